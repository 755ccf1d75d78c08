#pragma once
#include <array>
#include <opencv2/core.hpp>
#include <vector>

#include "proposals.h"
#include "text_line_builder.h"

struct TextRegion {
    std::array<cv::Point2f, 4> quad; // TL, TR, BR, BL
    cv::Rect2f bbox;                 // 所有成员框的外接矩形
    float score{0.f};                // 成员分数均值
    float slope{0.f};                // 中心线斜率 dy/dx
    float angle{0.f};                // TL->TR 的倾角（度）
};

// 链退化（NaN、零长度、零高度）时返回 false，调用方直接丢弃
bool fit_text_region(const std::vector<TextProposal> &proposals, const TextChain &chain, TextRegion &out);

// 平铺成 8 个数：x_tl, y_tl, x_tr, y_tr, x_br, y_br, x_bl, y_bl
std::array<float, 8> quad_to_array(const TextRegion &region);
