#pragma once
#include <vector>

#include "proposals.h"

// 一条文本行：proposal 下标，从左到右
using TextChain = std::vector<int>;

class TextLineBuilder {
public:
    struct Params {
        float max_horizontal_gap = 32.f; // b.x1 - a.x2 的上限（约 2 个 stride）
        float min_v_overlap      = 0.7f; // 竖直重叠 / 较矮框高度
        float min_size_sim       = 0.7f; // 较矮高度 / 较高高度
    };

    explicit TextLineBuilder(const Params &p = {}) : params_(p) {}

    // 输入应为 NMS 输出顺序（分数降序）；每个 proposal 恰好落在一条链里
    std::vector<TextChain> build(const std::vector<TextProposal> &proposals) const;

    // 左右相邻候选的判定，-1 表示没有
    std::vector<int> best_successors(const std::vector<TextProposal> &proposals) const;
    std::vector<int> best_precursors(const std::vector<TextProposal> &proposals) const;

    bool meet_v_iou(const TextBoxF &a, const TextBoxF &b) const;

private:
    Params params_;
};
