#include "proposals.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

const float kAnchorHeights[kAnchorsPerCell] = {11.f, 16.f, 23.f, 33.f, 48.f, 68.f, 97.f, 139.f, 198.f, 283.f};

std::vector<TextBoxF> generate_anchors(const cv::Size &grid, int stride) {
    std::vector<TextBoxF> anchors;
    if (grid.width <= 0 || grid.height <= 0)
        return anchors;
    anchors.reserve((size_t) grid.area() * kAnchorsPerCell);

    // 单元格 [0, stride-1] 的中心
    const float half = 0.5f * (float) (stride - 1);
    for (int row = 0; row < grid.height; ++row) {
        for (int col = 0; col < grid.width; ++col) {
            float cx = (float) (col * stride) + half;
            float cy = (float) (row * stride) + half;
            for (float h: kAnchorHeights) {
                TextBoxF a;
                a.x1 = cx - half;
                a.x2 = cx + half;
                a.y1 = cy - 0.5f * (h - 1.f);
                a.y2 = cy + 0.5f * (h - 1.f);
                anchors.push_back(a);
            }
        }
    }
    return anchors;
}

std::vector<TextBoxF> decode_boxes(const std::vector<TextBoxF> &anchors, const cv::Mat &regressions) {
    if (anchors.empty() && regressions.empty())
        return {};
    if (regressions.type() != CV_32F || regressions.cols != 2 || regressions.rows != (int) anchors.size())
        throw std::invalid_argument("regressions must be " + std::to_string(anchors.size()) + "x2 CV_32F, got " +
                                    std::to_string(regressions.rows) + "x" + std::to_string(regressions.cols));

    std::vector<TextBoxF> boxes(anchors.size());
    for (int i = 0; i < (int) anchors.size(); ++i) {
        const TextBoxF &a = anchors[i];
        const float *r = regressions.ptr<float>(i);
        float ha = a.height();
        float cya = 0.5f * (a.y1 + a.y2);
        float cy = r[0] * ha + cya;
        float h = std::exp(r[1]) * ha;

        // 只回归竖直方向，x 保持 anchor 不变
        TextBoxF &b = boxes[i];
        b.x1 = a.x1;
        b.x2 = a.x2;
        b.y1 = cy - 0.5f * (h - 1.f);
        b.y2 = cy + 0.5f * (h - 1.f);
    }
    return boxes;
}

static inline float clamp_coord(float v, float hi) {
    // NaN 比较恒为 false，统一落到 0
    if (!(v > 0.f))
        return 0.f;
    return std::min(v, hi);
}

void clip_boxes(std::vector<TextBoxF> &boxes, const cv::Size &image_size) {
    const float max_x = (float) std::max(0, image_size.width - 1);
    const float max_y = (float) std::max(0, image_size.height - 1);
    for (auto &b: boxes) {
        b.x1 = clamp_coord(b.x1, max_x);
        b.x2 = clamp_coord(b.x2, max_x);
        b.y1 = clamp_coord(b.y1, max_y);
        b.y2 = clamp_coord(b.y2, max_y);
        if (b.x1 > b.x2)
            std::swap(b.x1, b.x2);
        if (b.y1 > b.y2)
            std::swap(b.y1, b.y2);
    }
}

std::vector<TextProposal> filter_proposals(const std::vector<TextBoxF> &boxes, const cv::Mat &scores,
                                           float score_thresh, float min_size) {
    if (boxes.empty() && scores.empty())
        return {};
    if (scores.type() != CV_32F || scores.total() != boxes.size())
        throw std::invalid_argument("scores must hold " + std::to_string(boxes.size()) + " CV_32F values, got " +
                                    std::to_string(scores.total()));
    const cv::Mat flat = scores.isContinuous() ? scores : scores.clone();
    const float *s = flat.ptr<float>();

    std::vector<TextProposal> out;
    for (size_t i = 0; i < boxes.size(); ++i) {
        bool fg = s[i] > score_thresh;
        bool big = boxes[i].width() >= min_size && boxes[i].height() >= min_size;
        if (fg && big)
            out.push_back({boxes[i], s[i]});
    }
    return out;
}

float box_iou(const TextBoxF &a, const TextBoxF &b) {
    float xx1 = std::max(a.x1, b.x1), yy1 = std::max(a.y1, b.y1);
    float xx2 = std::min(a.x2, b.x2), yy2 = std::min(a.y2, b.y2);
    float w = std::max(0.f, xx2 - xx1 + 1.f);
    float h = std::max(0.f, yy2 - yy1 + 1.f);
    float inter = w * h;
    float uni = a.area() + b.area() - inter;
    return uni > 0.f ? inter / uni : 0.f;
}

std::vector<int> nms(const std::vector<TextProposal> &proposals, float iou_thresh) {
    std::vector<int> order(proposals.size());
    std::iota(order.begin(), order.end(), 0);
    // NaN 分数排在最后，保证比较是严格弱序
    auto key = [&](int i) {
        float s = proposals[i].score;
        return std::isnan(s) ? -std::numeric_limits<float>::infinity() : s;
    };
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) { return key(a) > key(b); });

    std::vector<int> keep;
    std::vector<char> suppressed(proposals.size(), 0);
    for (size_t oi = 0; oi < order.size(); ++oi) {
        int i = order[oi];
        if (suppressed[i])
            continue;
        keep.push_back(i);
        for (size_t oj = oi + 1; oj < order.size(); ++oj) {
            int j = order[oj];
            if (!suppressed[j] && box_iou(proposals[i].box, proposals[j].box) > iou_thresh)
                suppressed[j] = 1;
        }
    }
    return keep;
}

std::vector<TextProposal> ProposalDecoder::decode(const cv::Size &grid, const cv::Mat &scores,
                                                  const cv::Mat &regressions, const cv::Size &image_size) const {
    auto anchors = generate_anchors(grid, params_.stride);
    auto boxes = decode_boxes(anchors, regressions);
    clip_boxes(boxes, image_size);

    auto candidates = filter_proposals(boxes, scores, params_.score_thresh, params_.min_size);
    auto keep = nms(candidates, params_.nms_thresh);

    std::vector<TextProposal> out;
    out.reserve(keep.size());
    for (int k: keep)
        out.push_back(candidates[k]);

#ifndef NDEBUG
    std::cout << "[DET] anchors=" << anchors.size() << " kept_score_size=" << candidates.size()
              << " kept_nms=" << out.size() << "\n";
#endif
    return out;
}
