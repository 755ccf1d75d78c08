#pragma once
#include <opencv2/core.hpp>
#include <vector>

// 像素框，采用包含端点的约定：width = x2 - x1 + 1
struct TextBoxF {
    float x1{0.f}, y1{0.f}, x2{0.f}, y2{0.f};

    float width() const { return x2 - x1 + 1.f; }
    float height() const { return y2 - y1 + 1.f; }
    float area() const { return width() * height(); }
    cv::Point2f center() const { return {0.5f * (x1 + x2), 0.5f * (y1 + y2)}; }
};

struct TextProposal {
    TextBoxF box;
    float score{0.f};
};

// 每个网格单元的 anchor 高度（宽度固定为 stride）
constexpr int kAnchorsPerCell = 10;
extern const float kAnchorHeights[kAnchorsPerCell];

// grid = (W, H)，返回 H*W*10 个 anchor，顺序：行 -> 列 -> anchor
std::vector<TextBoxF> generate_anchors(const cv::Size &grid, int stride = 16);

// regressions: N x 2 CV_32F，每行 (dy_center, dh)
std::vector<TextBoxF> decode_boxes(const std::vector<TextBoxF> &anchors, const cv::Mat &regressions);

void clip_boxes(std::vector<TextBoxF> &boxes, const cv::Size &image_size);

std::vector<TextProposal> filter_proposals(const std::vector<TextBoxF> &boxes, const cv::Mat &scores,
                                           float score_thresh, float min_size);

float box_iou(const TextBoxF &a, const TextBoxF &b);

// 返回保留下来的下标，按输出顺序（分数降序，同分按原下标）
std::vector<int> nms(const std::vector<TextProposal> &proposals, float iou_thresh);

class ProposalDecoder {
public:
    struct Params {
        int   stride       = 16;
        float score_thresh = 0.7f;
        float min_size     = 16.f;
        float nms_thresh   = 0.3f;
    };

    explicit ProposalDecoder(const Params &p = {}) : params_(p) {}

    // 完整的检测后处理：anchor -> 回归 -> 裁剪 -> 过滤 -> NMS
    std::vector<TextProposal> decode(const cv::Size &grid, const cv::Mat &scores, const cv::Mat &regressions,
                                     const cv::Size &image_size) const;

    const Params &params() const { return params_; }

private:
    Params params_;
};
