#pragma once
#include <opencv2/core.hpp>

// 检测网络的输出：每个网格单元 10 个 anchor
struct DetectionMaps {
    cv::Size grid;       // (W, H)，特征图尺寸
    cv::Mat scores;      // (H*W*10) x 1 CV_32F，前景概率
    cv::Mat regressions; // (H*W*10) x 2 CV_32F，(dy_center, dh)
};

class TextDetectionNet {
public:
    virtual ~TextDetectionNet() = default;
    virtual DetectionMaps forward(const cv::Mat& bgr) const = 0;
};
