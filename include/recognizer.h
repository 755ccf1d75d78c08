#pragma once
#include <opencv2/core.hpp>

class TextRecognitionNet {
public:
    virtual ~TextRecognitionNet() = default;
    // gray: 单通道文本行；返回 T x C CV_32F 概率矩阵
    virtual cv::Mat forward(const cv::Mat& gray) const = 0;
};
