#pragma once
#include <opencv2/core.hpp>
#include <string>

#include "detector.h"
#include "onnx_session.h"
#include "recognizer.h"

// 输出下标：负数从末尾数；越界返回 -1
int pick_output(int idx, int n_out);

// 检测输出 [1,N,2] 或 [N,2] -> N x 2 CV_32F（拷贝）；形状不符抛 runtime_error
cv::Mat det_output_as_Nx2(const Ort::Value& v, int expect_n, const char* what);

// 识别输出 [T,C] / [1,T,C] / [1,1,T,C] -> T x C CV_32F（拷贝）；其它形状抛 runtime_error
cv::Mat rec_output_as_TxC(const Ort::Value& v);

// CTPN 检测网络（VGG16 + BiGRU），输入 NHWC BGR 减均值
class OnnxCtpnDetector : public TextDetectionNet {
public:
    struct Params {
        int   stride      = 16;
        int   anchors     = 10;
        cv::Scalar mean   = cv::Scalar(123.68, 116.779, 103.939);
        int   regr_output = 1;  // rpn_regress_reshape
        int   prob_output = -1; // rpn_cls_softmax，-1 表示最后一个输出
    };

    OnnxCtpnDetector(const std::string& det_model, bool use_cuda=false, const Params& p={});
    DetectionMaps forward(const cv::Mat& bgr) const override;

private:
    OnnxSession det_session_;
    Params params_;
    cv::Mat preprocess(const cv::Mat& bgr) const;
};

// DenseNet + CTC 识别网络，输入 NHWC 灰度 [1,32,w,1]
class OnnxDenseNetRecognizer : public TextRecognitionNet {
public:
    struct Params {
        int imgH  = 32;
        int min_w = 8;
    };
    OnnxDenseNetRecognizer(const std::string& rec_model, bool use_cuda=false, const Params& p={});
    cv::Mat forward(const cv::Mat& gray) const override;

private:
    OnnxSession rec_;
    Params p_;
    static void normalize_rec(cv::Mat& img);
};
