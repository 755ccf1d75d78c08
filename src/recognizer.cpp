#include "onnx_models.h"
#include <algorithm>
#include <iostream>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

OnnxDenseNetRecognizer::OnnxDenseNetRecognizer(const std::string &rec_model, bool use_cuda, const Params &p) :
    rec_(rec_model, use_cuda), p_(p) {
    // 从模型读取固定高度（NHWC），动态维则保留参数
    const auto &in_shape = rec_.input_shape();
    if (in_shape.size() == 4 && in_shape[1] > 0)
        p_.imgH = (int) in_shape[1];
}

void OnnxDenseNetRecognizer::normalize_rec(cv::Mat &img) {
    img.convertTo(img, CV_32F, 1.0 / 255.0, -0.5);
}

cv::Mat rec_output_as_TxC(const Ort::Value &v) {
    auto shp = v.GetTensorTypeAndShapeInfo().GetShape();
    int T = 0, C = 0;
    if (shp.size() == 2) {
        T = (int) shp[0];
        C = (int) shp[1];
    } else if (shp.size() == 3) {
        if (shp[0] != 1)
            throw std::runtime_error("rec output N!=1 not supported");
        T = (int) shp[1];
        C = (int) shp[2];
    } else if (shp.size() == 4) {
        if (shp[0] != 1 || shp[1] != 1)
            throw std::runtime_error("rec output [N,1,T,C] expected with N==1");
        T = (int) shp[2];
        C = (int) shp[3];
    } else {
        throw std::runtime_error("Unexpected rec output rank: " + std::to_string(shp.size()));
    }
    if (T == 0 || C == 0)
        return {};
    cv::Mat tmp(T, C, CV_32F, const_cast<float *>(v.GetTensorData<float>()));
    return tmp.clone();
}

cv::Mat OnnxDenseNetRecognizer::forward(const cv::Mat &gray) const {
    CV_Assert(!gray.empty() && gray.channels() == 1);

    // 1) 等比缩放到固定高度
    float scale = float(gray.rows) / float(p_.imgH);
    int tarW = std::max(p_.min_w, (int) (gray.cols / scale));
    cv::Mat img;
    cv::resize(gray, img, cv::Size(tarW, p_.imgH), 0, 0, cv::INTER_AREA);
    // 2) 归一化到 [-0.5, 0.5]
    normalize_rec(img);
    if (!img.isContinuous())
        img = img.clone();

    // 3) ORT 前向，NHWC
    std::vector<int64_t> ishape{1, p_.imgH, tarW, 1};
    auto mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
    auto input = Ort::Value::CreateTensor<float>(mem, (float *) img.data, img.total(), ishape.data(),
                                                 ishape.size());
    auto outputs = rec_.run(input);

    // 4) 统一成 TxC
    cv::Mat probs = rec_output_as_TxC(outputs[0]);
#ifndef NDEBUG
    std::cout << "[REC] in=" << gray.cols << "x" << gray.rows << " -> " << tarW << "x" << p_.imgH
              << " T=" << probs.rows << " C=" << probs.cols << "\n";
#endif
    return probs;
}
