#include "onnx_models.h"
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <stdexcept>

int pick_output(int idx, int n_out) {
    int k = idx < 0 ? n_out + idx : idx;
    return (k >= 0 && k < n_out) ? k : -1;
}

OnnxCtpnDetector::OnnxCtpnDetector(const std::string &det_model, bool use_cuda, const Params &p) :
    det_session_(det_model, use_cuda), params_(p) {
    const int n_out = (int) det_session_.output_count();
    if (pick_output(params_.prob_output, n_out) < 0 || pick_output(params_.regr_output, n_out) < 0)
        throw std::invalid_argument(det_model + ": has " + std::to_string(n_out) + " outputs, cannot pick prob/regr");
}

// 减均值（逐通道），保持 BGR、HWC
cv::Mat OnnxCtpnDetector::preprocess(const cv::Mat &bgr) const {
    cv::Mat img;
    if (bgr.channels() == 1)
        cv::cvtColor(bgr, img, cv::COLOR_GRAY2BGR);
    else if (bgr.channels() == 4)
        cv::cvtColor(bgr, img, cv::COLOR_BGRA2BGR);
    else
        img = bgr;
    CV_Assert(img.channels() == 3);
    img.convertTo(img, CV_32FC3);
    cv::subtract(img, params_.mean, img);
    return img.isContinuous() ? img : img.clone();
}

cv::Mat det_output_as_Nx2(const Ort::Value &v, int expect_n, const char *what) {
    auto shp = v.GetTensorTypeAndShapeInfo().GetShape();
    int64_t n = shp.size() == 3 ? shp[1] : shp.size() == 2 ? shp[0] : -1;
    int64_t c = shp.empty() ? -1 : shp.back();
    if ((shp.size() == 3 && shp[0] != 1) || n != expect_n || c != 2)
        throw std::runtime_error(std::string("det output ") + what + " shape mismatch, expected [1," +
                                 std::to_string(expect_n) + ",2]");
    if (expect_n == 0)
        return {};
    cv::Mat m(expect_n, 2, CV_32F, const_cast<float *>(v.GetTensorData<float>()));
    return m.clone();
}

DetectionMaps OnnxCtpnDetector::forward(const cv::Mat &bgr) const {
    CV_Assert(!bgr.empty());
    cv::Mat img = preprocess(bgr);

    // NHWC
    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
    std::vector<int64_t> ishape{1, (int64_t) img.rows, (int64_t) img.cols, 3};
    Ort::Value input = Ort::Value::CreateTensor<float>(mem, (float *) img.data, img.total() * 3, ishape.data(),
                                                       ishape.size());
    auto outputs = det_session_.run(input);

    const int n_out = (int) outputs.size();
    const int prob_idx = pick_output(params_.prob_output, n_out);
    const int regr_idx = pick_output(params_.regr_output, n_out);
    if (prob_idx < 0 || regr_idx < 0)
        throw std::runtime_error("det model returned " + std::to_string(n_out) + " outputs");

    DetectionMaps maps;
    maps.grid = cv::Size(bgr.cols / params_.stride, bgr.rows / params_.stride);
    const int n = maps.grid.area() * params_.anchors;

    cv::Mat prob = det_output_as_Nx2(outputs[prob_idx], n, "prob");
    maps.scores = prob.empty() ? cv::Mat() : prob.col(1).clone(); // softmax 第 1 维为前景
    maps.regressions = det_output_as_Nx2(outputs[regr_idx], n, "regr");

#ifndef NDEBUG
    std::cout << "[DET] grid=" << maps.grid.width << "x" << maps.grid.height << " anchors=" << n << "\n";
#endif
    return maps;
}
