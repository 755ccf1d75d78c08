#pragma once
#include <map>
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "ctc_decoder.h"
#include "detector.h"
#include "proposals.h"
#include "quad_fitter.h"
#include "recognizer.h"
#include "rectifier.h"
#include "text_line_builder.h"

struct OcrResult {
    TextRegion region;
    std::string text;
    float score{0.f}; // 识别置信度
};

class CtpnOcr {
public:
    struct Params {
        ProposalDecoder::Params proposals;
        TextLineBuilder::Params lines;
        RectifyParams rectify;
        int  blank_index      = 0;
        bool parallel_regions = false; // 区域级并行：摆正 -> 识别 -> 解码
    };

    CtpnOcr(std::shared_ptr<const TextDetectionNet> det,
            std::shared_ptr<const TextRecognitionNet> rec,
            std::vector<std::string> charset,
            const Params& p = {});

    // 只做检测：key 为文本行下标（NMS 输出顺序），退化的行不出现
    std::map<int, TextRegion> detect(const cv::Mat& bgr) const;

    // 完整 pipeline：返回 下标 -> (框, 文本)；下标不连续是正常的
    std::map<int, OcrResult> run(const cv::Mat& bgr) const;

private:
    std::shared_ptr<const TextDetectionNet> det_;
    std::shared_ptr<const TextRecognitionNet> rec_;
    std::vector<std::string> charset_;
    Params params_;
    ProposalDecoder proposal_decoder_;
    TextLineBuilder line_builder_;

    bool recognize_region(const cv::Mat& bgr, const TextRegion& region, OcrResult& out) const;
    static void check_detection(const DetectionMaps& maps, const cv::Size& image_size, int stride);
};

// 画出每个文本区域的四条边
void draw_text_regions(cv::Mat& img, const std::vector<TextRegion>& regions,
                       const cv::Scalar& color = cv::Scalar(255, 0, 0), int thickness = 2);
