#include "ctpn_ocr.h"
#include <exception>
#include <iostream>
#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <utility>

CtpnOcr::CtpnOcr(std::shared_ptr<const TextDetectionNet> det, std::shared_ptr<const TextRecognitionNet> rec,
                 std::vector<std::string> charset, const Params &p) :
    det_(std::move(det)), rec_(std::move(rec)), charset_(std::move(charset)), params_(p),
    proposal_decoder_(p.proposals), line_builder_(p.lines) {
    if (!det_ || !rec_)
        throw std::invalid_argument("CtpnOcr needs both a detection and a recognition net");
    if (params_.blank_index < 0 || params_.blank_index >= (int) charset_.size())
        throw std::invalid_argument("blank index " + std::to_string(params_.blank_index) +
                                    " outside charset of size " + std::to_string(charset_.size()));
}

// 检测网络输出的形状必须和输入图像对得上，否则是外部组件违约
void CtpnOcr::check_detection(const DetectionMaps &maps, const cv::Size &image_size, int stride) {
    const cv::Size expect_grid(image_size.width / stride, image_size.height / stride);
    if (maps.grid != expect_grid)
        throw std::runtime_error("det grid " + std::to_string(maps.grid.width) + "x" +
                                 std::to_string(maps.grid.height) + " does not match image, expected " +
                                 std::to_string(expect_grid.width) + "x" + std::to_string(expect_grid.height));
    const size_t n = (size_t) expect_grid.area() * kAnchorsPerCell;
    if (n == 0)
        return;
    if (maps.scores.type() != CV_32F || maps.scores.total() != n)
        throw std::runtime_error("det scores must hold " + std::to_string(n) + " CV_32F values");
    if (maps.regressions.type() != CV_32F || maps.regressions.rows != (int) n || maps.regressions.cols != 2)
        throw std::runtime_error("det regressions must be " + std::to_string(n) + "x2 CV_32F");
}

std::map<int, TextRegion> CtpnOcr::detect(const cv::Mat &bgr) const {
    CV_Assert(!bgr.empty());
    DetectionMaps maps = det_->forward(bgr);
    check_detection(maps, bgr.size(), proposal_decoder_.params().stride);

    std::map<int, TextRegion> regions;
    if (maps.grid.area() == 0)
        return regions;

    auto proposals = proposal_decoder_.decode(maps.grid, maps.scores, maps.regressions, bgr.size());
    auto chains = line_builder_.build(proposals);

    int degenerate = 0;
    for (int i = 0; i < (int) chains.size(); ++i) {
        TextRegion region;
        if (fit_text_region(proposals, chains[i], region))
            regions.emplace(i, region);
        else
            degenerate++;
    }
    if (degenerate > 0)
        std::cerr << "[WARN] dropped " << degenerate << " degenerate text line(s)\n";
    return regions;
}

bool CtpnOcr::recognize_region(const cv::Mat &bgr, const TextRegion &region, OcrResult &out) const {
    cv::Mat crop = rectify_region(bgr, region, params_.rectify);
    if (crop.empty())
        return false;

    cv::Mat gray;
    if (crop.channels() == 3)
        cv::cvtColor(crop, gray, cv::COLOR_BGR2GRAY);
    else if (crop.channels() == 4)
        cv::cvtColor(crop, gray, cv::COLOR_BGRA2GRAY);
    else
        gray = crop;

    cv::Mat probs = rec_->forward(gray);
    if (!probs.empty() && (probs.dims != 2 || probs.type() != CV_32F || probs.cols != (int) charset_.size()))
        throw std::runtime_error("rec output must be TxC CV_32F with C=" + std::to_string(charset_.size()) +
                                 ", got " + std::to_string(probs.rows) + "x" + std::to_string(probs.cols));

    out.region = region;
    out.text = ctc_greedy_decode(probs, charset_, params_.blank_index, &out.score);
    return !out.text.empty();
}

std::map<int, OcrResult> CtpnOcr::run(const cv::Mat &bgr) const {
    auto regions = detect(bgr);

    std::vector<std::pair<int, TextRegion>> todo(regions.begin(), regions.end());
    std::vector<OcrResult> slots(todo.size());
    std::vector<char> ok(todo.size(), 0);

    if (params_.parallel_regions && todo.size() > 1) {
        // 每个区域写自己的槽位；异常先存下来，结束后在调用线程重新抛出
        std::vector<std::exception_ptr> errors(todo.size());
        cv::parallel_for_(cv::Range(0, (int) todo.size()), [&](const cv::Range &r) {
            for (int i = r.start; i < r.end; ++i) {
                try {
                    ok[i] = recognize_region(bgr, todo[i].second, slots[i]) ? 1 : 0;
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        });
        for (auto &e: errors) {
            if (e)
                std::rethrow_exception(e);
        }
    } else {
        for (size_t i = 0; i < todo.size(); ++i)
            ok[i] = recognize_region(bgr, todo[i].second, slots[i]) ? 1 : 0;
    }

    std::map<int, OcrResult> results;
    for (size_t i = 0; i < todo.size(); ++i) {
        if (ok[i])
            results.emplace(todo[i].first, std::move(slots[i]));
    }

#ifndef NDEBUG
    std::cout << "[OCR] regions=" << regions.size() << " recognized=" << results.size() << "\n";
#endif
    return results;
}

void draw_text_regions(cv::Mat &img, const std::vector<TextRegion> &regions, const cv::Scalar &color,
                       int thickness) {
    for (auto &r: regions) {
        for (int i = 0; i < 4; ++i)
            cv::line(img, r.quad[i], r.quad[(i + 1) % 4], color, thickness);
    }
}
