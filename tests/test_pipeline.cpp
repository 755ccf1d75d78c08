#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <memory>
#include <opencv2/imgproc.hpp>
#include <tuple>

#include "ctpn_ocr.h"

namespace {
    // (row, col, anchor) -> 前景分数，其余为 0，回归量全 0
    using Hits = std::map<std::tuple<int, int, int>, float>;

    class StubDetector : public TextDetectionNet {
    public:
        explicit StubDetector(Hits hits, int extra_rows = 0) : hits_(std::move(hits)), extra_rows_(extra_rows) {}

        DetectionMaps forward(const cv::Mat &bgr) const override {
            DetectionMaps maps;
            maps.grid = cv::Size(bgr.cols / 16, bgr.rows / 16);
            const int n = maps.grid.area() * kAnchorsPerCell;
            maps.scores = cv::Mat::zeros(n + extra_rows_, 1, CV_32F);
            maps.regressions = cv::Mat::zeros(n, 2, CV_32F);
            for (auto &h: hits_) {
                int row, col, k;
                std::tie(row, col, k) = h.first;
                maps.scores.at<float>((row * maps.grid.width + col) * kAnchorsPerCell + k) = h.second;
            }
            return maps;
        }

    private:
        Hits hits_;
        int extra_rows_;
    };

    // 不管输入是什么，都输出同一串 "AB"
    class StubRecognizer : public TextRecognitionNet {
    public:
        explicit StubRecognizer(int classes = 3, bool blank_only = false) :
            classes_(classes), blank_only_(blank_only) {}

        cv::Mat forward(const cv::Mat &gray) const override {
            EXPECT_EQ(gray.channels(), 1);
            EXPECT_LE(gray.rows, gray.cols);
            calls++;
            const int seq[] = {0, 1, 1, 0, 2, 0};
            cv::Mat m(6, classes_, CV_32F, cv::Scalar(0.01f));
            for (int t = 0; t < 6; ++t)
                m.at<float>(t, blank_only_ ? 0 : seq[t]) = 0.98f;
            return m;
        }

        mutable std::atomic<int> calls{0};

    private:
        int classes_;
        bool blank_only_;
    };

    const std::vector<std::string> kCharset = {"", "A", "B"};

    // 160x64 白底，第 1 行网格 (y 16..31)、第 2..5 列 (x 32..95) 有一条黑色文字带
    cv::Mat band_image() {
        cv::Mat img(64, 160, CV_8UC3, cv::Scalar(255, 255, 255));
        cv::rectangle(img, cv::Rect(32, 16, 64, 16), cv::Scalar(0, 0, 0), cv::FILLED);
        return img;
    }

    Hits band_hits(int row) {
        Hits hits;
        for (int col = 2; col <= 5; ++col)
            hits[std::make_tuple(row, col, 1)] = 0.95f - 0.01f * (float) col; // 高 16 的 anchor
        return hits;
    }
}

TEST(CtpnOcr, SingleHorizontalBandGivesOneLine) {
    auto rec = std::make_shared<StubRecognizer>();
    CtpnOcr ocr(std::make_shared<StubDetector>(band_hits(1)), rec, kCharset);

    auto results = ocr.run(band_image());
    ASSERT_EQ(results.size(), 1u);
    ASSERT_EQ(results.begin()->first, 0);
    const OcrResult &r = results.begin()->second;
    EXPECT_EQ(r.text, "AB");
    EXPECT_GT(r.score, 0.9f);

    const float expect[8] = {32, 16, 95, 16, 95, 31, 32, 31};
    auto q = quad_to_array(r.region);
    for (int i = 0; i < 8; ++i)
        EXPECT_NEAR(q[i], expect[i], 1.0) << "coord " << i;
    EXPECT_NEAR(r.region.angle, 0.f, 1e-3);
    EXPECT_EQ(rec->calls.load(), 1);
}

TEST(CtpnOcr, InvalidCropIsDroppedAndIndexGapKept) {
    Hits hits = band_hits(1);
    // 第 8 列单独一个高框：裁出来高 > 宽，被丢弃；分数最高，占下标 0
    hits[std::make_tuple(0, 8, 3)] = 0.99f;

    auto rec = std::make_shared<StubRecognizer>();
    CtpnOcr ocr(std::make_shared<StubDetector>(hits), rec, kCharset);

    auto regions = ocr.detect(band_image());
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions.count(0), 1u);
    EXPECT_EQ(regions.count(1), 1u);

    auto results = ocr.run(band_image());
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.begin()->first, 1);
    EXPECT_EQ(results.begin()->second.text, "AB");
}

TEST(CtpnOcr, EmptyRecognitionIsDropped) {
    CtpnOcr ocr(std::make_shared<StubDetector>(band_hits(1)), std::make_shared<StubRecognizer>(3, true), kCharset);
    EXPECT_TRUE(ocr.run(band_image()).empty());
}

TEST(CtpnOcr, NothingAboveThreshold) {
    Hits hits;
    hits[std::make_tuple(1, 2, 1)] = 0.7f;
    CtpnOcr ocr(std::make_shared<StubDetector>(hits), std::make_shared<StubRecognizer>(), kCharset);
    EXPECT_TRUE(ocr.run(band_image()).empty());
}

TEST(CtpnOcr, ImageSmallerThanOneCell) {
    CtpnOcr ocr(std::make_shared<StubDetector>(Hits{}), std::make_shared<StubRecognizer>(), kCharset);
    cv::Mat tiny(8, 12, CV_8UC3, cv::Scalar(255, 255, 255));
    EXPECT_TRUE(ocr.run(tiny).empty());
}

TEST(CtpnOcr, MalformedDetectionOutputThrows) {
    CtpnOcr ocr(std::make_shared<StubDetector>(band_hits(1), 5), std::make_shared<StubRecognizer>(), kCharset);
    EXPECT_THROW(ocr.run(band_image()), std::runtime_error);
}

TEST(CtpnOcr, GridIsCheckedAgainstConfiguredStride) {
    // 检测器按 16 划格，配置成 32 时网格对不上
    CtpnOcr::Params p;
    p.proposals.stride = 32;
    CtpnOcr ocr(std::make_shared<StubDetector>(band_hits(1)), std::make_shared<StubRecognizer>(), kCharset, p);
    EXPECT_THROW(ocr.detect(band_image()), std::runtime_error);
}

TEST(CtpnOcr, MalformedRecognitionOutputThrows) {
    CtpnOcr ocr(std::make_shared<StubDetector>(band_hits(1)), std::make_shared<StubRecognizer>(5), kCharset);
    EXPECT_THROW(ocr.run(band_image()), std::runtime_error);
}

TEST(CtpnOcr, RejectsBadConstruction) {
    EXPECT_THROW(CtpnOcr(nullptr, std::make_shared<StubRecognizer>(), kCharset), std::invalid_argument);
    CtpnOcr::Params p;
    p.blank_index = 3;
    EXPECT_THROW(CtpnOcr(std::make_shared<StubDetector>(Hits{}), std::make_shared<StubRecognizer>(), kCharset, p),
                 std::invalid_argument);
}

TEST(CtpnOcr, ParallelRegionsMatchSequential) {
    Hits hits = band_hits(1);
    for (auto &h: band_hits(3))
        hits[h.first] = h.second - 0.1f;
    cv::Mat img = band_image();
    cv::rectangle(img, cv::Rect(32, 48, 64, 16), cv::Scalar(0, 0, 0), cv::FILLED);
    auto det = std::make_shared<StubDetector>(hits);

    CtpnOcr sequential(det, std::make_shared<StubRecognizer>(), kCharset);
    CtpnOcr::Params p;
    p.parallel_regions = true;
    CtpnOcr parallel(det, std::make_shared<StubRecognizer>(), kCharset, p);

    auto a = sequential.run(img);
    auto b = parallel.run(img);
    ASSERT_EQ(a.size(), 2u);
    ASSERT_EQ(b.size(), a.size());
    for (auto &kv: a) {
        ASSERT_EQ(b.count(kv.first), 1u);
        EXPECT_EQ(b.at(kv.first).text, kv.second.text);
        EXPECT_EQ(quad_to_array(b.at(kv.first).region), quad_to_array(kv.second.region));
    }
}

TEST(CtpnOcr, DrawTextRegionsOutlinesQuad) {
    cv::Mat img(64, 160, CV_8UC3, cv::Scalar(255, 255, 255));
    CtpnOcr ocr(std::make_shared<StubDetector>(band_hits(1)), std::make_shared<StubRecognizer>(), kCharset);
    auto regions = ocr.detect(band_image());
    std::vector<TextRegion> list;
    for (auto &kv: regions)
        list.push_back(kv.second);

    draw_text_regions(img, list, cv::Scalar(255, 0, 0), 1);
    EXPECT_EQ(img.at<cv::Vec3b>(16, 60), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(img.at<cv::Vec3b>(24, 60), cv::Vec3b(255, 255, 255));
}
