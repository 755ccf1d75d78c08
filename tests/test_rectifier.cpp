#include <gtest/gtest.h>
#include <cmath>
#include <opencv2/imgproc.hpp>

#include "rectifier.h"

static TextRegion axis_region(float x1, float y1, float x2, float y2) {
    TextRegion r;
    r.quad = {cv::Point2f(x1, y1), cv::Point2f(x2, y1), cv::Point2f(x2, y2), cv::Point2f(x1, y2)};
    r.bbox = cv::Rect2f(x1, y1, x2 - x1, y2 - y1);
    r.score = 0.9f;
    return r;
}

TEST(Rectifier, AngleZeroEqualsPlainCrop) {
    cv::Mat img(60, 120, CV_8UC3);
    cv::RNG rng(3);
    rng.fill(img, cv::RNG::UNIFORM, 0, 256);

    cv::Mat crop = rectify_region(img, axis_region(20, 10, 90, 40));
    ASSERT_FALSE(crop.empty());
    ASSERT_EQ(crop.size(), cv::Size(70, 30));
    cv::Mat ref = img(cv::Rect(20, 10, 70, 30));
    EXPECT_LE(cv::norm(crop, ref, cv::NORM_INF), 1.0);
}

TEST(Rectifier, RejectsTallAndEmptyCrops) {
    cv::Mat img(60, 120, CV_8UC1, cv::Scalar(128));
    EXPECT_TRUE(rectify_region(img, axis_region(10, 5, 20, 50)).empty());
    EXPECT_TRUE(rectify_region(img, axis_region(30, 30, 30, 40)).empty());
    EXPECT_TRUE(rotate_crop(img, 0.0, cv::Point2f(50, 30), cv::Point2f(40, 35)).empty());
}

TEST(Rectifier, ClampsToImageBorder) {
    cv::Mat img(60, 120, CV_8UC1, cv::Scalar(0));
    // 左上角被夹到 1，右下角被夹到 dim-2
    cv::Mat crop = rectify_region(img, axis_region(0, 0, 119, 59));
    ASSERT_FALSE(crop.empty());
    EXPECT_EQ(crop.size(), cv::Size(117, 57));
}

TEST(Rectifier, LooseModeAddsMargins) {
    cv::Mat img(80, 160, CV_8UC1, cv::Scalar(0));
    RectifyParams p;
    p.loose = true;
    cv::Mat crop = rectify_region(img, axis_region(40, 20, 100, 40), p);
    ASSERT_FALSE(crop.empty());
    // 60*0.1 = 6, 20*0.2 = 4
    EXPECT_EQ(crop.size(), cv::Size(72, 28));
}

// 在白图上画一条倾斜 degrees 度、长 120 高 20 的黑带
static TextRegion draw_tilted_band(cv::Mat &img, double degrees) {
    const double theta = degrees * CV_PI / 180.0;
    const cv::Point2f c(100, 50), u((float) std::cos(theta), (float) std::sin(theta)),
            v((float) -std::sin(theta), (float) std::cos(theta));

    TextRegion r;
    r.quad = {c - 60 * u - 10 * v, c + 60 * u - 10 * v, c + 60 * u + 10 * v, c - 60 * u + 10 * v};
    std::vector<cv::Point> poly;
    for (auto &p: r.quad)
        poly.emplace_back(cvRound(p.x), cvRound(p.y));
    cv::fillConvexPoly(img, poly, cv::Scalar(0, 0, 0));
    r.bbox = cv::boundingRect(poly);
    return r;
}

TEST(Rectifier, TiltedBandComesOutLevel) {
    cv::Mat img(100, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    TextRegion r = draw_tilted_band(img, 10.0);

    cv::Mat crop = rectify_region(img, r);
    ASSERT_FALSE(crop.empty());
    EXPECT_NEAR(crop.cols, 120, 2);
    EXPECT_NEAR(crop.rows, 20, 2);
    EXPECT_LT(cv::mean(crop)[0], 80.0);
}

TEST(Rectifier, UpTiltedBandComesOutLevel) {
    cv::Mat img(100, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    TextRegion r = draw_tilted_band(img, -10.0);
    ASSERT_LT(r.quad[1].y, r.quad[0].y);

    cv::Mat crop = rectify_region(img, r);
    ASSERT_FALSE(crop.empty());
    EXPECT_NEAR(crop.cols, 120, 2);
    EXPECT_NEAR(crop.rows, 20, 2);
    EXPECT_LT(cv::mean(crop)[0], 80.0);
}
