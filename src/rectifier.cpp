#include "rectifier.h"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

static inline cv::Point2f affine_point(const cv::Mat &M, const cv::Point2f &p) {
    const double *r0 = M.ptr<double>(0);
    const double *r1 = M.ptr<double>(1);
    return {(float) (r0[0] * p.x + r0[1] * p.y + r0[2]), (float) (r1[0] * p.x + r1[1] * p.y + r1[2])};
}

cv::Mat rotate_crop(const cv::Mat &img, double degree, const cv::Point2f &tl, const cv::Point2f &br) {
    CV_Assert(!img.empty());
    const int h = img.rows, w = img.cols;
    const double rad = degree * CV_PI / 180.0;
    const double s = std::fabs(std::sin(rad)), c = std::fabs(std::cos(rad));

    // 旋转后能装下整张图的画布
    const int new_h = (int) (w * s + h * c);
    const int new_w = (int) (h * s + w * c);

    cv::Mat M = cv::getRotationMatrix2D(cv::Point2f((float) (w / 2), (float) (h / 2)), degree, 1.0);
    M.at<double>(0, 2) += std::floor((new_w - w) / 2.0);
    M.at<double>(1, 2) += std::floor((new_h - h) / 2.0);

    cv::Mat rotated;
    cv::warpAffine(img, rotated, M, cv::Size(new_w, new_h), cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                   cv::Scalar(255, 255, 255));

    cv::Point2f p1 = affine_point(M, tl);
    cv::Point2f p3 = affine_point(M, br);
    int y0 = std::max(1, (int) p1.y), y1 = std::min(rotated.rows - 1, (int) p3.y);
    int x0 = std::max(1, (int) p1.x), x1 = std::min(rotated.cols - 1, (int) p3.x);

    int crop_h = y1 - y0, crop_w = x1 - x0;
    // 过滤异常图片：文本行摆正后不可能高大于宽
    if (crop_h < 1 || crop_w < 1 || crop_h > crop_w)
        return {};
    return rotated(cv::Rect(x0, y0, crop_w, crop_h)).clone();
}

cv::Mat rectify_region(const cv::Mat &img, const TextRegion &region, const RectifyParams &p) {
    const float x_dim = (float) img.cols, y_dim = (float) img.rows;
    const cv::Point2f &tl = region.quad[0];
    const cv::Point2f &tr = region.quad[1];
    const cv::Point2f &br = region.quad[2];

    float xl = 0.f, yl = 0.f;
    if (p.loose) {
        xl = (float) (int) (region.bbox.width * p.margin_x);
        yl = (float) (int) (region.bbox.height * p.margin_y);
    }
    cv::Point2f pt1(std::max(1.f, tl.x - xl), std::max(1.f, tl.y - yl));
    cv::Point2f pt3(std::min(br.x + xl, x_dim - 2.f), std::min(br.y + yl, y_dim - 2.f));

    double degree = std::atan2(tr.y - tl.y, tr.x - tl.x) * 180.0 / CV_PI;
    return rotate_crop(img, degree, pt1, pt3);
}
