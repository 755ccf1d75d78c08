#pragma once
#include <opencv2/core.hpp>

#include "quad_fitter.h"

struct RectifyParams {
    bool  loose    = false; // 裁剪时向外扩一圈
    float margin_x = 0.1f;  // 宽度比例
    float margin_y = 0.2f;  // 高度比例
};

// 绕图像中心旋转 degree（逆时针为正），画布扩到能装下整图，白色填充；
// 再按变换后的 tl/br 裁剪。尺寸异常（<1 或 高 > 宽）返回空 Mat
cv::Mat rotate_crop(const cv::Mat &img, double degree, const cv::Point2f &tl, const cv::Point2f &br);

// 按文本区域的上边倾角摆正并裁剪
cv::Mat rectify_region(const cv::Mat &img, const TextRegion &region, const RectifyParams &p = {});
