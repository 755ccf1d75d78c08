#include "quad_fitter.h"
#include <algorithm>
#include <cfloat>
#include <cmath>

static inline bool finite_point(const cv::Point2f &p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// 最小二乘拟合 y = k*x + b；x 全相同时退化成水平线
static void fit_line(const std::vector<cv::Point2d> &pts, double &k, double &b) {
    double mx = 0.0, my = 0.0;
    for (auto &p: pts) {
        mx += p.x;
        my += p.y;
    }
    mx /= (double) pts.size();
    my /= (double) pts.size();

    double sxx = 0.0, sxy = 0.0;
    for (auto &p: pts) {
        sxx += (p.x - mx) * (p.x - mx);
        sxy += (p.x - mx) * (p.y - my);
    }
    k = sxx > 1e-12 ? sxy / sxx : 0.0;
    b = my - k * mx;
}

bool fit_text_region(const std::vector<TextProposal> &proposals, const TextChain &chain, TextRegion &out) {
    if (chain.empty())
        return false;

    float left = FLT_MAX, right = -FLT_MAX, top = FLT_MAX, bottom = -FLT_MAX;
    double score_sum = 0.0;
    std::vector<cv::Point2d> centers;
    centers.reserve(chain.size());
    for (int idx: chain) {
        const TextBoxF &b = proposals.at(idx).box;
        left = std::min(left, b.x1);
        right = std::max(right, b.x2);
        top = std::min(top, b.y1);
        bottom = std::max(bottom, b.y2);
        cv::Point2f c = b.center();
        centers.emplace_back(c.x, c.y);
        score_sum += proposals[idx].score;
    }

    double k = 0.0, b0 = 0.0;
    fit_line(centers, k, b0);
    if (!std::isfinite(k) || !std::isfinite(b0))
        return false;

    // 角点到中心线的有符号垂直距离：左上角取最小作上边，右下角取最大作下边
    const double norm = std::sqrt(1.0 + k * k);
    double d_top = DBL_MAX, d_bottom = -DBL_MAX;
    for (int idx: chain) {
        const TextBoxF &b = proposals[idx].box;
        d_top = std::min(d_top, (b.y1 - k * b.x1 - b0) / norm);
        d_bottom = std::max(d_bottom, (b.y2 - k * b.x2 - b0) / norm);
    }
    const double bt = b0 + d_top * norm;
    const double bb = b0 + d_bottom * norm;

    cv::Point2f tl((float) left, (float) (k * left + bt));
    cv::Point2f tr((float) right, (float) (k * right + bt));
    cv::Point2f bl((float) left, (float) (k * left + bb));
    cv::Point2f br((float) right, (float) (k * right + bb));

    float dis_x = tr.x - tl.x, dis_y = tr.y - tl.y;
    float width = std::sqrt(dis_x * dis_x + dis_y * dis_y);
    float height = bl.y - tl.y;
    if (!(width > 0.f) || !(height > 0.f))
        return false;

    // 竖边平行四边形 -> 矩形的补偿
    float t = height * dis_y / width;
    float cx = std::fabs(t * dis_x / width);
    float cy = std::fabs(t * dis_y / width);
    if (k < 0) {
        tl.x -= cx;
        tl.y += cy;
        br.x += cx;
        br.y -= cy;
    } else {
        tr.x += cx;
        tr.y += cy;
        bl.x -= cx;
        bl.y -= cy;
    }

    TextRegion region;
    region.quad = {tl, tr, br, bl};
    for (auto &p: region.quad) {
        if (!finite_point(p))
            return false;
    }
    region.bbox = cv::Rect2f(left, top, right - left, bottom - top);
    region.score = (float) (score_sum / (double) chain.size());
    region.slope = (float) k;
    region.angle = (float) (std::atan2(tr.y - tl.y, tr.x - tl.x) * 180.0 / CV_PI);
    out = region;
    return true;
}

std::array<float, 8> quad_to_array(const TextRegion &region) {
    std::array<float, 8> v{};
    for (int i = 0; i < 4; ++i) {
        v[2 * i] = region.quad[i].x;
        v[2 * i + 1] = region.quad[i].y;
    }
    return v;
}
