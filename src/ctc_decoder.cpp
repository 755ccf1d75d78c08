#include "ctc_decoder.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string ctc_greedy_decode(const cv::Mat &probs, const std::vector<std::string> &charset, int blank_index,
                              float *avg_conf) {
    if (avg_conf)
        *avg_conf = 0.f;
    if (probs.empty())
        return {};
    if (probs.dims != 2 || probs.type() != CV_32F)
        throw std::invalid_argument("ctc probs must be a 2-D CV_32F TxC matrix");
    const int T = probs.rows, C = probs.cols;
    if (C != (int) charset.size())
        throw std::invalid_argument("ctc probs has " + std::to_string(C) + " classes, charset has " +
                                    std::to_string(charset.size()));
    if (blank_index < 0 || blank_index >= C)
        throw std::invalid_argument("ctc blank index out of range: " + std::to_string(blank_index));

    std::string out;
    out.reserve(T);
    int prev_k = -1;
    double sum_logp = 0.0;
    int used = 0;
    for (int t = 0; t < T; ++t) {
        const float *row = probs.ptr<float>(t);
        int k = int(std::max_element(row, row + C) - row); // argmax
        // 忽略 blank，且只输出与前一帧不同的 k
        if (k != blank_index && k != prev_k) {
            out += charset[k];
            sum_logp += std::log(std::max((double) row[k], 1e-12));
            used++;
        }
        prev_k = k;
    }

    if (avg_conf)
        *avg_conf = used ? (float) std::exp(sum_logp / used) : 0.f;
    return out;
}
