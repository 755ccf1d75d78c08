#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <algorithm>
#include <array>
#include <tuple>
#include <vector>

#include "ctc_decoder.h"
#include "proposals.h"
#include "quad_fitter.h"
#include "text_line_builder.h"

namespace py = pybind11;

using BoxList = std::vector<std::array<float, 4>>;

static std::vector<TextProposal> to_proposals(const BoxList &boxes, const std::vector<float> &scores) {
    if (boxes.size() != scores.size())
        throw py::value_error("boxes and scores must have the same length");
    std::vector<TextProposal> ps(boxes.size());
    for (size_t i = 0; i < boxes.size(); ++i) {
        ps[i].box = {boxes[i][0], boxes[i][1], boxes[i][2], boxes[i][3]};
        ps[i].score = scores[i];
    }
    return ps;
}

PYBIND11_MODULE(ctpn_ocr, m) {
    m.doc() = "CTPN text line post-processing core";

    m.def("generate_anchors", [](int rows, int cols, int stride) {
        BoxList out;
        for (auto &a: generate_anchors(cv::Size(cols, rows), stride))
            out.push_back({a.x1, a.y1, a.x2, a.y2});
        return out;
    }, py::arg("rows"), py::arg("cols"), py::arg("stride") = 16);

    m.def("nms", [](const BoxList &boxes, const std::vector<float> &scores, float thresh) {
        return nms(to_proposals(boxes, scores), thresh);
    }, py::arg("boxes"), py::arg("scores"), py::arg("thresh") = 0.3f);

    m.def("build_text_lines", [](const BoxList &boxes, const std::vector<float> &scores, float max_horizontal_gap,
                                 float min_v_overlap, float min_size_sim) {
        TextLineBuilder::Params p;
        p.max_horizontal_gap = max_horizontal_gap;
        p.min_v_overlap = min_v_overlap;
        p.min_size_sim = min_size_sim;
        return TextLineBuilder(p).build(to_proposals(boxes, scores));
    }, py::arg("boxes"), py::arg("scores"), py::arg("max_horizontal_gap") = 32.f, py::arg("min_v_overlap") = 0.7f,
          py::arg("min_size_sim") = 0.7f);

    // 返回 [(行下标, 8 个坐标, 分数)]，退化的行被跳过
    m.def("fit_text_regions", [](const BoxList &boxes, const std::vector<float> &scores,
                                 const std::vector<TextChain> &chains) {
        auto ps = to_proposals(boxes, scores);
        for (auto &c: chains) {
            for (int idx: c) {
                if (idx < 0 || idx >= (int) ps.size())
                    throw py::index_error("chain index out of range");
            }
        }
        std::vector<std::tuple<int, std::array<float, 8>, float>> out;
        for (int i = 0; i < (int) chains.size(); ++i) {
            TextRegion r;
            if (fit_text_region(ps, chains[i], r))
                out.emplace_back(i, quad_to_array(r), r.score);
        }
        return out;
    }, py::arg("boxes"), py::arg("scores"), py::arg("chains"));

    m.def("ctc_greedy_decode", [](const std::vector<std::vector<float>> &probs,
                                  const std::vector<std::string> &charset, int blank) {
        const int T = (int) probs.size();
        const int C = T ? (int) probs[0].size() : 0;
        cv::Mat mat(T, C, CV_32F);
        for (int t = 0; t < T; ++t) {
            if ((int) probs[t].size() != C)
                throw py::value_error("ragged probability matrix");
            std::copy(probs[t].begin(), probs[t].end(), mat.ptr<float>(t));
        }
        return ctc_greedy_decode(mat, charset, blank);
    }, py::arg("probs"), py::arg("charset"), py::arg("blank") = 0);
}
