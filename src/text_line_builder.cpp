#include "text_line_builder.h"
#include <algorithm>
#include <iostream>

static inline float v_overlap(const TextBoxF &a, const TextBoxF &b) {
    float y0 = std::max(a.y1, b.y1);
    float y1 = std::min(a.y2, b.y2);
    return std::max(0.f, y1 - y0 + 1.f) / std::min(a.height(), b.height());
}

static inline float size_similarity(const TextBoxF &a, const TextBoxF &b) {
    float ha = a.height(), hb = b.height();
    return std::min(ha, hb) / std::max(ha, hb);
}

bool TextLineBuilder::meet_v_iou(const TextBoxF &a, const TextBoxF &b) const {
    return v_overlap(a, b) >= params_.min_v_overlap && size_similarity(a, b) >= params_.min_size_sim;
}

namespace {
    // b 是否可以接在 a 的右边
    struct Adjacency {
        const TextLineBuilder &builder;
        float max_gap;

        bool operator()(const TextBoxF &a, const TextBoxF &b) const {
            if (!(b.x1 > a.x1))
                return false;
            if (b.x1 - a.x2 > max_gap)
                return false;
            return builder.meet_v_iou(a, b);
        }
    };

    // 候选排序：更近 > 分数更高 > 竖直重叠更大 > 下标更小
    // nearer(x, y) 为 true 表示 x 比 y 更靠近
    template<class Nearer>
    bool better(const std::vector<TextProposal> &ps, int self, int cand, int cur, Nearer nearer) {
        if (cur < 0)
            return true;
        const TextBoxF &c = ps[cand].box, &o = ps[cur].box;
        if (nearer(c, o))
            return true;
        if (nearer(o, c))
            return false;
        if (ps[cand].score != ps[cur].score)
            return ps[cand].score > ps[cur].score;
        float vc = v_overlap(ps[self].box, c), vo = v_overlap(ps[self].box, o);
        if (vc != vo)
            return vc > vo;
        return cand < cur;
    }
}

std::vector<int> TextLineBuilder::best_successors(const std::vector<TextProposal> &proposals) const {
    const int n = (int) proposals.size();
    Adjacency adjacent{*this, params_.max_horizontal_gap};
    auto nearer = [](const TextBoxF &x, const TextBoxF &y) { return x.x1 < y.x1; };

    std::vector<int> best(n, -1);
    for (int a = 0; a < n; ++a) {
        for (int b = 0; b < n; ++b) {
            if (b == a || !adjacent(proposals[a].box, proposals[b].box))
                continue;
            if (better(proposals, a, b, best[a], nearer))
                best[a] = b;
        }
    }
    return best;
}

std::vector<int> TextLineBuilder::best_precursors(const std::vector<TextProposal> &proposals) const {
    const int n = (int) proposals.size();
    Adjacency adjacent{*this, params_.max_horizontal_gap};
    auto nearer = [](const TextBoxF &x, const TextBoxF &y) { return x.x1 > y.x1; };

    std::vector<int> best(n, -1);
    for (int b = 0; b < n; ++b) {
        for (int a = 0; a < n; ++a) {
            if (a == b || !adjacent(proposals[a].box, proposals[b].box))
                continue;
            if (better(proposals, b, a, best[b], nearer))
                best[b] = a;
        }
    }
    return best;
}

std::vector<TextChain> TextLineBuilder::build(const std::vector<TextProposal> &proposals) const {
    const int n = (int) proposals.size();
    const auto best_right = best_successors(proposals);
    const auto best_left = best_precursors(proposals);

    // 只保留双向互为最优的边；x1 严格递增，不会成环
    std::vector<int> next(n, -1), prev(n, -1);
    for (int a = 0; a < n; ++a) {
        int b = best_right[a];
        if (b >= 0 && best_left[b] == a) {
            next[a] = b;
            prev[b] = a;
        }
    }

    std::vector<TextChain> chains;
    std::vector<char> assigned(n, 0);
    for (int i = 0; i < n; ++i) {
        if (assigned[i])
            continue;
        int head = i;
        while (prev[head] >= 0)
            head = prev[head];

        TextChain chain;
        for (int v = head; v >= 0; v = next[v]) {
            chain.push_back(v);
            assigned[v] = 1;
        }
        chains.push_back(std::move(chain));
    }

#ifndef NDEBUG
    std::cout << "[DET] proposals=" << n << " text_lines=" << chains.size() << "\n";
#endif
    return chains;
}
