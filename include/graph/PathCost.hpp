#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Graph.hpp"   // Graph facade, ArcNotFound
#include <cstddef>           // std::size_t
#include <utility>           // std::move
#include <vector>            // path storage

// ==========================
// SubPathCosts
// ==========================
// Lazy cost of every sub-path of a node path p0, p1, ..., pk.
// For each start i and each end j > i it yields (p_i, p_j, cost), where
// cost is the sum of arc weights from p_i to p_j. Entries are grouped by
// start: (p0,p1), (p0,p2), ..., (p0,pk), (p1,p2), ...
//
// Only the forward direction is walked. A consecutive pair that is not an
// arc raises ArcNotFound when it is reached.
// ==========================
template <typename NodeW, typename ArcW>
class SubPathCosts {
public:
    using Vertex = typename Graph<NodeW, ArcW>::Vertex;

    struct Entry {
        Vertex from;   // first node of the sub-path
        Vertex to;     // last node of the sub-path
        ArcW cost;     // sum of arc weights from `from` to `to`
    };

    SubPathCosts(const Graph<NodeW, ArcW>& g, std::vector<Vertex> path)
        : m_graph(g), m_path(std::move(path)), m_start(0), m_end(1),
          m_cost(WeightTraits<ArcW>::zero()) {}

    // Produce the next entry; returns false when every sub-path was visited
    bool next(Entry& out) {
        if (m_end >= m_path.size()) {                   // current start exhausted
            ++m_start;
            m_end = m_start + 1;
            m_cost = WeightTraits<ArcW>::zero();
        }
        if (m_end >= m_path.size()) return false;

        m_cost = m_cost + m_graph.arc(m_path[m_end - 1], m_path[m_end]);
        out = Entry{m_path[m_start], m_path[m_end], m_cost};
        ++m_end;
        return true;
    }

    // Drain the remaining entries
    std::vector<Entry> collect() {
        std::vector<Entry> all;
        Entry e{};
        while (next(e)) all.push_back(e);
        return all;
    }

private:
    const Graph<NodeW, ArcW>& m_graph;
    std::vector<Vertex> m_path;
    std::size_t m_start;   // index in m_path of the current sub-path start
    std::size_t m_end;     // index in m_path of the next sub-path end
    ArcW m_cost;           // running cost from m_start to m_end - 1
};
