#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Graph.hpp"   // Graph facade
#include <cstddef>           // std::size_t
#include <limits>            // max_digits10
#include <sstream>           // std::ostringstream to print weights
#include <string>            // std::string
#include <type_traits>       // std::is_floating_point
#include <vector>            // statement buffer

// ==========================
// Graphviz export
// ==========================
// Read-only view of a Graph as dot source:
//
//   digraph {
//   \tn0 [label="<node weight>"];
//   \tn0 -> n1 [label="<arc weight>"];
//   }
//
// Nodes come first in index order, then arcs in node order and, for each
// node, in backend order. Undirected graphs use "graph" and "--" and emit
// each mirrored pair once (from <= to).
//
// Floating-point labels are printed with max_digits10 significant digits,
// so a label reads back as the stored value (0.1 + 0.2 prints as
// 0.30000000000000004, not 0.3).
// ==========================

// Collects dot statements; the weight-independent half of toDot()
class DotWriter {
public:
    DotWriter(Kind kind, std::size_t reserve);

    void addNode(std::size_t i, const std::string& label);

    // Skips the mirror half of an undirected pair
    void addArc(std::size_t from, std::size_t to, const std::string& label);

    // Whole document, statements joined by '\n', no trailing newline
    std::string build() const;

private:
    Kind m_kind;
    std::vector<std::string> m_lines;
};

namespace detail {
template <typename T>
std::string dotLabel(const T& value) {
    std::ostringstream oss;
    if (std::is_floating_point<T>::value) oss.precision(std::numeric_limits<T>::max_digits10);
    oss << value;
    return oss.str();
}
} // namespace detail

template <typename NodeW, typename ArcW>
std::string toDot(const Graph<NodeW, ArcW>& g) {
    DotWriter out(g.kind(), g.totalEntries());
    g.forEachNode([&](std::size_t i, const NodeW& w) { out.addNode(i, detail::dotLabel(w)); });
    g.forEachArc([&](std::size_t u, std::size_t v, const ArcW& w) {
        out.addArc(u, v, detail::dotLabel(w));
    });
    return out.build();
}
