#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Graph.hpp"   // Graph facade

#include <boost/archive/archive_exception.hpp>   // rejected snapshots
#include <boost/archive/text_iarchive.hpp>   // loadGraph()
#include <boost/archive/text_oarchive.hpp>   // saveGraph()
#include <boost/serialization/access.hpp>    // boost::serialization::access
#include <boost/serialization/utility.hpp>   // std::pair members
#include <boost/serialization/vector.hpp>    // std::vector members

#include <cstddef>       // std::size_t
#include <istream>       // std::istream
#include <limits>        // matrix size bound
#include <ostream>       // std::ostream
#include <utility>       // std::pair
#include <vector>        // node and arc records

// ==========================
// GraphSnapshot
// ==========================
// Plain, serializable image of a Graph: kind, node weights and arcs,
// independent of the representation. Boost.Serialization archives it.
//
// Node weights are stored in one of two layouts:
// - extended: every weight, in index order
// - compact:  the node count plus (index, weight) for non-zero weights,
//             used when more than about half of the weights are zero
// Arcs are stored either weighted (from, to, weight) or simple (from, to)
// when every arc weight is zero. An undirected pair is stored once,
// with from <= to.
// ==========================

template <typename NodeW, typename ArcW = NodeW>
class GraphSnapshot {
public:
    using GraphT = Graph<NodeW, ArcW>;
    using Vertex = typename GraphT::Vertex;

    struct ArcRecord {
        Vertex from = 0;
        Vertex to = 0;
        ArcW weight{};

        template <class TArchive>
        void serialize(TArchive& ar, const unsigned int) {
            ar & from & to & weight;
        }
    };

    GraphSnapshot() = default;   // target of an input archive

    static GraphSnapshot fromGraph(const GraphT& g) {
        GraphSnapshot s;
        s.m_directed = g.directed();
        s.m_nodeCount = g.nodeCount();

        std::size_t zeros = 0;
        g.forEachNode([&](Vertex, const NodeW& w) { if (WeightTraits<NodeW>::isZero(w)) ++zeros; });
        s.m_compact = 2 * zeros > s.m_nodeCount + 1;
        g.forEachNode([&](Vertex i, const NodeW& w) {
            if (!s.m_compact) s.m_nodes.push_back(w);
            else if (!WeightTraits<NodeW>::isZero(w)) s.m_indexed.emplace_back(i, w);
        });

        s.m_weighted = false;
        g.forEachArc([&](Vertex u, Vertex v, const ArcW& w) {
            if (!g.directed() && u > v) return;          // mirror half
            s.m_arcs.push_back(ArcRecord{u, v, w});
            if (!WeightTraits<ArcW>::isZero(w)) s.m_weighted = true;
        });
        if (!s.m_weighted) {                             // drop the all-zero weights
            for (const ArcRecord& a : s.m_arcs) s.m_links.emplace_back(a.from, a.to);
            s.m_arcs.clear();
        }
        return s;
    }

    // Rebuild a graph in the requested representation.
    // Throws archive_exception when an index is outside [0, nodeCount) or the
    // matrix table would not fit in a size_t.
    GraphT toGraph(Representation rep = Representation::List) const {
        checkIndices(rep);
        const Kind kind = m_directed ? Kind::Directed : Kind::Undirected;
        GraphT g = m_compact ? GraphT(m_nodeCount, kind, rep)
                             : GraphT(m_nodeCount, kind, m_nodes, rep);   // SizeMismatch if corrupt
        if (m_compact) g.assignNodeWeights(m_indexed);
        for (const ArcRecord& a : m_arcs) g.insertArc(a.from, a.to, a.weight);
        for (const auto& l : m_links) g.insertDefaultArc(l.first, l.second);
        return g;
    }

    bool directed() const noexcept { return m_directed; }
    std::size_t nodeCount() const noexcept { return m_nodeCount; }
    bool compactNodes() const noexcept { return m_compact; }
    bool weightedArcs() const noexcept { return m_weighted; }
    const std::vector<NodeW>& nodeWeights() const noexcept { return m_nodes; }
    const std::vector<std::pair<Vertex, NodeW>>& indexedNodeWeights() const noexcept { return m_indexed; }
    const std::vector<ArcRecord>& weightedArcList() const noexcept { return m_arcs; }
    const std::vector<std::pair<Vertex, Vertex>>& simpleArcList() const noexcept { return m_links; }

private:
    friend class boost::serialization::access;

    // Archived indices come from outside the program, unlike caller indices
    void checkIndices(Representation rep) const {
        using boost::archive::archive_exception;
        if (rep == Representation::Matrix && m_nodeCount != 0 &&
            m_nodeCount > std::numeric_limits<std::size_t>::max() / m_nodeCount)
            throw archive_exception(archive_exception::input_stream_error, "node count too large for a matrix");
        for (const auto& p : m_indexed)
            if (p.first >= m_nodeCount)
                throw archive_exception(archive_exception::input_stream_error, "node index out of range");
        for (const ArcRecord& a : m_arcs)
            if (a.from >= m_nodeCount || a.to >= m_nodeCount)
                throw archive_exception(archive_exception::input_stream_error, "arc endpoint out of range");
        for (const auto& l : m_links)
            if (l.first >= m_nodeCount || l.second >= m_nodeCount)
                throw archive_exception(archive_exception::input_stream_error, "arc endpoint out of range");
    }

    template <class TArchive>
    void serialize(TArchive& ar, const unsigned int) {
        ar & m_directed & m_nodeCount & m_compact;
        if (m_compact) ar & m_indexed;
        else ar & m_nodes;
        ar & m_weighted;
        if (m_weighted) ar & m_arcs;
        else ar & m_links;
    }

    bool m_directed = false;
    std::size_t m_nodeCount = 0;
    bool m_compact = false;
    std::vector<NodeW> m_nodes;                         // extended layout
    std::vector<std::pair<Vertex, NodeW>> m_indexed;    // compact layout
    bool m_weighted = false;
    std::vector<ArcRecord> m_arcs;                      // weighted layout
    std::vector<std::pair<Vertex, Vertex>> m_links;     // simple layout
};

// Write g to `os` as a Boost text archive
template <typename NodeW, typename ArcW>
void saveGraph(const Graph<NodeW, ArcW>& g, std::ostream& os) {
    const GraphSnapshot<NodeW, ArcW> snapshot = GraphSnapshot<NodeW, ArcW>::fromGraph(g);
    boost::archive::text_oarchive ar(os);
    ar << snapshot;
}

// Read a graph written by saveGraph(); the representation may differ from the saved one.
// Throws boost::archive::archive_exception on malformed input, including
// node or arc indices outside the archived node count.
template <typename NodeW, typename ArcW = NodeW>
Graph<NodeW, ArcW> loadGraph(std::istream& is, Representation rep = Representation::List) {
    GraphSnapshot<NodeW, ArcW> snapshot;
    {
        boost::archive::text_iarchive ar(is);
        ar >> snapshot;
    }
    return snapshot.toGraph(rep);
}
