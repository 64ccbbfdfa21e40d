#pragma once                              // ensure this header is included only once per translation unit

#include "graph/AdjacencyList.hpp"     // sparse backend
#include "graph/AdjacencyMatrix.hpp"   // dense backend
#include "graph/ArcStorage.hpp"        // IArcStorage, NeighborRange
#include "graph/GraphError.hpp"        // SizeMismatch, ArcNotFound, ArcAlreadyExists
#include "graph/GraphKind.hpp"         // Kind, Representation
#include "graph/Weight.hpp"            // weight contract

#include <cstddef>       // std::size_t
#include <map>           // pairing undirected arcs in updateAllArcsWeight()
#include <memory>        // std::unique_ptr owning the backend
#include <sstream>       // used for building strings in label()
#include <string>        // std::string for label()
#include <utility>       // std::pair, std::move
#include <vector>        // node weights

// ==========================
// Graph facade
// ==========================
// The only caller-facing graph type. It owns:
// - a fixed number of nodes, each carrying a NodeW weight
// - one arc storage (AdjacencyList or AdjacencyMatrix), chosen once in
//   the constructor and never inspected afterwards
// - the directed/undirected kind
//
// Undirected graphs store every arc in both directions with the same
// weight. Every write goes primary direction first, then the mirror.
// A self-loop in an undirected graph is a single stored arc.
//
// Node indices are never validated: every index passed in must lie in
// [0, nodeCount()). Not thread-safe; wrap in a mutex if shared.
// ==========================

template <typename NodeW, typename ArcW = NodeW>
class Graph {
    static_assert(IsWeightV<NodeW>, "node weight type must satisfy the weight contract");
    static_assert(IsWeightV<ArcW>, "arc weight type must satisfy the weight contract");

public:
    // Type aliases for readability
    using Vertex     = std::size_t;                // node index type
    using NodeWeight = NodeW;
    using ArcWeight  = ArcW;
    using Arc        = std::pair<Vertex, ArcW>;    // (neighbor, weight)
    using Neighbors  = NeighborRange<ArcW>;

    // ---- Constructors ----

    // All node weights start at zero
    Graph(std::size_t n, Kind kind, Representation rep = Representation::List)
        : m_kind(kind), m_rep(rep), m_nodes(n), m_arcs(makeStorage(rep, n)), m_arcCount(0) {}

    // Node weights supplied up front; throws SizeMismatch if nodeWeights.size() != n
    Graph(std::size_t n, Kind kind, std::vector<NodeW> nodeWeights,
          Representation rep = Representation::List)
        : m_kind(kind), m_rep(rep), m_nodes(checkedWeights(n, std::move(nodeWeights))),
          m_arcs(makeStorage(rep, n)), m_arcCount(0) {}

    Graph(Graph&&) noexcept = default;
    Graph& operator=(Graph&&) noexcept = default;

    // Deep copy in the same representation
    Graph clone() const { return clone(m_rep); }

    // Deep copy in another representation; queries answer identically
    Graph clone(Representation rep) const {
        Graph out(nodeCount(), m_kind, m_nodes, rep);
        if (rep == m_rep) {
            out.m_arcs = m_arcs->clone();
        } else {
            forEachArc([&](Vertex u, Vertex v, const ArcW& w) {
                if (directed() || u <= v) out.m_arcs->insertArc(u, v, w, !directed());
            });
        }
        out.m_arcCount = m_arcCount;
        return out;
    }

    // ---- Shape ----

    std::size_t nodeCount() const noexcept { return m_nodes.size(); }

    // Logical arcs: an undirected pair counts once
    std::size_t arcCount() const noexcept { return m_arcCount; }

    std::size_t totalEntries() const noexcept { return nodeCount() + arcCount(); }

    Kind kind() const noexcept { return m_kind; }
    bool directed() const noexcept { return m_kind == Kind::Directed; }
    Representation representation() const noexcept { return m_rep; }

    // ---- Node weights ----

    const NodeW& nodeWeight(Vertex i) const { return m_nodes[i]; }
    void setNodeWeight(Vertex i, const NodeW& w) { m_nodes[i] = w; }

    // Assign weights in index order; stops at the shorter of the two
    template <typename Seq>
    void assignNodeWeights(const Seq& weights) {
        Vertex i = 0;
        for (const auto& w : weights) {
            if (i >= m_nodes.size()) break;
            m_nodes[i++] = w;
        }
    }

    // Assign only the listed (index, weight) pairs
    void assignNodeWeights(const std::vector<std::pair<Vertex, NodeW>>& indexed) {
        for (const auto& p : indexed) m_nodes[p.first] = p.second;
    }

    // nodes[i] = f(i, nodes[i]) for every node
    template <typename F>
    void updateAllNodesWeight(F f) {
        for (Vertex i = 0; i < m_nodes.size(); ++i) m_nodes[i] = f(i, m_nodes[i]);
    }

    // ---- Arcs ----

    // Add arc u->v (and v->u if undirected). Throws ArcAlreadyExists if u->v is stored.
    void insertArc(Vertex u, Vertex v, const ArcW& w) {
        if (m_arcs->findArc(u, v)) throw ArcAlreadyExists(u, v);
        m_arcs->insertArc(u, v, w, !directed());
        ++m_arcCount;
    }

    // insertArc() with the zero weight
    void insertDefaultArc(Vertex u, Vertex v) { insertArc(u, v, WeightTraits<ArcW>::zero()); }

    // Replace the weight of u->v (and v->u if undirected). Throws ArcNotFound if absent.
    void updateArc(Vertex u, Vertex v, const ArcW& w) {
        if (!m_arcs->updateArc(u, v, w, !directed())) throw ArcNotFound(u, v);
    }

    // Weight of u->v; throws ArcNotFound if absent
    ArcW arc(Vertex u, Vertex v) const {
        const ArcW* w = m_arcs->findArc(u, v);
        if (!w) throw ArcNotFound(u, v);
        return *w;
    }

    bool hasArc(Vertex u, Vertex v) const { return m_arcs->findArc(u, v) != nullptr; }

    // Remove u->v (and v->u if undirected). Returns false if nothing was stored.
    bool removeArc(Vertex u, Vertex v) {
        bool changed = m_arcs->removeArc(u, v, !directed());
        if (changed) --m_arcCount;
        return changed;
    }

    // Lazy (neighbor, weight) sequence of the arcs leaving u
    Neighbors neighbors(Vertex u) const { return Neighbors(*m_arcs, u); }

    std::size_t outDegree(Vertex u) const { return m_arcs->degree(u); }

    // ---- Visitors ----

    // f(i, weight) for every node, in index order
    template <typename F>
    void forEachNode(F f) const {
        for (Vertex i = 0; i < m_nodes.size(); ++i) f(i, m_nodes[i]);
    }

    // f(from, to, weight) for every stored direction: node order, then backend order.
    // Undirected pairs are visited twice, once per direction.
    template <typename F>
    void forEachArc(F f) const {
        for (Vertex u = 0; u < m_nodes.size(); ++u) {
            for (const Arc& a : neighbors(u)) f(u, a.first, a.second);
        }
    }

    // Replace every arc weight with f(from, to, weight).
    // For undirected graphs f is called once per pair (from <= to) and the
    // result is written to both directions.
    template <typename F>
    void updateAllArcsWeight(F f) {
        if (directed()) {
            m_arcs->transformArcs([&](Vertex u, Vertex v, const ArcW& w) { return ArcW(f(u, v, w)); });
            return;
        }
        std::map<std::pair<Vertex, Vertex>, ArcW> lower;   // results of already visited pairs
        m_arcs->transformArcs([&](Vertex u, Vertex v, const ArcW& w) {
            if (u <= v) {
                ArcW next = f(u, v, w);
                lower.emplace(std::make_pair(u, v), next);
                return next;
            }
            return lower.at(std::make_pair(v, u));           // row v was visited before row u
        });
    }

    // Return a human-readable summary: "DirectedGraph(3V,2E,List)"
    std::string label() const {
        std::ostringstream oss;
        oss << kindName(m_kind) << "Graph(" << nodeCount() << "V," << arcCount() << "E,"
            << representationName(m_rep) << ")";
        return oss.str();
    }

private:
    Kind m_kind;                                   // directed or undirected
    Representation m_rep;                          // backend chosen at construction
    std::vector<NodeW> m_nodes;                    // node weights, size fixed
    std::unique_ptr<IArcStorage<ArcW>> m_arcs;     // arc storage
    std::size_t m_arcCount;                        // number of logical arcs

    // The only place where the representation is looked at
    static std::unique_ptr<IArcStorage<ArcW>> makeStorage(Representation rep, std::size_t n) {
        if (rep == Representation::Matrix) return std::make_unique<AdjacencyMatrix<ArcW>>(n);
        return std::make_unique<AdjacencyList<ArcW>>(n);
    }

    static std::vector<NodeW> checkedWeights(std::size_t n, std::vector<NodeW> weights) {
        if (weights.size() != n) throw SizeMismatch(n, weights.size());
        return weights;
    }
}; // end class Graph

// Same kind, same node weights, same arcs with the same weights.
// The representation does not take part in the comparison.
template <typename NodeW, typename ArcW>
bool operator==(const Graph<NodeW, ArcW>& a, const Graph<NodeW, ArcW>& b) {
    if (a.kind() != b.kind() || a.nodeCount() != b.nodeCount() || a.arcCount() != b.arcCount())
        return false;
    for (std::size_t u = 0; u < a.nodeCount(); ++u) {
        if (!(a.nodeWeight(u) == b.nodeWeight(u))) return false;
        if (a.outDegree(u) != b.outDegree(u)) return false;
        for (const auto& arc : a.neighbors(u)) {
            if (!b.hasArc(u, arc.first) || !(b.arc(u, arc.first) == arc.second)) return false;
        }
    }
    return true;
}

template <typename NodeW, typename ArcW>
bool operator!=(const Graph<NodeW, ArcW>& a, const Graph<NodeW, ArcW>& b) {
    return !(a == b);
}
