#pragma once                              // ensure this header is included only once per translation unit

#include "graph/ArcStorage.hpp"   // IArcStorage interface
#include <algorithm>              // std::find_if
#include <vector>                 // per-node arc vectors

// ==========================
// AdjacencyList
// ==========================
// Sparse arc storage: one vector of (neighbor, weight) per node, kept in
// insertion order. Memory is proportional to the number of stored arcs.
// - insert: O(1) amortized append
// - find / update / remove: O(degree) linear scan
// - neighbor pass: O(degree)
// An undirected self-loop (from == to with mirror) is stored once.
// ==========================

template <typename W>
class AdjacencyList final : public IArcStorage<W> {
public:
    using typename IArcStorage<W>::Vertex;
    using typename IArcStorage<W>::Arc;
    using typename IArcStorage<W>::Transform;

    explicit AdjacencyList(std::size_t n) : m_adj(n) {}

    std::size_t n() const noexcept override { return m_adj.size(); }

    void insertArc(Vertex from, Vertex to, const W& w, bool mirror) override {
        m_adj[from].emplace_back(to, w);                // primary direction
        if (mirror && from != to) {
            m_adj[to].emplace_back(from, w);            // mirror direction
        }
    }

    bool updateArc(Vertex from, Vertex to, const W& w, bool mirror) override {
        Arc* primary = locate(from, to);
        if (!primary) return false;                     // never inserts
        primary->second = w;
        if (mirror && from != to) {
            if (Arc* back = locate(to, from)) back->second = w;
        }
        return true;
    }

    const W* findArc(Vertex from, Vertex to) const override {
        const auto& lst = m_adj[from];
        auto it = std::find_if(lst.begin(), lst.end(),
                               [to](const Arc& a) { return a.first == to; });
        return it == lst.end() ? nullptr : &it->second;
    }

    bool removeArc(Vertex from, Vertex to, bool mirror) override {
        bool changed = removeOne(from, to);
        if (changed && mirror && from != to) {
            removeOne(to, from);
        }
        return changed;
    }

    std::size_t degree(Vertex from) const override { return m_adj[from].size(); }

    // Every entry of a list is a stored arc, so the cursor is already valid
    std::size_t seekNeighbor(Vertex from, std::size_t cursor) const override {
        return cursor < m_adj[from].size() ? cursor : m_adj[from].size();
    }

    Arc neighborAt(Vertex from, std::size_t cursor) const override { return m_adj[from][cursor]; }

    std::size_t cursorEnd(Vertex from) const override { return m_adj[from].size(); }

    void transformArcs(const Transform& f) override {
        for (Vertex u = 0; u < m_adj.size(); ++u) {
            for (auto& a : m_adj[u]) a.second = f(u, a.first, a.second);
        }
    }

    std::unique_ptr<IArcStorage<W>> clone() const override {
        return std::make_unique<AdjacencyList>(*this);
    }

private:
    std::vector<std::vector<Arc>> m_adj;   // m_adj[u] = arcs leaving u

    Arc* locate(Vertex from, Vertex to) {
        auto& lst = m_adj[from];
        auto it = std::find_if(lst.begin(), lst.end(),
                               [to](const Arc& a) { return a.first == to; });
        return it == lst.end() ? nullptr : &*it;
    }

    // Helper: remove arc from->to from the list of `from`, keeping order
    bool removeOne(Vertex from, Vertex to) {
        auto& lst = m_adj[from];
        auto it = std::find_if(lst.begin(), lst.end(),
                               [to](const Arc& a) { return a.first == to; });
        if (it == lst.end()) return false;
        lst.erase(it);
        return true;
    }
};
