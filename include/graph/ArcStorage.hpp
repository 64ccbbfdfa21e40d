#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Weight.hpp"   // IsWeight contract
#include <cstddef>            // std::size_t
#include <functional>         // std::function for arc transforms
#include <iterator>           // std::input_iterator_tag
#include <memory>             // std::unique_ptr for clone()
#include <utility>            // std::pair for (neighbor, weight)

// ==========================
// Arc storage interface
// ==========================
// Strategy interface implemented by AdjacencyList and AdjacencyMatrix.
// The storage knows nothing about directed/undirected semantics: the
// Graph facade passes `mirror = true` when the reverse direction must be
// written in the same call. Mirror writes always happen primary first,
// then mirror.
//
// Neighbor iteration is cursor based: a cursor is a backend-specific
// position inside the row of a node (list: entry index, matrix: column).
// seekNeighbor() skips to the next stored arc at or after a cursor and
// returns cursorEnd() when the row is exhausted.
// ==========================

template <typename W>
class IArcStorage {
    static_assert(IsWeightV<W>, "arc weight type must satisfy the weight contract");

public:
    using Vertex = std::size_t;                    // node index type
    using Arc    = std::pair<Vertex, W>;           // (neighbor, weight)
    using Transform = std::function<W(Vertex, Vertex, const W&)>;

    virtual ~IArcStorage() = default;

    // Number of nodes the storage was sized for
    virtual std::size_t n() const noexcept = 0;

    // Store (from, to, w), plus (to, from, w) when mirror is set and from != to.
    // Does not check for an existing arc.
    virtual void insertArc(Vertex from, Vertex to, const W& w, bool mirror) = 0;

    // Overwrite the weight of a stored arc (and its mirror).
    // Returns false, writing nothing, if (from, to) is not stored.
    virtual bool updateArc(Vertex from, Vertex to, const W& w, bool mirror) = 0;

    // Pointer to the stored weight of (from, to), or nullptr
    virtual const W* findArc(Vertex from, Vertex to) const = 0;

    // Erase (from, to) and its mirror. Returns false if (from, to) was not stored.
    virtual bool removeArc(Vertex from, Vertex to, bool mirror) = 0;

    // Number of arcs stored in the row of `from`
    virtual std::size_t degree(Vertex from) const = 0;

    // Cursor protocol used by NeighborRange
    virtual std::size_t seekNeighbor(Vertex from, std::size_t cursor) const = 0;
    virtual Arc neighborAt(Vertex from, std::size_t cursor) const = 0;
    virtual std::size_t cursorEnd(Vertex from) const = 0;

    // Replace every stored weight with f(from, to, weight).
    // Rows are visited in increasing node order.
    virtual void transformArcs(const Transform& f) = 0;

    // Deep copy of the same representation
    virtual std::unique_ptr<IArcStorage> clone() const = 0;
};

// ==========================
// NeighborRange
// ==========================
// Lazy, finite, restartable sequence of (neighbor, weight) pairs for one
// node. Nothing is materialized: each step asks the storage for the next
// stored arc. Every begin() starts a new pass. The range must not outlive
// the graph and must not be iterated while the graph is being modified.
// ==========================

template <typename W>
class NeighborRange {
public:
    using Storage = IArcStorage<W>;
    using Vertex  = typename Storage::Vertex;
    using Arc     = typename Storage::Arc;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Arc;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = Arc;

        iterator() = default;
        iterator(const Storage* s, Vertex node, std::size_t cursor)
            : m_storage(s), m_node(node), m_cursor(cursor) {}

        Arc operator*() const { return m_storage->neighborAt(m_node, m_cursor); }

        iterator& operator++() {
            m_cursor = m_storage->seekNeighbor(m_node, m_cursor + 1);
            return *this;
        }

        iterator operator++(int) {
            iterator prev = *this;
            ++*this;
            return prev;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.m_storage == b.m_storage && a.m_node == b.m_node && a.m_cursor == b.m_cursor;
        }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        const Storage* m_storage = nullptr;
        Vertex m_node = 0;
        std::size_t m_cursor = 0;
    };

    NeighborRange(const Storage& s, Vertex node) : m_storage(&s), m_node(node) {}

    iterator begin() const { return iterator(m_storage, m_node, m_storage->seekNeighbor(m_node, 0)); }
    iterator end() const { return iterator(m_storage, m_node, m_storage->cursorEnd(m_node)); }

    bool empty() const { return begin() == end(); }
    std::size_t size() const { return m_storage->degree(m_node); }   // out-degree of the node

private:
    const Storage* m_storage;
    Vertex m_node;
};
