#pragma once                              // ensure this header is included only once per translation unit

#include "graph/ArcStorage.hpp"   // IArcStorage interface
#include <vector>                 // flat cell table

// ==========================
// AdjacencyMatrix
// ==========================
// Dense arc storage: a single row-major table of n*n cells. Each cell
// carries a presence flag next to the weight, so a zero weight is still a
// stored arc. Memory is O(n^2) whatever the number of arcs.
// - insert / update / find / remove: O(1)
// - neighbor pass: O(n), scanning the whole row and skipping empty cells
// Insert and update are the same cell write here; the Graph facade decides
// which one is legal by checking presence first.
// ==========================

template <typename W>
class AdjacencyMatrix final : public IArcStorage<W> {
public:
    using typename IArcStorage<W>::Vertex;
    using typename IArcStorage<W>::Arc;
    using typename IArcStorage<W>::Transform;

    explicit AdjacencyMatrix(std::size_t n)
        : m_n(n), m_cells(n * n), m_rowDegree(n, 0) {}

    std::size_t n() const noexcept override { return m_n; }

    void insertArc(Vertex from, Vertex to, const W& w, bool mirror) override {
        write(from, to, w);                             // primary direction
        if (mirror && from != to) write(to, from, w);   // mirror direction
    }

    bool updateArc(Vertex from, Vertex to, const W& w, bool mirror) override {
        if (!cell(from, to).present) return false;
        insertArc(from, to, w, mirror);
        return true;
    }

    const W* findArc(Vertex from, Vertex to) const override {
        const Cell& c = cell(from, to);
        return c.present ? &c.weight : nullptr;
    }

    bool removeArc(Vertex from, Vertex to, bool mirror) override {
        if (!cell(from, to).present) return false;
        clear(from, to);
        if (mirror && from != to) clear(to, from);
        return true;
    }

    std::size_t degree(Vertex from) const override { return m_rowDegree[from]; }

    std::size_t seekNeighbor(Vertex from, std::size_t cursor) const override {
        while (cursor < m_n && !cell(from, cursor).present) ++cursor;  // skip empty cells
        return cursor;
    }

    Arc neighborAt(Vertex from, std::size_t cursor) const override {
        return Arc(cursor, cell(from, cursor).weight);
    }

    std::size_t cursorEnd(Vertex) const override { return m_n; }

    void transformArcs(const Transform& f) override {
        for (Vertex u = 0; u < m_n; ++u) {
            for (Vertex v = 0; v < m_n; ++v) {
                Cell& c = cell(u, v);
                if (c.present) c.weight = f(u, v, c.weight);
            }
        }
    }

    std::unique_ptr<IArcStorage<W>> clone() const override {
        return std::make_unique<AdjacencyMatrix>(*this);
    }

private:
    struct Cell {
        bool present = false;   // presence sentinel
        W weight{};
    };

    std::size_t m_n;                        // nodes per side
    std::vector<Cell> m_cells;              // row-major: cell (u,v) at u*n + v
    std::vector<std::size_t> m_rowDegree;   // stored arcs per row

    Cell& cell(Vertex u, Vertex v) { return m_cells[u * m_n + v]; }
    const Cell& cell(Vertex u, Vertex v) const { return m_cells[u * m_n + v]; }

    void write(Vertex u, Vertex v, const W& w) {
        Cell& c = cell(u, v);
        if (!c.present) ++m_rowDegree[u];
        c.present = true;
        c.weight = w;
    }

    void clear(Vertex u, Vertex v) {
        Cell& c = cell(u, v);
        if (c.present) --m_rowDegree[u];
        c.present = false;
        c.weight = W{};
    }
};
