// ==========================
// tests/test_graph.cpp
// ==========================
// Unit tests for the Graph facade: construction, directed and undirected
// arc semantics, node weights, bulk updates, copies and path costs.
// Every behavioral test runs against both representations.
// ==========================

// Enable doctest main entry point (so this file produces a `main()`)
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"              // doctest framework header

#include "graph/Graph.hpp"        // Graph facade
#include "graph/PathCost.hpp"     // SubPathCosts

#include <algorithm>              // std::sort
#include <stdexcept>              // std::invalid_argument, std::out_of_range, std::logic_error
#include <string>                 // std::string
#include <utility>                // std::pair
#include <vector>                 // std::vector

static const Representation kReps[] = {Representation::List, Representation::Matrix};

// Materialize one pass over neighbors(u)
template <typename G>
static std::vector<typename G::Arc> neighborsOf(const G& g, std::size_t u) {
    std::vector<typename G::Arc> out;
    for (const auto& a : g.neighbors(u)) out.push_back(a);
    return out;
}

// ---------------------------
// Construction
// ---------------------------
TEST_CASE("Construction fails with SizeMismatch iff weights.size() != node count") {
    for (Representation rep : kReps) {
        CAPTURE(representationName(rep));
        for (std::size_t n = 0; n < 5; ++n) {
            for (std::size_t m = 0; m < 5; ++m) {
                std::vector<int> weights(m, 7);
                if (m == n) {
                    Graph<int> g(n, Kind::Directed, weights, rep);
                    CHECK(g.nodeCount() == n);
                } else {
                    CHECK_THROWS_AS(Graph<int>(n, Kind::Directed, weights, rep), SizeMismatch);
                }
            }
        }
    }
}

TEST_CASE("SizeMismatch carries both sizes and is an invalid_argument") {
    try {
        Graph<int> g(3, Kind::Undirected, std::vector<int>{1, 2});
        FAIL("expected SizeMismatch");
    } catch (const SizeMismatch& e) {
        CHECK(e.expected() == 3);
        CHECK(e.actual() == 2);
        CHECK(std::string(e.what()).find("expected 3") != std::string::npos);
    }
    CHECK_THROWS_AS(Graph<int>(2, Kind::Directed, std::vector<int>{1}), std::invalid_argument);
}

TEST_CASE("Default construction zeroes node weights and stores no arcs") {
    for (Representation rep : kReps) {
        Graph<double> g(5, Kind::Directed, rep);
        CHECK(g.representation() == rep);
        CHECK(g.arcCount() == 0);
        for (std::size_t i = 0; i < 5; ++i) {
            CHECK(g.nodeWeight(i) == 0.0);
            CHECK(g.neighbors(i).empty());
        }
    }
}

// ---------------------------
// Example: directed N=3, weights [1,2,3], arcs (0,1,10) (1,2,20)
// ---------------------------
TEST_CASE("Directed three-node example") {
    for (Representation rep : kReps) {
        CAPTURE(representationName(rep));
        Graph<int> g(3, Kind::Directed, {1, 2, 3}, rep);
        g.insertArc(0, 1, 10);
        g.insertArc(1, 2, 20);

        CHECK(g.arc(0, 1) == 10);
        CHECK_THROWS_AS(g.arc(1, 0), ArcNotFound);

        auto n1 = neighborsOf(g, 1);
        REQUIRE(n1.size() == 1);
        CHECK(n1[0].first == 2);
        CHECK(n1[0].second == 20);

        CHECK(g.nodeWeight(0) == 1);
        CHECK(g.nodeWeight(2) == 3);
        CHECK(g.arcCount() == 2);
        CHECK(g.label() == "DirectedGraph(3V,2E," + representationName(rep) + ")");
    }
}

// ---------------------------
// Directed semantics
// ---------------------------
TEST_CASE("Directed: inserting u->v leaves v->u absent") {
    for (Representation rep : kReps) {
        Graph<int> g(4, Kind::Directed, rep);
        for (std::size_t u = 0; u < 4; ++u) {
            for (std::size_t v = 0; v < 4; ++v) {
                if (u >= v) continue;
                g.insertArc(u, v, static_cast<int>(10 * u + v));
            }
        }
        for (std::size_t u = 0; u < 4; ++u) {
            for (std::size_t v = 0; v < 4; ++v) {
                if (u < v) CHECK(g.arc(u, v) == static_cast<int>(10 * u + v));
                else CHECK_THROWS_AS(g.arc(u, v), ArcNotFound);
            }
        }

        g.insertArc(3, 0, -5);                    // the reverse is an independent arc
        CHECK(g.arc(3, 0) == -5);
        CHECK(g.arc(0, 3) == 3);
        g.updateArc(3, 0, 8);
        CHECK(g.arc(0, 3) == 3);
    }
}

TEST_CASE("insertArc on an existing arc throws ArcAlreadyExists and keeps the weight") {
    for (Representation rep : kReps) {
        Graph<int> g(2, Kind::Directed, rep);
        g.insertArc(0, 1, 4);
        CHECK_THROWS_AS(g.insertArc(0, 1, 9), ArcAlreadyExists);
        CHECK_THROWS_AS(g.insertArc(0, 1, 9), std::logic_error);
        CHECK(g.arc(0, 1) == 4);
        CHECK(g.arcCount() == 1);
        CHECK(neighborsOf(g, 0).size() == 1);
    }
}

TEST_CASE("updateArc never inserts") {
    for (Representation rep : kReps) {
        Graph<int> g(3, Kind::Directed, rep);
        CHECK_THROWS_AS(g.updateArc(0, 2, 1), ArcNotFound);
        CHECK_FALSE(g.hasArc(0, 2));
        CHECK(g.arcCount() == 0);

        try {
            g.updateArc(2, 1, 1);
            FAIL("expected ArcNotFound");
        } catch (const ArcNotFound& e) {
            CHECK(e.from() == 2);
            CHECK(e.to() == 1);
        }
    }
}

// ---------------------------
// Undirected semantics
// ---------------------------
TEST_CASE("Undirected: both directions answer the same weight after insert and update") {
    for (Representation rep : kReps) {
        CAPTURE(representationName(rep));
        Graph<double> g(4, Kind::Undirected, rep);
        g.insertArc(0, 1, 1.5);
        g.insertArc(3, 2, 2.5);

        CHECK(g.arc(0, 1) == 1.5);
        CHECK(g.arc(1, 0) == 1.5);
        CHECK(g.arc(2, 3) == 2.5);
        CHECK(g.arc(3, 2) == 2.5);
        CHECK(g.arcCount() == 2);

        g.updateArc(1, 0, 7.0);                   // update through the mirror direction
        CHECK(g.arc(0, 1) == 7.0);
        CHECK(g.arc(1, 0) == 7.0);

        CHECK_THROWS_AS(g.insertArc(1, 0, 3.0), ArcAlreadyExists);   // mirror counts as present
        CHECK_THROWS_AS(g.arc(0, 2), ArcNotFound);
    }
}

TEST_CASE("Undirected: neighbors list both endpoints") {
    for (Representation rep : kReps) {
        Graph<int> g(4, Kind::Undirected, rep);
        g.insertArc(0, 1, 1);
        g.insertArc(1, 2, 2);
        g.insertArc(2, 3, 3);
        g.insertArc(3, 0, 4);
        for (std::size_t u = 0; u < 4; ++u) {
            CHECK(neighborsOf(g, u).size() == 2);
            CHECK(g.outDegree(u) == 2);
        }
    }
}

TEST_CASE("Undirected self-loop is stored once") {
    for (Representation rep : kReps) {
        Graph<int> g(2, Kind::Undirected, rep);
        g.insertArc(1, 1, 5);
        auto n1 = neighborsOf(g, 1);
        REQUIRE(n1.size() == 1);
        CHECK(n1[0].first == 1);
        CHECK(n1[0].second == 5);
        CHECK(g.arcCount() == 1);

        g.updateArc(1, 1, 6);
        CHECK(g.arc(1, 1) == 6);
        CHECK(g.removeArc(1, 1));
        CHECK(g.neighbors(1).empty());
    }
}

// ---------------------------
// Removal
// ---------------------------
TEST_CASE("removeArc on undirected removes both directions") {
    for (Representation rep : kReps) {
        Graph<int> g(3, Kind::Undirected, rep);
        g.insertArc(0, 1, 1);
        g.insertArc(1, 2, 2);
        g.insertArc(2, 0, 3);
        CHECK(g.removeArc(2, 1));
        CHECK_FALSE(g.hasArc(1, 2));
        CHECK_FALSE(g.hasArc(2, 1));
        CHECK(g.hasArc(0, 1));
        CHECK(g.arcCount() == 2);
        CHECK_FALSE(g.removeArc(1, 2));           // already gone
        CHECK(g.arcCount() == 2);

        g.insertArc(1, 2, 9);                     // can be inserted again
        CHECK(g.arc(2, 1) == 9);
    }
}

TEST_CASE("removeArc on directed removes one direction only") {
    for (Representation rep : kReps) {
        Graph<int> g(2, Kind::Directed, rep);
        g.insertArc(0, 1, 1);
        g.insertArc(1, 0, 2);
        CHECK(g.removeArc(0, 1));
        CHECK_FALSE(g.hasArc(0, 1));
        CHECK(g.arc(1, 0) == 2);
        CHECK(g.arcCount() == 1);
    }
}

// ---------------------------
// Queries do not mutate
// ---------------------------
TEST_CASE("arc() and neighbors() are idempotent") {
    for (Representation rep : kReps) {
        Graph<int> g(4, Kind::Undirected, rep);
        g.insertArc(0, 2, 3);
        g.insertArc(0, 3, 4);
        g.insertArc(1, 0, 5);

        auto range = g.neighbors(0);
        std::vector<Graph<int>::Arc> first(range.begin(), range.end());
        std::vector<Graph<int>::Arc> second(range.begin(), range.end());   // restart the same range
        CHECK(first == second);
        CHECK(first.size() == 3);
        CHECK(neighborsOf(g, 0) == first);

        CHECK(g.arc(0, 3) == g.arc(0, 3));
        CHECK(g.arcCount() == 3);
    }
}

// ---------------------------
// Node weights
// ---------------------------
TEST_CASE("setNodeWeight / nodeWeight and bulk node updates") {
    Graph<double> g(5, Kind::Directed);
    g.setNodeWeight(2, 4.5);
    CHECK(g.nodeWeight(2) == 4.5);

    g.updateAllNodesWeight([](std::size_t i, double) { return 1.5 * static_cast<double>(i); });
    g.forEachNode([](std::size_t i, double w) { CHECK(w == 1.5 * static_cast<double>(i)); });

    g.assignNodeWeights(std::vector<double>{9.0, 8.0});   // shorter sequence: prefix only
    CHECK(g.nodeWeight(0) == 9.0);
    CHECK(g.nodeWeight(1) == 8.0);
    CHECK(g.nodeWeight(2) == 3.0);

    g.assignNodeWeights(std::vector<std::pair<std::size_t, double>>{{4, -1.0}});
    CHECK(g.nodeWeight(4) == -1.0);
    CHECK(g.nodeWeight(3) == 4.5);
}

TEST_CASE("Node and arc weight types may differ") {
    Graph<int, double> g(2, Kind::Directed, {3, 4});
    g.insertArc(0, 1, 0.25);
    CHECK(g.nodeWeight(1) == 4);
    CHECK(g.arc(0, 1) == 0.25);
    g.insertDefaultArc(1, 0);
    CHECK(g.arc(1, 0) == 0.0);
}

// ---------------------------
// Bulk arc updates
// ---------------------------
TEST_CASE("updateAllArcsWeight on directed graph") {
    for (Representation rep : kReps) {
        Graph<double> g(4, Kind::Directed, rep);
        g.insertArc(0, 1, 1.0);
        g.insertArc(1, 2, 2.0);
        g.insertArc(2, 3, 3.0);
        g.insertArc(3, 0, 4.0);

        g.updateAllArcsWeight([](std::size_t, std::size_t, double w) { return 2.0 * w; });

        std::size_t seen = 0;
        g.forEachArc([&](std::size_t u, std::size_t v, double w) {
            ++seen;
            CHECK(v == (u + 1) % 4);
            CHECK(w == 2.0 * static_cast<double>(u + 1));
        });
        CHECK(seen == 4);
    }
}

TEST_CASE("updateAllArcsWeight on undirected graph calls f once per pair") {
    for (Representation rep : kReps) {
        Graph<double> g(4, Kind::Undirected, rep);
        g.insertArc(0, 1, 1.0);
        g.insertArc(1, 2, 2.0);
        g.insertArc(2, 3, 3.0);
        g.insertArc(3, 0, 4.0);
        g.insertArc(2, 2, 5.0);                   // self-loop

        int calls = 0;
        g.updateAllArcsWeight([&](std::size_t u, std::size_t v, double w) {
            ++calls;
            CHECK(u <= v);
            return w + 10.0 * static_cast<double>(calls);
        });
        CHECK(calls == 5);

        for (std::size_t u = 0; u < 4; ++u) {
            for (const auto& a : g.neighbors(u)) CHECK(g.arc(a.first, u) == a.second);   // still mirrored
        }
        CHECK(g.arc(2, 2) > 5.0);
    }
}

// ---------------------------
// Copies and comparison
// ---------------------------
TEST_CASE("clone() into the other representation answers identically") {
    for (Representation rep : kReps) {
        Graph<int> g(5, Kind::Undirected, {1, 2, 3, 4, 5}, rep);
        g.insertArc(0, 4, 7);
        g.insertArc(2, 1, 8);
        g.insertArc(3, 3, 9);

        const Representation other = rep == Representation::List ? Representation::Matrix
                                                                  : Representation::List;
        Graph<int> copy = g.clone(other);
        CHECK(copy.representation() == other);
        CHECK(copy == g);
        CHECK(copy.arcCount() == g.arcCount());
        for (std::size_t u = 0; u < 5; ++u) {
            for (std::size_t v = 0; v < 5; ++v) CHECK(copy.hasArc(u, v) == g.hasArc(u, v));
        }

        copy.updateArc(0, 4, 70);                 // the copy is independent
        CHECK(g.arc(4, 0) == 7);
        CHECK(copy != g);

        Graph<int> same = g.clone();
        CHECK(same.representation() == rep);
        CHECK(same == g);
    }
}

TEST_CASE("operator== compares kind, node weights and arcs") {
    Graph<int> a(3, Kind::Directed, {1, 2, 3});
    Graph<int> b(3, Kind::Directed, {1, 2, 3}, Representation::Matrix);
    CHECK(a == b);

    a.insertArc(0, 1, 5);
    CHECK(a != b);
    b.insertArc(0, 1, 6);
    CHECK(a != b);
    b.updateArc(0, 1, 5);
    CHECK(a == b);

    b.setNodeWeight(2, 0);
    CHECK(a != b);

    Graph<int> c(3, Kind::Undirected, {1, 2, 3});
    Graph<int> d(3, Kind::Directed, {1, 2, 3});
    CHECK(c != d);
}

TEST_CASE("Graph can be moved") {
    Graph<int> g(3, Kind::Undirected, {1, 2, 3}, Representation::Matrix);
    g.insertArc(0, 2, 4);
    Graph<int> moved = std::move(g);
    CHECK(moved.arc(2, 0) == 4);
    CHECK(moved.nodeWeight(1) == 2);
}

// ---------------------------
// Sub-path costs
// ---------------------------
TEST_CASE("SubPathCosts yields every forward sub-path cost") {
    for (Representation rep : kReps) {
        Graph<double> g(4, Kind::Directed, rep);
        g.insertArc(0, 1, 1.0);
        g.insertArc(1, 2, 2.0);
        g.insertArc(2, 3, 3.0);
        g.insertArc(3, 0, 4.0);

        SubPathCosts<double, double> costs(g, {0, 1, 2, 3});
        auto all = costs.collect();
        REQUIRE(all.size() == 6);
        const std::size_t from[] = {0, 0, 0, 1, 1, 2};
        const std::size_t to[]   = {1, 2, 3, 2, 3, 3};
        const double cost[]      = {1.0, 3.0, 6.0, 2.0, 5.0, 3.0};
        for (std::size_t i = 0; i < all.size(); ++i) {
            CHECK(all[i].from == from[i]);
            CHECK(all[i].to == to[i]);
            CHECK(all[i].cost == cost[i]);
        }

        SubPathCosts<double, double>::Entry e{};
        CHECK_FALSE(costs.next(e));               // exhausted
    }
}

TEST_CASE("SubPathCosts on short paths and missing arcs") {
    Graph<int> g(3, Kind::Directed);
    g.insertArc(2, 0, 5);

    SubPathCosts<int, int> empty(g, {});
    CHECK(empty.collect().empty());
    SubPathCosts<int, int> single(g, {1});
    CHECK(single.collect().empty());

    SubPathCosts<int, int> loop(g, {2, 0});
    auto one = loop.collect();
    REQUIRE(one.size() == 1);
    CHECK(one[0].cost == 5);

    SubPathCosts<int, int> broken(g, {2, 0, 1});
    SubPathCosts<int, int>::Entry e{};
    CHECK(broken.next(e));
    CHECK_THROWS_AS(broken.next(e), ArcNotFound);
}

// ---------------------------
// Kinds and weight contract
// ---------------------------
TEST_CASE("Kind and representation names") {
    CHECK(kindName(Kind::Directed) == "Directed");
    CHECK(kindName(Kind::Undirected) == "Undirected");
    CHECK(parseRepresentation("LIST") == Representation::List);
    CHECK(parseRepresentation("matrix") == Representation::Matrix);
    CHECK_THROWS_AS(parseRepresentation("csr"), std::invalid_argument);
}

struct Money {
    long cents = 0;
    Money() = default;
    Money(long c) : cents(c) {}
    Money operator+(const Money& o) const { return Money(cents + o.cents); }
    Money operator*(const Money& o) const { return Money(cents * o.cents); }
    bool operator==(const Money& o) const { return cents == o.cents; }
};

TEST_CASE("Weight contract accepts numeric types and rejects others") {
    static_assert(IsWeightV<int>, "int is a weight");
    static_assert(IsWeightV<double>, "double is a weight");
    static_assert(IsWeightV<unsigned long long>, "unsigned long long is a weight");
    static_assert(IsWeightV<Money>, "user numeric type is a weight");
    static_assert(!IsWeightV<std::string>, "no multiplication");
    static_assert(!IsWeightV<std::vector<int>>, "not numeric");

    CHECK(WeightTraits<Money>::zero() == Money(0));
    CHECK(WeightTraits<Money>::one() == Money(1));
    CHECK(WeightTraits<double>::isZero(0.0));

    Graph<Money> g(2, Kind::Undirected);
    g.insertArc(0, 1, Money(250));
    CHECK(g.arc(1, 0).cents == 250);
}
