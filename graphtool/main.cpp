// ==========================
// graphtool: build, convert and export graphs
// ==========================
// Parses: -v <V> -e <E> -s <seed> [--directed] [--matrix] [--weighted]
//         [--dot] [--save <file>]
//     or: --load <file> [--matrix] [--dot] [--save <file>]
// Generates a random graph (or loads an archived one), prints a summary
// on stderr and optionally the Graphviz source on stdout.
// ==========================

#include "graph/Graph.hpp"     // Graph API
#include "io/DotExport.hpp"    // toDot
#include "io/GraphArchive.hpp" // saveGraph / loadGraph
#include <getopt.h>            // getopt_long for command-line parsing
#include <cstdint>             // std::uint32_t seed
#include <cstdlib>             // std::atoi, std::exit
#include <exception>           // std::exception
#include <fstream>             // archive files
#include <iostream>            // I/O
#include <random>              // PRNG
#include <string>              // file names

using ToolGraph = Graph<long long>;

namespace {

struct Config {
    long long vertices = -1;                       // -v
    long long arcs = -1;                           // -e
    long long seed = -1;                           // -s
    bool directed = false;                         // --directed
    bool weighted = false;                         // --weighted: arc weights 1..9 instead of 1
    bool dot = false;                              // --dot: print dot source on stdout
    Representation rep = Representation::List;     // --matrix
    std::string loadPath;                          // --load <file>
    std::string savePath;                          // --save <file>
};

void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " -v <vertices> -e <arcs> -s <seed> [--directed] [--matrix] [--weighted]"
                 " [--dot] [--save <file>]\n"
              << "       " << prog << " --load <file> [--matrix] [--dot] [--save <file>]\n";
    std::exit(1);
}

Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    int li = 0;
    option lo[] = {
        {"directed", no_argument,       nullptr, 'D'},
        {"matrix",   no_argument,       nullptr, 'M'},
        {"weighted", no_argument,       nullptr, 'W'},
        {"dot",      no_argument,       nullptr, 'G'},
        {"load",     required_argument, nullptr, 'L'},
        {"save",     required_argument, nullptr, 'S'},
        {nullptr, 0, nullptr, 0}};

    for (int opt; (opt = getopt_long(argc, argv, "v:e:s:", lo, &li)) != -1; ) {
        switch (opt) {
            case 'v': cfg.vertices = std::atoi(optarg); break;
            case 'e': cfg.arcs = std::atoi(optarg); break;
            case 's': cfg.seed = std::atoi(optarg); break;
            case 'D': cfg.directed = true; break;
            case 'M': cfg.rep = Representation::Matrix; break;
            case 'W': cfg.weighted = true; break;
            case 'G': cfg.dot = true; break;
            case 'L': cfg.loadPath = optarg; break;
            case 'S': cfg.savePath = optarg; break;
            default: usage(argv[0]);
        }
    }

    if (cfg.loadPath.empty() && (cfg.vertices <= 0 || cfg.arcs < 0 || cfg.seed < 0)) usage(argv[0]);
    return cfg;
}

// Random graph with exactly cfg.arcs distinct arcs, no self-loops
ToolGraph makeRandomGraph(const Config& cfg) {
    const long long V = cfg.vertices;
    const long long maxArcs = cfg.directed ? V * (V - 1) : V * (V - 1) / 2;
    if (cfg.arcs > maxArcs) {
        std::cerr << "[graphtool] too many arcs for a simple "
                  << (cfg.directed ? "directed" : "undirected") << " graph (max " << maxArcs << ")\n";
        std::exit(1);
    }

    std::mt19937 rng(static_cast<std::uint32_t>(cfg.seed));
    std::uniform_int_distribution<long long> pick(0, V - 1);
    std::uniform_int_distribution<long long> weight(1, 9);

    ToolGraph g(static_cast<std::size_t>(V), cfg.directed ? Kind::Directed : Kind::Undirected, cfg.rep);
    g.updateAllNodesWeight([&](std::size_t, long long) { return weight(rng); });

    long long added = 0;
    while (added < cfg.arcs) {
        auto u = static_cast<std::size_t>(pick(rng));
        auto v = static_cast<std::size_t>(pick(rng));
        if (u == v || g.hasArc(u, v)) continue;    // skip self-loops and duplicates
        g.insertArc(u, v, cfg.weighted ? weight(rng) : 1);
        ++added;
    }
    return g;
}

ToolGraph loadFrom(const Config& cfg) {
    std::ifstream in(cfg.loadPath);
    if (!in) {
        std::cerr << "[graphtool] cannot open " << cfg.loadPath << "\n";
        std::exit(1);
    }
    return loadGraph<long long>(in, cfg.rep);
}

void saveTo(const ToolGraph& g, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "[graphtool] cannot write " << path << "\n";
        std::exit(1);
    }
    saveGraph(g, out);
    std::cerr << "[graphtool] saved to " << path << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const Config cfg = parseArgs(argc, argv);

    try {
        ToolGraph g = cfg.loadPath.empty() ? makeRandomGraph(cfg) : loadFrom(cfg);
        std::cerr << "[graphtool] " << (cfg.loadPath.empty() ? "generated " : "loaded ")
                  << g.label() << "\n";

        if (!cfg.savePath.empty()) saveTo(g, cfg.savePath);
        if (cfg.dot) std::cout << toDot(g) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[graphtool] error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
