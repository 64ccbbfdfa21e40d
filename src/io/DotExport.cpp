// ==========================
// DotExport.cpp
// ==========================
// Statement formatting for the Graphviz export. The template toDot()
// in DotExport.hpp turns weights into labels and feeds them here.
// ==========================

#include "io/DotExport.hpp"   // DotWriter declaration
#include <sstream>            // std::ostringstream for statements

DotWriter::DotWriter(Kind kind, std::size_t reserve) : m_kind(kind) {
    m_lines.reserve(reserve);
}

void DotWriter::addNode(std::size_t i, const std::string& label) {
    std::ostringstream oss;
    oss << "\tn" << i << " [label=\"" << label << "\"];";
    m_lines.push_back(oss.str());
}

void DotWriter::addArc(std::size_t from, std::size_t to, const std::string& label) {
    const bool directed = m_kind == Kind::Directed;
    if (!directed && from > to) return;            // mirror of an already emitted pair

    std::ostringstream oss;
    oss << "\tn" << from << (directed ? " -> " : " -- ") << "n" << to
        << " [label=\"" << label << "\"];";
    m_lines.push_back(oss.str());
}

std::string DotWriter::build() const {
    std::ostringstream oss;
    oss << (m_kind == Kind::Directed ? "digraph" : "graph") << " {\n";
    for (std::size_t i = 0; i < m_lines.size(); ++i) {
        oss << m_lines[i];
        if (i + 1 < m_lines.size()) oss << "\n";
    }
    oss << "\n}";
    return oss.str();
}
