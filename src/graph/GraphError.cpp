// ==========================
// GraphError.cpp
// ==========================
// Builds the human-readable messages carried by the graph exceptions.
// ==========================

#include "graph/GraphError.hpp"   // exception declarations
#include <sstream>                // std::ostringstream for messages
#include <string>                 // std::string

// Format "<what> (u -> v)" for the arc errors
static std::string arcMessage(const char* what, std::size_t from, std::size_t to) {
    std::ostringstream oss;
    oss << what << " (" << from << " -> " << to << ")";
    return oss.str();
}

static std::string sizeMessage(std::size_t expected, std::size_t actual) {
    std::ostringstream oss;
    oss << "node weights size mismatch: expected " << expected
        << " weights, got " << actual;
    return oss.str();
}

SizeMismatch::SizeMismatch(std::size_t expected, std::size_t actual)
    : std::invalid_argument(sizeMessage(expected, actual)),
      m_expected(expected), m_actual(actual) {}

ArcNotFound::ArcNotFound(std::size_t from, std::size_t to)
    : std::out_of_range(arcMessage("arc not found", from, to)),
      m_from(from), m_to(to) {}

ArcAlreadyExists::ArcAlreadyExists(std::size_t from, std::size_t to)
    : std::logic_error(arcMessage("arc already exists", from, to)),
      m_from(from), m_to(to) {}
