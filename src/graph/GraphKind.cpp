#include "graph/GraphKind.hpp"   // Kind, Representation
#include <cctype>                // std::tolower
#include <stdexcept>             // std::invalid_argument

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
static std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string kindName(Kind kind) {
    return kind == Kind::Directed ? "Directed" : "Undirected";
}

std::string representationName(Representation rep) {
    return rep == Representation::Matrix ? "Matrix" : "List";
}

Representation parseRepresentation(const std::string& name) {
    const std::string key = toLower(name);
    if (key == "list") return Representation::List;
    if (key == "matrix") return Representation::Matrix;
    throw std::invalid_argument("unknown representation: " + name);
}
