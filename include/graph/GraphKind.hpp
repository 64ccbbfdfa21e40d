#pragma once                              // ensure this header is included only once per translation unit

#include <string>        // std::string for names

// Whether arcs are one-way (Directed) or mirrored pairs (Undirected)
enum class Kind { Undirected, Directed };

// Internal arc storage strategy chosen at construction
enum class Representation { List, Matrix };

// "Directed" / "Undirected"
std::string kindName(Kind kind);

// "List" / "Matrix"
std::string representationName(Representation rep);

// Parse "list" / "matrix" (case-insensitive); throws std::invalid_argument otherwise
Representation parseRepresentation(const std::string& name);
