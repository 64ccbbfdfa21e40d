#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>       // std::size_t
#include <stdexcept>     // std::invalid_argument, std::out_of_range, std::logic_error

// ==========================
// Graph errors
// ==========================
// All failures of the storage layer are reported as exceptions
// derived from the standard hierarchy:
// - SizeMismatch      (construction: node weights do not match node count)
// - ArcNotFound       (query/update of an arc that is not stored)
// - ArcAlreadyExists  (insert of an arc that is already stored)
// Node indices are NOT validated: out-of-range indices are the caller's bug.
// ==========================

// Thrown when the node-weight sequence length differs from the node count
class SizeMismatch : public std::invalid_argument {
public:
    SizeMismatch(std::size_t expected, std::size_t actual);

    std::size_t expected() const noexcept { return m_expected; }  // requested node count
    std::size_t actual() const noexcept { return m_actual; }      // supplied weights

private:
    std::size_t m_expected;
    std::size_t m_actual;
};

// Thrown by arc()/updateArc() when (from, to) is not stored
class ArcNotFound : public std::out_of_range {
public:
    ArcNotFound(std::size_t from, std::size_t to);

    std::size_t from() const noexcept { return m_from; }
    std::size_t to() const noexcept { return m_to; }

private:
    std::size_t m_from;
    std::size_t m_to;
};

// Thrown by insertArc() when (from, to) is already stored
class ArcAlreadyExists : public std::logic_error {
public:
    ArcAlreadyExists(std::size_t from, std::size_t to);

    std::size_t from() const noexcept { return m_from; }
    std::size_t to() const noexcept { return m_to; }

private:
    std::size_t m_from;
    std::size_t m_to;
};
