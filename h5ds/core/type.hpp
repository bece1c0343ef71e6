#pragma once

#include "h5ds/config.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

// =============================================================================
// FILE: h5ds/core/type.hpp
// BRIEF: Basic types shared by the datastore modules
// =============================================================================

namespace h5ds {

using Size = std::size_t;
using Byte = std::uint8_t;

/// Row numbers are 1-based; 0 never names a row.
using RowIndex = std::uint64_t;

/// Dimension sizes, outermost first. Dimension 0 is the row axis.
using Shape = std::vector<std::uint64_t>;

/// Max-shape marker for an unlimited dimension
constexpr std::uint64_t UNLIMITED = std::numeric_limits<std::uint64_t>::max();

/// Storage class of an element type, independent of the file format.
enum class TypeClass {
    Integer,
    Float,
    String,
    Bitfield,
    Opaque,
    Compound,
    Reference,
    Enum,
    VarLen,
    Array,
    Unknown
};

inline const char* type_class_name(TypeClass cls) {
    switch (cls) {
        case TypeClass::Integer:   return "integer";
        case TypeClass::Float:     return "float";
        case TypeClass::String:    return "string";
        case TypeClass::Bitfield:  return "bitfield";
        case TypeClass::Opaque:    return "opaque";
        case TypeClass::Compound:  return "compound";
        case TypeClass::Reference: return "reference";
        case TypeClass::Enum:      return "enum";
        case TypeClass::VarLen:    return "vlen";
        case TypeClass::Array:     return "array";
        default:                   return "unknown";
    }
}

/// Product of all dimensions; 1 for an empty shape.
inline std::uint64_t shape_product(const Shape& shape, Size first = 0) {
    std::uint64_t n = 1;
    for (Size i = first; i < shape.size(); ++i) {
        n *= shape[i];
    }
    return n;
}

inline std::string shape_to_string(const Shape& shape) {
    std::string s = "[";
    for (Size i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += shape[i] == UNLIMITED ? std::string("Inf") : std::to_string(shape[i]);
    }
    s += "]";
    return s;
}

} // namespace h5ds
