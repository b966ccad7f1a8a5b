#ifndef VGEDIT_CORE_TYPES_H
#define VGEDIT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight enums shared by every vgedit module.

namespace vgedit {

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidOperation = 1,
    ParseError = 2,
    ValidationError = 3,
    UnsupportedAlgorithm = 4,
    IndexOutOfRange = 5,
    IoError = 6,
};

inline const char* engineErrorName(EngineError err) noexcept {
    switch (err) {
        case EngineError::Ok: return "Ok";
        case EngineError::InvalidOperation: return "InvalidOperation";
        case EngineError::ParseError: return "ParseError";
        case EngineError::ValidationError: return "ValidationError";
        case EngineError::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case EngineError::IndexOutOfRange: return "IndexOutOfRange";
        case EngineError::IoError: return "IoError";
    }
    return "Unknown";
}

// Closed set of drawable object kinds. Dispatch is a switch over this tag.
enum class ObjectKind : std::uint8_t { Point = 1, Line = 2, Polygon = 3, Curve = 4 };

inline const char* objectKindName(ObjectKind kind) noexcept {
    switch (kind) {
        case ObjectKind::Point: return "Point";
        case ObjectKind::Line: return "Line";
        case ObjectKind::Polygon: return "Polygon";
        case ObjectKind::Curve: return "Curve";
    }
    return "Unknown";
}

} // namespace vgedit

#endif // VGEDIT_CORE_TYPES_H
