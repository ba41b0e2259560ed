#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <cstdio>

// FieldValue: the scalar carried by one node of the dissection tree.
// Identifiers and timestamps stay uint64_t end to end; they are never
// routed through double.
using FieldValue = std::variant<
    std::monostate,     // container node / no value
    int64_t,
    uint64_t,
    double,
    std::string
>;

inline bool field_has_value(const FieldValue& v) {
    return !std::holds_alternative<std::monostate>(v);
}

inline int64_t field_to_int(const FieldValue& v) {
    if (auto* p = std::get_if<int64_t>(&v)) return *p;
    if (auto* p = std::get_if<uint64_t>(&v)) return static_cast<int64_t>(*p);
    if (auto* p = std::get_if<double>(&v)) return static_cast<int64_t>(*p);
    return 0;
}

inline uint64_t field_to_uint(const FieldValue& v) {
    if (auto* p = std::get_if<uint64_t>(&v)) return *p;
    if (auto* p = std::get_if<int64_t>(&v)) return static_cast<uint64_t>(*p);
    return 0;
}

inline double field_to_double(const FieldValue& v) {
    if (auto* p = std::get_if<double>(&v)) return *p;
    if (auto* p = std::get_if<uint64_t>(&v)) return static_cast<double>(*p);
    if (auto* p = std::get_if<int64_t>(&v)) return static_cast<double>(*p);
    return 0.0;
}

inline std::string field_to_string(const FieldValue& v) {
    if (auto* p = std::get_if<std::string>(&v)) return *p;
    if (auto* p = std::get_if<int64_t>(&v)) return std::to_string(*p);
    if (auto* p = std::get_if<uint64_t>(&v)) return std::to_string(*p);
    if (auto* p = std::get_if<double>(&v)) {
        char buf[64];
        snprintf(buf, sizeof(buf), "%g", *p);
        return buf;
    }
    return "";
}
