#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace studysync {

/**
 * Value - a single column value as stored locally and sent to the backend.
 * monostate is SQL NULL / JSON null.
 */
using Value = std::variant<std::monostate, int64_t, double, std::string>;

/**
 * Row - column name to value. Ordered so that serialization is stable.
 */
using Row = std::map<std::string, Value>;

[[nodiscard]] inline bool is_null(const Value& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

[[nodiscard]] inline bool is_null(const Row& row, const std::string& key) {
    auto it = row.find(key);
    return it == row.end() || is_null(it->second);
}

[[nodiscard]] inline std::optional<std::string> get_text(const Row& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end()) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return std::to_string(*i);
    return std::nullopt;
}

[[nodiscard]] inline std::optional<int64_t> get_int(const Row& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end()) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return *i;
    if (const auto* d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
    return std::nullopt;
}

[[nodiscard]] inline std::optional<double> get_double(const Row& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end()) return std::nullopt;
    if (const auto* d = std::get_if<double>(&it->second)) return *d;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return static_cast<double>(*i);
    return std::nullopt;
}

[[nodiscard]] inline std::optional<Uuid> get_uuid(const Row& row, const std::string& key) {
    auto text = get_text(row, key);
    if (!text) return std::nullopt;
    return Uuid::parse(*text);
}

/**
 * Parsed ISO-8601 column; empty when missing, null or unparseable.
 */
[[nodiscard]] inline std::optional<Timestamp> get_timestamp(const Row& row, const std::string& key) {
    auto text = get_text(row, key);
    if (!text) return std::nullopt;
    return Timestamp::from_iso_string(*text);
}

/**
 * Null for an empty optional, text otherwise.
 */
[[nodiscard]] inline Value text_or_null(const std::optional<std::string>& text) {
    if (text) return *text;
    return std::monostate{};
}

} // namespace studysync
