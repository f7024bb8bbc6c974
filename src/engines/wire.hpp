#pragma once
#include "../errors.hpp"
#include "../event.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <sstream>
#include <string>

namespace execrelay {

// Shared helpers for the engine decoders. Field access never throws on a
// type mismatch: a field of the wrong type reads as absent.

// Parse a raw line as a JSON object and return its string discriminator.
// Throws DecodeError when the line is not a JSON object or the discriminator
// is missing or not a string.
inline nlohmann::json parse_envelope(const std::string& line, const char* discriminator,
                                     std::string& kind_out) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw DecodeError("envelope is not a JSON object");
    }
    if (!j.contains(discriminator) || !j[discriminator].is_string()) {
        throw DecodeError(std::string("missing discriminator '") + discriminator + "'");
    }
    kind_out = j[discriminator].get<std::string>();
    return j;
}

inline std::string string_field(const nlohmann::json& j, const char* key,
                                const std::string& fallback = {}) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return fallback;
}

// Integers outside the range of int are clamped, so a huge exit code still
// reads as nonzero with the right sign.
inline std::optional<int> int_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_number_integer()) {
        return std::nullopt;
    }
    const auto& v = j[key];
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return std::numeric_limits<int>::max();
        }
        return static_cast<int>(u);
    }
    int64_t n = v.get<int64_t>();
    if (n > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (n < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(n);
}

inline uint64_t count_field(const nlohmann::json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_number_unsigned()) {
        return j[key].get<uint64_t>();
    }
    return 0;
}

inline bool bool_field(const nlohmann::json& j, const char* key) {
    return j.is_object() && j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

inline const nlohmann::json& object_field(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.is_object() && j.contains(key) && j[key].is_object()) {
        return j[key];
    }
    return empty;
}

// Last token captured (group 1) by `line_re` on any line of text.
inline std::optional<std::string> last_line_match(const std::string& text,
                                                  const std::regex& line_re) {
    std::optional<std::string> found;
    std::istringstream stream(text);
    std::string line;
    std::smatch m;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (std::regex_match(line, m, line_re) && m.size() > 1 && m[1].length() > 0) {
            found = m[1].str();
        }
    }
    return found;
}

inline UnknownItem unknown_item(std::string id, std::string raw_kind,
                                nlohmann::json payload) {
    return UnknownItem{std::move(id), std::move(raw_kind), std::move(payload)};
}

} // namespace execrelay
