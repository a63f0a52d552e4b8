// JSON parsing and serialization utilities
#pragma once

#include <boost/json.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "ammsim/core/errors.hpp"
#include "ammsim/core/numeric_types.hpp"

namespace ammsim {

// ============================================================================
// JSON value parsing (boost::json::value -> T)
// ============================================================================

// Parse an integer that may be encoded as a decimal string (wei-scale values
// overflow 64 bits) or as a JSON number
inline Int parse_int(const boost::json::value& v) {
    if (v.is_string()) {
        const std::string s(v.as_string().c_str());
        try {
            return Int(s);
        } catch (const std::exception&) {
            throw ConfigError("expected integer string, got: " + s);
        }
    }
    if (v.is_int64())  return Int(v.as_int64());
    if (v.is_uint64()) return Int(v.as_uint64());
    if (v.is_double()) {
        const double d = v.as_double();
        if (!std::isfinite(d)) throw ConfigError("non-finite integer value");
        return from_double(d);
    }
    throw ConfigError("expected integer value");
}

inline std::vector<Int> parse_int_array(const boost::json::value& v) {
    if (!v.is_array()) throw ConfigError("expected array of integers");
    std::vector<Int> out;
    out.reserve(v.as_array().size());
    for (const auto& e : v.as_array()) out.push_back(parse_int(e));
    return out;
}

// Parse a JSON value as a plain real number
inline double parse_real(const boost::json::value& v) {
    if (v.is_string()) return std::strtod(v.as_string().c_str(), nullptr);
    if (v.is_double()) return v.as_double();
    if (v.is_int64())  return static_cast<double>(v.as_int64());
    if (v.is_uint64()) return static_cast<double>(v.as_uint64());
    throw ConfigError("expected numeric value");
}

// Serialize a big integer as a decimal string
inline boost::json::value int_to_json(const Int& v) {
    return boost::json::value(v.str());
}

inline boost::json::array ints_to_json(const std::vector<Int>& xs) {
    boost::json::array a;
    a.reserve(xs.size());
    for (const auto& x : xs) a.emplace_back(x.str());
    return a;
}

// ============================================================================
// JSON object accessors
// ============================================================================

// Get a required value from a JSON object (throws on missing key)
inline const boost::json::value& get_required(const boost::json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ConfigError(std::string("missing key: ") + key);
    }
    return it->value();
}

// Get a required string value from a JSON object (throws on missing/wrong type)
inline std::string get_str(const boost::json::object& obj, const char* key) {
    const auto& v = get_required(obj, key);
    if (!v.is_string()) {
        throw ConfigError(std::string("expected string for key: ") + key);
    }
    return std::string(v.as_string().c_str());
}

// Get an optional uint64 value from a JSON object (returns default if missing)
inline uint64_t get_u64_opt(const boost::json::object& obj, const char* key, uint64_t default_value) {
    auto it = obj.find(key);
    if (it == obj.end()) return default_value;
    const auto& v = it->value();
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64()) return static_cast<uint64_t>(v.as_int64());
    if (v.is_string()) {
        try {
            return static_cast<uint64_t>(std::stoull(std::string(v.as_string().c_str())));
        } catch (const std::exception&) {
            throw ConfigError(std::string("expected unsigned integer for key: ") + key);
        }
    }
    return default_value;
}

// ============================================================================
// File I/O
// ============================================================================

// Read entire file contents into a string
inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError("Cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace ammsim
