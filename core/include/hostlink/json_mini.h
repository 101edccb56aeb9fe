#pragma once

// json_mini.h
//
// Thin RAII + accessor layer over json-c. Everything that crosses the wire or
// lands in the audit log is built and read through here.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hostlink::json_mini {

// Owns one json-c reference.
struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Give up ownership (e.g. when adding into a parent object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: trailing garbage or a truncated document yields an empty Doc.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = static_cast<size_t>(json_tokener_get_parse_end(tok));
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    while (consumed < json.size()) {
        char c = json[consumed];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
        consumed++;
    }
    // A bare "null" document parses to NULL; callers see it as "no value".
    return Doc{obj};
}

// Same as parse() but returns the error text json-c produced.
inline Doc parse_verbose(const std::string& json, std::string* err) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "out of memory";
        return Doc{};
    }
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = static_cast<size_t>(json_tokener_get_parse_end(tok));
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        if (err) *err = json_tokener_error_desc(jerr);
        return Doc{};
    }
    for (; consumed < json.size(); consumed++) {
        char c = json[consumed];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            if (obj) json_object_put(obj);
            if (err) *err = "trailing characters after JSON value";
            return Doc{};
        }
    }
    if (!obj && err) *err = "empty or null document";
    return Doc{obj};
}

inline json_object* member(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline bool has_key(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return false;
    json_object* v = nullptr;
    return json_object_object_get_ex(obj, key, &v) != 0;
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    if (json_object_is_type(v, json_type_int)) return static_cast<int64_t>(json_object_get_int64(v));
    if (json_object_is_type(v, json_type_double)) return static_cast<int64_t>(json_object_get_double(v));
    return std::nullopt;
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_array_strings(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// ---- builders ----

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

inline json_object* new_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) json_object_array_add(arr, new_string(s));
    return arr;
}

inline void put_string(json_object* obj, const char* key, const std::string& s) {
    json_object_object_add(obj, key, new_string(s));
}
inline void put_int(json_object* obj, const char* key, int64_t v) {
    json_object_object_add(obj, key, json_object_new_int64(v));
}
inline void put_bool(json_object* obj, const char* key, bool v) {
    json_object_object_add(obj, key, json_object_new_boolean(v ? 1 : 0));
}

// Shares `v` with `obj` (takes an extra reference).
inline void put_shared(json_object* obj, const char* key, json_object* v) {
    json_object_object_add(obj, key, v ? json_object_get(v) : nullptr);
}

inline std::string to_string(json_object* obj, bool pretty = false) {
    if (!obj) return "null";
    int flags = pretty ? (JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED) : JSON_C_TO_STRING_PLAIN;
    flags |= JSON_C_TO_STRING_NOSLASHESCAPE;
    return json_object_to_json_string_ext(obj, flags);
}

} // namespace hostlink::json_mini
