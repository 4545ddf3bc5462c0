#pragma once

// json_mini.h
//
// Thin helpers over json-c. Parse once, then read typed fields from the
// resulting object; writers build payloads with json_escape/quote.

#include <json-c/json.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace patchbench::json_mini {

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

    explicit operator bool() const { return root != nullptr; }
    bool is_object() const { return root && json_object_is_type(root, json_type_object); }
};

// Strict parse: trailing garbage or truncated input yields an empty Doc.
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
    for (size_t i = consumed; i < json.size(); i++) {
        if (!std::isspace(static_cast<unsigned char>(json[i]))) {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline json_object* field(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

// Returns nullopt when the key is absent; an array with a non-string
// element also yields nullopt so callers can reject it.
inline std::optional<std::vector<std::string>> get_strings(json_object* obj, const char* key) {
    json_object* arr = field(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return std::nullopt;
    std::vector<std::string> out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (!el || !json_object_is_type(el, json_type_string)) return std::nullopt;
        out.emplace_back(json_object_get_string(el));
    }
    return out;
}

inline std::string to_json(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

inline std::string quote(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

inline std::string string_array(const std::vector<std::string>& items) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i) oss << ",";
        oss << quote(items[i]);
    }
    oss << "]";
    return oss.str();
}

} // namespace patchbench::json_mini
