// value.cc - Tagged value tree and yaml-cpp conversion

#include "value.h"

#include <algorithm>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace ruleaudit {

const Value* Value::find(const std::string& key) const {
    if (kind != ValueKind::MAPPING) return nullptr;
    for (const auto& e : entries) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

void Value::set(std::string key, Value v) {
    for (auto& e : entries) {
        if (e.first == key) {
            e.second = std::move(v);
            return;
        }
    }
    entries.emplace_back(std::move(key), std::move(v));
}

static bool is_numeric(ScalarType t) {
    return t == ScalarType::INT || t == ScalarType::FLOAT;
}

bool operator==(const Value& a, const Value& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case ValueKind::NUL:
            return true;
        case ValueKind::SCALAR:
            if (is_numeric(a.scalar_type) && is_numeric(b.scalar_type) &&
                (a.scalar_type == ScalarType::FLOAT || b.scalar_type == ScalarType::FLOAT)) {
                return std::strtod(a.scalar.c_str(), nullptr) ==
                       std::strtod(b.scalar.c_str(), nullptr);
            }
            return a.scalar_type == b.scalar_type && a.scalar == b.scalar;
        case ValueKind::SEQUENCE:
            if (a.items.size() != b.items.size()) return false;
            for (size_t i = 0; i < a.items.size(); ++i) {
                if (a.items[i] != b.items[i]) return false;
            }
            return true;
        case ValueKind::MAPPING:
            if (a.entries.size() != b.entries.size()) return false;
            for (const auto& e : a.entries) {
                const Value* other = b.find(e.first);
                if (!other || *other != e.second) return false;
            }
            return true;
    }
    return false;
}

std::string render(const Value& v) {
    switch (v.kind) {
        case ValueKind::NUL:
            return "null";
        case ValueKind::SCALAR:
            return v.scalar;
        case ValueKind::SEQUENCE: {
            std::string out = "[";
            for (size_t i = 0; i < v.items.size(); ++i) {
                if (i > 0) out += ", ";
                out += render(v.items[i]);
            }
            out += "]";
            return out;
        }
        case ValueKind::MAPPING: {
            std::string out = "{";
            for (size_t i = 0; i < v.entries.size(); ++i) {
                if (i > 0) out += ", ";
                out += v.entries[i].first;
                out += ": ";
                out += render(v.entries[i].second);
            }
            out += "}";
            return out;
        }
    }
    return std::string();
}

//=============================================================================
// Plain Scalar Resolution
//=============================================================================

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static bool is_null_text(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

static bool resolve_bool(const std::string& s, bool& out) {
    static const char* const TRUE_WORDS[] = {"yes", "Yes", "YES", "true", "True",
                                             "TRUE", "on", "On", "ON"};
    static const char* const FALSE_WORDS[] = {"no", "No", "NO", "false", "False",
                                              "FALSE", "off", "Off", "OFF"};
    for (const char* w : TRUE_WORDS) {
        if (s == w) { out = true; return true; }
    }
    for (const char* w : FALSE_WORDS) {
        if (s == w) { out = false; return true; }
    }
    return false;
}

// Digits in `base` with '_' separators; false on a foreign digit or overflow
static bool parse_digits(std::string_view body, unsigned base, unsigned long long& out) {
    out = 0;
    bool any = false;
    for (char c : body) {
        if (c == '_') continue;
        unsigned d;
        if (is_digit(c)) d = static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f') d = static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') d = static_cast<unsigned>(c - 'A' + 10);
        else return false;
        if (d >= base) return false;
        if (out > (ULLONG_MAX - d) / base) return false;
        out = out * base + d;
        any = true;
    }
    return any;
}

// [-+]? (0b[01_]+ | 0x[0-9a-fA-F_]+ | 0[0-7_]+ | 0 | [1-9][0-9_]*)
static bool resolve_int(const std::string& s, std::string& canonical) {
    std::string_view v(s);
    bool negative = false;
    if (!v.empty() && (v[0] == '-' || v[0] == '+')) {
        negative = v[0] == '-';
        v.remove_prefix(1);
    }
    if (v.empty() || !is_digit(v[0])) return false;

    unsigned long long n = 0;
    bool ok;
    if (v.size() > 2 && v[0] == '0' && v[1] == 'b') {
        ok = parse_digits(v.substr(2), 2, n);
    } else if (v.size() > 2 && v[0] == '0' && v[1] == 'x') {
        ok = parse_digits(v.substr(2), 16, n);
    } else if (v.size() > 1 && v[0] == '0') {
        ok = parse_digits(v.substr(1), 8, n);
    } else {
        ok = parse_digits(v, 10, n);
    }
    if (!ok) return false;

    canonical = (negative && n != 0) ? "-" : "";
    canonical += std::to_string(n);
    return true;
}

// [-+]? [0-9][0-9_]* . [0-9_]* ([eE][-+][0-9]+)?  |  .[0-9][0-9_]* (...)
// [-+]? .inf  |  .nan
static bool resolve_float(const std::string& s, std::string& canonical) {
    std::string_view v(s);
    bool negative = false;
    bool has_sign = false;
    if (!v.empty() && (v[0] == '-' || v[0] == '+')) {
        negative = v[0] == '-';
        has_sign = true;
        v.remove_prefix(1);
    }
    if (v == ".inf" || v == ".Inf" || v == ".INF") {
        canonical = negative ? "-inf" : "inf";
        return true;
    }
    if (!has_sign && (v == ".nan" || v == ".NaN" || v == ".NAN")) {
        canonical = "nan";
        return true;
    }

    std::string number = negative ? "-" : "";
    size_t i = 0;
    if (!v.empty() && is_digit(v[0])) {
        for (; i < v.size() && (is_digit(v[i]) || v[i] == '_'); ++i) {
            if (v[i] != '_') number += v[i];
        }
    } else if (has_sign || v.size() < 2 || v[0] != '.' || !is_digit(v[1])) {
        return false;
    }
    if (i >= v.size() || v[i] != '.') return false;
    number += '.';
    for (++i; i < v.size() && (is_digit(v[i]) || v[i] == '_'); ++i) {
        if (v[i] != '_') number += v[i];
    }
    if (i < v.size()) {
        if (v[i] != 'e' && v[i] != 'E') return false;
        if (++i >= v.size() || (v[i] != '-' && v[i] != '+')) return false;
        number += 'e';
        number += v[i];
        if (++i >= v.size()) return false;
        for (; i < v.size(); ++i) {
            if (!is_digit(v[i])) return false;
            number += v[i];
        }
    }

    // Shortest of %.15g / %.17g that reads back exactly
    double d = std::strtod(number.c_str(), nullptr);
    char buf[32];
    snprintf(buf, sizeof(buf), "%.15g", d);
    if (std::strtod(buf, nullptr) != d) snprintf(buf, sizeof(buf), "%.17g", d);
    canonical = buf;
    return true;
}

Value resolve_plain_scalar(const std::string& text) {
    if (is_null_text(text)) return Value();

    bool b;
    if (resolve_bool(text, b)) return Value::make_scalar(b ? "true" : "false", ScalarType::BOOL);

    std::string canonical;
    if (resolve_int(text, canonical)) return Value::make_scalar(canonical, ScalarType::INT);
    if (resolve_float(text, canonical)) return Value::make_scalar(canonical, ScalarType::FLOAT);
    return Value::make_scalar(text);
}

//=============================================================================
// YAML Conversion
//=============================================================================

Value from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            // "?" is the non-specific tag of plain scalars; quoted ones carry "!"
            if (node.Tag() == "?") return resolve_plain_scalar(node.Scalar());
            return Value::make_scalar(node.Scalar());
        case YAML::NodeType::Sequence: {
            Value seq = Value::make_sequence();
            seq.items.reserve(node.size());
            for (const auto& item : node) {
                seq.items.push_back(from_yaml(item));
            }
            return seq;
        }
        case YAML::NodeType::Map: {
            Value map = Value::make_mapping();
            for (const auto& kv : node) {
                // Complex keys are rare in rule files; use their rendering
                std::string key = kv.first.IsScalar() ? kv.first.Scalar()
                                                      : render(from_yaml(kv.first));
                map.set(std::move(key), from_yaml(kv.second));
            }
            return map;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return Value();
}

bool parse_yaml(const std::string& text, Value& out, std::string& err) {
    try {
        out = from_yaml(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        err = e.what();
        return false;
    }
    return true;
}

bool parse_rule_text(std::string text, const std::string& origin, Value& out) {
    std::replace(text.begin(), text.end(), '\t', ' ');

    std::string err;
    if (!parse_yaml(text, out, err)) {
        std::cerr << "Failed to parse " << origin << ": " << err << "\n";
        return false;
    }
    if (out.is_null()) {
        out = Value::make_sequence();
    } else if (!out.is_sequence()) {
        std::cerr << "Invalid rule file " << origin << ": root is not a sequence\n";
        return false;
    }
    return true;
}

} // namespace ruleaudit
