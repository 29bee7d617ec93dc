// value.h - Tagged value tree for parsed rule files
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_VALUE_H
#define RULEAUDIT_VALUE_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace YAML {
class Node;
}

namespace ruleaudit {

//=============================================================================
// Value - Mapping | Sequence | Scalar | Null
//=============================================================================

enum class ValueKind : uint8_t {
    NUL,
    SCALAR,
    SEQUENCE,
    MAPPING,
};

// Resolved type of a scalar. Plain scalars are resolved with the YAML 1.1
// rules (yes/no/on/off booleans, 0x/0o/0b integers); quoted ones stay strings.
enum class ScalarType : uint8_t {
    STRING,
    BOOL,
    INT,
    FLOAT,
};

struct Value {
    using Entry = std::pair<std::string, Value>;

    ValueKind kind = ValueKind::NUL;
    std::string scalar;           // SCALAR only, canonical for non-strings
    ScalarType scalar_type = ScalarType::STRING;
    std::vector<Value> items;     // SEQUENCE only
    std::vector<Entry> entries;   // MAPPING only, in document order

    static Value make_scalar(std::string s, ScalarType type = ScalarType::STRING) {
        Value v;
        v.kind = ValueKind::SCALAR;
        v.scalar = std::move(s);
        v.scalar_type = type;
        return v;
    }
    static Value make_sequence() {
        Value v;
        v.kind = ValueKind::SEQUENCE;
        return v;
    }
    static Value make_mapping() {
        Value v;
        v.kind = ValueKind::MAPPING;
        return v;
    }

    bool is_null() const { return kind == ValueKind::NUL; }
    bool is_scalar() const { return kind == ValueKind::SCALAR; }
    bool is_sequence() const { return kind == ValueKind::SEQUENCE; }
    bool is_mapping() const { return kind == ValueKind::MAPPING; }

    // Mapping lookup, nullptr if absent or not a mapping
    const Value* find(const std::string& key) const;

    // Appends to a mapping; a repeated key replaces the earlier value
    void set(std::string key, Value v);
};

// Deep equality; mappings compare as unordered key sets, scalars by type and
// value (an integer equals a float of the same value)
bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Flow-style rendering for reports: scalar, [a, b], {k: v}, null
std::string render(const Value& v);

//=============================================================================
// YAML Conversion
//=============================================================================

// Type of a plain (unquoted) scalar; NUL kind for null spellings
Value resolve_plain_scalar(const std::string& text);

Value from_yaml(const YAML::Node& node);

// Parse YAML text into a Value. Returns false and sets err on parse failure.
bool parse_yaml(const std::string& text, Value& out, std::string& err);

// Parse the text of a rule file: tabs become spaces before parsing, the root
// must be a sequence (an empty document yields an empty sequence). Errors
// are reported to std::cerr naming `origin`.
bool parse_rule_text(std::string text, const std::string& origin, Value& out);

} // namespace ruleaudit

#endif // RULEAUDIT_VALUE_H
