// record.h - Record identity and translation markers
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_RECORD_H
#define RULEAUDIT_RECORD_H

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "value.h"

namespace ruleaudit {

//=============================================================================
// Key Mode
//=============================================================================

enum class KeyMode : uint8_t {
    COMPOSITE,  // name + ":" + tag
    SINGLE,     // sole mapping key (unicode definition files)
};

// Identity fields of composite records
inline constexpr const char* PRIMARY_FIELD = "name";
inline constexpr const char* SECONDARY_FIELD = "tag";

// Fields whose values legitimately differ between languages
inline const std::set<std::string>& default_ignored_keys() {
    static const std::set<std::string> keys = {"t", "T", "oc", "OC", "CT", "ct"};
    return keys;
}

// Fields that still hold English text waiting to be translated
inline const std::set<std::string>& default_untranslated_keys() {
    static const std::set<std::string> keys = {"t", "ot", "oc"};
    return keys;
}

//=============================================================================
// Key Derivation
//=============================================================================

// Returns nullopt when the record lacks its identity fields
std::optional<std::string> derive_key(const Value& record, KeyMode mode);

// 'key', plus " (Unicode char: \uXXXX)" for a one-character key
std::string format_key_for_display(const std::string& key);

// Occurrences of marker keys in mappings and in mapping elements of sequences
size_t count_untranslated(const Value& record, const std::set<std::string>& markers);

} // namespace ruleaudit

#endif // RULEAUDIT_RECORD_H
