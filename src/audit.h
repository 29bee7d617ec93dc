// audit.h - Translation audit of a rule file against its English version
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_AUDIT_H
#define RULEAUDIT_AUDIT_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "record.h"
#include "registry.h"
#include "value.h"

namespace ruleaudit {

//=============================================================================
// Audit Configuration
//=============================================================================

struct AuditConfig {
    std::string english_path;     // Reference ("source of truth") rules
    std::string translated_path;  // Derived rules, rewritten in NEW_VERSION mode

    enum class Mode { WARNINGS, NEW_VERSION } mode = Mode::WARNINGS;
    enum class Unicode { AUTO, YES, NO } unicode = Unicode::AUTO;

    std::set<std::string> ignored_keys = default_ignored_keys();
    std::set<std::string> untranslated_keys = default_untranslated_keys();

    bool verbose = false;
};

// AUTO selects single-key mode when the translated path contains "unicode"
KeyMode resolve_key_mode(const AuditConfig& config);

//=============================================================================
// Insertion Chains
//=============================================================================

// English records missing from the translated file, keyed by the English
// record they follow. Each anchor has at most one missing successor, and a
// missing key may itself anchor the next missing key.
struct InsertionChains {
    std::optional<std::string> at_start;                  // Missing first record(s)
    std::unordered_map<std::string, std::string> after;   // anchor -> missing

    void add(const std::optional<std::string>& anchor, const std::string& missing);

    // Remove and return the missing key chained after `anchor`
    // (nullopt anchor = start of file)
    std::optional<std::string> take(const std::optional<std::string>& anchor);
};

//=============================================================================
// Audit Report
//=============================================================================

struct AuditReport {
    KeyMode mode = KeyMode::COMPOSITE;
    size_t english_items = 0;

    Registry english;
    Registry translated;

    std::unordered_map<std::string, size_t> untranslated_counts;

    std::vector<std::string> missing;  // English order
    InsertionChains chains;

    std::unordered_set<std::string> extra_set;
    std::unordered_set<std::string> differing_set;

    // Duplicate keys make every other finding unreliable: no rewrite may follow
    bool has_duplicates() const {
        return english.has_duplicates || translated.has_duplicates;
    }
};

// Compare two parsed root sequences and print findings to `out`
AuditReport build_report(const Value& english_root, const Value& translated_root,
                         KeyMode mode, const std::set<std::string>& ignored_keys,
                         const std::set<std::string>& untranslated_keys,
                         std::ostream& out);

// Full run: load both files, report, and in NEW_VERSION mode rewrite the
// translated file. Returns false on I/O or parse failure and on duplicate keys.
bool run_audit(const AuditConfig& config, AuditReport& report, std::ostream& out);

} // namespace ruleaudit

#endif // RULEAUDIT_AUDIT_H
