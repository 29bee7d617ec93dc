// registry.h - Ordered key -> record registry for one rule file
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_REGISTRY_H
#define RULEAUDIT_REGISTRY_H

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "record.h"
#include "value.h"

namespace ruleaudit {

//=============================================================================
// Registry
//=============================================================================

// Records in file order. Entries are never reordered or removed once built,
// so `entries` order is the file order of first occurrences.
struct Registry {
    struct Entry {
        std::string key;
        Value record;
        std::optional<std::string> predecessor;  // nullopt = start of file
    };

    std::vector<Entry> entries;
    std::unordered_map<std::string, size_t> index;  // key -> entries position

    bool has_duplicates = false;
    size_t skipped = 0;  // Records without identity fields

    bool contains(const std::string& key) const { return index.count(key) != 0; }

    const Entry* find(const std::string& key) const {
        auto it = index.find(key);
        return it == index.end() ? nullptr : &entries[it->second];
    }

    size_t size() const { return entries.size(); }
};

// Build a registry from a parsed root sequence. Duplicate keys and records
// without a key are reported to `out` as warnings naming `label`
// ("English", "translated").
Registry build_registry(const Value& root, KeyMode mode, const std::string& label,
                        std::ostream& out);

} // namespace ruleaudit

#endif // RULEAUDIT_REGISTRY_H
