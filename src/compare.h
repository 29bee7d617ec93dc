// compare.h - Structural comparison of records, ignoring translated text
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_COMPARE_H
#define RULEAUDIT_COMPARE_H

#include <set>
#include <string>
#include <vector>

#include "value.h"

namespace ruleaudit {

struct CompareResult {
    std::vector<std::string> warnings;  // Human-readable trail, path-qualified
    bool match = true;
};

// Compare two values recursively. Mapping keys in `ignored` are skipped on
// both sides. Stops at the first mismatch. `path` prefixes every location
// in the warnings (the record key at top level).
CompareResult compare(const Value& a, const Value& b, const std::string& path,
                      const std::set<std::string>& ignored);

} // namespace ruleaudit

#endif // RULEAUDIT_COMPARE_H
