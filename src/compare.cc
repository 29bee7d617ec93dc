// compare.cc - Structural comparison of records, ignoring translated text

#include "compare.h"

namespace ruleaudit {

static void report_values(CompareResult& r, const std::string& header,
                          const Value& a, const Value& b) {
    r.warnings.push_back(header);
    r.warnings.push_back("  1: " + render(a));
    r.warnings.push_back("  2: " + render(b));
    r.match = false;
}

static std::set<std::string> significant_keys(const Value& map,
                                              const std::set<std::string>& ignored) {
    std::set<std::string> keys;
    for (const auto& e : map.entries) {
        if (!ignored.count(e.first)) keys.insert(e.first);
    }
    return keys;
}

// {'a', 'b'} - keys in a not in b
static std::string key_difference(const std::set<std::string>& a,
                                  const std::set<std::string>& b) {
    std::string out;
    for (const auto& k : a) {
        if (b.count(k)) continue;
        out += out.empty() ? "{'" : ", '";
        out += k;
        out += "'";
    }
    if (!out.empty()) out += "}";
    return out;
}

static void compare_sequences(const Value& a, const Value& b, const std::string& path,
                              const std::set<std::string>& ignored, CompareResult& r);

static void compare_mappings(const Value& a, const Value& b, const std::string& path,
                             const std::set<std::string>& ignored, CompareResult& r) {
    std::set<std::string> keys_a = significant_keys(a, ignored);
    std::set<std::string> keys_b = significant_keys(b, ignored);
    if (keys_a != keys_b) {
        r.warnings.push_back("Dictionaries don't have the same keys at path: " + path);
        std::string only_a = key_difference(keys_a, keys_b);
        std::string only_b = key_difference(keys_b, keys_a);
        if (!only_a.empty()) {
            r.warnings.push_back(
                "Keys in first dictionary that are not in second dictionary: " + only_a);
        }
        if (!only_b.empty()) {
            r.warnings.push_back(
                "Keys in second dictionary that are not in first dictionary: " + only_b);
        }
        r.match = false;
        return;
    }

    for (const auto& [key, va] : a.entries) {
        if (ignored.count(key)) continue;
        const Value& vb = *b.find(key);
        std::string sub = path + "['" + key + "']";

        if (va.is_mapping() && vb.is_mapping()) {
            compare_mappings(va, vb, sub, ignored, r);
        } else if (va.is_sequence()) {
            if (!vb.is_sequence() || va.items.size() != vb.items.size()) {
                r.warnings.push_back("lists don't match at path: " + sub);
                r.match = false;
            } else {
                compare_sequences(va, vb, sub, ignored, r);
            }
        } else if (va != vb) {
            report_values(r, "Values for key: " + key + " don't match at path: " + sub + ":",
                          va, vb);
        }
        if (!r.match) return;
    }
}

static void compare_sequences(const Value& a, const Value& b, const std::string& path,
                              const std::set<std::string>& ignored, CompareResult& r) {
    if (a.items.size() != b.items.size()) {
        r.warnings.push_back("Lists don't have the same length at path: " + path);
        r.match = false;
        return;
    }

    for (size_t i = 0; i < a.items.size(); ++i) {
        const Value& ia = a.items[i];
        const Value& ib = b.items[i];
        std::string sub = path + "[" + std::to_string(i) + "]";

        if (ia.is_mapping() && ib.is_mapping()) {
            compare_mappings(ia, ib, sub, ignored, r);
        } else if (ia != ib) {
            report_values(r, "List item values don't match at path: " + sub + ":", ia, ib);
        }
        if (!r.match) return;
    }
}

CompareResult compare(const Value& a, const Value& b, const std::string& path,
                      const std::set<std::string>& ignored) {
    CompareResult r;
    if (a.is_mapping() && b.is_mapping()) {
        compare_mappings(a, b, path, ignored, r);
    } else if (a.is_sequence() && b.is_sequence()) {
        compare_sequences(a, b, path, ignored, r);
    } else if (a != b) {
        report_values(r, "Values don't match at path: " + path + ":", a, b);
    }
    return r;
}

} // namespace ruleaudit
