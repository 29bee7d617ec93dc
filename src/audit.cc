// audit.cc - Translation audit of a rule file against its English version

#include "audit.h"

#include <iostream>

#include "common.h"
#include "compare.h"
#include "mmap.h"
#include "replace.h"
#include "rewrite.h"

namespace ruleaudit {

KeyMode resolve_key_mode(const AuditConfig& config) {
    switch (config.unicode) {
        case AuditConfig::Unicode::YES: return KeyMode::SINGLE;
        case AuditConfig::Unicode::NO:  return KeyMode::COMPOSITE;
        case AuditConfig::Unicode::AUTO: break;
    }
    return to_lower_ascii(config.translated_path).find("unicode") != std::string::npos
               ? KeyMode::SINGLE
               : KeyMode::COMPOSITE;
}

//=============================================================================
// Insertion Chains
//=============================================================================

void InsertionChains::add(const std::optional<std::string>& anchor, const std::string& missing) {
    if (anchor) {
        after[*anchor] = missing;
    } else {
        at_start = missing;
    }
}

std::optional<std::string> InsertionChains::take(const std::optional<std::string>& anchor) {
    std::optional<std::string> missing;
    if (!anchor) {
        missing.swap(at_start);
        return missing;
    }
    auto it = after.find(*anchor);
    if (it == after.end()) return missing;
    missing = std::move(it->second);
    after.erase(it);
    return missing;
}

//=============================================================================
// Report
//=============================================================================

static std::string join_keys(const std::set<std::string>& keys) {
    std::string out;
    for (const auto& k : keys) {
        if (!out.empty()) out += ", ";
        out += k;
    }
    return out;
}

AuditReport build_report(const Value& english_root, const Value& translated_root,
                         KeyMode mode, const std::set<std::string>& ignored_keys,
                         const std::set<std::string>& untranslated_keys,
                         std::ostream& out) {
    AuditReport report;
    report.mode = mode;
    report.english_items = english_root.items.size();

    out << "\nProcessing " << report.english_items << " items in "
        << (mode == KeyMode::SINGLE ? "Unicode" : "Non-Unicode") << " mode.\n\n";

    report.english = build_registry(english_root, mode, "English", out);
    report.translated = build_registry(translated_root, mode, "translated", out);

    // Untranslated keys
    for (const auto& entry : report.translated.entries) {
        size_t count = count_untranslated(entry.record, untranslated_keys);
        if (count == 0) continue;
        report.untranslated_counts[entry.key] = count;
        out << "Rule " << format_key_for_display(entry.key) << " still contains "
            << count << " key(s) needing translating.\n";
    }

    // Missing in translated file
    for (const auto& entry : report.english.entries) {
        if (report.translated.contains(entry.key)) continue;
        report.missing.push_back(entry.key);
        report.chains.add(entry.predecessor, entry.key);
        out << "Rule " << format_key_for_display(entry.key)
            << " is missing in the translated file.\n";
    }

    // Extra in translated file
    for (const auto& entry : report.translated.entries) {
        if (report.english.contains(entry.key)) continue;
        report.extra_set.insert(entry.key);
        out << "Warning: Rule " << format_key_for_display(entry.key)
            << " in translated file is not in the English file.\n";
    }

    // Structural differences
    std::string ignored_list = join_keys(ignored_keys);
    for (const auto& entry : report.english.entries) {
        const Registry::Entry* other = report.translated.find(entry.key);
        if (!other) continue;

        CompareResult cmp = compare(entry.record, other->record, entry.key, ignored_keys);
        if (cmp.match) continue;

        report.differing_set.insert(entry.key);
        out << "Warning: Rule " << format_key_for_display(entry.key)
            << " contains differences other than ones in " << ignored_list << " keys:\n";
        for (const auto& w : cmp.warnings) {
            out << "  - " << w << "\n";
        }
    }

    return report;
}

//=============================================================================
// Main Audit Function
//=============================================================================

static bool load(const std::string& path, std::vector<std::string>& lines, Value& root) {
    std::string text;
    if (!read_file(path, text)) {
        std::cerr << "Failed to open: " << path << "\n";
        return false;
    }
    lines = split_lines(text);
    return parse_rule_text(std::move(text), path, root);
}

static void print_chains(const AuditReport& report, std::ostream& out) {
    out << "Missing rules:\n";
    for (const auto& key : report.missing) {
        const std::optional<std::string>& predecessor = report.english.find(key)->predecessor;
        out << "  " << key << " is missing after "
            << (predecessor ? *predecessor : std::string("the start of the file")) << "\n";
    }
    out << "\n";
}

bool run_audit(const AuditConfig& config, AuditReport& report, std::ostream& out) {
    std::vector<std::string> english_lines;
    std::vector<std::string> translated_lines;
    Value english_root;
    Value translated_root;

    if (!load(config.english_path, english_lines, english_root)) return false;
    if (!load(config.translated_path, translated_lines, translated_root)) return false;

    report = build_report(english_root, translated_root, resolve_key_mode(config),
                          config.ignored_keys, config.untranslated_keys, out);

    if (report.has_duplicates()) {
        out << "\nStopping: Duplicate keys in the English or translated file "
               "may cause incorrect results.\n";
        return false;
    }

    if (config.mode != AuditConfig::Mode::NEW_VERSION) return true;

    out << "\nCreating new version of translated file with comments where "
           "translation is needed.\n";
    if (config.verbose) print_chains(report, out);

    RewriteResult result = rewrite_annotated(translated_lines, english_lines, report);
    for (const auto& key : result.unplaced) {
        out << "Warning: Missing rule " << format_key_for_display(key)
            << " could not be placed in the new version.\n";
    }

    if (!result.changed()) {
        out << "No changes needed to " << config.translated_path << ".\n";
        return true;
    }

    std::string backup;
    if (!replace_with_backup(config.translated_path, result.content, backup)) return false;

    out << "New version of " << config.translated_path << " created. Original backed up to "
        << backup << ".\n";
    if (result.new_rule_comments > 0) {
        out << "  " << result.new_rule_comments << " new rule(s) that need translation.\n";
    }
    if (result.needs_translation_comments > 0) {
        out << "  " << result.needs_translation_comments
            << " rule(s) that need translation of keys.\n";
    }
    if (result.not_in_english_comments > 0) {
        out << "  " << result.not_in_english_comments << " rule(s) not in English file.\n";
    }
    if (result.differences_comments > 0) {
        out << "  " << result.differences_comments
            << " rule(s) with differences other than translation.\n";
    }
    return true;
}

} // namespace ruleaudit
