// rewrite.h - Annotated rewrite of a translated rule file
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_REWRITE_H
#define RULEAUDIT_REWRITE_H

#include <string>
#include <string_view>
#include <vector>

#include "audit.h"

namespace ruleaudit {

// Marker carried by every inserted comment; lines with it are dropped on input
inline constexpr const char* AUDIT_MARKER = "# [AUDIT]";

struct RewriteResult {
    std::string content;

    bool discarded_audit_comments = false;  // Input held annotations of a previous run

    size_t new_rule_comments = 0;
    size_t needs_translation_comments = 0;
    size_t not_in_english_comments = 0;
    size_t differences_comments = 0;

    // Missing English records that could not be placed or extracted
    std::vector<std::string> unplaced;

    size_t total_comments() const {
        return new_rule_comments + needs_translation_comments +
               not_in_english_comments + differences_comments;
    }

    // Whether the translated file has to be replaced
    bool changed() const { return discarded_audit_comments || total_comments() > 0; }
};

// Rewrite `translated_lines` with audit annotations from `report`, splicing
// in missing records verbatim from `english_lines`. Every line not touched by
// an annotation or insertion is copied byte for byte.
RewriteResult rewrite_annotated(const std::vector<std::string>& translated_lines,
                                const std::vector<std::string>& english_lines,
                                const AuditReport& report);

// "\r\n" if the first terminated line uses it, "\n" otherwise
std::string detect_line_ending(const std::vector<std::string>& lines);

} // namespace ruleaudit

#endif // RULEAUDIT_REWRITE_H
