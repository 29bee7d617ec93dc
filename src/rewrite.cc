// rewrite.cc - Annotated rewrite of a translated rule file
//
// Single pass over the translated lines driven by LineSegmenter:
//   record start  -> flush previous block, splice in English records missing
//                    after it (following the chain), then buffer the new line
//   key detected  -> write the lines before the record's name line and any
//                    annotations for the record
//   end of file   -> flush, splice in records missing after the last one

#include "rewrite.h"

#include <algorithm>
#include <iostream>

#include "common.h"
#include "segmenter.h"

namespace ruleaudit {

std::string detect_line_ending(const std::vector<std::string>& lines) {
    for (const auto& l : lines) {
        if (!has_eol(l)) continue;
        return (l.size() >= 2 && l[l.size() - 2] == '\r') ? "\r\n" : "\n";
    }
    return "\n";
}

// Line carrying the record's identity field, else its first content line.
// lines.size() for an empty block.
static size_t identity_line(const std::vector<std::string>& lines, KeyMode mode) {
    std::string quoted;
    for (size_t i = 0; i < lines.size(); ++i) {
        bool found = mode == KeyMode::SINGLE ? match_single_key_line(lines[i], quoted)
                                             : match_item_field_line(lines[i], PRIMARY_FIELD);
        if (found) return i;
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        if (line_is_content(lines[i])) return i;
    }
    return lines.size();
}

//=============================================================================
// OutputSink - accumulates output, completing unterminated lines
//=============================================================================

class OutputSink {
public:
    explicit OutputSink(std::string eol) : eol_(std::move(eol)) {}

    void write(std::string_view s) {
        if (s.empty()) return;
        if (open_line_) out_ += eol_;
        out_.append(s.data(), s.size());
        open_line_ = !has_eol(s);
    }

    void write_all(const std::vector<std::string>& lines) {
        for (const auto& l : lines) write(l);
    }

    std::string release() { return std::move(out_); }

private:
    std::string eol_;
    std::string out_;
    bool open_line_ = false;
};

//=============================================================================
// RewriteEngine
//=============================================================================

class RewriteEngine {
public:
    RewriteEngine(const std::vector<std::string>& english_lines, const AuditReport& report,
                  std::string eol)
        : english_lines_(english_lines), report_(report), chains_(report.chains),
          seg_(report.mode), eol_(eol), sink_(std::move(eol)) {}

    RewriteResult run(const std::vector<std::string>& translated_lines) {
        for (const auto& line : translated_lines) {
            switch (seg_.classify(line)) {
                case LineSegmenter::LineClass::AUDIT:
                    result_.discarded_audit_comments = true;
                    continue;
                case LineSegmenter::LineClass::PREAMBLE:
                    sink_.write(line);
                    continue;
                case LineSegmenter::LineClass::RECORD_START:
                    end_record();
                    break;
                case LineSegmenter::LineClass::BODY:
                    break;
            }
            if (seg_.append(line)) on_key_detected();
        }

        end_record();
        sink_.write_all(seg_.take_all());

        if (chains_.at_start) result_.unplaced.push_back(*chains_.at_start);
        for (const auto& [anchor, missing] : chains_.after) {
            result_.unplaced.push_back(missing);
        }
        std::sort(result_.unplaced.begin(), result_.unplaced.end());

        result_.content = sink_.release();
        return std::move(result_);
    }

private:
    // Flush the finished block and splice in whatever is missing after it
    void end_record() {
        LineSegmenter::Block prev = seg_.finish_record();
        sink_.write_all(prev.lines);

        if (!seen_record_) {
            insert_missing_after(std::nullopt);
        } else if (prev.key) {
            insert_missing_after(prev.key);
        }
        seen_record_ = true;
    }

    void insert_missing_after(std::optional<std::string> anchor) {
        while (std::optional<std::string> missing = chains_.take(anchor)) {
            std::vector<std::string> lines =
                extract_record_lines(*missing, english_lines_, report_.mode);
            if (lines.empty()) result_.unplaced.push_back(*missing);

            size_t at = identity_line(lines, report_.mode);
            for (size_t i = 0; i < lines.size(); ++i) {
                if (i == at) {
                    if (!anchor) sink_.write(eol_);
                    annotate("NEW RULE '" + *missing + "' THAT NEEDS TRANSLATION");
                    ++result_.new_rule_comments;
                }
                sink_.write(lines[i]);
            }
            anchor = std::move(missing);
        }
    }

    void on_key_detected() {
        const std::string& key = *seg_.key();

        if (report_.mode == KeyMode::COMPOSITE) {
            sink_.write_all(seg_.take_lines_before_primary());
        }

        auto it = report_.untranslated_counts.find(key);
        if (it != report_.untranslated_counts.end()) {
            sink_.write_all(seg_.take_leading_blank_lines());
            annotate("RULE '" + key + "' NEEDS TRANSLATION OF " +
                     std::to_string(it->second) + " KEYS");
            ++result_.needs_translation_comments;
        }
        if (report_.extra_set.count(key)) {
            sink_.write_all(seg_.take_leading_blank_lines());
            annotate("RULE '" + key + "' RULE NOT IN ENGLISH FILE");
            ++result_.not_in_english_comments;
        }
        if (report_.differing_set.count(key)) {
            sink_.write_all(seg_.take_leading_blank_lines());
            annotate("RULE '" + key + "' HAS DIFFERENCES OTHER THAN TRANSLATION");
            ++result_.differences_comments;
        }
    }

    void annotate(const std::string& text) {
        int indent = std::max(0, seg_.root_indentation());
        sink_.write(std::string(indent, ' ') + AUDIT_MARKER + " " + text + eol_);
    }

    const std::vector<std::string>& english_lines_;
    const AuditReport& report_;
    InsertionChains chains_;
    LineSegmenter seg_;
    std::string eol_;
    OutputSink sink_;
    RewriteResult result_;
    bool seen_record_ = false;
};

RewriteResult rewrite_annotated(const std::vector<std::string>& translated_lines,
                                const std::vector<std::string>& english_lines,
                                const AuditReport& report) {
    RewriteEngine engine(english_lines, report, detect_line_ending(translated_lines));
    return engine.run(translated_lines);
}

} // namespace ruleaudit
