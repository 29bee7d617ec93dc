// segmenter.cc - Line-exact segmentation of rule files into record blocks

#include "segmenter.h"

#include <algorithm>
#include <iterator>

#include "common.h"
#include "value.h"

namespace ruleaudit {

// Resolve quotes and escapes of a key token as the YAML parser does
static std::optional<std::string> decode_quoted_key(const std::string& quoted) {
    Value parsed;
    std::string err;
    if (!parse_yaml(quoted, parsed, err) || !parsed.is_scalar()) return std::nullopt;
    return parsed.scalar;
}

LineSegmenter::LineClass LineSegmenter::classify(std::string_view line) {
    if (line_is_audit_comment(line)) return LineClass::AUDIT;

    if (!in_document_) {
        if (line_is_normal_comment(line) || line_is_start_of_document(line)) {
            return LineClass::PREAMBLE;
        }
        in_document_ = true;
    }

    if (line_is_sequence_item(line)) {
        int indent = static_cast<int>(indentation_of(line));
        if (root_indentation_ < 0) root_indentation_ = indent;
        if (indent == root_indentation_) return LineClass::RECORD_START;
    }
    return LineClass::BODY;
}

LineSegmenter::Block LineSegmenter::finish_record() {
    Block block;
    block.lines = take_front(content_end_);
    block.key = std::move(key_);

    key_.reset();
    saw_primary_ = false;
    primary_line_ = 0;
    return block;
}

bool LineSegmenter::append(std::string_view line) {
    buffer_.emplace_back(line);
    if (line_is_content(line)) content_end_ = buffer_.size();

    if (root_indentation_ < 0 || key_) return false;

    if (mode_ == KeyMode::SINGLE) {
        std::string quoted;
        if (!match_single_key_line(line, quoted)) return false;
        key_ = decode_quoted_key(quoted);
        return key_.has_value();
    }

    if (match_item_field_line(line, PRIMARY_FIELD)) {
        saw_primary_ = true;
        primary_line_ = buffer_.size();
    }
    if (saw_primary_ && match_field_line(line, SECONDARY_FIELD)) {
        key_ = key_from_buffer();
        return key_.has_value();
    }
    return false;
}

std::vector<std::string> LineSegmenter::take_lines_before_primary() {
    if (primary_line_ <= 1) {
        primary_line_ = 0;
        return {};
    }
    std::vector<std::string> lines = take_front(primary_line_ - 1);
    primary_line_ = 0;
    return lines;
}

std::vector<std::string> LineSegmenter::take_leading_blank_lines() {
    size_t n = 0;
    while (n < buffer_.size() && line_is_blank(buffer_[n])) ++n;
    return take_front(n);
}

std::vector<std::string> LineSegmenter::take_all() {
    return take_front(buffer_.size());
}

std::vector<std::string> LineSegmenter::take_front(size_t n) {
    n = std::min(n, buffer_.size());
    std::vector<std::string> out(std::make_move_iterator(buffer_.begin()),
                                 std::make_move_iterator(buffer_.begin() + n));
    buffer_.erase(buffer_.begin(), buffer_.begin() + n);
    content_end_ = content_end_ > n ? content_end_ - n : 0;
    if (primary_line_ > 0) primary_line_ = primary_line_ > n ? primary_line_ - n : 0;
    return out;
}

// Parse only the buffered span: it holds the record from its first line
// through the secondary identity line, preceded by comments/blank lines.
std::optional<std::string> LineSegmenter::key_from_buffer() const {
    std::string text;
    for (const auto& l : buffer_) text += l;
    std::replace(text.begin(), text.end(), '\t', ' ');

    Value parsed;
    std::string err;
    if (!parse_yaml(text, parsed, err)) return std::nullopt;
    if (!parsed.is_sequence() || parsed.items.size() != 1) return std::nullopt;
    return derive_key(parsed.items[0], KeyMode::COMPOSITE);
}

//=============================================================================
// Missing-Record Extraction
//=============================================================================

std::vector<std::string> extract_record_lines(const std::string& key,
                                              const std::vector<std::string>& lines,
                                              KeyMode mode) {
    LineSegmenter seg(mode);

    for (const auto& line : lines) {
        LineSegmenter::LineClass cls = seg.classify(line);
        if (cls == LineSegmenter::LineClass::AUDIT ||
            cls == LineSegmenter::LineClass::PREAMBLE) {
            continue;
        }
        if (cls == LineSegmenter::LineClass::RECORD_START) {
            // The key still names the previous record here
            if (seg.key() == key) return seg.finish_record().lines;
            seg.finish_record();
        }
        seg.append(line);
    }

    if (seg.buffered() > 0 && seg.key() == key) return seg.finish_record().lines;
    return {};
}

} // namespace ruleaudit
