// segmenter.h - Line-exact segmentation of rule files into record blocks
// Part of rule_audit - rule translation auditor
//
// A rule file is scanned line by line without a preserving parser:
//
//   ---                      <- preamble (document start + document comments)
//   # document comment
//                            <- first non-comment line enters the document
//   # comment for rule a     <- block of "a:x": leading comments/blank lines
//   - name: a                <- plus the record's own lines
//     tag: x
//     match: "."
//   # comment for rule b     <- trailing comments belong to the next record
//   - name: b
//
// A block is only finalized when the next record starts (or at EOF) since
// comments after a record are ambiguous until then.

#ifndef RULEAUDIT_SEGMENTER_H
#define RULEAUDIT_SEGMENTER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "record.h"

namespace ruleaudit {

//=============================================================================
// LineSegmenter
//=============================================================================

class LineSegmenter {
public:
    enum class LineClass : uint8_t {
        AUDIT,         // "# [AUDIT]" annotation, never buffered
        PREAMBLE,      // Document start marker or document-level comment
        RECORD_START,  // Sequence item at the root indentation
        BODY,          // Anything else inside the document
    };

    // A finalized block and the key detected for it
    struct Block {
        std::vector<std::string> lines;
        std::optional<std::string> key;
    };

    explicit LineSegmenter(KeyMode mode) : mode_(mode) {}

    // Classify the next raw line. Moves into the document on the first real
    // content line and fixes the root indentation on the first sequence item.
    // Does not buffer the line.
    LineClass classify(std::string_view line);

    // Remove the buffered lines through the last content line and return them
    // with the current key. Later lines stay buffered for the next record and
    // key detection restarts.
    Block finish_record();

    // Buffer a RECORD_START or BODY line and run key detection.
    // Returns true when this line completed the current record's key.
    bool append(std::string_view line);

    // Remove buffered lines that precede the primary identity line
    // (composite mode, once that line was seen).
    std::vector<std::string> take_lines_before_primary();

    // Remove blank lines at the head of the buffer
    std::vector<std::string> take_leading_blank_lines();

    // Remove everything still buffered
    std::vector<std::string> take_all();

    const std::optional<std::string>& key() const { return key_; }
    int root_indentation() const { return root_indentation_; }
    bool in_document() const { return in_document_; }
    size_t buffered() const { return buffer_.size(); }

private:
    std::vector<std::string> take_front(size_t n);
    std::optional<std::string> key_from_buffer() const;

    KeyMode mode_;
    bool in_document_ = false;
    int root_indentation_ = -1;   // -1 until the first root sequence item

    std::vector<std::string> buffer_;
    size_t content_end_ = 0;      // Buffered lines through the last content line

    std::optional<std::string> key_;
    bool saw_primary_ = false;
    size_t primary_line_ = 0;     // 1-based buffer position of the name line
};

//=============================================================================
// Missing-Record Extraction
//=============================================================================

// Raw lines of the record `key` (leading comments included, trailing comments
// excluded), exactly as they appear in `lines`. Empty if the key is not found.
std::vector<std::string> extract_record_lines(const std::string& key,
                                              const std::vector<std::string>& lines,
                                              KeyMode mode);

} // namespace ruleaudit

#endif // RULEAUDIT_SEGMENTER_H
