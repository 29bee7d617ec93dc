// record.cc - Record identity and translation markers

#include "record.h"

#include <algorithm>
#include <cstdio>
#include <vector>

#include "common.h"

namespace ruleaudit {

std::optional<std::string> derive_key(const Value& record, KeyMode mode) {
    if (!record.is_mapping()) return std::nullopt;

    if (mode == KeyMode::SINGLE) {
        if (record.entries.size() != 1) return std::nullopt;
        return record.entries[0].first;
    }

    const Value* name = record.find(PRIMARY_FIELD);
    const Value* tag = record.find(SECONDARY_FIELD);
    if (!name || !tag || !name->is_scalar()) return std::nullopt;

    std::string tag_key;
    if (tag->is_sequence()) {
        std::vector<std::string> tags;
        tags.reserve(tag->items.size());
        for (const auto& t : tag->items) {
            if (!t.is_scalar()) return std::nullopt;
            tags.push_back(t.scalar);
        }
        std::sort(tags.begin(), tags.end());
        tag_key = "[";
        for (size_t i = 0; i < tags.size(); ++i) {
            if (i > 0) tag_key += ", ";
            tag_key += tags[i];
        }
        tag_key += "]";
    } else if (tag->is_scalar()) {
        tag_key = tag->scalar;
    } else {
        return std::nullopt;
    }

    return name->scalar + ":" + tag_key;
}

std::string format_key_for_display(const std::string& key) {
    std::string out = "'" + key + "'";
    uint32_t cp;
    if (is_single_code_point(key, cp)) {
        char buf[16];
        snprintf(buf, sizeof(buf), "%04x", cp);
        out += " (Unicode char: \\u";
        out += buf;
        out += ")";
    }
    return out;
}

size_t count_untranslated(const Value& record, const std::set<std::string>& markers) {
    size_t count = 0;
    if (!record.is_mapping()) return 0;
    for (const auto& [key, value] : record.entries) {
        if (markers.count(key)) ++count;
        if (value.is_mapping()) {
            count += count_untranslated(value, markers);
        } else if (value.is_sequence()) {
            for (const auto& item : value.items) {
                if (item.is_mapping()) count += count_untranslated(item, markers);
            }
        }
    }
    return count;
}

} // namespace ruleaudit
