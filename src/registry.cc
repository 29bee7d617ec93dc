// registry.cc - Ordered key -> record registry for one rule file

#include "registry.h"

namespace ruleaudit {

Registry build_registry(const Value& root, KeyMode mode, const std::string& label,
                        std::ostream& out) {
    Registry reg;
    std::optional<std::string> previous;

    for (size_t i = 0; i < root.items.size(); ++i) {
        const Value& record = root.items[i];
        std::optional<std::string> key = derive_key(record, mode);
        if (!key) {
            ++reg.skipped;
            out << "Warning: Item " << (i + 1) << " in " << label
                << " file has no "
                << (mode == KeyMode::SINGLE ? "single key" : "name and tag")
                << " and is skipped.\n";
            continue;
        }

        if (reg.contains(*key)) {
            out << "Warning: Duplicate key " << format_key_for_display(*key)
                << " in " << label << " file.\n";
            reg.has_duplicates = true;
            continue;
        }

        reg.index.emplace(*key, reg.entries.size());
        reg.entries.push_back({*key, record, previous});
        previous = std::move(key);
    }

    return reg;
}

} // namespace ruleaudit
