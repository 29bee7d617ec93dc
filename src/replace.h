// replace.h - Backup and atomic replacement of a rewritten file
// Part of rule_audit - rule translation auditor

#ifndef RULEAUDIT_REPLACE_H
#define RULEAUDIT_REPLACE_H

#include <string>

namespace ruleaudit {

// "<path>.bak" for n == 1, "<path>-<n>.bak" after that
std::string backup_name(const std::string& path, unsigned n);

// Create a backup of `path` under the first free backup name.
bool create_backup(const std::string& path, std::string& backup_path);

// Replace `path` with `content`: the content goes to a temp file in the same
// directory (same file mode), the original is backed up, then the temp file is
// renamed over `path`. `path` always names either the old or the new file.
// The temp file is removed on failure.
bool replace_with_backup(const std::string& path, const std::string& content,
                         std::string& backup_path);

} // namespace ruleaudit

#endif // RULEAUDIT_REPLACE_H
