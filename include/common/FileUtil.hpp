#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ferry::common {

/// Replace the file at pathTarget with sContent so that readers see either the
/// old or the new content, never a partial write.
/// Writes a temporary sibling, fsyncs it, renames it over the target and
/// fsyncs the parent directory. iMode is applied to the new file.
/// Throws std::runtime_error on any I/O failure; the temporary file is removed.
void writeFileAtomic(const std::filesystem::path& pathTarget, const std::string& sContent,
                     int iMode = 0644);

/// Read a whole file. Returns std::nullopt if it does not exist or cannot be opened.
std::optional<std::string> readFile(const std::filesystem::path& pathFile);

/// Strip leading and trailing whitespace.
std::string trim(const std::string& sValue);

}  // namespace ferry::common
