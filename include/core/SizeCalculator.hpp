#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ferry::core {

/// Total bytes of the given paths. Files count their own size; directories
/// count every file beneath them without following directory symlinks.
/// Entries whose size cannot be read are skipped; this never throws for I/O.
uint64_t computeTotalSize(const std::vector<std::string>& vPaths);

}  // namespace ferry::core
