#include "core/SizeCalculator.hpp"

#include "common/Logger.hpp"

#include <filesystem>
#include <system_error>

namespace ferry::core {

namespace fs = std::filesystem;

namespace {

uint64_t fileSizeOrZero(const fs::path& path) {
  std::error_code ec;
  const auto nSize = fs::file_size(path, ec);
  if (ec) {
    common::Logger::get()->debug("Skipping {} in size count: {}", path.string(), ec.message());
    return 0;
  }
  return static_cast<uint64_t>(nSize);
}

uint64_t directorySize(const fs::path& pathDir) {
  uint64_t uTotal = 0;
  std::error_code ec;
  fs::recursive_directory_iterator it(pathDir, fs::directory_options::skip_permission_denied, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    std::error_code ecType;
    if (it->is_directory(ecType)) {
      continue;
    }
    uTotal += fileSizeOrZero(it->path());
  }
  if (ec) {
    common::Logger::get()->debug("Stopped walking {}: {}", pathDir.string(), ec.message());
  }
  return uTotal;
}

}  // namespace

uint64_t computeTotalSize(const std::vector<std::string>& vPaths) {
  uint64_t uTotal = 0;
  for (const auto& sPath : vPaths) {
    std::error_code ec;
    const auto stStatus = fs::status(sPath, ec);
    if (ec) {
      continue;
    }
    if (fs::is_regular_file(stStatus)) {
      uTotal += fileSizeOrZero(sPath);
    } else if (fs::is_directory(stStatus)) {
      uTotal += directorySize(sPath);
    }
  }
  return uTotal;
}

}  // namespace ferry::core
