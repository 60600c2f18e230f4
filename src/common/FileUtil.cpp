#include "common/FileUtil.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ferry::common {

namespace {

std::runtime_error ioError(const std::string& sWhat, const std::filesystem::path& path,
                           int iErrno) {
  return std::runtime_error(sWhat + " " + path.string() + ": " + std::strerror(iErrno));
}

void syncDirectory(const std::filesystem::path& pathDir) {
  int iFd = ::open(pathDir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (iFd < 0) {
    throw ioError("Failed to open directory", pathDir, errno);
  }
  if (::fsync(iFd) != 0) {
    int iErr = errno;
    ::close(iFd);
    throw ioError("Failed to fsync directory", pathDir, iErr);
  }
  ::close(iFd);
}

}  // namespace

void writeFileAtomic(const std::filesystem::path& pathTarget, const std::string& sContent,
                     int iMode) {
  const auto pathDir = pathTarget.has_parent_path() ? pathTarget.parent_path()
                                                    : std::filesystem::path(".");
  std::string sTemplate = (pathDir / ("." + pathTarget.filename().string() + ".XXXXXX")).string();
  std::vector<char> vTemplate(sTemplate.begin(), sTemplate.end());
  vTemplate.push_back('\0');

  int iFd = ::mkstemp(vTemplate.data());
  if (iFd < 0) {
    throw ioError("Failed to create temporary file for", pathTarget, errno);
  }
  const std::filesystem::path pathTmp(vTemplate.data());

  auto fail = [&](const std::string& sWhat) {
    int iErr = errno;
    ::close(iFd);
    ::unlink(pathTmp.c_str());
    return ioError(sWhat, pathTarget, iErr);
  };

  const char* pData = sContent.data();
  size_t nLeft = sContent.size();
  while (nLeft > 0) {
    ssize_t nWritten = ::write(iFd, pData, nLeft);
    if (nWritten < 0) {
      if (errno == EINTR) continue;
      throw fail("Failed to write");
    }
    pData += nWritten;
    nLeft -= static_cast<size_t>(nWritten);
  }

  if (::fchmod(iFd, static_cast<mode_t>(iMode)) != 0) {
    throw fail("Failed to set mode on");
  }
  if (::fsync(iFd) != 0) {
    throw fail("Failed to fsync");
  }
  if (::close(iFd) != 0) {
    int iErr = errno;
    ::unlink(pathTmp.c_str());
    throw ioError("Failed to close", pathTarget, iErr);
  }
  if (::rename(pathTmp.c_str(), pathTarget.c_str()) != 0) {
    int iErr = errno;
    ::unlink(pathTmp.c_str());
    throw ioError("Failed to rename temporary file onto", pathTarget, iErr);
  }

  syncDirectory(pathDir);
}

std::optional<std::string> readFile(const std::filesystem::path& pathFile) {
  std::ifstream ifs(pathFile, std::ios::binary);
  if (!ifs.is_open()) {
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

std::string trim(const std::string& sValue) {
  const char* pWhitespace = " \t\r\n\f\v";
  const auto nFirst = sValue.find_first_not_of(pWhitespace);
  if (nFirst == std::string::npos) {
    return {};
  }
  const auto nLast = sValue.find_last_not_of(pWhitespace);
  return sValue.substr(nFirst, nLast - nFirst + 1);
}

}  // namespace ferry::common
