#include "core/DescriptorBuilder.hpp"

#include "common/Errors.hpp"
#include "common/FileUtil.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace ferry::core {

bool DescriptorBuilder::isSafeInventoryValue(const std::string& sValue) {
  if (sValue.empty()) {
    return false;
  }
  // Anything that could end the host token or start another key=value pair
  static constexpr std::string_view kForbidden = "='\"#;[]\\";
  for (unsigned char c : sValue) {
    if (c <= 0x20 || c == 0x7f ||
        kForbidden.find(static_cast<char>(c)) != std::string_view::npos) {
      return false;
    }
  }
  return true;
}

std::filesystem::path DescriptorBuilder::buildInventory(const std::filesystem::path& pathSession,
                                                        const std::string& sHost,
                                                        const std::string& sUser,
                                                        const std::string& sPrivateKeyPath) {
  if (sHost.empty()) {
    throw common::ValidationError("missing_client_host", "client_host is required");
  }
  if (sUser.empty()) {
    throw common::ValidationError("missing_client_user", "client_user is required");
  }
  if (!isSafeInventoryValue(sHost)) {
    throw common::ValidationError("invalid_client_host", "client_host is malformed");
  }
  if (!isSafeInventoryValue(sUser)) {
    throw common::ValidationError("invalid_client_user", "client_user is malformed");
  }

  const auto pathInventory = pathSession / kInventoryFile;
  const std::string sContent = "[target]\nclient ansible_host=" + sHost + " ansible_user=" +
                               sUser + " ansible_ssh_private_key_file=" + sPrivateKeyPath +
                               "\n";
  common::writeFileAtomic(pathInventory, sContent, 0600);
  return pathInventory;
}

std::filesystem::path DescriptorBuilder::buildParameters(
    const std::filesystem::path& pathSession, const std::vector<std::string>& vSrcPaths,
    const std::string& sDestPath, const std::string& sClientUser,
    const std::string& sPublicKey) {
  if (vSrcPaths.empty()) {
    throw common::ValidationError("empty_src_paths", "At least one source path is required");
  }
  if (sDestPath.empty()) {
    throw common::ValidationError("empty_dest_path", "dest_path is required");
  }

  // JSON is valid YAML, so `--extra-vars @vars.json` reads it as-is
  nlohmann::json jVars = {
      {"src_paths", vSrcPaths},
      {"dest_path", sDestPath},
      {"client_user", sClientUser},
      {"public_key", sPublicKey},
  };

  const auto pathParameters = pathSession / kParametersFile;
  common::writeFileAtomic(pathParameters, jVars.dump(2) + "\n", 0600);
  return pathParameters;
}

}  // namespace ferry::core
