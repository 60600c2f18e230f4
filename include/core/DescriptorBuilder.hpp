#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::core {

/// Writes the two inputs ansible-playbook needs for a session: the inventory
/// naming the single target host, and the extra-vars parameter file.
/// Both writers are deterministic and overwrite a fixed, session-scoped path.
class DescriptorBuilder {
 public:
  static constexpr const char* kInventoryFile = "inventory.ini";
  static constexpr const char* kParametersFile = "vars.json";

  /// True if sValue can stand as a single inventory token: no whitespace,
  /// control characters, quotes, '=' or INI syntax characters.
  static bool isSafeInventoryValue(const std::string& sValue);

  /// [target] group with one host entry using the session's private key.
  /// Throws ValidationError if sHost or sUser is empty or not a safe inventory value.
  static std::filesystem::path buildInventory(const std::filesystem::path& pathSession,
                                              const std::string& sHost,
                                              const std::string& sUser,
                                              const std::string& sPrivateKeyPath);

  /// JSON object with src_paths, dest_path, client_user and public_key.
  /// Throws ValidationError if vSrcPaths or sDestPath is empty.
  static std::filesystem::path buildParameters(const std::filesystem::path& pathSession,
                                               const std::vector<std::string>& vSrcPaths,
                                               const std::string& sDestPath,
                                               const std::string& sClientUser,
                                               const std::string& sPublicKey);
};

}  // namespace ferry::core
