#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "dv/core/crypto_filesystem.h"
#include "dv/error.h"
#include "dv/security/zeroizer.h"

// Prints the logical tree of a vault together with each folder's data folder.

namespace {

std::shared_ptr<const dv::core::FilenameCipher> LoadCipher(const std::filesystem::path& key_file) {
  std::ifstream in(key_file, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open key file: " + key_file.string());
  }
  std::array<uint8_t, dv::core::DeterministicFilenameCipher::kKeyMaterialSize + 1> key{};
  dv::security::Zeroizer::ScopeWiper<uint8_t> wiper(key);
  in.read(reinterpret_cast<char*>(key.data()), key.size());
  const auto read = static_cast<size_t>(in.gcount());
  if (read != dv::core::DeterministicFilenameCipher::kKeyMaterialSize) {
    throw std::runtime_error("Key file must hold exactly " +
                             std::to_string(dv::core::DeterministicFilenameCipher::kKeyMaterialSize) +
                             " bytes: " + key_file.string());
  }
  return dv::core::DeterministicFilenameCipher::FromKeyMaterial(std::span<const uint8_t>(key.data(), read));
}

void PrintFolder(dv::core::Folder& folder, const std::string& indent) {
  std::cout << indent << (folder.IsRoot() ? "/" : folder.Name() + "/") << "  ["
            << folder.PhysicalFolder()->Describe() << "]\n";
  for (const auto& child : folder.Children()) {
    if (const auto* sub = std::get_if<std::shared_ptr<dv::core::Folder>>(&child)) {
      PrintFolder(**sub, indent + "  ");
    } else {
      std::cout << indent << "  " << dv::core::NameOf(child) << "\n";
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  bool init = false;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--init") {
      init = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: dv-tree [--init] <vault-dir> <key-file>\n";
      return 0;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) {
    std::cerr << "dv-tree expects a vault directory and a key file" << std::endl;
    return 1;
  }

  try {
    auto cipher = LoadCipher(positional[1]);
    auto options = dv::core::LoadOptionsFromEnvironment();
    auto filesystem = dv::core::CryptoFileSystem::Open(std::filesystem::path(positional[0]), cipher, options);
    auto root = filesystem->Root();
    if (init) {
      root->Create(dv::core::FolderCreateMode::kIncludingParents);
    }
    if (!root->Exists()) {
      std::cerr << "No vault at " << positional[0] << " (use --init to create one)" << std::endl;
      return 2;
    }
    PrintFolder(*root, "");
  } catch (const dv::Error& err) {
    std::cerr << "dv-tree failed: " << err.what() << std::endl;
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "dv-tree failed: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
