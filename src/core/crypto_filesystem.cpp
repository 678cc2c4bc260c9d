#include "dv/core/crypto_filesystem.h"

#include <system_error>
#include <utility>

#include "dv/common.h"
#include "dv/crypto/provider.h"
#include "dv/error.h"
#include "dv/errors.h"
#include "dv/storage/local_storage.h"

namespace dv::core {

namespace {

std::vector<std::string> SplitLogicalPath(std::string_view logical_path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= logical_path.size()) {
    const size_t end = logical_path.find('/', start);
    const auto segment = logical_path.substr(start, end == std::string_view::npos ? end : end - start);
    if (!segment.empty()) {
      segments.emplace_back(segment);
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return segments;
}

}  // namespace

CryptoFileSystem::CryptoFileSystem(std::shared_ptr<const VaultContext> context)
    : context_(std::move(context)), root_(std::make_shared<Folder>(context_, nullptr, std::string{})) {}

std::shared_ptr<CryptoFileSystem> CryptoFileSystem::Open(std::shared_ptr<storage::PhysicalFolder> physical_root,
                                                         std::shared_ptr<const FilenameCipher> cipher,
                                                         FileSystemOptions options) {
  ValidateOptions(options);
  crypto::EnsureCryptoProviderInitialized();

  auto data_root = physical_root->Folder(options.data_folder_name);
  PhysicalPathMapper mapper(cipher, options.shard_prefix_length, options.encrypt_directory_ids);
  auto context = std::make_shared<const VaultContext>(VaultContext{std::move(physical_root), std::move(data_root),
                                                                   std::move(cipher), std::move(mapper),
                                                                   std::move(options)});
  return std::shared_ptr<CryptoFileSystem>(new CryptoFileSystem(std::move(context)));
}

std::shared_ptr<CryptoFileSystem> CryptoFileSystem::Open(const std::filesystem::path& physical_root,
                                                         std::shared_ptr<const FilenameCipher> cipher,
                                                         FileSystemOptions options) {
  // Absolute so that two contexts opened on one vault describe the same root.
  std::error_code ec;
  auto absolute = std::filesystem::absolute(physical_root, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kOpenFailed,
                "Failed to resolve vault path: " + PathToUtf8String(physical_root) + " (" + ec.message() + ")",
                ec.value()};
  }
  return Open(std::make_shared<storage::LocalFolder>(absolute.lexically_normal()), std::move(cipher),
              std::move(options));
}

std::shared_ptr<Folder> CryptoFileSystem::ResolveFolder(std::string_view logical_path) const {
  auto folder = root_;
  for (const auto& segment : SplitLogicalPath(logical_path)) {
    folder = folder->GetFolder(segment);
  }
  return folder;
}

std::shared_ptr<File> CryptoFileSystem::ResolveFile(std::string_view logical_path) const {
  auto segments = SplitLogicalPath(logical_path);
  if (segments.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidSegmentName,
                std::string(errors::msg::kInvalidSegmentEmpty) + ": " + std::string(logical_path)};
  }
  auto folder = root_;
  for (size_t i = 0; i + 1 < segments.size(); ++i) {
    folder = folder->GetFolder(segments[i]);
  }
  return folder->GetFile(segments.back());
}

}  // namespace dv::core
