#pragma once
#include <cstddef>
#include <string_view>

namespace zit::consts {

// Directory and file names
inline constexpr std::string_view kRepoDir    = ".zit";
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::string_view kHeadFile   = "HEAD";
inline constexpr std::string_view kHeadLock   = "HEAD.lock";
inline constexpr std::string_view kIndexFile  = "index";
inline constexpr std::string_view kConfigFile = "config";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kMinPrefixLen = 4; // shortest digest prefix accepted by resolve()

// ——— JSON field names (index entries and commit records) ———
inline constexpr std::string_view kKeyPath      = "path";
inline constexpr std::string_view kKeyHash      = "hash";
inline constexpr std::string_view kKeyTimeStamp = "timeStamp";
inline constexpr std::string_view kKeyMessage   = "message";
inline constexpr std::string_view kKeyFiles     = "files";
inline constexpr std::string_view kKeyParent    = "parent";

// Indentation used when writing index and commit JSON
inline constexpr int kJsonIndent = 2;

} // namespace zit::consts
