#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace zit {

// Raw 20-byte SHA-1 (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

oid sha1(std::string_view data);

// 40-char lowercase hex.
std::string to_hex(const oid &id);

/**
 * Digest used to address every object in the store: lowercase hex SHA-1 of
 * the raw content, no header. compute_digest("hello\n") ==
 * "f572d396fae9206628714fb2ce00f72e94f2258f".
 */
inline std::string compute_digest(std::string_view content) { return to_hex(sha1(content)); }

// 40 hex digits, either case.
bool looks_hex40(std::string_view str);

} // namespace zit
