// metadoc/index/digest.hpp - Content-derived record names
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace metadoc
{

/// Length of an encoded symbol name: SHA-512 (64 bytes) as lowercase hex.
inline constexpr size_t k_symbol_digest_length = 128;

/**
 * Filesystem-safe name of the record for @p symbol.
 *
 * SHA-512 of the UTF-8 bytes, rendered as 128 lowercase hex characters.
 * The same symbol maps to the same name in every run and process, which
 * is what lets the site resolve symbol -> symbol/<digest>.
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
[[nodiscard]] std::string encode_symbol_name(std::string_view symbol);

}  // namespace metadoc
