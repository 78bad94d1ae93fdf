#pragma once

#include <ccpm/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace ccpm {

// ---------------------------------------------------------------------------
// Content fingerprints: lowercase hex SHA-256.
// ---------------------------------------------------------------------------

/// Hash the bytes of a file, streamed in chunks.
[[nodiscard]] Result<std::string, Error> HashFile(const std::filesystem::path& path);

/// Hash an in-memory buffer.
[[nodiscard]] Result<std::string, Error> HashBytes(std::string_view data);

/// `num_bytes` of CSPRNG output as lowercase hex (record ids).
[[nodiscard]] Result<std::string, Error> RandomHex(std::size_t num_bytes);

/// True when both files exist and have the same fingerprint.
[[nodiscard]] bool FilesIdentical(const std::filesystem::path& a,
                                  const std::filesystem::path& b);

} // namespace ccpm
