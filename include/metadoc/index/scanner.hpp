// metadoc/index/scanner.hpp - Classpath scanning for semantic metadata files
#pragma once

#include <filesystem>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <vector>

#include "metadoc/basic/progress.hpp"

namespace metadoc
{

inline constexpr std::string_view k_semanticdb_suffix = ".semanticdb";
inline constexpr std::string_view k_semanticdb_json_suffix = ".semanticdb.json";

/// Encoding of a metadata file, derived from its suffix.
enum class MetadataFormat {
  Binary,  ///< *.semanticdb (protobuf)
  Json,    ///< *.semanticdb.json (protobuf JSON mapping)
};

/// Format of @p file, or nullopt if its name has no recognized suffix.
[[nodiscard]] std::optional<MetadataFormat> metadata_format(const std::filesystem::path & file);

/**
 * Finds every semantic metadata file below a list of classpath roots.
 *
 * Roots are walked in parallel. A root that is itself a regular metadata
 * file is returned as is. Directory symlinks are not followed.
 */
class MetadataScanner
{
public:
  explicit MetadataScanner(ProgressObserver & progress) : progress_(progress) {}

  /**
   * Scan all roots.
   *
   * @return Matched files, sorted lexicographically so that sequential
   *         replays visit them in a fixed order
   * @throws std::filesystem::filesystem_error when a root cannot be walked
   */
  [[nodiscard]] std::vector<std::filesystem::path> scan(
    gsl::span<const std::filesystem::path> classpath) const;

  static constexpr std::string_view k_task_name = "Scanning semanticdb files";

private:
  ProgressObserver & progress_;
};

}  // namespace metadoc
