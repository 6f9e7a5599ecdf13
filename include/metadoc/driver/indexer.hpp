// metadoc/driver/indexer.hpp - Indexing driver
//
// Single entry point for the site generation pipeline.
// Used by the CLI and by integration tests.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "metadoc/basic/diagnostic.hpp"
#include "metadoc/basic/progress.hpp"
#include "metadoc/project/project_config.hpp"

namespace metadoc
{

// ============================================================================
// Index Options
// ============================================================================

struct IndexOptions
{
  /// Output directory of the site (required)
  std::filesystem::path target;

  /// Classpath roots scanned for semantic metadata
  std::vector<std::filesystem::path> classpath;

  /// Write <target>/metadoc.zip instead of a directory tree
  bool zip = false;

  /// Remove the target before writing. Everything in it is deleted.
  bool clean_target_first = false;

  /// Worker threads (0 = one per core, 1 = deterministic sequential replay)
  unsigned threads = 0;

  /// Build options from a loaded project configuration.
  [[nodiscard]] static IndexOptions from_config(const ProjectConfig & config);
};

// ============================================================================
// Index Result
// ============================================================================

struct IndexResult
{
  /// Whether the site was fully written
  bool success = false;

  /// Skipped files (warnings) and the fatal error, if any
  DiagnosticBag diagnostics;

  /// Target directory or archive
  std::filesystem::path output;

  size_t files_scanned = 0;
  size_t documents_indexed = 0;
  size_t symbols_published = 0;
};

// ============================================================================
// Indexer
// ============================================================================

/**
 * Driver that runs the indexing pipeline.
 *
 * The pipeline consists of:
 * 1. Scanning the classpath for metadata files (parallel per root)
 * 2. Decoding files and accumulating occurrences (parallel per file);
 *    each document is also copied to semanticdb/
 * 3. Namespace reconciliation (single pass, after accumulation)
 * 4. Writing symbol records (parallel per symbol)
 * 5. Writing the workspace manifest
 */
class Indexer
{
public:
  /**
   * Generate a site.
   *
   * Any failure other than a decode failure aborts the run and is reported as an error.
   * Files that fail to decode are skipped and reported as warnings.
   */
  [[nodiscard]] static IndexResult run(const IndexOptions & options, ProgressObserver & progress);

  static constexpr std::string_view k_index_task_name = "Building symbol index";

  /// Archive name used with IndexOptions::zip.
  static constexpr const char * k_zip_file_name = "metadoc.zip";
};

}  // namespace metadoc
