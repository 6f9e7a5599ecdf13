// metadoc/index/scanner.cpp - Classpath scanning
//
#include "metadoc/index/scanner.hpp"

#include <tbb/concurrent_vector.h>
#include <tbb/parallel_for.h>

#include <algorithm>
#include <atomic>
#include <string>

namespace fs = std::filesystem;

namespace metadoc
{

namespace
{

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace

std::optional<MetadataFormat> metadata_format(const fs::path & file)
{
  const std::string name = file.filename().string();
  if (ends_with(name, k_semanticdb_suffix)) {
    return MetadataFormat::Binary;
  }
  if (ends_with(name, k_semanticdb_json_suffix)) {
    return MetadataFormat::Json;
  }
  return std::nullopt;
}

std::vector<fs::path> MetadataScanner::scan(gsl::span<const fs::path> classpath) const
{
  progress_.start_task(k_task_name, classpath.size());

  tbb::concurrent_vector<fs::path> found;
  std::atomic<size_t> done{0};

  try {
    tbb::parallel_for(size_t{0}, classpath.size(), [&](size_t i) {
      const fs::path & root = classpath[i];

      if (fs::is_regular_file(root)) {
        if (metadata_format(root)) {
          found.push_back(root);
        }
      } else {
        // Throws filesystem_error for a missing or unreadable root.
        for (const auto & entry : fs::recursive_directory_iterator(root)) {
          if (entry.is_regular_file() && metadata_format(entry.path())) {
            found.push_back(entry.path());
          }
        }
      }

      progress_.tick(k_task_name, ++done);
    });
  } catch (...) {
    progress_.complete_task(k_task_name, false);
    throw;
  }

  std::vector<fs::path> files(found.begin(), found.end());
  std::sort(files.begin(), files.end());
  progress_.complete_task(k_task_name, true);
  return files;
}

}  // namespace metadoc
