// metadoc/test_support/document_builders.hpp - helpers for unit/integration tests
//
// Builders for semantic metadata documents, plus scratch directories and
// files for tests that run the scanner, the writer or the whole pipeline.
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "metadoc/basic/progress.hpp"
#include "metadoc/index/schema.hpp"

namespace metadoc::test_support
{

// ============================================================================
// Documents
// ============================================================================

struct RangeSpec
{
  int start_line = 0;
  int start_character = 0;
  int end_line = 0;
  int end_character = 0;
};

/**
 * Fluent builder for a TextDocument.
 *
 *   auto doc = DocumentBuilder("A.scala").define("a.A#", {0, 6, 0, 7}).build();
 */
class DocumentBuilder
{
public:
  explicit DocumentBuilder(std::string uri)
  {
    doc_.set_schema(semanticdb::SEMANTICDB3);
    doc_.set_uri(std::move(uri));
  }

  DocumentBuilder & define(const std::string & symbol, const RangeSpec & r)
  {
    return occurrence(symbol, r, semanticdb::SymbolOccurrence::DEFINITION);
  }

  DocumentBuilder & reference(const std::string & symbol, const RangeSpec & r)
  {
    return occurrence(symbol, r, semanticdb::SymbolOccurrence::REFERENCE);
  }

  DocumentBuilder & occurrence(
    const std::string & symbol, const RangeSpec & r, semanticdb::SymbolOccurrence::Role role)
  {
    auto * occ = doc_.add_occurrences();
    occ->set_symbol(symbol);
    occ->set_role(role);
    auto * range = occ->mutable_range();
    range->set_start_line(r.start_line);
    range->set_start_character(r.start_character);
    range->set_end_line(r.end_line);
    range->set_end_character(r.end_character);
    return *this;
  }

  /// Occurrence without a range.
  DocumentBuilder & bare(const std::string & symbol, semanticdb::SymbolOccurrence::Role role)
  {
    auto * occ = doc_.add_occurrences();
    occ->set_symbol(symbol);
    occ->set_role(role);
    return *this;
  }

  [[nodiscard]] semanticdb::TextDocument build() const { return doc_; }

private:
  semanticdb::TextDocument doc_;
};

[[nodiscard]] inline semanticdb::TextDocuments wrap(const semanticdb::TextDocument & doc)
{
  semanticdb::TextDocuments docs;
  *docs.add_documents() = doc;
  return docs;
}

[[nodiscard]] inline schema::Range make_range(const RangeSpec & r)
{
  schema::Range range;
  range.set_start_line(r.start_line);
  range.set_start_character(r.start_character);
  range.set_end_line(r.end_line);
  range.set_end_character(r.end_character);
  return range;
}

[[nodiscard]] inline schema::Position make_position(
  const std::string & filename, const RangeSpec & r)
{
  schema::Position position;
  position.set_filename(filename);
  position.set_start_line(r.start_line);
  position.set_start_character(r.start_character);
  position.set_end_line(r.end_line);
  position.set_end_character(r.end_character);
  return position;
}

// ============================================================================
// Filesystem
// ============================================================================

[[nodiscard]] inline std::filesystem::path make_temp_dir(std::string_view prefix)
{
  const auto base = std::filesystem::temp_directory_path();
  static std::atomic<unsigned> counter{0};
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::filesystem::path dir = base / (std::string(prefix) + "_" + std::to_string(now) +
                                            "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(const std::filesystem::path & p, std::string_view bytes)
{
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path());
  }
  std::ofstream out(p, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("failed to open file for writing: " + p.string());
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

[[nodiscard]] inline std::string read_file(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

/// Serialize @p docs as a binary *.semanticdb file.
inline void write_semanticdb(
  const std::filesystem::path & p, const semanticdb::TextDocuments & docs)
{
  std::string bytes;
  if (!docs.SerializeToString(&bytes)) {
    throw std::runtime_error("failed to serialize " + p.string());
  }
  write_file(p, bytes);
}

/// Removes a directory tree when the test ends.
class ScopedTempDir
{
public:
  explicit ScopedTempDir(std::string_view prefix) : path_(make_temp_dir(prefix)) {}
  ~ScopedTempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir & operator=(const ScopedTempDir &) = delete;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

// ============================================================================
// Progress
// ============================================================================

/// Records the phases it was told about.
class RecordingProgress final : public ProgressObserver
{
public:
  void start_task(std::string_view task, size_t length) override
  {
    started.emplace_back(task);
    lengths.push_back(length);
  }
  void tick(std::string_view /*task*/, size_t /*done*/) override {}
  void complete_task(std::string_view task, bool success) override
  {
    (success ? completed : failed).emplace_back(task);
  }

  std::vector<std::string> started;
  std::vector<size_t> lengths;
  std::vector<std::string> completed;
  std::vector<std::string> failed;
};

}  // namespace metadoc::test_support
