// metadoc/output/zip_sink.hpp - Site written into a single zip archive
//
// For very large corpora creating one file per symbol dominates the run;
// appending to one archive is much faster. Entries are deflated with zlib
// in the calling thread and appended under a lock. ZIP64 records are added
// when the entry count or archive offsets exceed the classic format.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "metadoc/output/output_sink.hpp"

namespace metadoc
{

class ZipSink final : public OutputSink
{
public:
  /// @throws WriteError if the archive cannot be created
  explicit ZipSink(std::filesystem::path archive);
  ~ZipSink() override;

  ZipSink(const ZipSink &) = delete;
  ZipSink & operator=(const ZipSink &) = delete;

  void write(const std::string & relative_path, std::string_view bytes) override;

  /// Writes the central directory. Without it the archive is unreadable.
  void close() override;

  [[nodiscard]] std::filesystem::path location() const override { return archive_; }

  [[nodiscard]] size_t entry_count() const;

private:
  struct CentralEntry
  {
    std::string name;
    uint16_t method = 0;
    uint32_t crc = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
  };

  void write_raw(const std::string & bytes);
  void write_central_directory();

  std::filesystem::path archive_;
  std::ofstream out_;
  uint16_t dos_time_ = 0;
  uint16_t dos_date_ = 0;

  mutable std::mutex mutex_;
  uint64_t offset_ = 0;
  std::vector<CentralEntry> entries_;
  std::unordered_map<std::string, size_t> entry_index_;
  bool closed_ = false;
  bool failed_ = false;
};

}  // namespace metadoc
