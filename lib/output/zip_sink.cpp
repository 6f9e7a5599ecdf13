// metadoc/output/zip_sink.cpp - Site written into a single zip archive
//
#include "metadoc/output/zip_sink.hpp"

#include <zlib.h>

#include <ctime>
#include <limits>
#include <system_error>
#include <utility>

#include "metadoc/basic/errors.hpp"

namespace fs = std::filesystem;

namespace metadoc
{

namespace
{

constexpr uint32_t k_local_header_sig = 0x04034b50;
constexpr uint32_t k_central_header_sig = 0x02014b50;
constexpr uint32_t k_zip64_eocd_sig = 0x06064b50;
constexpr uint32_t k_zip64_locator_sig = 0x07064b50;
constexpr uint32_t k_eocd_sig = 0x06054b50;

constexpr uint16_t k_version_needed = 20;
constexpr uint16_t k_version_needed_zip64 = 45;
constexpr uint16_t k_version_made_by = (3U << 8) | 45U;  // UNIX, 4.5
constexpr uint16_t k_flag_utf8 = 0x0800;
constexpr uint16_t k_method_stored = 0;
constexpr uint16_t k_method_deflated = 8;
constexpr uint16_t k_zip64_extra_id = 0x0001;

constexpr uint16_t k_max16 = std::numeric_limits<uint16_t>::max();
constexpr uint32_t k_max32 = std::numeric_limits<uint32_t>::max();

void put16(std::string & out, uint16_t v)
{
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string & out, uint32_t v)
{
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

void put64(std::string & out, uint64_t v)
{
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

/// Raw deflate (no zlib header), as stored in zip entries.
std::string deflate_raw(std::string_view input)
{
  z_stream zs{};
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw WriteError("deflateInit2 failed");
  }

  std::string out(deflateBound(&zs, static_cast<uLong>(input.size())), '\0');
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  zs.avail_in = static_cast<uInt>(input.size());
  zs.next_out = reinterpret_cast<Bytef *>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&zs, Z_FINISH);
  const uLong produced = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    throw WriteError("deflate failed");
  }
  out.resize(produced);
  return out;
}

}  // namespace

ZipSink::ZipSink(fs::path archive) : archive_(std::move(archive))
{
  std::error_code ec;
  if (archive_.has_parent_path()) {
    fs::create_directories(archive_.parent_path(), ec);
    if (ec) {
      throw WriteError(
        "cannot create directory " + archive_.parent_path().string() + ": " + ec.message());
    }
  }

  out_.open(archive_, std::ios::binary | std::ios::trunc);
  if (!out_.is_open()) {
    throw WriteError("cannot create archive " + archive_.string());
  }

  const std::time_t now = std::time(nullptr);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  dos_time_ = static_cast<uint16_t>(
    (local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
  dos_date_ = static_cast<uint16_t>(
    ((local.tm_year - 80) << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
}

ZipSink::~ZipSink()
{
  // An archive that was never closed has no central directory; it is left
  // behind as a partial output, like an interrupted directory target.
  if (out_.is_open()) {
    out_.close();
  }
}

void ZipSink::write(const std::string & relative_path, std::string_view bytes)
{
  if (relative_path.empty() || relative_path.size() > k_max16) {
    throw WriteError("invalid archive entry name: " + relative_path);
  }
  if (bytes.size() >= k_max32) {
    throw WriteError("archive entry too large: " + relative_path);
  }

  // Compress outside of the lock.
  CentralEntry entry;
  entry.name = relative_path;
  entry.uncompressed_size = static_cast<uint32_t>(bytes.size());
  entry.crc = static_cast<uint32_t>(crc32(
    crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef *>(bytes.data()),
    static_cast<uInt>(bytes.size())));

  std::string deflated = deflate_raw(bytes);
  std::string_view payload;
  if (deflated.size() < bytes.size()) {
    entry.method = k_method_deflated;
    payload = deflated;
  } else {
    entry.method = k_method_stored;
    payload = bytes;
  }
  entry.compressed_size = static_cast<uint32_t>(payload.size());

  const std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || failed_) {
    throw WriteError("archive is no longer writable: " + archive_.string());
  }

  entry.local_header_offset = offset_;

  std::string record;
  record.reserve(30 + entry.name.size() + payload.size());
  put32(record, k_local_header_sig);
  put16(record, k_version_needed);
  put16(record, k_flag_utf8);
  put16(record, entry.method);
  put16(record, dos_time_);
  put16(record, dos_date_);
  put32(record, entry.crc);
  put32(record, entry.compressed_size);
  put32(record, entry.uncompressed_size);
  put16(record, static_cast<uint16_t>(entry.name.size()));
  put16(record, 0);  // extra length
  record.append(entry.name);
  record.append(payload);

  write_raw(record);

  // A rewritten path shadows the earlier entry in the central directory.
  const auto it = entry_index_.find(entry.name);
  if (it != entry_index_.end()) {
    entries_[it->second] = std::move(entry);
  } else {
    entry_index_.emplace(entry.name, entries_.size());
    entries_.push_back(std::move(entry));
  }
}

void ZipSink::close()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  if (failed_) {
    throw WriteError("archive is incomplete: " + archive_.string());
  }

  write_central_directory();
  out_.close();
  if (out_.fail()) {
    failed_ = true;
    throw WriteError("failed to finish archive " + archive_.string());
  }
  closed_ = true;
}

size_t ZipSink::entry_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ZipSink::write_raw(const std::string & bytes)
{
  out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out_) {
    failed_ = true;
    throw WriteError("failed to write archive " + archive_.string());
  }
  offset_ += bytes.size();
}

void ZipSink::write_central_directory()
{
  const uint64_t cd_offset = offset_;

  std::string cd;
  for (const auto & e : entries_) {
    const bool zip64_offset = e.local_header_offset >= k_max32;

    std::string extra;
    if (zip64_offset) {
      put16(extra, k_zip64_extra_id);
      put16(extra, 8);
      put64(extra, e.local_header_offset);
    }

    put32(cd, k_central_header_sig);
    put16(cd, k_version_made_by);
    put16(cd, zip64_offset ? k_version_needed_zip64 : k_version_needed);
    put16(cd, k_flag_utf8);
    put16(cd, e.method);
    put16(cd, dos_time_);
    put16(cd, dos_date_);
    put32(cd, e.crc);
    put32(cd, e.compressed_size);
    put32(cd, e.uncompressed_size);
    put16(cd, static_cast<uint16_t>(e.name.size()));
    put16(cd, static_cast<uint16_t>(extra.size()));
    put16(cd, 0);  // comment length
    put16(cd, 0);  // disk number start
    put16(cd, 0);  // internal attributes
    put32(cd, 0100644U << 16);
    put32(cd, zip64_offset ? k_max32 : static_cast<uint32_t>(e.local_header_offset));
    cd.append(e.name);
    cd.append(extra);
  }
  write_raw(cd);

  const uint64_t cd_size = cd.size();
  const uint64_t count = entries_.size();
  const bool zip64 = count >= k_max16 || cd_offset >= k_max32 || cd_size >= k_max32;

  std::string tail;
  if (zip64) {
    const uint64_t zip64_eocd_offset = offset_;
    put32(tail, k_zip64_eocd_sig);
    put64(tail, 44);  // size of the remaining record
    put16(tail, k_version_made_by);
    put16(tail, k_version_needed_zip64);
    put32(tail, 0);  // this disk
    put32(tail, 0);  // disk with the central directory
    put64(tail, count);
    put64(tail, count);
    put64(tail, cd_size);
    put64(tail, cd_offset);

    put32(tail, k_zip64_locator_sig);
    put32(tail, 0);
    put64(tail, zip64_eocd_offset);
    put32(tail, 1);  // total disks
  }

  put32(tail, k_eocd_sig);
  put16(tail, 0);
  put16(tail, 0);
  put16(tail, zip64 ? k_max16 : static_cast<uint16_t>(count));
  put16(tail, zip64 ? k_max16 : static_cast<uint16_t>(count));
  put32(tail, zip64 ? k_max32 : static_cast<uint32_t>(cd_size));
  put32(tail, zip64 ? k_max32 : static_cast<uint32_t>(cd_offset));
  put16(tail, 0);  // comment length
  write_raw(tail);
}

}  // namespace metadoc
