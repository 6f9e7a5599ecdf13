// metadoc/output/directory_sink.cpp - Site written as a directory tree
//
#include "metadoc/output/directory_sink.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "metadoc/basic/errors.hpp"

namespace fs = std::filesystem;

namespace metadoc
{

namespace
{

std::atomic<uint64_t> g_temp_counter{0};

bool is_contained(const fs::path & relative)
{
  if (relative.empty() || relative.is_absolute()) {
    return false;
  }
  for (const auto & part : relative) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

}  // namespace

DirectorySink::DirectorySink(fs::path root) : root_(std::move(root))
{
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw WriteError("cannot create directory " + root_.string() + ": " + ec.message());
  }
}

void DirectorySink::write(const std::string & relative_path, std::string_view bytes)
{
  const fs::path relative(relative_path);
  if (!is_contained(relative)) {
    throw WriteError("refusing to write outside of the target: " + relative_path);
  }

  const fs::path out = root_ / relative;
  std::error_code ec;
  fs::create_directories(out.parent_path(), ec);
  if (ec) {
    throw WriteError(
      "cannot create directory " + out.parent_path().string() + ": " + ec.message());
  }

  const fs::path temp =
    out.parent_path() /
    ("." + out.filename().string() + ".tmp" + std::to_string(g_temp_counter.fetch_add(1)));

  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      throw WriteError("cannot open " + temp.string());
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (file.fail()) {
      fs::remove(temp, ec);
      throw WriteError("failed to write " + out.string());
    }
  }

  fs::rename(temp, out, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw WriteError("cannot move " + temp.string() + " to " + out.string() + ": " + ec.message());
  }
}

}  // namespace metadoc
