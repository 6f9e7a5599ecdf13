// metadoc/output/output_sink.hpp - Destination of a generated site
//
// The writer addresses files by '/'-separated paths relative to the site
// root ("symbol/<digest>", "index.workspace"). A sink maps them onto a
// directory tree or into a single archive.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace metadoc
{

class OutputSink
{
public:
  virtual ~OutputSink() = default;

  /**
   * Create or replace the file at @p relative_path with @p bytes.
   *
   * Safe to call concurrently for distinct paths. A write either fully
   * succeeds or leaves no trace of the new content.
   *
   * @throws WriteError
   */
  virtual void write(const std::string & relative_path, std::string_view bytes) = 0;

  /**
   * Flush and release the sink. Further writes are errors.
   *
   * @throws WriteError
   */
  virtual void close() = 0;

  /// Where the site ends up (directory or archive file).
  [[nodiscard]] virtual std::filesystem::path location() const = 0;
};

}  // namespace metadoc
