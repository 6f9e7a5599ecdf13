// metadoc/output/directory_sink.hpp - Site written as a directory tree
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "metadoc/output/output_sink.hpp"

namespace metadoc
{

/**
 * Writes every file through a temporary sibling that is renamed into
 * place, so readers never observe a truncated record.
 */
class DirectorySink final : public OutputSink
{
public:
  /// @throws WriteError if @p root cannot be created
  explicit DirectorySink(std::filesystem::path root);

  void write(const std::string & relative_path, std::string_view bytes) override;
  void close() override {}
  [[nodiscard]] std::filesystem::path location() const override { return root_; }

private:
  std::filesystem::path root_;
};

}  // namespace metadoc
