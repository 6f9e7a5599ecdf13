// metadoc/index/index_reader.hpp - Lookups against a generated site
//
// Mirrors what the static site does in the browser: symbol name ->
// digest -> symbol/<digest>.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

#include "metadoc/index/schema.hpp"

namespace metadoc
{

class IndexReader
{
public:
  /// @param root Directory target of a previous run
  explicit IndexReader(std::filesystem::path root) : root_(std::move(root)) {}

  /**
   * Record published for @p symbol.
   *
   * @return nullopt if no record exists (unknown symbol, or a symbol
   *         without definition)
   * @throws DecodeError if the record exists but cannot be decoded
   */
  [[nodiscard]] std::optional<schema::SymbolIndex> read_symbol(std::string_view symbol) const;

  /// @throws DecodeError if the manifest is missing or corrupt
  [[nodiscard]] schema::Workspace read_workspace() const;

  /// Single-document copy of the input for @p uri, if present.
  [[nodiscard]] std::optional<semanticdb::TextDocuments> read_document(std::string_view uri) const;

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }

private:
  std::filesystem::path root_;
};

}  // namespace metadoc
