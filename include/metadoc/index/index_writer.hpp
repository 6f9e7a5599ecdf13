// metadoc/index/index_writer.hpp - Persisting the symbol index
//
// Site layout:
//   symbol/<sha512-hex>              SymbolIndex per published symbol
//   index.workspace                  Workspace (all indexed filenames)
//   semanticdb/<uri>.semanticdb      single-document copy of each input
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "metadoc/basic/progress.hpp"
#include "metadoc/index/schema.hpp"
#include "metadoc/output/output_sink.hpp"

namespace metadoc
{

inline constexpr const char * k_symbol_dir = "symbol";
inline constexpr const char * k_semanticdb_dir = "semanticdb";
inline constexpr const char * k_workspace_file = "index.workspace";

class IndexWriter
{
public:
  IndexWriter(OutputSink & sink, ProgressObserver & progress) : sink_(sink), progress_(progress) {}

  /// "symbol/<digest>" for @p symbol.
  [[nodiscard]] static std::string symbol_path(std::string_view symbol);

  /**
   * "semanticdb/<uri>.semanticdb" for a document uri.
   *
   * @throws DecodeError if the uri is empty, absolute or climbs out of the
   *         site with ".." segments
   */
  [[nodiscard]] static std::string document_path(std::string_view uri);

  /**
   * Write one record per entry, in parallel.
   *
   * @throws WriteError on the first failed write
   */
  void write_symbols(gsl::span<const schema::SymbolIndex> entries);

  /// @throws WriteError
  void write_symbol(const schema::SymbolIndex & entry);

  /// @throws WriteError
  void write_workspace(const std::vector<std::string> & filenames);

  /**
   * Store @p document alone in a TextDocuments under document_path().
   *
   * @throws DecodeError for an unsafe uri, WriteError on write failure
   */
  void write_document(const semanticdb::TextDocument & document);

  static constexpr std::string_view k_task_name = "Writing symbol index";

private:
  OutputSink & sink_;
  ProgressObserver & progress_;
};

}  // namespace metadoc
