// metadoc/index/index_writer.cpp - Persisting the symbol index
//
#include "metadoc/index/index_writer.hpp"

#include <tbb/parallel_for.h>

#include <atomic>
#include <filesystem>

#include "metadoc/basic/errors.hpp"
#include "metadoc/index/digest.hpp"

namespace metadoc
{

namespace
{

std::string serialize(const google::protobuf::MessageLite & message, std::string_view what)
{
  std::string bytes;
  if (!message.SerializeToString(&bytes)) {
    throw WriteError("failed to serialize " + std::string(what));
  }
  return bytes;
}

}  // namespace

std::string IndexWriter::symbol_path(std::string_view symbol)
{
  return std::string(k_symbol_dir) + "/" + encode_symbol_name(symbol);
}

std::string IndexWriter::document_path(std::string_view uri)
{
  if (uri.empty()) {
    throw DecodeError("document has no uri");
  }
  const std::filesystem::path p{std::string(uri)};
  if (p.is_absolute() || uri.front() == '/') {
    throw DecodeError("document uri must be relative: " + std::string(uri));
  }
  for (const auto & part : p) {
    if (part == "..") {
      throw DecodeError("document uri leaves the source root: " + std::string(uri));
    }
  }
  return std::string(k_semanticdb_dir) + "/" + std::string(uri) + ".semanticdb";
}

void IndexWriter::write_symbols(gsl::span<const schema::SymbolIndex> entries)
{
  progress_.start_task(k_task_name, entries.size());
  std::atomic<size_t> done{0};

  try {
    tbb::parallel_for(size_t{0}, entries.size(), [&](size_t i) {
      write_symbol(entries[i]);
      progress_.tick(k_task_name, ++done);
    });
  } catch (...) {
    progress_.complete_task(k_task_name, false);
    throw;
  }
  progress_.complete_task(k_task_name, true);
}

void IndexWriter::write_symbol(const schema::SymbolIndex & entry)
{
  sink_.write(symbol_path(entry.symbol()), serialize(entry, entry.symbol()));
}

void IndexWriter::write_workspace(const std::vector<std::string> & filenames)
{
  schema::Workspace workspace;
  for (const auto & name : filenames) {
    workspace.add_filenames(name);
  }
  sink_.write(k_workspace_file, serialize(workspace, k_workspace_file));
}

void IndexWriter::write_document(const semanticdb::TextDocument & document)
{
  const std::string path = document_path(document.uri());
  semanticdb::TextDocuments single;
  *single.add_documents() = document;
  sink_.write(path, serialize(single, path));
}

}  // namespace metadoc
