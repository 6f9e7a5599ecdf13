// metadoc/index/index_reader.cpp - Lookups against a generated site
//
#include "metadoc/index/index_reader.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include "metadoc/basic/errors.hpp"
#include "metadoc/index/index_writer.hpp"

namespace fs = std::filesystem;

namespace metadoc
{

namespace
{

/// Parse the file at @p path into @p message; false if the file is absent.
bool read_message(const fs::path & path, google::protobuf::MessageLite & message)
{
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return false;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw DecodeError("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  const std::string bytes = buffer.str();

  if (
    bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
    !message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    throw DecodeError("corrupt record " + path.string());
  }
  return true;
}

}  // namespace

std::optional<schema::SymbolIndex> IndexReader::read_symbol(std::string_view symbol) const
{
  schema::SymbolIndex entry;
  if (!read_message(root_ / IndexWriter::symbol_path(symbol), entry)) {
    return std::nullopt;
  }
  return entry;
}

schema::Workspace IndexReader::read_workspace() const
{
  schema::Workspace workspace;
  if (!read_message(root_ / k_workspace_file, workspace)) {
    throw DecodeError("missing " + (root_ / k_workspace_file).string());
  }
  return workspace;
}

std::optional<semanticdb::TextDocuments> IndexReader::read_document(std::string_view uri) const
{
  semanticdb::TextDocuments docs;
  if (!read_message(root_ / IndexWriter::document_path(uri), docs)) {
    return std::nullopt;
  }
  return docs;
}

}  // namespace metadoc
