// metadoc/index/document_parser.hpp - Decoding of semantic metadata files
#pragma once

#include <filesystem>
#include <string_view>

#include "metadoc/index/scanner.hpp"
#include "metadoc/index/schema.hpp"

namespace metadoc
{

/**
 * Decodes *.semanticdb and *.semanticdb.json files into TextDocuments.
 *
 * All failures are reported as DecodeError; lower level causes (I/O,
 * JSON syntax) are attached as nested exceptions.
 */
class DocumentParser
{
public:
  /**
   * Read and decode one metadata file, dispatching on its suffix.
   *
   * @throws DecodeError on unknown suffix, unreadable file or malformed content
   */
  [[nodiscard]] static semanticdb::TextDocuments parse_file(const std::filesystem::path & path);

  /// Decode an in-memory payload of the given format.
  [[nodiscard]] static semanticdb::TextDocuments parse_bytes(
    std::string_view bytes, MetadataFormat format);

  /**
   * Decode the protobuf JSON mapping of TextDocuments.
   *
   * Accepts lowerCamelCase and snake_case field names and enums given by
   * name or number. Unknown keys are ignored.
   */
  [[nodiscard]] static semanticdb::TextDocuments parse_json(std::string_view text);
};

}  // namespace metadoc
