// metadoc/index/document_parser.cpp - Decoding of semantic metadata files
//
#include "metadoc/index/document_parser.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "metadoc/basic/errors.hpp"

namespace metadoc
{

namespace
{

using json = nlohmann::json;

// -----------------------------
// JSON field helpers
// -----------------------------

/// Looks up a field by its JSON name, then by its proto name.
const json * find_field(const json & obj, const char * json_name, const char * proto_name)
{
  auto it = obj.find(json_name);
  if (it == obj.end() && proto_name != nullptr) {
    it = obj.find(proto_name);
  }
  if (it == obj.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

[[noreturn]] void fail(const std::string & where, const std::string & what)
{
  throw DecodeError(where + ": " + what);
}

int32_t to_int32(const json & value, const std::string & where)
{
  int64_t n = 0;
  if (value.is_number_integer()) {
    n = value.get<int64_t>();
  } else if (value.is_string()) {
    const auto & s = value.get_ref<const std::string &>();
    size_t consumed = 0;
    try {
      n = std::stoll(s, &consumed);
    } catch (const std::exception &) {
      fail(where, "expected an integer, got \"" + s + "\"");
    }
    if (consumed != s.size()) {
      fail(where, "expected an integer, got \"" + s + "\"");
    }
  } else {
    fail(where, "expected an integer");
  }
  if (n < std::numeric_limits<int32_t>::min() || n > std::numeric_limits<int32_t>::max()) {
    fail(where, "integer out of range");
  }
  return static_cast<int32_t>(n);
}

int32_t read_int(const json & obj, const char * json_name, const char * proto_name, const std::string & where)
{
  const json * v = find_field(obj, json_name, proto_name);
  return v == nullptr ? 0 : to_int32(*v, where + "." + json_name);
}

std::string read_string(const json & obj, const char * name, const std::string & where)
{
  const json * v = find_field(obj, name, nullptr);
  if (v == nullptr) {
    return {};
  }
  if (!v->is_string()) {
    fail(where + "." + name, "expected a string");
  }
  return v->get<std::string>();
}

template <typename Enum, typename ParseFn, typename ValidFn>
Enum read_enum(
  const json & obj, const char * name, const std::string & where, ParseFn parse, ValidFn valid)
{
  const json * v = find_field(obj, name, nullptr);
  if (v == nullptr) {
    return static_cast<Enum>(0);
  }
  if (v->is_string()) {
    Enum out{};
    if (!parse(v->get<std::string>(), &out)) {
      fail(where + "." + name, "unknown enum value \"" + v->get<std::string>() + "\"");
    }
    return out;
  }
  const int32_t n = to_int32(*v, where + "." + name);
  if (!valid(n)) {
    fail(where + "." + name, "unknown enum number " + std::to_string(n));
  }
  return static_cast<Enum>(n);
}

const json * read_array(const json & obj, const char * name, const std::string & where)
{
  const json * v = find_field(obj, name, nullptr);
  if (v != nullptr && !v->is_array()) {
    fail(where + "." + name, "expected an array");
  }
  return v;
}

// -----------------------------
// Message decoders
// -----------------------------

void decode_range(const json & j, semanticdb::Range & out, const std::string & where)
{
  if (!j.is_object()) {
    fail(where, "expected an object");
  }
  out.set_start_line(read_int(j, "startLine", "start_line", where));
  out.set_start_character(read_int(j, "startCharacter", "start_character", where));
  out.set_end_line(read_int(j, "endLine", "end_line", where));
  out.set_end_character(read_int(j, "endCharacter", "end_character", where));
}

void decode_occurrence(const json & j, semanticdb::SymbolOccurrence & out, const std::string & where)
{
  if (!j.is_object()) {
    fail(where, "expected an object");
  }
  if (const json * range = find_field(j, "range", nullptr)) {
    decode_range(*range, *out.mutable_range(), where + ".range");
  }
  out.set_symbol(read_string(j, "symbol", where));
  out.set_role(read_enum<semanticdb::SymbolOccurrence_Role>(
    j, "role", where, semanticdb::SymbolOccurrence_Role_Parse,
    semanticdb::SymbolOccurrence_Role_IsValid));
}

void decode_document(const json & j, semanticdb::TextDocument & out, const std::string & where)
{
  if (!j.is_object()) {
    fail(where, "expected an object");
  }
  out.set_schema(read_enum<semanticdb::Schema>(
    j, "schema", where, semanticdb::Schema_Parse, semanticdb::Schema_IsValid));
  out.set_uri(read_string(j, "uri", where));
  out.set_text(read_string(j, "text", where));

  if (const json * occurrences = read_array(j, "occurrences", where)) {
    size_t i = 0;
    for (const auto & occ : *occurrences) {
      decode_occurrence(
        occ, *out.add_occurrences(), where + ".occurrences[" + std::to_string(i++) + "]");
    }
  }
}

std::string read_all_bytes(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw std::runtime_error("read failed: " + path.string());
  }
  return buffer.str();
}

}  // namespace

semanticdb::TextDocuments DocumentParser::parse_file(const std::filesystem::path & path)
{
  const auto format = metadata_format(path);
  if (!format) {
    throw DecodeError("unexpected filename " + path.filename().string());
  }

  std::string bytes;
  try {
    bytes = read_all_bytes(path);
  } catch (const std::exception &) {
    std::throw_with_nested(DecodeError("failed to read " + path.string()));
  }

  return parse_bytes(bytes, *format);
}

semanticdb::TextDocuments DocumentParser::parse_bytes(std::string_view bytes, MetadataFormat format)
{
  switch (format) {
    case MetadataFormat::Binary: {
      semanticdb::TextDocuments docs;
      if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw DecodeError("semanticdb payload too large");
      }
      if (!docs.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        throw DecodeError("malformed semanticdb payload");
      }
      return docs;
    }
    case MetadataFormat::Json:
      return parse_json(bytes);
  }
  throw DecodeError("unsupported metadata format");
}

semanticdb::TextDocuments DocumentParser::parse_json(std::string_view text)
{
  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::exception &) {
    std::throw_with_nested(DecodeError("malformed semanticdb JSON"));
  }

  if (!root.is_object()) {
    throw DecodeError("TextDocuments: expected an object");
  }

  semanticdb::TextDocuments docs;
  if (const json * documents = read_array(root, "documents", "TextDocuments")) {
    size_t i = 0;
    for (const auto & doc : *documents) {
      decode_document(
        doc, *docs.add_documents(), "TextDocuments.documents[" + std::to_string(i++) + "]");
    }
  }
  return docs;
}

}  // namespace metadoc
