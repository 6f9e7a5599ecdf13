// metadoc/basic/errors.hpp - Exception types raised by the indexing pipeline
//
// Scan failures surface as std::filesystem::filesystem_error and are not
// wrapped. Decode failures are recovered per file; write failures abort the run.
//
#pragma once

#include <stdexcept>
#include <string>

namespace metadoc
{

/**
 * A metadata file could not be decoded (unknown suffix, malformed bytes,
 * malformed JSON, unsafe document uri).
 */
class DecodeError : public std::runtime_error
{
public:
  explicit DecodeError(const std::string & message) : std::runtime_error(message) {}
};

/**
 * An output record or directory could not be written.
 */
class WriteError : public std::runtime_error
{
public:
  explicit WriteError(const std::string & message) : std::runtime_error(message) {}
};

}  // namespace metadoc
