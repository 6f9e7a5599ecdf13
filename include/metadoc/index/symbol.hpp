// metadoc/index/symbol.hpp - SemanticDB symbol classification
//
// Global symbols are terminated by a namespace marker: '.' for terms and
// packages, '#' for types. Anything else (locals such as "local12",
// parameters "(x)", type parameters "[T]") is private to its file and is
// never indexed.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace metadoc
{

/// Namespace of the last descriptor of a global symbol.
enum class DescriptorKind : uint8_t {
  Term,    ///< name.
  Type,    ///< name#
  Method,  ///< name(disambiguator).
};

/**
 * A global symbol split into owner and last descriptor.
 *
 * "scala.Option#" -> owner "scala.", name "Option", Type.
 * Views point into the string passed to parse_global_symbol().
 */
struct GlobalSymbol
{
  std::string_view owner;
  std::string_view name;  ///< Includes the backquotes of a quoted name
  DescriptorKind kind = DescriptorKind::Term;
};

/// True if @p symbol ends in a term or type namespace marker.
[[nodiscard]] bool is_global_symbol(std::string_view symbol) noexcept;

/**
 * Split a global symbol into owner and last descriptor.
 *
 * @return nullopt for local symbols, multi-symbols (";a.;b#") and
 *         descriptors that cannot be delimited.
 */
[[nodiscard]] std::optional<GlobalSymbol> parse_global_symbol(std::string_view symbol);

/// "pkg.Foo#" -> "pkg.Foo."; nullopt unless @p symbol is a type symbol.
[[nodiscard]] std::optional<std::string> term_sibling_of(std::string_view symbol);

/// "pkg.Foo." -> "pkg.Foo#"; nullopt unless @p symbol is a term symbol.
[[nodiscard]] std::optional<std::string> type_sibling_of(std::string_view symbol);

}  // namespace metadoc
