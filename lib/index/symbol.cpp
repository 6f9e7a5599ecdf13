// metadoc/index/symbol.cpp - SemanticDB symbol classification
//
#include "metadoc/index/symbol.hpp"

namespace metadoc
{

namespace
{

bool is_descriptor_end(char c)
{
  return c == '.' || c == '#' || c == '/' || c == ')' || c == ']';
}

/// Start index of the name that ends right before @p end, or npos.
size_t find_name_start(std::string_view s, size_t end)
{
  if (end == 0) {
    return std::string_view::npos;
  }

  // Backquoted name: `a b`
  if (s[end - 1] == '`') {
    if (end < 2) {
      return std::string_view::npos;
    }
    const size_t open = s.rfind('`', end - 2);
    return open;
  }

  size_t start = end;
  while (start > 0 && !is_descriptor_end(s[start - 1])) {
    --start;
  }
  return start == end ? std::string_view::npos : start;
}

std::string make_sibling(const GlobalSymbol & sym, char marker)
{
  std::string out;
  out.reserve(sym.owner.size() + sym.name.size() + 1);
  out.append(sym.owner);
  out.append(sym.name);
  out.push_back(marker);
  return out;
}

}  // namespace

bool is_global_symbol(std::string_view symbol) noexcept
{
  if (symbol.empty()) {
    return false;
  }
  const char last = symbol.back();
  return last == '.' || last == '#';
}

std::optional<GlobalSymbol> parse_global_symbol(std::string_view symbol)
{
  if (!is_global_symbol(symbol) || symbol.front() == ';') {
    return std::nullopt;
  }

  const size_t body_end = symbol.size() - 1;
  GlobalSymbol out;
  out.kind = symbol.back() == '#' ? DescriptorKind::Type : DescriptorKind::Term;

  size_t name_end = body_end;
  if (out.kind == DescriptorKind::Term && body_end > 0 && symbol[body_end - 1] == ')') {
    // name(+1).
    const size_t open = symbol.rfind('(', body_end - 1);
    if (open == std::string_view::npos) {
      return std::nullopt;
    }
    out.kind = DescriptorKind::Method;
    name_end = open;
  }

  const size_t name_start = find_name_start(symbol, name_end);
  if (name_start == std::string_view::npos) {
    return std::nullopt;
  }

  out.owner = symbol.substr(0, name_start);
  out.name = symbol.substr(name_start, name_end - name_start);
  return out;
}

std::optional<std::string> term_sibling_of(std::string_view symbol)
{
  const auto parsed = parse_global_symbol(symbol);
  if (!parsed || parsed->kind != DescriptorKind::Type) {
    return std::nullopt;
  }
  return make_sibling(*parsed, '.');
}

std::optional<std::string> type_sibling_of(std::string_view symbol)
{
  const auto parsed = parse_global_symbol(symbol);
  if (!parsed || parsed->kind != DescriptorKind::Term) {
    return std::nullopt;
  }
  return make_sibling(*parsed, '#');
}

}  // namespace metadoc
