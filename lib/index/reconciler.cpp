// metadoc/index/reconciler.cpp - Term/type namespace reconciliation
//
#include "metadoc/index/reconciler.hpp"

#include <utility>

#include "metadoc/index/symbol.hpp"

namespace metadoc
{

NamespaceReconciler::NamespaceReconciler(const OccurrenceAccumulator & symbols)
{
  for (const auto & slot : symbols.entries()) {
    symbols_.emplace(slot.first, &slot.second);
  }
}

const schema::SymbolIndex * NamespaceReconciler::lookup(const std::string & symbol) const
{
  const auto it = symbols_.find(symbol);
  return it == symbols_.end() ? nullptr : it->second;
}

schema::SymbolIndex NamespaceReconciler::reconcile(const schema::SymbolIndex & entry) const
{
  if (entry.has_definition()) {
    return with_sibling_references(entry);
  }
  return with_sibling_definition(entry);
}

bool NamespaceReconciler::is_absorbed(const schema::SymbolIndex & entry) const
{
  if (entry.has_definition()) {
    return false;
  }
  const auto type_symbol = type_sibling_of(entry.symbol());
  if (!type_symbol) {
    return false;
  }
  const schema::SymbolIndex * type_entry = lookup(*type_symbol);
  return type_entry != nullptr && type_entry->has_definition();
}

std::vector<schema::SymbolIndex> NamespaceReconciler::run() const
{
  std::vector<schema::SymbolIndex> published;
  published.reserve(symbols_.size());

  for (const auto & slot : symbols_) {
    if (is_absorbed(*slot.second)) {
      continue;
    }
    schema::SymbolIndex actual = reconcile(*slot.second);
    if (actual.has_definition()) {
      published.push_back(std::move(actual));
    }
  }
  return published;
}

schema::SymbolIndex NamespaceReconciler::with_sibling_references(
  const schema::SymbolIndex & entry) const
{
  const auto term_symbol = term_sibling_of(entry.symbol());
  if (!term_symbol) {
    return entry;
  }
  const schema::SymbolIndex * term_entry = lookup(*term_symbol);
  if (term_entry == nullptr || term_entry->has_definition()) {
    return entry;
  }

  schema::SymbolIndex out = entry;
  auto & references = *out.mutable_references();
  for (const auto & [filename, ranges] : term_entry->references()) {
    auto & merged = references[filename];
    for (const auto & range : ranges.ranges()) {
      *merged.add_ranges() = range;
    }
  }
  return out;
}

schema::SymbolIndex NamespaceReconciler::with_sibling_definition(
  const schema::SymbolIndex & entry) const
{
  const auto type_symbol = type_sibling_of(entry.symbol());
  if (!type_symbol) {
    return entry;
  }
  const schema::SymbolIndex * type_entry = lookup(*type_symbol);
  if (type_entry == nullptr || !type_entry->has_definition()) {
    return entry;
  }

  schema::SymbolIndex out = entry;
  *out.mutable_definition() = type_entry->definition();
  return out;
}

}  // namespace metadoc
