// metadoc/index/accumulator.cpp - Concurrent aggregation of symbol occurrences
//
#include "metadoc/index/accumulator.hpp"

#include <algorithm>

#include "metadoc/index/symbol.hpp"

namespace metadoc
{

void OccurrenceAccumulator::add_document(const semanticdb::TextDocument & document)
{
  for (const auto & occ : document.occurrences()) {
    if (!is_global_symbol(occ.symbol())) {
      continue;  // local symbol
    }
    if (!occ.has_range()) {
      continue;
    }

    const semanticdb::Range & r = occ.range();
    switch (occ.role()) {
      case semanticdb::SymbolOccurrence::DEFINITION: {
        schema::Position position;
        position.set_filename(document.uri());
        position.set_start_line(r.start_line());
        position.set_start_character(r.start_character());
        position.set_end_line(r.end_line());
        position.set_end_character(r.end_character());
        add_definition(occ.symbol(), position);
        break;
      }
      case semanticdb::SymbolOccurrence::REFERENCE: {
        schema::Range range;
        range.set_start_line(r.start_line());
        range.set_start_character(r.start_character());
        range.set_end_line(r.end_line());
        range.set_end_character(r.end_character());
        add_reference(document.uri(), range, occ.symbol());
        break;
      }
      default:
        break;
    }
  }

  record_filename(document.uri());
}

void OccurrenceAccumulator::add_definition(
  const std::string & symbol, const schema::Position & position)
{
  SymbolMap::accessor slot;
  if (symbols_.insert(slot, symbol)) {
    slot->second.set_symbol(symbol);
  }

  schema::SymbolIndex & entry = slot->second;
  if (entry.has_definition()) {
    return;
  }
  *entry.mutable_definition() = position;
  (*entry.mutable_references())[position.filename()];
}

void OccurrenceAccumulator::add_reference(
  const std::string & filename, const schema::Range & range, const std::string & symbol)
{
  SymbolMap::accessor slot;
  if (symbols_.insert(slot, symbol)) {
    slot->second.set_symbol(symbol);
  }

  schema::Ranges & ranges = (*slot->second.mutable_references())[filename];
  *ranges.add_ranges() = range;
}

void OccurrenceAccumulator::record_filename(const std::string & filename)
{
  filenames_.insert(filename);
}

std::optional<schema::SymbolIndex> OccurrenceAccumulator::find(const std::string & symbol) const
{
  SymbolMap::const_accessor slot;
  if (!symbols_.find(slot, symbol)) {
    return std::nullopt;
  }
  return slot->second;
}

std::vector<std::string> OccurrenceAccumulator::filenames() const
{
  std::vector<std::string> out(filenames_.begin(), filenames_.end());
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace metadoc
