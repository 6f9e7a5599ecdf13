// metadoc/index/reconciler.hpp - Term/type namespace reconciliation
//
// An object and its synthetic companion type share one name but live in
// the term and type namespaces ("pkg.Foo." and "pkg.Foo#"). The compiler
// may attach the definition to one half and references to the other. This
// pass folds each such pair into a single browsable record.
//
#pragma once

#include <map>
#include <string>
#include <vector>

#include "metadoc/index/accumulator.hpp"
#include "metadoc/index/schema.hpp"

namespace metadoc
{

/**
 * Post-accumulation pass over a stable OccurrenceAccumulator.
 *
 * Rules, applied per entry:
 *  - type entry with a definition, term sibling present without one:
 *    the type entry gains the term sibling's references (appended after
 *    its own, per file). The term sibling becomes an alias of the type
 *    record and is not published on its own.
 *  - term entry without a definition, type sibling with one: the term
 *    borrows the sibling's definition.
 *  - anything else is left unchanged.
 * Entries that still lack a definition are not published.
 *
 * The constructor takes an ordered snapshot of the accumulator's slots and
 * every later lookup goes through it, so the live map is only walked once.
 * The accumulator must not be mutated while a reconciler exists.
 */
class NamespaceReconciler
{
public:
  explicit NamespaceReconciler(const OccurrenceAccumulator & symbols);

  /// Reconciled view of a single entry.
  [[nodiscard]] schema::SymbolIndex reconcile(const schema::SymbolIndex & entry) const;

  /// True if @p entry is a definition-less term folded into its type sibling.
  [[nodiscard]] bool is_absorbed(const schema::SymbolIndex & entry) const;

  /**
   * Every record to publish: reconciled, definition-bearing, not absorbed.
   * Sorted by symbol.
   */
  [[nodiscard]] std::vector<schema::SymbolIndex> run() const;

private:
  [[nodiscard]] schema::SymbolIndex with_sibling_references(
    const schema::SymbolIndex & entry) const;
  [[nodiscard]] schema::SymbolIndex with_sibling_definition(
    const schema::SymbolIndex & entry) const;

  [[nodiscard]] const schema::SymbolIndex * lookup(const std::string & symbol) const;

  // Points into the accumulator's slots; sorted by symbol.
  std::map<std::string, const schema::SymbolIndex *> symbols_;
};

}  // namespace metadoc
