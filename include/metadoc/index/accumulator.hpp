// metadoc/index/accumulator.hpp - Concurrent aggregation of symbol occurrences
//
// One SymbolIndex slot per global symbol, shared by every indexing worker.
//
#pragma once

#include <tbb/concurrent_hash_map.h>
#include <tbb/concurrent_unordered_set.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "metadoc/index/schema.hpp"

namespace metadoc
{

/**
 * Aggregates definition and reference occurrences into one entry per symbol.
 *
 * Thread-safety: add_* and record_filename may be called concurrently from
 * any number of workers. Each update holds the write lock of its own slot
 * for the whole read-modify-write, so no update to a symbol is lost and
 * updates to different symbols proceed independently. Readers (find,
 * entries, filenames) must only run once all writers are done.
 */
class OccurrenceAccumulator
{
public:
  using SymbolMap = tbb::concurrent_hash_map<std::string, schema::SymbolIndex>;

  OccurrenceAccumulator() = default;

  OccurrenceAccumulator(const OccurrenceAccumulator &) = delete;
  OccurrenceAccumulator & operator=(const OccurrenceAccumulator &) = delete;

  // ===========================================================================
  // Writers (concurrent)
  // ===========================================================================

  /**
   * Record every global occurrence of @p document and its uri.
   *
   * Local symbols and occurrences without a range are skipped. Occurrences
   * are applied in document order.
   */
  void add_document(const semanticdb::TextDocument & document);

  /**
   * Record a definition. The first definition recorded for a symbol wins;
   * later ones are dropped without notice (a JVM and a JS build of the same
   * source both define the same symbols).
   *
   * The defining file also gets a (possibly empty) entry in the reference map.
   */
  void add_definition(const std::string & symbol, const schema::Position & position);

  /// Append @p range to the references of @p symbol in @p filename.
  void add_reference(
    const std::string & filename, const schema::Range & range, const std::string & symbol);

  void record_filename(const std::string & filename);

  // ===========================================================================
  // Readers (after accumulation)
  // ===========================================================================

  [[nodiscard]] const SymbolMap & entries() const noexcept { return symbols_; }

  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

  /// Snapshot of the entry for @p symbol, if any occurrence was recorded.
  [[nodiscard]] std::optional<schema::SymbolIndex> find(const std::string & symbol) const;

  /// Every filename recorded so far, sorted.
  [[nodiscard]] std::vector<std::string> filenames() const;

private:
  SymbolMap symbols_;
  tbb::concurrent_unordered_set<std::string> filenames_;
};

}  // namespace metadoc
