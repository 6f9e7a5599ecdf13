// test_reconciler.cpp - Tests for term/type namespace reconciliation
//
#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "metadoc/index/accumulator.hpp"
#include "metadoc/index/reconciler.hpp"
#include "metadoc/test_support/document_builders.hpp"

using metadoc::NamespaceReconciler;
using metadoc::OccurrenceAccumulator;
using metadoc::test_support::DocumentBuilder;
using metadoc::test_support::make_position;
using metadoc::test_support::make_range;

namespace
{

std::vector<std::string> symbols_of(const std::vector<metadoc::schema::SymbolIndex> & entries)
{
  std::vector<std::string> out;
  out.reserve(entries.size());
  for (const auto & e : entries) {
    out.push_back(e.symbol());
  }
  return out;
}

}  // namespace

// =============================================================================
// Type with definition, term with references only
// =============================================================================

TEST(ReconcilerTest, TypeAbsorbsTermReferences)
{
  OccurrenceAccumulator acc;
  acc.add_definition("a.A#", make_position("A.scala", {0, 6, 0, 7}));
  acc.add_reference("B.scala", make_range({1, 0, 1, 1}), "a.A#");
  acc.add_reference("B.scala", make_range({4, 2, 4, 3}), "a.A.");
  acc.add_reference("C.scala", make_range({9, 0, 9, 1}), "a.A.");

  const NamespaceReconciler reconciler(acc);
  const auto published = reconciler.run();

  // The term is folded into the type and not published on its own.
  ASSERT_EQ(symbols_of(published), std::vector<std::string>{"a.A#"});

  const auto & entry = published.front();
  EXPECT_EQ(entry.definition().filename(), "A.scala");

  // Union per file: the type's own ranges first, then the term's.
  const auto & b = entry.references().at("B.scala");
  ASSERT_EQ(b.ranges_size(), 2);
  EXPECT_EQ(b.ranges(0).start_line(), 1);
  EXPECT_EQ(b.ranges(1).start_line(), 4);
  EXPECT_EQ(entry.references().at("C.scala").ranges_size(), 1);
  EXPECT_EQ(entry.references().at("A.scala").ranges_size(), 0);
}

TEST(ReconcilerTest, TermBorrowsTypeDefinition)
{
  OccurrenceAccumulator acc;
  acc.add_definition("a.A#", make_position("A.scala", {0, 6, 0, 7}));
  acc.add_reference("B.scala", make_range({4, 2, 4, 3}), "a.A.");

  const NamespaceReconciler reconciler(acc);
  const auto term = acc.find("a.A.");
  ASSERT_TRUE(term.has_value());
  EXPECT_TRUE(reconciler.is_absorbed(*term));

  const auto view = reconciler.reconcile(*term);
  ASSERT_TRUE(view.has_definition());
  EXPECT_EQ(view.definition().filename(), "A.scala");
  EXPECT_EQ(view.references().at("B.scala").ranges_size(), 1);
}

// =============================================================================
// Both halves defined
// =============================================================================

TEST(ReconcilerTest, BothDefinedArePublishedUnchanged)
{
  OccurrenceAccumulator acc;
  acc.add_definition("a.A#", make_position("A.scala", {0, 6, 0, 7}));
  acc.add_definition("a.A.", make_position("A.scala", {5, 7, 5, 8}));
  acc.add_reference("B.scala", make_range({1, 0, 1, 1}), "a.A#");
  acc.add_reference("B.scala", make_range({2, 0, 2, 1}), "a.A.");

  const NamespaceReconciler reconciler(acc);
  const auto published = reconciler.run();

  const std::vector<std::string> expected{"a.A#", "a.A."};
  ASSERT_EQ(symbols_of(published), expected);

  EXPECT_EQ(published[0].references().at("B.scala").ranges_size(), 1);
  EXPECT_EQ(published[0].definition().start_line(), 0);
  EXPECT_EQ(published[1].references().at("B.scala").ranges_size(), 1);
  EXPECT_EQ(published[1].definition().start_line(), 5);
}

// =============================================================================
// Nothing to reconcile
// =============================================================================

TEST(ReconcilerTest, UndefinedSymbolsAreNotPublished)
{
  OccurrenceAccumulator acc;
  acc.add_reference("B.scala", make_range({1, 0, 1, 1}), "scala.Int#");
  acc.add_reference("B.scala", make_range({1, 0, 1, 1}), "scala.Int.");
  acc.add_reference("B.scala", make_range({2, 0, 2, 1}), "scala.Predef.println(+1).");

  const NamespaceReconciler reconciler(acc);
  EXPECT_TRUE(reconciler.run().empty());
}

TEST(ReconcilerTest, TermDefinitionDoesNotLendToType)
{
  OccurrenceAccumulator acc;
  acc.add_definition("a.A.", make_position("A.scala", {0, 7, 0, 8}));
  acc.add_reference("B.scala", make_range({1, 0, 1, 1}), "a.A#");

  const NamespaceReconciler reconciler(acc);
  const auto published = reconciler.run();
  ASSERT_EQ(symbols_of(published), std::vector<std::string>{"a.A."});
  EXPECT_EQ(published.front().references().count("B.scala"), 0U);
}

TEST(ReconcilerTest, MethodsAreNotSiblings)
{
  OccurrenceAccumulator acc;
  acc.add_definition("a.A#foo#", make_position("A.scala", {0, 0, 0, 1}));
  acc.add_reference("B.scala", make_range({1, 0, 1, 1}), "a.A#foo().");

  const NamespaceReconciler reconciler(acc);
  const auto published = reconciler.run();
  ASSERT_EQ(published.size(), 1U);
  EXPECT_EQ(published.front().references().count("B.scala"), 0U);
}

TEST(ReconcilerTest, OutputIsSortedBySymbol)
{
  OccurrenceAccumulator acc;
  for (const char * symbol : {"c.C#", "a.A#", "b.B.", "a.A#x."}) {
    acc.add_definition(symbol, make_position("X.scala", {0, 0, 0, 1}));
  }

  const NamespaceReconciler reconciler(acc);
  const std::vector<std::string> expected{"a.A#", "a.A#x.", "b.B.", "c.C#"};
  EXPECT_EQ(symbols_of(reconciler.run()), expected);
}

TEST(ReconcilerTest, LargeMapPublishesEachSymbolOnce)
{
  constexpr int k_pairs = 5000;

  OccurrenceAccumulator acc;
  for (int i = 0; i < k_pairs; ++i) {
    const std::string name = "p.T" + std::to_string(i);
    acc.add_document(DocumentBuilder("T" + std::to_string(i) + ".scala")
                       .define(name + "#", {0, 6, 0, 8})
                       .reference(name + ".", {3, 0, 3, 2})
                       .build());
  }
  ASSERT_EQ(acc.size(), static_cast<size_t>(2 * k_pairs));

  const NamespaceReconciler reconciler(acc);
  const auto published = reconciler.run();
  ASSERT_EQ(published.size(), static_cast<size_t>(k_pairs));

  const auto symbols = symbols_of(published);
  const std::set<std::string> distinct(symbols.begin(), symbols.end());
  EXPECT_EQ(distinct.size(), symbols.size());
  for (const auto & entry : published) {
    EXPECT_EQ(entry.symbol().back(), '#') << entry.symbol();
    EXPECT_EQ(entry.references_size(), 1) << entry.symbol();
  }
}
