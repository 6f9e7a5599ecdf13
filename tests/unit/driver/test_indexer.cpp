// test_indexer.cpp - End-to-end tests for the indexing driver
//
#include <gtest/gtest.h>

#include <filesystem>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "metadoc/driver/indexer.hpp"
#include "metadoc/index/index_reader.hpp"
#include "metadoc/index/index_writer.hpp"
#include "metadoc/index/scanner.hpp"
#include "metadoc/test_support/document_builders.hpp"

namespace fs = std::filesystem;

using metadoc::IndexOptions;
using metadoc::IndexReader;
using metadoc::Indexer;
using metadoc::test_support::DocumentBuilder;
using metadoc::test_support::RecordingProgress;
using metadoc::test_support::ScopedTempDir;
using metadoc::test_support::wrap;
using metadoc::test_support::write_file;
using metadoc::test_support::write_semanticdb;

namespace
{

/// Two-file project: A.scala defines pkg.Foo#, B.scala references it.
fs::path write_sample_classpath(const fs::path & root)
{
  const fs::path classes = root / "classes";
  const fs::path meta = classes / "META-INF" / "semanticdb";

  write_semanticdb(
    meta / "A.scala.semanticdb", wrap(DocumentBuilder("A.scala")
                                        .define("pkg.Foo#", {1, 6, 1, 9})
                                        .reference("pkg.Bar.", {2, 2, 2, 5})
                                        .define("local0", {3, 4, 3, 5})
                                        .build()));
  write_semanticdb(
    meta / "B.scala.semanticdb",
    wrap(DocumentBuilder("B.scala").reference("pkg.Foo#", {5, 10, 5, 13}).build()));
  return classes;
}

/// Fails as soon as the indexing phase starts.
class FailingProgress final : public metadoc::ProgressObserver
{
public:
  void start_task(std::string_view task, size_t /*length*/) override
  {
    if (task == Indexer::k_index_task_name) {
      throw std::runtime_error("observer failed");
    }
  }
  void tick(std::string_view /*task*/, size_t /*done*/) override {}
  void complete_task(std::string_view /*task*/, bool /*success*/) override {}
};

IndexOptions options_for(const fs::path & classpath, const fs::path & target)
{
  IndexOptions options;
  options.target = target;
  options.classpath = {classpath};
  options.threads = 1;
  return options;
}

}  // namespace

// =============================================================================
// Directory target
// =============================================================================

TEST(IndexerTest, GeneratesSiteForTwoDocuments)
{
  const ScopedTempDir dir("metadoc_indexer");
  const fs::path target = dir.path() / "site";
  RecordingProgress progress;

  const auto result = Indexer::run(options_for(write_sample_classpath(dir.path()), target), progress);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.files_scanned, 2U);
  EXPECT_EQ(result.documents_indexed, 2U);
  EXPECT_EQ(result.symbols_published, 1U);
  EXPECT_EQ(result.output, fs::absolute(target));

  const std::vector<std::string> phases{
    std::string(metadoc::MetadataScanner::k_task_name), std::string(Indexer::k_index_task_name),
    std::string(metadoc::IndexWriter::k_task_name)};
  EXPECT_EQ(progress.started, phases);
  EXPECT_EQ(progress.completed, phases);

  const IndexReader reader(target);
  const auto foo = reader.read_symbol("pkg.Foo#");
  ASSERT_TRUE(foo.has_value());
  EXPECT_EQ(foo->definition().filename(), "A.scala");
  EXPECT_EQ(foo->definition().start_line(), 1);
  ASSERT_EQ(foo->references_size(), 2);
  EXPECT_EQ(foo->references().at("A.scala").ranges_size(), 0);
  ASSERT_EQ(foo->references().at("B.scala").ranges_size(), 1);
  EXPECT_EQ(foo->references().at("B.scala").ranges(0).start_line(), 5);

  // Referenced but never defined.
  EXPECT_FALSE(reader.read_symbol("pkg.Bar.").has_value());
  EXPECT_FALSE(reader.read_symbol("local0").has_value());

  const auto workspace = reader.read_workspace();
  ASSERT_EQ(workspace.filenames_size(), 2);
  EXPECT_EQ(workspace.filenames(0), "A.scala");
  EXPECT_EQ(workspace.filenames(1), "B.scala");

  EXPECT_TRUE(reader.read_document("A.scala").has_value());
  EXPECT_TRUE(reader.read_document("B.scala").has_value());
}

TEST(IndexerTest, ParallelRunMatchesSequentialRun)
{
  const ScopedTempDir dir("metadoc_indexer");
  const fs::path meta = dir.path() / "classes";
  for (int i = 0; i < 40; ++i) {
    const std::string uri = "F" + std::to_string(i) + ".scala";
    DocumentBuilder builder(uri);
    builder.define("p.T" + std::to_string(i) + "#", {0, 0, 0, 1});
    builder.reference("p.Shared#", {i, 0, i, 1});
    if (i == 0) {
      builder.define("p.Shared#", {9, 0, 9, 1});
    }
    write_semanticdb(meta / (uri + ".semanticdb"), wrap(builder.build()));
  }

  metadoc::NullProgress progress;
  IndexOptions sequential = options_for(meta, dir.path() / "seq");
  IndexOptions parallel = options_for(meta, dir.path() / "par");
  parallel.threads = 4;

  const auto a = Indexer::run(sequential, progress);
  const auto b = Indexer::run(parallel, progress);
  ASSERT_TRUE(a.success);
  ASSERT_TRUE(b.success);
  EXPECT_EQ(a.symbols_published, 41U);
  EXPECT_EQ(b.symbols_published, a.symbols_published);

  const auto shared_a = IndexReader(dir.path() / "seq").read_symbol("p.Shared#");
  const auto shared_b = IndexReader(dir.path() / "par").read_symbol("p.Shared#");
  ASSERT_TRUE(shared_a.has_value());
  ASSERT_TRUE(shared_b.has_value());
  EXPECT_EQ(shared_a->references_size(), 40);
  EXPECT_EQ(shared_b->references_size(), 40);
  EXPECT_EQ(shared_b->definition().filename(), "F0.scala");
}

TEST(IndexerTest, SequentialReplayKeepsFirstDefinition)
{
  const ScopedTempDir dir("metadoc_indexer");
  const fs::path classes = dir.path() / "classes";
  write_semanticdb(
    classes / "A.semanticdb",
    wrap(DocumentBuilder("A.scala").define("pkg.Dup#", {1, 6, 1, 9}).build()));
  write_semanticdb(
    classes / "B.semanticdb",
    wrap(DocumentBuilder("B.scala").define("pkg.Dup#", {7, 6, 7, 9}).build()));

  metadoc::NullProgress progress;
  const auto result = Indexer::run(options_for(classes, dir.path() / "site"), progress);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.symbols_published, 1U);

  const auto dup = IndexReader(dir.path() / "site").read_symbol("pkg.Dup#");
  ASSERT_TRUE(dup.has_value());
  EXPECT_EQ(dup->definition().filename(), "A.scala");
  EXPECT_EQ(dup->definition().start_line(), 1);
  EXPECT_EQ(dup->references().count("B.scala"), 0U);
}

TEST(IndexerTest, ManyCompanionPairsArePublishedOnce)
{
  constexpr int k_pairs = 2000;

  const ScopedTempDir dir("metadoc_indexer");
  const fs::path classes = dir.path() / "classes";
  DocumentBuilder builder("Big.scala");
  for (int i = 0; i < k_pairs; ++i) {
    const std::string name = "p.T" + std::to_string(i);
    builder.define(name + "#", {i, 6, i, 8});
    builder.reference(name + ".", {i, 20, i, 22});
  }
  write_semanticdb(classes / "Big.scala.semanticdb", wrap(builder.build()));

  RecordingProgress progress;
  auto options = options_for(classes, dir.path() / "site");
  options.threads = 4;
  const auto result = Indexer::run(options, progress);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.symbols_published, static_cast<size_t>(k_pairs));

  std::set<std::string> records;
  for (const auto & file : fs::directory_iterator(dir.path() / "site" / metadoc::k_symbol_dir)) {
    records.insert(file.path().filename().string());
  }
  EXPECT_EQ(records.size(), static_cast<size_t>(k_pairs));
}

// =============================================================================
// Failures
// =============================================================================

TEST(IndexerTest, UndecodableFileIsSkippedWithWarning)
{
  const ScopedTempDir dir("metadoc_indexer");
  const fs::path classes = write_sample_classpath(dir.path());
  const fs::path broken = classes / "META-INF" / "semanticdb" / "C.scala.semanticdb.json";
  write_file(broken, "{ not json");

  metadoc::NullProgress progress;
  const auto result = Indexer::run(options_for(classes, dir.path() / "site"), progress);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.files_scanned, 3U);
  EXPECT_EQ(result.documents_indexed, 2U);

  ASSERT_EQ(result.diagnostics.warnings().size(), 1U);
  const auto warning = result.diagnostics.warnings().front();
  EXPECT_EQ(warning.code, "W001");
  ASSERT_TRUE(warning.subject.has_value());
  EXPECT_EQ(fs::path(*warning.subject), broken);
  EXPECT_FALSE(warning.notes.empty());
  EXPECT_LE(warning.notes.size(), 10U);

  EXPECT_TRUE(IndexReader(dir.path() / "site").read_symbol("pkg.Foo#").has_value());
}

TEST(IndexerTest, UnsafeDocumentUriIsSkippedWithWarning)
{
  const ScopedTempDir dir("metadoc_indexer");
  const fs::path classes = dir.path() / "classes";
  write_semanticdb(
    classes / "Evil.scala.semanticdb",
    wrap(DocumentBuilder("../../Evil.scala").define("e.Evil#", {0, 0, 0, 1}).build()));

  metadoc::NullProgress progress;
  const auto result = Indexer::run(options_for(classes, dir.path() / "site"), progress);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.diagnostics.warnings().size(), 1U);
  EXPECT_EQ(result.symbols_published, 0U);
  EXPECT_FALSE(fs::exists(dir.path() / "Evil.scala.semanticdb"));
}

TEST(IndexerTest, MissingClasspathRootIsAnError)
{
  const ScopedTempDir dir("metadoc_indexer");
  RecordingProgress progress;
  const auto result =
    Indexer::run(options_for(dir.path() / "nope", dir.path() / "site"), progress);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
  EXPECT_EQ(progress.failed.size(), 1U);
}

TEST(IndexerTest, MissingTargetIsAnError)
{
  metadoc::NullProgress progress;
  const auto result = Indexer::run(IndexOptions{}, progress);
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.errors().size(), 1U);
  EXPECT_NE(result.diagnostics.errors().front().message.find("--target"), std::string::npos);
}

TEST(IndexerTest, ThreadCountAboveIntRangeIsAnError)
{
  const ScopedTempDir dir("metadoc_indexer");
  metadoc::NullProgress progress;
  auto options = options_for(write_sample_classpath(dir.path()), dir.path() / "site");
  options.threads = static_cast<unsigned>(std::numeric_limits<int>::max()) + 1U;

  const auto result = Indexer::run(options, progress);
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.errors().size(), 1U);
  EXPECT_NE(result.diagnostics.errors().front().message.find("thread"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir.path() / "site"));
}

TEST(IndexerTest, UnexpectedFailureIsReportedAsError)
{
  const ScopedTempDir dir("metadoc_indexer");
  FailingProgress progress;
  const auto result =
    Indexer::run(options_for(write_sample_classpath(dir.path()), dir.path() / "site"), progress);
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.errors().size(), 1U);
  const auto error = result.diagnostics.errors().front();
  EXPECT_EQ(error.code, "E002");
  ASSERT_FALSE(error.notes.empty());
  EXPECT_EQ(error.notes.front(), "observer failed");
}

// =============================================================================
// Target handling
// =============================================================================

TEST(IndexerTest, CleanTargetFirstRemovesStaleFiles)
{
  const ScopedTempDir dir("metadoc_indexer");
  const fs::path target = dir.path() / "site";
  write_file(target / "stale.txt", "old");

  metadoc::NullProgress progress;
  auto options = options_for(write_sample_classpath(dir.path()), target);

  ASSERT_TRUE(Indexer::run(options, progress).success);
  EXPECT_TRUE(fs::exists(target / "stale.txt"));

  options.clean_target_first = true;
  ASSERT_TRUE(Indexer::run(options, progress).success);
  EXPECT_FALSE(fs::exists(target / "stale.txt"));
  EXPECT_TRUE(fs::exists(target / metadoc::k_workspace_file));
}

TEST(IndexerTest, ZipModeWritesSingleArchive)
{
  const ScopedTempDir dir("metadoc_indexer");
  const fs::path target = dir.path() / "site";

  metadoc::NullProgress progress;
  auto options = options_for(write_sample_classpath(dir.path()), target);
  options.zip = true;

  const auto result = Indexer::run(options, progress);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, fs::absolute(target) / Indexer::k_zip_file_name);
  EXPECT_TRUE(fs::is_regular_file(result.output));
  EXPECT_FALSE(fs::exists(target / metadoc::k_workspace_file));
  EXPECT_FALSE(fs::exists(target / metadoc::k_symbol_dir));
}

TEST(IndexerTest, OptionsFromConfig)
{
  metadoc::ProjectConfig config;
  config.target = "/tmp/site";
  config.classpath = {"/tmp/classes"};
  config.zip = true;
  config.threads = 3;

  const auto options = IndexOptions::from_config(config);
  EXPECT_EQ(options.target, fs::path("/tmp/site"));
  ASSERT_EQ(options.classpath.size(), 1U);
  EXPECT_TRUE(options.zip);
  EXPECT_FALSE(options.clean_target_first);
  EXPECT_EQ(options.threads, 3U);
}
