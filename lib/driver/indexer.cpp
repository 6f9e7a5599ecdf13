// metadoc/driver/indexer.cpp - Indexing driver implementation
//
#include "metadoc/driver/indexer.hpp"

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <atomic>
#include <exception>
#include <limits>
#include <memory>
#include <mutex>
#include <system_error>

#include "metadoc/basic/errors.hpp"
#include "metadoc/index/accumulator.hpp"
#include "metadoc/index/document_parser.hpp"
#include "metadoc/index/index_writer.hpp"
#include "metadoc/index/reconciler.hpp"
#include "metadoc/index/scanner.hpp"
#include "metadoc/output/directory_sink.hpp"
#include "metadoc/output/zip_sink.hpp"

namespace fs = std::filesystem;

namespace metadoc
{

namespace
{

/// Nested causes reported for a file that failed to decode.
constexpr size_t k_max_cause_depth = 10;

void collect_causes(const std::exception & e, std::vector<std::string> & out)
{
  out.emplace_back(e.what());
  if (out.size() >= k_max_cause_depth) {
    return;
  }
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception & nested) {
    collect_causes(nested, out);
  }
}

/// Decode failures reported from worker threads.
class DecodeLog
{
public:
  explicit DecodeLog(DiagnosticBag & diags) : diags_(diags) {}

  void skipped(const fs::path & file, const std::exception & e)
  {
    std::vector<std::string> causes;
    collect_causes(e, causes);

    const std::lock_guard<std::mutex> lock(mutex_);
    auto builder = diags_.report_warning("failed to decode semantic metadata");
    builder.with_code("W001").with_subject(file.string()).with_help("the file was skipped");
    for (auto & cause : causes) {
      builder.with_note(std::move(cause));
    }
  }

private:
  DiagnosticBag & diags_;
  std::mutex mutex_;
};

template <typename Fn>
void for_each_index(size_t n, bool sequential, const Fn & fn)
{
  if (sequential) {
    for (size_t i = 0; i < n; ++i) {
      fn(i);
    }
    return;
  }
  tbb::parallel_for(size_t{0}, n, fn);
}

void prepare_target(const fs::path & target, bool clean_first)
{
  std::error_code ec;
  if (clean_first && fs::exists(target, ec)) {
    fs::remove_all(target, ec);
    if (ec) {
      throw WriteError("cannot clean " + target.string() + ": " + ec.message());
    }
  }
  fs::create_directories(target, ec);
  if (ec) {
    throw WriteError("cannot create " + target.string() + ": " + ec.message());
  }
}

struct Pipeline
{
  const IndexOptions & options;
  ProgressObserver & progress;
  OutputSink & sink;
  IndexResult & result;

  void run()
  {
    const bool sequential = options.threads == 1;

    // 1. Scan
    const MetadataScanner scanner(progress);
    const std::vector<fs::path> files = scanner.scan(options.classpath);
    result.files_scanned = files.size();

    // 2. Decode + accumulate
    OccurrenceAccumulator accumulator;
    IndexWriter writer(sink, progress);
    DecodeLog log(result.diagnostics);
    std::atomic<size_t> documents{0};
    std::atomic<size_t> done{0};

    progress.start_task(Indexer::k_index_task_name, files.size());
    try {
      for_each_index(files.size(), sequential, [&](size_t i) {
        const fs::path & file = files[i];
        try {
          const semanticdb::TextDocuments docs = DocumentParser::parse_file(file);
          for (const auto & document : docs.documents()) {
            writer.write_document(document);
            accumulator.add_document(document);
            ++documents;
          }
        } catch (const DecodeError & e) {
          log.skipped(file, e);
        }
        progress.tick(Indexer::k_index_task_name, ++done);
      });
    } catch (...) {
      progress.complete_task(Indexer::k_index_task_name, false);
      throw;
    }
    progress.complete_task(Indexer::k_index_task_name, true);
    result.documents_indexed = documents.load();

    // 3. Reconcile (accumulation is complete; the map is read-only from here)
    const NamespaceReconciler reconciler(accumulator);
    const std::vector<schema::SymbolIndex> published = reconciler.run();

    // 4. Symbol records
    writer.write_symbols(published);
    result.symbols_published = published.size();

    // 5. Workspace manifest
    writer.write_workspace(accumulator.filenames());
  }
};

}  // namespace

IndexOptions IndexOptions::from_config(const ProjectConfig & config)
{
  IndexOptions options;
  if (config.target) {
    options.target = *config.target;
  }
  options.classpath = config.classpath;
  options.zip = config.zip;
  options.clean_target_first = config.clean_target_first;
  options.threads = config.threads;
  return options;
}

IndexResult Indexer::run(const IndexOptions & options, ProgressObserver & progress)
{
  IndexResult result;

  if (options.target.empty()) {
    result.diagnostics.report_error("--target is required");
    return result;
  }

  if (options.threads > static_cast<unsigned>(std::numeric_limits<int>::max())) {
    result.diagnostics.report_error("thread count out of range")
      .with_note(std::to_string(options.threads) + " exceeds " +
                 std::to_string(std::numeric_limits<int>::max()));
    return result;
  }

  const fs::path target = fs::absolute(options.target);

  try {
    prepare_target(target, options.clean_target_first);

    std::unique_ptr<OutputSink> sink;
    if (options.zip) {
      sink = std::make_unique<ZipSink>(target / k_zip_file_name);
    } else {
      sink = std::make_unique<DirectorySink>(target);
    }
    result.output = sink->location();

    tbb::task_arena arena(
      options.threads == 0 ? tbb::task_arena::automatic : static_cast<int>(options.threads));
    arena.execute([&] {
      Pipeline pipeline{options, progress, *sink, result};
      pipeline.run();
    });

    sink->close();
    result.success = !result.diagnostics.has_errors();
  } catch (const fs::filesystem_error & e) {
    result.diagnostics.report_error("cannot scan classpath")
      .with_code("E001")
      .with_subject(e.path1().string())
      .with_note(e.code().message());
  } catch (const WriteError & e) {
    result.diagnostics.report_error("failed to write site")
      .with_code("E002")
      .with_subject(target.string())
      .with_note(e.what());
  } catch (const std::exception & e) {
    result.diagnostics.report_error("indexing failed")
      .with_code("E002")
      .with_subject(target.string())
      .with_note(e.what());
  }

  return result;
}

}  // namespace metadoc
