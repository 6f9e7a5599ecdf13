// metadoc - Symbol index generator Command Line Interface
//
// Usage:
//   metadoc [index] --target <dir> [options] <classpath>...
//   metadoc lookup --target <dir> <symbol>
//
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <nlohmann/json.hpp>

#include "metadoc/basic/diagnostic_printer.hpp"
#include "metadoc/basic/errors.hpp"
#include "metadoc/basic/term_display.hpp"
#include "metadoc/driver/indexer.hpp"
#include "metadoc/index/index_reader.hpp"
#include "metadoc/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

#ifdef _WIN32
constexpr char k_path_separator = ';';
#else
constexpr char k_path_separator = ':';
#endif

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "metadoc v0.1.0\n\n"
            << "Usage: " << program_name << " [index] --target <dir> [options] <classpath>...\n"
            << "       " << program_name << " lookup --target <dir> <symbol>\n\n"
            << "Commands:\n"
            << "  index                    Generate a site from semantic metadata (default)\n"
            << "  lookup <symbol>          Print the record of a symbol in a generated site\n\n"
            << "Options:\n"
            << "  -t, --target <dir>       Output directory of the site\n"
            << "  --clean-target-first     Remove the target directory before writing\n"
            << "  --zip                    Write <target>/metadoc.zip instead of a directory\n"
            << "  --non-interactive        Disable the in-place progress bar\n"
            << "  -j, --threads <n>        Worker threads (0 = one per core)\n"
            << "  --config <path>          Use this metadoc.yaml instead of searching for one\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const metadoc::DiagnosticBag & diagnostics)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  metadoc::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

nlohmann::json range_to_json(const metadoc::schema::Range & range)
{
  return nlohmann::json{
    {"startLine", range.start_line()},
    {"startCharacter", range.start_character()},
    {"endLine", range.end_line()},
    {"endCharacter", range.end_character()}};
}

nlohmann::json symbol_to_json(const metadoc::schema::SymbolIndex & entry)
{
  nlohmann::json out;
  out["symbol"] = entry.symbol();
  if (entry.has_definition()) {
    const auto & def = entry.definition();
    out["definition"] = nlohmann::json{
      {"filename", def.filename()},
      {"startLine", def.start_line()},
      {"startCharacter", def.start_character()},
      {"endLine", def.end_line()},
      {"endCharacter", def.end_character()}};
  }

  // Protobuf maps have no stable order; nlohmann::json objects sort keys.
  nlohmann::json references = nlohmann::json::object();
  for (const auto & [filename, ranges] : entry.references()) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto & range : ranges.ranges()) {
      list.push_back(range_to_json(range));
    }
    references[filename] = std::move(list);
  }
  out["references"] = std::move(references);
  return out;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command = "index";
  std::optional<std::string> target;
  std::optional<std::string> config_path;
  std::optional<std::string> threads;
  std::vector<std::string> positional;
  bool clean_target_first = false;
  bool zip = false;
  bool non_interactive = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  int first = 1;
  if (argc >= 2) {
    const std::string head = argv[1];
    if (head == "index" || head == "lookup") {
      args.command = head;
      first = 2;
    }
  }

  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];

    const auto value = [&](std::optional<std::string> & slot) {
      if (i + 1 < argc) {
        slot = argv[++i];
      } else {
        args.error = "missing value for " + arg;
      }
    };

    if (arg == "-t" || arg == "--target") {
      value(args.target);
    } else if (arg == "--config") {
      value(args.config_path);
    } else if (arg == "-j" || arg == "--threads") {
      value(args.threads);
    } else if (arg == "--clean-target-first") {
      args.clean_target_first = true;
    } else if (arg == "--zip") {
      args.zip = true;
    } else if (arg == "--non-interactive") {
      args.non_interactive = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else {
      args.positional.push_back(arg);
    }
  }

  return args;
}

/// Split a classpath argument ("a:b:c") into its entries.
std::vector<fs::path> split_classpath(const std::string & value)
{
  std::vector<fs::path> out;
  size_t begin = 0;
  while (begin <= value.size()) {
    size_t end = value.find(k_path_separator, begin);
    if (end == std::string::npos) {
      end = value.size();
    }
    if (end > begin) {
      out.emplace_back(fs::absolute(value.substr(begin, end - begin)));
    }
    begin = end + 1;
  }
  return out;
}

std::optional<unsigned> parse_threads(const std::string & value)
{
  try {
    size_t consumed = 0;
    const long n = std::stol(value, &consumed);
    if (consumed != value.size() || n < 0 || n > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    return static_cast<unsigned>(n);
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

// ============================================================================
// Commands
// ============================================================================

int cmd_index(const CommandArgs & args)
{
  metadoc::ProjectConfig config;

  std::optional<fs::path> config_path;
  if (args.config_path) {
    config_path = fs::absolute(*args.config_path);
  } else {
    config_path = metadoc::find_project_config(fs::current_path());
  }

  if (config_path) {
    const auto config_result = metadoc::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }
    config = config_result.config;
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  }

  // Command-line options override metadoc.yaml
  if (args.target) {
    config.target = fs::absolute(*args.target);
  }
  if (!args.positional.empty()) {
    config.classpath.clear();
    for (const auto & entry : args.positional) {
      for (auto & path : split_classpath(entry)) {
        config.classpath.push_back(std::move(path));
      }
    }
  }
  if (args.threads) {
    const auto threads = parse_threads(*args.threads);
    if (!threads) {
      std::cerr << "error: invalid thread count '" << *args.threads << "'\n";
      return 1;
    }
    config.threads = *threads;
  }
  config.zip = config.zip || args.zip;
  config.clean_target_first = config.clean_target_first || args.clean_target_first;
  config.non_interactive = config.non_interactive || args.non_interactive;

  if (!config.target) {
    std::cerr << "error: --target is required\n";
    return 1;
  }

  const bool fallback = config.non_interactive || metadoc::TermDisplay::default_fallback_mode();
  metadoc::TermDisplay display(std::cerr, fallback);

  const auto options = metadoc::IndexOptions::from_config(config);
  const auto result = metadoc::Indexer::run(options, display);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Scanned " << result.files_scanned << " files, indexed "
              << result.documents_indexed << " documents, published "
              << result.symbols_published << " symbols\n";
  }

  std::cout << options.target.string() << "\n";
  return 0;
}

int cmd_lookup(const CommandArgs & args)
{
  if (!args.target) {
    std::cerr << "error: --target is required\n";
    return 1;
  }
  if (args.positional.size() != 1) {
    std::cerr << "error: exactly one symbol required\n";
    std::cerr << "usage: metadoc lookup --target <dir> <symbol>\n";
    return 1;
  }

  const metadoc::IndexReader reader(fs::absolute(*args.target));
  const std::string & symbol = args.positional.front();

  try {
    const auto entry = reader.read_symbol(symbol);
    if (!entry) {
      std::cerr << "error: no record for symbol '" << symbol << "'\n";
      return 1;
    }
    std::cout << symbol_to_json(*entry).dump(2) << "\n";
    return 0;
  } catch (const metadoc::DecodeError & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "lookup") {
    return cmd_lookup(args);
  }

  return cmd_index(args);
}
