#include "mat2nwb/converter.hpp"
#include "mat2nwb/diagnostics.hpp"
#include "mat2nwb/errors.hpp"
#include "mat2nwb/file_name_meta.hpp"
#include "mat2nwb/utils.hpp"
#include "mat2nwb/version.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mat2nwb;

namespace {

struct Args {
  std::string source_path;
  ConvertOptions convert;
  bool yes{false};
  bool quiet{false};
};

static void print_help() {
  std::cout
    << "mat2nwb_convert_cli\n\n"
    << "Convert a MATLAB .mat session file (v5/v7 or v7.3) into an NWB 2.x file.\n"
    << "Every top-level struct becomes a TimeSeries under /acquisition.\n\n"
    << "Usage:\n"
    << "  mat2nwb_convert_cli <source.mat> [session-description] [experimenter-name] [options]\n\n"
    << "The source file name must follow animal_[signal_]session_tag.mat, e.g.\n"
    << "  mouse1_VLS_42_control.mat  ->  mouse1_VLS_42_control.nwb\n\n"
    << "Options:\n"
    << "  --outdir DIR             Output directory (default: current directory)\n"
    << "  --institution TEXT       Institution (default: Whitehead Institute)\n"
    << "  --compression N          Deflate level for data, 0-9 (default: 3; 0 = off)\n"
    << "  -y, --yes                Overwrite an existing output file without asking\n"
    << "  -q, --quiet              Only print warnings, skipped channels and errors\n"
    << "  --version                Print version and exit\n"
    << "  -h, --help               Show this help\n\n"
    << "Exit codes: 0 success, 1 conversion failed or cancelled, 2 usage error\n";
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw UsageError("Missing value for " + flag);
  return std::string(argv[++i]);
}

static Args parse_args(int argc, char** argv) {
  Args a;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "mat2nwb_convert_cli " << version_string() << " (NWB " << nwb_schema_version()
                << ")\n";
      std::exit(0);
    } else if (arg == "--outdir") {
      a.convert.output_dir = require_value(i, argc, argv, arg);
    } else if (arg == "--institution") {
      a.convert.institution = require_value(i, argc, argv, arg);
    } else if (arg == "--compression") {
      const std::string v = require_value(i, argc, argv, arg);
      int level = 0;
      try {
        level = to_int(v);
      } catch (const std::exception&) {
        throw UsageError("Invalid --compression value: " + v);
      }
      if (level < 0 || level > 9) throw UsageError("--compression must be between 0 and 9");
      a.convert.compression_level = level;
    } else if (arg == "-y" || arg == "--yes") {
      a.yes = true;
    } else if (arg == "-q" || arg == "--quiet") {
      a.quiet = true;
    } else if (!arg.empty() && arg[0] == '-' && arg.size() > 1) {
      throw UsageError("Unknown argument: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) throw UsageError("Missing required argument: <source.mat>");
  if (positional.size() > 3) throw UsageError("Too many arguments: " + positional[3]);
  a.source_path = positional[0];
  if (positional.size() >= 2) a.convert.session_description = positional[1];
  if (positional.size() >= 3) a.convert.experimenter = positional[2];
  return a;
}

// y/Y confirms; anything else (including EOF) declines.
static bool confirm_overwrite(const std::string& path) {
  std::cout << "File " << path << " already exists. Overwrite? (y/n): " << std::flush;
  std::string line;
  if (!std::getline(std::cin, line)) return false;
  const std::string answer = trim(line);
  return answer == "y" || answer == "Y";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc <= 1) {
      print_help();
      return 2;
    }
    const Args args = parse_args(argc, argv);

    if (!file_exists(args.source_path)) throw SourceNotFound(args.source_path);

    const FileNameParts parts = parse_file_name(args.source_path);
    const std::string out_path = output_path_for(parts, args.convert);
    if (file_exists(out_path) && !args.yes) {
      if (!confirm_overwrite(out_path)) {
        std::cout << "Conversion cancelled.\n";
        return 1;
      }
    }

    const ConversionResult result = convert_mat_to_nwb(args.source_path, args.convert);
    render_diagnostics(std::cout, std::cerr, result.diagnostics, !args.quiet);

    std::cout << "\nConverted " << result.written.size() << " channel(s), skipped "
              << result.skipped.size() << "\n";
    if (!result.ok()) {
      std::cerr << "Error: NWB export failed; no output file was written\n";
      return 1;
    }
    std::cout << "Successfully exported NWB file to: " << result.nwb_path << "\n";
    return 0;
  } catch (const UsageError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << "Run with --help for usage.\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
