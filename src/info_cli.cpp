#include "mat2nwb/diagnostics.hpp"
#include "mat2nwb/field_classifier.hpp"
#include "mat2nwb/name_deriver.hpp"
#include "mat2nwb/reader.hpp"
#include "mat2nwb/utils.hpp"

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace mat2nwb;

namespace {

struct Args {
  std::string input_path;

  // Also run the channel classifier and print the conversion plan.
  bool classify{false};

  // Limit the sub-fields described per variable (0 => all).
  std::size_t max_fields{0};
};

static void print_help() {
  std::cout
    << "mat2nwb_info_cli\n\n"
    << "Print the contents of a MATLAB .mat file (v5/v7 or v7.3): format version,\n"
    << "top-level variables and their sub-fields. With --classify, also show how\n"
    << "mat2nwb_convert_cli would map each variable to an NWB TimeSeries.\n\n"
    << "Usage:\n"
    << "  mat2nwb_info_cli --input file.mat\n"
    << "  mat2nwb_info_cli --input file.mat --classify\n\n"
    << "Options:\n"
    << "  --input PATH             Input .mat file\n"
    << "  --classify               Print output names, fields used and sampling mode\n"
    << "  --max-fields N           Limit described sub-fields per variable (0 => all; default: 0)\n"
    << "  -h, --help               Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--classify") {
      a.classify = true;
    } else if (arg == "--max-fields" && i + 1 < argc) {
      const int n = to_int(argv[++i]);
      if (n < 0) throw std::runtime_error("--max-fields must be >= 0");
      a.max_fields = static_cast<std::size_t>(n);
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static void print_plan(const RecordSet& records) {
  const std::string prefix = common_name_prefix(collect_naming_keys(records));
  std::cout << "\nCommon name prefix: " << (prefix.empty() ? "(none)" : "'" + prefix + "'") << "\n";

  for (const auto& r : records) {
    ClassificationResult cr = classify_channel(r);
    if (cr.skipped()) {
      render_diagnostics(std::cout, cr.diagnostics);
      continue;
    }
    const ClassifiedChannel& ch = *cr.channel;
    const std::string out = derive_output_name(ch.description, prefix);
    std::cout << "\n" << r.name << " -> /acquisition/" << out << "\n";
    if (ch.time_field) std::cout << "  time field:  " << *ch.time_field << "\n";
    if (ch.value_field) {
      std::cout << "  data field:  " << *ch.value_field << (ch.used_fallback ? " (fallback)" : "")
                << "\n";
    }
    std::cout << "  data shape:  " << format_dims(ch.data.dims) << " (" << mat_class_name(ch.data_class)
              << ", time along axis " << ch.time_axis << ")\n";
    if (ch.sampling.is_regular) {
      std::cout << "  sampling:    regular, " << ch.sampling.sampling_rate_hz << " Hz from t="
                << ch.sampling.start_time << "\n";
    } else {
      std::cout << "  sampling:    irregular, " << ch.sampling.timestamps.size() << " timestamps\n";
    }
    for (const auto& d : cr.diagnostics) {
      if (d.severity == Severity::kInfo) continue;
      std::cout << "  " << severity_label(d.severity) << ": " << d.message << "\n";
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.input_path.empty()) {
      print_help();
      return 2;
    }

    if (!file_exists(args.input_path)) {
      throw std::runtime_error("File not found: " + args.input_path);
    }

    const MatFormat fmt = detect_mat_format(args.input_path);
    const RecordSet records = read_mat_file_auto(args.input_path);

    std::cout << "File:      " << args.input_path << "\n";
    std::cout << "Format:    " << mat_format_name(fmt) << "\n";
    std::cout << "Variables: " << records.size() << "\n";

    for (const auto& r : records) {
      std::cout << "\n" << r.name << ": " << describe_value(r.value) << "\n";
      if (!r.value.is_struct()) continue;
      for (const auto& line : describe_fields(r.value, args.max_fields)) {
        std::cout << "  " << line << "\n";
      }
    }

    if (args.classify) print_plan(records);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
