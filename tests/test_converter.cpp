#include "mat2nwb/converter.hpp"
#include "mat2nwb/errors.hpp"
#include "mat2nwb/utils.hpp"

#include "mat5_fixture.hpp"
#include "test_support.hpp"

#include <H5Cpp.h>

#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace mat2nwb;
using mat2nwb_test::Mat5Builder;

namespace {

class FailingWriter : public IContainerWriter {
public:
  void write(const NwbFile&, const std::string&) override {
    ++calls;
    throw ExportError("disk full");
  }
  int calls{0};
};

bool has_diag(const std::vector<Diagnostic>& diags, Severity s, const std::string& subject,
              const std::string& needle) {
  for (const auto& d : diags) {
    if (d.severity == s && d.subject == subject && mat2nwb_test::contains(d.message, needle)) {
      return true;
    }
  }
  return false;
}

ChannelRecord make_struct(const std::string& name, std::vector<double> times,
                          std::vector<double> values) {
  ChannelRecord r;
  r.name = name;
  r.value.cls = MatClass::kStruct;
  r.value.array.dims = {1, 1};

  MatValue t;
  t.array.dims = {1, times.size()};
  t.array.data = std::move(times);
  MatValue v;
  v.array.dims = {1, values.size()};
  v.array.data = std::move(values);

  r.value.field_names = {"times", "values"};
  r.value.field_values = {t, v};
  return r;
}

std::string read_scalar_string(const H5::H5File& f, const char* path) {
  H5::DataSet ds = f.openDataSet(path);
  H5std_string s;
  ds.read(s, ds.getDataType());
  return s;
}

} // namespace

int main() {
  namespace fs = std::filesystem;
  const std::string src_dir = "test_tmp_conv_src";
  const std::string out_dir = "test_tmp_conv_out";
  fs::remove_all(src_dir);
  fs::remove_all(out_dir);
  ensure_directory(src_dir);

  const std::string src = src_dir + "/m1_VLS_42_control.mat";
  {
    Mat5Builder b;
    b.add(b.struct_array("m1_VLS_ChR2", {{"times", b.row("", {10.0, 10.5, 11.0, 11.5})},
                                         {"values", b.row("", {1.0, 2.0, 3.0, 4.0})}}));
    b.add(b.struct_array("m1_VLS_Lick_times", {{"times", b.row("", {12.0, 12.7, 15.1})},
                                               {"values", b.row("", {1.0, 1.0, 1.0})}}),
          true);
    b.add(b.char_row("m1_VLS_notes", "baseline"));
    b.write(src);
  }

  // End to end.
  {
    ConvertOptions opts;
    opts.output_dir = out_dir;
    opts.experimenter = "Doe, Jane";
    const ConversionResult res = convert_mat_to_nwb(src, opts);

    assert(res.ok());
    assert(res.nwb_path == (fs::path(out_dir) / "m1_VLS_42_control.nwb").string());
    assert(file_exists(res.nwb_path));
    assert((res.written == std::vector<std::string>{"ChR2", "Lick_times"}));
    assert((res.skipped == std::vector<std::string>{"m1_VLS_notes"}));
    assert(has_diag(res.diagnostics, Severity::kInfo, "ChR2", "regular sampling detected"));
    assert(has_diag(res.diagnostics, Severity::kInfo, "ChR2",
                    "STATUS: Successfully added to NWB path /acquisition/ChR2"));
    assert(has_diag(res.diagnostics, Severity::kInfo, "Lick_times", "Time field used: times"));
    assert(has_diag(res.diagnostics, Severity::kSkipped, "m1_VLS_notes", ""));

    H5::H5File f(res.nwb_path, H5F_ACC_RDONLY);
    assert(read_scalar_string(f, "/identifier") == "m1_VLS_42_control");
    assert(read_scalar_string(f, "/general/notes") == "Signal Type: VLS, Tag: control");
    assert(read_scalar_string(f, "/general/session_id") == "42");
    assert(read_scalar_string(f, "/general/subject/subject_id") == "m1");
    assert(mat2nwb_test::contains(read_scalar_string(f, "/session_start_time"), "T00:00:10.000"));

    double start = 0.0;
    double rate = 0.0;
    H5::DataSet st = f.openDataSet("/acquisition/ChR2/starting_time");
    st.read(&start, H5::PredType::NATIVE_DOUBLE);
    st.openAttribute("rate").read(H5::PredType::NATIVE_DOUBLE, &rate);
    assert(start == 10.0);
    assert(rate == 2.0);

    H5::DataSet ts = f.openDataSet("/acquisition/Lick_times/timestamps");
    std::vector<double> t(3);
    ts.read(t.data(), H5::PredType::NATIVE_DOUBLE);
    assert((t == std::vector<double>{12.0, 12.7, 15.1}));
    assert(!f.nameExists("/acquisition/m1_VLS_notes"));
  }

  // Export failures are reported, not thrown.
  {
    const std::string other_out = out_dir + "_failing";
    fs::remove_all(other_out);
    ConvertOptions opts;
    opts.output_dir = other_out;
    FailingWriter w;
    const ConversionResult res = convert_mat_to_nwb(src, opts, &w);
    assert(w.calls == 1);
    assert(!res.ok());
    assert(!file_exists(output_path_for(parse_file_name(src), opts)));
    bool found = false;
    for (const auto& d : res.diagnostics) {
      if (d.severity == Severity::kError && d.message == "Error exporting NWB file:" &&
          d.details.size() == 1 && d.details[0] == "disk full") {
        found = true;
      }
    }
    assert(found);
    fs::remove_all(other_out);
  }

  // Errors before anything is written.
  {
    assert(mat2nwb_test::throws_as<SourceNotFound>(
        [&] { convert_mat_to_nwb(src_dir + "/m1_VLS_43_missing.mat"); }));
    assert(!file_exists("m1_VLS_43_missing.nwb"));

    const std::string badname = src_dir + "/badname.mat";
    fs::copy_file(src, badname);
    FailingWriter w;
    assert(mat2nwb_test::throws_as<UsageError>([&] { convert_mat_to_nwb(badname, {}, &w); }));
    assert(w.calls == 0);

    const std::string junk = src_dir + "/m1_VLS_44_junk.mat";
    {
      std::ofstream f(junk);
      f << "not a mat file";
    }
    assert(mat2nwb_test::throws_as<LoadError>([&] { convert_mat_to_nwb(junk, {}, &w); }));
    assert(w.calls == 0);
  }

  // Output-name collisions: last write wins.
  {
    RecordSet records;
    records.push_back(make_struct("s_A_x", {0.0, 1.0}, {5.0, 6.0}));
    records.push_back(make_struct("s_B_x", {0.0, 0.5}, {7.0, 8.0}));
    NwbFile nwb(SessionMetadata{});
    ConversionResult res;
    assemble_nwb_file(records, &nwb, &res);
    assert((res.written == std::vector<std::string>{"x"}));
    assert(nwb.acquisition().size() == 1);
    assert(nwb.find_acquisition("x")->description == "s_B_x");
    assert(has_diag(res.diagnostics, Severity::kWarning, "x", "collides with an earlier channel"));
  }

  // Earliest timestamp and session metadata.
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    RecordSet records;
    records.push_back(make_struct("a_one", {nan, 4.0, 3.5}, {1, 2, 3}));
    records.push_back(make_struct("a_two", {7.0}, {1}));
    ChannelRecord text;
    text.name = "a_text";
    text.value.cls = MatClass::kChar;
    records.push_back(text);
    const auto earliest = earliest_timestamp(records);
    assert(earliest && *earliest == 3.5);
    assert(!earliest_timestamp(RecordSet{text}));

    const FileNameParts parts = parse_file_name("Jack_42_sham.mat");
    ConvertOptions opts;
    const std::time_t now = std::time(nullptr);
    const SessionMetadata s = make_session_metadata(parts, opts, 12.25, now);
    assert(s.identifier == "Jack_42_sham");
    assert(s.notes == "Signal Type: , Tag: sham");
    assert(s.subject_id == "Jack");
    assert((s.experimenter == std::vector<std::string>{"Unknown"}));
    assert(s.institution == "Whitehead Institute");
    assert(mat2nwb_test::contains(s.session_start_time, "T00:00:12.250"));
    assert(s.timestamps_reference_time == s.session_start_time);

    const SessionMetadata none = make_session_metadata(parts, opts, std::nullopt, now);
    assert(mat2nwb_test::contains(none.session_start_time, "T00:00:00.000"));
    assert(output_path_for(parts, opts) == "Jack_42_sham.nwb");
  }

  // Earliest timestamps too large for a calendar date fall back to midnight.
  {
    const FileNameParts parts = parse_file_name("Jack_42_sham.mat");
    const std::time_t now = std::time(nullptr);
    for (double huge : {1e20, -1e20, std::numeric_limits<double>::infinity()}) {
      std::vector<Diagnostic> warnings;
      const SessionMetadata s = make_session_metadata(parts, ConvertOptions{}, huge, now, &warnings);
      assert(mat2nwb_test::contains(s.session_start_time, "T00:00:00.000"));
      assert(s.timestamps_reference_time == s.session_start_time);
      assert(warnings.size() == 1);
      assert(warnings[0].severity == Severity::kWarning);
      assert(mat2nwb_test::contains(warnings[0].message, "using local midnight"));
    }

    std::vector<Diagnostic> none;
    make_session_metadata(parts, ConvertOptions{}, 12.25, now, &none);
    assert(none.empty());

    // Through the full pipeline the warning lands in the result.
    const std::string huge_src = src_dir + "/m2_VLS_7_late.mat";
    {
      Mat5Builder b;
      b.add(b.struct_array("m2_VLS_ChR2", {{"times", b.row("", {1e20, 2e20})},
                                           {"values", b.row("", {1.0, 2.0})}}));
      b.write(huge_src);
    }
    ConvertOptions opts;
    opts.output_dir = out_dir;
    const ConversionResult res = convert_mat_to_nwb(huge_src, opts);
    assert(res.ok());
    assert(has_diag(res.diagnostics, Severity::kWarning, "", "using local midnight"));
    H5::H5File f(res.nwb_path, H5F_ACC_RDONLY);
    assert(mat2nwb_test::contains(read_scalar_string(f, "/session_start_time"), "T00:00:00.000"));
  }

  fs::remove_all(src_dir);
  fs::remove_all(out_dir);
  return 0;
}
