#include "mat2nwb/converter.hpp"

#include "mat2nwb/errors.hpp"
#include "mat2nwb/name_deriver.hpp"
#include "mat2nwb/reader.hpp"
#include "mat2nwb/utils.hpp"

#include <H5Cpp.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <utility>

namespace mat2nwb {

std::optional<double> earliest_timestamp(const RecordSet& records) {
  std::optional<double> best;
  for (const auto& r : records) {
    if (!r.value.is_struct()) continue;
    const auto tf = first_present_field(r.value, time_field_candidates());
    if (!tf) continue;
    const MatValue* t = r.value.field(*tf);
    if (!t || !t->is_numeric() || t->array.empty()) continue;
    for (double x : t->array.data) {
      if (!std::isfinite(x)) continue;
      if (!best || x < *best) best = x;
    }
  }
  return best;
}

namespace {

// Midnight of `now`'s day plus `offset` seconds, millisecond precision.
// Empty if the local calendar cannot represent the result.
std::string start_time_after_midnight(std::time_t now, double offset) {
  const double whole = std::floor(offset);
  int millis = static_cast<int>(std::lround((offset - whole) * 1000.0));
  std::time_t start = local_midnight(now) + static_cast<std::time_t>(whole);
  if (millis >= 1000) {
    start += 1;
    millis -= 1000;
  }
  return format_local_iso8601(start, millis);
}

} // namespace

SessionMetadata make_session_metadata(const FileNameParts& parts,
                                      const ConvertOptions& opts,
                                      std::optional<double> earliest,
                                      std::time_t now,
                                      std::vector<Diagnostic>* warnings) {
  SessionMetadata s;
  s.identifier = parts.identifier();
  s.session_description = opts.session_description;
  s.experimenter = {opts.experimenter};
  s.institution = opts.institution;
  s.notes = "Signal Type: " + parts.signal + ", Tag: " + parts.tag;
  s.session_id = parts.session;
  s.subject_id = parts.animal;

  const double offset = earliest ? *earliest : 0.0;
  if (std::fabs(offset) <= kMaxSessionOffsetSeconds) {
    s.session_start_time = start_time_after_midnight(now, offset);
  }
  if (s.session_start_time.empty()) {
    if (warnings) {
      std::ostringstream msg;
      msg << "Earliest timestamp " << offset
          << " s cannot offset the session start time; using local midnight";
      warnings->push_back(Diagnostic{Severity::kWarning, "", msg.str(), {}});
    }
    s.session_start_time = start_time_after_midnight(now, 0.0);
  }
  s.timestamps_reference_time = s.session_start_time;
  s.file_create_date = format_local_iso8601(now, 0);
  return s;
}

std::string output_path_for(const FileNameParts& parts, const ConvertOptions& opts) {
  if (opts.output_dir.empty()) return parts.nwb_file_name();
  return (std::filesystem::u8path(opts.output_dir) / std::filesystem::u8path(parts.nwb_file_name()))
      .u8string();
}

TimeSeries make_time_series(const ClassifiedChannel& ch) {
  TimeSeries ts;
  ts.name = ch.output_name;
  ts.description = ch.description;
  ts.data_class = ch.data_class;
  ts.data = ch.data;
  ts.time_axis = ch.time_axis;
  ts.regular = ch.sampling.is_regular;
  ts.starting_time = ch.sampling.start_time;
  ts.rate = ch.sampling.sampling_rate_hz;
  if (!ts.regular) ts.timestamps = ch.sampling.timestamps;
  return ts;
}

namespace {

Diagnostic info(const std::string& subject, const std::string& message) {
  Diagnostic d;
  d.severity = Severity::kInfo;
  d.subject = subject;
  d.message = message;
  return d;
}

void append(std::vector<Diagnostic>* dst, std::vector<Diagnostic> src) {
  for (auto& d : src) dst->push_back(std::move(d));
}

} // namespace

void assemble_nwb_file(const RecordSet& records, NwbFile* nwb, ConversionResult* result) {
  const std::string prefix = common_name_prefix(collect_naming_keys(records));

  for (const auto& r : records) {
    ClassificationResult cr = classify_channel(r);
    if (cr.skipped()) {
      append(&result->diagnostics, std::move(cr.diagnostics));
      result->skipped.push_back(r.name);
      continue;
    }

    ClassifiedChannel& ch = *cr.channel;
    ch.output_name = derive_output_name(ch.description, prefix);

    // Per-channel notes are reported under the output name.
    for (auto& d : cr.diagnostics) d.subject = ch.output_name;
    append(&result->diagnostics, std::move(cr.diagnostics));

    if (ch.sampling.is_regular) {
      std::size_t n_times = 1;
      for (std::size_t d : ch.timestamps_dims) n_times *= d;
      result->diagnostics.push_back(
          info(ch.output_name, n_times == 1 ? "Using starting_time and rate instead of "
                                              "timestamps (single timestamp)"
                                            : "Using starting_time and rate instead of "
                                              "timestamps (regular sampling detected)"));
    }

    const TimeSeries ts = make_time_series(ch);
    if (nwb->add_acquisition(ts)) {
      Diagnostic w;
      w.severity = Severity::kWarning;
      w.subject = ch.output_name;
      w.message = "Output name '" + ch.output_name + "' from " + ch.description +
                  " collides with an earlier channel; the earlier TimeSeries is replaced";
      result->diagnostics.push_back(std::move(w));
      result->written.erase(std::remove(result->written.begin(), result->written.end(),
                                        ch.output_name),
                            result->written.end());
    }
    result->written.push_back(ch.output_name);

    result->diagnostics.push_back(info(ch.output_name, "Data shape: " + format_dims(ch.data.dims)));
    result->diagnostics.push_back(
        info(ch.output_name, "Timestamps shape: " + format_dims(ch.timestamps_dims)));
    if (ch.time_field) {
      result->diagnostics.push_back(info(ch.output_name, "Time field used: " + *ch.time_field));
    }
    if (ch.value_field) {
      result->diagnostics.push_back(info(ch.output_name, "Data field used: " + *ch.value_field));
    }
    result->diagnostics.push_back(
        info(ch.output_name, "STATUS: Successfully added to NWB path /acquisition/" + ch.output_name));
  }
}

ConversionResult convert_mat_to_nwb(const std::string& mat_path,
                                    const ConvertOptions& opts,
                                    IContainerWriter* writer) {
  if (!file_exists(mat_path)) throw SourceNotFound(mat_path);

  const FileNameParts parts = parse_file_name(mat_path);
  const RecordSet records = read_mat_file_auto(mat_path);

  const std::time_t now = std::time(nullptr);
  ConversionResult result;
  NwbFile nwb(make_session_metadata(parts, opts, earliest_timestamp(records), now,
                                    &result.diagnostics));

  assemble_nwb_file(records, &nwb, &result);

  NwbWriterOptions wopts;
  wopts.compression_level = opts.compression_level;
  NwbWriter default_writer(wopts);
  IContainerWriter* w = writer ? writer : &default_writer;

  const std::string out_path = output_path_for(parts, opts);
  try {
    if (!opts.output_dir.empty()) ensure_directory(opts.output_dir);
    w->write(nwb, out_path);
    result.nwb_path = out_path;
  } catch (const ExportError& e) {
    result.diagnostics.push_back(Diagnostic{Severity::kError, "", "Error exporting NWB file:", {e.what()}});
  } catch (const H5::Exception& e) {
    result.diagnostics.push_back(
        Diagnostic{Severity::kError, "", "Error exporting NWB file:", {e.getDetailMsg()}});
  } catch (const std::filesystem::filesystem_error& e) {
    result.diagnostics.push_back(Diagnostic{Severity::kError, "", "Error exporting NWB file:", {e.what()}});
  }
  return result;
}

} // namespace mat2nwb
