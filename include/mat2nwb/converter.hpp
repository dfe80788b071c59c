#pragma once

#include "mat2nwb/diagnostics.hpp"
#include "mat2nwb/field_classifier.hpp"
#include "mat2nwb/file_name_meta.hpp"
#include "mat2nwb/nwb_file.hpp"
#include "mat2nwb/nwb_writer.hpp"
#include "mat2nwb/types.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace mat2nwb {

struct ConvertOptions {
  std::string session_description{"Converted MATLAB session"};
  std::string experimenter{"Unknown"};
  std::string institution{"Whitehead Institute"};

  // Destination directory for <identifier>.nwb ("" => current directory).
  std::string output_dir;

  // Deflate level for TimeSeries data (0 disables compression).
  int compression_level{3};
};

struct ConversionResult {
  // Path of the written NWB file; empty if the export failed.
  std::string nwb_path;

  std::vector<std::string> written;  // output names under /acquisition
  std::vector<std::string> skipped;  // source record names
  std::vector<Diagnostic> diagnostics;

  bool ok() const { return !nwb_path.empty(); }
};

// Earliest finite value over the first present canonical time field of every
// struct record (when that field is a non-empty numeric array).
std::optional<double> earliest_timestamp(const RecordSet& records);

// Largest |earliest timestamp| (seconds) accepted as a session start offset.
constexpr double kMaxSessionOffsetSeconds = 1e12;

// Session metadata for a run. The session start time is local midnight of
// `now`'s day plus the earliest timestamp (in seconds, 0 if there is none);
// the timestamps reference time equals it.
//
// An earliest timestamp that is not finite, exceeds kMaxSessionOffsetSeconds
// or lands outside the local calendar is ignored (start = local midnight) and
// reported as a warning appended to *warnings.
SessionMetadata make_session_metadata(const FileNameParts& parts,
                                      const ConvertOptions& opts,
                                      std::optional<double> earliest,
                                      std::time_t now,
                                      std::vector<Diagnostic>* warnings = nullptr);

// Destination path: <output_dir>/<identifier>.nwb
std::string output_path_for(const FileNameParts& parts, const ConvertOptions& opts);

// Build the TimeSeries for one classified channel.
TimeSeries make_time_series(const ClassifiedChannel& ch);

// Classify every record, assign output names by common-prefix stripping and
// register the resulting TimeSeries on `nwb`. Skips, warnings (including
// output-name collisions, last write wins) and per-channel status lines are
// appended to `result`.
void assemble_nwb_file(const RecordSet& records, NwbFile* nwb, ConversionResult* result);

// Full pipeline for one MAT-file:
//   existence check -> filename parse -> load -> classify -> name -> assemble
//   -> export
//
// Throws SourceNotFound, UsageError (filename convention) or LoadError before
// anything is written. Export failures do not throw: they are recorded as an
// error diagnostic and the result has an empty nwb_path.
//
// `writer` defaults to an NwbWriter configured from opts.
ConversionResult convert_mat_to_nwb(const std::string& mat_path,
                                    const ConvertOptions& opts = ConvertOptions{},
                                    IContainerWriter* writer = nullptr);

} // namespace mat2nwb
