#pragma once

#include "mat2nwb/types.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace mat2nwb {

// Structured diagnostics.
//
// The conversion core (classifier, name deriver, assembler) never prints.
// It returns Diagnostic records and the CLI tools decide how to render them.
// This keeps the core testable without capturing stdout.
enum class Severity {
  kInfo,     // progress/status for a channel that was converted
  kWarning,  // converted, but something looked suspicious (e.g. name collision)
  kSkipped,  // channel omitted from output (classification failed)
  kError,    // file-level failure (export)
};

const char* severity_label(Severity s);

struct Diagnostic {
  Severity severity{Severity::kInfo};
  std::string subject;               // channel/field name (may be empty)
  std::string message;
  std::vector<std::string> details;  // rendered one per line, indented
};

// MATLAB mat2str(size(x)) style, e.g. "[1 100]".
std::string format_dims(const std::vector<std::size_t>& dims);

// One-line description of a value's class, size and (for non-empty numeric
// values) range, e.g. "double with size [1 100], range [0, 99]".
std::string describe_value(const MatValue& v);

// Detail lines describing every direct sub-field of a struct record: name,
// class, size, numeric range, a note for single-row numeric fields, the first
// few sub-field names of nested structs, the first few cells of cell arrays,
// and the content of `title`/`comment` char fields.
//
// max_fields limits the number of sub-fields described (0 => all).
std::vector<std::string> describe_fields(const MatValue& record, std::size_t max_fields = 0);

// Render diagnostics in a human-readable block format:
//
//   FIELD: <subject>
//     WARNING: <message>
//     <detail lines>
//
// Info diagnostics are omitted when include_info is false.
void render_diagnostics(std::ostream& os,
                        const std::vector<Diagnostic>& diags,
                        bool include_info = true);

// Same format, split by severity: info blocks go to `out`, warnings, skips and
// errors to `err`.
void render_diagnostics(std::ostream& out,
                        std::ostream& err,
                        const std::vector<Diagnostic>& diags,
                        bool include_info = true);

} // namespace mat2nwb
