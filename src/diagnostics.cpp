#include "mat2nwb/diagnostics.hpp"

#include "mat2nwb/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>
#include <sstream>

namespace mat2nwb {

const char* severity_label(Severity s) {
  switch (s) {
    case Severity::kInfo: return "INFO";
    case Severity::kWarning: return "WARNING";
    case Severity::kSkipped: return "SKIPPED";
    case Severity::kError: return "ERROR";
  }
  return "INFO";
}

std::string format_dims(const std::vector<std::size_t>& dims) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < dims.size(); ++i) {
    if (i) oss << " ";
    oss << dims[i];
  }
  oss << "]";
  return oss.str();
}

static bool finite_range(const std::vector<double>& v, double* lo, double* hi) {
  double mn = std::numeric_limits<double>::infinity();
  double mx = -std::numeric_limits<double>::infinity();
  bool any = false;
  for (double x : v) {
    if (std::isnan(x)) continue;  // min()/max() ignore NaN
    if (x < mn) mn = x;
    if (x > mx) mx = x;
    any = true;
  }
  if (!any) return false;
  *lo = mn;
  *hi = mx;
  return true;
}

std::string describe_value(const MatValue& v) {
  std::ostringstream oss;
  if (v.cls == MatClass::kObject && !v.class_name.empty()) {
    oss << v.class_name;
  } else {
    oss << mat_class_name(v.cls);
  }

  if (v.is_numeric() && v.array.empty()) {
    oss << " (EMPTY)";
  }
  oss << " with size " << format_dims(v.array.dims);

  if (v.is_numeric() && !v.array.empty()) {
    double lo = 0.0, hi = 0.0;
    if (finite_range(v.array.data, &lo, &hi)) {
      oss << ", range [" << lo << ", " << hi << "]";
    } else {
      oss << ", range [NaN, NaN]";
    }
  }
  return oss.str();
}

std::vector<std::string> describe_fields(const MatValue& record, std::size_t max_fields) {
  std::vector<std::string> lines;

  const std::size_t n = record.field_names.size();
  const std::size_t limit = (max_fields == 0 || max_fields > n) ? n : max_fields;
  for (std::size_t i = 0; i < limit; ++i) {
    const std::string& name = record.field_names[i];
    const MatValue* v = i < record.field_values.size() ? &record.field_values[i] : nullptr;
    if (!v) {
      lines.push_back("- " + name + ": (no value stored; empty struct array)");
      continue;
    }

    if (v->is_struct()) {
      std::ostringstream oss;
      oss << "- " << name << ": struct with " << v->field_names.size() << " fields";
      lines.push_back(oss.str());
      if (!v->field_names.empty()) {
        lines.push_back("  Subfields:");
        const std::size_t shown = std::min<std::size_t>(5, v->field_names.size());
        for (std::size_t k = 0; k < shown; ++k) {
          lines.push_back("    " + v->field_names[k]);
        }
        if (v->field_names.size() > 5) {
          std::ostringstream more;
          more << "    ... and " << (v->field_names.size() - 5) << " more fields";
          lines.push_back(more.str());
        }
      }
      continue;
    }

    if (v->cls == MatClass::kCell) {
      lines.push_back("- " + name + ": cell array with size " + format_dims(v->array.dims));
      if (!v->cells.empty()) {
        lines.push_back("  Sample cell contents:");
        const std::size_t shown = std::min<std::size_t>(3, v->cells.size());
        for (std::size_t k = 0; k < shown; ++k) {
          std::ostringstream oss;
          oss << "    Cell " << (k + 1) << ": " << mat_class_name(v->cells[k].cls)
              << " with size " << format_dims(v->cells[k].array.dims);
          lines.push_back(oss.str());
        }
      }
      continue;
    }

    lines.push_back("- " + name + ": " + describe_value(*v));

    if (v->is_numeric() && !v->array.empty() && v->array.dim(0) <= 1) {
      std::ostringstream oss;
      oss << "  NOTE: This field has only " << v->array.dim(0)
          << " row(s), which doesn't meet the multi-row requirement";
      lines.push_back(oss.str());
    }

    if (v->cls == MatClass::kChar) {
      const std::string low = to_lower(name);
      if (low == "title" || low == "comment") {
        lines.push_back("    Content: \"" + v->text + "\"");
      }
    }
  }

  if (limit < n) {
    std::ostringstream oss;
    oss << "... " << (n - limit) << " more fields not shown";
    lines.push_back(oss.str());
  }

  return lines;
}

void render_diagnostics(std::ostream& os,
                        const std::vector<Diagnostic>& diags,
                        bool include_info) {
  // Consecutive diagnostics about the same subject share one FIELD header.
  const std::string* last_subject = nullptr;
  for (const auto& d : diags) {
    if (!include_info && d.severity == Severity::kInfo) continue;

    if (!last_subject || *last_subject != d.subject) {
      os << "\n";
      if (!d.subject.empty()) {
        os << "FIELD: " << d.subject << "\n";
      }
    }
    last_subject = &d.subject;
    if (d.severity == Severity::kInfo) {
      os << "  " << d.message << "\n";
    } else {
      os << "  " << severity_label(d.severity) << ": " << d.message << "\n";
    }
    for (const auto& line : d.details) {
      os << "  " << line << "\n";
    }
  }
}

void render_diagnostics(std::ostream& out,
                        std::ostream& err,
                        const std::vector<Diagnostic>& diags,
                        bool include_info) {
  std::vector<Diagnostic> infos;
  std::vector<Diagnostic> problems;
  for (const auto& d : diags) {
    if (d.severity == Severity::kInfo) {
      if (include_info) infos.push_back(d);
    } else {
      problems.push_back(d);
    }
  }
  render_diagnostics(out, infos, true);
  render_diagnostics(err, problems, true);
}

} // namespace mat2nwb
