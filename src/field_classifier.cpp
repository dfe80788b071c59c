#include "mat2nwb/field_classifier.hpp"

#include "mat2nwb/name_deriver.hpp"
#include "mat2nwb/orientation.hpp"

#include <sstream>
#include <utility>

namespace mat2nwb {

const std::vector<std::string>& time_field_candidates() {
  static const std::vector<std::string> k = {"times", "time", "t", "timestamps"};
  return k;
}

const std::vector<std::string>& value_field_candidates() {
  static const std::vector<std::string> k = {
      "values", "value", "data", "signal", "amplitude", "position", "X", "Y"};
  return k;
}

std::optional<std::string> first_present_field(const MatValue& record,
                                               const std::vector<std::string>& candidates) {
  for (const auto& c : candidates) {
    if (record.has_field(c)) return c;
  }
  return std::nullopt;
}

namespace {

Diagnostic note(const std::string& subject, const std::string& message,
                Severity severity = Severity::kInfo) {
  Diagnostic d;
  d.severity = severity;
  d.subject = subject;
  d.message = message;
  return d;
}

bool usable_numeric(const MatValue* v) {
  return v && v->is_numeric() && !v->array.empty();
}

// Why a candidate pair cannot be used directly, or empty if it can.
std::string canonical_pair_problem(const std::string& time_name, const MatValue* t,
                                   const std::string& value_name, const MatValue* v) {
  if (!t || !v) return "time/value fields hold no value";
  if (!t->is_numeric() || !v->is_numeric()) {
    return "time field '" + time_name + "' (" + mat_class_name(t->cls) + ") or value field '" +
           value_name + "' (" + mat_class_name(v->cls) + ") is not numeric";
  }
  if (t->array.empty() || v->array.empty()) {
    return "time field '" + time_name + "' or value field '" + value_name + "' is empty";
  }
  if (!t->array.is_vector()) {
    return "time field '" + time_name + "' is not a vector (size " +
           format_dims(t->array.dims) + ")";
  }
  return std::string();
}

void check_timestamp_count(ClassifiedChannel* ch, std::vector<Diagnostic>* diags) {
  if (ch->sampling.is_regular) return;
  if (ch->sampling.timestamps.size() == ch->n_samples()) return;
  std::ostringstream oss;
  oss << "Timestamp count (" << ch->sampling.timestamps.size()
      << ") does not match the number of samples along the time axis (" << ch->n_samples() << ")";
  diags->push_back(note(ch->channel, oss.str(), Severity::kWarning));
}

ClassificationResult classify_canonical(const ChannelRecord& record,
                                        const std::string& time_name,
                                        const std::string& value_name) {
  ClassificationResult res;
  const MatValue& t = *record.value.field(time_name);
  const MatValue& v = *record.value.field(value_name);

  ClassifiedChannel ch;
  ch.channel = record.name;
  ch.description = record.name;
  ch.time_field = time_name;
  ch.value_field = value_name;
  ch.data_class = v.cls;

  const OrientedArray times = orient_vector(t.array, 2);
  if (times.change != OrientationChange::kNone) {
    res.diagnostics.push_back(
        note(record.name, "Transposing timestamps for " + record.name + " to row vector"));
  }
  ch.timestamps_dims = times.array.dims;

  if (v.array.is_vector()) {
    const OrientedArray data = orient_vector(v.array, 2);
    if (data.change != OrientationChange::kNone) {
      res.diagnostics.push_back(
          note(record.name, "Transposing vector data for " + record.name + " to row vector"));
    }
    ch.data = data.array;
    ch.time_axis = 2;
  } else {
    const OrientedArray data = make_time_major(v.array);
    ch.data = data.array;
    ch.time_axis = 1;
    res.diagnostics.push_back(
        note(record.name,
             record.name + " is multi-dimensional (size " + format_dims(v.array.dims) +
                 "); assuming time runs along the longest dimension (" +
                 orientation_change_name(data.change) + ", now " + format_dims(ch.data.dims) + ")",
             Severity::kWarning));
  }

  ch.sampling = classify_sampling(times.array.data);
  check_timestamp_count(&ch, &res.diagnostics);

  res.channel = std::move(ch);
  return res;
}

bool classify_fallback(const ChannelRecord& record, ClassificationResult* res) {
  const MatValue& rv = record.value;
  for (std::size_t i = 0; i < rv.field_names.size() && i < rv.field_values.size(); ++i) {
    const std::string& fname = rv.field_names[i];
    const MatValue& fv = rv.field_values[i];
    if (!usable_numeric(&fv)) continue;

    const std::string full = record.name + kNameSeparator + fname;

    // Time in the first dimension: vectors become columns, everything else
    // is made time-major.
    const OrientedArray tm = orient_for_output(fv.array, 1);
    if (tm.array.dim(0) <= 1) continue;

    ClassifiedChannel ch;
    ch.channel = record.name;
    ch.description = full;
    ch.value_field = fname;
    ch.used_fallback = true;
    ch.data_class = fv.cls;

    const std::size_t n = tm.array.dim(0);
    if (tm.array.is_vector()) {
      // Vectors are emitted as rows, like the canonical path.
      const OrientedArray row = orient_vector(tm.array, 2);
      ch.data = row.array;
      ch.time_axis = 2;
    } else {
      ch.data = tm.array;
      ch.time_axis = 1;
      if (tm.change != OrientationChange::kNone) {
        res->diagnostics.push_back(
            note(record.name, std::string(tm.change == OrientationChange::kPermuted ? "Permuting "
                                                                                    : "Transposing ") +
                                  std::to_string(fv.array.ndims()) + "D data for " + full +
                                  " to make time the first dimension (now " +
                                  format_dims(ch.data.dims) + ")"));
      }
      res->diagnostics.push_back(
          note(record.name,
               full + " is multi-dimensional; time is assumed to run along the longest dimension",
               Severity::kWarning));
    }

    std::vector<double> ts(n);
    for (std::size_t k = 0; k < n; ++k) ts[k] = static_cast<double>(k);
    ch.timestamps_dims = {1, n};
    ch.sampling = classify_sampling(ts);

    res->channel = std::move(ch);
    return true;
  }
  return false;
}

Diagnostic skip_diagnostic(const ChannelRecord& record) {
  Diagnostic d;
  d.severity = Severity::kSkipped;
  d.subject = record.name;

  if (!record.value.is_struct()) {
    d.message = "Variable " + record.name + " is not a struct. Skipping.";
    d.details.push_back("## DIAGNOSTIC INFO ##");
    d.details.push_back("- " + record.name + ": " + describe_value(record.value));
    d.details.push_back(
        "HINT: Each variable must be a struct holding a time field and a value field "
        "(or at least one numeric field with multiple rows)");
    d.details.push_back("STATUS: SKIPPED - Not a struct");
    return d;
  }

  d.message = "Could not find suitable numeric data for " + record.name + ". Skipping.";
  d.details.push_back("## DIAGNOSTIC INFO ##");
  d.details.push_back("Structure contents:");
  for (const auto& line : describe_fields(record.value)) {
    d.details.push_back(line);
  }
  d.details.push_back(
      "HINT: The converter requires numeric data with multiple rows (size(data,1) > 1)");
  d.details.push_back("STATUS: SKIPPED - Could not find suitable numeric data");
  return d;
}

} // namespace

ClassificationResult classify_channel(const ChannelRecord& record) {
  if (!record.value.is_struct()) {
    ClassificationResult res;
    res.diagnostics.push_back(skip_diagnostic(record));
    return res;
  }

  const auto time_name = first_present_field(record.value, time_field_candidates());
  const auto value_name = first_present_field(record.value, value_field_candidates());

  std::vector<Diagnostic> pre;
  if (time_name && value_name) {
    const std::string problem =
        canonical_pair_problem(*time_name, record.value.field(*time_name),
                               *value_name, record.value.field(*value_name));
    if (problem.empty()) {
      return classify_canonical(record, *time_name, *value_name);
    }
    pre.push_back(note(record.name, "Canonical fields unusable: " + problem +
                                        "; searching for another numeric field",
                       Severity::kWarning));
  }

  ClassificationResult res;
  res.diagnostics = std::move(pre);
  if (!classify_fallback(record, &res)) {
    res.diagnostics.push_back(skip_diagnostic(record));
  }
  return res;
}

} // namespace mat2nwb
