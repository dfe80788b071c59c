#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mat2nwb {

// MATLAB array classes as stored in MAT files.
//
// Only the numeric classes (double ... uint64) count as numeric data for
// conversion. logical and char are stored with a numeric payload but are not
// numeric in the MATLAB sense (isnumeric() is false for them).
enum class MatClass {
  kDouble,
  kSingle,
  kInt8,
  kUInt8,
  kInt16,
  kUInt16,
  kInt32,
  kUInt32,
  kInt64,
  kUInt64,
  kLogical,
  kChar,
  kStruct,
  kCell,
  kObject,
  kSparse,
  kFunction,
  kUnknown,
};

// MATLAB class() spelling, e.g. "double", "struct", "function_handle".
const char* mat_class_name(MatClass c);

bool is_numeric_class(MatClass c);

// Dense N-d array in MATLAB storage order (column-major).
//
// dims follows MATLAB size(): it always has at least two entries once
// populated, and trailing singleton dimensions beyond the second are not
// stored. Values are converted to double regardless of the source class.
struct NumericArray {
  std::vector<std::size_t> dims;
  std::vector<double> data;

  std::size_t ndims() const { return dims.size(); }
  std::size_t dim(std::size_t i) const { return i < dims.size() ? dims[i] : 1; }
  std::size_t numel() const;
  bool empty() const { return numel() == 0; }

  // MATLAB isvector(): 2-D with at least one singleton dimension.
  bool is_vector() const;
};

// One loaded MATLAB value (a variable, a struct field or a cell).
struct MatValue {
  MatClass cls{MatClass::kDouble};

  // dims are meaningful for every class; data is only filled for numeric,
  // logical and char values (char keeps the raw code units).
  NumericArray array;

  bool is_complex{false};  // only the real part is kept in array.data
  std::string text;        // kChar: decoded text (column-major order)
  std::string class_name;  // kObject: MATLAB class name

  // kStruct / kObject: field names in declaration order and the values of
  // the first element (struct arrays keep element 0 only).
  std::vector<std::string> field_names;
  std::vector<MatValue> field_values;

  // kCell: cell contents in column-major order.
  std::vector<MatValue> cells;

  bool is_numeric() const { return is_numeric_class(cls); }
  bool is_struct() const { return cls == MatClass::kStruct || cls == MatClass::kObject; }

  // Case-sensitive field lookup. Returns nullptr if absent (or no value is
  // stored for it, e.g. an empty struct array).
  const MatValue* field(const std::string& name) const;
  bool has_field(const std::string& name) const;
};

// A named top-level variable from the source file.
struct ChannelRecord {
  std::string name;
  MatValue value;
};

// Records in discovery order. Order matters for common-prefix computation and
// for fallback field probing.
using RecordSet = std::vector<ChannelRecord>;

} // namespace mat2nwb
