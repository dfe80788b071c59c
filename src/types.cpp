#include "mat2nwb/types.hpp"

namespace mat2nwb {

const char* mat_class_name(MatClass c) {
  switch (c) {
    case MatClass::kDouble: return "double";
    case MatClass::kSingle: return "single";
    case MatClass::kInt8: return "int8";
    case MatClass::kUInt8: return "uint8";
    case MatClass::kInt16: return "int16";
    case MatClass::kUInt16: return "uint16";
    case MatClass::kInt32: return "int32";
    case MatClass::kUInt32: return "uint32";
    case MatClass::kInt64: return "int64";
    case MatClass::kUInt64: return "uint64";
    case MatClass::kLogical: return "logical";
    case MatClass::kChar: return "char";
    case MatClass::kStruct: return "struct";
    case MatClass::kCell: return "cell";
    case MatClass::kObject: return "object";
    case MatClass::kSparse: return "sparse";
    case MatClass::kFunction: return "function_handle";
    case MatClass::kUnknown: break;
  }
  return "unknown";
}

bool is_numeric_class(MatClass c) {
  switch (c) {
    case MatClass::kDouble:
    case MatClass::kSingle:
    case MatClass::kInt8:
    case MatClass::kUInt8:
    case MatClass::kInt16:
    case MatClass::kUInt16:
    case MatClass::kInt32:
    case MatClass::kUInt32:
    case MatClass::kInt64:
    case MatClass::kUInt64:
      return true;
    default:
      return false;
  }
}

std::size_t NumericArray::numel() const {
  if (dims.empty()) return 0;
  std::size_t n = 1;
  for (std::size_t d : dims) n *= d;
  return n;
}

bool NumericArray::is_vector() const {
  if (dims.size() != 2) return false;
  if (dims[0] == 0 && dims[1] == 0) return false;
  return dims[0] == 1 || dims[1] == 1;
}

const MatValue* MatValue::field(const std::string& name) const {
  for (std::size_t i = 0; i < field_names.size(); ++i) {
    if (field_names[i] == name) {
      return i < field_values.size() ? &field_values[i] : nullptr;
    }
  }
  return nullptr;
}

bool MatValue::has_field(const std::string& name) const {
  for (const auto& f : field_names) {
    if (f == name) return true;
  }
  return false;
}

} // namespace mat2nwb
