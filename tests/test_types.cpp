#include "mat2nwb/types.hpp"

#include "test_support.hpp"
#include <string>

int main() {
  using namespace mat2nwb;

  // numel / empty / dim beyond range
  {
    NumericArray a;
    assert(a.numel() == 0);
    assert(a.empty());

    a.dims = {3, 4};
    assert(a.numel() == 12);
    assert(a.dim(0) == 3);
    assert(a.dim(1) == 4);
    assert(a.dim(5) == 1);

    a.dims = {0, 5};
    assert(a.empty());
  }

  // isvector(): 2-D with a singleton dimension; 0x0 is not a vector
  {
    NumericArray a;
    a.dims = {1, 10};
    assert(a.is_vector());
    a.dims = {10, 1};
    assert(a.is_vector());
    a.dims = {1, 1};
    assert(a.is_vector());
    a.dims = {1, 0};
    assert(a.is_vector());
    a.dims = {0, 0};
    assert(!a.is_vector());
    a.dims = {3, 4};
    assert(!a.is_vector());
    a.dims = {1, 4, 2};
    assert(!a.is_vector());
  }

  // Only the numeric classes are numeric.
  {
    assert(is_numeric_class(MatClass::kDouble));
    assert(is_numeric_class(MatClass::kUInt64));
    assert(!is_numeric_class(MatClass::kLogical));
    assert(!is_numeric_class(MatClass::kChar));
    assert(!is_numeric_class(MatClass::kStruct));
    assert(std::string(mat_class_name(MatClass::kInt16)) == "int16");
    assert(std::string(mat_class_name(MatClass::kFunction)) == "function_handle");
  }

  // Field lookup is case-sensitive; a name without a stored value is absent.
  {
    MatValue s;
    s.cls = MatClass::kStruct;
    s.field_names = {"times", "Values", "orphan"};
    s.field_values.resize(2);
    s.field_values[1].cls = MatClass::kSingle;

    assert(s.is_struct());
    assert(s.has_field("times"));
    assert(s.has_field("Values"));
    assert(!s.has_field("values"));
    assert(s.field("orphan") == nullptr);
    assert(s.field("Values")->cls == MatClass::kSingle);

    MatValue obj;
    obj.cls = MatClass::kObject;
    assert(obj.is_struct());
    assert(!obj.is_numeric());
  }

  return 0;
}
