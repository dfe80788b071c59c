#include "mat2nwb/mat73_reader.hpp"

#include "mat2nwb/errors.hpp"

#include <H5Cpp.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mat2nwb {

namespace {

std::string strip_nuls(std::string s) {
  const std::size_t nul = s.find('\0');
  if (nul != std::string::npos) s.resize(nul);
  return s;
}

std::string read_string_attr(const H5::H5Object& obj, const char* name) {
  if (!obj.attrExists(name)) return std::string();
  H5::Attribute a = obj.openAttribute(name);
  H5std_string s;
  a.read(a.getDataType(), s);
  return strip_nuls(s);
}

int read_int_attr(const H5::H5Object& obj, const char* name, int def) {
  if (!obj.attrExists(name)) return def;
  H5::Attribute a = obj.openAttribute(name);
  int v = def;
  a.read(H5::PredType::NATIVE_INT, &v);
  return v;
}

// MATLAB_fields: 1-D array of variable-length char sequences.
std::vector<std::string> read_field_order(const H5::Group& g) {
  std::vector<std::string> out;
  if (!g.attrExists("MATLAB_fields")) return out;

  H5::Attribute a = g.openAttribute("MATLAB_fields");
  H5::DataType t = a.getDataType();
  H5::DataSpace sp = a.getSpace();
  const hssize_t n = sp.getSimpleExtentNpoints();
  if (n <= 0 || t.getClass() != H5T_VLEN) return out;

  std::vector<hvl_t> buf(static_cast<std::size_t>(n));
  a.read(t, buf.data());
  for (const hvl_t& v : buf) {
    out.push_back(strip_nuls(std::string(static_cast<const char*>(v.p), v.len)));
  }
  H5::DataSet::vlenReclaim(buf.data(), t, sp);
  return out;
}

// Link names of a group, in creation order when the file tracks it and in
// name order otherwise.
std::vector<std::string> link_names(const H5::Group& g) {
  hid_t gcpl = H5Gget_create_plist(g.getId());
  if (gcpl < 0) throw LoadError("Failed to query HDF5 group properties");
  unsigned flags = 0;
  const herr_t st = H5Pget_link_creation_order(gcpl, &flags);
  H5Pclose(gcpl);
  if (st < 0) throw LoadError("Failed to query HDF5 link creation order");
  const H5_index_t idx = (flags & H5P_CRT_ORDER_TRACKED) ? H5_INDEX_CRT_ORDER : H5_INDEX_NAME;

  std::vector<std::string> names;
  const hsize_t n = g.getNumObjs();
  for (hsize_t i = 0; i < n; ++i) {
    const ssize_t len =
        H5Lget_name_by_idx(g.getId(), ".", idx, H5_ITER_INC, i, nullptr, 0, H5P_DEFAULT);
    if (len < 0) throw LoadError("Failed to read HDF5 link name");
    std::string name(static_cast<std::size_t>(len) + 1, '\0');
    if (H5Lget_name_by_idx(g.getId(), ".", idx, H5_ITER_INC, i, &name[0], name.size(),
                           H5P_DEFAULT) < 0) {
      throw LoadError("Failed to read HDF5 link name");
    }
    name.resize(static_cast<std::size_t>(len));
    names.push_back(name);
  }
  return names;
}

std::vector<std::size_t> matlab_dims(const H5::DataSpace& sp) {
  const int rank = sp.getSimpleExtentNdims();
  std::vector<hsize_t> h(static_cast<std::size_t>(std::max(rank, 0)));
  if (rank > 0) sp.getSimpleExtentDims(h.data());

  std::vector<std::size_t> dims(h.rbegin(), h.rend());
  while (dims.size() < 2) dims.push_back(1);
  while (dims.size() > 2 && dims.back() == 1) dims.pop_back();
  return dims;
}

MatClass class_from_name(const std::string& s) {
  if (s == "double") return MatClass::kDouble;
  if (s == "single") return MatClass::kSingle;
  if (s == "int8") return MatClass::kInt8;
  if (s == "uint8") return MatClass::kUInt8;
  if (s == "int16") return MatClass::kInt16;
  if (s == "uint16") return MatClass::kUInt16;
  if (s == "int32") return MatClass::kInt32;
  if (s == "uint32") return MatClass::kUInt32;
  if (s == "int64") return MatClass::kInt64;
  if (s == "uint64") return MatClass::kUInt64;
  if (s == "logical") return MatClass::kLogical;
  if (s == "char") return MatClass::kChar;
  if (s == "cell") return MatClass::kCell;
  if (s == "struct") return MatClass::kStruct;
  if (s == "function_handle") return MatClass::kFunction;
  return MatClass::kUnknown;
}

// Class of a dataset without a MATLAB_class attribute.
MatClass class_from_type(const H5::DataSet& ds) {
  switch (ds.getTypeClass()) {
    case H5T_FLOAT:
      return ds.getFloatType().getSize() == 4 ? MatClass::kSingle : MatClass::kDouble;
    case H5T_INTEGER: {
      const H5::IntType t = ds.getIntType();
      const bool is_signed = t.getSign() != H5T_SGN_NONE;
      switch (t.getSize()) {
        case 1: return is_signed ? MatClass::kInt8 : MatClass::kUInt8;
        case 2: return is_signed ? MatClass::kInt16 : MatClass::kUInt16;
        case 4: return is_signed ? MatClass::kInt32 : MatClass::kUInt32;
        default: return is_signed ? MatClass::kInt64 : MatClass::kUInt64;
      }
    }
    case H5T_STRING:
      return MatClass::kChar;
    case H5T_REFERENCE:
      return MatClass::kCell;
    case H5T_COMPOUND:
      return MatClass::kDouble;
    default:
      return MatClass::kUnknown;
  }
}

std::vector<double> read_doubles(const H5::DataSet& ds, std::size_t n) {
  std::vector<double> out(n);
  if (n == 0) return out;
  if (ds.getTypeClass() == H5T_COMPOUND) {
    // Complex: read only the real member.
    H5::CompType mt(sizeof(double));
    mt.insertMember("real", 0, H5::PredType::NATIVE_DOUBLE);
    ds.read(out.data(), mt);
  } else {
    ds.read(out.data(), H5::PredType::NATIVE_DOUBLE);
  }
  return out;
}

std::string utf16_units_to_text(const NumericArray& a) {
  const std::size_t rows = a.dim(0);
  const std::size_t cols = a.numel() / std::max<std::size_t>(rows, 1);
  std::string out;
  for (std::size_t r = 0; r < rows; ++r) {
    if (r) out.push_back('\n');
    for (std::size_t c = 0; c < cols; ++c) {
      const std::size_t idx = r + rows * c;
      if (idx >= a.data.size()) break;
      const std::uint32_t u = static_cast<std::uint32_t>(a.data[idx]);
      if (u < 0x80) {
        out.push_back(static_cast<char>(u));
      } else if (u < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (u >> 6)));
        out.push_back(static_cast<char>(0x80 | (u & 0x3F)));
      } else {
        out.push_back(static_cast<char>(0xE0 | ((u >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((u >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (u & 0x3F)));
      }
    }
  }
  return out;
}

MatValue read_object(const H5::H5Location& loc, const std::string& name);
MatValue read_group(const H5::Group& g);
MatValue read_dataset(const H5::DataSet& ds);

MatValue read_referenced(const H5::H5Location& loc, const hobj_ref_t& ref) {
  const H5O_type_t t = loc.getRefObjType(const_cast<hobj_ref_t*>(&ref), H5R_OBJECT);
  if (t == H5O_TYPE_GROUP) {
    H5::Group g(loc, &ref, H5R_OBJECT);
    return read_group(g);
  }
  if (t == H5O_TYPE_DATASET) {
    H5::DataSet ds(loc, &ref, H5R_OBJECT);
    return read_dataset(ds);
  }
  MatValue v;
  v.cls = MatClass::kUnknown;
  v.array.dims = {0, 0};
  return v;
}

std::vector<hobj_ref_t> read_refs(const H5::DataSet& ds, std::size_t n) {
  std::vector<hobj_ref_t> refs(n);
  if (n > 0) ds.read(refs.data(), H5::PredType::STD_REF_OBJ);
  return refs;
}

MatValue read_dataset(const H5::DataSet& ds) {
  MatValue v;
  const std::string cls = read_string_attr(ds, "MATLAB_class");
  v.cls = cls.empty() ? class_from_type(ds) : class_from_name(cls);
  if (v.cls == MatClass::kUnknown && ds.attrExists("MATLAB_object_decode")) {
    v.cls = MatClass::kObject;
    v.class_name = cls;
  }

  H5::DataSpace sp = ds.getSpace();
  const std::size_t npoints = static_cast<std::size_t>(sp.getSimpleExtentNpoints());

  if (read_int_attr(ds, "MATLAB_empty", 0) != 0) {
    // The payload holds the MATLAB size vector of the empty array.
    const std::vector<double> sz = read_doubles(ds, npoints);
    v.array.dims.clear();
    for (double d : sz) v.array.dims.push_back(static_cast<std::size_t>(d));
    while (v.array.dims.size() < 2) v.array.dims.push_back(0);
    return v;
  }

  v.array.dims = matlab_dims(sp);
  v.is_complex = ds.getTypeClass() == H5T_COMPOUND;

  switch (v.cls) {
    case MatClass::kCell: {
      if (ds.getTypeClass() != H5T_REFERENCE) break;
      const std::vector<hobj_ref_t> refs = read_refs(ds, npoints);
      v.cells.reserve(refs.size());
      for (const hobj_ref_t& r : refs) v.cells.push_back(read_referenced(ds, r));
      break;
    }
    case MatClass::kChar:
      if (ds.getTypeClass() == H5T_STRING) {
        H5std_string s;
        ds.read(s, ds.getStrType());
        v.text = strip_nuls(s);
        v.array.dims = {1, v.text.size()};
        v.array.data.assign(v.text.begin(), v.text.end());
      } else {
        v.array.data = read_doubles(ds, npoints);
        v.text = utf16_units_to_text(v.array);
      }
      break;
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
    case MatClass::kLogical:
      if (ds.getTypeClass() == H5T_REFERENCE) {
        // Field of a struct array: one reference per element; keep element 0.
        const std::vector<hobj_ref_t> refs = read_refs(ds, npoints);
        if (!refs.empty()) return read_referenced(ds, refs.front());
        break;
      }
      v.array.data = read_doubles(ds, npoints);
      break;
    default:
      break;
  }
  return v;
}

MatValue read_group(const H5::Group& g) {
  MatValue v;
  const std::string cls = read_string_attr(g, "MATLAB_class");
  if (g.attrExists("MATLAB_sparse")) {
    v.cls = MatClass::kSparse;
    v.array.dims = {static_cast<std::size_t>(read_int_attr(g, "MATLAB_sparse", 0)), 0};
    return v;
  }
  v.cls = (cls.empty() || cls == "struct") ? MatClass::kStruct : MatClass::kObject;
  if (v.cls == MatClass::kObject) v.class_name = cls;
  v.array.dims = {1, 1};

  const std::vector<std::string> links = link_names(g);
  std::vector<std::string> order = read_field_order(g);
  order.erase(std::remove_if(order.begin(), order.end(),
                             [&](const std::string& f) {
                               return std::find(links.begin(), links.end(), f) == links.end();
                             }),
              order.end());
  for (const auto& l : links) {
    if (std::find(order.begin(), order.end(), l) == order.end()) order.push_back(l);
  }

  for (const auto& f : order) {
    v.field_names.push_back(f);
    v.field_values.push_back(read_object(g, f));
  }
  return v;
}

MatValue read_object(const H5::H5Location& loc, const std::string& name) {
  const H5O_type_t t = loc.childObjType(name);
  if (t == H5O_TYPE_GROUP) {
    H5::Group g = loc.openGroup(name);
    return read_group(g);
  }
  if (t == H5O_TYPE_DATASET) {
    H5::DataSet ds = loc.openDataSet(name);
    return read_dataset(ds);
  }
  MatValue v;
  v.cls = MatClass::kUnknown;
  v.array.dims = {0, 0};
  return v;
}

} // namespace

RecordSet Mat73Reader::read(const std::string& path) {
  H5::Exception::dontPrint();

  RecordSet records;
  try {
    H5::H5File file(path, H5F_ACC_RDONLY);
    H5::Group root = file.openGroup("/");
    for (const auto& name : link_names(root)) {
      if (!name.empty() && name[0] == '#') continue;
      records.push_back(ChannelRecord{name, read_object(root, name)});
    }
  } catch (const H5::Exception& e) {
    throw LoadError("Failed to read MAT v7.3 (HDF5) file " + path + ": " + e.getDetailMsg());
  }
  return records;
}

} // namespace mat2nwb
