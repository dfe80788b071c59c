#include "mat2nwb/errors.hpp"
#include "mat2nwb/mat73_reader.hpp"
#include "mat2nwb/reader.hpp"

#include "test_support.hpp"

#include <H5Cpp.h>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mat2nwb;

namespace {

void put_class(H5::H5Object& obj, const std::string& cls) {
  H5::StrType t(H5::PredType::C_S1, cls.size());
  H5::Attribute a = obj.createAttribute("MATLAB_class", t, H5::DataSpace(H5S_SCALAR));
  a.write(t, cls);
}

void put_fields(H5::Group& g, const std::vector<std::string>& names) {
  H5::VarLenType t(H5::PredType::C_S1);
  const hsize_t n = names.size();
  H5::DataSpace sp(1, &n);
  std::vector<hvl_t> buf(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) {
    buf[i].len = names[i].size();
    buf[i].p = const_cast<char*>(names[i].data());
  }
  H5::Attribute a = g.createAttribute("MATLAB_fields", t, sp);
  a.write(t, buf.data());
}

// HDF5 dims are MATLAB dims reversed; `values` is already in MATLAB
// (column-major) order.
H5::DataSet put_doubles(H5::Group& g, const std::string& name, std::vector<hsize_t> hdims,
                        const std::vector<double>& values, const std::string& cls = "double") {
  H5::DataSpace sp(static_cast<int>(hdims.size()), hdims.data());
  H5::DataSet ds = g.createDataSet(name, H5::PredType::IEEE_F64LE, sp);
  ds.write(values.data(), H5::PredType::NATIVE_DOUBLE);
  if (!cls.empty()) put_class(ds, cls);
  return ds;
}

H5::DataSet put_char(H5::Group& g, const std::string& name, const std::string& text) {
  std::vector<std::uint16_t> units(text.begin(), text.end());
  const hsize_t hdims[2] = {units.size(), 1};
  H5::DataSpace sp(2, hdims);
  H5::DataSet ds = g.createDataSet(name, H5::PredType::STD_U16LE, sp);
  ds.write(units.data(), H5::PredType::NATIVE_UINT16);
  put_class(ds, "char");
  return ds;
}

// Stamp the 128-byte MAT header into the userblock.
void write_mat73_header(const std::string& path) {
  std::string text = "MATLAB 7.3 MAT-file, Platform: test, Created on: fixture HDF5 schema 1.00 .";
  text.resize(116, ' ');
  std::string hdr = text;
  hdr.append(8, '\0');
  hdr.push_back('\x00');
  hdr.push_back('\x02');
  hdr.push_back('I');
  hdr.push_back('M');

  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  if (!f) throw std::runtime_error("cannot open fixture: " + path);
  f.seekp(0);
  f.write(hdr.data(), static_cast<std::streamsize>(hdr.size()));
}

struct Complex {
  double re;
  double im;
};

void build_fixture(const std::string& path) {
  H5::FileCreatPropList fcpl;
  fcpl.setUserblock(512);
  H5::H5File file(path, H5F_ACC_TRUNC, fcpl);
  H5::Group root = file.openGroup("/");

  // struct chan with MATLAB_fields giving the declaration order
  H5::Group chan = file.createGroup("/m1_VLS_ChR2");
  put_class(chan, "struct");
  put_fields(chan, {"times", "values", "note"});
  put_doubles(chan, "times", {3, 1}, {0.0, 0.5, 1.0});
  put_doubles(chan, "values", {2, 3}, {1, 2, 3, 4, 5, 6});
  put_char(chan, "note", "hi");
  put_doubles(chan, "zextra", {1, 1}, {42.0});

  // empty array: payload is the MATLAB size vector
  {
    const hsize_t n = 2;
    H5::DataSpace sp(1, &n);
    H5::DataSet ds = root.createDataSet("empty_var", H5::PredType::STD_U64LE, sp);
    const std::uint64_t sz[2] = {0, 3};
    ds.write(sz, H5::PredType::NATIVE_UINT64);
    put_class(ds, "double");
    H5::Attribute a = ds.createAttribute("MATLAB_empty", H5::PredType::STD_U8LE,
                                         H5::DataSpace(H5S_SCALAR));
    const std::uint8_t one = 1;
    a.write(H5::PredType::NATIVE_UINT8, &one);
  }

  // cell {[7 8], 'ok'} with contents under #refs#
  {
    H5::Group refs = file.createGroup("/#refs#");
    put_doubles(refs, "a", {2, 1}, {7.0, 8.0});
    put_char(refs, "b", "ok");

    hobj_ref_t r[2];
    file.reference(&r[0], "/#refs#/a");
    file.reference(&r[1], "/#refs#/b");
    const hsize_t hdims[2] = {2, 1};
    H5::DataSpace sp(2, hdims);
    H5::DataSet ds = root.createDataSet("trials", H5::PredType::STD_REF_OBJ, sp);
    ds.write(r, H5::PredType::STD_REF_OBJ);
    put_class(ds, "cell");
  }

  // complex double row
  {
    H5::CompType ct(sizeof(Complex));
    ct.insertMember("real", HOFFSET(Complex, re), H5::PredType::NATIVE_DOUBLE);
    ct.insertMember("imag", HOFFSET(Complex, im), H5::PredType::NATIVE_DOUBLE);
    const hsize_t hdims[2] = {2, 1};
    H5::DataSpace sp(2, hdims);
    H5::DataSet ds = root.createDataSet("z", ct, sp);
    const Complex vals[2] = {{1.5, 9.0}, {-2.5, 9.0}};
    ds.write(vals, ct);
    put_class(ds, "double");
  }

  // no MATLAB_class: class follows the stored type
  {
    const hsize_t n = 3;
    H5::DataSpace sp(1, &n);
    H5::DataSet ds = root.createDataSet("plain", H5::PredType::STD_I32LE, sp);
    const std::int32_t v[3] = {-1, 0, 1};
    ds.write(v, H5::PredType::NATIVE_INT32);
  }

  file.close();
  write_mat73_header(path);
}

const ChannelRecord* find(const RecordSet& rs, const std::string& name) {
  for (const auto& r : rs) {
    if (r.name == name) return &r;
  }
  return nullptr;
}

} // namespace

int main() {
  const mat2nwb_test::TempFile tmp("test_tmp_mat73_reader.mat");
  build_fixture(tmp.path);

  assert(detect_mat_format(tmp.path) == MatFormat::kV73);
  const RecordSet rs = read_mat_file_auto(tmp.path);

  // Internal "#refs#" is not a variable.
  assert(rs.size() == 5);
  assert(find(rs, "#refs#") == nullptr);

  {
    const ChannelRecord* chan = find(rs, "m1_VLS_ChR2");
    assert(chan && chan->value.cls == MatClass::kStruct);
    assert((chan->value.field_names ==
            std::vector<std::string>{"times", "values", "note", "zextra"}));

    const MatValue* t = chan->value.field("times");
    assert((t->array.dims == std::vector<std::size_t>{1, 3}));
    assert((t->array.data == std::vector<double>{0.0, 0.5, 1.0}));

    const MatValue* v = chan->value.field("values");
    assert((v->array.dims == std::vector<std::size_t>{3, 2}));
    assert(v->array.data[5] == 6.0);

    const MatValue* note = chan->value.field("note");
    assert(note->cls == MatClass::kChar);
    assert(note->text == "hi");
  }

  {
    const ChannelRecord* e = find(rs, "empty_var");
    assert(e->value.cls == MatClass::kDouble);
    assert((e->value.array.dims == std::vector<std::size_t>{0, 3}));
    assert(e->value.array.data.empty());
  }

  {
    const ChannelRecord* c = find(rs, "trials");
    assert(c->value.cls == MatClass::kCell);
    assert(c->value.cells.size() == 2);
    assert((c->value.cells[0].array.data == std::vector<double>{7.0, 8.0}));
    assert(c->value.cells[1].text == "ok");
  }

  {
    const ChannelRecord* z = find(rs, "z");
    assert(z->value.is_complex);
    assert((z->value.array.data == std::vector<double>{1.5, -2.5}));
  }

  {
    const ChannelRecord* p = find(rs, "plain");
    assert(p->value.cls == MatClass::kInt32);
    assert((p->value.array.dims == std::vector<std::size_t>{3, 1}));
    assert((p->value.array.data == std::vector<double>{-1, 0, 1}));
  }

  // A plain HDF5 file (no MAT header) is still routed to the HDF5 reader.
  {
    const mat2nwb_test::TempFile plain("test_tmp_mat73_plain.h5");
    {
      H5::H5File f(plain.path, H5F_ACC_TRUNC);
      H5::Group root = f.openGroup("/");
      put_doubles(root, "x", {2}, {1.0, 2.0}, "");
    }
    assert(detect_mat_format(plain.path) == MatFormat::kV73);
    const RecordSet prs = read_mat_file_auto(plain.path);
    assert(prs.size() == 1 && prs[0].name == "x");
    assert(prs[0].value.cls == MatClass::kDouble);
  }

  // An HDF5 file holding only internal groups has no variables.
  {
    const mat2nwb_test::TempFile hidden("test_tmp_mat73_hidden.mat");
    {
      H5::H5File f(hidden.path, H5F_ACC_TRUNC);
      f.createGroup("/#subsystem#");
    }
    Mat73Reader r;
    assert(r.read(hidden.path).empty());
    assert(mat2nwb_test::throws_as<LoadError>([&] { read_mat_file_auto(hidden.path); }));
  }

  return 0;
}
