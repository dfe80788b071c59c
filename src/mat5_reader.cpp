#include "mat2nwb/mat5_reader.hpp"

#include "mat2nwb/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace mat2nwb {

namespace {

// Data types (MAT-file format, table 1-1).
enum : std::uint32_t {
  miINT8 = 1,
  miUINT8 = 2,
  miINT16 = 3,
  miUINT16 = 4,
  miINT32 = 5,
  miUINT32 = 6,
  miSINGLE = 7,
  miDOUBLE = 9,
  miINT64 = 12,
  miUINT64 = 13,
  miMATRIX = 14,
  miCOMPRESSED = 15,
  miUTF8 = 16,
  miUTF16 = 17,
  miUTF32 = 18,
};

// Array classes (array flags, low byte).
enum : std::uint32_t {
  mxCELL = 1,
  mxSTRUCT = 2,
  mxOBJECT = 3,
  mxCHAR = 4,
  mxSPARSE = 5,
  mxDOUBLE = 6,
  mxSINGLE = 7,
  mxINT8 = 8,
  mxUINT8 = 9,
  mxINT16 = 10,
  mxUINT16 = 11,
  mxINT32 = 12,
  mxUINT32 = 13,
  mxINT64 = 14,
  mxUINT64 = 15,
  mxFUNCTION = 16,
  mxOPAQUE = 17,
};

constexpr std::uint32_t kFlagComplex = 0x0800;
constexpr std::uint32_t kFlagLogical = 0x0200;
constexpr std::size_t kHeaderBytes = 128;

struct Element {
  std::uint32_t type{0};
  std::uint32_t nbytes{0};
  const std::uint8_t* data{nullptr};
  std::size_t offset{0};  // file offset of the tag (for messages)
};

// Bounds-checked reader over one byte range. Multi-byte values are decoded
// explicitly with the file's byte order, independent of the host.
class ByteCursor {
public:
  ByteCursor(const std::uint8_t* data, std::size_t size, bool big_endian,
             std::size_t base_offset, const std::string* label)
      : data_(data), size_(size), big_endian_(big_endian), base_(base_offset), label_(label) {}

  std::size_t remaining() const { return size_ - pos_; }
  std::size_t offset() const { return base_ + pos_; }
  bool big_endian() const { return big_endian_; }

  const std::uint8_t* take(std::size_t n) {
    if (n > remaining()) {
      fail("element overruns its enclosing data (need " + std::to_string(n) + " bytes, " +
           std::to_string(remaining()) + " left)");
    }
    const std::uint8_t* p = data_ + pos_;
    pos_ += n;
    return p;
  }

  std::uint32_t u32() { return decode_u32(take(4), big_endian_); }

  // Data elements start on 8-byte boundaries relative to the range start.
  void align8() {
    const std::size_t pad = (8 - (pos_ % 8)) % 8;
    pos_ += std::min(pad, remaining());
  }

  [[noreturn]] void fail(const std::string& what) const {
    throw LoadError("MAT parse error in " + *label_ + " at offset " + std::to_string(offset()) +
                    ": " + what);
  }

  static std::uint16_t decode_u16(const std::uint8_t* p, bool be) {
    return be ? static_cast<std::uint16_t>((p[0] << 8) | p[1])
              : static_cast<std::uint16_t>(p[0] | (p[1] << 8));
  }

  static std::uint32_t decode_u32(const std::uint8_t* p, bool be) {
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      const int k = be ? i : 3 - i;
      v = (v << 8) | p[k];
    }
    return v;
  }

  static std::uint64_t decode_u64(const std::uint8_t* p, bool be) {
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
      const int k = be ? i : 7 - i;
      v = (v << 8) | p[k];
    }
    return v;
  }

private:
  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t pos_{0};
  bool big_endian_;
  std::size_t base_;
  const std::string* label_;
};

Element read_element(ByteCursor& c) {
  Element e;
  e.offset = c.offset();
  const std::uint32_t first = c.u32();
  if ((first >> 16) != 0) {
    // Small data element: type and size packed into one word, data in the
    // following 4 bytes.
    e.type = first & 0xFFFFu;
    e.nbytes = first >> 16;
    if (e.nbytes > 4) c.fail("invalid small data element size " + std::to_string(e.nbytes));
    e.data = c.take(4);
    return e;
  }
  e.type = first;
  e.nbytes = c.u32();
  e.data = c.take(e.nbytes);
  // Compressed elements are not padded.
  if (e.type != miCOMPRESSED) c.align8();
  return e;
}

std::size_t element_width(std::uint32_t type) {
  switch (type) {
    case miINT8:
    case miUINT8:
    case miUTF8:
      return 1;
    case miINT16:
    case miUINT16:
    case miUTF16:
      return 2;
    case miINT32:
    case miUINT32:
    case miSINGLE:
    case miUTF32:
      return 4;
    case miDOUBLE:
    case miINT64:
    case miUINT64:
      return 8;
    default:
      return 0;
  }
}

std::vector<double> element_to_doubles(const Element& e, const ByteCursor& c) {
  const std::size_t w = element_width(e.type);
  if (w == 0) c.fail("unsupported numeric data type " + std::to_string(e.type));
  const bool be = c.big_endian();
  const std::size_t n = e.nbytes / w;

  std::vector<double> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    const std::uint8_t* p = e.data + i * w;
    switch (e.type) {
      case miINT8: out[i] = static_cast<std::int8_t>(p[0]); break;
      case miUINT8:
      case miUTF8: out[i] = p[0]; break;
      case miINT16: out[i] = static_cast<std::int16_t>(ByteCursor::decode_u16(p, be)); break;
      case miUINT16:
      case miUTF16: out[i] = ByteCursor::decode_u16(p, be); break;
      case miINT32: out[i] = static_cast<std::int32_t>(ByteCursor::decode_u32(p, be)); break;
      case miUINT32:
      case miUTF32: out[i] = ByteCursor::decode_u32(p, be); break;
      case miSINGLE: {
        const std::uint32_t bits = ByteCursor::decode_u32(p, be);
        float f = 0.0f;
        std::memcpy(&f, &bits, sizeof(f));
        out[i] = f;
        break;
      }
      case miDOUBLE: {
        const std::uint64_t bits = ByteCursor::decode_u64(p, be);
        double d = 0.0;
        std::memcpy(&d, &bits, sizeof(d));
        out[i] = d;
        break;
      }
      case miINT64:
        out[i] = static_cast<double>(static_cast<std::int64_t>(ByteCursor::decode_u64(p, be)));
        break;
      case miUINT64: out[i] = static_cast<double>(ByteCursor::decode_u64(p, be)); break;
      default: break;
    }
  }
  return out;
}

std::string element_to_string(const Element& e) {
  std::string s(reinterpret_cast<const char*>(e.data), e.nbytes);
  const std::size_t nul = s.find('\0');
  if (nul != std::string::npos) s.resize(nul);
  return s;
}

void append_utf8(std::uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Char arrays are stored column-major; rows are joined with '\n'.
std::string char_units_to_text(const NumericArray& a, bool bytes_are_utf8) {
  const std::size_t rows = a.dim(0);
  const std::size_t cols = a.numel() / std::max<std::size_t>(rows, 1);
  std::string out;
  for (std::size_t r = 0; r < rows; ++r) {
    if (r) out.push_back('\n');
    for (std::size_t c = 0; c < cols; ++c) {
      const std::size_t idx = r + rows * c;
      if (idx >= a.data.size()) break;
      const std::uint32_t u = static_cast<std::uint32_t>(a.data[idx]);
      if (bytes_are_utf8) {
        out.push_back(static_cast<char>(u & 0xFFu));
      } else {
        append_utf8(u, &out);
      }
    }
  }
  return out;
}

MatClass numeric_class(std::uint32_t mx) {
  switch (mx) {
    case mxDOUBLE: return MatClass::kDouble;
    case mxSINGLE: return MatClass::kSingle;
    case mxINT8: return MatClass::kInt8;
    case mxUINT8: return MatClass::kUInt8;
    case mxINT16: return MatClass::kInt16;
    case mxUINT16: return MatClass::kUInt16;
    case mxINT32: return MatClass::kInt32;
    case mxUINT32: return MatClass::kUInt32;
    case mxINT64: return MatClass::kInt64;
    case mxUINT64: return MatClass::kUInt64;
    default: return MatClass::kUnknown;
  }
}

std::vector<std::uint8_t> inflate_element(const Element& e, const std::string& label) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  if (inflateInit(&zs) != Z_OK) {
    throw LoadError("zlib initialization failed while reading " + label);
  }
  zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(e.data));
  zs.avail_in = static_cast<uInt>(e.nbytes);

  std::vector<std::uint8_t> out;
  const std::size_t chunk = std::max<std::size_t>(static_cast<std::size_t>(e.nbytes) * 4, 4096);
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    const std::size_t old = out.size();
    out.resize(old + chunk);
    zs.next_out = reinterpret_cast<Bytef*>(out.data() + old);
    zs.avail_out = static_cast<uInt>(chunk);
    ret = inflate(&zs, Z_NO_FLUSH);
    out.resize(old + chunk - zs.avail_out);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&zs);
      throw LoadError("MAT parse error in " + label + " at offset " + std::to_string(e.offset) +
                      ": compressed variable is corrupt or truncated (zlib code " +
                      std::to_string(ret) + ")");
    }
  }
  inflateEnd(&zs);
  return out;
}

MatValue parse_matrix(const Element& m, const ByteCursor& parent, const std::string& label,
                      std::string* name_out);

MatValue parse_matrix_body(ByteCursor& c, const std::string& label, std::string* name_out) {
  MatValue v;

  const Element flags = read_element(c);
  if (flags.type != miUINT32 || flags.nbytes < 8) c.fail("missing array flags");
  const std::uint32_t f0 = ByteCursor::decode_u32(flags.data, c.big_endian());
  const std::uint32_t mx = f0 & 0xFFu;
  v.is_complex = (f0 & kFlagComplex) != 0;

  const Element dims = read_element(c);
  if (dims.type != miINT32 || dims.nbytes < 8) c.fail("missing dimensions array");
  const std::size_t nd = dims.nbytes / 4;
  v.array.dims.resize(nd);
  for (std::size_t i = 0; i < nd; ++i) {
    const std::int32_t d = static_cast<std::int32_t>(
        ByteCursor::decode_u32(dims.data + 4 * i, c.big_endian()));
    if (d < 0) c.fail("negative dimension");
    v.array.dims[i] = static_cast<std::size_t>(d);
  }
  while (v.array.dims.size() > 2 && v.array.dims.back() == 1) v.array.dims.pop_back();

  const Element name = read_element(c);
  if (name.type != miINT8 && name.type != miUINT8) c.fail("missing array name");
  if (name_out) *name_out = element_to_string(name);

  const std::size_t numel = v.array.numel();

  switch (mx) {
    case mxDOUBLE:
    case mxSINGLE:
    case mxINT8:
    case mxUINT8:
    case mxINT16:
    case mxUINT16:
    case mxINT32:
    case mxUINT32:
    case mxINT64:
    case mxUINT64: {
      v.cls = (f0 & kFlagLogical) ? MatClass::kLogical : numeric_class(mx);
      const Element re = read_element(c);
      v.array.data = element_to_doubles(re, c);
      if (v.array.data.size() != numel) {
        c.fail("real part has " + std::to_string(v.array.data.size()) + " values, expected " +
               std::to_string(numel));
      }
      // The imaginary part (if any) follows; only the real part is kept.
      break;
    }
    case mxCHAR: {
      v.cls = MatClass::kChar;
      if (numel > 0) {
        const Element txt = read_element(c);
        v.array.data = element_to_doubles(txt, c);
        const bool utf8 = txt.type == miUTF8 || txt.type == miINT8 || txt.type == miUINT8;
        v.text = char_units_to_text(v.array, utf8);
      }
      break;
    }
    case mxCELL: {
      v.cls = MatClass::kCell;
      v.cells.reserve(numel);
      for (std::size_t i = 0; i < numel; ++i) {
        const Element cell = read_element(c);
        if (cell.type != miMATRIX) c.fail("cell element is not a matrix");
        v.cells.push_back(parse_matrix(cell, c, label, nullptr));
      }
      break;
    }
    case mxOBJECT:
    case mxSTRUCT: {
      v.cls = (mx == mxOBJECT) ? MatClass::kObject : MatClass::kStruct;
      if (mx == mxOBJECT) {
        v.class_name = element_to_string(read_element(c));
      }
      const Element len_el = read_element(c);
      if (len_el.type != miINT32 || len_el.nbytes < 4) c.fail("missing field name length");
      const std::size_t len = ByteCursor::decode_u32(len_el.data, c.big_endian());
      const Element names = read_element(c);
      if (len == 0 && names.nbytes != 0) c.fail("zero field name length");
      const std::size_t nfields = (len == 0) ? 0 : names.nbytes / len;
      for (std::size_t k = 0; k < nfields; ++k) {
        std::string fname(reinterpret_cast<const char*>(names.data + k * len), len);
        const std::size_t nul = fname.find('\0');
        if (nul != std::string::npos) fname.resize(nul);
        v.field_names.push_back(fname);
      }
      for (std::size_t e = 0; e < numel; ++e) {
        for (std::size_t k = 0; k < nfields; ++k) {
          const Element fe = read_element(c);
          if (fe.type != miMATRIX) c.fail("struct field '" + v.field_names[k] + "' is not a matrix");
          MatValue fv = parse_matrix(fe, c, label, nullptr);
          if (e == 0) v.field_values.push_back(std::move(fv));
        }
      }
      break;
    }
    case mxSPARSE:
      v.cls = MatClass::kSparse;
      break;
    case mxFUNCTION:
      v.cls = MatClass::kFunction;
      break;
    default:
      v.cls = MatClass::kUnknown;
      break;
  }
  return v;
}

MatValue parse_matrix(const Element& m, const ByteCursor& parent, const std::string& label,
                      std::string* name_out) {
  if (m.nbytes == 0) {
    // Empty matrix: MATLAB writes a bare tag for [].
    MatValue v;
    v.cls = MatClass::kDouble;
    v.array.dims = {0, 0};
    if (name_out) name_out->clear();
    return v;
  }
  ByteCursor c(m.data, m.nbytes, parent.big_endian(), m.offset + 8, &label);
  return parse_matrix_body(c, label, name_out);
}

} // namespace

RecordSet Mat5Reader::read(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw LoadError("Failed to open MAT-file: " + path);
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                                  std::istreambuf_iterator<char>());
  if (f.bad()) throw LoadError("Failed to read MAT-file: " + path);
  return parse(bytes, path);
}

RecordSet Mat5Reader::parse(const std::vector<std::uint8_t>& bytes, const std::string& label) {
  if (bytes.size() < kHeaderBytes) {
    throw LoadError("Not a MAT-file (shorter than the 128-byte header): " + label);
  }

  bool big_endian = false;
  if (bytes[126] == 'I' && bytes[127] == 'M') {
    big_endian = false;
  } else if (bytes[126] == 'M' && bytes[127] == 'I') {
    big_endian = true;
  } else {
    throw LoadError("Not a MAT v5 file (bad endian indicator): " + label);
  }

  const std::uint16_t version = ByteCursor::decode_u16(bytes.data() + 124, big_endian);
  if (version != 0x0100) {
    throw LoadError("Unsupported MAT-file header version " + std::to_string(version) +
                    " in " + label);
  }

  RecordSet records;
  ByteCursor c(bytes.data() + kHeaderBytes, bytes.size() - kHeaderBytes, big_endian,
               kHeaderBytes, &label);
  while (c.remaining() >= 8) {
    const Element e = read_element(c);
    std::string name;
    MatValue v;

    if (e.type == miCOMPRESSED) {
      // Offsets inside a compressed variable are reported relative to its tag.
      const std::vector<std::uint8_t> inflated = inflate_element(e, label);
      ByteCursor ic(inflated.data(), inflated.size(), big_endian, e.offset, &label);
      const Element m = read_element(ic);
      if (m.type != miMATRIX) continue;
      v = parse_matrix(m, ic, label, &name);
    } else if (e.type == miMATRIX) {
      v = parse_matrix(e, c, label, &name);
    } else {
      continue;
    }

    if (name.empty()) continue;  // subsystem data
    records.push_back(ChannelRecord{name, std::move(v)});
  }

  return records;
}

} // namespace mat2nwb
