#include "mat2nwb/orientation.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace mat2nwb {

NumericArray transpose(const NumericArray& a) {
  if (a.ndims() > 2) {
    throw std::invalid_argument("transpose: array has more than 2 dimensions");
  }
  const std::size_t rows = a.dim(0);
  const std::size_t cols = a.dim(1);

  NumericArray out;
  out.dims = {cols, rows};
  out.data.resize(a.data.size());
  for (std::size_t c = 0; c < cols; ++c) {
    for (std::size_t r = 0; r < rows; ++r) {
      // in(r, c) at r + rows*c  ->  out(c, r) at c + cols*r
      out.data[c + cols * r] = a.data[r + rows * c];
    }
  }
  return out;
}

NumericArray permute(const NumericArray& a, const std::vector<std::size_t>& order) {
  const std::size_t nd = a.ndims();
  if (order.size() != nd) {
    throw std::invalid_argument("permute: order length does not match the number of dimensions");
  }
  std::vector<bool> seen(nd, false);
  for (std::size_t k : order) {
    if (k >= nd || seen[k]) {
      throw std::invalid_argument("permute: order is not a permutation of the array axes");
    }
    seen[k] = true;
  }

  NumericArray out;
  out.dims.resize(nd);
  for (std::size_t k = 0; k < nd; ++k) out.dims[k] = a.dims[order[k]];
  out.data.resize(a.data.size());
  if (a.data.empty()) return out;

  // Column-major strides of the input.
  std::vector<std::size_t> in_stride(nd, 1);
  for (std::size_t k = 1; k < nd; ++k) in_stride[k] = in_stride[k - 1] * a.dims[k - 1];

  // Walk the output in storage order, tracking its multi-index.
  std::vector<std::size_t> idx(nd, 0);
  for (std::size_t lin = 0; lin < out.data.size(); ++lin) {
    std::size_t src = 0;
    for (std::size_t k = 0; k < nd; ++k) src += idx[k] * in_stride[order[k]];
    out.data[lin] = a.data[src];

    for (std::size_t k = 0; k < nd; ++k) {
      if (++idx[k] < out.dims[k]) break;
      idx[k] = 0;
    }
  }
  return out;
}

OrientedArray orient_vector(const NumericArray& a, int target_axis) {
  if (target_axis != 1 && target_axis != 2) {
    throw std::invalid_argument("orient_vector: target axis must be 1 or 2, got " +
                                std::to_string(target_axis));
  }

  OrientedArray r;
  r.array = a;
  r.time_axis = target_axis;
  if (!a.is_vector()) return r;

  const bool is_row = a.dims[0] == 1;
  const bool is_col = a.dims[1] == 1;
  if (is_row && is_col) return r;  // scalar

  if ((target_axis == 1 && is_row) || (target_axis == 2 && is_col)) {
    r.array = transpose(a);
    r.change = OrientationChange::kTransposed;
  }
  return r;
}

OrientedArray make_time_major(const NumericArray& a) {
  OrientedArray r;
  r.array = a;
  r.time_axis = 1;
  if (a.ndims() < 2) return r;

  const auto longest_it = std::max_element(a.dims.begin(), a.dims.end());
  const std::size_t longest = static_cast<std::size_t>(longest_it - a.dims.begin());
  if (a.dims[0] >= *longest_it) return r;

  if (a.ndims() == 2) {
    r.array = transpose(a);
    r.change = OrientationChange::kTransposed;
    return r;
  }

  std::vector<std::size_t> order(a.ndims());
  for (std::size_t k = 0; k < order.size(); ++k) order[k] = k;
  std::swap(order[0], order[longest]);
  r.array = permute(a, order);
  r.change = OrientationChange::kPermuted;
  return r;
}

OrientedArray orient_for_output(const NumericArray& a, int target_axis) {
  if (a.is_vector() || (target_axis != 1 && target_axis != 2)) {
    return orient_vector(a, target_axis);
  }
  return make_time_major(a);
}

const char* orientation_change_name(OrientationChange c) {
  switch (c) {
    case OrientationChange::kNone: return "none";
    case OrientationChange::kTransposed: return "transposed";
    case OrientationChange::kPermuted: return "permuted";
  }
  return "none";
}

} // namespace mat2nwb
