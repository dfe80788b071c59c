#pragma once

#include "mat2nwb/types.hpp"

#include <cstddef>
#include <vector>

namespace mat2nwb {

// Layout transforms for arrays bound for an NWB TimeSeries.
//
// All functions here are pure layout changes: element values and element
// count are never modified. Axes are MATLAB-style and 1-based where they are
// part of the public contract (target axis 1 = rows, 2 = columns).
//
// Heuristic (best-effort, not a correctness guarantee): for arrays that are
// not vectors, the longest dimension is assumed to be the time axis.

enum class OrientationChange {
  kNone,
  kTransposed,
  kPermuted,
};

struct OrientedArray {
  NumericArray array;
  OrientationChange change{OrientationChange::kNone};
  int time_axis{1};  // 1-based MATLAB axis along which time varies
};

// 2-D transpose. Throws std::invalid_argument for arrays with more than two
// dimensions.
NumericArray transpose(const NumericArray& a);

// MATLAB permute(): order is a 0-based permutation of the array's axes;
// output dims[k] = input dims[order[k]]. Throws std::invalid_argument if
// order is not a permutation of 0..ndims-1.
NumericArray permute(const NumericArray& a, const std::vector<std::size_t>& order);

// Orient a vector so it varies along target_axis (1 => column Nx1,
// 2 => row 1xN). Non-vectors are returned unchanged. Throws
// std::invalid_argument for any other target axis.
OrientedArray orient_vector(const NumericArray& a, int target_axis);

// Put the longest dimension first:
// - 2-D: transpose if the first dimension is shorter than the longest one
// - N-D (N > 2): swap the (first) longest dimension with axis 0
OrientedArray make_time_major(const NumericArray& a);

// Vectors -> orient_vector(a, target_axis); everything else ->
// make_time_major(a) (time axis 1).
OrientedArray orient_for_output(const NumericArray& a, int target_axis);

const char* orientation_change_name(OrientationChange c);

} // namespace mat2nwb
