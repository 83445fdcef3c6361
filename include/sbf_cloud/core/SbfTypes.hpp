// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CORE_SBF_TYPES_HPP
#define SBF_CLOUD_CORE_SBF_TYPES_HPP

#include <array>
#include <cstddef>
#include <vector>

namespace sbf_cloud {

// x, y, z in double precision (true coordinates and shifts)
using Vec3 = std::array<double, 3>;

using PointMatrix = std::vector<Vec3>;

// Number of coordinate columns preceding the scalar fields in a payload row
constexpr std::size_t kCoordinateColumns = 3;

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_CORE_SBF_TYPES_HPP
