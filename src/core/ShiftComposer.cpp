// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/core/ShiftComposer.hpp"

namespace sbf_cloud {

Vec3 ShiftComposer::computeLocalShift(const PointMatrix& points, const Vec3& global_shift) {
    Vec3 shift{0.0, 0.0, 0.0};
    if (points.empty()) {
        return shift;
    }

    Vec3 sum{0.0, 0.0, 0.0};
    for (const auto& point : points) {
        for (std::size_t i = 0; i < 3; ++i) {
            sum[i] += point[i] - global_shift[i];
        }
    }

    const double count = static_cast<double>(points.size());
    for (std::size_t i = 0; i < 3; ++i) {
        shift[i] = sum[i] / count;
    }
    return shift;
}

void ShiftComposer::decompose(const Vec3& point, const Vec3& local_shift, const Vec3& global_shift,
                              float* stored) {
    for (std::size_t i = 0; i < 3; ++i) {
        stored[i] = toStored(point[i], local_shift[i], global_shift[i]);
    }
}

Vec3 ShiftComposer::compose(const float* stored, const Vec3& local_shift, const Vec3& global_shift) {
    return {toTrue(stored[0], local_shift[0], global_shift[0]),
            toTrue(stored[1], local_shift[1], global_shift[1]),
            toTrue(stored[2], local_shift[2], global_shift[2])};
}

}  // namespace sbf_cloud
