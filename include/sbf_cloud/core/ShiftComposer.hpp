// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CORE_SHIFT_COMPOSER_HPP
#define SBF_CLOUD_CORE_SHIFT_COMPOSER_HPP

#include "sbf_cloud/core/SbfTypes.hpp"

namespace sbf_cloud {

// true = stored + local_shift + global_shift, always evaluated in double.
class ShiftComposer {
public:
    // Centroid of (points - global_shift); zero for an empty cloud
    static Vec3 computeLocalShift(const PointMatrix& points, const Vec3& global_shift);

    static float toStored(double true_value, double local_shift, double global_shift) {
        return static_cast<float>(true_value - global_shift - local_shift);
    }

    static double toTrue(float stored, double local_shift, double global_shift) {
        return static_cast<double>(stored) + local_shift + global_shift;
    }

    static void decompose(const Vec3& point, const Vec3& local_shift, const Vec3& global_shift,
                          float* stored);
    static Vec3 compose(const float* stored, const Vec3& local_shift, const Vec3& global_shift);
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_CORE_SHIFT_COMPOSER_HPP
