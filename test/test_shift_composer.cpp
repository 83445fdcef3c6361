// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "sbf_cloud/core/ShiftComposer.hpp"

using sbf_cloud::PointMatrix;
using sbf_cloud::ShiftComposer;
using sbf_cloud::Vec3;

namespace {

PointMatrix makeSurveyCloud(const Vec3& origin, std::size_t count) {
    PointMatrix points;
    points.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double d = static_cast<double>(i % 100) * 0.001;
        points.push_back({origin[0] + d, origin[1] - d, origin[2] + static_cast<double>(i / 100) * 0.001});
    }
    return points;
}

double roundTripError(const PointMatrix& points, const Vec3& global) {
    const Vec3 local = ShiftComposer::computeLocalShift(points, global);
    double worst = 0.0;
    for (const auto& point : points) {
        float stored[3];
        ShiftComposer::decompose(point, local, global, stored);
        const Vec3 restored = ShiftComposer::compose(stored, local, global);
        for (std::size_t axis = 0; axis < 3; ++axis) {
            worst = std::max(worst, std::abs(restored[axis] - point[axis]));
        }
    }
    return worst;
}

}  // namespace

TEST(ShiftComposerTest, LocalShiftIsCentroidRelativeToGlobal) {
    const PointMatrix points = {{10.0, 20.0, 30.0}, {12.0, 22.0, 34.0}};
    const Vec3 local = ShiftComposer::computeLocalShift(points, {1.0, 2.0, 3.0});
    EXPECT_DOUBLE_EQ(10.0, local[0]);
    EXPECT_DOUBLE_EQ(19.0, local[1]);
    EXPECT_DOUBLE_EQ(29.0, local[2]);
}

TEST(ShiftComposerTest, EmptyCloudHasZeroShift) {
    const Vec3 local = ShiftComposer::computeLocalShift({}, {5.0, 5.0, 5.0});
    EXPECT_EQ((Vec3{0.0, 0.0, 0.0}), local);
}

TEST(ShiftComposerTest, ComposeAddsBothShifts) {
    const float stored[3] = {0.5f, -0.25f, 2.0f};
    const Vec3 point = ShiftComposer::compose(stored, {10.0, 20.0, 5.0}, {500000.0, 4000000.0, 0.0});
    EXPECT_DOUBLE_EQ(500010.5, point[0]);
    EXPECT_DOUBLE_EQ(4000019.75, point[1]);
    EXPECT_DOUBLE_EQ(7.0, point[2]);

    EXPECT_DOUBLE_EQ(3.5, ShiftComposer::toTrue(0.5f, 1.0, 2.0));
    EXPECT_FLOAT_EQ(0.5f, ShiftComposer::toStored(3.5, 1.0, 2.0));
}

TEST(ShiftComposerTest, KeepsSubMillimetreAtTenMillionMetres) {
    const PointMatrix points = makeSurveyCloud({10000000.0, 10000000.0, 10000000.0}, 1000);

    EXPECT_LT(roundTripError(points, {0.0, 0.0, 0.0}), 1e-4);
    EXPECT_LT(roundTripError(points, {10000000.0, 10000000.0, 0.0}), 1e-4);
    EXPECT_LT(roundTripError(points, {9999000.0, 0.0, 10000000.0}), 1e-4);
}

TEST(ShiftComposerTest, AnyLocalShiftComposesConsistently) {
    // the centroid is only a choice made when writing
    const float stored[3] = {1.0f, 2.0f, 3.0f};
    const Vec3 a = ShiftComposer::compose(stored, {100.0, 0.0, 0.0}, {0.0, 0.0, 0.0});
    const Vec3 b = ShiftComposer::compose(stored, {0.0, 0.0, 0.0}, {100.0, 0.0, 0.0});
    EXPECT_EQ(a, b);
}
