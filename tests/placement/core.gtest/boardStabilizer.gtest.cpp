#include "placement/core/boardStabilizer.hpp"
#include "placement/core/transform.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <numbers>
#include <vector>

namespace tabletop::placement::core {
namespace gtest {

static constexpr float PI         = std::numbers::pi_v<float>;
static constexpr float TOLERANCE  = 1e-4f;
static constexpr float ASPECT     = 1.8f; //!< 2.7 / 1.5, the default board.

//! Sample without a plane (camera fallback).
static Sample cameraSample(const cv::Vec3f& position, float cameraYaw = 0.f) {
	return Sample{position, std::nullopt, cameraYaw};
}

//! Horizontal plane through the origin with the given extent (x, z).
static PlaneAnchor makePlane(float extentX, float extentZ, const cv::Matx44f& transform = cv::Matx44f::eye()) {
	PlaneAnchor plane{};
	plane.transform = transform;
	plane.extent    = {extentX, 0.f, extentZ};
	return plane;
}

static void expectNear(const cv::Vec3f& actual, const cv::Vec3f& expected, float tolerance = TOLERANCE) {
	EXPECT_NEAR(actual[0], expected[0], tolerance);
	EXPECT_NEAR(actual[1], expected[1], tolerance);
	EXPECT_NEAR(actual[2], expected[2], tolerance);
}

TEST(Stabilizer, Initial_State) {
	const BoardStabilizer stabilizer(ASPECT);
	const BoardState& state = stabilizer.state();

	EXPECT_FLOAT_EQ(state.scale, 0.3f);
	EXPECT_FLOAT_EQ(state.yawAngle, 0.f);
	EXPECT_TRUE(state.recentPositions.empty());
	EXPECT_TRUE(state.recentYawAngles.empty());
	EXPECT_EQ(state.recentPositions.capacity(), 10u);
	EXPECT_EQ(state.recentYawAngles.capacity(), 20u);
}

// Position is the plain mean of every sample as long as the window is not full.
TEST(Stabilizer, Position_Mean_Of_First_Ten_Samples) {
	BoardStabilizer stabilizer(ASPECT);

	const std::vector<cv::Vec3f> positions = {
	        {1.f, 0.f, -2.f}, {1.4f, 0.1f, -2.2f}, {0.8f, -0.1f, -1.9f}, {1.1f, 0.f, -2.05f}, {0.9f, 0.05f, -2.1f},
	        {1.2f, 0.f, -1.8f}, {1.05f, -0.05f, -2.f}, {0.95f, 0.f, -2.3f}, {1.3f, 0.02f, -1.95f}, {1.f, 0.f, -2.f},
	};

	cv::Vec3f sum{0.f, 0.f, 0.f};
	for (std::size_t i = 0; i < positions.size(); ++i) {
		stabilizer.update(cameraSample(positions[i]));
		sum += positions[i];
		expectNear(stabilizer.state().position, sum / static_cast<float>(i + 1));
	}
	EXPECT_EQ(stabilizer.state().recentPositions.size(), 10u);
}

TEST(Stabilizer, First_Sample_Seeds_Position) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.update(cameraSample({0.25f, -1.f, 3.5f}));
	expectNear(stabilizer.state().position, {0.25f, -1.f, 3.5f});
}

TEST(Stabilizer, Eleventh_Sample_Evicts_Oldest) {
	BoardStabilizer stabilizer(ASPECT);
	for (int i = 1; i <= 11; ++i) {
		stabilizer.update(cameraSample({static_cast<float>(i), 0.f, static_cast<float>(-2 * i)}));
	}

	// Mean of 2..11.
	expectNear(stabilizer.state().position, {6.5f, 0.f, -13.f});
	EXPECT_EQ(stabilizer.state().recentPositions.size(), 10u);
	expectNear(stabilizer.state().recentPositions.oldest(), {2.f, 0.f, -4.f});
}

TEST(Stabilizer, Scale_Gesture_Is_Clamped) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.scaleBy(5.f / 0.3f);
	EXPECT_NEAR(stabilizer.state().scale, 5.f, TOLERANCE);

	stabilizer.scaleBy(10.f);
	EXPECT_FLOAT_EQ(stabilizer.state().scale, 11.f);

	stabilizer.scaleBy(0.01f);
	EXPECT_FLOAT_EQ(stabilizer.state().scale, 0.3f);

	// Repeated gestures never leave the range.
	for (int i = 0; i < 50; ++i) {
		stabilizer.scaleBy(i % 2 == 0 ? 3.f : 0.2f);
		EXPECT_GE(stabilizer.state().scale, 0.3f);
		EXPECT_LE(stabilizer.state().scale, 11.f);
	}
}

TEST(Stabilizer, Camera_Fallback_Resets_Scale) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.scaleBy(10.f);
	ASSERT_GT(stabilizer.state().scale, 0.3f);

	stabilizer.update(cameraSample({0.f, 0.f, -1.f}, 0.4f));
	EXPECT_FLOAT_EQ(stabilizer.state().scale, 0.3f);
	EXPECT_NEAR(stabilizer.state().yawAngle, 0.4f, TOLERANCE);
}

TEST(Stabilizer, Fit_To_Extent_Keeps_Aspect_Ratio) {
	const BoardFit fit = fitToExtent(2.f, 1.f, ASPECT, 11.f);
	EXPECT_NEAR(fit.depth, 1.f, TOLERANCE);
	EXPECT_NEAR(fit.width, 1.f / ASPECT, TOLERANCE);

	// Wide enough in depth: width limited by the plane's width.
	const BoardFit narrow = fitToExtent(1.f, 4.f, ASPECT, 11.f);
	EXPECT_NEAR(narrow.width, 1.f, TOLERANCE);
	EXPECT_NEAR(narrow.depth, ASPECT, TOLERANCE);

	// Huge plane: width limited by the maximum scale.
	const BoardFit huge = fitToExtent(100.f, 100.f, ASPECT, 11.f);
	EXPECT_NEAR(huge.width, 11.f, TOLERANCE);
	EXPECT_NEAR(huge.depth, 11.f * ASPECT, 1e-3f);
}

TEST(Stabilizer, Contain_Moves_By_Exact_Overhang) {
	const PlaneAnchor plane = makePlane(2.f, 2.f);
	const cv::Vec3f boardExtent{1.f, 0.f, 1.f};

	// +X side overhangs by 0.3.
	const auto adjusted = containWithinPlane(plane, {0.8f, 0.f, 0.f}, boardExtent);
	ASSERT_TRUE(adjusted.has_value());
	expectNear(*adjusted, {0.5f, 0.f, 0.f});

	// -Z side overhangs by 0.2, X untouched.
	const auto adjustedZ = containWithinPlane(plane, {0.1f, 0.f, -0.7f}, boardExtent);
	ASSERT_TRUE(adjustedZ.has_value());
	expectNear(*adjustedZ, {0.1f, 0.f, -0.5f});

	// Both axes at once.
	const auto adjustedXZ = containWithinPlane(plane, {-0.9f, 0.f, 0.75f}, boardExtent);
	ASSERT_TRUE(adjustedXZ.has_value());
	expectNear(*adjustedXZ, {-0.5f, 0.f, 0.5f});

	EXPECT_FALSE(containWithinPlane(plane, {0.2f, 0.f, -0.3f}, boardExtent).has_value());
}

TEST(Stabilizer, Contain_Works_In_Plane_Coordinates) {
	// Plane moved to x=5 and turned a quarter turn: its local +X points along world -Z.
	const PlaneAnchor plane = makePlane(2.f, 2.f, makeTransform({5.f, 0.f, 0.f}, PI / 2.f));
	const cv::Vec3f boardExtent{1.f, 0.f, 1.f};

	// Local (0.8, 0, 0) overhangs the local +X side by 0.3.
	const auto adjusted = containWithinPlane(plane, {5.f, 0.f, -0.8f}, boardExtent);
	ASSERT_TRUE(adjusted.has_value());
	expectNear(*adjusted, {5.f, 0.f, -0.5f});
}

TEST(Stabilizer, Contain_Respects_Plane_Center) {
	PlaneAnchor plane = makePlane(2.f, 2.f);
	plane.center      = {1.f, 0.f, 0.f}; // Plane spans x in [0, 2].

	const auto adjusted = containWithinPlane(plane, {0.2f, 0.f, 0.f}, {1.f, 0.f, 1.f});
	ASSERT_TRUE(adjusted.has_value());
	expectNear(*adjusted, {0.5f, 0.f, 0.f});
}

// Board hangs over the plane after smoothing: it is pulled inside, the position window keeps the raw sample.
TEST(Stabilizer, Update_Pulls_Board_Inside_Plane) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.update(Sample{{0.3f, 0.f, 0.f}, makePlane(1.f, 2.f), 0.f});

	const BoardState& state = stabilizer.state();
	EXPECT_NEAR(state.yawAngle, 0.f, TOLERANCE);
	EXPECT_NEAR(state.scale, 1.f, TOLERANCE);
	expectNear(state.position, {0.f, 0.f, 0.f});
	expectNear(state.recentPositions.newest(), {0.3f, 0.f, 0.f});
}

// Plane wider than deep: the board turns a quarter and its extent is read along the swapped axes.
TEST(Stabilizer, Update_Aligns_Long_Side_With_Plane) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.update(Sample{{0.f, 0.f, 0.f}, makePlane(2.f, 1.f), 0.2f});

	const BoardState& state = stabilizer.state();
	EXPECT_NEAR(state.yawAngle, PI / 2.f, TOLERANCE);
	EXPECT_NEAR(state.scale, 1.f, TOLERANCE);
	expectNear(state.position, {0.f, 0.f, 0.f});
}

// Plane yaw is taken modulo a half turn, whichever is closer to the camera.
TEST(Stabilizer, Update_Faces_Camera) {
	const PlaneAnchor plane = makePlane(1.f, 3.f, makeRotationY(0.3f));

	BoardStabilizer towards(ASPECT);
	towards.update(Sample{{0.f, 0.f, 0.f}, plane, 0.f});
	EXPECT_NEAR(towards.state().yawAngle, 0.3f, TOLERANCE);

	BoardStabilizer behind(ASPECT);
	behind.update(Sample{{0.f, 0.f, 0.f}, plane, PI});
	EXPECT_NEAR(behind.state().yawAngle, 0.3f + PI, TOLERANCE);
}

TEST(Stabilizer, Rotation_Averages_Recent_Angles) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.update(cameraSample({0.f, 0.f, 0.f}, 0.1f));
	stabilizer.update(cameraSample({0.f, 0.f, 0.f}, 1.0f));

	EXPECT_NEAR(stabilizer.state().yawAngle, 0.55f, TOLERANCE);
	EXPECT_NEAR(stabilizer.state().recentYawAngles.oldest(), 0.1f, TOLERANCE);
}

// A target across the half-turn rewrites the window first, the mean stays near the target.
TEST(Stabilizer, Rotation_Flip_Guard) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.update(cameraSample({0.f, 0.f, 0.f}, 0.1f));

	const float target = PI - 0.05f;
	stabilizer.update(cameraSample({0.f, 0.f, 0.f}, target));

	const BoardState& state = stabilizer.state();
	ASSERT_EQ(state.recentYawAngles.size(), 2u);
	EXPECT_NEAR(state.recentYawAngles.oldest(), 0.1f + PI, TOLERANCE);
	EXPECT_NEAR(state.yawAngle, (0.1f + PI + target) / 2.f, TOLERANCE);
	EXPECT_GT(state.yawAngle, PI / 2.f + 1.f); // Naive mean would be ~1.6.
}

TEST(Stabilizer, Rotation_Window_Holds_Twenty) {
	BoardStabilizer stabilizer(ASPECT);
	for (int i = 0; i < 25; ++i) {
		stabilizer.update(cameraSample({0.f, 0.f, 0.f}, 0.01f * static_cast<float>(i)));
	}
	EXPECT_EQ(stabilizer.state().recentYawAngles.size(), 20u);
	EXPECT_NEAR(stabilizer.state().recentYawAngles.oldest(), 0.05f, TOLERANCE);
	EXPECT_NEAR(stabilizer.state().yawAngle, 0.01f * (5.f + 24.f) / 2.f, TOLERANCE);
}

TEST(Stabilizer, Rotate_Gesture_Is_Direct) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.rotateBy(0.2f);
	EXPECT_NEAR(stabilizer.state().yawAngle, -0.2f, TOLERANCE);

	stabilizer.rotateBy(0.5f, true);
	EXPECT_NEAR(stabilizer.state().yawAngle, 0.3f, TOLERANCE);
	EXPECT_TRUE(stabilizer.state().recentYawAngles.empty());
}

TEST(Stabilizer, Move_Bypasses_Position_Window) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.update(cameraSample({1.f, 0.f, 1.f}));
	stabilizer.moveTo({3.f, 0.f, -2.f});

	expectNear(stabilizer.state().position, {3.f, 0.f, -2.f});
	ASSERT_EQ(stabilizer.state().recentPositions.size(), 1u);
	expectNear(stabilizer.state().recentPositions.newest(), {1.f, 0.f, 1.f});
}

TEST(Stabilizer, Custom_Config) {
	StabilizerConfig config{};
	config.positionWindow = 2u;
	config.minimumScale   = 0.5f;
	config.maximumScale   = 2.f;

	BoardStabilizer stabilizer(ASPECT, config);
	EXPECT_FLOAT_EQ(stabilizer.state().scale, 0.5f);

	stabilizer.update(cameraSample({0.f, 0.f, 0.f}));
	stabilizer.update(cameraSample({2.f, 0.f, 0.f}));
	stabilizer.update(cameraSample({4.f, 0.f, 0.f}));
	expectNear(stabilizer.state().position, {3.f, 0.f, 0.f});

	stabilizer.scaleBy(100.f);
	EXPECT_FLOAT_EQ(stabilizer.state().scale, 2.f);
}

TEST(Stabilizer, Transform_Reflects_State) {
	BoardStabilizer stabilizer(ASPECT);
	stabilizer.update(cameraSample({0.5f, 0.f, -1.f}, 0.7f));

	const BoardTransform transform = stabilizer.transform();
	expectNear(transform.position, stabilizer.state().position);
	EXPECT_FLOAT_EQ(transform.yaw, stabilizer.state().yawAngle);
	EXPECT_FLOAT_EQ(transform.scale, stabilizer.state().scale);
}

} // namespace gtest
} // namespace tabletop::placement::core
