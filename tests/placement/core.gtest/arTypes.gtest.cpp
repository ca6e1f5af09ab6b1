#include "placement/core/arTypes.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <limits>

namespace tabletop::placement::core {
namespace gtest {

TEST(ArTypes, Classification_Description) {
	EXPECT_EQ(description(PlaneClassification::None), "");
	EXPECT_EQ(description(PlaneClassification::Wall), "Wall");
	EXPECT_EQ(description(PlaneClassification::Floor), "Floor");
	EXPECT_EQ(description(PlaneClassification::Ceiling), "Ceiling");
	EXPECT_EQ(description(PlaneClassification::Table), "Table");
	EXPECT_EQ(description(PlaneClassification::Seat), "Seat");
	EXPECT_EQ(description(PlaneClassification::Unknown), "Unknown");
}

TEST(ArTypes, Hit_Type_Flags) {
	constexpr HitTestType types = HitTestType::EstimatedHorizontalPlane | HitTestType::ExistingPlaneUsingExtent;
	static_assert(hasType(types, HitTestType::EstimatedHorizontalPlane));

	EXPECT_TRUE(hasType(types, HitTestType::ExistingPlaneUsingExtent));
	EXPECT_FALSE(hasType(types, HitTestType::ExistingPlane));
	EXPECT_FALSE(hasType(types, HitTestType::FeaturePoint));
}

TEST(ArTypes, Hit_Validation) {
	HitTestResult hit{};
	hit.distance = 1.2f;
	EXPECT_TRUE(isValidHit(hit));

	hit.distance = -0.1f;
	EXPECT_FALSE(isValidHit(hit));

	hit.distance                = 1.f;
	hit.worldTransform(1, 3)    = std::numeric_limits<float>::quiet_NaN();
	EXPECT_FALSE(isValidHit(hit));

	hit.worldTransform = cv::Matx44f::eye();
	hit.plane          = PlaneAnchor{};
	hit.plane->extent  = {1.f, 0.f, 2.f};
	EXPECT_TRUE(isValidHit(hit));

	hit.plane->extent = {1.f, 0.f, -2.f};
	EXPECT_FALSE(isValidHit(hit));

	hit.plane->extent = {std::numeric_limits<float>::infinity(), 0.f, 2.f};
	EXPECT_FALSE(isValidPlane(*hit.plane));
	EXPECT_FALSE(isValidHit(hit));
}

} // namespace gtest
} // namespace tabletop::placement::core
