#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string_view>

// Data handed to us by the AR tracking system. We only read it.
namespace tabletop::placement::core {

//! Semantic label of a detected plane, if the tracker provides one.
enum class PlaneClassification { None, Wall, Floor, Ceiling, Table, Seat, Unknown };

//! Human readable label for UI feedback. Empty for PlaneClassification::None.
std::string_view description(PlaneClassification classification);

//! A tracked, roughly planar real-world surface.
struct PlaneAnchor {
	cv::Matx44f transform{cv::Matx44f::eye()}; //!< Plane to world (rotation + translation).
	cv::Vec3f center{0.f, 0.f, 0.f};           //!< Center of the detected extent in plane coordinates.
	cv::Vec3f extent{0.f, 0.f, 0.f};           //!< Full width (x) and depth (z) of the plane in plane coordinates. y is unused.
	PlaneClassification classification{PlaneClassification::None};
};

//! Kind of surface a hit test result came from. Values are bit flags so sets can be requested.
enum class HitTestType : unsigned {
	FeaturePoint             = 1u << 0u, //!< Point the tracker believes is part of a continuous surface.
	EstimatedHorizontalPlane = 1u << 1u, //!< Plane without an anchor.
	ExistingPlane            = 1u << 2u, //!< Anchored plane, extent ignored.
	ExistingPlaneUsingExtent = 1u << 3u, //!< Anchored plane, hit within its extent.
};

constexpr HitTestType operator|(const HitTestType lhs, const HitTestType rhs) {
	return static_cast<HitTestType>(static_cast<unsigned>(lhs) | static_cast<unsigned>(rhs));
}

//! Check if @p types contains @p type.
constexpr bool hasType(const HitTestType types, const HitTestType type) {
	return (static_cast<unsigned>(types) & static_cast<unsigned>(type)) != 0u;
}

//! Intersection of a screen-space ray with the detected world.
struct HitTestResult {
	HitTestType type{HitTestType::FeaturePoint};
	cv::Matx44f worldTransform{cv::Matx44f::eye()}; //!< Pose of the hit point in world coordinates.
	float distance{0.f};                            //!< Distance from the camera to the hit point.
	std::optional<PlaneAnchor> plane{};             //!< Plane the hit belongs to, if it is anchored.
};

//! One hit-test observation, consumed by the board stabilizer.
struct Sample {
	cv::Vec3f worldPosition{0.f, 0.f, 0.f};
	std::optional<PlaneAnchor> plane{};
	float cameraYaw{0.f}; //!< Camera rotation about the up axis (radians).
};

//! All values finite and extents not negative.
bool isValidPlane(const PlaneAnchor& plane);

//! All values finite, distance not negative and the attached plane (if any) valid.
bool isValidHit(const HitTestResult& hit);

} // namespace tabletop::placement::core
