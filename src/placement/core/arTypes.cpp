#include "placement/core/arTypes.hpp"

#include <cmath>

namespace tabletop::placement::core {

namespace {

template <int M, int N>
static bool isFinite(const cv::Matx<float, M, N>& values) {
	for (int i = 0; i < M * N; ++i) {
		if (!std::isfinite(values.val[i])) {
			return false;
		}
	}
	return true;
}

} // namespace

std::string_view description(const PlaneClassification classification) {
	switch (classification) {
	case PlaneClassification::Wall:
		return "Wall";
	case PlaneClassification::Floor:
		return "Floor";
	case PlaneClassification::Ceiling:
		return "Ceiling";
	case PlaneClassification::Table:
		return "Table";
	case PlaneClassification::Seat:
		return "Seat";
	case PlaneClassification::Unknown:
		return "Unknown";
	case PlaneClassification::None:
		break;
	}
	return "";
}

bool isValidPlane(const PlaneAnchor& plane) {
	if (!isFinite(plane.transform) || !isFinite(plane.center) || !isFinite(plane.extent)) {
		return false;
	}
	return plane.extent[0] >= 0.f && plane.extent[2] >= 0.f;
}

bool isValidHit(const HitTestResult& hit) {
	if (!isFinite(hit.worldTransform) || !std::isfinite(hit.distance) || hit.distance < 0.f) {
		return false;
	}
	return !hit.plane || isValidPlane(*hit.plane);
}

} // namespace tabletop::placement::core
