#include "placement/core/transform.hpp"

#include <cmath>

namespace tabletop::placement::core {

cv::Vec3f translation(const cv::Matx44f& transform) {
	return {transform(0, 3), transform(1, 3), transform(2, 3)};
}

cv::Vec3f xAxis(const cv::Matx44f& transform) {
	return {transform(0, 0), transform(1, 0), transform(2, 0)};
}

float yawAngle(const cv::Matx44f& transform) {
	// R_y(a) maps +X to (cos a, 0, -sin a).
	return std::atan2(-transform(2, 0), transform(0, 0));
}

cv::Vec3f rightVector(const float yaw) {
	return {std::cos(yaw), 0.f, -std::sin(yaw)};
}

cv::Vec3f transformPoint(const cv::Matx44f& transform, const cv::Vec3f& point) {
	const cv::Vec4f p = transform * cv::Vec4f(point[0], point[1], point[2], 1.f);
	return {p[0], p[1], p[2]};
}

cv::Matx44f makeTranslation(const cv::Vec3f& offset) {
	cv::Matx44f m = cv::Matx44f::eye();
	m(0, 3)       = offset[0];
	m(1, 3)       = offset[1];
	m(2, 3)       = offset[2];
	return m;
}

cv::Matx44f makeRotationY(const float angle) {
	const float c = std::cos(angle);
	const float s = std::sin(angle);
	// clang-format off
	return cv::Matx44f( c,   0.f, s,   0.f,
	                   0.f, 1.f, 0.f, 0.f,
	                  -s,   0.f, c,   0.f,
	                   0.f, 0.f, 0.f, 1.f);
	// clang-format on
}

cv::Matx44f makeScale(const float factor) {
	cv::Matx44f m = cv::Matx44f::eye();
	m(0, 0)       = factor;
	m(1, 1)       = factor;
	m(2, 2)       = factor;
	return m;
}

cv::Matx44f makeTransform(const cv::Vec3f& position, const float yaw, const float scale) {
	return makeTranslation(position) * makeRotationY(yaw) * makeScale(scale);
}

float normalizedAngle(const float angle, const float reference, const float increment) {
	if (!(increment > 0.f)) {
		return angle;
	}
	const float turns = std::round((angle - reference) / increment); //!< Whole increments between angle and reference.
	return angle - turns * increment;
}

} // namespace tabletop::placement::core
