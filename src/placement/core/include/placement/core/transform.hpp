#pragma once

#include <opencv2/core.hpp>

// Small affine helpers on top of the OpenCV fixed-size types.
// Convention: column vectors (p' = M * p), translation stored in the last column, Y is up.
// A positive yaw rotates +X towards -Z (right-handed rotation about +Y).
namespace tabletop::placement::core {

//! Translation part of an affine transform.
cv::Vec3f translation(const cv::Matx44f& transform);

//! Local +X axis of an affine transform (first rotation column, not normalised).
cv::Vec3f xAxis(const cv::Matx44f& transform);

//! Rotation about the up axis encoded in an affine transform.
//! The local X axis is projected onto the ground plane, pitch and roll are ignored.
float yawAngle(const cv::Matx44f& transform);

//! World direction of the local +X axis for a node rotated by @p yaw about the up axis.
cv::Vec3f rightVector(float yaw);

//! Apply an affine transform to a point (w = 1).
cv::Vec3f transformPoint(const cv::Matx44f& transform, const cv::Vec3f& point);

cv::Matx44f makeTranslation(const cv::Vec3f& offset);
cv::Matx44f makeRotationY(float angle);
cv::Matx44f makeScale(float factor);

//! Compose T(position) * R_y(yaw) * S(scale).
cv::Matx44f makeTransform(const cv::Vec3f& position, float yaw, float scale = 1.f);

/*! Pick the representative of @p angle modulo @p increment that is closest to @p reference.
 *  A rectangle looks the same after a half turn, so with increment pi two yaw angles that differ by pi are interchangeable.
 * \param [in] angle     Angle to normalise (radians).
 * \param [in] reference Angle the result should be close to (radians).
 * \param [in] increment Symmetry period (radians, > 0).
 * \return     angle + k * increment with |result - reference| <= increment / 2.
 */
float normalizedAngle(float angle, float reference, float increment);

} // namespace tabletop::placement::core
