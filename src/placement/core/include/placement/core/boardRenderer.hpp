#pragma once

#include "placement/core/arTypes.hpp"
#include "placement/core/boardOutline.hpp"
#include "placement/core/boardStabilizer.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <optional>
#include <vector>

// The renderer reads a board transform and produces geometry. It does not own or modify board state.
namespace tabletop::placement::core {

enum class QuadKind { Border, Fill };

//! Flat quad in world coordinates, corners in winding order.
struct BoardQuad {
	QuadKind kind{QuadKind::Border};
	std::array<cv::Vec3f, 4> corners{};
	float opacity{1.f};
};

//! Settings for the top-down debug view (looking down the -Y axis, +X right, +Z down in the image).
struct RenderSettings {
	cv::Size imageSize{800, 800};
	float pixelsPerUnit{100.f};           //!< Image pixels per world unit.
	cv::Vec3f viewCenter{0.f, 0.f, 0.f};  //!< World point shown at the image center.
	cv::Scalar background{20, 20, 20};    //!< BGR.
	cv::Scalar planeColor{200, 140, 60};  //!< BGR. Plane footprint outline.
	cv::Scalar borderColor{255, 255, 255}; //!< BGR.
	cv::Scalar fillColor{0, 200, 0};      //!< BGR.
};

//! Board coordinates to world: T(position) * R_y(yaw) * S(scale).
cv::Matx44f boardToWorld(const BoardTransform& transform);

//! Board outline placed in the world. Border segments first, fill last.
std::vector<BoardQuad> buildBoardQuads(const BoardTransform& transform, const BoardOutline& outline);

//! Corners of the plane's detected extent in world coordinates.
std::array<cv::Vec3f, 4> planeFootprint(const PlaneAnchor& plane);

//! Project a world point into the top-down image.
cv::Point2f toImage(const cv::Vec3f& world, const RenderSettings& settings);

/*! Draw the board (and the plane it sits on) from above.
 * \param [in] quads    Output of buildBoardQuads.
 * \param [in] plane    Plane to outline, if known.
 * \param [in] settings View settings.
 * \return     BGR image of settings.imageSize.
 */
cv::Mat drawTopDown(const std::vector<BoardQuad>& quads, const std::optional<PlaneAnchor>& plane, const RenderSettings& settings = RenderSettings{});

} // namespace tabletop::placement::core
