#pragma once

#include "placement/core/arTypes.hpp"
#include "placement/core/recentHistory.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <numbers>
#include <optional>

// Stabilizing is what makes the board usable while placing it.
// Motivation: Hit tests against the detected world jitter from frame to frame, planes grow and shrink and the tracker may swap a
// plane's major axis. Rendering the raw results makes the board shake, spin and hang over the edge of the table.
// Process (per hit-test sample):
//   1) Position: trailing mean over the most recent positions.
//   2) Orientation: plane yaw (long side along the plane's long side, half-turn chosen towards the camera) or camera yaw without a
//      plane. Averaged over the most recent angles; the window is rewritten when the target jumps across a half-turn.
//   3) Scale: largest board of fixed aspect ratio that fits the plane's extent. Minimum scale without a plane.
//   4) Bounds: hard shift of the board so its footprint lies inside the plane. Not smoothed.
namespace tabletop::placement::core {

//! Tuning of the stabilizer. Defaults are empirically chosen, change with care.
struct StabilizerConfig {
	std::size_t positionWindow{10u};                             //!< Positions averaged for the board position.
	std::size_t rotationWindow{20u};                             //!< Yaw angles averaged for the board rotation.
	float minimumScale{0.3f};                                    //!< Smallest board width (world units).
	float maximumScale{11.0f};                                   //!< Largest board width (world units).
	float rotationFlipThreshold{std::numbers::pi_v<float> / 2.f}; //!< Target vs average yaw difference that rewrites the yaw window.
	float axisFlipDotThreshold{0.5f};                            //!< |dot(plane X, board right)| below this swaps the plane extent.
};

//! What the renderer needs to place the board.
struct BoardTransform {
	cv::Vec3f position{0.f, 0.f, 0.f}; //!< World position of the board center.
	float yaw{0.f};                    //!< Rotation about the up axis (radians).
	float scale{1.f};                  //!< Uniform scale, equals the board width in world units.
};

//! Board state carried across frames.
struct BoardState {
	BoardState(std::size_t positionWindow, std::size_t rotationWindow, float initialScale)
	    : scale{initialScale}, recentPositions{positionWindow}, recentYawAngles{rotationWindow} {
	}

	cv::Vec3f position{0.f, 0.f, 0.f};
	float yawAngle{0.f};
	float scale;
	RecentHistory<cv::Vec3f> recentPositions;
	RecentHistory<float> recentYawAngles;

	bool operator==(const BoardState& other) const = default;
};

//! Width and depth of the board after fitting it into a plane.
struct BoardFit {
	float width{0.f};
	float depth{0.f};
};

/*! Largest rectangle with depth = width * aspectRatio that fits into extentX x extentZ, with width <= maximumScale.
 * \param [in] extentX     Available width.
 * \param [in] extentZ     Available depth.
 * \param [in] aspectRatio Board depth / width.
 * \param [in] maximumScale Upper bound for the width.
 */
BoardFit fitToExtent(float extentX, float extentZ, float aspectRatio, float maximumScale);

/*! Shift a board so its footprint lies inside the plane's extent.
 *  Each plane axis (x, z) is checked on its own; the board is moved by exactly the overhang on the low side, else on the high side.
 * \param [in] plane         Plane to stay inside.
 * \param [in] worldPosition Current board center (world).
 * \param [in] boardExtent   Board size in plane coordinates (x, z used).
 * \return     Corrected world position, or null if the board already lies within the plane.
 */
std::optional<cv::Vec3f> containWithinPlane(const PlaneAnchor& plane, const cv::Vec3f& worldPosition, const cv::Vec3f& boardExtent);

/*! Turns the stream of hit-test samples and manual gestures into a stable board transform.
 *  Not thread safe. Feed samples and gestures from the same thread.
 */
class BoardStabilizer {
public:
	explicit BoardStabilizer(float aspectRatio, StabilizerConfig config = StabilizerConfig{});

	//! Process one hit-test sample while the board follows the detected world.
	void update(const Sample& sample);

	//! Scale all three axes by @p factor, clamped to [minimumScale, maximumScale].
	void scaleBy(float factor);

	//! Rotate about the up axis by @p delta. A tipped board (pitched past 90 degrees) turns the other way.
	void rotateBy(float delta, bool tipped = false);

	//! Place the board at @p worldPosition directly. The position window is left untouched.
	void moveTo(const cv::Vec3f& worldPosition);

	const BoardState& state() const {
		return m_state;
	}
	BoardTransform transform() const;

	float aspectRatio() const {
		return m_aspectRatio;
	}
	const StabilizerConfig& config() const {
		return m_config;
	}

private:
	void orientToCamera(float cameraYaw);
	void orientToPlane(const PlaneAnchor& plane, float cameraYaw);
	void rotate(float targetYaw);
	void scaleToPlane(const PlaneAnchor& plane);
	void adjustPosition(const PlaneAnchor& plane, const cv::Vec3f& extent);

private:
	StabilizerConfig m_config; //!< Windows, scale limits and thresholds.
	float m_aspectRatio;       //!< Board depth / width. Fixed for the board's lifetime.
	BoardState m_state;        //!< Current board state.
};

} // namespace tabletop::placement::core
