#pragma once

#include "placement/core/arTypes.hpp"
#include "placement/core/boardOutline.hpp"
#include "placement/core/boardStabilizer.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>

namespace tabletop::placement {

//! Board follows the detected plane (Placing) or is moved by the user's gestures (Adjusting).
enum class PlacementMode { Placing, Adjusting };

//! Camera tracking quality as reported by the tracker.
struct TrackingState {
	enum class Status { Normal, NotAvailable, Limited };
	enum class LimitedReason { None, Initializing, ExcessiveMotion, InsufficientFeatures, Relocalizing };

	Status status{Status::NotAvailable};
	LimitedReason reason{LimitedReason::None}; //!< Only meaningful for Status::Limited.

	static TrackingState normal() {
		return {Status::Normal, LimitedReason::None};
	}
	static TrackingState notAvailable() {
		return {Status::NotAvailable, LimitedReason::None};
	}
	static TrackingState limited(LimitedReason reason) {
		return {Status::Limited, reason};
	}
};

//! Per-frame data from the tracker.
struct Frame {
	float cameraYaw{0.f};          //!< Camera rotation about the up axis (radians).
	TrackingState trackingState{}; //!< Tracking quality for this frame.
	std::size_t anchorCount{0u};   //!< Number of anchors (planes) currently tracked.
};

//! Access to the tracker's hit test. Implemented by the host platform (or a simulation).
class HitTester {
public:
	virtual ~HitTester() = default;

	/*! Intersect the ray through @p screenPoint with the detected world.
	 * \param [in] screenPoint Viewport coordinates (pixels).
	 * \param [in] types       Accepted result types.
	 * \return     Results sorted by distance, nearest first. Empty if nothing was hit.
	 */
	virtual std::vector<core::HitTestResult> hitTest(cv::Point2f screenPoint, core::HitTestType types) const = 0;
};

enum class GesturePhase { Began, Changed, Ended, Cancelled };

struct SessionConfig {
	core::BoardSize preferredSize{};          //!< Defines the board's aspect ratio.
	core::StabilizerConfig stabilizer{};      //!< Smoothing windows, scale limits, thresholds.
	float minimumHitDistance{0.5f};           //!< Hits this close to the camera are ignored while placing.
};

//! UI feedback for the tracking state. Empty if no feedback is needed.
std::string_view statusMessage(const Frame& frame);

/*! Interactive board placement on top of the tracker.
 *  Process: The host
 *   - Calls onFrame() for every camera frame. While Placing, the board follows the plane under the screen center.
 *   - Forwards tap/pan/pinch/rotation gestures. A tap toggles Placing/Adjusting; pan, pinch and rotation switch to Adjusting and
 *     move, scale and turn the board directly.
 *  All calls must come from the same (render) thread.
 */
class PlacementSession {
public:
	struct Callbacks {
		std::function<void(const core::BoardTransform&)> onBoardUpdated; //!< Board transform changed.
		std::function<void(PlacementMode)> onModeChanged;                //!< Placing/Adjusting toggled.
	};

public:
	PlacementSession(const HitTester& hitTester, cv::Size2f viewportSize, SessionConfig config = SessionConfig{});

	//! Process a camera frame.
	//! \returns True if the board was updated from a hit test.
	bool onFrame(const Frame& frame);

	void onTap();                                              //!< Toggle between Placing and Adjusting.
	void onPan(GesturePhase phase, cv::Point2f location);      //!< Drag the board along existing planes.
	void onPinch(GesturePhase phase, float scale);             //!< Scale by the incremental pinch factor.
	void onRotate(GesturePhase phase, float rotation);         //!< Turn by the incremental rotation (radians).

	void connect(Callbacks callbacks); //!< Connect callback functions.
	void disconnect();                 //!< Disconnect the callback functions.

	PlacementMode mode() const {
		return m_mode;
	}
	void setMode(PlacementMode mode);

	const core::BoardStabilizer& board() const {
		return m_board;
	}
	const core::BoardOutline& outline() const {
		return m_outline;
	}
	const SessionConfig& config() const {
		return m_config;
	}

	cv::Point2f screenCenter() const;

private:
	void notifyBoardUpdated() const;

private:
	const HitTester& m_hitTester; //!< Tracker access, owned by the host.
	cv::Size2f m_viewport;        //!< Viewport size in pixels.
	SessionConfig m_config;

	core::BoardStabilizer m_board; //!< Board state and smoothing.
	core::BoardOutline m_outline;  //!< Border and fill for the board's aspect ratio.

	PlacementMode m_mode{PlacementMode::Placing};
	cv::Vec3f m_panOffset{0.f, 0.f, 0.f}; //!< Hit point minus board position when the pan began.

	Callbacks m_callbacks; //!< Callback functions to signal events.
};

} // namespace tabletop::placement
