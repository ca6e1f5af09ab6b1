#include "placement/session.hpp"

#include "placement/core/transform.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>
#include <utility>

namespace tabletop::placement {

namespace {

//! Hit types used to find the surface under the screen center while placing.
static constexpr core::HitTestType PLACEMENT_HIT_TYPES = core::HitTestType::EstimatedHorizontalPlane | core::HitTestType::ExistingPlaneUsingExtent;

static bool sessionDebugEnabled() {
	const char* env = std::getenv("TABLETOP_PLACEMENT_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

} // namespace

std::string_view statusMessage(const Frame& frame) {
	using Status = TrackingState::Status;
	using Reason = TrackingState::LimitedReason;

	const TrackingState& state = frame.trackingState;
	switch (state.status) {
	case Status::Normal:
		if (frame.anchorCount == 0u) {
			return "Move the device around to detect horizontal and vertical surfaces.";
		}
		return "";
	case Status::NotAvailable:
		return "Tracking unavailable.";
	case Status::Limited:
		switch (state.reason) {
		case Reason::ExcessiveMotion:
			return "Tracking limited - Move the device more slowly.";
		case Reason::InsufficientFeatures:
			return "Tracking limited - Point the device at an area with visible surface detail, or improve lighting conditions.";
		case Reason::Initializing:
			return "Initializing AR session.";
		case Reason::Relocalizing:
		case Reason::None:
			break;
		}
		break;
	}
	return "";
}

PlacementSession::PlacementSession(const HitTester& hitTester, const cv::Size2f viewportSize, SessionConfig config)
    : m_hitTester{hitTester}, m_viewport{viewportSize}, m_config{config}, m_board{core::aspectRatio(config.preferredSize), config.stabilizer},
      m_outline{core::makeOutline(m_board.aspectRatio())} {
}

cv::Point2f PlacementSession::screenCenter() const {
	return {m_viewport.width / 2.f, m_viewport.height / 2.f};
}

bool PlacementSession::onFrame(const Frame& frame) {
	if (m_mode != PlacementMode::Placing || frame.trackingState.status != TrackingState::Status::Normal) {
		return false;
	}

	const std::vector<core::HitTestResult> results = m_hitTester.hitTest(screenCenter(), PLACEMENT_HIT_TYPES);
	if (results.empty()) {
		return false;
	}

	const core::HitTestResult& hit = results.front();
	if (!core::isValidHit(hit)) {
		std::cerr << "[Warning] Ignoring hit test result with non-finite values.\n";
		return false;
	}

	// Ignore results that are too close to the camera when initially placing.
	if (hit.distance <= m_config.minimumHitDistance) {
		if (sessionDebugEnabled()) {
			std::cerr << "[placement-debug] hit too close: distance=" << hit.distance << '\n';
		}
		return false;
	}

	m_board.update(core::Sample{core::translation(hit.worldTransform), hit.plane, frame.cameraYaw});
	notifyBoardUpdated();
	return true;
}

void PlacementSession::onTap() {
	setMode(m_mode == PlacementMode::Adjusting ? PlacementMode::Placing : PlacementMode::Adjusting);
}

void PlacementSession::onPan(const GesturePhase phase, const cv::Point2f location) {
	setMode(PlacementMode::Adjusting);

	const std::vector<core::HitTestResult> results = m_hitTester.hitTest(location, core::HitTestType::ExistingPlane);
	if (results.empty() || !core::isValidHit(results.front())) {
		return;
	}
	const cv::Vec3f hitPosition = core::translation(results.front().worldTransform);

	switch (phase) {
	case GesturePhase::Began:
		m_panOffset = hitPosition - m_board.state().position;
		break;
	case GesturePhase::Changed:
		m_board.moveTo(hitPosition - m_panOffset);
		notifyBoardUpdated();
		break;
	case GesturePhase::Ended:
	case GesturePhase::Cancelled:
		break;
	}
}

void PlacementSession::onPinch(const GesturePhase phase, const float scale) {
	setMode(PlacementMode::Adjusting);

	if (phase == GesturePhase::Changed) {
		m_board.scaleBy(scale);
		notifyBoardUpdated();
	}
}

void PlacementSession::onRotate(const GesturePhase phase, const float rotation) {
	setMode(PlacementMode::Adjusting);

	if (phase == GesturePhase::Changed) {
		// The board only ever turns about the up axis, it is never tipped.
		m_board.rotateBy(rotation, false);
		notifyBoardUpdated();
	}
}

void PlacementSession::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void PlacementSession::disconnect() {
	m_callbacks = {nullptr, nullptr};
}

void PlacementSession::setMode(const PlacementMode mode) {
	if (m_mode == mode) {
		return;
	}
	m_mode = mode;
	if (m_callbacks.onModeChanged) {
		m_callbacks.onModeChanged(m_mode);
	}
}

void PlacementSession::notifyBoardUpdated() const {
	if (m_callbacks.onBoardUpdated) {
		m_callbacks.onBoardUpdated(m_board.transform());
	}
}

} // namespace tabletop::placement
