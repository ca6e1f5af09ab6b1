#include "placement/core/boardStabilizer.hpp"

#include "placement/core/transform.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <numbers>
#include <string_view>

namespace tabletop::placement::core {

namespace {

//! Boards are rectangles, half a turn apart looks the same.
static constexpr float HALF_TURN = std::numbers::pi_v<float>;

//! Enable per-sample diagnostics via environment variable.
static bool stabilizerDebugEnabled() {
	const char* env = std::getenv("TABLETOP_PLACEMENT_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

} // namespace

BoardFit fitToExtent(const float extentX, const float extentZ, const float aspectRatio, const float maximumScale) {
	BoardFit fit{};
	fit.width = std::min(extentX, maximumScale);
	fit.depth = std::min(extentZ, fit.width * aspectRatio);
	fit.width = fit.depth / aspectRatio; // Depth may have shrunk, keep the aspect ratio.
	return fit;
}

std::optional<cv::Vec3f> containWithinPlane(const PlaneAnchor& plane, const cv::Vec3f& worldPosition, const cv::Vec3f& boardExtent) {
	const cv::Matx44f worldToPlane = plane.transform.inv();
	cv::Vec3f local                = transformPoint(worldToPlane, worldPosition);

	const cv::Vec3f boardMin = local - boardExtent / 2.f;
	const cv::Vec3f boardMax = local + boardExtent / 2.f;
	const cv::Vec3f planeMin = plane.center - plane.extent / 2.f;
	const cv::Vec3f planeMax = plane.center + plane.extent / 2.f;

	bool adjusted = false;
	for (const int axis: {0, 2}) {
		if (boardMin[axis] < planeMin[axis]) {
			local[axis] += planeMin[axis] - boardMin[axis];
			adjusted = true;
		} else if (boardMax[axis] > planeMax[axis]) {
			local[axis] -= boardMax[axis] - planeMax[axis];
			adjusted = true;
		}
	}

	if (!adjusted) {
		return std::nullopt;
	}
	return transformPoint(plane.transform, local);
}

BoardStabilizer::BoardStabilizer(const float aspectRatio, StabilizerConfig config)
    : m_config{config}, m_aspectRatio{aspectRatio}, m_state{config.positionWindow, config.rotationWindow, config.minimumScale} {
}

void BoardStabilizer::update(const Sample& sample) {
	// Average using the most recent positions to avoid jitter.
	m_state.recentPositions.push(sample.worldPosition);
	m_state.position = m_state.recentPositions.mean().value_or(sample.worldPosition);

	if (sample.plane) {
		orientToPlane(*sample.plane, sample.cameraYaw);
		scaleToPlane(*sample.plane);
	} else {
		orientToCamera(sample.cameraYaw);
		m_state.scale = m_config.minimumScale;
	}

	if (stabilizerDebugEnabled()) {
		std::cerr << "[placement-debug] plane=" << (sample.plane ? 1 : 0) << " pos=(" << m_state.position[0] << "," << m_state.position[1] << ","
		          << m_state.position[2] << ") yaw=" << m_state.yawAngle << " scale=" << m_state.scale
		          << " windows=" << m_state.recentPositions.size() << "/" << m_state.recentYawAngles.size() << '\n';
	}
}

void BoardStabilizer::scaleBy(const float factor) {
	m_state.scale = std::clamp(m_state.scale * factor, m_config.minimumScale, m_config.maximumScale);
}

void BoardStabilizer::rotateBy(const float delta, const bool tipped) {
	if (tipped) {
		m_state.yawAngle += delta;
	} else {
		m_state.yawAngle -= delta;
	}
}

void BoardStabilizer::moveTo(const cv::Vec3f& worldPosition) {
	m_state.position = worldPosition;
}

BoardTransform BoardStabilizer::transform() const {
	return {m_state.position, m_state.yawAngle, m_state.scale};
}

void BoardStabilizer::orientToCamera(const float cameraYaw) {
	rotate(cameraYaw);
}

void BoardStabilizer::orientToPlane(const PlaneAnchor& plane, const float cameraYaw) {
	float boardAngle = yawAngle(plane.transform);

	// Long side of the board along the long side of the plane.
	if (plane.extent[0] > plane.extent[2]) {
		boardAngle += HALF_TURN / 2.f;
	}

	// Of the two equivalent angles, take the one facing the camera.
	boardAngle = normalizedAngle(boardAngle, cameraYaw, HALF_TURN);
	rotate(boardAngle);
}

void BoardStabilizer::rotate(const float targetYaw) {
	// Do not average across a half-turn flip, that would spin the board.
	if (const auto previous = m_state.recentYawAngles.mean(); previous && std::abs(targetYaw - *previous) > m_config.rotationFlipThreshold) {
		m_state.recentYawAngles.remap([targetYaw](const float angle) { return normalizedAngle(angle, targetYaw, HALF_TURN); });
	}

	m_state.recentYawAngles.push(targetYaw);
	m_state.yawAngle = m_state.recentYawAngles.mean().value_or(targetYaw);
}

void BoardStabilizer::scaleToPlane(const PlaneAnchor& plane) {
	// Plane rotated by 90 degrees relative to the board: its extent axes are swapped.
	const cv::Vec3f planeXAxis = xAxis(plane.transform);
	const bool axisFlipped     = std::abs(planeXAxis.dot(rightVector(m_state.yawAngle))) < m_config.axisFlipDotThreshold;

	cv::Vec3f planeExtent = plane.extent;
	if (axisFlipped) {
		planeExtent = {planeExtent[2], 0.f, planeExtent[0]};
	}

	const BoardFit fit = fitToExtent(planeExtent[0], planeExtent[2], m_aspectRatio, m_config.maximumScale);
	m_state.scale      = fit.width;

	cv::Vec3f planeLocalExtent{fit.width, 0.f, fit.depth};
	if (axisFlipped) {
		planeLocalExtent = {planeLocalExtent[2], 0.f, planeLocalExtent[0]};
	}
	adjustPosition(plane, planeLocalExtent);
}

void BoardStabilizer::adjustPosition(const PlaneAnchor& plane, const cv::Vec3f& extent) {
	if (const auto adjusted = containWithinPlane(plane, m_state.position, extent)) {
		m_state.position = *adjusted;
	}
}

} // namespace tabletop::placement::core
