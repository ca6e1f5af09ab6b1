#include "simulatedScene.hpp"

#include "placement/core/transform.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace tabletop::placement {

namespace {

static constexpr std::size_t MAX_RECENT_HITS = 40u;
static constexpr float START_EXTENT_FRACTION  = 0.25f; //!< Part of the table detected on the first frame.

} // namespace

SimulatedScene::SimulatedScene(const cv::Size2f viewportSize, SceneConfig config)
    : m_viewport{viewportSize}, m_config{config}, m_fullExtent{config.planeExtent} {
	m_plane.transform      = core::makeRotationY(m_config.planeYaw);
	m_plane.extent         = m_fullExtent * START_EXTENT_FRACTION;
	m_plane.classification = core::PlaneClassification::Table;
}

std::vector<core::HitTestResult> SimulatedScene::hitTest(const cv::Point2f screenPoint, const core::HitTestType types) const {
	// Screen offset from the center maps onto the plane, plus tracker noise.
	const cv::Point2f offset = screenPoint - cv::Point2f{m_viewport.width / 2.f, m_viewport.height / 2.f};
	const cv::Vec3f local{m_plane.center[0] + offset.x * m_config.metersPerPixel + static_cast<float>(m_rng.gaussian(m_config.noise)), m_plane.center[1],
	                      m_plane.center[2] + offset.y * m_config.metersPerPixel + static_cast<float>(m_rng.gaussian(m_config.noise))};
	const cv::Vec3f world = core::transformPoint(m_plane.transform, local);

	const bool insideExtent = std::abs(local[0] - m_plane.center[0]) <= m_plane.extent[0] / 2.f &&
	                          std::abs(local[2] - m_plane.center[2]) <= m_plane.extent[2] / 2.f;

	core::HitTestResult hit{};
	hit.worldTransform       = m_plane.transform;
	hit.worldTransform(0, 3) = world[0];
	hit.worldTransform(1, 3) = world[1];
	hit.worldTransform(2, 3) = world[2];
	hit.distance             = static_cast<float>(cv::norm(world - m_config.cameraPosition));

	if (insideExtent && core::hasType(types, core::HitTestType::ExistingPlaneUsingExtent)) {
		hit.type  = core::HitTestType::ExistingPlaneUsingExtent;
		hit.plane = m_plane;
	} else if (core::hasType(types, core::HitTestType::ExistingPlane)) {
		hit.type  = core::HitTestType::ExistingPlane;
		hit.plane = m_plane;
	} else if (core::hasType(types, core::HitTestType::EstimatedHorizontalPlane)) {
		hit.type = core::HitTestType::EstimatedHorizontalPlane;
	} else if (core::hasType(types, core::HitTestType::FeaturePoint)) {
		hit.type = core::HitTestType::FeaturePoint;
	} else {
		return {};
	}

	m_recentHits.push_back(world);
	if (m_recentHits.size() > MAX_RECENT_HITS) {
		m_recentHits.erase(m_recentHits.begin());
	}
	return {hit};
}

Frame SimulatedScene::advance() {
	++m_frame;

	// Detection grows the plane until the full table is known.
	for (const int axis: {0, 2}) {
		m_plane.extent[axis] = std::min(m_fullExtent[axis], m_plane.extent[axis] + m_config.planeGrowth);
	}

	Frame frame{};
	frame.cameraYaw     = m_config.yawWobble * std::sin(static_cast<float>(m_frame) * 0.05f);
	frame.anchorCount   = 1u;
	frame.trackingState = m_frame <= m_config.initializingFrames ? TrackingState::limited(TrackingState::LimitedReason::Initializing)
	                                                              : TrackingState::normal();
	return frame;
}

void SimulatedScene::swapPlaneAxes() {
	m_plane.transform = m_plane.transform * core::makeRotationY(std::numbers::pi_v<float> / 2.f);
	std::swap(m_plane.extent[0], m_plane.extent[2]);
	std::swap(m_fullExtent[0], m_fullExtent[2]);
	m_plane.center = {-m_plane.center[2], m_plane.center[1], m_plane.center[0]}; // Same world point in the turned frame.
}

} // namespace tabletop::placement
