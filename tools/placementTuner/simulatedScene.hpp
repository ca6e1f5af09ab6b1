#pragma once

#include "placement/core/arTypes.hpp"
#include "placement/session.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <vector>

namespace tabletop::placement {

struct SceneConfig {
	cv::Vec3f cameraPosition{0.f, 1.2f, 1.5f}; //!< Hit distances are measured from here.
	cv::Vec3f planeExtent{1.6f, 0.f, 0.9f};    //!< Fully detected table size.
	float planeYaw{0.3f};                      //!< Table rotation about the up axis.
	float metersPerPixel{0.002f};              //!< Screen offset to plane offset.
	float noise{0.01f};                        //!< Standard deviation of the hit position (meters).
	float yawWobble{0.05f};                    //!< Amplitude of the camera yaw oscillation (radians).
	float planeGrowth{0.02f};                  //!< Extent added per frame until the table is fully detected.
	unsigned initializingFrames{15u};          //!< Frames reported as Limited(Initializing) at start.
};

//! Table top seen by a shaky camera. Stands in for the tracker: hit tests return noisy points on a growing plane.
class SimulatedScene : public HitTester {
public:
	explicit SimulatedScene(cv::Size2f viewportSize, SceneConfig config = SceneConfig{});

	std::vector<core::HitTestResult> hitTest(cv::Point2f screenPoint, core::HitTestType types) const override;

	//! Step the simulation by one camera frame.
	Frame advance();

	//! Turn the plane by a quarter and swap its extent, the way a tracker re-labels a plane's major axis.
	void swapPlaneAxes();

	void setNoise(float noise) {
		m_config.noise = noise;
	}

	const core::PlaneAnchor& plane() const {
		return m_plane;
	}
	const std::vector<cv::Vec3f>& recentHits() const {
		return m_recentHits;
	}

private:
	cv::Size2f m_viewport;
	SceneConfig m_config;
	core::PlaneAnchor m_plane;
	cv::Vec3f m_fullExtent;
	unsigned m_frame{0u};

	mutable cv::RNG m_rng{0x7ab1e7u};
	mutable std::vector<cv::Vec3f> m_recentHits{}; //!< Raw hit positions for display.
};

} // namespace tabletop::placement
