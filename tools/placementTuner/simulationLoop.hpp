#pragma once

#include "mainWindow.hpp"
#include "simulatedScene.hpp"

#include "placement/session.hpp"

#include <QTimer>

#include <opencv2/core/mat.hpp>

namespace tabletop {

//! Advances the simulated scene periodically, feeds the frames to the session and updates the UI.
class SimulationLoop {
public:
	SimulationLoop(MainWindow& window, placement::SimulatedScene& scene, placement::PlacementSession& session, int periodMs = 33);
	~SimulationLoop();

	void start();
	void stop();

	//! Re-render the current state (used when the view or board changes between frames).
	void refresh();

private:
	void step();
	cv::Mat render() const;

private:
	MainWindow& m_window;
	placement::SimulatedScene& m_scene;
	placement::PlacementSession& m_session;
	placement::Frame m_lastFrame{};
	QTimer m_timer{};
};

} // namespace tabletop
