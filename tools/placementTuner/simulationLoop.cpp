#include "simulationLoop.hpp"

#include "placement/core/boardRenderer.hpp"
#include "placement/core/debugVisualizer.hpp"
#include "placement/core/transform.hpp"

#include <QObject>
#include <QString>

#include <opencv2/imgproc.hpp>

#include <string>
#include <vector>

namespace tabletop {

namespace {

static const cv::Scalar HIT_COLOR(60, 60, 230);
static const cv::Scalar BOARD_CENTER_COLOR(0, 230, 0);

//! Top-down view centered on the plane.
static placement::core::RenderSettings viewSettings(const placement::core::PlaneAnchor& plane) {
	placement::core::RenderSettings settings{};
	settings.pixelsPerUnit = 300.f;
	settings.viewCenter    = placement::core::transformPoint(plane.transform, plane.center);
	return settings;
}

static QString describe(const placement::core::BoardTransform& board) {
	return QString("pos (%1, %2, %3)  yaw %4  scale %5")
	        .arg(board.position[0], 0, 'f', 3)
	        .arg(board.position[1], 0, 'f', 3)
	        .arg(board.position[2], 0, 'f', 3)
	        .arg(board.yaw, 0, 'f', 3)
	        .arg(board.scale, 0, 'f', 3);
}

} // namespace

SimulationLoop::SimulationLoop(MainWindow& window, placement::SimulatedScene& scene, placement::PlacementSession& session, const int periodMs)
    : m_window(window), m_scene(scene), m_session(session) {
	m_timer.setInterval(periodMs);
	m_timer.setTimerType(Qt::PreciseTimer);
	QObject::connect(&m_timer, &QTimer::timeout, [&]() { step(); });
}

SimulationLoop::~SimulationLoop() {
	stop();
}

void SimulationLoop::start() {
	step();
	m_timer.start();
}

void SimulationLoop::stop() {
	m_timer.stop();
}

void SimulationLoop::refresh() {
	m_window.setImage(render());
}

void SimulationLoop::step() {
	m_lastFrame = m_scene.advance();
	m_session.onFrame(m_lastFrame);

	const std::string_view message = placement::statusMessage(m_lastFrame);
	QString status                 = QString::fromUtf8(message.data(), static_cast<qsizetype>(message.size()));
	if (status.isEmpty()) {
		const std::string_view label = placement::core::description(m_scene.plane().classification);
		status = QString("%1  |  %2").arg(QString::fromUtf8(label.data(), static_cast<qsizetype>(label.size())), describe(m_session.board().transform()));
	}
	m_window.setStatus(status);
	refresh();
}

cv::Mat SimulationLoop::render() const {
	const placement::core::PlaneAnchor& plane       = m_scene.plane();
	const placement::core::RenderSettings settings  = viewSettings(plane);
	const placement::core::BoardTransform transform = m_session.board().transform();
	const std::vector<placement::core::BoardQuad> quads = placement::core::buildBoardQuads(transform, m_session.outline());

	const cv::Mat board = placement::core::drawTopDown(quads, plane, settings);
	if (m_window.selectedView() == TunerView::Board) {
		return board;
	}

	placement::core::DebugVisualizer debugger;
	debugger.setInteractive(false);

	debugger.beginStage("Samples");
	cv::Mat samples = placement::core::drawTopDown({}, plane, settings);
	for (const auto& hit: m_scene.recentHits()) {
		cv::circle(samples, placement::core::toImage(hit, settings), 3, HIT_COLOR, cv::FILLED, cv::LINE_AA);
	}
	cv::drawMarker(samples, placement::core::toImage(transform.position, settings), BOARD_CENTER_COLOR, cv::MARKER_CROSS, 16, 2, cv::LINE_AA);
	debugger.add("Raw hits / averaged position", samples);

	debugger.beginStage("Board");
	debugger.add("Stabilized board", board);

	return debugger.buildMosaic();
}

} // namespace tabletop
