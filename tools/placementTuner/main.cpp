#include <charconv>
#include <iostream>
#include <string_view>
#include <system_error>

#include <QApplication>

#include "mainWindow.hpp"
#include "placement/session.hpp"
#include "simulatedScene.hpp"
#include "simulationLoop.hpp"

// Interactive tuner for the board placement.
// A simulated table top replaces the tracker: hit tests jitter, the detected plane grows over time and its axes can be swapped.
// Watch the raw hits against the averaged board and try the gestures in the Adjusting mode.
//
// Usage: placementTuner [noise in meters]
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	tabletop::placement::SceneConfig sceneConfig{};
	if (argc > 1) {
		const std::string_view arg = argv[1];
		float noise                = 0.f;
		const auto [end, ec]       = std::from_chars(arg.data(), arg.data() + arg.size(), noise);
		if (ec != std::errc{} || end != arg.data() + arg.size() || noise < 0.f) {
			std::cerr << "[Error] Invalid noise '" << arg << "'. Expected a non-negative number of meters.\n";
			return 1;
		}
		sceneConfig.noise = noise;
	}

	const cv::Size2f viewport{800.f, 600.f};
	tabletop::placement::SimulatedScene scene(viewport, sceneConfig);
	tabletop::placement::PlacementSession session(scene, viewport);

	tabletop::MainWindow window;
	window.resize(1400, 900);

	tabletop::SimulationLoop loop(window, scene, session);

	using tabletop::placement::GesturePhase;
	const auto rotate = [&](float rotation) {
		session.onRotate(GesturePhase::Began, 0.f);
		session.onRotate(GesturePhase::Changed, rotation);
		session.onRotate(GesturePhase::Ended, 0.f);
		loop.refresh();
	};
	const auto pinch = [&](float scale) {
		session.onPinch(GesturePhase::Began, 1.f);
		session.onPinch(GesturePhase::Changed, scale);
		session.onPinch(GesturePhase::Ended, 1.f);
		loop.refresh();
	};

	window.connect({
	        .onTap          = [&]() { session.onTap(); },
	        .onRotate       = rotate,
	        .onPinch        = pinch,
	        .onSwapAxes     = [&]() { scene.swapPlaneAxes(); },
	        .onNoiseChanged = [&](float noise) { scene.setNoise(noise); },
	        .onViewChanged  = [&](tabletop::TunerView) { loop.refresh(); },
	});
	session.connect({nullptr, [&](tabletop::placement::PlacementMode mode) { window.setMode(mode); }});

	window.show();
	loop.start();

	return application.exec();
}
