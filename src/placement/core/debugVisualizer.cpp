#include "placement/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace tabletop::placement::core {

namespace {

static constexpr int TILE_SIZE      = 400; //!< Square tile per view.
static constexpr int HEADER_HEIGHT  = 32;  //!< Stage name bar.
static constexpr int LABEL_HEIGHT   = 24;  //!< View name bar inside a tile.
static constexpr int TILE_PADDING   = 4;
static constexpr int MAX_MOSAIC_DIM = 2400;

static const cv::Scalar BACKGROUND(20, 20, 20);
static const cv::Scalar BAR_COLOR(0, 0, 0);
static const cv::Scalar TEXT_COLOR(255, 255, 255);

} // namespace

void DebugVisualizer::setInteractive(const bool interactive, const unsigned displayTimeMs) {
	m_interactive = interactive;
	m_displayTime = displayTimeMs;
}

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}
	m_stages.push_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& image) {
	if (!m_hasActiveStage) {
		std::cerr << "[Warning] DebugVisualizer::add(" << name << ") without an active stage. View dropped.\n";
		return;
	}

	m_currentStage.views.push_back(DebugView{std::move(name), image.clone()});

	if (m_interactive) {
		cv::imshow("Placement Debug", toBgr8U(image));
		cv::waitKey(static_cast<int>(m_displayTime));
	}
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	endStage();

	std::size_t rows = 0u;
	for (const auto& stage: m_stages) {
		rows = std::max(rows, stage.views.size());
	}
	if (m_stages.empty() || rows == 0u) {
		return {};
	}

	const int cols = static_cast<int>(m_stages.size());
	const int tile = std::max(1, std::min({TILE_SIZE, MAX_MOSAIC_DIM / cols, (MAX_MOSAIC_DIM - HEADER_HEIGHT) / static_cast<int>(rows)}));

	cv::Mat mosaic(HEADER_HEIGHT + static_cast<int>(rows) * tile, cols * tile, CV_8UC3, BACKGROUND);

	for (int c = 0; c < cols; ++c) {
		const DebugStage& stage = m_stages[static_cast<std::size_t>(c)];

		cv::Mat header = mosaic(cv::Rect(c * tile, 0, tile, HEADER_HEIGHT));
		header.setTo(BAR_COLOR);
		const std::string title = stage.name.empty() ? "Stage " + std::to_string(c + 1) : stage.name;
		cv::putText(header, title, cv::Point(8, HEADER_HEIGHT - 10), cv::FONT_HERSHEY_SIMPLEX, 0.65, TEXT_COLOR, 1, cv::LINE_AA);

		for (std::size_t r = 0; r < stage.views.size(); ++r) {
			const DebugView& view = stage.views[r];
			cv::Mat cell          = mosaic(cv::Rect(c * tile, HEADER_HEIGHT + static_cast<int>(r) * tile, tile, tile));

			cell(cv::Rect(0, 0, tile, std::min(tile, LABEL_HEIGHT))).setTo(BAR_COLOR);
			cv::putText(cell, view.name, cv::Point(TILE_PADDING, LABEL_HEIGHT - 7), cv::FONT_HERSHEY_SIMPLEX, 0.5, TEXT_COLOR, 1, cv::LINE_AA);

			if (view.image.empty()) {
				continue;
			}

			// Fit into the space below the label, keep the aspect ratio.
			const int availW = std::max(1, tile - 2 * TILE_PADDING);
			const int availH = std::max(1, tile - LABEL_HEIGHT - 2 * TILE_PADDING);
			const cv::Mat bgr = toBgr8U(view.image);
			const double s    = std::min(static_cast<double>(availW) / bgr.cols, static_cast<double>(availH) / bgr.rows);
			const int w       = std::clamp(static_cast<int>(std::lround(bgr.cols * s)), 1, availW);
			const int h       = std::clamp(static_cast<int>(std::lround(bgr.rows * s)), 1, availH);

			cv::Mat resized;
			cv::resize(bgr, resized, cv::Size(w, h), 0.0, 0.0, s < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
			resized.copyTo(cell(cv::Rect(TILE_PADDING + (availW - w) / 2, LABEL_HEIGHT + TILE_PADDING + (availH - h) / 2, w, h)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;
	if (in.depth() == CV_8U) {
		out = in;
	} else {
		double minV = 0.0;
		double maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		const double range = maxV - minV;
		if (range < 1e-9) {
			in.convertTo(out, CV_8U);
		} else {
			in.convertTo(out, CV_8U, 255.0 / range, -minV * 255.0 / range);
		}
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace tabletop::placement::core
