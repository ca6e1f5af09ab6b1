#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace tabletop::placement::core {

//! Single labelled view produced while processing a frame.
struct DebugView {
	std::string name; //!< Label drawn above the image.
	cv::Mat image;    //!< Any depth, 1/3/4 channels.
};

//! Views grouped by processing stage (raw samples, stabilized board, ...).
struct DebugStage {
	std::string name;
	std::vector<DebugView> views{};
};

//! Collects intermediate views of the placement pipeline and lays them out as one image.
class DebugVisualizer {
public:
	void beginStage(std::string name);               //!< Start a new stage. Ends the active one.
	void add(std::string name, const cv::Mat& image); //!< Add a view to the active stage. Shows it in interactive mode.
	void endStage();

	//! One column per stage, one row per view. Ends the active stage. Empty if nothing was added.
	cv::Mat buildMosaic();

	void setInteractive(bool interactive, unsigned displayTimeMs = 0u); //!< Show each view as soon as it's added.
	void clear();

	std::size_t stageCount() const {
		return m_stages.size() + (m_hasActiveStage ? 1u : 0u);
	}

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	bool m_interactive{false};  //!< Show views in add().
	unsigned m_displayTime{0u}; //!< Ms to show a view in interactive mode. 0 -> until key press.

	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{}; //!< Finished stages.
};

} // namespace tabletop::placement::core
