#pragma once

#include <opencv2/core.hpp>

#include <array>

namespace tabletop::placement::core {

//! Preferred board size. Only the ratio matters, the stabilizer decides the actual width.
struct BoardSize {
	float width{1.5f};
	float height{2.7f};
};

//! Board depth / width.
float aspectRatio(const BoardSize& size);

enum class Corner { TopLeft, TopRight, BottomLeft, BottomRight };
enum class Alignment { Horizontal, Vertical };

inline constexpr std::array<Corner, 4> ALL_CORNERS       = {Corner::TopLeft, Corner::TopRight, Corner::BottomLeft, Corner::BottomRight};
inline constexpr std::array<Alignment, 2> ALL_ALIGNMENTS = {Alignment::Horizontal, Alignment::Vertical};

//! Horizontal sign of a corner: -1 left, +1 right.
float cornerU(Corner corner);
//! Vertical sign of a corner: -1 top, +1 bottom.
float cornerV(Corner corner);

//! Axis-aligned rectangle in board coordinates (x across the width, y along the depth, board center at the origin).
struct OutlineRect {
	cv::Point2f center{0.f, 0.f};
	cv::Size2f size{0.f, 0.f};
};

//! One of the 8 border pieces: from a corner half way along one edge.
struct BorderSegment {
	Corner corner;
	Alignment alignment;
	OutlineRect rect;
};

/*! Border and fill of a board with width 1.
 *  Scaling the outline by the board scale gives the board in world units. Board coordinates (x, y) lie in the board's XZ plane as (x, 0, y).
 */
struct BoardOutline {
	static constexpr float THICKNESS    = 0.012f; //!< Border thickness relative to the board width.
	static constexpr float FILL_OPACITY = 0.6f;

	cv::Size2f borderSize{1.f, 1.f};       //!< (1, aspectRatio).
	std::array<BorderSegment, 8> segments{}; //!< Corner-major order: for each corner, horizontal then vertical.
	OutlineRect fill{};                      //!< Translucent fill inside the border.
};

BorderSegment makeBorderSegment(Corner corner, Alignment alignment, const cv::Size2f& borderSize);

//! Build border segments and fill for a board of the given aspect ratio.
BoardOutline makeOutline(float aspectRatio);

} // namespace tabletop::placement::core
