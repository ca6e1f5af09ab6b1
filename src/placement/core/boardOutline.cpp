#include "placement/core/boardOutline.hpp"

#include <cstddef>

namespace tabletop::placement::core {

float aspectRatio(const BoardSize& size) {
	return size.height / size.width;
}

float cornerU(const Corner corner) {
	switch (corner) {
	case Corner::TopLeft:
	case Corner::BottomLeft:
		return -1.f;
	case Corner::TopRight:
	case Corner::BottomRight:
		return 1.f;
	}
	return 1.f;
}

float cornerV(const Corner corner) {
	switch (corner) {
	case Corner::TopLeft:
	case Corner::TopRight:
		return -1.f;
	case Corner::BottomLeft:
	case Corner::BottomRight:
		return 1.f;
	}
	return 1.f;
}

BorderSegment makeBorderSegment(const Corner corner, const Alignment alignment, const cv::Size2f& borderSize) {
	static constexpr float T = BoardOutline::THICKNESS;

	const float u = cornerU(corner);
	const float v = cornerV(corner);

	BorderSegment segment{corner, alignment, {}};
	switch (alignment) {
	case Alignment::Horizontal:
		// Along the top/bottom edge, from the corner to the middle of the edge.
		segment.rect.size   = {borderSize.width / 2.f, T};
		segment.rect.center = {u * borderSize.width / 4.f, v * (borderSize.height / 2.f - T / 2.f)};
		break;
	case Alignment::Vertical:
		segment.rect.size   = {T, borderSize.height / 2.f};
		segment.rect.center = {u * (borderSize.width / 2.f - T / 2.f), v * borderSize.height / 4.f};
		break;
	}
	return segment;
}

BoardOutline makeOutline(const float aspectRatio) {
	BoardOutline outline{};
	outline.borderSize = {1.f, aspectRatio};

	std::size_t i = 0u;
	for (const Corner corner: ALL_CORNERS) {
		for (const Alignment alignment: ALL_ALIGNMENTS) {
			outline.segments[i++] = makeBorderSegment(corner, alignment, outline.borderSize);
		}
	}

	const float length = 1.f - 2.f * BoardOutline::THICKNESS;
	outline.fill       = {{0.f, 0.f}, {length, length * aspectRatio}};
	return outline;
}

} // namespace tabletop::placement::core
