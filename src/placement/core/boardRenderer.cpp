#include "placement/core/boardRenderer.hpp"

#include "placement/core/transform.hpp"

#include <opencv2/imgproc.hpp>

namespace tabletop::placement::core {

namespace {

//! Rectangle in board coordinates lifted onto the board's XZ plane and moved into the world.
static std::array<cv::Vec3f, 4> rectToWorld(const OutlineRect& rect, const cv::Matx44f& toWorld) {
	const float hx = rect.size.width / 2.f;
	const float hy = rect.size.height / 2.f;

	const std::array<cv::Point2f, 4> local = {
	        cv::Point2f{rect.center.x - hx, rect.center.y - hy},
	        cv::Point2f{rect.center.x + hx, rect.center.y - hy},
	        cv::Point2f{rect.center.x + hx, rect.center.y + hy},
	        cv::Point2f{rect.center.x - hx, rect.center.y + hy},
	};

	std::array<cv::Vec3f, 4> corners{};
	for (std::size_t i = 0; i < local.size(); ++i) {
		corners[i] = transformPoint(toWorld, {local[i].x, 0.f, local[i].y});
	}
	return corners;
}

static std::vector<cv::Point> toPolygon(const std::array<cv::Vec3f, 4>& corners, const RenderSettings& settings) {
	std::vector<cv::Point> polygon;
	polygon.reserve(corners.size());
	for (const auto& corner: corners) {
		const cv::Point2f p = toImage(corner, settings);
		polygon.emplace_back(cvRound(p.x), cvRound(p.y));
	}
	return polygon;
}

} // namespace

cv::Matx44f boardToWorld(const BoardTransform& transform) {
	return makeTransform(transform.position, transform.yaw, transform.scale);
}

std::vector<BoardQuad> buildBoardQuads(const BoardTransform& transform, const BoardOutline& outline) {
	const cv::Matx44f toWorld = boardToWorld(transform);

	std::vector<BoardQuad> quads;
	quads.reserve(outline.segments.size() + 1u);
	for (const auto& segment: outline.segments) {
		quads.push_back({QuadKind::Border, rectToWorld(segment.rect, toWorld), 1.f});
	}
	quads.push_back({QuadKind::Fill, rectToWorld(outline.fill, toWorld), BoardOutline::FILL_OPACITY});
	return quads;
}

std::array<cv::Vec3f, 4> planeFootprint(const PlaneAnchor& plane) {
	const cv::Vec3f& c = plane.center;
	const float hx     = plane.extent[0] / 2.f;
	const float hz     = plane.extent[2] / 2.f;
	return {
	        transformPoint(plane.transform, {c[0] - hx, c[1], c[2] - hz}),
	        transformPoint(plane.transform, {c[0] + hx, c[1], c[2] - hz}),
	        transformPoint(plane.transform, {c[0] + hx, c[1], c[2] + hz}),
	        transformPoint(plane.transform, {c[0] - hx, c[1], c[2] + hz}),
	};
}

cv::Point2f toImage(const cv::Vec3f& world, const RenderSettings& settings) {
	const float x = (world[0] - settings.viewCenter[0]) * settings.pixelsPerUnit + static_cast<float>(settings.imageSize.width) / 2.f;
	const float y = (world[2] - settings.viewCenter[2]) * settings.pixelsPerUnit + static_cast<float>(settings.imageSize.height) / 2.f;
	return {x, y};
}

cv::Mat drawTopDown(const std::vector<BoardQuad>& quads, const std::optional<PlaneAnchor>& plane, const RenderSettings& settings) {
	cv::Mat image(settings.imageSize, CV_8UC3, settings.background);

	if (plane) {
		const std::vector<std::vector<cv::Point>> outline = {toPolygon(planeFootprint(*plane), settings)};
		cv::polylines(image, outline, true, settings.planeColor, 2, cv::LINE_AA);
	}

	// Translucent fill first so the border stays crisp on top.
	for (const auto& quad: quads) {
		if (quad.kind != QuadKind::Fill) {
			continue;
		}
		cv::Mat overlay = image.clone();
		cv::fillConvexPoly(overlay, toPolygon(quad.corners, settings), settings.fillColor, cv::LINE_AA);
		cv::addWeighted(overlay, static_cast<double>(quad.opacity), image, 1.0 - static_cast<double>(quad.opacity), 0.0, image);
	}

	for (const auto& quad: quads) {
		if (quad.kind != QuadKind::Border) {
			continue;
		}
		const std::vector<cv::Point> polygon = toPolygon(quad.corners, settings);
		cv::fillConvexPoly(image, polygon, settings.borderColor, cv::LINE_AA);
		// Thin segments may be less than a pixel wide at low zoom.
		cv::polylines(image, std::vector<std::vector<cv::Point>>{polygon}, true, settings.borderColor, 1, cv::LINE_AA);
	}

	return image;
}

} // namespace tabletop::placement::core
