#include "surface/core/surface.hpp"

#include <opencv2/core.hpp>

#include <utility>

namespace xgmap::surface::core {

Surface::Surface(std::shared_ptr<const GridSpec> grid, cv::Mat values) : m_grid{std::move(grid)}, m_values{std::move(values)} {
	if (!m_grid) {
		CV_Error(cv::Error::StsNullPtr, "Surface needs a grid");
	}
	CV_Assert(m_values.type() == CV_64FC1);
	CV_Assert(m_values.size() == m_grid->size());
}

Surface Surface::filled(std::shared_ptr<const GridSpec> grid, const double value) {
	if (!grid) {
		CV_Error(cv::Error::StsNullPtr, "Surface needs a grid");
	}
	cv::Mat values(grid->size(), CV_64FC1, cv::Scalar(value));
	return {std::move(grid), std::move(values)};
}

double Surface::valueAt(const double x, const double y) const {
	CV_Assert(!empty());
	const cv::Point node = m_grid->nearestNode(x, y);
	return at(node.y, node.x);
}

double Surface::minValue() const {
	CV_Assert(!empty());
	double minV = 0.0;
	cv::minMaxLoc(m_values, &minV, nullptr);
	return minV;
}

double Surface::maxValue() const {
	CV_Assert(!empty());
	double maxV = 0.0;
	cv::minMaxLoc(m_values, nullptr, &maxV);
	return maxV;
}

} // namespace xgmap::surface::core
