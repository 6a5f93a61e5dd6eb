#include "surface/core/surfaceComparator.hpp"

#include <opencv2/core.hpp>

#include <utility>

namespace xgmap::surface::core {

Surface difference(const Surface& subject, const Surface& baseline) {
	if (subject.empty() || baseline.empty()) {
		CV_Error(cv::Error::StsUnmatchedSizes, "Cannot compare an empty surface");
	}
	if (!(subject.grid() == baseline.grid())) {
		CV_Error(cv::Error::StsUnmatchedSizes, "Surfaces were built on different grids");
	}

	cv::Mat diff;
	cv::subtract(subject.values(), baseline.values(), diff, cv::noArray(), CV_64F);
	return {subject.gridPtr(), std::move(diff)};
}

double symmetricRange(const Surface& surface) {
	if (surface.empty()) {
		return 0.0;
	}
	return cv::norm(surface.values(), cv::NORM_INF);
}

} // namespace xgmap::surface::core
