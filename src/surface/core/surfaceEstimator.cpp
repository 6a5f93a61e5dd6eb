#include "surface/core/surfaceEstimator.hpp"

#include "cloughTocher.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>

#include <utility>

namespace xgmap::surface::core {

static constexpr const char* STAGE_NAME = "Estimate Surface";

//! Whole grid filled with the fill value. Used when the shots cannot be interpolated.
static EstimateResult insufficientData(const std::shared_ptr<const GridSpec>& grid, const EstimatorConfig& config, DebugTrace* trace) {
	Surface surface = Surface::filled(grid, config.interpolation.fillValue);
	if (trace) {
		trace->add("Fallback", surface.values());
		trace->endStage();
	}
	return {EstimateStatus::InsufficientData, std::move(surface)};
}

static EstimateResult numericAnomaly(const char* step, DebugTrace* trace) {
	CV_LOG_ERROR(NULL, "Surface estimation produced non-finite values after step '" << step << "'. Surface discarded.");
	if (trace) {
		trace->endStage();
	}
	return {EstimateStatus::NumericAnomaly, Surface{}};
}

EstimateResult estimateSurface(std::span<const ShotRecord> records, const std::shared_ptr<const GridSpec>& grid, const EstimatorConfig& config,
                               DebugTrace* trace) {
	if (!grid) {
		CV_Error(cv::Error::StsNullPtr, "estimateSurface needs a grid");
	}
	validate(config);

	if (trace) {
		trace->beginStage(STAGE_NAME);
	}

	// 1. Distinct interpolation sites in canonical order.
	std::vector<Site> sites = mergeSites(records);
	if (static_cast<int>(sites.size()) < config.interpolation.minSites) {
		CV_LOG_INFO(NULL, "Only " << sites.size() << " distinct shot positions (" << records.size() << " shots), need "
		                          << config.interpolation.minSites << ". Using fill value surface.");
		return insufficientData(grid, config, trace);
	}

	// 2. Cubic interpolation on the grid nodes. Outside the hull -> fill value.
	const CloughTocherInterpolator interpolator(std::move(sites), config.interpolation);
	if (!interpolator.valid()) {
		CV_LOG_INFO(NULL, "Shot positions are collinear (" << records.size() << " shots). Using fill value surface.");
		return insufficientData(grid, config, trace);
	}

	cv::Mat values = interpolator.evaluate(*grid, config.interpolation.fillValue);
	if (trace) {
		trace->add("Interpolated", values);
	}
	if (!cv::checkRange(values)) {
		return numericAnomaly("Interpolated", trace);
	}

	// 3. Negative expected goals are not possible. Clamp cubic overshoot.
	cv::max(values, 0.0, values);
	if (trace) {
		trace->add("Clamped", values);
	}

	// 4. Smooth. Not clamped again afterwards.
	const int radius = kernelRadius(config.smoothing);
	const cv::Size kernel(2 * radius + 1, 2 * radius + 1);
	cv::Mat smoothed;
	cv::GaussianBlur(values, smoothed, kernel, config.smoothing.sigma, config.smoothing.sigma, cv::BORDER_REFLECT);
	if (trace) {
		trace->add("Smoothed", smoothed);
		trace->endStage();
	}
	if (!cv::checkRange(smoothed)) {
		return numericAnomaly("Smoothed", nullptr);
	}

	CV_LOG_DEBUG(NULL, "Estimated surface from " << records.size() << " shots, " << interpolator.triangleCount() << " triangles, "
	                                            << interpolator.gradientIterations() << " gradient sweeps.");
	return {EstimateStatus::Ok, Surface(grid, std::move(smoothed))};
}

bool isValidEstimate(const EstimateResult& result) {
	return result.status != EstimateStatus::NumericAnomaly && !result.surface.empty();
}

const char* toString(const EstimateStatus status) {
	switch (status) {
	case EstimateStatus::Ok:
		return "Ok";
	case EstimateStatus::InsufficientData:
		return "InsufficientData";
	case EstimateStatus::NumericAnomaly:
		return "NumericAnomaly";
	}
	return "Unknown";
}

} // namespace xgmap::surface::core
