#include "surface/core/config.hpp"

#include <opencv2/core.hpp>

#include <cmath>
#include <string>

namespace xgmap::surface::core {

//! Overwrite @p value with node[key] if the key exists.
template <typename T>
static void readOptional(const cv::FileNode& node, const char* key, T& value) {
	const cv::FileNode child = node[key];
	if (!child.empty()) {
		child >> value;
	}
}

GridConfig readGridConfig(const cv::FileNode& node, const GridConfig& defaults) {
	GridConfig config = defaults;
	if (node.empty()) {
		return config;
	}

	readOptional(node, "widthSamples", config.widthSamples);
	readOptional(node, "heightSamples", config.heightSamples);

	const cv::FileNode bounds = node["bounds"];
	if (!bounds.empty()) {
		readOptional(bounds, "xMin", config.bounds.xMin);
		readOptional(bounds, "xMax", config.bounds.xMax);
		readOptional(bounds, "yMaxAbs", config.bounds.yMaxAbs);
	}

	validate(config);
	return config;
}

EstimatorConfig readEstimatorConfig(const cv::FileNode& node, const EstimatorConfig& defaults) {
	EstimatorConfig config = defaults;
	if (node.empty()) {
		return config;
	}

	const cv::FileNode interpolation = node["interpolation"];
	if (!interpolation.empty()) {
		readOptional(interpolation, "minSites", config.interpolation.minSites);
		readOptional(interpolation, "gradientMaxIterations", config.interpolation.gradientMaxIterations);
		readOptional(interpolation, "gradientTolerance", config.interpolation.gradientTolerance);
		readOptional(interpolation, "fillValue", config.interpolation.fillValue);
		readOptional(interpolation, "hullTolerance", config.interpolation.hullTolerance);
	}

	const cv::FileNode smoothing = node["smoothing"];
	if (!smoothing.empty()) {
		readOptional(smoothing, "sigma", config.smoothing.sigma);
		readOptional(smoothing, "truncate", config.smoothing.truncate);
	}

	validate(config);
	return config;
}

void validate(const GridConfig& config) {
	if (config.widthSamples < 2 || config.heightSamples < 2) {
		CV_Error(cv::Error::StsBadArg, "Grid needs at least 2 samples per axis, got " + std::to_string(config.widthSamples) + "x" +
		                                       std::to_string(config.heightSamples));
	}
	if (!std::isfinite(config.bounds.xMin) || !std::isfinite(config.bounds.xMax) || !(config.bounds.xMax > config.bounds.xMin)) {
		CV_Error(cv::Error::StsBadArg, "Grid x range must be finite and increasing");
	}
	if (!std::isfinite(config.bounds.yMaxAbs) || !(config.bounds.yMaxAbs > 0.0)) {
		CV_Error(cv::Error::StsBadArg, "Grid yMaxAbs must be finite and positive");
	}
}

void validate(const EstimatorConfig& config) {
	const auto& interp = config.interpolation;
	if (interp.minSites < 3) {
		CV_Error(cv::Error::StsBadArg, "Interpolation needs minSites >= 3 (one triangle)");
	}
	if (interp.gradientMaxIterations < 0) {
		CV_Error(cv::Error::StsBadArg, "gradientMaxIterations must not be negative");
	}
	if (!(interp.gradientTolerance > 0.0) || !(interp.hullTolerance >= 0.0)) {
		CV_Error(cv::Error::StsBadArg, "Interpolation tolerances must be positive");
	}
	if (!std::isfinite(interp.fillValue)) {
		CV_Error(cv::Error::StsBadArg, "fillValue must be finite");
	}

	const auto& smooth = config.smoothing;
	if (!(smooth.sigma > 0.0) || !std::isfinite(smooth.sigma)) {
		CV_Error(cv::Error::StsBadArg, "Smoothing sigma must be positive");
	}
	if (!(smooth.truncate > 0.0) || !std::isfinite(smooth.truncate)) {
		CV_Error(cv::Error::StsBadArg, "Smoothing truncate must be positive");
	}
	kernelRadius(smooth); // Throws if the kernel is too large.
}

int kernelRadius(const SmoothingConfig& config) {
	const double radius = config.truncate * config.sigma + 0.5;
	if (!(radius < static_cast<double>(MAX_KERNEL_RADIUS + 1))) {
		CV_Error(cv::Error::StsBadArg, "Smoothing kernel radius (truncate * sigma) exceeds " + std::to_string(MAX_KERNEL_RADIUS) + " cells");
	}
	return static_cast<int>(radius);
}

} // namespace xgmap::surface::core
