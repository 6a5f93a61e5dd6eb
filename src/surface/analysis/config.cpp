#include "surface/config.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

namespace xgmap::surface {

static SummaryConfig readSummaryConfig(const cv::FileNode& node, const SummaryConfig& defaults) {
	SummaryConfig config = defaults;
	const cv::FileNode distance = node["highDangerDistance"];
	if (!distance.empty()) {
		distance >> config.highDangerDistance;
	}
	if (!(config.highDangerDistance >= 0.0)) {
		CV_Error(cv::Error::StsBadArg, "highDangerDistance must not be negative");
	}
	return config;
}

XgmapConfig readConfig(const cv::FileNode& root) {
	XgmapConfig config{};
	if (root.empty()) {
		return config;
	}

	config.grid      = core::readGridConfig(root["grid"], config.grid);
	config.estimator = core::readEstimatorConfig(root["estimator"], config.estimator);
	if (!root["summary"].empty()) {
		config.summary = readSummaryConfig(root["summary"], config.summary);
	}
	return config;
}

static XgmapConfig readStorage(cv::FileStorage& storage, const std::string& origin) {
	if (!storage.isOpened()) {
		CV_Error(cv::Error::StsError, "Could not open configuration " + origin);
	}

	XgmapConfig config = readConfig(storage.root());
	CV_LOG_INFO(NULL, "Configuration " << origin << ": grid " << config.grid.widthSamples << "x" << config.grid.heightSamples << ", sigma "
	                                   << config.estimator.smoothing.sigma);
	return config;
}

XgmapConfig loadConfig(const std::filesystem::path& path) {
	cv::FileStorage storage(path.string(), cv::FileStorage::READ);
	return readStorage(storage, "'" + path.string() + "'");
}

XgmapConfig parseConfig(const std::string& text) {
	cv::FileStorage storage(text, cv::FileStorage::READ | cv::FileStorage::MEMORY);
	return readStorage(storage, "from memory");
}

} // namespace xgmap::surface
