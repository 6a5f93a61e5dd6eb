#pragma once

#include "surface/core/config.hpp"
#include "surface/shotSummary.hpp"

#include <opencv2/core/persistence.hpp>

#include <filesystem>
#include <string>

namespace xgmap::surface {

//! Full configuration of the analysis.
struct XgmapConfig {
	core::GridConfig grid{};
	core::EstimatorConfig estimator{};
	SummaryConfig summary{};
};

/*! Read the configuration from a file node with the sub nodes "grid", "estimator" and "summary".
 *  YAML input starts with the "%YAML:1.0" directive, as cv::FileStorage expects.
 *  Keys that are not present keep their defaults.
 *  Example (YAML):
 *    grid:      { widthSamples: 100, heightSamples: 85, bounds: { xMin: 0, xMax: 100, yMaxAbs: 42.5 } }
 *    estimator: { interpolation: { minSites: 4 }, smoothing: { sigma: 3.0, truncate: 4.0 } }
 *    summary:   { highDangerDistance: 20 }
 * \throws cv::Exception (StsBadArg) on invalid values.
 */
XgmapConfig readConfig(const cv::FileNode& root);

//! Load a YAML, JSON or XML configuration file (format detected by cv::FileStorage).
//! \throws cv::Exception (StsError) if the file cannot be opened, StsBadArg on invalid values.
XgmapConfig loadConfig(const std::filesystem::path& path);

//! Parse a configuration held in memory, e.g. embedded defaults or test input.
XgmapConfig parseConfig(const std::string& text);

} // namespace xgmap::surface
