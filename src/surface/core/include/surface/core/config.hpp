#pragma once

#include <opencv2/core/persistence.hpp>

namespace xgmap::surface::core {

//! Rink coordinate bounds of the sampling grid.
struct GridBounds {
	double xMin{0.0};     //!< First x sample (rink feet).
	double xMax{100.0};   //!< Last x sample (rink feet).
	double yMaxAbs{42.5}; //!< y samples span [-yMaxAbs, yMaxAbs].

	bool operator==(const GridBounds&) const = default;
};

//! Sampling grid parameters.
struct GridConfig {
	GridBounds bounds{};
	int widthSamples{100}; //!< Samples along x (columns).
	int heightSamples{85}; //!< Samples along y (rows).
};

//! Scattered cubic interpolation parameters.
struct InterpolationConfig {
	int minSites{4};                 //!< Fewer distinct positions than this -> fill the whole grid with fillValue.
	int gradientMaxIterations{400};  //!< Sweeps of the global gradient estimation.
	double gradientTolerance{1e-6};  //!< Relative gradient change that stops the sweeps.
	double fillValue{0.0};           //!< Value outside the convex hull of the sites.
	double hullTolerance{1e-10};     //!< Barycentric slack when testing if a node is inside a triangle.
};

//! Largest accepted Gaussian kernel radius in cells. Far beyond any grid, keeps the kernel size representable.
inline constexpr int MAX_KERNEL_RADIUS = 1000;

//! Gaussian smoothing parameters. Sigma and truncation are in grid cells.
struct SmoothingConfig {
	double sigma{3.0};
	double truncate{4.0}; //!< Kernel radius = round(truncate * sigma).
};

//! Full surface estimation configuration.
struct EstimatorConfig {
	InterpolationConfig interpolation{};
	SmoothingConfig smoothing{};
};

//! Read a grid configuration. Keys that are not present keep the values of @p defaults.
//! \throws cv::Exception (StsBadArg) if the resulting configuration is invalid.
GridConfig readGridConfig(const cv::FileNode& node, const GridConfig& defaults = GridConfig{});

//! Read an estimator configuration ("interpolation" and "smoothing" sub nodes). Missing keys keep the values of @p defaults.
//! \throws cv::Exception (StsBadArg) if the resulting configuration is invalid.
EstimatorConfig readEstimatorConfig(const cv::FileNode& node, const EstimatorConfig& defaults = EstimatorConfig{});

void validate(const GridConfig& config);      //!< \throws cv::Exception (StsBadArg) on invalid values.
void validate(const EstimatorConfig& config); //!< \throws cv::Exception (StsBadArg) on invalid values.

//! Half width of the Gaussian kernel in cells.
//! \throws cv::Exception (StsBadArg) if the radius exceeds MAX_KERNEL_RADIUS.
int kernelRadius(const SmoothingConfig& config);

} // namespace xgmap::surface::core
