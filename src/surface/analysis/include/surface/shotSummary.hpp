#pragma once

#include "surface/core/shotRecord.hpp"

#include <cstddef>
#include <span>

namespace xgmap::surface {

//! Summary statistics parameters.
struct SummaryConfig {
	double highDangerDistance{20.0}; //!< Shots at most this far from the net (feet) are high danger.
};

//! Counting statistics of a set of shots. All percentages are 0 if there are no shots.
struct ShotSummary {
	std::size_t totalShots{0};
	std::size_t goals{0};
	double shootingPercentage{0.0}; //!< goals / totalShots * 100.

	std::size_t highDangerShots{0};
	double highDangerPercentage{0.0}; //!< highDangerShots / totalShots * 100.

	double totalXGoal{0.0};  //!< Sum of xGoal (expected goals).
	double meanXGoal{0.0};
	double medianXGoal{0.0};
	double stddevXGoal{0.0};
	double maxXGoal{0.0};

	double minX{0.0}; //!< Observed coordinate range. Sanity check of the data source's cleaning.
	double maxX{0.0};
	double minY{0.0};
	double maxY{0.0};
};

ShotSummary summarizeShots(std::span<const core::ShotRecord> shots, const SummaryConfig& config = SummaryConfig{});

} // namespace xgmap::surface
