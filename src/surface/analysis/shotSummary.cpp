#include "surface/shotSummary.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace xgmap::surface {

static double percentage(const std::size_t part, const std::size_t total) {
	return total > 0u ? static_cast<double>(part) / static_cast<double>(total) * 100.0 : 0.0;
}

ShotSummary summarizeShots(std::span<const core::ShotRecord> shots, const SummaryConfig& config) {
	ShotSummary summary{};
	summary.totalShots = shots.size();
	if (shots.empty()) {
		return summary;
	}

	std::vector<double> xGoals;
	xGoals.reserve(shots.size());

	summary.minX = summary.maxX = shots.front().x;
	summary.minY = summary.maxY = shots.front().y;
	for (const auto& shot: shots) {
		if (shot.isGoal) {
			++summary.goals;
		}
		if (core::shotDistance(shot) <= config.highDangerDistance) {
			++summary.highDangerShots;
		}

		xGoals.push_back(shot.xGoal);
		summary.minX = std::min(summary.minX, shot.x);
		summary.maxX = std::max(summary.maxX, shot.x);
		summary.minY = std::min(summary.minY, shot.y);
		summary.maxY = std::max(summary.maxY, shot.y);
	}

	summary.shootingPercentage   = percentage(summary.goals, summary.totalShots);
	summary.highDangerPercentage = percentage(summary.highDangerShots, summary.totalShots);

	const SampleStatistics stats = sampleStatistics(std::move(xGoals));
	summary.totalXGoal           = stats.total;
	summary.meanXGoal            = stats.mean;
	summary.medianXGoal          = stats.median;
	summary.stddevXGoal          = stats.stddev;
	summary.maxXGoal             = stats.max;

	return summary;
}

} // namespace xgmap::surface
