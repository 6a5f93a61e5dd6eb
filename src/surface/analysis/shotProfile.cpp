#include "surface/shotProfile.hpp"

#include "surface/core/surfaceComparator.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

namespace xgmap::surface {

//! Pool the shots of the scope, summarise and estimate them. Baseline and difference are left empty.
static ShotProfile profileSubject(std::span<const core::ShotRecord> shots, const Scope& scope, const std::shared_ptr<const core::GridSpec>& grid,
                                  const RosterResolver& roster, const XgmapConfig& config) {
	ScopeResult gathered = gatherShots(shots, scope, roster);

	ShotProfile profile{scope, gathered.status, {}, std::nullopt, {}, {}};
	if (gathered.status == ScopeStatus::EmptyScope) {
		return profile;
	}

	profile.summary = summarizeShots(gathered.records, config.summary);
	profile.subject = core::estimateSurface(gathered.records, grid, config.estimator);
	if (!core::isValidEstimate(*profile.subject)) {
		CV_LOG_ERROR(NULL, "No surface for " << describe(scope) << " (" << core::toString(profile.subject->status) << ").");
	}
	return profile;
}

core::EstimateResult estimateLeague(std::span<const core::ShotRecord> shots, const std::shared_ptr<const core::GridSpec>& grid,
                                    const core::EstimatorConfig& config) {
	const ScopeResult league = gatherShots(shots, Scope::league());
	return core::estimateSurface(league.records, grid, config);
}

ShotProfile buildProfile(std::span<const core::ShotRecord> shots, const Scope& scope, const core::Surface& baseline, const RosterResolver& roster,
                         const XgmapConfig& config) {
	if (baseline.empty()) {
		CV_Error(cv::Error::StsNullPtr, "buildProfile needs a league baseline surface");
	}

	ShotProfile profile = profileSubject(shots, scope, baseline.gridPtr(), roster, config);
	if (!profile.subject || !core::isValidEstimate(*profile.subject)) {
		return profile;
	}

	profile.baseline   = baseline;
	profile.difference = core::difference(profile.subject->surface, baseline);
	return profile;
}

ShotProfile buildProfile(std::span<const core::ShotRecord> shots, const Scope& scope, const std::shared_ptr<const core::GridSpec>& grid,
                         const RosterResolver& roster, const XgmapConfig& config) {
	const core::EstimateResult league = estimateLeague(shots, grid, config.estimator);
	if (!core::isValidEstimate(league)) {
		CV_LOG_ERROR(NULL, "No league baseline surface (" << core::toString(league.status) << ").");
		return profileSubject(shots, scope, grid, roster, config);
	}

	return buildProfile(shots, scope, league.surface, roster, config);
}

bool isValidProfile(const ShotProfile& profile) {
	return profile.scopeStatus == ScopeStatus::Ok && profile.subject && core::isValidEstimate(*profile.subject) && !profile.difference.empty();
}

} // namespace xgmap::surface
