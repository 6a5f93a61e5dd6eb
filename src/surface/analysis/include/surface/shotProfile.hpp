#pragma once

#include "surface/aggregation.hpp"
#include "surface/config.hpp"
#include "surface/core/gridSpec.hpp"
#include "surface/core/surface.hpp"
#include "surface/core/surfaceEstimator.hpp"
#include "surface/shotSummary.hpp"

#include <memory>
#include <optional>
#include <span>

namespace xgmap::surface {

//! Everything a report renderer needs for one player or team: statistics, own surface and the comparison to the league.
//! Hand off: subject.surface with a sequential colour scale, difference with a diverging scale centred at zero.
struct ShotProfile {
	Scope scope;                                 //!< Profiled player or team.
	ScopeStatus scopeStatus;                     //!< On EmptyScope nothing else is filled.
	ShotSummary summary{};                       //!< Counting statistics of the pooled shots.
	std::optional<core::EstimateResult> subject; //!< Surface of the pooled shots.
	core::Surface baseline{};                    //!< League surface (subtrahend).
	core::Surface difference{};                  //!< subject - baseline. Empty if either surface is missing.
};

//! Estimate the league baseline surface from all shots.
core::EstimateResult estimateLeague(std::span<const core::ShotRecord> shots, const std::shared_ptr<const core::GridSpec>& grid,
                                    const core::EstimatorConfig& config = core::EstimatorConfig{});

/*! Build the profile of one scope against a precomputed league baseline.
 *  Reuse one baseline for many profiles. The subject is estimated on baseline.gridPtr().
 * \throws cv::Exception (StsNullPtr) if the baseline is empty.
 */
ShotProfile buildProfile(std::span<const core::ShotRecord> shots, const Scope& scope, const core::Surface& baseline,
                         const RosterResolver& roster = {}, const XgmapConfig& config = XgmapConfig{});

//! Build the profile of one scope, estimating the league baseline on @p grid first.
ShotProfile buildProfile(std::span<const core::ShotRecord> shots, const Scope& scope, const std::shared_ptr<const core::GridSpec>& grid,
                         const RosterResolver& roster = {}, const XgmapConfig& config = XgmapConfig{});

bool isValidProfile(const ShotProfile& profile); //!< Scope resolved and the difference surface exists.

} // namespace xgmap::surface
