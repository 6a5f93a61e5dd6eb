#pragma once

#include "surface/aggregation.hpp"
#include "surface/core/config.hpp"
#include "surface/core/gridSpec.hpp"
#include "surface/core/surfaceEstimator.hpp"

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace xgmap::surface {

//! Estimation result of one scope.
struct ScopedEstimate {
	Scope scope;                                  //!< Requested scope.
	ScopeStatus scopeStatus;                      //!< Aggregation outcome.
	std::size_t shotCount{0};                     //!< Pooled shots.
	std::optional<core::EstimateResult> estimate; //!< Estimation outcome. nullopt on EmptyScope (no estimation ran).
};

/*! Estimate one surface per scope.
 *  The scopes are resolved (roster lookups) sequentially on the calling thread. The estimations are independent units of work
 *  and run on OpenCV's worker pool (cv::parallel_for_). Results are in @p scopes order.
 *
 * \param [in] shots  Cleaned shots of the data source.
 * \param [in] scopes Scopes to estimate.
 * \param [in] grid   Shared sampling grid.
 * \param [in] roster Roster collaborator for team scopes.
 * \param [in] config Estimator configuration.
 */
std::vector<ScopedEstimate> estimateBatch(std::span<const core::ShotRecord> shots, const std::vector<Scope>& scopes,
                                          const std::shared_ptr<const core::GridSpec>& grid, const RosterResolver& roster = {},
                                          const core::EstimatorConfig& config = core::EstimatorConfig{});

} // namespace xgmap::surface
