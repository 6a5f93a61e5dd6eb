#include "surface/batchEstimator.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

#include <utility>

namespace xgmap::surface {

std::vector<ScopedEstimate> estimateBatch(std::span<const core::ShotRecord> shots, const std::vector<Scope>& scopes,
                                          const std::shared_ptr<const core::GridSpec>& grid, const RosterResolver& roster,
                                          const core::EstimatorConfig& config) {
	if (!grid) {
		CV_Error(cv::Error::StsNullPtr, "estimateBatch needs a grid");
	}
	core::validate(config);

	// 1. Resolve scopes on this thread. The roster collaborator does not have to be thread safe.
	std::vector<std::vector<core::ShotRecord>> pooled(scopes.size());
	std::vector<ScopedEstimate> results;
	results.reserve(scopes.size());
	for (std::size_t i = 0; i < scopes.size(); ++i) {
		ScopeResult gathered = gatherShots(shots, scopes[i], roster);
		results.push_back(ScopedEstimate{scopes[i], gathered.status, gathered.records.size(), std::nullopt});
		pooled[i] = std::move(gathered.records);
	}

	// 2. Estimate in parallel. Every unit writes its own slot only.
	cv::parallel_for_(cv::Range(0, static_cast<int>(scopes.size())), [&](const cv::Range& range) {
		for (int i = range.start; i < range.end; ++i) {
			const auto idx = static_cast<std::size_t>(i);
			if (results[idx].scopeStatus == ScopeStatus::EmptyScope) {
				continue;
			}
			results[idx].estimate = core::estimateSurface(pooled[idx], grid, config);
		}
	});

	CV_LOG_DEBUG(NULL, "Estimated " << scopes.size() << " scopes.");
	return results;
}

} // namespace xgmap::surface
