#include "surface/aggregation.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

#include <algorithm>
#include <iterator>
#include <set>

namespace xgmap::surface {

static ScopeResult emptyScope(const Scope& scope) {
	CV_LOG_WARNING(NULL, "No shots found for " << describe(scope) << ".");
	return {ScopeStatus::EmptyScope, {}};
}

ScopeResult gatherShots(std::span<const core::ShotRecord> shots, const Scope& scope, const RosterResolver& roster) {
	switch (scope.kind) {
	case ScopeKind::League:
		return {ScopeStatus::Ok, {shots.begin(), shots.end()}};

	case ScopeKind::Player: {
		ScopeResult result{ScopeStatus::Ok, {}};
		std::copy_if(shots.begin(), shots.end(), std::back_inserter(result.records),
		             [&](const core::ShotRecord& shot) { return shot.shooter == scope.name; });
		if (result.records.empty()) {
			return emptyScope(scope);
		}
		return result;
	}

	case ScopeKind::Team: {
		if (!roster) {
			CV_Error(cv::Error::StsNullPtr, "Team scope '" + scope.name + "' needs a roster resolver");
		}

		const std::vector<std::string> players = roster(scope.name);
		const std::set<std::string> members(players.begin(), players.end()); // One membership per player.
		if (members.empty()) {
			return emptyScope(scope);
		}

		ScopeResult result{ScopeStatus::Ok, {}};
		std::copy_if(shots.begin(), shots.end(), std::back_inserter(result.records),
		             [&](const core::ShotRecord& shot) { return members.contains(shot.shooter); });
		if (result.records.empty()) {
			CV_LOG_INFO(NULL, describe(scope) << " has " << members.size() << " players but no shots.");
		}
		return result;
	}
	}

	CV_Error(cv::Error::StsBadArg, "Unknown scope kind");
}

std::string describe(const Scope& scope) {
	switch (scope.kind) {
	case ScopeKind::Player:
		return "player '" + scope.name + "'";
	case ScopeKind::Team:
		return "team '" + scope.name + "'";
	case ScopeKind::League:
		return "league";
	}
	return "unknown scope";
}

const char* toString(const ScopeStatus status) {
	switch (status) {
	case ScopeStatus::Ok:
		return "Ok";
	case ScopeStatus::EmptyScope:
		return "EmptyScope";
	}
	return "Unknown";
}

} // namespace xgmap::surface
