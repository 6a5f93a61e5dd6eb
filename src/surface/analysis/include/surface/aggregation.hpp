#pragma once

#include "surface/core/shotRecord.hpp"

#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace xgmap::surface {

enum class ScopeKind { Player, Team, League };

//! Which shots feed one estimation.
struct Scope {
	ScopeKind kind;     //!< Pooling rule.
	std::string name{}; //!< Player or team identifier. Unused for the league.

	static Scope player(std::string name) { return {ScopeKind::Player, std::move(name)}; }
	static Scope team(std::string name) { return {ScopeKind::Team, std::move(name)}; }
	static Scope league() { return {ScopeKind::League, {}}; }
};

enum class ScopeStatus {
	Ok,         //!< Scope resolved. The records may still be empty (team whose players took no shots).
	EmptyScope, //!< Player without shots, or team whose roster resolved to nobody.
};

//! Result of the aggregation stage.
struct ScopeResult {
	ScopeStatus status;                    //!< Resolution outcome. Callers decide whether EmptyScope aborts.
	std::vector<core::ShotRecord> records; //!< Pooled shots in data source order.
};

//! Roster collaborator: team identifier -> player identifiers currently on it. Queried on every team lookup, never cached.
using RosterResolver = std::function<std::vector<std::string>(const std::string& team)>;

/*! Pool the shots of one scope.
 *  - Player: every shot of the named shooter. No shots -> EmptyScope.
 *  - Team:   every shot of every player on the roster. Empty roster -> EmptyScope. Roster players without shots -> Ok, no records.
 *  - League: every shot.
 *  Shots are neither deduplicated nor reweighted. Each shot is included at most once, even if a roster repeats a player.
 *
 * \param [in] shots  Cleaned shots of the data source.
 * \param [in] scope  Pooling rule.
 * \param [in] roster Roster collaborator. Required for team scopes.
 * \throws     cv::Exception (StsNullPtr) for a team scope without roster resolver.
 */
ScopeResult gatherShots(std::span<const core::ShotRecord> shots, const Scope& scope, const RosterResolver& roster = {});

std::string describe(const Scope& scope); //!< Human readable scope, e.g. "team 'OTT'".

const char* toString(ScopeStatus status);

} // namespace xgmap::surface
