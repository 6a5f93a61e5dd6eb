#include "surface/aggregation.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <map>
#include <string>
#include <vector>

namespace xgmap::surface {
namespace gtest {
namespace {

std::vector<core::ShotRecord> sampleShots() {
	return {
	        {80.0, 2.0, 0.30, "ana"},   {60.0, -10.0, 0.05, "ben"}, {85.0, 0.0, 0.40, "ana"},
	        {40.0, 20.0, 0.02, "cleo"}, {70.0, 5.0, 0.10, "ben"},   {75.0, -3.0, 0.15, "dan"},
	};
}

//! Roster lookup backed by a fixed table. Counts the lookups.
struct FakeRoster {
	std::map<std::string, std::vector<std::string>> teams;
	int lookups{0};

	RosterResolver resolver() {
		return [this](const std::string& team) {
			++lookups;
			const auto it = teams.find(team);
			return it == teams.end() ? std::vector<std::string>{} : it->second;
		};
	}
};

} // namespace

TEST(Aggregation, League_AllShotsInOrder) {
	const auto shots         = sampleShots();
	const ScopeResult result = gatherShots(shots, Scope::league());

	EXPECT_EQ(result.status, ScopeStatus::Ok);
	ASSERT_EQ(result.records.size(), shots.size());
	for (std::size_t i = 0; i < shots.size(); ++i) {
		EXPECT_EQ(result.records[i].shooter, shots[i].shooter);
		EXPECT_DOUBLE_EQ(result.records[i].xGoal, shots[i].xGoal);
	}
}

TEST(Aggregation, Player_OnlyOwnShots) {
	const auto shots         = sampleShots();
	const ScopeResult result = gatherShots(shots, Scope::player("ana"));

	EXPECT_EQ(result.status, ScopeStatus::Ok);
	ASSERT_EQ(result.records.size(), 2u);
	EXPECT_DOUBLE_EQ(result.records[0].xGoal, 0.30);
	EXPECT_DOUBLE_EQ(result.records[1].xGoal, 0.40);
}

TEST(Aggregation, PlayerWithoutShots_EmptyScope) {
	const auto shots         = sampleShots();
	const ScopeResult result = gatherShots(shots, Scope::player("nobody"));

	EXPECT_EQ(result.status, ScopeStatus::EmptyScope);
	EXPECT_TRUE(result.records.empty());
}

TEST(Aggregation, Team_PoolsRosterShots) {
	const auto shots = sampleShots();
	FakeRoster roster{{{"OTT", {"ana", "ben"}}}};

	const ScopeResult result = gatherShots(shots, Scope::team("OTT"), roster.resolver());
	EXPECT_EQ(result.status, ScopeStatus::Ok);
	ASSERT_EQ(result.records.size(), 4u);
	for (const auto& r: result.records) {
		EXPECT_TRUE(r.shooter == "ana" || r.shooter == "ben") << r.shooter;
	}
	EXPECT_EQ(roster.lookups, 1);
}

TEST(Aggregation, Team_DuplicateRosterEntriesCountOnce) {
	const auto shots = sampleShots();
	FakeRoster roster{{{"OTT", {"ana", "ana", "ben", "ana"}}}};

	const ScopeResult result = gatherShots(shots, Scope::team("OTT"), roster.resolver());
	EXPECT_EQ(result.status, ScopeStatus::Ok);
	EXPECT_EQ(result.records.size(), 4u);
}

TEST(Aggregation, Team_EmptyRoster_EmptyScope) {
	const auto shots = sampleShots();
	FakeRoster roster{{{"OTT", {}}}};

	EXPECT_EQ(gatherShots(shots, Scope::team("OTT"), roster.resolver()).status, ScopeStatus::EmptyScope);
	EXPECT_EQ(gatherShots(shots, Scope::team("unknown"), roster.resolver()).status, ScopeStatus::EmptyScope);
}

TEST(Aggregation, Team_RosterWithoutShots_OkAndEmpty) {
	const auto shots = sampleShots();
	FakeRoster roster{{{"NEW", {"rookie1", "rookie2"}}}};

	const ScopeResult result = gatherShots(shots, Scope::team("NEW"), roster.resolver());
	EXPECT_EQ(result.status, ScopeStatus::Ok);
	EXPECT_TRUE(result.records.empty());
}

TEST(Aggregation, Team_RosterChangesAreSeen) {
	const auto shots = sampleShots();
	FakeRoster roster{{{"OTT", {"ana"}}}};
	const RosterResolver resolver = roster.resolver();

	EXPECT_EQ(gatherShots(shots, Scope::team("OTT"), resolver).records.size(), 2u);
	roster.teams["OTT"].push_back("dan"); // Trade
	EXPECT_EQ(gatherShots(shots, Scope::team("OTT"), resolver).records.size(), 3u);
	EXPECT_EQ(roster.lookups, 2);
}

TEST(Aggregation, Team_WithoutResolver_Throws) {
	const auto shots = sampleShots();
	EXPECT_THROW(gatherShots(shots, Scope::team("OTT")), cv::Exception);
}

TEST(Aggregation, Describe) {
	EXPECT_EQ(describe(Scope::player("ana")), "player 'ana'");
	EXPECT_EQ(describe(Scope::team("OTT")), "team 'OTT'");
	EXPECT_EQ(describe(Scope::league()), "league");
	EXPECT_STREQ(toString(ScopeStatus::EmptyScope), "EmptyScope");
}

} // namespace gtest
} // namespace xgmap::surface
