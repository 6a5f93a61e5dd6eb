#include "surface/batchEstimator.hpp"
#include "surface/core/gridSpec.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace xgmap::surface {
namespace gtest {
namespace {

//! Shots of four players spread over the offensive half.
std::vector<core::ShotRecord> leagueShots() {
	static const std::vector<std::string> PLAYERS = {"ana", "ben", "cleo", "dan"};

	std::vector<core::ShotRecord> shots;
	cv::RNG rng(77u);
	for (int i = 0; i < 400; ++i) {
		shots.push_back(core::ShotRecord{rng.uniform(0.0, 89.0), rng.uniform(-42.5, 42.5), rng.uniform(0.0, 0.2),
		                                 PLAYERS[static_cast<std::size_t>(i) % PLAYERS.size()]});
	}
	// A player with too few positions for a surface.
	shots.push_back(core::ShotRecord{80.0, 0.0, 0.3, "eve"});
	shots.push_back(core::ShotRecord{82.0, 3.0, 0.2, "eve"});
	return shots;
}

} // namespace

TEST(BatchEstimator, ResultsInScopeOrder) {
	const auto shots = leagueShots();
	const auto grid  = core::GridSpec::create();

	const RosterResolver roster = [](const std::string& team) {
		return team == "OTT" ? std::vector<std::string>{"ana", "ben"} : std::vector<std::string>{};
	};
	const std::vector<Scope> scopes = {
	        Scope::league(), Scope::player("cleo"), Scope::player("ghost"), Scope::team("OTT"), Scope::player("eve"), Scope::team("TOR"),
	};

	const std::vector<ScopedEstimate> results = estimateBatch(shots, scopes, grid, roster);
	ASSERT_EQ(results.size(), scopes.size());

	for (std::size_t i = 0; i < scopes.size(); ++i) {
		EXPECT_EQ(results[i].scope.kind, scopes[i].kind);
		EXPECT_EQ(results[i].scope.name, scopes[i].name);
	}

	EXPECT_EQ(results[0].shotCount, shots.size());
	ASSERT_TRUE(results[0].estimate.has_value());
	EXPECT_EQ(results[0].estimate->status, core::EstimateStatus::Ok);

	EXPECT_EQ(results[1].shotCount, 100u);
	ASSERT_TRUE(results[1].estimate.has_value());
	EXPECT_EQ(results[1].estimate->status, core::EstimateStatus::Ok);

	EXPECT_EQ(results[2].scopeStatus, ScopeStatus::EmptyScope);
	EXPECT_FALSE(results[2].estimate.has_value());

	EXPECT_EQ(results[3].shotCount, 200u);
	ASSERT_TRUE(results[3].estimate.has_value());
	EXPECT_EQ(results[3].estimate->status, core::EstimateStatus::Ok);

	EXPECT_EQ(results[4].scopeStatus, ScopeStatus::Ok);
	ASSERT_TRUE(results[4].estimate.has_value());
	EXPECT_EQ(results[4].estimate->status, core::EstimateStatus::InsufficientData);

	EXPECT_EQ(results[5].scopeStatus, ScopeStatus::EmptyScope);
	EXPECT_FALSE(results[5].estimate.has_value());
}

TEST(BatchEstimator, SameAsSequentialEstimation) {
	const auto shots = leagueShots();
	const auto grid  = core::GridSpec::create();

	const std::vector<Scope> scopes = {Scope::player("ana"), Scope::player("ben"), Scope::league(), Scope::player("dan")};
	const std::vector<ScopedEstimate> results = estimateBatch(shots, scopes, grid);
	ASSERT_EQ(results.size(), scopes.size());

	for (std::size_t i = 0; i < scopes.size(); ++i) {
		const ScopeResult gathered        = gatherShots(shots, scopes[i]);
		const core::EstimateResult single = core::estimateSurface(gathered.records, grid);

		ASSERT_TRUE(results[i].estimate.has_value());
		ASSERT_EQ(results[i].estimate->status, single.status);
		EXPECT_EQ(cv::norm(results[i].estimate->surface.values(), single.surface.values(), cv::NORM_INF), 0.0) << describe(scopes[i]);
	}
}

TEST(BatchEstimator, NoScopes_NoResults) {
	const auto shots = leagueShots();
	EXPECT_TRUE(estimateBatch(shots, {}, core::GridSpec::create()).empty());
}

TEST(BatchEstimator, NullGrid_Throws) {
	const auto shots = leagueShots();
	EXPECT_THROW(estimateBatch(shots, {Scope::league()}, nullptr), cv::Exception);
}

} // namespace gtest
} // namespace xgmap::surface
