#include "surface/core/gridSpec.hpp"
#include "surface/core/surface.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>

namespace xgmap::surface::core {
namespace gtest {

TEST(GridSpec, DefaultAxes_SnappedToLattice) {
	const auto grid = GridSpec::create();
	ASSERT_NE(grid, nullptr);

	EXPECT_EQ(grid->width(), 100);
	EXPECT_EQ(grid->height(), 85);
	EXPECT_EQ(grid->size(), cv::Size(100, 85));

	const auto& xs = grid->xAxis();
	const auto& ys = grid->yAxis();
	ASSERT_EQ(xs.size(), 100u);
	ASSERT_EQ(ys.size(), 85u);

	EXPECT_DOUBLE_EQ(xs.front(), 0.0);
	EXPECT_DOUBLE_EQ(xs.back(), 100.0);
	EXPECT_DOUBLE_EQ(ys.front(), -43.0); // -42.5 rounds away from zero
	EXPECT_DOUBLE_EQ(ys.back(), 43.0);

	for (const double v: xs) {
		EXPECT_DOUBLE_EQ(v, std::round(v));
	}
	for (const double v: ys) {
		EXPECT_DOUBLE_EQ(v, std::round(v));
	}
	EXPECT_TRUE(std::is_sorted(xs.begin(), xs.end()));
	EXPECT_TRUE(std::is_sorted(ys.begin(), ys.end()));
}

TEST(GridSpec, Linspace_ExactEndpoints) {
	const auto v = linspace(-42.5, 42.5, 85);
	ASSERT_EQ(v.size(), 85u);
	EXPECT_DOUBLE_EQ(v.front(), -42.5);
	EXPECT_DOUBLE_EQ(v.back(), 42.5);
	EXPECT_NEAR(v[42], 0.0, 1e-12);

	EXPECT_TRUE(linspace(0.0, 1.0, 0).empty());
	ASSERT_EQ(linspace(3.0, 7.0, 1).size(), 1u);
	EXPECT_DOUBLE_EQ(linspace(3.0, 7.0, 1).front(), 3.0);
}

TEST(GridSpec, InvalidParameters_Throw) {
	EXPECT_THROW(GridSpec::create(GridBounds{}, 1, 85), cv::Exception);
	EXPECT_THROW(GridSpec::create(GridBounds{}, 100, 0), cv::Exception);
	EXPECT_THROW(GridSpec::create(GridBounds{50.0, 10.0, 42.5}, 100, 85), cv::Exception);
	EXPECT_THROW(GridSpec::create(GridBounds{0.0, 100.0, 0.0}, 100, 85), cv::Exception);
}

TEST(GridSpec, Create_SharedBySurfaces) {
	auto grid = GridSpec::create(GridBounds{}, 20, 15);
	ASSERT_NE(grid, nullptr);
	EXPECT_EQ(grid.use_count(), 1);
	EXPECT_EQ(grid->size(), cv::Size(20, 15));

	const Surface a = Surface::filled(grid, 0.1);
	const Surface b = Surface::filled(grid, 0.2);
	EXPECT_EQ(grid.use_count(), 3);

	// Surfaces keep the grid alive on their own.
	const GridSpec* raw = grid.get();
	grid.reset();
	EXPECT_EQ(&a.grid(), raw);
	EXPECT_DOUBLE_EQ(b.valueAt(0.0, 0.0), 0.2);
}

TEST(GridSpec, Equality_ByValue) {
	const auto a = GridSpec::create();
	const auto b = GridSpec::create(GridConfig{});
	const auto c = GridSpec::create(GridBounds{}, 50, 85);
	const auto d = GridSpec::create(GridBounds{0.0, 89.0, 42.5}, 100, 85);

	EXPECT_TRUE(*a == *b);
	EXPECT_FALSE(*a == *c);
	EXPECT_FALSE(*a == *d);
}

TEST(GridSpec, NearestNode) {
	const auto grid = GridSpec::create();

	const cv::Point net = grid->nearestNode(89.0, 0.0);
	EXPECT_DOUBLE_EQ(grid->xAxis()[static_cast<std::size_t>(net.x)], 89.0);
	EXPECT_DOUBLE_EQ(grid->yAxis()[static_cast<std::size_t>(net.y)], 0.0);

	// Outside the bounds -> clamped to the border nodes.
	EXPECT_EQ(grid->nearestNode(-10.0, -100.0), cv::Point(0, 0));
	EXPECT_EQ(grid->nearestNode(500.0, 100.0), cv::Point(99, 84));
}

TEST(Surface, FilledAndLookup) {
	const auto grid      = GridSpec::create();
	const Surface filled = Surface::filled(grid, 0.25);

	ASSERT_FALSE(filled.empty());
	EXPECT_EQ(filled.values().size(), grid->size());
	EXPECT_EQ(filled.values().type(), CV_64FC1);
	EXPECT_DOUBLE_EQ(filled.minValue(), 0.25);
	EXPECT_DOUBLE_EQ(filled.maxValue(), 0.25);
	EXPECT_DOUBLE_EQ(filled.valueAt(89.0, 0.0), 0.25);

	EXPECT_TRUE(Surface{}.empty());
}

TEST(Surface, WrongShape_Throws) {
	const auto grid = GridSpec::create();
	EXPECT_THROW(Surface(grid, cv::Mat::zeros(10, 10, CV_64FC1)), cv::Exception);
	EXPECT_THROW(Surface(grid, cv::Mat::zeros(grid->size(), CV_32FC1)), cv::Exception);
	EXPECT_THROW(Surface(nullptr, cv::Mat::zeros(grid->size(), CV_64FC1)), cv::Exception);
}

} // namespace gtest
} // namespace xgmap::surface::core
