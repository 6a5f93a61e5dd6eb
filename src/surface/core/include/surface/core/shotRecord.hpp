#pragma once

#include <string>

namespace xgmap::surface::core {

//! Rink coordinate of the net that shot distances are measured to.
inline constexpr double NET_X = 89.0;
inline constexpr double NET_Y = 0.0;

//! One observed shot as delivered by the data source.
//! The source guarantees 0 <= x <= 89, -42.5 <= y <= 42.5 and 0 <= xGoal <= 1.
struct ShotRecord {
	double x;              //!< Rink x coordinate (feet), adjusted to the offensive half.
	double y;              //!< Rink y coordinate (feet).
	double xGoal;          //!< Model goal probability of this shot.
	std::string shooter{}; //!< Shooter identity.
	bool isGoal{false};    //!< The shot was a goal.
	double distance{-1.0}; //!< Shot distance in feet. Negative -> derived from (x, y).
};

//! Distance of the shot to the net. Uses the recorded distance if the source provided one.
double shotDistance(const ShotRecord& shot);

} // namespace xgmap::surface::core
