#include "surface/core/shotRecord.hpp"

#include <cmath>

namespace xgmap::surface::core {

double shotDistance(const ShotRecord& shot) {
	if (shot.distance >= 0.0) {
		return shot.distance;
	}
	return std::hypot(NET_X - shot.x, NET_Y - shot.y);
}

} // namespace xgmap::surface::core
