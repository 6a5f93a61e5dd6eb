#include "surface/core/gridSpec.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>

namespace xgmap::surface::core {

std::vector<double> linspace(const double start, const double stop, const int count) {
	if (count <= 0) {
		return {};
	}
	if (count == 1) {
		return {start};
	}

	std::vector<double> values(static_cast<std::size_t>(count));
	const double step = (stop - start) / static_cast<double>(count - 1);
	for (int i = 0; i < count; ++i) {
		values[static_cast<std::size_t>(i)] = start + static_cast<double>(i) * step;
	}
	values.back() = stop; // No accumulated rounding on the last sample.
	return values;
}

//! Round every sample to the nearest integer coordinate (half away from zero).
static std::vector<double> snapToLattice(std::vector<double> axis) {
	for (double& v: axis) {
		v = std::round(v);
	}
	return axis;
}

//! Index of the axis value closest to v. Ties resolve to the lower index.
static int nearestIndex(const std::vector<double>& axis, const double v) {
	const auto it = std::lower_bound(axis.begin(), axis.end(), v);
	if (it == axis.begin()) {
		return 0;
	}
	if (it == axis.end()) {
		return static_cast<int>(axis.size()) - 1;
	}

	const auto hi = static_cast<int>(it - axis.begin());
	const int lo  = hi - 1;
	return (v - axis[static_cast<std::size_t>(lo)] <= axis[static_cast<std::size_t>(hi)] - v) ? lo : hi;
}

GridSpec::GridSpec(CreateKey, const GridBounds& bounds, const int widthSamples, const int heightSamples)
    : m_bounds{bounds}, m_xAxis{snapToLattice(linspace(bounds.xMin, bounds.xMax, widthSamples))},
      m_yAxis{snapToLattice(linspace(-bounds.yMaxAbs, bounds.yMaxAbs, heightSamples))} {
}

std::shared_ptr<const GridSpec> GridSpec::create(const GridBounds& bounds, const int widthSamples, const int heightSamples) {
	validate(GridConfig{bounds, widthSamples, heightSamples});
	return std::make_shared<const GridSpec>(CreateKey{}, bounds, widthSamples, heightSamples);
}

std::shared_ptr<const GridSpec> GridSpec::create(const GridConfig& config) {
	return create(config.bounds, config.widthSamples, config.heightSamples);
}

cv::Point GridSpec::nearestNode(const double x, const double y) const {
	return {nearestIndex(m_xAxis, x), nearestIndex(m_yAxis, y)};
}

bool GridSpec::operator==(const GridSpec& other) const {
	return m_bounds == other.m_bounds && m_xAxis.size() == other.m_xAxis.size() && m_yAxis.size() == other.m_yAxis.size();
}

} // namespace xgmap::surface::core
