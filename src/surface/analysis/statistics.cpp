#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace xgmap::surface {

SampleStatistics sampleStatistics(std::vector<double> values) {
	SampleStatistics stats{};
	stats.count = values.size();
	if (values.empty()) {
		return stats;
	}

	// Sorted once: summation order does not depend on the input order and the median is a lookup.
	std::sort(values.begin(), values.end());

	const auto n = static_cast<double>(stats.count);
	stats.total  = std::accumulate(values.begin(), values.end(), 0.0);
	stats.mean   = stats.total / n;
	stats.max    = values.back();

	const std::size_t mid = stats.count / 2;
	stats.median          = (stats.count % 2 == 0) ? 0.5 * (values[mid - 1] + values[mid]) : values[mid];

	double squares = 0.0;
	for (const double v: values) {
		squares += (v - stats.mean) * (v - stats.mean);
	}
	stats.stddev = std::sqrt(squares / n);

	return stats;
}

} // namespace xgmap::surface
