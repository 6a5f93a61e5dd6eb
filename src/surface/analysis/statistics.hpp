#pragma once

#include <cstddef>
#include <vector>

namespace xgmap::surface {

//! Descriptive statistics of a sample. All members are 0 for an empty sample.
struct SampleStatistics {
	std::size_t count{0};
	double total{0.0};
	double mean{0.0};
	double stddev{0.0}; //!< Population standard deviation.
	double median{0.0}; //!< Mean of the two middle values for even counts.
	double max{0.0};
};

SampleStatistics sampleStatistics(std::vector<double> values);

} // namespace xgmap::surface
