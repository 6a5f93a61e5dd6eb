#pragma once

#include <opencv2/core/mat.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xgmap::surface::core {

//! Matrix recorded by one step of an estimation.
struct TraceEntry {
	std::string stage; //!< e.g. "Estimate Surface".
	std::string step;  //!< e.g. "Interpolated", "Clamped", "Smoothed".
	cv::Mat values;    //!< Deep copy of the step output.
};

/*! Records the intermediate matrices of the estimation functions, for tests and parameter tuning.
 *  A step is recorded under the currently open stage, entries keep their recording order.
 * \note Not thread safe. Use one trace per estimation call.
 */
class DebugTrace {
public:
	void beginStage(std::string stage); //!< Closes the open stage, if any.
	void add(std::string step, const cv::Mat& values);
	void endStage();

	const std::vector<TraceEntry>& entries() const { return m_entries; }

	//! Most recent entry of @p step within @p stage. nullptr if it was not recorded.
	const TraceEntry* find(std::string_view stage, std::string_view step) const;

	void clear();

private:
	std::optional<std::string> m_openStage{}; //!< Stage new steps are recorded under.
	std::vector<TraceEntry> m_entries{};
};

} // namespace xgmap::surface::core
