#include "surface/core/debugTrace.hpp"

#include <opencv2/core/utils/logger.hpp>

#include <algorithm>
#include <utility>

namespace xgmap::surface::core {

void DebugTrace::beginStage(std::string stage) {
	m_openStage = std::move(stage);
}

void DebugTrace::endStage() {
	m_openStage.reset();
}

void DebugTrace::add(std::string step, const cv::Mat& values) {
	if (!m_openStage) {
		CV_LOG_WARNING(NULL, "DebugTrace: step '" << step << "' recorded outside of a stage, ignored.");
		return;
	}
	m_entries.push_back(TraceEntry{*m_openStage, std::move(step), values.clone()});
}

const TraceEntry* DebugTrace::find(std::string_view stage, std::string_view step) const {
	const auto it = std::find_if(m_entries.rbegin(), m_entries.rend(),
	                             [&](const TraceEntry& entry) { return entry.stage == stage && entry.step == step; });
	return it == m_entries.rend() ? nullptr : &*it;
}

void DebugTrace::clear() {
	m_openStage.reset();
	m_entries.clear();
}

} // namespace xgmap::surface::core
