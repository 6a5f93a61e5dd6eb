#pragma once

#include "surface/core/gridSpec.hpp"

#include <opencv2/core/mat.hpp>

#include <memory>

namespace xgmap::surface::core {

/*! Scalar field sampled on a GridSpec.
 *  values() is a CV_64FC1 matrix with grid().height() rows (y) and grid().width() columns (x).
 *  A Surface is immutable after creation. The matrix header is shared on copy, clone() it before modifying.
 *  A default constructed Surface is empty and represents "no result".
 */
class Surface {
public:
	Surface() = default;

	//! \throws cv::Exception if @p grid is null or @p values does not match the grid size / is not CV_64FC1.
	Surface(std::shared_ptr<const GridSpec> grid, cv::Mat values);

	//! Surface with every cell set to @p value.
	static Surface filled(std::shared_ptr<const GridSpec> grid, double value);

	bool empty() const { return !m_grid || m_values.empty(); }

	const GridSpec& grid() const { return *m_grid; } //!< \note Only valid if !empty().
	const std::shared_ptr<const GridSpec>& gridPtr() const { return m_grid; }
	const cv::Mat& values() const { return m_values; }

	double at(int row, int col) const { return m_values.at<double>(row, col); }
	double valueAt(double x, double y) const; //!< Value of the node closest to the rink coordinate (x, y).

	double minValue() const;
	double maxValue() const;

private:
	std::shared_ptr<const GridSpec> m_grid{}; //!< Grid the values are aligned to.
	cv::Mat m_values{};                       //!< Values (rows = y, cols = x).
};

} // namespace xgmap::surface::core
