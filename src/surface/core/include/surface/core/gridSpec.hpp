#pragma once

#include "surface/core/config.hpp"

#include <opencv2/core/types.hpp>

#include <memory>
#include <vector>

namespace xgmap::surface::core {

/*! Regular sampling lattice over the offensive half of the rink.
 *  Column c samples x = xAxis()[c], row r samples y = yAxis()[r]. Both axes are linearly spaced over their bounds and then
 *  rounded to the nearest integer (half away from zero), which snaps the query points onto the integer lattice the raw shot
 *  coordinates live on.
 *
 *  A GridSpec is immutable and shared (std::shared_ptr<const GridSpec>) by every Surface built on it. Surfaces can only be
 *  compared if their grids are equal.
 */
class GridSpec {
public:
	//! \throws cv::Exception (StsBadArg) for less than 2 samples on an axis or an empty coordinate range.
	static std::shared_ptr<const GridSpec> create(const GridBounds& bounds = GridBounds{}, int widthSamples = 100, int heightSamples = 85);
	static std::shared_ptr<const GridSpec> create(const GridConfig& config);

	const GridBounds& bounds() const { return m_bounds; }
	int width() const { return static_cast<int>(m_xAxis.size()); }  //!< Number of columns.
	int height() const { return static_cast<int>(m_yAxis.size()); } //!< Number of rows.
	cv::Size size() const { return {width(), height()}; }

	const std::vector<double>& xAxis() const { return m_xAxis; } //!< Rounded x query coordinates (size = width()).
	const std::vector<double>& yAxis() const { return m_yAxis; } //!< Rounded y query coordinates (size = height()).

	//! Grid node closest to a rink coordinate. x -> column, y -> row.
	cv::Point nearestNode(double x, double y) const;

	bool operator==(const GridSpec& other) const;

private:
	//! Restricts construction to create() while still allowing std::make_shared.
	struct CreateKey {
		explicit CreateKey() = default;
	};

public:
	GridSpec(CreateKey, const GridBounds& bounds, int widthSamples, int heightSamples);

private:
	GridBounds m_bounds;         //!< Bounds the axes were generated from.
	std::vector<double> m_xAxis; //!< Column coordinates.
	std::vector<double> m_yAxis; //!< Row coordinates.
};

//! \p count values evenly spaced over [start, stop]. The endpoints are exact.
std::vector<double> linspace(double start, double stop, int count);

} // namespace xgmap::surface::core
