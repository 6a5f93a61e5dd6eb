#pragma once

#include "surface/core/config.hpp"
#include "surface/core/gridSpec.hpp"
#include "surface/core/shotRecord.hpp"

#include <opencv2/core/mat.hpp>

#include <array>
#include <span>
#include <vector>

namespace xgmap::surface::core {

//! One interpolation node: a distinct position with the mean value of all shots taken there.
struct Site {
	double x;
	double y;
	double value;
};

/*! Merge shots at identical positions into sites and order them canonically (x, then y).
 *  Positions are compared in single precision, the precision the triangulation works in.
 *  The order of @p records does not influence the result beyond floating point summation order.
 */
std::vector<Site> mergeSites(std::span<const ShotRecord> records);

/*! Clough-Tocher C1 piecewise cubic interpolation of scattered data.
 *  The sites are triangulated (Delaunay, cv::Subdiv2D). Each triangle is split into three cubic Bezier patches around its
 *  centroid. The patches use vertex gradients obtained from a global curvature minimising iteration:
 *    for every vertex, pick the gradient minimising the integrated squared second derivative along all incident edges,
 *    given the current gradients of the neighbours (Gauss-Seidel sweeps until the relative change drops below a tolerance).
 *  Linear data is reproduced exactly. Grid nodes outside the triangulated hull get a fill value.
 */
class CloughTocherInterpolator {
public:
	//! \param [in] sites  Distinct sites, e.g. produced by mergeSites().
	//! \param [in] config Gradient iteration and hull tolerance parameters.
	CloughTocherInterpolator(std::vector<Site> sites, const InterpolationConfig& config);

	bool valid() const { return !m_triangles.empty(); } //!< At least one non-degenerate triangle exists.
	std::size_t triangleCount() const { return m_triangles.size(); }
	int gradientIterations() const { return m_gradientIterations; } //!< Sweeps used. 0 if not converged.

	//! Evaluate at every node of @p grid. Nodes outside the triangulation get @p fillValue.
	//! \return CV_64FC1 matrix of grid.size().
	cv::Mat evaluate(const GridSpec& grid, double fillValue) const;

private:
	struct Triangle {
		std::array<int, 3> v;         //!< Site indices, counter clockwise.
		std::array<int, 3> neighbour; //!< neighbour[k] is the triangle opposite of v[k]. -1 on the hull.
	};

	void triangulate();
	void estimateGradients();

	std::array<double, 3> barycentric(const Triangle& tri, double x, double y) const;
	bool inside(const std::array<double, 3>& b) const;
	double interpolate(std::size_t tri, const std::array<double, 3>& b) const;

private:
	std::vector<Site> m_sites;
	InterpolationConfig m_config;

	std::vector<Triangle> m_triangles{};
	std::vector<std::vector<int>> m_adjacency{}; //!< Sorted neighbouring site indices per site.
	std::vector<cv::Vec2d> m_gradients{};        //!< Estimated (df/dx, df/dy) per site.
	int m_gradientIterations{0};
};

} // namespace xgmap::surface::core
