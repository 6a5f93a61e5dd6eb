#include "cloughTocher.hpp"

#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <utility>

/**
 * @brief Clough-Tocher interpolation on a Delaunay triangulation.
 *
 * Per triangle (vertices 1, 2, 3) the interpolant is a cubic Bezier patch on each of the three sub triangles formed with
 * the centroid (vertex 4). The Bezier ordinates c_ijkl follow from
 *  1) the vertex values and gradients (corner and edge ordinates),
 *  2) C1 continuity inside the triangle (ordinates next to the centroid),
 *  3) the requirement that the cross boundary derivative is linear along each edge, which makes neighbouring patches C1.
 *     The direction of that derivative points to the centroid of the neighbouring triangle (or the own centroid on the hull).
 *
 * The evaluation uses extended barycentric coordinates (b1, b2, b3, b4) where one of b1..b3 is zero, which selects the
 * sub triangle without branching.
 */
namespace xgmap::surface::core {

static constexpr double TRIANGULATION_PAD = 10.0; //!< Padding of the Subdiv2D rectangle, in multiples of the data span.
static constexpr double DEGENERATE_AREA   = 1e-12; //!< Relative (to span^2) area below which a triangle is ignored.

std::vector<Site> mergeSites(std::span<const ShotRecord> records) {
	// Key in single precision: two positions that are equal as floats are the same vertex in the triangulation.
	std::map<std::pair<float, float>, std::vector<double>> groups;
	for (const auto& r: records) {
		groups[{static_cast<float>(r.x), static_cast<float>(r.y)}].push_back(r.xGoal);
	}

	std::vector<Site> sites;
	sites.reserve(groups.size());
	for (auto& [pos, values]: groups) {
		std::sort(values.begin(), values.end()); // Summation order independent of the record order.
		const double sum = std::accumulate(values.begin(), values.end(), 0.0);
		sites.push_back(Site{static_cast<double>(pos.first), static_cast<double>(pos.second), sum / static_cast<double>(values.size())});
	}
	return sites;
}

CloughTocherInterpolator::CloughTocherInterpolator(std::vector<Site> sites, const InterpolationConfig& config)
    : m_sites{std::move(sites)}, m_config{config} {
	triangulate();
	if (valid()) {
		estimateGradients();
	}
}

void CloughTocherInterpolator::triangulate() {
	if (m_sites.size() < 3u) {
		return;
	}

	// 1. Bounding rectangle. Subdiv2D places its virtual outer vertices relative to it; keep them far away.
	double minX = m_sites.front().x, maxX = minX;
	double minY = m_sites.front().y, maxY = minY;
	for (const auto& s: m_sites) {
		minX = std::min(minX, s.x);
		maxX = std::max(maxX, s.x);
		minY = std::min(minY, s.y);
		maxY = std::max(maxY, s.y);
	}
	const double span = std::max({maxX - minX, maxY - minY, 1.0});
	const double pad  = TRIANGULATION_PAD * span;

	const cv::Rect rect(static_cast<int>(std::floor(minX - pad)), static_cast<int>(std::floor(minY - pad)),
	                    static_cast<int>(std::ceil(maxX - minX + 2.0 * pad)) + 2, static_cast<int>(std::ceil(maxY - minY + 2.0 * pad)) + 2);

	// 2. Delaunay triangulation. Remember which Subdiv2D vertex belongs to which site.
	cv::Subdiv2D subdiv(rect);
	std::map<int, int> vertexToSite;
	for (std::size_t i = 0; i < m_sites.size(); ++i) {
		const cv::Point2f pt(static_cast<float>(m_sites[i].x), static_cast<float>(m_sites[i].y));
		const int vertex = subdiv.insert(pt);
		if (!vertexToSite.emplace(vertex, static_cast<int>(i)).second) {
			CV_LOG_DEBUG(NULL, "Site (" << pt.x << ", " << pt.y << ") coincides with an existing vertex, skipped.");
		}
	}

	const auto siteOf = [&](const int edge) -> int {
		const auto it = vertexToSite.find(subdiv.edgeOrg(edge));
		return it == vertexToSite.end() ? -1 : it->second; // -1 -> one of the virtual outer vertices
	};

	// 3. Collect faces whose three vertices are real sites.
	std::vector<int> leadingEdges;
	subdiv.getLeadingEdgeList(leadingEdges);

	std::set<std::array<int, 3>> seen;
	for (const int leading: leadingEdges) {
		for (const int e0: {leading, subdiv.rotateEdge(leading, 2)}) {
			const int e1 = subdiv.getEdge(e0, cv::Subdiv2D::NEXT_AROUND_LEFT);
			const int e2 = subdiv.getEdge(e1, cv::Subdiv2D::NEXT_AROUND_LEFT);
			if (e1 <= 0 || e2 <= 0 || subdiv.getEdge(e2, cv::Subdiv2D::NEXT_AROUND_LEFT) != e0) {
				continue; // Not a triangular face.
			}

			std::array<int, 3> v{siteOf(e0), siteOf(e1), siteOf(e2)};
			if (v[0] < 0 || v[1] < 0 || v[2] < 0) {
				continue;
			}

			std::array<int, 3> key = v;
			std::sort(key.begin(), key.end());
			if (key[0] == key[1] || key[1] == key[2] || !seen.insert(key).second) {
				continue;
			}

			const Site& a      = m_sites[static_cast<std::size_t>(v[0])];
			const Site& b      = m_sites[static_cast<std::size_t>(v[1])];
			const Site& c      = m_sites[static_cast<std::size_t>(v[2])];
			const double area2 = (b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y);
			if (std::abs(area2) <= DEGENERATE_AREA * span * span) {
				continue; // Collinear
			}
			if (area2 < 0.0) {
				std::swap(v[1], v[2]); // Counter clockwise
			}
			m_triangles.push_back(Triangle{v, {-1, -1, -1}});
		}
	}

	// Canonical order: the first triangle claiming a grid node wins, so this order must not depend on Subdiv2D internals.
	std::sort(m_triangles.begin(), m_triangles.end(), [](const Triangle& lhs, const Triangle& rhs) {
		auto l = lhs.v, r = rhs.v;
		std::sort(l.begin(), l.end());
		std::sort(r.begin(), r.end());
		return l < r;
	});

	// 4. Triangle neighbours across edges and site adjacency.
	std::map<std::pair<int, int>, std::vector<std::pair<int, int>>> edgeFaces; //!< (site, site) -> (triangle, opposite corner)
	for (std::size_t t = 0; t < m_triangles.size(); ++t) {
		const auto& v = m_triangles[t].v;
		for (int k = 0; k < 3; ++k) {
			const int a = v[static_cast<std::size_t>((k + 1) % 3)];
			const int b = v[static_cast<std::size_t>((k + 2) % 3)];
			edgeFaces[{std::min(a, b), std::max(a, b)}].emplace_back(static_cast<int>(t), k);
		}
	}

	m_adjacency.assign(m_sites.size(), {});
	for (const auto& [edge, faces]: edgeFaces) {
		m_adjacency[static_cast<std::size_t>(edge.first)].push_back(edge.second);
		m_adjacency[static_cast<std::size_t>(edge.second)].push_back(edge.first);

		if (faces.size() == 2u) {
			const auto [t0, k0] = faces[0];
			const auto [t1, k1] = faces[1];
			m_triangles[static_cast<std::size_t>(t0)].neighbour[static_cast<std::size_t>(k0)] = t1;
			m_triangles[static_cast<std::size_t>(t1)].neighbour[static_cast<std::size_t>(k1)] = t0;
		}
	}
	for (auto& adj: m_adjacency) {
		std::sort(adj.begin(), adj.end());
	}

	CV_LOG_DEBUG(NULL, "Triangulated " << m_sites.size() << " sites into " << m_triangles.size() << " triangles.");
}

void CloughTocherInterpolator::estimateGradients() {
	m_gradients.assign(m_sites.size(), cv::Vec2d(0.0, 0.0));
	m_gradientIterations = 0;

	for (int iter = 0; iter < m_config.gradientMaxIterations; ++iter) {
		double err = 0.0; // Largest relative gradient change of this sweep.

		for (std::size_t i = 0; i < m_sites.size(); ++i) {
			const auto& nbrs = m_adjacency[i];
			if (nbrs.empty()) {
				continue;
			}

			const Site& si = m_sites[i];
			double q00 = 0.0, q01 = 0.0, q11 = 0.0; // Symmetric 2x2 system
			double s0 = 0.0, s1 = 0.0;
			for (const int j: nbrs) {
				const Site& sj     = m_sites[static_cast<std::size_t>(j)];
				const cv::Vec2d gj = m_gradients[static_cast<std::size_t>(j)];

				const double ex  = sj.x - si.x;
				const double ey  = sj.y - si.y;
				const double L   = std::sqrt(ex * ex + ey * ey);
				const double L3  = L * L * L;
				const double df2 = -ex * gj[0] - ey * gj[1]; // Derivative at j along the edge back to i
				const double rhs = 6.0 * (si.value - sj.value) - 2.0 * df2;

				q00 += 4.0 * ex * ex / L3;
				q01 += 4.0 * ex * ey / L3;
				q11 += 4.0 * ey * ey / L3;
				s0 += rhs * ex / L3;
				s1 += rhs * ey / L3;
			}

			const double det = q00 * q11 - q01 * q01;
			if (det == 0.0 || !std::isfinite(det)) {
				continue; // All incident edges are parallel. Keep the previous gradient.
			}

			const double r0 = (q11 * s0 - q01 * s1) / det;
			const double r1 = (-q01 * s0 + q00 * s1) / det;

			cv::Vec2d& gi = m_gradients[i];
			double change = std::max(std::abs(gi[0] + r0), std::abs(gi[1] + r1));
			gi            = cv::Vec2d(-r0, -r1);
			change /= std::max(1.0, std::max(std::abs(r0), std::abs(r1)));
			err = std::max(err, change);
		}

		if (err < m_config.gradientTolerance) {
			m_gradientIterations = iter + 1;
			return;
		}
	}

	CV_LOG_DEBUG(NULL, "Gradient estimation did not converge within " << m_config.gradientMaxIterations << " sweeps.");
}

std::array<double, 3> CloughTocherInterpolator::barycentric(const Triangle& tri, const double x, const double y) const {
	const Site& p0 = m_sites[static_cast<std::size_t>(tri.v[0])];
	const Site& p1 = m_sites[static_cast<std::size_t>(tri.v[1])];
	const Site& p2 = m_sites[static_cast<std::size_t>(tri.v[2])];

	const double det = (p1.x - p0.x) * (p2.y - p0.y) - (p2.x - p0.x) * (p1.y - p0.y);
	const double b1  = ((x - p0.x) * (p2.y - p0.y) - (p2.x - p0.x) * (y - p0.y)) / det;
	const double b2  = ((p1.x - p0.x) * (y - p0.y) - (x - p0.x) * (p1.y - p0.y)) / det;
	return {1.0 - b1 - b2, b1, b2};
}

bool CloughTocherInterpolator::inside(const std::array<double, 3>& b) const {
	const double eps = m_config.hullTolerance;
	return b[0] >= -eps && b[1] >= -eps && b[2] >= -eps;
}

double CloughTocherInterpolator::interpolate(const std::size_t t, const std::array<double, 3>& b) const {
	const Triangle& tri = m_triangles[t];
	const Site& p1      = m_sites[static_cast<std::size_t>(tri.v[0])];
	const Site& p2      = m_sites[static_cast<std::size_t>(tri.v[1])];
	const Site& p3      = m_sites[static_cast<std::size_t>(tri.v[2])];
	const cv::Vec2d& d1 = m_gradients[static_cast<std::size_t>(tri.v[0])];
	const cv::Vec2d& d2 = m_gradients[static_cast<std::size_t>(tri.v[1])];
	const cv::Vec2d& d3 = m_gradients[static_cast<std::size_t>(tri.v[2])];

	// Edge vectors
	const double e12x = p2.x - p1.x, e12y = p2.y - p1.y;
	const double e23x = p3.x - p2.x, e23y = p3.y - p2.y;
	const double e31x = p1.x - p3.x, e31y = p1.y - p3.y;

	// Directional derivatives at the corners along the edges
	const double df12 = +(d1[0] * e12x + d1[1] * e12y);
	const double df21 = -(d2[0] * e12x + d2[1] * e12y);
	const double df23 = +(d2[0] * e23x + d2[1] * e23y);
	const double df32 = -(d3[0] * e23x + d3[1] * e23y);
	const double df31 = +(d3[0] * e31x + d3[1] * e31y);
	const double df13 = -(d1[0] * e31x + d1[1] * e31y);

	// Corner and edge ordinates
	const double c3000 = p1.value;
	const double c2100 = (df12 + 3.0 * c3000) / 3.0;
	const double c2010 = (df13 + 3.0 * c3000) / 3.0;
	const double c0300 = p2.value;
	const double c1200 = (df21 + 3.0 * c0300) / 3.0;
	const double c0210 = (df23 + 3.0 * c0300) / 3.0;
	const double c0030 = p3.value;
	const double c1020 = (df31 + 3.0 * c0030) / 3.0;
	const double c0120 = (df32 + 3.0 * c0030) / 3.0;

	const double c2001 = (c2100 + c2010 + c3000) / 3.0;
	const double c0201 = (c1200 + c0300 + c0210) / 3.0;
	const double c0021 = (c1020 + c0120 + c0030) / 3.0;

	// Cross boundary derivative direction per edge, expressed relative to the edge midpoint direction.
	std::array<double, 3> g{};
	for (std::size_t k = 0; k < 3; ++k) {
		const int n = tri.neighbour[k];
		if (n < 0) {
			g[k] = -0.5; // Hull edge: derivative towards the own centroid.
			continue;
		}

		const Triangle& other = m_triangles[static_cast<std::size_t>(n)];
		double cx             = 0.0;
		double cy             = 0.0;
		for (const int v: other.v) {
			cx += m_sites[static_cast<std::size_t>(v)].x;
			cy += m_sites[static_cast<std::size_t>(v)].y;
		}
		const auto c = barycentric(tri, cx / 3.0, cy / 3.0);

		if (k == 0) {
			g[k] = (2.0 * c[2] + c[1] - 1.0) / (2.0 - 3.0 * c[2] - 3.0 * c[1]);
		} else if (k == 1) {
			g[k] = (2.0 * c[0] + c[2] - 1.0) / (2.0 - 3.0 * c[0] - 3.0 * c[2]);
		} else {
			g[k] = (2.0 * c[1] + c[0] - 1.0) / (2.0 - 3.0 * c[1] - 3.0 * c[0]);
		}
	}

	const double c0111 = (g[0] * (-c0300 + 3.0 * c0210 - 3.0 * c0120 + c0030) + (-c0300 + 2.0 * c0210 - c0120 + c0021 + c0201)) / 2.0;
	const double c1011 = (g[1] * (-c0030 + 3.0 * c1020 - 3.0 * c2010 + c3000) + (-c0030 + 2.0 * c1020 - c2010 + c2001 + c0021)) / 2.0;
	const double c1101 = (g[2] * (-c3000 + 3.0 * c2100 - 3.0 * c1200 + c0300) + (-c3000 + 2.0 * c2100 - c1200 + c2001 + c0201)) / 2.0;

	const double c1002 = (c1101 + c1011 + c2001) / 3.0;
	const double c0102 = (c1101 + c0111 + c0201) / 3.0;
	const double c0012 = (c1011 + c0111 + c0021) / 3.0;

	const double c0003 = (c1002 + c0102 + c0012) / 3.0;

	// Extended barycentric coordinates. One of b1..b3 is zero -> selects the sub triangle.
	const double minB = std::min({b[0], b[1], b[2]});
	const double b1   = b[0] - minB;
	const double b2   = b[1] - minB;
	const double b3   = b[2] - minB;
	const double b4   = 3.0 * minB;

	return b1 * b1 * b1 * c3000 + 3.0 * b1 * b1 * b2 * c2100 + 3.0 * b1 * b1 * b3 * c2010 + 3.0 * b1 * b1 * b4 * c2001 +
	       3.0 * b1 * b2 * b2 * c1200 + 6.0 * b1 * b2 * b4 * c1101 + 3.0 * b1 * b3 * b3 * c1020 + 6.0 * b1 * b3 * b4 * c1011 +
	       3.0 * b1 * b4 * b4 * c1002 + b2 * b2 * b2 * c0300 + 3.0 * b2 * b2 * b3 * c0210 + 3.0 * b2 * b2 * b4 * c0201 +
	       3.0 * b2 * b3 * b3 * c0120 + 6.0 * b2 * b3 * b4 * c0111 + 3.0 * b2 * b4 * b4 * c0102 + b3 * b3 * b3 * c0030 +
	       3.0 * b3 * b3 * b4 * c0021 + 3.0 * b3 * b4 * b4 * c0012 + b4 * b4 * b4 * c0003;
}

cv::Mat CloughTocherInterpolator::evaluate(const GridSpec& grid, const double fillValue) const {
	cv::Mat values(grid.size(), CV_64FC1, cv::Scalar(fillValue));
	cv::Mat_<uchar> assigned = cv::Mat_<uchar>::zeros(grid.size());

	const auto& xs = grid.xAxis();
	const auto& ys = grid.yAxis();

	// Visit only the nodes inside each triangle's bounding box.
	for (std::size_t t = 0; t < m_triangles.size(); ++t) {
		const Triangle& tri = m_triangles[t];

		double minX = m_sites[static_cast<std::size_t>(tri.v[0])].x, maxX = minX;
		double minY = m_sites[static_cast<std::size_t>(tri.v[0])].y, maxY = minY;
		for (const int v: tri.v) {
			const Site& s = m_sites[static_cast<std::size_t>(v)];
			minX          = std::min(minX, s.x);
			maxX          = std::max(maxX, s.x);
			minY          = std::min(minY, s.y);
			maxY          = std::max(maxY, s.y);
		}

		const auto c0 = static_cast<int>(std::lower_bound(xs.begin(), xs.end(), minX - 1e-9) - xs.begin());
		const auto c1 = static_cast<int>(std::upper_bound(xs.begin(), xs.end(), maxX + 1e-9) - xs.begin());
		const auto r0 = static_cast<int>(std::lower_bound(ys.begin(), ys.end(), minY - 1e-9) - ys.begin());
		const auto r1 = static_cast<int>(std::upper_bound(ys.begin(), ys.end(), maxY + 1e-9) - ys.begin());

		for (int r = r0; r < r1; ++r) {
			for (int c = c0; c < c1; ++c) {
				if (assigned(r, c)) {
					continue;
				}

				const auto b = barycentric(tri, xs[static_cast<std::size_t>(c)], ys[static_cast<std::size_t>(r)]);
				if (!inside(b)) {
					continue;
				}
				values.at<double>(r, c) = interpolate(t, b);
				assigned(r, c)          = 1;
			}
		}
	}

	return values;
}

} // namespace xgmap::surface::core
