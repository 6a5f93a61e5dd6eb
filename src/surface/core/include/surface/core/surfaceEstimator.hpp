#pragma once

#include "surface/core/config.hpp"
#include "surface/core/debugTrace.hpp"
#include "surface/core/gridSpec.hpp"
#include "surface/core/shotRecord.hpp"
#include "surface/core/surface.hpp"

#include <memory>
#include <span>

// Estimation turns scattered shots into a smooth expected-goal density surface.
// Process:
//   1) Merge shots at identical positions (mean xGoal) and order them canonically. The result does not depend on record order.
//   2) Clough-Tocher cubic interpolation over the Delaunay triangulation of the positions. Nodes outside the convex hull get
//      the fill value.
//   3) Clamp negative values to zero. Negative expected goals are meaningless and come from cubic overshoot.
//   4) Gaussian smoothing (sigma 3 cells, reflected border). The smoothed values are not clamped again.
namespace xgmap::surface::core {

enum class EstimateStatus {
	Ok,               //!< Surface interpolated and smoothed.
	InsufficientData, //!< Too few distinct (non collinear) positions. Surface is filled with the fill value.
	NumericAnomaly,   //!< Interpolation produced NaN or infinity. Surface is empty.
};

//! Result of the estimation stage.
struct EstimateResult {
	EstimateStatus status; //!< What happened. InsufficientData still carries a valid Surface.
	Surface surface;       //!< Estimated surface. Empty on NumericAnomaly.
};

/*! Estimate the smoothed expected-goal surface of a set of shots.
 * \param [in]     records Shots to pool. May be empty.
 * \param [in]     grid    Sampling grid. Reuse the same grid for every Surface that will be compared.
 * \param [in]     config  Interpolation and smoothing parameters.
 * \param [in,out] trace   Optional trace receiving "Interpolated", "Clamped" and "Smoothed" matrices.
 * \return         EstimateResult. Surface shape is (grid->height(), grid->width()).
 * \throws         cv::Exception if @p grid is null or @p config is invalid.
 */
EstimateResult estimateSurface(std::span<const ShotRecord> records, const std::shared_ptr<const GridSpec>& grid,
                               const EstimatorConfig& config = EstimatorConfig{}, DebugTrace* trace = nullptr);

bool isValidEstimate(const EstimateResult& result); //!< Status is not NumericAnomaly and the surface is not empty.

const char* toString(EstimateStatus status);

} // namespace xgmap::surface::core
