#pragma once

#include "surface/core/surface.hpp"

namespace xgmap::surface::core {

//! Pointwise subject - baseline on a shared grid.
//! Positive cells: the subject outperforms the baseline. The result is neither clamped, smoothed nor re-centred, zero stays the
//! neutral midpoint of a diverging colour scale.
//! \throws cv::Exception (StsUnmatchedSizes) if a surface is empty or the grids differ. No partial result is produced.
Surface difference(const Surface& subject, const Surface& baseline);

//! Largest absolute value of the surface. Symmetric colour limits [-r, r] keep zero centred. 0 for an empty surface.
double symmetricRange(const Surface& surface);

} // namespace xgmap::surface::core
