#ifndef LAGRANGE_WINDOW_H
#define LAGRANGE_WINDOW_H

#include <map>
#include <string>

#include "lagrange_buffer.h"
#include "lagrange_filter.h"

namespace lagrange {

/// materialized (T, N) window per variable name
using WindowData = std::map<std::string, MatrixXd>;

/// join the two halves of a window advected out from its center: the
/// backward group without its first row (the center state), reversed in
/// time, followed by the whole forward group
WindowData assembleWindow(const Group& backward, const Group& forward);

/// filter every variable at the window center T / 2, keyed "var_" + name
std::map<std::string, VectorXd> filterStep(const WindowData& window, const Filter& filter);

/// same, with each particle's filter picked from its "lon" and "lat" at
/// the window center
std::map<std::string, VectorXd> filterStep(const WindowData& window,
                                           const SpatialFilter& filter);

/// number of advection steps on each side of the center for a window of
/// the given half width
Index windowSteps(double windowSize, double advectionDt);

} // namespace lagrange

#endif // LAGRANGE_WINDOW_H
