#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "lagrange_window.h"
#include "lagrange_error.h"

namespace lagrange {

namespace {

Index windowCenter(const WindowData& window)
{
    Index T = -1;
    for (const auto& [name, m] : window) {
        if (T < 0)
            T = m.rows();
        else if (m.rows() != T)
            throw ConfigError(fmt::format("variable '{}' has {} rows, expected {}",
                                          name, m.rows(), T));
    }
    return T / 2;
}

} // namespace

WindowData assembleWindow(const Group& backward, const Group& forward)
{
    if (backward.size() != forward.size())
        throw ConfigError(fmt::format("backward group has {} variables, forward has {}",
                                      backward.size(), forward.size()));
    WindowData window;
    for (const auto& [name, fwdset] : forward) {
        auto it = backward.find(name);
        if (it == backward.end())
            throw ConfigError(fmt::format("variable '{}' missing from backward group", name));
        MatrixXd fwd = fwdset->read();
        MatrixXd bwd = it->second->read();
        if (bwd.rows() < 1)
            throw ConfigError(fmt::format("backward group of '{}' lacks the center state", name));
        if (bwd.cols() != fwd.cols())
            throw ConfigError(fmt::format("variable '{}' has {} particles backward, {} forward",
                                          name, bwd.cols(), fwd.cols()));

        // row 0 of backward is the center, already the first row of forward
        const Index nb = bwd.rows() - 1;
        MatrixXd m(nb + fwd.rows(), fwd.cols());
        m.topRows(nb) = bwd.bottomRows(nb).colwise().reverse();
        m.bottomRows(fwd.rows()) = fwd;
        window.emplace(name, std::move(m));
    }
    return window;
}

std::map<std::string, VectorXd> filterStep(const WindowData& window, const Filter& filter)
{
    const Index center = windowCenter(window);
    std::map<std::string, VectorXd> out;
    for (const auto& [name, m] : window) {
        out.emplace("var_" + name, filter.apply(m, center));
    }
    return out;
}

std::map<std::string, VectorXd> filterStep(const WindowData& window,
                                           const SpatialFilter& filter)
{
    auto lon = window.find("lon");
    auto lat = window.find("lat");
    if (lon == window.end() || lat == window.end())
        throw ConfigError("spatial filtering needs 'lon' and 'lat' in the window");

    const Index center = windowCenter(window);
    if (center >= lon->second.rows())
        throw DomainError(fmt::format("center index {} outside window of length {}",
                                      center, lon->second.rows()));
    const VectorXd lons = lon->second.row(center).transpose();
    const VectorXd lats = lat->second.row(center).transpose();

    std::map<std::string, VectorXd> out;
    for (const auto& [name, m] : window) {
        out.emplace("var_" + name, filter.apply(m, center, lons, lats));
    }
    return out;
}

Index windowSteps(double windowSize, double advectionDt)
{
    if (!(advectionDt > 0.) || !(windowSize >= 0.))
        throw ConfigError(fmt::format("invalid window size {} for advection step {}",
                                      windowSize, advectionDt));
    return static_cast<Index>(std::floor(windowSize / advectionDt));
}

} // namespace lagrange
