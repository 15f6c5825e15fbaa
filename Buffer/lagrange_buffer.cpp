#include <algorithm>

#include <fmt/format.h>

#include "lagrange_buffer.h"
#include "lagrange_error.h"

namespace lagrange {

std::vector<Variable> trackedVariables(
    const std::vector<Variable>& variables,
    const std::optional<std::vector<std::string>>& allowed)
{
    std::vector<Variable> tracked;
    for (const auto& v : variables) {
        // this variable isn't marked for output, honour that
        if (!v.to_write)
            continue;
        // explicit list of variables, e.g. only the sampled ones
        if (allowed && std::find(allowed->begin(), allowed->end(), v.name) == allowed->end())
            continue;
        tracked.push_back(v);
    }
    return tracked;
}

namespace internal {

void checkGroupName(const std::string& name)
{
    if (name.empty() || name == "." || name == "..")
        throw ConfigError(fmt::format("invalid group name '{}'", name));
    if (name.find('/') != std::string::npos)
        throw ConfigError(fmt::format("group name '{}' may not contain '/'", name));
}

std::vector<Eigen::VectorXd> gatherRow(const ParticleSource& particles,
                                       const std::vector<Variable>& variables,
                                       Index n)
{
    if (particles.size() != n)
        throw ConfigError(fmt::format("buffer holds {} particles, source has {}",
                                      n, particles.size()));
    std::vector<Eigen::VectorXd> row;
    row.reserve(variables.size());
    for (const auto& v : variables) {
        row.push_back(particles.values(v.name));
        if (row.back().size() != n)
            throw ConfigError(fmt::format("variable '{}' has {} values, expected {}",
                                          v.name, row.back().size(), n));
        // integers have no NaN to store
        if ((v.dtype == DType::Int32 || v.dtype == DType::Int64) && !row.back().allFinite())
            throw ConfigError(fmt::format("integer variable '{}' has non-finite values", v.name));
    }
    return row;
}

} // namespace internal

} // namespace lagrange
