#include "lagrange_particles.h"
#include "lagrange_error.h"

#include <fmt/format.h>

#include <utility>

namespace lagrange {

std::string_view dtypeName(DType dtype)
{
    switch (dtype) {
    case DType::Float32: return "float32";
    case DType::Float64: return "float64";
    case DType::Int32:   return "int32";
    case DType::Int64:   return "int64";
    }
    return "unknown";
}

ParticleState::ParticleState(Index n, std::vector<Variable> variables)
    : n(n), vars(std::move(variables))
{
    if (n < 0)
        throw ConfigError(fmt::format("negative particle count {}", n));
    for (const auto& v : vars) {
        if (data.count(v.name))
            throw ConfigError(fmt::format("duplicate particle variable '{}'", v.name));
        data[v.name] = VectorXd::Zero(n);
    }
}

VectorXd ParticleState::values(const std::string& name) const
{
    auto it = data.find(name);
    if (it == data.end())
        throw ConfigError(fmt::format("no particle variable '{}'", name));
    return it->second;
}

void ParticleState::set(const std::string& name, const VectorXd& values)
{
    auto it = data.find(name);
    if (it == data.end())
        throw ConfigError(fmt::format("no particle variable '{}'", name));
    if (values.size() != n)
        throw ConfigError(fmt::format("variable '{}' needs {} values, got {}",
                                      name, n, values.size()));
    it->second = values;
}

} // namespace lagrange
