#ifndef LAGRANGE_PARTICLES_H
#define LAGRANGE_PARTICLES_H

#include <Eigen/Core>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace lagrange {

using Eigen::Index;
using Eigen::VectorXd;

/// Storage type of a particle attribute.
enum class DType {
    Float32 = 0,
    Float64 = 1,
    Int32 = 2,
    Int64 = 3
};

std::string_view dtypeName(DType dtype);

/// Describes one particle attribute. Only attributes marked to_write are
/// picked up by the trajectory buffers.
struct Variable {
    std::string name;
    DType dtype = DType::Float64;
    bool to_write = true;
};

inline bool operator==(const Variable& lhs, const Variable& rhs) {
    return lhs.name == rhs.name && lhs.dtype == rhs.dtype &&
           lhs.to_write == rhs.to_write;
}

///ParticleSource - live particle attributes
/** Interface the advection side has to provide so that its particle
    state can be buffered. The particle count and the set of variables
    never change over the lifetime of a source.
**/
class ParticleSource
{
public:
    virtual ~ParticleSource() = default;

    /// number of particles, including deleted ones
    virtual Index size() const = 0;
    /// ordered variable descriptors
    virtual const std::vector<Variable>& variables() const = 0;
    /// current values of one variable, one entry per particle
    virtual VectorXd values(const std::string& name) const = 0;
};

///ParticleState - a particle source backed by plain arrays
class ParticleState : public ParticleSource
{
public:
    ParticleState(Index n, std::vector<Variable> variables);

    Index size() const override { return n; }
    const std::vector<Variable>& variables() const override { return vars; }
    VectorXd values(const std::string& name) const override;

    /// replace the values of a declared variable
    void set(const std::string& name, const VectorXd& values);

private:
    Index n;
    std::vector<Variable> vars;
    std::map<std::string, VectorXd> data;
};

} // namespace lagrange

#endif // LAGRANGE_PARTICLES_H
