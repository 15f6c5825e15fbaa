#ifndef LAGRANGE_BUFFER_H
#define LAGRANGE_BUFFER_H

#include <Eigen/Core>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lagrange_particles.h"

namespace lagrange {

using Eigen::Index;
using Eigen::MatrixXd;

///Dataset - read-only (T, N) view of one buffered variable
/** Rows are time steps in write order, columns are particles. Views are
    lazy: nothing is copied out of the buffer until read() is called, and
    read() reflects every row written up to that point.
**/
class Dataset
{
public:
    virtual ~Dataset() = default;

    virtual Index rows() const = 0;
    virtual Index cols() const = 0;
    virtual DType dtype() const = 0;

    /// materialize the whole (T, N) array
    virtual MatrixXd read() const = 0;
};

/// the per-variable datasets of one window
using Group = std::map<std::string, std::shared_ptr<const Dataset>>;

///ParticleBuffer - windowed storage of particle trajectories
/** Particle state is recorded one time step at a time into the active
    group, a named window holding one (T, N) dataset per tracked variable.
    Writes are all-or-nothing over the variables of a group.
**/
class ParticleBuffer
{
public:
    virtual ~ParticleBuffer() = default;

    /// select (creating when needed) the group for subsequent writes
    virtual void setGroup(const std::string& name) = 0;

    /// append the current particle state to the active group
    virtual void write(const ParticleSource& particles, double time,
                       bool deletedOnly = false) = 0;

    /// datasets of a previously selected group
    virtual Group data(const std::string& name) const = 0;

    /// tracked variables, in declaration order
    virtual const std::vector<Variable>& variables() const = 0;

    /// number of particles per row
    virtual Index size() const = 0;
};

/// the variables a buffer tracks: everything marked to_write that is also
/// in the allow-list, if any
std::vector<Variable> trackedVariables(
    const std::vector<Variable>& variables,
    const std::optional<std::vector<std::string>>& allowed);

namespace internal {

/// throws ConfigError unless name can label a group in every buffer: not
/// empty, not "." or "..", and without '/'
void checkGroupName(const std::string& name);

/// fetch one row per tracked variable, checking every array before any
/// of them is used; integer variables must be finite
std::vector<Eigen::VectorXd> gatherRow(const ParticleSource& particles,
                                       const std::vector<Variable>& variables,
                                       Index n);

} // namespace internal

} // namespace lagrange

#endif // LAGRANGE_BUFFER_H
