#ifndef LAGRANGE_MEMORY_BUFFER_H
#define LAGRANGE_MEMORY_BUFFER_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <logging.h>

#include "lagrange_buffer.h"

namespace lagrange {

namespace internal {

/// a dataset that can grow by whole rows, in two phases so that a group can
/// make room in all of its datasets before committing any row
class MemoryDataset : public Dataset
{
public:
    /// make room for one more row, may throw std::bad_alloc
    virtual void reserveRow() = 0;
    /// append a row for which room has been reserved
    virtual void appendRow(const Eigen::VectorXd& row) noexcept = 0;
};

std::shared_ptr<MemoryDataset> makeMemoryDataset(DType dtype, Index n);

/// one window: a dataset per tracked variable, all of equal length
class MemoryGroup
{
public:
    MemoryGroup(const std::vector<Variable>& variables, Index n);

    void writeRow(const std::vector<Eigen::VectorXd>& row);
    Group view() const;
    Index rows() const { return nrows; }

private:
    std::vector<std::pair<std::string, std::shared_ptr<MemoryDataset>>> datasets;
    Index nrows = 0;
};

} // namespace internal

///MemoryBuffer - in-memory particle trajectory buffer
/** Keeps every group in process memory, each variable in its declared
    type. Suited to small particle sets or short windows; the data is
    gone with the buffer.
**/
class MemoryBuffer : public ParticleBuffer
{
public:
    MemoryBuffer(Index n, const std::vector<Variable>& variables,
                 const std::optional<std::vector<std::string>>& allowed = std::nullopt);
    explicit MemoryBuffer(const ParticleSource& particles,
                          const std::optional<std::vector<std::string>>& allowed = std::nullopt);
    MemoryBuffer(const MemoryBuffer&) = delete;
    MemoryBuffer& operator=(const MemoryBuffer&) = delete;

    void setGroup(const std::string& name) override;
    void write(const ParticleSource& particles, double time,
               bool deletedOnly = false) override;
    Group data(const std::string& name) const override;
    const std::vector<Variable>& variables() const override { return vars; }
    Index size() const override { return n; }

private:
    Index n;
    std::vector<Variable> vars;
    std::shared_ptr<spdlog::logger> logger;
    std::map<std::string, internal::MemoryGroup> groups;
    internal::MemoryGroup* active = nullptr;
};

} // namespace lagrange

#endif // LAGRANGE_MEMORY_BUFFER_H
