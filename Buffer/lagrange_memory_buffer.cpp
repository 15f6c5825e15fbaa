#include <algorithm>
#include <cmath>
#include <cstdint>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include "lagrange_memory_buffer.h"
#include "lagrange_error.h"

namespace lagrange {

namespace internal {

namespace {

template <typename Scalar>
class TypedMemoryDataset : public MemoryDataset
{
    using Storage = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

public:
    TypedMemoryDataset(DType dtype, Index n) : type(dtype), n(n) {}

    Index rows() const override { return nrows; }
    Index cols() const override { return n; }
    DType dtype() const override { return type; }

    MatrixXd read() const override {
        return Eigen::Map<const Storage>(values.data(), nrows, n).template cast<double>();
    }

    void reserveRow() override {
        auto needed = static_cast<std::size_t>((nrows + 1) * n);
        if (values.capacity() < needed)
            values.reserve(std::max(needed, 2 * values.capacity()));
    }

    void appendRow(const Eigen::VectorXd& row) noexcept override {
        for (Index i = 0; i < n; ++i) {
            values.push_back(convert(row[i]));
        }
        ++nrows;
    }

private:
    static Scalar convert(double v) {
        if constexpr (std::is_integral<Scalar>::value) {
            return static_cast<Scalar>(std::llround(v));
        } else {
            return static_cast<Scalar>(v);
        }
    }

    DType type;
    Index n;
    Index nrows = 0;
    // row-major (T, N), grown geometrically
    std::vector<Scalar> values;
};

} // namespace

std::shared_ptr<MemoryDataset> makeMemoryDataset(DType dtype, Index n)
{
    switch (dtype) {
    case DType::Float32: return std::make_shared<TypedMemoryDataset<float>>(dtype, n);
    case DType::Float64: return std::make_shared<TypedMemoryDataset<double>>(dtype, n);
    case DType::Int32:   return std::make_shared<TypedMemoryDataset<std::int32_t>>(dtype, n);
    case DType::Int64:   return std::make_shared<TypedMemoryDataset<std::int64_t>>(dtype, n);
    }
    throw ConfigError("unsupported dtype");
}

MemoryGroup::MemoryGroup(const std::vector<Variable>& variables, Index n)
{
    for (const auto& v : variables) {
        datasets.emplace_back(v.name, makeMemoryDataset(v.dtype, n));
    }
}

void MemoryGroup::writeRow(const std::vector<Eigen::VectorXd>& row)
{
    // growing may fail part way, but leaves every row count untouched
    for (auto& d : datasets) {
        d.second->reserveRow();
    }
    for (std::size_t i = 0; i < datasets.size(); ++i) {
        datasets[i].second->appendRow(row[i]);
    }
    ++nrows;
}

Group MemoryGroup::view() const
{
    Group group;
    for (const auto& d : datasets) {
        group.emplace(d.first, d.second);
    }
    return group;
}

} // namespace internal

MemoryBuffer::MemoryBuffer(Index n, const std::vector<Variable>& variables,
                           const std::optional<std::vector<std::string>>& allowed)
    : n(n), vars(trackedVariables(variables, allowed)),
      logger(logging::createLogger("buffer.memory", this))
{
    if (n < 0)
        throw ConfigError(fmt::format("negative particle count {}", n));
    if (vars.empty())
        logger->warn("no variables selected for buffering, writes will record nothing");
    logger->debug("buffering {} variables of {} particles in memory", vars.size(), n);
}

MemoryBuffer::MemoryBuffer(const ParticleSource& particles,
                           const std::optional<std::vector<std::string>>& allowed)
    : MemoryBuffer(particles.size(), particles.variables(), allowed)
{
}

void MemoryBuffer::setGroup(const std::string& name)
{
    active = nullptr;
    internal::checkGroupName(name);
    // has this group been requested already?
    auto it = groups.find(name);
    if (it == groups.end()) {
        it = groups.emplace(name, internal::MemoryGroup(vars, n)).first;
        logger->debug("created group '{}'", name);
    }
    active = &it->second;
}

void MemoryBuffer::write(const ParticleSource& particles, double time, bool deletedOnly)
{
    // deleted particles are not written
    if (deletedOnly)
        return;
    if (!active)
        throw ConfigError("write before any group was selected");

    auto row = internal::gatherRow(particles, vars, n);
    active->writeRow(row);
    SPDLOG_LOGGER_TRACE(logger, "wrote row {} at time {}", active->rows() - 1, time);
}

Group MemoryBuffer::data(const std::string& name) const
{
    auto it = groups.find(name);
    if (it == groups.end())
        throw ConfigError(fmt::format("no buffered group '{}'", name));
    return it->second.view();
}

} // namespace lagrange
