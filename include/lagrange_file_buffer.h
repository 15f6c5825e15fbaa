#ifndef LAGRANGE_FILE_BUFFER_H
#define LAGRANGE_FILE_BUFFER_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <logging.h>
#include <h5_io.h>

#include "lagrange_buffer.h"

namespace lagrange {

namespace internal {

/// one window in the file: an HDF5 group with a chunked (T, N) dataset per
/// tracked variable, T unlimited
class FileGroup
{
public:
    FileGroup(hid_t file, const std::string& name,
              const std::vector<Variable>& variables, Index n);

    /// extend every dataset by one row and fill it, or leave all of them
    /// as they were
    void writeRow(const std::vector<Eigen::VectorXd>& row);
    /// shrink every dataset back to the given number of rows
    void truncate(hsize_t rows);
    Index rows() const { return static_cast<Index>(nrows); }

private:
    void writeSlab(hid_t dset, DType dtype, const Eigen::VectorXd& values) const;

    std::string name;
    h5::Handle group;
    std::vector<std::string> names;
    std::vector<DType> types;
    std::vector<h5::Handle> datasets;
    hsize_t n;
    hsize_t nrows = 0;
};

/// lazy view of one variable of a group, read from the file on demand
class FileDataset : public Dataset
{
public:
    FileDataset(std::shared_ptr<const h5::Handle> file, std::string path, DType dtype);

    Index rows() const override;
    Index cols() const override;
    DType dtype() const override { return type; }
    MatrixXd read() const override;

private:
    std::shared_ptr<const h5::Handle> file;
    std::string path;
    DType type;
};

} // namespace internal

///FileBuffer - disk backed particle trajectory buffer
/** Writes every group into a private temporary HDF5 file, growing the
    datasets one row per write so that trajectories larger than memory can
    be buffered. The time of every write is kept in the root attribute
    "time". The file is removed when the buffer is destroyed.
**/
class FileBuffer : public ParticleBuffer
{
public:
    /// directory: where to place the temporary file, empty for the system
    /// temporary directory
    FileBuffer(Index n, const std::vector<Variable>& variables,
               const std::optional<std::vector<std::string>>& allowed = std::nullopt,
               const std::string& directory = "");
    explicit FileBuffer(const ParticleSource& particles,
                        const std::optional<std::vector<std::string>>& allowed = std::nullopt,
                        const std::string& directory = "");
    ~FileBuffer() override;
    FileBuffer(const FileBuffer&) = delete;
    FileBuffer& operator=(const FileBuffer&) = delete;

    void setGroup(const std::string& name) override;
    void write(const ParticleSource& particles, double time,
               bool deletedOnly = false) override;
    Group data(const std::string& name) const override;
    const std::vector<Variable>& variables() const override { return vars; }
    Index size() const override { return n; }

    /// time of every recorded write, across all groups
    const std::vector<double>& times() const { return timeValues; }
    const std::string& path() const { return filePath; }

private:
    Index n;
    std::vector<Variable> vars;
    std::shared_ptr<spdlog::logger> logger;
    std::string filePath;
    std::shared_ptr<h5::Handle> file;
    std::map<std::string, internal::FileGroup> groups;
    internal::FileGroup* active = nullptr;
    std::vector<double> timeValues;
};

} // namespace lagrange

#endif // LAGRANGE_FILE_BUFFER_H
