#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <eigen_utils.h>

#include "lagrange_file_buffer.h"
#include "lagrange_error.h"

namespace lagrange {

namespace {

// aim for chunks of about 1 MiB, whole rows at a time
constexpr hsize_t chunkBytes = 1 << 20;
constexpr hsize_t maxChunkRows = 1024;

std::string makeTempPath(const std::string& directory)
{
    namespace fs = std::filesystem;
    fs::path dir = directory.empty() ? fs::temp_directory_path() : fs::path(directory);
    std::string pattern = (dir / "lagrange-XXXXXX.h5").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = mkstemps(buf.data(), 3);
    if (fd < 0)
        throw ResourceError(fmt::format("cannot create temporary file in {}: {}",
                                        dir.string(), std::strerror(errno)));
    if (::close(fd) != 0)
        throw ResourceError(fmt::format("cannot close temporary file {}: {}",
                                        buf.data(), std::strerror(errno)));
    return std::string(buf.data());
}

} // namespace

namespace internal {

FileGroup::FileGroup(hid_t file, const std::string& name,
                     const std::vector<Variable>& variables, Index n)
    : name(name), n(static_cast<hsize_t>(n))
{
    group = h5::Handle(H5Gcreate2(file, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
                       H5Gclose, fmt::format("cannot create group '{}'", name));

    for (const auto& v : variables) {
        hid_t type = h5::native(v.dtype);
        hsize_t rowBytes = std::max<hsize_t>(this->n * H5Tget_size(type), 1);
        hsize_t dims[2] = {0, this->n};
        // a zero particle count still needs a non-empty chunk
        hsize_t maxdims[2] = {H5S_UNLIMITED, this->n > 0 ? this->n : H5S_UNLIMITED};
        hsize_t chunk[2] = {std::clamp<hsize_t>(chunkBytes / rowBytes, 1, maxChunkRows),
                            std::max<hsize_t>(this->n, 1)};

        h5::Handle space(H5Screate_simple(2, dims, maxdims), H5Sclose,
                         "H5Screate_simple failed");
        h5::Handle dcpl(H5Pcreate(H5P_DATASET_CREATE), H5Pclose, "H5Pcreate failed");
        if (H5Pset_chunk(dcpl.get(), 2, chunk) < 0)
            throw ResourceError(fmt::format("cannot set chunking for '{}/{}'", name, v.name));
        datasets.emplace_back(H5Dcreate2(group.get(), v.name.c_str(), type, space.get(),
                                         H5P_DEFAULT, dcpl.get(), H5P_DEFAULT),
                              H5Dclose, fmt::format("cannot create dataset '{}/{}'", name, v.name));
        names.push_back(v.name);
        types.push_back(v.dtype);
    }
}

void FileGroup::writeSlab(hid_t dset, DType dtype, const Eigen::VectorXd& values) const
{
    if (n == 0)
        return;
    // HDF5 truncates floats converted to integers, round them as memory does
    if (dtype == DType::Int32 || dtype == DType::Int64) {
        Eigen::VectorXd rounded = values.array().round().matrix();
        return writeSlab(dset, DType::Float64, rounded);
    }
    h5::Handle fspace(H5Dget_space(dset), H5Sclose, "H5Dget_space failed");
    hsize_t start[2] = {nrows, 0};
    hsize_t count[2] = {1, n};
    if (H5Sselect_hyperslab(fspace.get(), H5S_SELECT_SET, start, nullptr, count, nullptr) < 0)
        throw ResourceError("H5Sselect_hyperslab failed");
    h5::Handle mspace(H5Screate_simple(1, &n, nullptr), H5Sclose, "H5Screate_simple failed");
    if (H5Dwrite(dset, H5T_NATIVE_DOUBLE, mspace.get(), fspace.get(), H5P_DEFAULT,
                 values.data()) < 0)
        throw ResourceError("H5Dwrite failed");
}

void FileGroup::writeRow(const std::vector<Eigen::VectorXd>& row)
{
    // first, resize all datasets to add another entry in the time dimension
    // then fill in the new row of each
    hsize_t dims[2] = {nrows + 1, n};
    std::size_t extended = 0;
    try {
        for (; extended < datasets.size(); ++extended) {
            if (H5Dset_extent(datasets[extended].get(), dims) < 0)
                throw ResourceError(fmt::format("cannot extend '{}/{}' to {} rows",
                                                name, names[extended], dims[0]));
        }
        for (std::size_t i = 0; i < datasets.size(); ++i) {
            writeSlab(datasets[i].get(), types[i], row[i]);
        }
    } catch (const ResourceError& e) {
        hsize_t old[2] = {nrows, n};
        for (std::size_t i = 0; i < extended; ++i) {
            if (H5Dset_extent(datasets[i].get(), old) < 0)
                throw ResourceError(fmt::format("{}; cannot restore '{}/{}' to {} rows",
                                                e.what(), name, names[i], nrows));
        }
        throw;
    }
    ++nrows;
}

void FileGroup::truncate(hsize_t rows)
{
    hsize_t dims[2] = {rows, n};
    for (std::size_t i = 0; i < datasets.size(); ++i) {
        if (H5Dset_extent(datasets[i].get(), dims) < 0)
            throw ResourceError(fmt::format("cannot truncate '{}/{}' to {} rows",
                                            name, names[i], rows));
    }
    nrows = rows;
}

FileDataset::FileDataset(std::shared_ptr<const h5::Handle> file, std::string path, DType dtype)
    : file(std::move(file)), path(std::move(path)), type(dtype)
{
}

Index FileDataset::rows() const
{
    h5::Handle dset(H5Dopen2(file->get(), path.c_str(), H5P_DEFAULT), H5Dclose,
                    "cannot open dataset " + path);
    return static_cast<Index>(h5::get_dims(dset.get()).at(0));
}

Index FileDataset::cols() const
{
    h5::Handle dset(H5Dopen2(file->get(), path.c_str(), H5P_DEFAULT), H5Dclose,
                    "cannot open dataset " + path);
    return static_cast<Index>(h5::get_dims(dset.get()).at(1));
}

MatrixXd FileDataset::read() const
{
    h5::Handle dset(H5Dopen2(file->get(), path.c_str(), H5P_DEFAULT), H5Dclose,
                    "cannot open dataset " + path);
    auto dims = h5::get_dims(dset.get());
    if (dims.size() != 2)
        throw ResourceError(fmt::format("expected (T, N) at {}", path));
    // the file is row-major, so read as such and let Eigen transpose storage
    Eigen::RowMatrixXd values(static_cast<Index>(dims[0]), static_cast<Index>(dims[1]));
    if (values.size() > 0 &&
        H5Dread(dset.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) < 0)
        throw ResourceError("H5Dread failed for " + path);
    return values;
}

} // namespace internal

FileBuffer::FileBuffer(Index n, const std::vector<Variable>& variables,
                       const std::optional<std::vector<std::string>>& allowed,
                       const std::string& directory)
    : n(n), vars(trackedVariables(variables, allowed)),
      logger(logging::createLogger("buffer.file", this))
{
    if (n < 0)
        throw ConfigError(fmt::format("negative particle count {}", n));
    if (vars.empty())
        logger->warn("no variables selected for buffering, writes will record nothing");

    // failures are reported as ResourceError, not printed by the library
    if (H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr) < 0)
        logger->warn("cannot disable HDF5 automatic error printing");

    filePath = makeTempPath(directory);
    try {
        // the time attribute outgrows the compact attribute storage of the
        // oldest file format
        h5::Handle fapl(H5Pcreate(H5P_FILE_ACCESS), H5Pclose, "H5Pcreate failed");
        if (H5Pset_libver_bounds(fapl.get(), H5F_LIBVER_V18, H5F_LIBVER_LATEST) < 0)
            throw ResourceError("H5Pset_libver_bounds failed");
        file = std::make_shared<h5::Handle>(
            H5Fcreate(filePath.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl.get()), H5Fclose,
            "cannot create buffer file " + filePath);
        // create empty time attribute
        h5::write_attribute(file->get(), "time", timeValues);
    } catch (const ResourceError&) {
        file.reset();
        std::error_code ec;
        std::filesystem::remove(filePath, ec);
        throw;
    }
    logger->debug("buffering {} variables of {} particles in {}", vars.size(), n, filePath);
}

FileBuffer::FileBuffer(const ParticleSource& particles,
                       const std::optional<std::vector<std::string>>& allowed,
                       const std::string& directory)
    : FileBuffer(particles.size(), particles.variables(), allowed, directory)
{
}

FileBuffer::~FileBuffer()
{
    active = nullptr;
    groups.clear();
    file.reset();
    std::error_code ec;
    std::filesystem::remove(filePath, ec);
    if (ec)
        logger->warn("cannot remove buffer file {}: {}", filePath, ec.message());
}

void FileBuffer::setGroup(const std::string& name)
{
    // creates the group, and datasets for all written variables
    // if they do not already exist
    active = nullptr;
    internal::checkGroupName(name);
    auto it = groups.find(name);
    if (it == groups.end()) {
        try {
            it = groups.emplace(name, internal::FileGroup(file->get(), name, vars, n)).first;
        } catch (const ResourceError& e) {
            logger->error("cannot create group '{}' in {}: {}", name, filePath, e.what());
            throw;
        }
        logger->debug("created group '{}'", name);
    }
    active = &it->second;
}

void FileBuffer::write(const ParticleSource& particles, double time, bool deletedOnly)
{
    // don't write out deleted particles
    if (deletedOnly)
        return;
    if (!active)
        throw ConfigError("write before any group was selected");

    auto row = internal::gatherRow(particles, vars, n);
    hsize_t before = static_cast<hsize_t>(active->rows());
    try {
        active->writeRow(row);
    } catch (const ResourceError& e) {
        logger->error("cannot write row {} at time {}: {}", before, time, e.what());
        throw;
    }

    timeValues.push_back(time);
    try {
        h5::write_attribute(file->get(), "time", timeValues);
    } catch (const ResourceError& e) {
        // the attribute still holds the previous times
        timeValues.pop_back();
        logger->error("cannot record time {}: {}", time, e.what());
        try {
            active->truncate(before);
        } catch (const ResourceError& t) {
            throw ResourceError(fmt::format("{}; {}", e.what(), t.what()));
        }
        throw;
    }
    SPDLOG_LOGGER_TRACE(logger, "wrote row {} at time {}", before, time);
}

Group FileBuffer::data(const std::string& name) const
{
    if (!groups.count(name))
        throw ConfigError(fmt::format("no buffered group '{}'", name));
    Group group;
    for (const auto& v : vars) {
        group.emplace(v.name, std::make_shared<internal::FileDataset>(
                                  file, name + "/" + v.name, v.dtype));
    }
    return group;
}

} // namespace lagrange
