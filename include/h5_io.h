#pragma once

#include <hdf5.h>

#include <string>
#include <utility>
#include <vector>

#include "lagrange_error.h"
#include "lagrange_particles.h"

// ===============================
// HDF5 helpers
// ===============================
namespace h5 {

using lagrange::ResourceError;

// owning hid_t, closed with the matching H5?close on destruction
class Handle
{
public:
    using Closer = herr_t (*)(hid_t);

    Handle() = default;
    Handle(hid_t id, Closer close, const std::string& what) : id(id), close(close) {
        if (id < 0) throw ResourceError(what);
    }
    ~Handle() { reset(); }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;
    Handle(Handle&& other) noexcept : id(other.id), close(other.close) { other.id = -1; }
    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            id = std::exchange(other.id, -1);
            close = other.close;
        }
        return *this;
    }

    hid_t get() const { return id; }

    void reset() {
        if (id >= 0 && close) close(id);
        id = -1;
    }

private:
    hid_t id = -1;
    Closer close = nullptr;
};

inline std::vector<hsize_t> get_dims(hid_t dset) {
    if (dset < 0) throw ResourceError("get_dims: invalid dataset handle");
    Handle space(H5Dget_space(dset), H5Sclose, "get_dims: H5Dget_space failed");
    int nd = H5Sget_simple_extent_ndims(space.get());
    if (nd < 0) throw ResourceError("get_dims: H5Sget_simple_extent_ndims failed");
    std::vector<hsize_t> dims(static_cast<size_t>(nd));
    if (nd > 0) H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr);
    return dims;
}

// map particle variable types to HDF5 native types
inline hid_t native(lagrange::DType dtype) {
    switch (dtype) {
    case lagrange::DType::Float32: return H5T_NATIVE_FLOAT;
    case lagrange::DType::Float64: return H5T_NATIVE_DOUBLE;
    case lagrange::DType::Int32:   return H5T_NATIVE_INT32;
    case lagrange::DType::Int64:   return H5T_NATIVE_INT64;
    }
    throw ResourceError("native: unsupported dtype");
}

// write a 1-D double attribute (overwrites if exists)
// the new value is written under a temporary name and renamed over the old
// one, so a failed write leaves the old value in place
inline void write_attribute(hid_t loc, const std::string& name, const std::vector<double>& data) {
    const std::string staged = name + ".new";
    // left over from an earlier failed write
    if (H5Aexists(loc, staged.c_str()) > 0 && H5Adelete(loc, staged.c_str()) < 0)
        throw ResourceError("write_attribute: failed to delete stale attribute: " + staged);
    {
        hsize_t dims[1] = { static_cast<hsize_t>(data.size()) };
        Handle space(data.empty() ? H5Screate(H5S_NULL) : H5Screate_simple(1, dims, nullptr),
                     H5Sclose, "write_attribute: H5Screate failed");
        Handle attr(H5Acreate2(loc, staged.c_str(), H5T_NATIVE_DOUBLE, space.get(), H5P_DEFAULT, H5P_DEFAULT),
                    H5Aclose, "write_attribute: H5Acreate2 failed for " + name);
        if (!data.empty() && H5Awrite(attr.get(), H5T_NATIVE_DOUBLE, data.data()) < 0)
            throw ResourceError("write_attribute: H5Awrite failed for " + name);
    }
    htri_t exists = H5Aexists(loc, name.c_str());
    if (exists < 0)
        throw ResourceError("write_attribute: H5Aexists failed for " + name);
    if (exists > 0 && H5Adelete(loc, name.c_str()) < 0)
        throw ResourceError("write_attribute: failed to delete existing attribute: " + name);
    if (H5Arename(loc, staged.c_str(), name.c_str()) < 0)
        throw ResourceError("write_attribute: H5Arename failed for " + name);
}

} // namespace h5
