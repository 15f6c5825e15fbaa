#ifndef LAGRANGE_FILTER_H
#define LAGRANGE_FILTER_H

#include <eigen_utils.h>
#include <logging.h>

#include <functional>
#include <memory>
#include <vector>

#include "lagrange_buffer.h"

namespace lagrange {

using Eigen::DenseBase;
using Eigen::Index;
using Eigen::RowMatrixXd;
using Eigen::VectorXcd;
using Eigen::VectorXd;

/// numerator b and denominator a of a digital IIR filter, a[0] == 1
struct Coefficients {
    VectorXd b;
    VectorXd a;
};

/// frequency response sampled at w, in rad/sample unless a sampling
/// frequency was given
struct FrequencyResponse {
    VectorXd w;
    VectorXcd h;
};

/// digital Butterworth high-pass of the given order: analog prototype,
/// pre-warped and mapped with the bilinear transform
Coefficients butter_highpass(int order, double cutoff, double fs);

/// steady-state initial conditions of lfilter for a unit step
VectorXd lfilter_zi(const Coefficients& coefs);

/// zero-phase forward-backward filtering of every column of x, with odd
/// extension of 3 * max(len(a), len(b)) samples at both ends
RowMatrixXd filtfilt(const Coefficients& coefs, const Eigen::Ref<const RowMatrixXd>& x);

/// response at worN frequencies evenly spaced over [0, pi)
FrequencyResponse freqz(const Coefficients& coefs, Index worN = 512);
/// same, with w in the units of fs over [0, fs/2)
FrequencyResponse freqz(const Coefficients& coefs, Index worN, double fs);

namespace internal {

/// samples added at each end of the series before filtering
Index padlen(const Coefficients& coefs);

/// throws DomainError unless center lies in [0, length) and the series
/// is longer than the padding
void checkWindow(Index length, Index center, Index padlen);

/// filtfilt of x, evaluated only at row `center`; the backward pass stops
/// there
VectorXd filtfiltAt(const Coefficients& coefs, const VectorXd& zi,
                    const Eigen::Ref<const RowMatrixXd>& x, Index center);

/// run body(k) for k in [0, nblocks) across the OpenMP threads; the first
/// exception thrown by any block is rethrown after all of them finish
void forEachBlock(Index nblocks, const std::function<void(Index)>& body);

} // namespace internal

///Filter - zero-phase high-pass over particle trajectories
/** Holds a 4th order Butterworth high-pass designed for the given cutoff
    and sampling frequency. apply() filters a (T, N) window forward and
    backward along time and returns the value at the center row for every
    particle. Particles are processed in independent blocks of columns,
    so that the result does not depend on the number of threads.
**/
class Filter
{
public:
    static constexpr int order = 4;

    Filter(double cutoff, double fs);

    const Coefficients& coefficients() const { return coefs; }
    double cutoff() const { return fc; }
    double samplingFrequency() const { return sampleRate; }

    template <typename Derived>
    VectorXd apply(const DenseBase<Derived>& data, Index center) const {
        RowMatrixXd x = data.derived().template cast<double>();
        return applyRows(x, center);
    }

    VectorXd apply(const Dataset& data, Index center) const {
        return applyRows(data.read(), center);
    }

    VectorXd applyRows(const Eigen::Ref<const RowMatrixXd>& x, Index center) const;

private:
    double fc;
    double sampleRate;
    Coefficients coefs;
    VectorXd zi;
    std::shared_ptr<spdlog::logger> logger;
};

///SpatialFilter - high-pass with a cutoff that depends on location
/** The cutoff is a function of (lon, lat), tabulated on a grid given by the
    lons and lats vectors with one Filter per grid node. Each particle is
    filtered with the filter of its nearest node, found separately along
    lon and lat. Particles without a finite location yield NaN.
**/
class SpatialFilter
{
public:
    using FrequencyFunction = std::function<double(double, double)>;

    SpatialFilter(const FrequencyFunction& frequency, double fs,
                  const VectorXd& lons, const VectorXd& lats);

    /// one filter per grid node, ordered lon-major
    const std::vector<Filter>& filters() const { return nodes; }
    const VectorXd& lons() const { return gridLons; }
    const VectorXd& lats() const { return gridLats; }
    double samplingFrequency() const { return sampleRate; }

    /// index into filters() of the node nearest to (lon, lat), -1 when
    /// either coordinate is not finite
    Index bucket(double lon, double lat) const;

    template <typename Derived>
    VectorXd apply(const DenseBase<Derived>& data, Index center,
                   const VectorXd& lon, const VectorXd& lat) const {
        RowMatrixXd x = data.derived().template cast<double>();
        return applyRows(x, center, lon, lat);
    }

    VectorXd apply(const Dataset& data, Index center,
                   const VectorXd& lon, const VectorXd& lat) const {
        return applyRows(data.read(), center, lon, lat);
    }

    VectorXd applyRows(const Eigen::Ref<const RowMatrixXd>& x, Index center,
                       const VectorXd& lon, const VectorXd& lat) const;

private:
    double sampleRate;
    VectorXd gridLons;
    VectorXd gridLats;
    std::vector<Filter> nodes;
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace lagrange

#endif // LAGRANGE_FILTER_H
