#include <algorithm>
#include <cmath>
#include <complex>
#include <exception>
#include <vector>

#include <Eigen/Dense>
#include <unsupported/Eigen/FFT>

#include <fmt/format.h>

#include "lagrange_filter.h"
#include "lagrange_error.h"

namespace lagrange {

namespace {

using Complex = std::complex<double>;

// particles per parallel task; fixed so that the arithmetic done on every
// column is the same whatever the thread count
constexpr Index blockCols = 256;

// coefficients of the monic polynomial with the given roots, highest power
// first
Eigen::VectorXcd poly(const std::vector<Complex>& roots)
{
    Eigen::VectorXcd c = Eigen::VectorXcd::Zero(roots.size() + 1);
    c[0] = 1.;
    for (std::size_t k = 0; k < roots.size(); ++k) {
        for (Index i = static_cast<Index>(k) + 1; i > 0; --i) {
            c[i] -= roots[k] * c[i - 1];
        }
    }
    return c;
}

// odd extension: reflect about the end points, padlen samples each side
RowMatrixXd oddExtend(const Eigen::Ref<const RowMatrixXd>& x, Index padlen)
{
    const Index T = x.rows();
    RowMatrixXd ext(T + 2 * padlen, x.cols());
    ext.middleRows(padlen, T) = x;
    for (Index i = 0; i < padlen; ++i) {
        ext.row(padlen - 1 - i) = 2. * x.row(0) - x.row(i + 1);
        ext.row(padlen + T + i) = 2. * x.row(T - 1) - x.row(T - 2 - i);
    }
    return ext;
}

// direct form II transposed over rows [from, to] of x, walking backwards
// when from > to, with the state started at zi * x.row(from). Results go
// to the same rows of y, which may be x itself.
void lfilterRows(const Coefficients& c, const VectorXd& zi, const RowMatrixXd& x,
                 Index from, Index to, RowMatrixXd& y)
{
    const Index nz = zi.size();
    const VectorXd& b = c.b;
    const VectorXd& a = c.a;
    RowMatrixXd z = zi * x.row(from);
    Eigen::RowVectorXd xt, yt;
    const Index step = from <= to ? 1 : -1;
    for (Index t = from;; t += step) {
        xt = x.row(t);
        yt = b[0] * xt + z.row(0);
        for (Index i = 0; i + 1 < nz; ++i) {
            z.row(i) = b[i + 1] * xt + z.row(i + 1) - a[i + 1] * yt;
        }
        z.row(nz - 1) = b[nz] * xt - a[nz] * yt;
        y.row(t) = yt;
        if (t == to)
            break;
    }
}

void checkCoefficients(const Coefficients& c)
{
    if (c.a.size() < 2 || c.a.size() != c.b.size())
        throw ConfigError(fmt::format("expected b and a of equal length > 1, got {} and {}",
                                      c.b.size(), c.a.size()));
    if (c.a[0] != 1.)
        throw ConfigError(fmt::format("expected normalized a[0] == 1, got {}", c.a[0]));
}

} // namespace

Coefficients butter_highpass(int order, double cutoff, double fs)
{
    if (order < 1)
        throw ConfigError(fmt::format("filter order must be positive, got {}", order));
    if (!(fs > 0.))
        throw ConfigError(fmt::format("sampling frequency must be positive, got {}", fs));
    if (!(cutoff > 0.) || !(cutoff < fs / 2.))
        throw ConfigError(fmt::format("cutoff {} outside (0, {}) for fs={}",
                                      cutoff, fs / 2., fs));

    // normalized to nyquist, then pre-warped for the bilinear transform
    // done at the normalized sampling rate of 2
    const double wn = 2. * cutoff / fs;
    const double fs2 = 4.;
    const double warped = fs2 * std::tan(M_PI * wn / 2.);

    // analog prototype, poles on the left half of the unit circle
    std::vector<Complex> p;
    for (int m = -order + 1; m < order; m += 2) {
        p.push_back(-std::exp(Complex(0., M_PI * m / (2. * order))));
    }

    // lowpass to highpass: poles go to warped / p, order zeros at s = 0
    Complex prod = 1.;
    for (const auto& pk : p) prod *= -pk;
    double k = std::real(1. / prod);
    for (auto& pk : p) pk = warped / pk;

    // bilinear transform: the zeros all land on z = 1
    Complex den = 1.;
    for (const auto& pk : p) den *= fs2 - pk;
    k *= std::real(std::pow(fs2, order) / den);
    for (auto& pk : p) pk = (fs2 + pk) / (fs2 - pk);

    Coefficients c;
    c.b = k * poly(std::vector<Complex>(order, 1.)).real();
    c.a = poly(p).real();
    return c;
}

VectorXd lfilter_zi(const Coefficients& coefs)
{
    checkCoefficients(coefs);
    const Index n = coefs.a.size() - 1;
    const VectorXd a = coefs.a.tail(n);
    // I - companion(a).T
    Eigen::MatrixXd m = Eigen::MatrixXd::Identity(n, n);
    m.col(0) += a;
    for (Index i = 0; i + 1 < n; ++i) {
        m(i, i + 1) -= 1.;
    }
    VectorXd rhs = coefs.b.tail(n) - a * coefs.b[0];
    return m.partialPivLu().solve(rhs);
}

RowMatrixXd filtfilt(const Coefficients& coefs, const Eigen::Ref<const RowMatrixXd>& x)
{
    const Index pl = internal::padlen(coefs);
    if (x.rows() <= pl)
        throw DomainError(fmt::format("series of length {} is too short, need more than {}",
                                      x.rows(), pl));
    const VectorXd zi = lfilter_zi(coefs);
    RowMatrixXd ext = oddExtend(x, pl);
    const Index last = ext.rows() - 1;
    lfilterRows(coefs, zi, ext, 0, last, ext);
    lfilterRows(coefs, zi, ext, last, 0, ext);
    return ext.middleRows(pl, x.rows());
}

FrequencyResponse freqz(const Coefficients& coefs, Index worN)
{
    if (worN < 1 || 2 * worN < std::max(coefs.b.size(), coefs.a.size()))
        throw ConfigError(fmt::format("cannot evaluate {} frequencies for a filter of length {}",
                                      worN, std::max(coefs.b.size(), coefs.a.size())));
    const Index nfft = 2 * worN;

    // zero-padded full spectra of numerator and denominator
    Eigen::FFT<double> fft;
    VectorXd pad = VectorXd::Zero(nfft);
    VectorXcd num, den;
    pad.head(coefs.b.size()) = coefs.b;
    fft.fwd(num, pad);
    pad.setZero();
    pad.head(coefs.a.size()) = coefs.a;
    fft.fwd(den, pad);

    FrequencyResponse r;
    r.w = VectorXd::LinSpaced(worN, 0., M_PI * (worN - 1) / worN);
    r.h = num.head(worN).cwiseQuotient(den.head(worN));
    return r;
}

FrequencyResponse freqz(const Coefficients& coefs, Index worN, double fs)
{
    auto r = freqz(coefs, worN);
    r.w *= fs / (2. * M_PI);
    return r;
}

namespace internal {

Index padlen(const Coefficients& coefs)
{
    return 3 * std::max(coefs.a.size(), coefs.b.size());
}

void checkWindow(Index length, Index center, Index padlen)
{
    if (center < 0 || center >= length)
        throw DomainError(fmt::format("center index {} outside window of length {}",
                                      center, length));
    if (length <= padlen)
        throw DomainError(fmt::format("window of length {} is too short, need more than {}",
                                      length, padlen));
}

VectorXd filtfiltAt(const Coefficients& coefs, const VectorXd& zi,
                    const Eigen::Ref<const RowMatrixXd>& x, Index center)
{
    const Index pl = padlen(coefs);
    RowMatrixXd ext = oddExtend(x, pl);
    const Index last = ext.rows() - 1;
    lfilterRows(coefs, zi, ext, 0, last, ext);
    // nothing before the center is needed on the way back
    lfilterRows(coefs, zi, ext, last, pl + center, ext);
    return ext.row(pl + center).transpose();
}

void forEachBlock(Index nblocks, const std::function<void(Index)>& body)
{
    // exceptions may not leave the parallel region
    std::exception_ptr failure;
#pragma omp parallel for schedule(static)
    for (Index k = 0; k < nblocks; ++k) {
        try {
            body(k);
        } catch (...) {
#pragma omp critical(lagrange_block_failure)
            if (!failure)
                failure = std::current_exception();
        }
    }
    if (failure)
        std::rethrow_exception(failure);
}

} // namespace internal

Filter::Filter(double cutoff, double fs)
    : fc(cutoff), sampleRate(fs), coefs(butter_highpass(order, cutoff, fs)),
      zi(lfilter_zi(coefs)), logger(logging::createLogger("filter", this))
{
    logger->debug("highpass order={} cutoff={} fs={} b{} a{}", order, fc, sampleRate,
                  logging::pprint(coefs.b), logging::pprint(coefs.a));
}

VectorXd Filter::applyRows(const Eigen::Ref<const RowMatrixXd>& x, Index center) const
{
    internal::checkWindow(x.rows(), center, internal::padlen(coefs));

    const Index n = x.cols();
    const Index nblocks = (n + blockCols - 1) / blockCols;
    VectorXd out(n);
    SPDLOG_LOGGER_TRACE(logger, "filter {} particles over {} samples at {} in {} blocks",
                        n, x.rows(), center, nblocks);

    internal::forEachBlock(nblocks, [&](Index k) {
        const Index c0 = k * blockCols;
        const Index nc = std::min(blockCols, n - c0);
        out.segment(c0, nc) = internal::filtfiltAt(coefs, zi, x.middleCols(c0, nc), center);
    });
    return out;
}

SpatialFilter::SpatialFilter(const FrequencyFunction& frequency, double fs,
                             const VectorXd& lons, const VectorXd& lats)
    : sampleRate(fs), gridLons(lons), gridLats(lats),
      logger(logging::createLogger("filter.spatial", this))
{
    if (gridLons.size() == 0 || gridLats.size() == 0)
        throw ConfigError(fmt::format("empty location grid ({} lons, {} lats)",
                                      gridLons.size(), gridLats.size()));
    if (!frequency)
        throw ConfigError("no cutoff frequency function given");

    nodes.reserve(gridLons.size() * gridLats.size());
    for (Index i = 0; i < gridLons.size(); ++i) {
        for (Index j = 0; j < gridLats.size(); ++j) {
            nodes.emplace_back(frequency(gridLons[i], gridLats[j]), sampleRate);
        }
    }
    logger->debug("built {} filters on a {}x{} grid, fs={}", nodes.size(),
                  gridLons.size(), gridLats.size(), sampleRate);
}

Index SpatialFilter::bucket(double lon, double lat) const
{
    if (!std::isfinite(lon) || !std::isfinite(lat))
        return -1;
    return eiu::nearest(gridLons, lon) * gridLats.size() + eiu::nearest(gridLats, lat);
}

VectorXd SpatialFilter::applyRows(const Eigen::Ref<const RowMatrixXd>& x, Index center,
                                  const VectorXd& lon, const VectorXd& lat) const
{
    const Index n = x.cols();
    if (lon.size() != n || lat.size() != n)
        throw ConfigError(fmt::format("{} particles but {} lons and {} lats",
                                      n, lon.size(), lat.size()));
    internal::checkWindow(x.rows(), center, internal::padlen(nodes.front().coefficients()));

    // particle indices sharing a bucket, in their original order
    std::vector<std::vector<Index>> members(nodes.size());
    for (Index i = 0; i < n; ++i) {
        Index b = bucket(lon[i], lat[i]);
        if (b >= 0)
            members[b].push_back(i);
    }

    VectorXd out = VectorXd::Constant(n, eiu::nan);
    RowMatrixXd sub;
    for (std::size_t b = 0; b < members.size(); ++b) {
        const auto& idx = members[b];
        if (idx.empty())
            continue;
        sub.resize(x.rows(), static_cast<Index>(idx.size()));
        for (std::size_t j = 0; j < idx.size(); ++j) {
            sub.col(j) = x.col(idx[j]);
        }
        SPDLOG_LOGGER_TRACE(logger, "bucket {} holds {} particles", b, idx.size());
        VectorXd r = nodes[b].applyRows(sub, center);
        for (std::size_t j = 0; j < idx.size(); ++j) {
            out[idx[j]] = r[j];
        }
    }
    return out;
}

} // namespace lagrange
