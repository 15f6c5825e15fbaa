#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
// remove the extra filename:lineno in trace but use function instead
#undef SPDLOG_LOGGER_TRACE
#define SPDLOG_LOGGER_TRACE(logger, ...)                                       \
    logger->log(spdlog::source_loc{__FUNCTION__, __LINE__, __FUNCTION__},      \
                spdlog::level::trace, __VA_ARGS__)

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <Eigen/Core>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace logging {

// shared sink
inline const static auto console =
    std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

// this will create and return a runtime logger object to console
inline auto createLogger(std::string_view name) {
    return std::make_shared<spdlog::logger>(std::string(name), console);
}

// optionally we can use a unique name
inline auto createLogger(std::string_view name, const void* const ptr) {
    return createLogger(fmt::format("{}&{:x}", name, reinterpret_cast<std::uintptr_t>(ptr)));
}

using Eigen::DenseBase;
using Eigen::DontAlignCols;
using Eigen::Index;
using Eigen::IOFormat;
using Eigen::StreamPrecision;

namespace internal {

// pretty print large Eigen array by only showing part of it
template <typename OStream, typename Derived>
OStream &pprint_matrix(OStream &s, const DenseBase<Derived> &_m,
                       const IOFormat &fmt, Index max_rows, Index max_cols,
                       Index max_size = -1) {
    const Derived& m(_m.derived());

    if (m.size() == 0) {
        s << fmt.matPrefix << fmt.matSuffix;
        return s;
    }

    if (max_size < 0)
        max_size = max_rows * max_cols;
    if (m.cols() == 1 || m.rows() == 1) {
        max_rows = max_size;
        max_cols = max_size;
    }

    std::streamsize explicit_precision;
    if (fmt.precision == StreamPrecision) {
        explicit_precision = 0;
    } else {
        explicit_precision = fmt.precision;
    }
    std::streamsize old_precision = 0;
    if (explicit_precision)
        old_precision = s.precision(explicit_precision);

    auto print_row = [&fmt, &m, max_cols](OStream &s, Index i) {
        if (i)
            s << fmt.rowSpacer;
        s << fmt.rowPrefix;
        s << m.coeff(i, 0);
        if (m.cols() <= max_cols) {
            for (Index j = 1; j < m.cols(); ++j) {
                s << fmt.coeffSeparator;
                s << m.coeff(i, j);
            }
        } else {
            for (Index j = 1; j < max_cols / 2; ++j) {
                s << fmt.coeffSeparator;
                s << m.coeff(i, j);
            }
            s << fmt.coeffSeparator << "...";
            for (Index j = m.cols() - max_cols / 2; j < m.cols(); ++j) {
                s << fmt.coeffSeparator;
                s << m.coeff(i, j);
            }
        }
        s << fmt.rowSuffix;
        if (i < m.rows() - 1)
            s << fmt.rowSeparator;
    };

    s << fmt.matPrefix;
    if (m.rows() <= max_rows) {
        for (Index i = 0; i < m.rows(); ++i)
            print_row(s, i);
    } else {
        for (Index i = 0; i < max_rows / 2; ++i)
            print_row(s, i);
        s << "..." << fmt.rowSeparator;
        for (Index i = m.rows() - max_rows / 2; i < m.rows(); ++i)
            print_row(s, i);
    }
    s << fmt.matSuffix;
    if (explicit_precision)
        s.precision(old_precision);
    return s;
}

} // namespace internal

// wrapper class to log Eigen objects, e.g.
//   logger->debug("coefs{}", logging::pprint(b));
// the wrapped object is referenced, not copied, so use it within the
// logging statement only
template <typename Derived> struct pprint {

    pprint(const DenseBase<Derived> &m) : m(m.derived()) {}

    template <typename OStream>
    friend OStream &operator<<(OStream &os, const pprint &pp) {
        auto &&m = pp.m;
        if (m.size() == 0)
            return os << "(empty)";
        os << "(" << m.rows() << "," << m.cols() << ")";

        auto f = pp.matrix_formatter();
        return internal::pprint_matrix(os, m, f, 5, 5, 10);
    }

  private:
    const Derived &m;
    IOFormat matrix_formatter() const {
        if (m.cols() == 1)
            return IOFormat(StreamPrecision, DontAlignCols, ", ", ", ", "", "",
                            "[", "]");
        else if (m.cols() < 3)
            return IOFormat(StreamPrecision, DontAlignCols, ", ", " ", "[", "]",
                            "[", "]");
        else
            return IOFormat(StreamPrecision, 0, ", ", "\n", "[", "]", "[\n",
                            "]\n");
    }
};

} // namespace logging

#if FMT_VERSION >= 90000
// fmt >= 9 no longer picks up operator<< implicitly
template <typename Derived>
struct fmt::formatter<logging::pprint<Derived>> : fmt::ostream_formatter {};
#endif
