#pragma once

#define _USE_MATH_DEFINES
#include <cmath>

#include <Eigen/Core>

#include <limits>

namespace Eigen {

// time-major working storage: one row per time step, one column per particle
using RowMatrixXd =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

} // namespace Eigen

namespace eiu {

inline constexpr double nan = std::numeric_limits<double>::quiet_NaN();

// index of the element of v nearest to x
template <typename Derived>
Eigen::Index nearest(const Eigen::DenseBase<Derived> &v, double x) {
    Eigen::Index i = 0;
    (v.derived().array() - x).abs().minCoeff(&i);
    return i;
}

} // namespace eiu
