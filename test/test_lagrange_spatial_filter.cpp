#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cmath>

#include <lagrange_filter.h>
#include <lagrange_error.h>

namespace {

using namespace Eigen;
using namespace lagrange;

class SpatialFilterTest : public ::testing::Test
{
public:
    VectorXd lons = VectorXd::Zero(1);
    VectorXd lats = Vector2d(1., 2.);
    double fs = 1.;
    SpatialFilter filter{[](double, double lat) { return 0.1 * lat; }, fs, lons, lats};

    // particle series with a slow and a fast component
    static VectorXd series(Index nt, double phase) {
        VectorXd u(nt);
        for (Index i = 0; i < nt; ++i) {
            u[i] = 1. + std::sin(2. * M_PI * 0.02 * i + phase) + 0.5 * std::sin(2. * M_PI * 0.4 * i);
        }
        return u;
    }
};

TEST_F(SpatialFilterTest, OneFilterPerNode) {
    ASSERT_EQ(filter.filters().size(), 2u);
    EXPECT_DOUBLE_EQ(filter.filters()[0].cutoff(), 0.1);
    EXPECT_DOUBLE_EQ(filter.filters()[1].cutoff(), 0.2);
    EXPECT_DOUBLE_EQ(filter.samplingFrequency(), fs);
}

TEST_F(SpatialFilterTest, ResponseBelowCutoff) {
    for (Index b = 0; b < 2; ++b) {
        double cutoff = 0.1 * lats[b];
        auto r = freqz(filter.filters()[b].coefficients());
        for (Index k = 0; k < r.w.size(); ++k) {
            if (r.w[k] < cutoff) {
                EXPECT_LT(std::abs(r.h[k]), 1e-2) << "bucket " << b << " at w=" << r.w[k];
            }
        }
    }
}

TEST_F(SpatialFilterTest, Buckets) {
    EXPECT_EQ(filter.bucket(0., 1.), 0);
    EXPECT_EQ(filter.bucket(10., 1.2), 0);
    EXPECT_EQ(filter.bucket(-3., 1.8), 1);
    EXPECT_EQ(filter.bucket(0., 25.), 1);
    EXPECT_EQ(filter.bucket(std::nan(""), 1.), -1);
    EXPECT_EQ(filter.bucket(0., INFINITY), -1);

    VectorXd glons = Vector3d(0., 10., 20.);
    VectorXd glats = Vector2d(-5., 5.);
    SpatialFilter grid([](double lon, double) { return 0.01 * (1. + lon / 10.); }, 1., glons, glats);
    ASSERT_EQ(grid.filters().size(), 6u);
    // lon-major
    EXPECT_EQ(grid.bucket(11., 4.), 1 * 2 + 1);
    EXPECT_EQ(grid.bucket(19., -4.), 2 * 2 + 0);
    EXPECT_DOUBLE_EQ(grid.filters()[grid.bucket(19., -4.)].cutoff(), 0.03);
}

TEST_F(SpatialFilterTest, MatchesBaseFilterPerBucket) {
    const Index nt = 61, center = 30;
    MatrixXd data(nt, 5);
    for (Index j = 0; j < 5; ++j) {
        data.col(j) = series(nt, 0.3 * j);
    }
    // particles interleaved across the two buckets
    VectorXd plon = VectorXd::Zero(5);
    VectorXd plat(5);
    plat << 2.1, 0.9, 1.7, 1.2, 2.0;

    VectorXd r = filter.apply(data, center, plon, plat);
    ASSERT_EQ(r.size(), 5);

    Filter f1(0.1, fs), f2(0.2, fs);
    for (Index j = 0; j < 5; ++j) {
        const Filter& expected = plat[j] > 1.5 ? f2 : f1;
        VectorXd col = data.col(j);
        EXPECT_NEAR(r[j], expected.apply(col, center)[0], 1e-12) << "particle " << j;
    }
}

TEST_F(SpatialFilterTest, NonFiniteLocation) {
    const Index nt = 41;
    MatrixXd data(nt, 3);
    for (Index j = 0; j < 3; ++j) {
        data.col(j) = series(nt, j);
    }
    VectorXd plon = VectorXd::Zero(3);
    VectorXd plat(3);
    plat << 1., std::nan(""), 2.;
    VectorXd r = filter.apply(data, 20, plon, plat);
    EXPECT_FALSE(std::isnan(r[0]));
    EXPECT_TRUE(std::isnan(r[1]));
    EXPECT_FALSE(std::isnan(r[2]));
}

TEST_F(SpatialFilterTest, Errors) {
    const Index nt = 41;
    MatrixXd data = MatrixXd::Ones(nt, 2);
    VectorXd plon = VectorXd::Zero(2);
    VectorXd plat = VectorXd::Ones(2);

    EXPECT_THROW(filter.apply(data, nt, plon, plat), DomainError);
    EXPECT_THROW(filter.apply(data, -1, plon, plat), DomainError);
    EXPECT_THROW(filter.apply(data, 10, plon, VectorXd::Ones(3)), ConfigError);

    auto f = [](double, double) { return 0.1; };
    EXPECT_THROW(SpatialFilter(f, 1., VectorXd(), lats), ConfigError);
    EXPECT_THROW(SpatialFilter(f, 1., lons, VectorXd()), ConfigError);
    // cutoff above nyquist at one of the nodes
    EXPECT_THROW(SpatialFilter([](double, double lat) { return 0.3 * lat; }, 1., lons, lats),
                 ConfigError);
}

} // namespace
