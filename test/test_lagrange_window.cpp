#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cmath>
#include <utility>

#include <lagrange_window.h>
#include <lagrange_memory_buffer.h>
#include <lagrange_file_buffer.h>
#include <lagrange_error.h>

namespace {

using namespace Eigen;
using namespace lagrange;
using namespace testing;

// particles advected forward and backward from the window center, as the
// advection side records them
class WindowTest : public ::testing::Test
{
public:
    std::vector<Variable> vars{{"U", DType::Float64, true},
                               {"lon", DType::Float64, true},
                               {"lat", DType::Float64, true}};
    Index n = 2;
    Index steps = 20;
    double dt = 1.;
    ParticleState state{n, vars};

    // U of particle j at time t
    static double velocity(Index j, double t) {
        return 1. + j + std::sin(2. * M_PI * 0.3 * t);
    }

    void advect(ParticleBuffer& buffer) {
        for (const auto& [group, sign] : {std::pair<const char*, double>{"forward", 1.},
                                          std::pair<const char*, double>{"backward", -1.}}) {
            buffer.setGroup(group);
            for (Index i = 0; i <= steps; ++i) {
                double t = sign * i * dt;
                state.set("U", Vector2d(velocity(0, t), velocity(1, t)));
                state.set("lon", Vector2d(0., 0.));
                state.set("lat", Vector2d(1., 2.));
                buffer.write(state, t);
            }
        }
    }
};

TEST_F(WindowTest, Assemble) {
    MemoryBuffer buffer(state);
    advect(buffer);
    WindowData window = assembleWindow(buffer.data("backward"), buffer.data("forward"));

    ASSERT_EQ(window.size(), 3u);
    const MatrixXd& U = window.at("U");
    ASSERT_EQ(U.rows(), 2 * steps + 1);
    ASSERT_EQ(U.cols(), n);
    // rows run from -steps * dt to steps * dt, the center once
    for (Index i = 0; i < U.rows(); ++i) {
        double t = (i - steps) * dt;
        EXPECT_DOUBLE_EQ(U(i, 0), velocity(0, t)) << "row " << i;
        EXPECT_DOUBLE_EQ(U(i, 1), velocity(1, t)) << "row " << i;
    }
}

TEST_F(WindowTest, AssembleFromFile) {
    FileBuffer file(state);
    MemoryBuffer memory(state);
    advect(file);
    advect(memory);
    WindowData a = assembleWindow(file.data("backward"), file.data("forward"));
    WindowData b = assembleWindow(memory.data("backward"), memory.data("forward"));
    for (const auto& [name, m] : b) {
        EXPECT_EQ(a.at(name), m) << name;
    }
}

TEST_F(WindowTest, MismatchedGroups) {
    MemoryBuffer buffer(state);
    advect(buffer);
    Group backward = buffer.data("backward");
    Group forward = buffer.data("forward");

    Group missing = backward;
    missing.erase("U");
    EXPECT_THROW(assembleWindow(missing, forward), ConfigError);

    MemoryBuffer empty(n, vars);
    empty.setGroup("backward");
    EXPECT_THROW(assembleWindow(empty.data("backward"), forward), ConfigError);
}

TEST_F(WindowTest, FilterStep) {
    MemoryBuffer buffer(state);
    advect(buffer);
    WindowData window = assembleWindow(buffer.data("backward"), buffer.data("forward"));

    Filter filter(0.1, 1. / dt);
    auto out = filterStep(window, filter);
    EXPECT_THAT(out, ElementsAre(Key("var_U"), Key("var_lat"), Key("var_lon")));

    const Index center = window.at("U").rows() / 2;
    EXPECT_EQ(center, steps);
    VectorXd expected = filter.apply(window.at("U"), center);
    EXPECT_EQ(out.at("var_U"), expected);
    // constant positions are removed by the high-pass
    EXPECT_NEAR(out.at("var_lat")[1], 0., 1e-12);
    // the particles differ by a constant only
    EXPECT_NEAR(out.at("var_U")[0], out.at("var_U")[1], 1e-12);
    EXPECT_LT(std::abs(out.at("var_U")[0]), 0.2);
}

TEST_F(WindowTest, SpatialFilterStep) {
    MemoryBuffer buffer(state);
    advect(buffer);
    WindowData window = assembleWindow(buffer.data("backward"), buffer.data("forward"));

    SpatialFilter filter([](double, double lat) { return 0.1 * lat; }, 1. / dt,
                         VectorXd::Zero(1), Vector2d(1., 2.));
    auto out = filterStep(window, filter);
    ASSERT_EQ(out.count("var_U"), 1u);

    VectorXd U0 = window.at("U").col(0);
    VectorXd U1 = window.at("U").col(1);
    EXPECT_NEAR(out.at("var_U")[0], Filter(0.1, 1.).apply(U0, steps)[0], 1e-12);
    EXPECT_NEAR(out.at("var_U")[1], Filter(0.2, 1.).apply(U1, steps)[0], 1e-12);

    // particles that have left the domain have no location
    window.at("lat")(steps, 1) = std::nan("");
    out = filterStep(window, filter);
    EXPECT_FALSE(std::isnan(out.at("var_U")[0]));
    EXPECT_TRUE(std::isnan(out.at("var_U")[1]));

    window.erase("lon");
    EXPECT_THROW(filterStep(window, filter), ConfigError);
}

TEST(WindowStepsTest, Steps) {
    EXPECT_EQ(windowSteps(61200., 1800.), 34);
    EXPECT_EQ(windowSteps(10., 3.), 3);
    EXPECT_EQ(windowSteps(0., 3.), 0);
    EXPECT_THROW(windowSteps(10., 0.), ConfigError);
    EXPECT_THROW(windowSteps(-1., 1.), ConfigError);
}

} // namespace
