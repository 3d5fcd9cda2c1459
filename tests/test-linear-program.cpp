#include <catch2/catch.hpp>

#include "incircle/linear_program.hpp"

#include <cmath>
#include <string>

namespace {

lp::Problem boxWithSum()
{
    // min -x - y  s.t.  0 <= x, y <= 1  and  z = x + y
    lp::Problem problem;
    problem.f = Eigen::Vector3d(-1.0, -1.0, 0.0);
    problem.A.resize(4, 3);
    problem.A << 1.0, 0.0, 0.0,
        0.0, 1.0, 0.0,
        -1.0, 0.0, 0.0,
        0.0, -1.0, 0.0;
    problem.b = Eigen::Vector4d(1.0, 1.0, 0.0, 0.0);
    problem.Aeq.resize(1, 3);
    problem.Aeq << -1.0, -1.0, 1.0;
    problem.beq = Eigen::VectorXd::Zero(1);
    return problem;
}

} // anonymous namespace

TEST_CASE("equalities are eliminated before solving", "[lp]")
{
    lp::Problem const problem = boxWithSum();
    REQUIRE(problem.consistent());

    Eigen::VectorXd x;
    REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::OPTIMAL);
    REQUIRE(x.size() == 3);
    REQUIRE(x(0) == Approx(1.0));
    REQUIRE(x(1) == Approx(1.0));
    REQUIRE(x(2) == Approx(2.0));
    REQUIRE(lp::violation(problem, x) < 1e-9);
}

TEST_CASE("inequality-only problems go straight to the backend", "[lp]")
{
    // x = [cx, cy, r], r no larger than the distance to any side of the
    // unit square
    lp::Problem problem;
    problem.f = Eigen::Vector3d(0.0, 0.0, -1.0);
    problem.A.resize(4, 3);
    problem.A << -1.0, 0.0, 1.0,
        1.0, 0.0, 1.0,
        0.0, -1.0, 1.0,
        0.0, 1.0, 1.0;
    problem.b = Eigen::Vector4d(0.0, 1.0, 0.0, 1.0);
    problem.Aeq.resize(0, 3);
    problem.beq.resize(0);

    Eigen::VectorXd x;
    REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::OPTIMAL);
    REQUIRE(x(0) == Approx(0.5));
    REQUIRE(x(1) == Approx(0.5));
    REQUIRE(x(2) == Approx(0.5));

    SECTION("contradicting bounds")
    {
        // cx >= 2 and cx <= 1
        problem.A.conservativeResize(6, 3);
        problem.A.row(4) << -1.0, 0.0, 0.0;
        problem.A.row(5) << 1.0, 0.0, 0.0;
        problem.b.conservativeResize(6);
        problem.b(4) = -2.0;
        problem.b(5) = 1.0;
        REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::INFEASIBLE);
    }

    SECTION("no upper sides")
    {
        // r <= cx and r <= cy only
        problem.A.resize(2, 3);
        problem.A << -1.0, 0.0, 1.0,
            0.0, -1.0, 1.0;
        problem.b = Eigen::Vector2d::Zero();
        REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::UNBOUNDED);
    }
}

TEST_CASE("inconsistent equalities are infeasible", "[lp]")
{
    lp::Problem problem;
    problem.f = Eigen::Vector2d(1.0, 0.0);
    problem.A.resize(0, 2);
    problem.b.resize(0);
    problem.Aeq.resize(2, 2);
    problem.Aeq << 1.0, 1.0,
        1.0, 1.0;
    problem.beq = Eigen::Vector2d(1.0, 2.0);

    Eigen::VectorXd x;
    REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::INFEASIBLE);
}

TEST_CASE("inequality fixed by the equalities can make a problem infeasible", "[lp]")
{
    // x = 3 but x <= 1
    lp::Problem problem;
    problem.f = Eigen::Vector2d(0.0, 1.0);
    problem.A.resize(2, 2);
    problem.A << 1.0, 0.0,
        0.0, -1.0;
    problem.b = Eigen::Vector2d(1.0, 0.0);
    problem.Aeq.resize(1, 2);
    problem.Aeq << 1.0, 0.0;
    problem.beq = Eigen::VectorXd::Constant(1, 3.0);

    Eigen::VectorXd x;
    REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::INFEASIBLE);
}

TEST_CASE("free direction left by the equalities is unbounded", "[lp]")
{
    lp::Problem problem;
    problem.f = Eigen::Vector2d(0.0, -1.0);
    problem.A.resize(0, 2);
    problem.b.resize(0);
    problem.Aeq.resize(1, 2);
    problem.Aeq << 1.0, 0.0;
    problem.beq = Eigen::VectorXd::Zero(1);

    Eigen::VectorXd x;
    REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::UNBOUNDED);
}

TEST_CASE("fully determined equalities only need checking", "[lp]")
{
    lp::Problem problem;
    problem.f = Eigen::Vector2d(1.0, 1.0);
    problem.A.resize(1, 2);
    problem.A << 1.0, 1.0;
    problem.b = Eigen::VectorXd::Constant(1, 4.0);
    problem.Aeq = Eigen::Matrix2d::Identity();
    problem.beq = Eigen::Vector2d(1.0, 2.0);

    Eigen::VectorXd x;
    REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::OPTIMAL);
    REQUIRE(x(0) == Approx(1.0));
    REQUIRE(x(1) == Approx(2.0));

    problem.b(0) = 2.0;
    REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::INFEASIBLE);
}

TEST_CASE("malformed problems are rejected", "[lp]")
{
    lp::Problem problem = boxWithSum();
    Eigen::VectorXd x;

    SECTION("bound vector of the wrong length")
    {
        problem.b.resize(3);
        REQUIRE_FALSE(problem.consistent());
        REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::NUMERICAL);
    }

    SECTION("not a number in the data")
    {
        problem.A(0, 0) = std::nan("");
        REQUIRE_FALSE(problem.finite());
        REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::NUMERICAL);
    }

    SECTION("null space too large for the backend")
    {
        problem.f = Eigen::VectorXd::Ones(6);
        problem.A = Eigen::MatrixXd::Identity(6, 6);
        problem.b = Eigen::VectorXd::Ones(6);
        problem.Aeq.resize(0, 6);
        problem.beq.resize(0);
        REQUIRE(problem.consistent());
        REQUIRE(lp::SeidelSolver().solve(problem, x) == lp::NUMERICAL);
    }
}

TEST_CASE("violation measures the worst scaled constraint", "[lp]")
{
    lp::Problem const problem = boxWithSum();

    REQUIRE(lp::violation(problem, Eigen::Vector3d(0.5, 0.5, 1.0)) == 0.0);
    // x = 2 breaks x <= 1 by one, scaled by 1 + |b|
    REQUIRE(lp::violation(problem, Eigen::Vector3d(2.0, 0.0, 2.0)) == Approx(0.5));
    // z = x + y off by three
    REQUIRE(lp::violation(problem, Eigen::Vector3d(0.0, 0.0, 3.0)) == Approx(3.0));
}

TEST_CASE("status strings", "[lp]")
{
    REQUIRE(std::string{lp::statusString(lp::OPTIMAL)} == "optimal");
    REQUIRE(std::string{lp::statusString(lp::INFEASIBLE)} == "infeasible");
    REQUIRE(std::string{lp::statusString(lp::UNBOUNDED)} == "unbounded");
    REQUIRE(std::string{lp::statusString(lp::NUMERICAL)} == "numerical failure");
    REQUIRE(std::string{lp::statusString(42)} == "unknown");
}
