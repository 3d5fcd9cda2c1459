/*
    MIT License

    Copyright (c) 2026 The incircle authors

    Permission is hereby granted, free of charge, to any person obtaining a copy
    of this software and associated documentation files (the "Software"), to deal
    in the Software without restriction, including without limitation the rights
    to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
    copies of the Software, and to permit persons to whom the Software is
    furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be included in all
    copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
    IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
    FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
    AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
    LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
    OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
    SOFTWARE.
*/

/**
 * @file linear_program.hpp
 * @brief Mixed equality/inequality LPs on top of SDLP, Seidel's small-dimensional LP solver
 *
 * Problem form:
 *     min  f^T x
 *     s.t. A x <= b
 *          Aeq x = beq
 *
 * Variables are unbounded in sign. The equalities are eliminated first,
 * x = x0 + Z y with Z an orthonormal basis of null(Aeq), which leaves an
 * inequality-only LP in y. As long as null(Aeq) is at most four dimensional
 * that LP is handed to sdlp::linprog, however many variables x has.
 */

#ifndef INCIRCLE_LINEAR_PROGRAM_HPP
#define INCIRCLE_LINEAR_PROGRAM_HPP

#include <Eigen/Eigen>
#include <sdlp/sdlp.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace lp
{

    enum
    {
        OPTIMAL = 0,
        INFEASIBLE,
        UNBOUNDED,
        NUMERICAL,
    };

    inline const char *statusString(const int status)
    {
        switch (status)
        {
        case OPTIMAL:
            return "optimal";
        case INFEASIBLE:
            return "infeasible";
        case UNBOUNDED:
            return "unbounded";
        case NUMERICAL:
            return "numerical failure";
        default:
            return "unknown";
        }
    }

    struct Problem
    {
        Eigen::VectorXd f;
        Eigen::MatrixXd A;
        Eigen::VectorXd b;
        Eigen::MatrixXd Aeq;
        Eigen::VectorXd beq;

        inline int variables() const
        {
            return f.size();
        }

        inline bool consistent() const
        {
            const int n = f.size();
            return A.cols() == n && b.size() == A.rows() &&
                   Aeq.cols() == n && beq.size() == Aeq.rows();
        }

        inline bool finite() const
        {
            return f.allFinite() && A.allFinite() && b.allFinite() &&
                   Aeq.allFinite() && beq.allFinite();
        }
    };

    /**
     * @brief Largest constraint violation of x, scaled by the magnitude of
     *        the corresponding right-hand side
     */
    inline double violation(const Problem &problem,
                            const Eigen::VectorXd &x)
    {
        double worst = 0.0;
        if (problem.A.rows() > 0)
        {
            const Eigen::VectorXd slack = problem.A * x - problem.b;
            for (int i = 0; i < slack.size(); i++)
            {
                worst = std::max(worst, slack(i) / (1.0 + std::fabs(problem.b(i))));
            }
        }
        if (problem.Aeq.rows() > 0)
        {
            const Eigen::VectorXd residual = problem.Aeq * x - problem.beq;
            for (int i = 0; i < residual.size(); i++)
            {
                worst = std::max(worst, std::fabs(residual(i)) / (1.0 + std::fabs(problem.beq(i))));
            }
        }
        return worst;
    }

    class SeidelSolver
    {
    public:
        // Largest null space of Aeq the backend is instantiated for.
        static constexpr int maxReducedDim = 4;

    private:
        double tolerance;

        template <int k>
        static inline int solveReduced(const Eigen::VectorXd &c,
                                       const Eigen::MatrixXd &A,
                                       const Eigen::VectorXd &b,
                                       Eigen::VectorXd &y)
        {
            const Eigen::Matrix<double, k, 1> cFixed = c;
            const Eigen::Matrix<double, -1, k> AFixed = A;
            Eigen::Matrix<double, k, 1> yFixed;

            // +inf: infeasible, -inf: unbounded (yFixed is then a direction)
            const double minimum = sdlp::linprog<k>(cFixed, AFixed, b, yFixed);
            if (std::isinf(minimum))
            {
                return minimum > 0.0 ? INFEASIBLE : UNBOUNDED;
            }
            if (std::isnan(minimum))
            {
                return NUMERICAL;
            }
            y = yFixed;
            return OPTIMAL;
        }

    public:
        SeidelSolver(const double tol = 1.0e-7)
            : tolerance(tol) {}

        inline double getTolerance() const
        {
            return tolerance;
        }

        /**
         * @brief Solves the problem
         * @param problem LP in mixed form
         * @param x optimal solution on OPTIMAL, untouched otherwise
         * @return OPTIMAL, INFEASIBLE, UNBOUNDED or NUMERICAL
         */
        inline int solve(const Problem &problem,
                         Eigen::VectorXd &x) const
        {
            if (!problem.consistent() || !problem.finite() || problem.variables() == 0)
            {
                return NUMERICAL;
            }
            const int n = problem.variables();

            // particular solution and null space of the equalities
            Eigen::VectorXd x0 = Eigen::VectorXd::Zero(n);
            Eigen::MatrixXd Z = Eigen::MatrixXd::Identity(n, n);
            if (problem.Aeq.rows() > 0)
            {
                const Eigen::FullPivLU<Eigen::MatrixXd> lu(problem.Aeq);
                x0 = lu.solve(problem.beq);
                const Eigen::VectorXd residual = problem.Aeq * x0 - problem.beq;
                if (!x0.allFinite() ||
                    residual.cwiseAbs().maxCoeff() >
                        tolerance * (1.0 + problem.beq.cwiseAbs().maxCoeff()))
                {
                    return INFEASIBLE;
                }

                const int k = n - lu.rank();
                if (k > 0)
                {
                    const Eigen::MatrixXd kernel = lu.kernel();
                    const Eigen::HouseholderQR<Eigen::MatrixXd> qr(kernel);
                    Z = qr.householderQ() * Eigen::MatrixXd::Identity(n, k);
                }
                else
                {
                    Z.resize(n, 0);
                }
            }

            const int k = Z.cols();
            if (k > maxReducedDim)
            {
                return NUMERICAL;
            }

            // inequalities in terms of y; rows that no longer depend on y
            // are either always satisfied or make the problem infeasible
            const Eigen::MatrixXd AZ = problem.A * Z;
            const Eigen::VectorXd bZ = problem.b - problem.A * x0;
            std::vector<int> keep;
            keep.reserve(AZ.rows());
            for (int i = 0; i < AZ.rows(); i++)
            {
                const double scale = 1.0 + problem.A.row(i).norm();
                if (k > 0 && AZ.row(i).norm() > tolerance * scale)
                {
                    keep.push_back(i);
                }
                else if (bZ(i) < -tolerance * (1.0 + std::fabs(problem.b(i))))
                {
                    return INFEASIBLE;
                }
            }

            Eigen::VectorXd sol = x0;
            if (k > 0)
            {
                Eigen::MatrixXd Ar(keep.size(), k);
                Eigen::VectorXd br(keep.size());
                for (int i = 0; i < (int)keep.size(); i++)
                {
                    Ar.row(i) = AZ.row(keep[i]);
                    br(i) = bZ(keep[i]);
                }
                const Eigen::VectorXd cr = Z.transpose() * problem.f;

                Eigen::VectorXd y;
                int status;
                switch (k)
                {
                case 1:
                    status = solveReduced<1>(cr, Ar, br, y);
                    break;
                case 2:
                    status = solveReduced<2>(cr, Ar, br, y);
                    break;
                case 3:
                    status = solveReduced<3>(cr, Ar, br, y);
                    break;
                default:
                    status = solveReduced<4>(cr, Ar, br, y);
                    break;
                }
                if (status != OPTIMAL)
                {
                    return status;
                }
                sol += Z * y;
            }

            if (!sol.allFinite() || violation(problem, sol) > tolerance)
            {
                return NUMERICAL;
            }

            x = sol;
            return OPTIMAL;
        }
    };

} // namespace lp

#endif
