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
 * @file inscribed_circle.hpp
 * @brief Largest inscribed circle (Chebyshev center) of a polygon via LP
 *
 * With n polygon vertices A_i and unit edge normals N_i pointing into the
 * polygon, the unknowns are x = [c_x, c_y, r, s_1, ..., s_n]:
 *
 *     min  -r
 *     s.t. N_i^T c - s_i = N_i^T A_i      (s_i: distance of c to edge i)
 *          r - s_i <= 0
 *
 * For a convex polygon the optimum is the exact incircle. For a non-convex
 * one, the half-planes of all edges intersect in the polygon's kernel, and
 * the circle returned is the largest one inside that kernel.
 */

#ifndef INCIRCLE_INSCRIBED_CIRCLE_HPP
#define INCIRCLE_INSCRIBED_CIRCLE_HPP

#include "linear_program.hpp"
#include "polygon_utils.hpp"

#include <Eigen/Eigen>

#include <cmath>

namespace incircle
{

    enum
    {
        SUCCESS = 0,
        DEGENERATE_EDGE,
        DEGENERATE_POLYGON,
        INFEASIBLE_GEOMETRY,
        NUMERICAL_ERROR,
        SELF_INTERSECTION,
    };

    inline const char *statusString(const int status)
    {
        switch (status)
        {
        case SUCCESS:
            return "success";
        case DEGENERATE_EDGE:
            return "degenerate edge";
        case DEGENERATE_POLYGON:
            return "degenerate polygon";
        case INFEASIBLE_GEOMETRY:
            return "infeasible geometry";
        case NUMERICAL_ERROR:
            return "numerical error";
        case SELF_INTERSECTION:
            return "self-intersecting polygon";
        default:
            return "unknown";
        }
    }

    struct Circle
    {
        Eigen::Vector2d center;
        double radius;

        Circle()
            : center(Eigen::Vector2d::Zero()), radius(0.0) {}
    };

    struct Options
    {
        // Reject polygons whose boundary touches itself.
        bool checkSimple;
        // |signed area| at or below areaTolerance * diagonal^2, with the
        // diagonal of the bounding box, is treated as zero.
        double areaTolerance;

        Options()
            : checkSimple(true), areaTolerance(1.0e-12) {}
    };

    /**
     * @brief Unit normal of every edge, the edge direction turned by -90 deg
     * @param vertices open polygon, 2xn
     * @param normals output, 2xn, column i belongs to the edge
     *        vertices.col(i) -> vertices.col(i + 1 mod n)
     * @return SUCCESS, or DEGENERATE_EDGE if an edge has zero length
     *
     * The normals point to the right of each edge, which is into the polygon
     * for clockwise winding and out of it for counter-clockwise winding.
     */
    inline int extractNormals(const Eigen::Matrix2Xd &vertices,
                              Eigen::Matrix2Xd &normals)
    {
        const int n = vertices.cols();
        Eigen::Matrix2d rotation;
        rotation << 0.0, 1.0,
            -1.0, 0.0;

        normals.resize(2, n);
        for (int i = 0; i < n; i++)
        {
            const Eigen::Vector2d dir = vertices.col((i + 1) % n) - vertices.col(i);
            const double len = dir.norm();
            if (!(len > 0.0))
            {
                return DEGENERATE_EDGE;
            }
            normals.col(i) = rotation * dir / len;
        }
        return SUCCESS;
    }

    /**
     * @brief Assembles the LP of the file comment
     *
     * f = -e_3, A = [0 0 1 -I], b = 0, Aeq = [N^T 0 -I], beq_i = N_i^T A_i.
     * Every matrix has n rows and n + 3 columns.
     */
    inline void buildProgram(const Eigen::Matrix2Xd &vertices,
                             const Eigen::Matrix2Xd &normals,
                             lp::Problem &problem)
    {
        const int n = vertices.cols();
        const int vars = n + 3;

        problem.f.setZero(vars);
        problem.f(2) = -1.0;

        problem.Aeq.setZero(n, vars);
        problem.Aeq.leftCols<2>() = normals.transpose();
        problem.Aeq.rightCols(n).diagonal().setConstant(-1.0);
        problem.beq = normals.cwiseProduct(vertices).colwise().sum().transpose();

        problem.A.setZero(n, vars);
        problem.A.col(2).setConstant(1.0);
        problem.A.rightCols(n).diagonal().setConstant(-1.0);
        problem.b.setZero(n);
    }

    /**
     * @brief Reads the circle off an LP solution
     * @return NUMERICAL_ERROR if x does not have n + 3 entries
     */
    inline int interpretSolution(const Eigen::VectorXd &x,
                                 const int n,
                                 Circle &circle)
    {
        if (x.size() != n + 3 || !x.head<3>().allFinite())
        {
            return NUMERICAL_ERROR;
        }
        circle.center = x.head<2>();
        circle.radius = std::fabs(x(2));
        return SUCCESS;
    }

    /**
     * @brief Largest circle inside a polygon
     * @param polygon 2xN vertices, the first vertex may be repeated at the end
     * @param circle result, only written on SUCCESS
     * @param solver anything with
     *        int solve(const lp::Problem &, Eigen::VectorXd &) const
     *        reporting lp::OPTIMAL, INFEASIBLE, UNBOUNDED or NUMERICAL.
     *        It is given the LP of the polygon translated and scaled to
     *        a unit bounding box diagonal.
     * @param opts validation options
     * @return one of the status codes above
     */
    template <typename Solver>
    inline int maxInscribedCircle(const Eigen::Matrix2Xd &polygon,
                                  Circle &circle,
                                  const Solver &solver,
                                  const Options &opts = Options())
    {
        Eigen::Matrix2Xd vertices;
        polygon_utils::openRing(polygon, vertices);

        const int n = vertices.cols();
        if (!vertices.allFinite())
        {
            return NUMERICAL_ERROR;
        }
        if (n < 3 || polygon_utils::countDistinct(vertices) < 3)
        {
            return DEGENERATE_POLYGON;
        }

        // work in a frame where the bounding box starts at the origin and
        // has a unit diagonal; the result is mapped back at the end
        const Eigen::Vector2d lower = vertices.rowwise().minCoeff();
        const double extent = (vertices.rowwise().maxCoeff() - lower).norm();
        if (!(extent > 0.0) || !std::isfinite(extent))
        {
            return NUMERICAL_ERROR;
        }
        vertices = (vertices.colwise() - lower) / extent;

        Eigen::Matrix2Xd normals;
        const int extracted = extractNormals(vertices, normals);
        if (extracted != SUCCESS)
        {
            return extracted;
        }

        // make every normal point into the polygon
        const double area = polygon_utils::signedArea(vertices);
        if (std::fabs(area) <= opts.areaTolerance)
        {
            return DEGENERATE_POLYGON;
        }
        if (area > 0.0)
        {
            normals = -normals;
        }

        if (opts.checkSimple && !polygon_utils::isSimple(vertices))
        {
            return SELF_INTERSECTION;
        }

        lp::Problem problem;
        buildProgram(vertices, normals, problem);

        Eigen::VectorXd x;
        switch (solver.solve(problem, x))
        {
        case lp::OPTIMAL:
            break;
        case lp::INFEASIBLE:
            return INFEASIBLE_GEOMETRY;
        case lp::UNBOUNDED:
            return DEGENERATE_POLYGON;
        default:
            return NUMERICAL_ERROR;
        }

        // the edge half-planes have no point in common
        if (x.size() == n + 3 && x(2) < 0.0)
        {
            return INFEASIBLE_GEOMETRY;
        }

        Circle result;
        const int interpreted = interpretSolution(x, n, result);
        if (interpreted != SUCCESS)
        {
            return interpreted;
        }
        circle.center = lower + extent * result.center;
        circle.radius = extent * result.radius;
        return SUCCESS;
    }

    inline int maxInscribedCircle(const Eigen::Matrix2Xd &polygon,
                                  Circle &circle,
                                  const Options &opts = Options())
    {
        return maxInscribedCircle(polygon, circle, lp::SeidelSolver(), opts);
    }

    /**
     * @brief Checks that every edge line is at least radius - tol away from
     *        the center, on the inner side
     */
    inline bool verifyCircle(const Eigen::Matrix2Xd &polygon,
                             const Circle &circle,
                             const double tol = 1.0e-6)
    {
        Eigen::Matrix2Xd vertices;
        polygon_utils::openRing(polygon, vertices);

        const int n = vertices.cols();
        if (n < 3)
        {
            return false;
        }
        const double side = polygon_utils::signedArea(vertices) > 0.0 ? 1.0 : -1.0;
        for (int i = 0; i < n; i++)
        {
            const double dist = side * polygon_utils::lineDistance(vertices.col(i),
                                                                   vertices.col((i + 1) % n),
                                                                   circle.center);
            if (dist < circle.radius - tol)
            {
                return false;
            }
        }
        return true;
    }

} // namespace incircle

#endif
