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
 * @file polygon_utils.hpp
 * @brief Measures and validity checks for simple polygons in the plane
 *
 * A polygon is stored as a 2xN matrix with one vertex per column. The edge
 * from the last column back to the first is implicit; a ring whose last
 * vertex repeats the first has to go through openRing() before anything
 * here is applied to it.
 */

#ifndef INCIRCLE_POLYGON_UTILS_HPP
#define INCIRCLE_POLYGON_UTILS_HPP

#include <Eigen/Eigen>

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace polygon_utils
{

    /**
     * @brief Drops the closing vertex of a ring if it repeats the first one
     * @param ring vertices, possibly closed
     * @param vertices output with every vertex listed exactly once
     * @return true if a closing vertex was removed
     */
    inline bool openRing(const Eigen::Matrix2Xd &ring,
                         Eigen::Matrix2Xd &vertices)
    {
        const int n = ring.cols();
        if (n > 1 && ring.col(0) == ring.col(n - 1))
        {
            vertices = ring.leftCols(n - 1);
            return true;
        }
        vertices = ring;
        return false;
    }

    inline int countDistinct(const Eigen::Matrix2Xd &vertices)
    {
        std::set<std::pair<double, double>> unique;
        for (int i = 0; i < vertices.cols(); i++)
        {
            unique.insert(std::make_pair(vertices(0, i), vertices(1, i)));
        }
        return unique.size();
    }

    /**
     * @brief Orientation of the triangle p, q, r
     * @return twice its signed area: > 0 for a left turn, < 0 for a right
     *         turn, 0 if the points are collinear
     */
    inline double ccw(const Eigen::Vector2d &p,
                      const Eigen::Vector2d &q,
                      const Eigen::Vector2d &r)
    {
        return (q(0) - p(0)) * (r(1) - p(1)) - (q(1) - p(1)) * (r(0) - p(0));
    }

    /**
     * @brief Shoelace area, positive for counter-clockwise winding
     *
     * Summed as a fan of triangles around the first vertex, so the products
     * stay small for polygons far from the origin.
     */
    inline double signedArea(const Eigen::Matrix2Xd &vertices)
    {
        const int n = vertices.cols();
        double twice = 0.0;
        for (int i = 1; i + 1 < n; i++)
        {
            twice += ccw(vertices.col(0), vertices.col(i), vertices.col(i + 1));
        }
        return 0.5 * twice;
    }

    /**
     * @brief Checks that no vertex is reflex
     *
     * Collinear consecutive vertices are tolerated. The polygon is assumed
     * to be simple.
     */
    inline bool isConvex(const Eigen::Matrix2Xd &vertices)
    {
        const int n = vertices.cols();
        if (n < 3)
        {
            return false;
        }

        int sign = 0;
        for (int i = 0; i < n; i++)
        {
            const double turn = ccw(vertices.col(i),
                                    vertices.col((i + 1) % n),
                                    vertices.col((i + 2) % n));
            if (turn == 0.0)
            {
                continue;
            }
            const int s = turn > 0.0 ? 1 : -1;
            if (sign == 0)
            {
                sign = s;
            }
            else if (s != sign)
            {
                return false;
            }
        }
        return sign != 0;
    }

    // Whether r, known to be collinear with p and q, lies in their bounding box.
    inline bool onSegment(const Eigen::Vector2d &p,
                          const Eigen::Vector2d &q,
                          const Eigen::Vector2d &r)
    {
        return std::min(p(0), q(0)) <= r(0) && r(0) <= std::max(p(0), q(0)) &&
               std::min(p(1), q(1)) <= r(1) && r(1) <= std::max(p(1), q(1));
    }

    /**
     * @brief Closed segment intersection test, touching and collinear
     *        overlap included
     */
    inline bool segmentsIntersect(const Eigen::Vector2d &p1,
                                  const Eigen::Vector2d &p2,
                                  const Eigen::Vector2d &q1,
                                  const Eigen::Vector2d &q2)
    {
        const double d1 = ccw(p1, p2, q1);
        const double d2 = ccw(p1, p2, q2);
        const double d3 = ccw(q1, q2, p1);
        const double d4 = ccw(q1, q2, p2);

        if (((d1 > 0.0 && d2 < 0.0) || (d1 < 0.0 && d2 > 0.0)) &&
            ((d3 > 0.0 && d4 < 0.0) || (d3 < 0.0 && d4 > 0.0)))
        {
            return true;
        }

        return (d1 == 0.0 && onSegment(p1, p2, q1)) ||
               (d2 == 0.0 && onSegment(p1, p2, q2)) ||
               (d3 == 0.0 && onSegment(q1, q2, p1)) ||
               (d4 == 0.0 && onSegment(q1, q2, p2));
    }

    /**
     * @brief Checks that the boundary does not touch itself
     *
     * Fails on repeated vertices, on non-adjacent edges sharing any point
     * and on adjacent edges that fold back onto each other. O(n^2).
     */
    inline bool isSimple(const Eigen::Matrix2Xd &vertices)
    {
        const int n = vertices.cols();
        if (n < 3 || countDistinct(vertices) != n)
        {
            return false;
        }

        for (int i = 0; i < n; i++)
        {
            const Eigen::Vector2d a = vertices.col(i);
            const Eigen::Vector2d b = vertices.col((i + 1) % n);
            const Eigen::Vector2d c = vertices.col((i + 2) % n);

            // spike: the next edge runs back along this one
            if (ccw(a, b, c) == 0.0 && (b - a).dot(c - b) < 0.0)
            {
                return false;
            }

            for (int j = i + 2; j < n; j++)
            {
                // the last edge is adjacent to the first
                if (i == 0 && j == n - 1)
                {
                    continue;
                }
                if (segmentsIntersect(a, b, vertices.col(j), vertices.col((j + 1) % n)))
                {
                    return false;
                }
            }
        }
        return true;
    }

    /**
     * @brief Crossing-number point in polygon test
     *
     * Points exactly on the boundary may be reported either way.
     */
    inline bool contains(const Eigen::Matrix2Xd &vertices,
                         const Eigen::Vector2d &p)
    {
        const int n = vertices.cols();
        bool inside = false;
        for (int i = 0, j = n - 1; i < n; j = i++)
        {
            const double yi = vertices(1, i);
            const double yj = vertices(1, j);
            if ((yi <= p(1) && p(1) < yj) || (yj <= p(1) && p(1) < yi))
            {
                const double xCross = vertices(0, i) +
                                      (p(1) - yi) * (vertices(0, j) - vertices(0, i)) / (yj - yi);
                if (p(0) < xCross)
                {
                    inside = !inside;
                }
            }
        }
        return inside;
    }

    // Signed distance of p to the line through a and b, positive on the left.
    inline double lineDistance(const Eigen::Vector2d &a,
                               const Eigen::Vector2d &b,
                               const Eigen::Vector2d &p)
    {
        return ccw(a, b, p) / (b - a).norm();
    }

} // namespace polygon_utils

#endif
