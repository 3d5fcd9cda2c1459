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
 * @file polygon_io.hpp
 * @brief Polygon vertices from plain coordinate files
 *
 * One vertex per line, "x y" or "x,y". Blank lines and lines starting
 * with '#' are skipped.
 */

#ifndef INCIRCLE_POLYGON_IO_HPP
#define INCIRCLE_POLYGON_IO_HPP

#include <Eigen/Eigen>

#include <algorithm>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

namespace polygon_io
{

    /**
     * @brief Parses vertices from a stream
     * @param in text in the format above
     * @param polygon 2xN output, only written on success
     * @return false on the first malformed line
     */
    inline bool parsePolygon(std::istream &in,
                             Eigen::Matrix2Xd &polygon)
    {
        std::vector<double> coords;
        std::string line;
        while (std::getline(in, line))
        {
            std::replace(line.begin(), line.end(), ',', ' ');

            const std::size_t first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos || line[first] == '#')
            {
                continue;
            }

            std::istringstream fields(line);
            double x, y;
            std::string rest;
            if (!(fields >> x >> y) || (fields >> rest))
            {
                return false;
            }
            coords.push_back(x);
            coords.push_back(y);
        }

        polygon = Eigen::Map<const Eigen::Matrix2Xd>(coords.data(), 2, coords.size() / 2);
        return true;
    }

    inline bool loadPolygon(const std::string &path,
                            Eigen::Matrix2Xd &polygon)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return false;
        }
        return parsePolygon(file, polygon);
    }

} // namespace polygon_io

#endif
