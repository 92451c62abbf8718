#ifndef HEXALLOC_HEX_GEOMETRY_HPP_
#define HEXALLOC_HEX_GEOMETRY_HPP_

#include <array>
#include <cmath>
#include <Eigen/Dense>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/box.hpp>

namespace hexalloc
{

namespace bg = boost::geometry;

// Planar coordinates in meters. Polygons are counter-clockwise and closed.
using Point = bg::model::d2::point_xy<double>;
using Polygon = bg::model::polygon<Point, false, true>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;
using Box = bg::model::box<Point>;

constexpr double kAcreInSquareMeters = 4046.8564224;

// Area factor of a regular hexagon: A = kHexAreaFactor * side^2
const double kHexAreaFactor = 3.0 * std::sqrt(3.0) / 2.0;

inline double acresToSquareMeters(double acres)
{
  return acres * kAcreInSquareMeters;
}

/// @brief Area of a regular hexagon.
/// @param side Side length (equal to the circumradius).
double hexArea(double side);

/// @brief Side length of the regular hexagon with the given area. Inverse of hexArea.
double sideForArea(double target_area);

/// @brief Center of a pointy-top hexagon in axial coordinates.
Eigen::Vector2d axialToXY(int q, int r, double side);

/// @brief Six vertices at 30 + 60k degrees around the center, counter-clockwise.
std::array<Eigen::Vector2d, 6> hexagonVertices(const Eigen::Vector2d & center, double side);

/// @brief Closed polygon built from hexagonVertices.
Polygon hexagonPolygon(const Eigen::Vector2d & center, double side);

inline Point toPoint(const Eigen::Vector2d & v)
{
  return Point(v.x(), v.y());
}

inline Eigen::Vector2d toVector(const Point & p)
{
  return Eigen::Vector2d(p.x(), p.y());
}

}  // namespace hexalloc

#endif  // HEXALLOC_HEX_GEOMETRY_HPP_
