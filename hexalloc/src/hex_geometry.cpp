#include "hexalloc/hex_geometry.hpp"

#include <cmath>

namespace hexalloc
{

double hexArea(double side)
{
  return kHexAreaFactor * side * side;
}

double sideForArea(double target_area)
{
  return std::sqrt(target_area / kHexAreaFactor);
}

Eigen::Vector2d axialToXY(int q, int r, double side)
{
  const double x = side * std::sqrt(3.0) * (q + r / 2.0);
  const double y = side * 1.5 * r;
  return Eigen::Vector2d(x, y);
}

std::array<Eigen::Vector2d, 6> hexagonVertices(const Eigen::Vector2d & center, double side)
{
  std::array<Eigen::Vector2d, 6> vertices;
  for (int k = 0; k < 6; ++k) {
    const double angle = (30.0 + 60.0 * k) * M_PI / 180.0;
    vertices[k] = center + side * Eigen::Vector2d(std::cos(angle), std::sin(angle));
  }
  return vertices;
}

Polygon hexagonPolygon(const Eigen::Vector2d & center, double side)
{
  Polygon hexagon;
  auto & ring = hexagon.outer();
  ring.reserve(7);
  for (const auto & vertex : hexagonVertices(center, side)) {
    ring.push_back(toPoint(vertex));
  }
  ring.push_back(ring.front());
  return hexagon;
}

}  // namespace hexalloc
