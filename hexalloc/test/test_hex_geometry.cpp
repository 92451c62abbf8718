#include <gtest/gtest.h>
#include <cmath>
#include <utility>
#include "hexalloc/hex_geometry.hpp"

using hexalloc::hexArea;
using hexalloc::sideForArea;

TEST(HexGeometry, SideForAreaInvertsHexArea)
{
  for (double side : {0.01, 0.5, 1.0, 7.25, 38.7, 1250.0}) {
    EXPECT_NEAR(sideForArea(hexArea(side)), side, 1e-9 * side);
  }
}

TEST(HexGeometry, HexAreaIsStrictlyIncreasing)
{
  double previous = hexArea(0.0);
  for (double side = 0.1; side < 100.0; side += 0.7) {
    const double area = hexArea(side);
    EXPECT_GT(area, previous);
    previous = area;
  }
}

TEST(HexGeometry, HexAreaOfUnitSide)
{
  EXPECT_NEAR(hexArea(1.0), 3.0 * std::sqrt(3.0) / 2.0, 1e-12);
}

TEST(HexGeometry, HalfAcreCell)
{
  const double area = hexalloc::acresToSquareMeters(0.5);
  EXPECT_DOUBLE_EQ(area, 2023.4282112);
  EXPECT_NEAR(hexArea(sideForArea(area)), area, 1e-9);
}

TEST(HexGeometry, AxialToXYPointyTop)
{
  const double s = 2.0;
  EXPECT_TRUE(hexalloc::axialToXY(0, 0, s).isApprox(Eigen::Vector2d(0.0, 0.0)));
  EXPECT_NEAR(hexalloc::axialToXY(1, 0, s).x(), s * std::sqrt(3.0), 1e-12);
  EXPECT_NEAR(hexalloc::axialToXY(1, 0, s).y(), 0.0, 1e-12);

  const Eigen::Vector2d up = hexalloc::axialToXY(0, 1, s);
  EXPECT_NEAR(up.x(), s * std::sqrt(3.0) / 2.0, 1e-12);
  EXPECT_NEAR(up.y(), 3.0, 1e-12);
}

TEST(HexGeometry, NeighboursAreOneApothemPairApart)
{
  const double s = 3.0;
  const Eigen::Vector2d origin = hexalloc::axialToXY(0, 0, s);
  for (auto [q, r] : {std::pair{1, 0}, std::pair{0, 1}, std::pair{-1, 1}, std::pair{-1, 0}, std::pair{0, -1}, std::pair{1, -1}}) {
    EXPECT_NEAR((hexalloc::axialToXY(q, r, s) - origin).norm(), s * std::sqrt(3.0), 1e-9);
  }
}

TEST(HexGeometry, VerticesLieOnCircumcircle)
{
  const Eigen::Vector2d center(10.0, -4.0);
  const double s = 5.0;
  const auto vertices = hexalloc::hexagonVertices(center, s);

  for (const auto & v : vertices) {
    EXPECT_NEAR((v - center).norm(), s, 1e-9);
  }
  // First vertex at 30 degrees
  EXPECT_NEAR(vertices[0].x(), center.x() + s * std::sqrt(3.0) / 2.0, 1e-9);
  EXPECT_NEAR(vertices[0].y(), center.y() + s / 2.0, 1e-9);
  // Top vertex at 90 degrees
  EXPECT_NEAR(vertices[1].x(), center.x(), 1e-9);
  EXPECT_NEAR(vertices[1].y(), center.y() + s, 1e-9);
}

TEST(HexGeometry, HexagonPolygonIsClosedAndHasHexArea)
{
  const auto hexagon = hexalloc::hexagonPolygon(Eigen::Vector2d(1.0, 2.0), 4.0);
  ASSERT_EQ(hexagon.outer().size(), 7u);
  EXPECT_DOUBLE_EQ(hexagon.outer().front().x(), hexagon.outer().back().x());
  EXPECT_DOUBLE_EQ(hexagon.outer().front().y(), hexagon.outer().back().y());
  EXPECT_NEAR(hexalloc::bg::area(hexagon), hexArea(4.0), 1e-9);
  EXPECT_TRUE(hexalloc::bg::is_valid(hexagon));
}
