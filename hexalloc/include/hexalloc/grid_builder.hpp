#ifndef HEXALLOC_GRID_BUILDER_HPP_
#define HEXALLOC_GRID_BUILDER_HPP_

#include <vector>
#include "hexalloc/grid_cell.hpp"
#include "hexalloc/hex_geometry.hpp"

namespace hexalloc
{

struct GridBuilderOptions {
    // Target area of a full hexagon, square meters
    double cell_area = acresToSquareMeters(0.5);

    // Clipped cells at or below this area are dropped
    double sliver_threshold = 1.0;
    bool ignore_slivers = true;

    // Extra lattice rows/columns generated around the bounding box
    int padding = 3;
};

class HexGridBuilder
{
public:
  explicit HexGridBuilder(const GridBuilderOptions & options);

  /// @brief Tiles the boundary with hexagons centered on its bounding box.
  /// @param boundary Farm outline, may be non-convex and have holes.
  /// @return Kept cells with ids 0..N-1 in lattice order. Empty for a degenerate boundary.
  /// @throws InvalidGeometryError if the boundary has fewer than three vertices.
  std::vector<GridCell> build(const Polygon & boundary) const;

  double sideLength() const {return side_;}

  const GridBuilderOptions & options() const {return options_;}

private:
  std::vector<Eigen::Vector2d> latticeCenters(const Box & bounds) const;

  GridBuilderOptions options_;
  double side_;
};

}  // namespace hexalloc

#endif  // HEXALLOC_GRID_BUILDER_HPP_
