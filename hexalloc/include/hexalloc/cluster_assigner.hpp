#ifndef HEXALLOC_CLUSTER_ASSIGNER_HPP_
#define HEXALLOC_CLUSTER_ASSIGNER_HPP_

#include <cstddef>
#include <optional>
#include <set>
#include <vector>
#include <Eigen/Dense>
#include "hexalloc/assignment_result.hpp"
#include "hexalloc/grid_cell.hpp"
#include "hexalloc/vehicle.hpp"

namespace hexalloc
{

struct ClusterAssignerOptions {
    // Seed of the k-means++ initialization
    unsigned int seed = 42;
    int max_kmeans_iterations = 300;

    // Lloyd iterations stop once no centroid moves further than this (meters)
    double kmeans_tolerance = 1e-4;

    // A receiving bucket needs spare capacity of at least spare_slack * workload(cell)
    double spare_slack = 0.5;

    // Rebalancing pass budget, 0 selects max(200, 10 * k)
    std::size_t max_passes = 0;
};

// Cells owned by one cluster, as indices into the cell vector
struct CellBucket {
    std::set<std::size_t> cells;
};

struct ClusterSeeding {
    std::vector<std::size_t> labels;
    std::vector<Eigen::Vector2d> centroids;
};

/// @brief Transfers one cell between buckets.
/// @throws std::out_of_range if the cell is not in the source bucket.
void moveCell(std::vector<CellBucket> & buckets, std::size_t cell, std::size_t from, std::size_t to);

class ClusterAssigner
{
public:
  explicit ClusterAssigner(const ClusterAssignerOptions & options = ClusterAssignerOptions());

  /// @brief Partitions the cells among the fleet, one bucket per vehicle.
  ///
  /// Capacities missing from the fleet are resolved in place. Buckets left above
  /// their capacity are reported through the zone statistics, not raised.
  /// @throws ZeroWorkloadError if the cells carry no workload.
  /// @throws InvalidFleetError if the fleet is empty or invalid.
  AssignmentResult assign(const std::vector<GridCell> & cells, std::vector<Vehicle> & fleet) const;

  /// @brief k-means over the cell centers. Deterministic for a given seed.
  ClusterSeeding seed(const std::vector<GridCell> & cells, std::size_t k) const;

  /// @brief Greedy capacity rebalancing. Moves at most one cell out of each
  /// overloaded bucket per pass until a pass changes nothing or the budget runs out.
  /// @return Number of passes executed.
  std::size_t rebalance(
    const std::vector<GridCell> & cells,
    const std::vector<Eigen::Vector2d> & centroids,
    const std::vector<double> & capacities,
    std::vector<CellBucket> & buckets) const;

  std::size_t passBudget(std::size_t k) const;

private:
  std::optional<std::size_t> nearestReceiver(
    const GridCell & cell,
    std::size_t source,
    const std::vector<Eigen::Vector2d> & centroids,
    const std::vector<double> & spare) const;

  ClusterAssignerOptions options_;
};

}  // namespace hexalloc

#endif  // HEXALLOC_CLUSTER_ASSIGNER_HPP_
