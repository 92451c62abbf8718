#include "hexalloc/cluster_assigner.hpp"
#include "hexalloc/workload_model.hpp"
#include <algorithm>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <open3d/Open3D.h>
#include <rclcpp/rclcpp.hpp>

namespace hexalloc
{

namespace
{

double bucketWorkload(const std::vector<GridCell> & cells, const CellBucket & bucket)
{
  double workload = 0.0;
  for (size_t idx : bucket.cells) {
    workload += cellWorkload(cells[idx]);
  }
  return workload;
}

// Nearest centroid of every point, through a kd-tree over the centroids
std::vector<size_t> labelPoints(
  const open3d::geometry::PointCloud & points,
  const std::vector<Eigen::Vector3d> & centroids)
{
  open3d::geometry::PointCloud centroid_cloud;
  centroid_cloud.points_ = centroids;
  open3d::geometry::KDTreeFlann tree(centroid_cloud);

  std::vector<size_t> labels(points.points_.size(), 0);
  std::vector<int> indices(1);
  std::vector<double> distance2(1);
  for (size_t i = 0; i < points.points_.size(); ++i) {
    if (tree.SearchKNN(points.points_[i], 1, indices, distance2) > 0) {
      labels[i] = static_cast<size_t>(indices[0]);
    }
  }
  return labels;
}

}  // namespace

void moveCell(std::vector<CellBucket> & buckets, size_t cell, size_t from, size_t to)
{
  if (buckets.at(from).cells.erase(cell) == 0) {
    throw std::out_of_range("Cell " + std::to_string(cell) + " is not in bucket " + std::to_string(from));
  }
  buckets.at(to).cells.insert(cell);
}

ClusterAssigner::ClusterAssigner(const ClusterAssignerOptions & options)
: options_(options)
{
}

size_t ClusterAssigner::passBudget(size_t k) const
{
  if (options_.max_passes > 0) {
    return options_.max_passes;
  }
  return std::max<size_t>(200, 10 * k);
}

ClusterSeeding ClusterAssigner::seed(const std::vector<GridCell> & cells, size_t k) const
{
  ClusterSeeding seeding;
  if (cells.empty() || k == 0) {
    seeding.centroids.assign(k, Eigen::Vector2d::Zero());
    return seeding;
  }

  open3d::geometry::PointCloud points;
  points.points_.reserve(cells.size());
  for (const auto & cell : cells) {
    points.points_.emplace_back(cell.center.x(), cell.center.y(), 0.0);
  }
  const size_t n = points.points_.size();

  // k-means++ initialization
  std::mt19937 gen(options_.seed);
  std::vector<Eigen::Vector3d> centroids;
  centroids.reserve(k);
  std::uniform_int_distribution<size_t> first(0, n - 1);
  centroids.push_back(points.points_[first(gen)]);

  std::vector<double> distance2(n, std::numeric_limits<double>::max());
  while (centroids.size() < k) {
    const Eigen::Vector3d & latest = centroids.back();
    for (size_t i = 0; i < n; ++i) {
      distance2[i] = std::min(distance2[i], (points.points_[i] - latest).squaredNorm());
    }
    const double total = std::accumulate(distance2.begin(), distance2.end(), 0.0);
    if (!(total > 0.0)) {
      // Fewer distinct centers than clusters
      centroids.push_back(points.points_[centroids.size() % n]);
      continue;
    }
    std::discrete_distribution<size_t> pick(distance2.begin(), distance2.end());
    centroids.push_back(points.points_[pick(gen)]);
  }

  // Lloyd iterations
  std::vector<size_t> labels;
  for (int iteration = 0; iteration < options_.max_kmeans_iterations; ++iteration) {
    labels = labelPoints(points, centroids);

    std::vector<std::vector<size_t>> members(k);
    for (size_t i = 0; i < n; ++i) {
      members[labels[i]].push_back(i);
    }

    double max_shift = 0.0;
    for (size_t c = 0; c < k; ++c) {
      Eigen::Vector3d updated;
      if (members[c].empty()) {
        // Re-seed an empty cluster at the point farthest from its own centroid
        size_t farthest = 0;
        double farthest_distance = -1.0;
        for (size_t i = 0; i < n; ++i) {
          const double d = (points.points_[i] - centroids[labels[i]]).squaredNorm();
          if (d > farthest_distance && members[labels[i]].size() > 1) {
            farthest_distance = d;
            farthest = i;
          }
        }
        if (farthest_distance < 0.0) {
          continue;
        }
        updated = points.points_[farthest];
        members[labels[farthest]].erase(
          std::find(members[labels[farthest]].begin(), members[labels[farthest]].end(), farthest));
        members[c].push_back(farthest);
        labels[farthest] = c;
      } else {
        updated = points.SelectByIndex(members[c])->GetCenter();
      }
      max_shift = std::max(max_shift, (updated - centroids[c]).norm());
      centroids[c] = updated;
    }

    if (max_shift <= options_.kmeans_tolerance) {
      break;
    }
  }
  labels = labelPoints(points, centroids);

  seeding.labels = std::move(labels);
  seeding.centroids.reserve(k);
  for (const auto & c : centroids) {
    seeding.centroids.emplace_back(c.x(), c.y());
  }
  return seeding;
}

std::optional<size_t> ClusterAssigner::nearestReceiver(
  const GridCell & cell,
  size_t source,
  const std::vector<Eigen::Vector2d> & centroids,
  const std::vector<double> & spare) const
{
  const double required = options_.spare_slack * cellWorkload(cell);

  std::optional<size_t> best;
  double best_distance = std::numeric_limits<double>::max();
  // Strict comparison keeps the lowest bucket index on ties
  for (size_t b = 0; b < centroids.size(); ++b) {
    if (b == source || spare[b] < required) {
      continue;
    }
    const double distance = (cell.center - centroids[b]).norm();
    if (!best || distance < best_distance) {
      best = b;
      best_distance = distance;
    }
  }
  return best;
}

size_t ClusterAssigner::rebalance(
  const std::vector<GridCell> & cells,
  const std::vector<Eigen::Vector2d> & centroids,
  const std::vector<double> & capacities,
  std::vector<CellBucket> & buckets) const
{
  const size_t k = buckets.size();
  if (centroids.size() != k || capacities.size() != k) {
    throw std::invalid_argument("Bucket, centroid and capacity counts differ");
  }

  const size_t budget = passBudget(k);
  size_t passes = 0;
  bool changed = true;
  while (changed && passes < budget) {
    changed = false;
    ++passes;

    for (size_t b = 0; b < k; ++b) {
      // Fresh workloads, earlier buckets of this pass may have moved cells
      std::vector<double> spare(k);
      double workload = 0.0;
      for (size_t i = 0; i < k; ++i) {
        const double w = bucketWorkload(cells, buckets[i]);
        spare[i] = capacities[i] - w;
        if (i == b) {
          workload = w;
        }
      }
      if (!exceedsCapacity(workload, capacities[b])) {
        continue;
      }

      // Outliers first, so the core of the cluster stays together
      std::vector<std::pair<double, size_t>> candidates;
      candidates.reserve(buckets[b].cells.size());
      for (size_t idx : buckets[b].cells) {
        candidates.emplace_back(-(cells[idx].center - centroids[b]).norm(), idx);
      }
      std::sort(candidates.begin(), candidates.end());

      for (const auto & candidate : candidates) {
        const size_t idx = candidate.second;
        auto target = nearestReceiver(cells[idx], b, centroids, spare);
        if (!target) {
          continue;
        }
        moveCell(buckets, idx, b, *target);
        changed = true;
        break;
      }
    }
  }
  return passes;
}

AssignmentResult ClusterAssigner::assign(const std::vector<GridCell> & cells, std::vector<Vehicle> & fleet) const
{
  auto logger = rclcpp::get_logger("hexalloc.cluster_assigner");

  const double total = totalWorkload(cells);
  const std::vector<double> capacities = resolveCapacities(fleet, total);
  const size_t k = fleet.size();

  ClusterSeeding seeding = seed(cells, k);
  std::vector<CellBucket> buckets(k);
  for (size_t i = 0; i < cells.size(); ++i) {
    buckets[seeding.labels[i]].cells.insert(i);
  }

  AssignmentResult result;
  result.passes = rebalance(cells, seeding.centroids, capacities, buckets);
  result.converged = true;

  result.zones.reserve(k);
  for (size_t b = 0; b < k; ++b) {
    ZoneAssignment zone;
    zone.vehicle_id = fleet[b].id;
    zone.cell_indices.assign(buckets[b].cells.begin(), buckets[b].cells.end());
    zone.stats.cell_count = zone.cell_indices.size();
    zone.stats.workload = bucketWorkload(cells, buckets[b]);
    zone.stats.capacity = capacities[b];
    zone.stats.battery_fraction = fleet[b].battery_fraction;
    if (zone.stats.overCapacity()) {
      result.converged = false;
    }
    result.zones.push_back(std::move(zone));
  }

  if (!result.converged) {
    RCLCPP_WARN(logger, "Rebalancing left zones above capacity after %zu of %zu passes.",
      result.passes, passBudget(k));
  } else {
    RCLCPP_DEBUG(logger, "Rebalancing converged after %zu passes.", result.passes);
  }
  return result;
}

}  // namespace hexalloc
