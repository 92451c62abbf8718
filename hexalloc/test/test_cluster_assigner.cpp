#include <gtest/gtest.h>
#include <map>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include "hexalloc/cluster_assigner.hpp"
#include "hexalloc/exceptions.hpp"
#include "hexalloc/grid_builder.hpp"
#include "hexalloc/workload_model.hpp"

using hexalloc::AssignmentResult;
using hexalloc::CellBucket;
using hexalloc::ClusterAssigner;
using hexalloc::ClusterAssignerOptions;
using hexalloc::GridCell;
using hexalloc::Vehicle;

namespace
{

GridCell cellAt(std::size_t id, double x, double y, double area = 100.0)
{
  GridCell cell;
  cell.id = id;
  cell.center = Eigen::Vector2d(x, y);
  cell.area = area;
  return cell;
}

// Row-major square lattice of equal cells, 10 m apart
std::vector<GridCell> lattice(int cols, int rows, double area = 100.0)
{
  std::vector<GridCell> cells;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      cells.push_back(cellAt(cells.size(), 10.0 * c, 10.0 * r, area));
    }
  }
  return cells;
}

std::vector<Vehicle> fleetWithBatteries(const std::vector<double> & batteries)
{
  std::vector<Vehicle> fleet;
  for (std::size_t i = 0; i < batteries.size(); ++i) {
    Vehicle v;
    v.id = static_cast<int>(i);
    v.battery_fraction = batteries[i];
    fleet.push_back(v);
  }
  return fleet;
}

std::vector<GridCell> halfAcreFarm()
{
  hexalloc::GridBuilderOptions options;
  options.cell_area = hexalloc::acresToSquareMeters(0.5);
  const double width = 1000.0;
  const double height = hexalloc::acresToSquareMeters(200.0) / width;

  hexalloc::Polygon farm;
  hexalloc::bg::read_wkt(
    "POLYGON((0 0," + std::to_string(width) + " 0," + std::to_string(width) + " " +
    std::to_string(height) + ",0 " + std::to_string(height) + ",0 0))", farm);
  hexalloc::bg::correct(farm);

  auto cells = hexalloc::HexGridBuilder(options).build(farm);
  // Every 20th cell is high priority
  for (std::size_t i = 0; i < cells.size(); i += 20) {
    cells[i].priority = hexalloc::kHighPriority;
  }
  return cells;
}

void expectExactPartition(const std::vector<GridCell> & cells, const AssignmentResult & result)
{
  std::map<std::size_t, int> owners;
  std::size_t count = 0;
  double workload = 0.0;
  for (const auto & zone : result.zones) {
    EXPECT_EQ(zone.stats.cell_count, zone.cell_indices.size());
    for (std::size_t idx : zone.cell_indices) {
      ASSERT_LT(idx, cells.size());
      EXPECT_TRUE(owners.emplace(idx, zone.vehicle_id).second) << "cell " << idx << " assigned twice";
    }
    count += zone.stats.cell_count;
    workload += zone.stats.workload;
  }
  EXPECT_EQ(count, cells.size());
  EXPECT_EQ(owners.size(), cells.size());
  EXPECT_NEAR(workload, hexalloc::totalWorkload(cells), 1e-9 * hexalloc::totalWorkload(cells));
}

}  // namespace

TEST(ClusterAssigner, ThreeEqualCellsThreeEqualVehicles)
{
  std::vector<GridCell> cells = {cellAt(0, 0.0, 0.0), cellAt(1, 1000.0, 0.0), cellAt(2, 0.0, 1000.0)};
  auto fleet = fleetWithBatteries({0.5, 0.5, 0.5});

  auto result = ClusterAssigner().assign(cells, fleet);

  ASSERT_EQ(result.zones.size(), 3u);
  expectExactPartition(cells, result);
  for (const auto & zone : result.zones) {
    EXPECT_EQ(zone.stats.cell_count, 1u);
    EXPECT_FALSE(zone.stats.overCapacity());
    EXPECT_DOUBLE_EQ(zone.stats.battery_fraction, 0.5);
  }
  EXPECT_TRUE(result.converged);
}

TEST(ClusterAssigner, WorkloadEqualToCapacityIsFeasible)
{
  auto cells = lattice(4, 3);
  auto fleet = fleetWithBatteries({1.0, 1.0, 1.0});
  fleet[0].capacity_workload = hexalloc::totalWorkload(cells);
  fleet[1].capacity_workload = 0.0;
  fleet[2].capacity_workload = 0.0;

  auto result = ClusterAssigner().assign(cells, fleet);

  expectExactPartition(cells, result);
  const auto & owner = result.zoneFor(0);
  EXPECT_EQ(owner.stats.cell_count, cells.size());
  EXPECT_DOUBLE_EQ(owner.stats.workload, owner.stats.capacity);
  EXPECT_FALSE(owner.stats.overCapacity());
  EXPECT_EQ(result.zoneFor(1).stats.cell_count, 0u);
  EXPECT_EQ(result.zoneFor(2).stats.cell_count, 0u);
  EXPECT_TRUE(result.converged);
}

TEST(ClusterAssigner, SingleCapableVehicleCollectsEverything)
{
  auto cells = lattice(10, 8);
  auto fleet = fleetWithBatteries({0.4, 0.9, 0.6, 0.8});
  const double total = hexalloc::totalWorkload(cells);
  fleet[0].capacity_workload = 0.0;
  fleet[1].capacity_workload = total * 1.5;
  fleet[2].capacity_workload = 0.0;
  fleet[3].capacity_workload = 0.0;

  ClusterAssigner assigner;
  auto result = assigner.assign(cells, fleet);

  expectExactPartition(cells, result);
  EXPECT_EQ(result.zoneFor(1).stats.cell_count, cells.size());
  EXPECT_LT(result.passes, assigner.passBudget(fleet.size()));
  EXPECT_TRUE(result.converged);
}

TEST(ClusterAssigner, PartitionsHalfAcreFarmExactlyOnce)
{
  auto cells = halfAcreFarm();
  ASSERT_GT(cells.size(), 400u);

  std::mt19937 gen(42);
  std::uniform_real_distribution<double> battery(0.35, 1.0);
  std::vector<double> batteries;
  for (int i = 0; i < 15; ++i) {
    batteries.push_back(battery(gen));
  }
  auto fleet = fleetWithBatteries(batteries);

  auto result = ClusterAssigner().assign(cells, fleet);

  ASSERT_EQ(result.zones.size(), 15u);
  expectExactPartition(cells, result);
  for (std::size_t i = 0; i < fleet.size(); ++i) {
    EXPECT_EQ(result.zones[i].vehicle_id, fleet[i].id);
    ASSERT_TRUE(fleet[i].capacity_workload.has_value());
    EXPECT_DOUBLE_EQ(result.zones[i].stats.capacity, *fleet[i].capacity_workload);
  }
}

TEST(ClusterAssigner, SameSeedSameAssignment)
{
  auto cells = halfAcreFarm();
  auto fleet_a = fleetWithBatteries({0.35, 0.8, 0.55, 1.0, 0.62});
  auto fleet_b = fleet_a;

  ClusterAssignerOptions options;
  options.seed = 7;
  auto a = ClusterAssigner(options).assign(cells, fleet_a);
  auto b = ClusterAssigner(options).assign(cells, fleet_b);

  ASSERT_EQ(a.zones.size(), b.zones.size());
  for (std::size_t i = 0; i < a.zones.size(); ++i) {
    EXPECT_EQ(a.zones[i].cell_indices, b.zones[i].cell_indices);
  }
  EXPECT_EQ(a.passes, b.passes);
}

TEST(ClusterAssigner, InfeasibleCapacityIsReportedNotRaised)
{
  std::vector<GridCell> cells = {cellAt(0, 0.0, 0.0, 100.0)};
  auto fleet = fleetWithBatteries({1.0, 1.0});
  fleet[0].capacity_workload = 10.0;
  fleet[1].capacity_workload = 10.0;

  AssignmentResult result;
  ASSERT_NO_THROW(result = ClusterAssigner().assign(cells, fleet));

  expectExactPartition(cells, result);
  EXPECT_FALSE(result.converged);
  std::size_t over = 0;
  for (const auto & zone : result.zones) {
    if (zone.stats.overCapacity()) {
      ++over;
      EXPECT_GT(zone.stats.workload, zone.stats.capacity);
    }
  }
  EXPECT_EQ(over, 1u);
  EXPECT_EQ(result.passes, 1u);
}

TEST(ClusterAssigner, EmptyCellSetHasNoWorkload)
{
  auto fleet = fleetWithBatteries({1.0});
  EXPECT_THROW(ClusterAssigner().assign({}, fleet), hexalloc::ZeroWorkloadError);
}

TEST(ClusterAssigner, EmptyFleetIsRejected)
{
  auto cells = lattice(2, 2);
  std::vector<Vehicle> fleet;
  EXPECT_THROW(ClusterAssigner().assign(cells, fleet), hexalloc::InvalidFleetError);
}

TEST(ClusterAssigner, PassBudget)
{
  ClusterAssigner assigner;
  EXPECT_EQ(assigner.passBudget(1), 200u);
  EXPECT_EQ(assigner.passBudget(20), 200u);
  EXPECT_EQ(assigner.passBudget(50), 500u);

  ClusterAssignerOptions options;
  options.max_passes = 3;
  EXPECT_EQ(ClusterAssigner(options).passBudget(50), 3u);
}

TEST(ClusterAssigner, SeedingSeparatesDistantGroups)
{
  std::vector<GridCell> cells;
  for (const auto & origin : {Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(5000.0, 0.0), Eigen::Vector2d(0.0, 5000.0)}) {
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 3; ++j) {
        cells.push_back(cellAt(cells.size(), origin.x() + 10.0 * i, origin.y() + 10.0 * j));
      }
    }
  }

  auto seeding = ClusterAssigner().seed(cells, 3);
  ASSERT_EQ(seeding.labels.size(), cells.size());
  ASSERT_EQ(seeding.centroids.size(), 3u);

  for (std::size_t group = 0; group < 3; ++group) {
    const std::size_t label = seeding.labels[group * 9];
    for (std::size_t i = group * 9; i < group * 9 + 9; ++i) {
      EXPECT_EQ(seeding.labels[i], label);
    }
    const Eigen::Vector2d expected = cells[group * 9 + 4].center;
    EXPECT_NEAR((seeding.centroids[label] - expected).norm(), 0.0, 1e-6);
  }
  EXPECT_NE(seeding.labels[0], seeding.labels[9]);
  EXPECT_NE(seeding.labels[0], seeding.labels[18]);
  EXPECT_NE(seeding.labels[9], seeding.labels[18]);
}

TEST(ClusterAssigner, RebalanceMovesFarthestCellFirst)
{
  std::vector<GridCell> cells = {cellAt(0, 1.0, 0.0), cellAt(1, 5.0, 0.0), cellAt(2, 100.0, 0.0)};
  std::vector<CellBucket> buckets(2);
  buckets[0].cells = {0, 1};
  buckets[1].cells = {2};
  std::vector<Eigen::Vector2d> centroids = {Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(100.0, 0.0)};
  std::vector<double> capacities = {100.0, 1000.0};

  ClusterAssigner().rebalance(cells, centroids, capacities, buckets);

  EXPECT_EQ(buckets[0].cells, (std::set<std::size_t>{0}));
  EXPECT_EQ(buckets[1].cells, (std::set<std::size_t>{1, 2}));
}

TEST(ClusterAssigner, ReceiverNeedsHalfTheCellWorkload)
{
  std::vector<GridCell> cells = {cellAt(0, 0.0, 0.0, 60.0), cellAt(1, 3.0, 0.0, 60.0)};
  std::vector<Eigen::Vector2d> centroids = {Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(50.0, 0.0)};

  // Spare of exactly half the cell workload qualifies. The receiver ends up
  // over capacity, but the source has too little spare to take the cell back.
  std::vector<CellBucket> buckets(2);
  buckets[0].cells = {0, 1};
  auto passes = ClusterAssigner().rebalance(cells, centroids, {80.0, 30.0}, buckets);
  EXPECT_EQ(buckets[0].cells, (std::set<std::size_t>{0}));
  EXPECT_EQ(buckets[1].cells, (std::set<std::size_t>{1}));
  EXPECT_EQ(passes, 2u);

  // Slightly less does not
  std::vector<CellBucket> tight(2);
  tight[0].cells = {0, 1};
  passes = ClusterAssigner().rebalance(cells, centroids, {80.0, 29.9}, tight);
  EXPECT_TRUE(tight[1].cells.empty());
  EXPECT_EQ(passes, 1u);
}

TEST(ClusterAssigner, EquidistantReceiversPreferLowestIndex)
{
  std::vector<GridCell> cells = {cellAt(0, 0.0, 0.0), cellAt(1, 0.0, 1.0)};
  std::vector<CellBucket> buckets(3);
  buckets[2].cells = {0, 1};
  std::vector<Eigen::Vector2d> centroids = {
    Eigen::Vector2d(-10.0, 0.5), Eigen::Vector2d(10.0, 0.5), Eigen::Vector2d(0.0, 0.5)};

  ClusterAssigner().rebalance(cells, centroids, {500.0, 500.0, 100.0}, buckets);

  EXPECT_EQ(buckets[0].cells.size(), 1u);
  EXPECT_TRUE(buckets[1].cells.empty());
  EXPECT_EQ(buckets[2].cells.size(), 1u);
}

TEST(ClusterAssigner, MoveCellTransfersOwnership)
{
  std::vector<CellBucket> buckets(2);
  buckets[0].cells = {4, 7};

  hexalloc::moveCell(buckets, 7, 0, 1);
  EXPECT_EQ(buckets[0].cells, (std::set<std::size_t>{4}));
  EXPECT_EQ(buckets[1].cells, (std::set<std::size_t>{7}));

  EXPECT_THROW(hexalloc::moveCell(buckets, 7, 0, 1), std::out_of_range);
}

TEST(AssignmentResult, ZoneForUnknownVehicleThrows)
{
  AssignmentResult result;
  result.zones.resize(1);
  result.zones[0].vehicle_id = 3;
  EXPECT_EQ(&result.zoneFor(3), &result.zones[0]);
  EXPECT_THROW(result.zoneFor(4), std::out_of_range);
}
