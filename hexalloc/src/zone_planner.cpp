#include "hexalloc/zone_planner.hpp"
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <rclcpp/executors.hpp>
#include "grid_map_ros/grid_map_ros.hpp"
#include "hexalloc/exceptions.hpp"
#include "hexalloc/grid_builder.hpp"
#include "hexalloc/planner_utils.hpp"
#include "hexalloc/zone_exporter.hpp"


ZonePlanner::ZonePlanner()
  : Node("zone_planner"),
    filter_loader_("hexalloc", "hexalloc::CellFilterBase"),
    strategy_loader_("hexalloc", "hexalloc::AssignmentStrategy")
{
  // Farm boundary, WKT or a rectangle of the given width and area
  this->declare_parameter("boundary_wkt", "");
  this->declare_parameter("farm_width_m", 1000.0);
  this->declare_parameter("total_acres", 200.0);

  this->declare_parameter("cell_acres", 0.5);
  this->declare_parameter("sliver_threshold_m2", 1.0);
  this->declare_parameter("ignore_slivers", true);

  // Fleet, explicit batteries or a random one
  this->declare_parameter("battery_fractions", std::vector<double>());
  this->declare_parameter("capacities", std::vector<double>());
  this->declare_parameter("num_vehicles", 15);
  this->declare_parameter("battery_min", 0.35);
  this->declare_parameter("battery_max", 1.0);
  this->declare_parameter("seed", 42);

  this->declare_parameter("output_dir", "");
  this->declare_parameter("frame_id", "map");
  this->declare_parameter("grid_resolution", 5.0);

  loadPlugins();

  // Late subscribers still get the last plan
  rclcpp::QoS qos_profile(rclcpp::KeepLast(1));
  qos_profile.transient_local();
  grid_map_publisher_ = this->create_publisher<grid_map_msgs::msg::GridMap>("zone_map", qos_profile);

  grid_map_.setFrameId(this->get_parameter("frame_id").as_string());

  RCLCPP_INFO(this->get_logger(),
    "Node [%s] started.", this->get_name());
}

void ZonePlanner::loadPlugins()
{
  auto declared_classes = filter_loader_.getDeclaredClasses();
  RCLCPP_INFO(this->get_logger(), "[%s] Querying available cell filter plugins:", this->get_name());
  for (const auto & cls : declared_classes) {
    RCLCPP_INFO(this->get_logger(), "  %s", cls.c_str());
  }

  this->declare_parameter("filter_plugins", std::vector<std::string>());
  auto filter_names = this->get_parameter("filter_plugins").as_string_array();

  for (const auto & name : filter_names) {
    this->declare_parameter(name + ".plugin", "");
    std::string type = this->get_parameter(name + ".plugin").as_string();
    try {
      auto filter = filter_loader_.createSharedInstance(type);
      filter->initialize(name, this);
      filters_.push_back(filter);
      RCLCPP_INFO(this->get_logger(), "Successfully loaded filter plugin '%s' of type '%s'", name.c_str(), type.c_str());
    } catch (pluginlib::PluginlibException & ex) {
      RCLCPP_ERROR(this->get_logger(), "The plugin failed to load for filter '%s'. Error: %s", name.c_str(), ex.what());
    }
  }

  this->declare_parameter("assignment_plugin", "capacity_kmeans");
  auto strategy_name = this->get_parameter("assignment_plugin").as_string();
  this->declare_parameter(strategy_name + ".plugin", "hexalloc::CapacityKMeans");
  std::string type = this->get_parameter(strategy_name + ".plugin").as_string();
  try {
    strategy_ = strategy_loader_.createSharedInstance(type);
    strategy_->initialize(this, strategy_name);
    RCLCPP_INFO(this->get_logger(), "Successfully loaded assignment plugin '%s' of type '%s'", strategy_name.c_str(), type.c_str());
  } catch (pluginlib::PluginlibException & ex) {
    RCLCPP_ERROR(this->get_logger(), "The plugin failed to load for assignment '%s'. Error: %s", strategy_name.c_str(), ex.what());
  }
}

hexalloc::Polygon ZonePlanner::boundaryFromParameters() const
{
  auto wkt = this->get_parameter("boundary_wkt").as_string();
  if (!wkt.empty()) {
    return hexalloc::PlannerUtils::boundaryFromWkt(wkt);
  }

  auto width = this->get_parameter("farm_width_m").as_double();
  auto total_area = hexalloc::acresToSquareMeters(this->get_parameter("total_acres").as_double());
  if (!(width > 0.0)) {
    throw hexalloc::InvalidGeometryError("farm_width_m must be positive");
  }
  return hexalloc::PlannerUtils::rectangleBoundary(width, total_area / width);
}

std::vector<hexalloc::Vehicle> ZonePlanner::fleetFromParameters() const
{
  auto batteries = this->get_parameter("battery_fractions").as_double_array();
  auto capacities = this->get_parameter("capacities").as_double_array();
  if (!batteries.empty()) {
    return hexalloc::PlannerUtils::fleetFromBatteries(batteries, capacities);
  }

  auto count = this->get_parameter("num_vehicles").as_int();
  if (count <= 0) {
    throw hexalloc::InvalidFleetError("num_vehicles must be positive");
  }
  std::mt19937 gen(static_cast<std::mt19937::result_type>(this->get_parameter("seed").as_int()));
  auto fleet = hexalloc::PlannerUtils::randomFleet(
    static_cast<std::size_t>(count),
    this->get_parameter("battery_min").as_double(),
    this->get_parameter("battery_max").as_double(),
    gen);
  if (!capacities.empty()) {
    if (capacities.size() != fleet.size()) {
      throw hexalloc::InvalidFleetError(
        "Got " + std::to_string(capacities.size()) + " capacities for " +
        std::to_string(fleet.size()) + " vehicles");
    }
    for (std::size_t i = 0; i < fleet.size(); ++i) {
      fleet[i].capacity_workload = capacities[i];
    }
  }
  return fleet;
}

bool ZonePlanner::plan()
{
  if (!strategy_) {
    RCLCPP_ERROR(this->get_logger(), "No assignment plugin loaded. Nothing to plan.");
    return false;
  }

  hexalloc::PlanningContext context;
  try {
    context.boundary = boundaryFromParameters();

    hexalloc::GridBuilderOptions options;
    options.cell_area = hexalloc::acresToSquareMeters(this->get_parameter("cell_acres").as_double());
    options.sliver_threshold = this->get_parameter("sliver_threshold_m2").as_double();
    options.ignore_slivers = this->get_parameter("ignore_slivers").as_bool();
    hexalloc::HexGridBuilder builder(options);
    context.cells = builder.build(context.boundary);
    RCLCPP_INFO(this->get_logger(), "Total hexes: %zu", context.cells.size());

    for (const auto & filter : filters_) {
      context.cells = filter->filter(context);
    }

    context.fleet = fleetFromParameters();
    strategy_->process(context);
  } catch (const std::runtime_error & e) {
    RCLCPP_ERROR(this->get_logger(), "Planning failed: %s", e.what());
    return false;
  }

  if (!context.result) {
    RCLCPP_WARN(this->get_logger(), "Assignment plugin produced no result.");
    return false;
  }

  logSummary(context);

  try {
    exportResult(context);
  } catch (const hexalloc::ExportError & e) {
    RCLCPP_ERROR(this->get_logger(), "%s", e.what());
  }

  publishResult(context);
  return true;
}

void ZonePlanner::logSummary(const hexalloc::PlanningContext & context) const
{
  const auto & result = *context.result;
  RCLCPP_INFO(this->get_logger(), "---- Assignment summary ----");
  std::size_t total_assigned = 0;
  for (const auto & zone : result.zones) {
    const auto & s = zone.stats;
    RCLCPP_INFO(this->get_logger(), "UAV %d: hexes=%zu, workload=%.1f, capacity=%.1f, battery=%.2f%s",
      zone.vehicle_id, s.cell_count, s.workload, s.capacity, s.battery_fraction,
      s.overCapacity() ? " (over capacity)" : "");
    total_assigned += s.cell_count;
  }
  RCLCPP_INFO(this->get_logger(), "Total hexes assigned: %zu", total_assigned);
  RCLCPP_INFO(this->get_logger(), "Avg hexes per UAV: %.2f",
    static_cast<double>(total_assigned) / static_cast<double>(result.zones.size()));
  if (!result.converged) {
    RCLCPP_WARN(this->get_logger(), "Some zones exceed their capacity after %zu rebalancing passes.", result.passes);
  }
}

void ZonePlanner::exportResult(const hexalloc::PlanningContext & context) const
{
  auto output_dir = this->get_parameter("output_dir").as_string();
  if (output_dir.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    throw hexalloc::ExportError("Cannot create " + output_dir + ": " + ec.message());
  }

  auto csv_path = (std::filesystem::path(output_dir) / "zone_allocation.csv").string();
  hexalloc::ZoneExporter::writeCsv(csv_path, context.cells, *context.result);
  RCLCPP_INFO(this->get_logger(), "Saved zone allocation CSV to %s", csv_path.c_str());

  auto geo_path = (std::filesystem::path(output_dir) / "uav_assignments.geojson").string();
  hexalloc::ZoneExporter::writeGeoJson(geo_path, context.cells, *context.result);
  RCLCPP_INFO(this->get_logger(), "Saved GeoJSON to %s", geo_path.c_str());
}

void ZonePlanner::publishResult(const hexalloc::PlanningContext & context)
{
  hexalloc::PlannerUtils::rasterize(
    context.boundary, context.cells, *context.result,
    this->get_parameter("grid_resolution").as_double(), grid_map_);

  grid_map::Time timestamp(this->get_clock()->now().nanoseconds());
  grid_map_.setTimestamp(timestamp);
  auto message = grid_map::GridMapRosConverter::toMessage(grid_map_);
  grid_map_publisher_->publish(*message);
}


int main(int argc, char * argv[]){
  rclcpp::init(argc, argv);

  auto node = std::make_shared<ZonePlanner>();
  if (!node->plan()) {
    RCLCPP_ERROR(node->get_logger(), "No zone plan published.");
  }

  rclcpp::executors::SingleThreadedExecutor executor;

  executor.add_node(node);
  executor.spin();
  rclcpp::shutdown();
  return 0;
}
