#include "hexalloc/default_assigners.hpp"
#include "hexalloc/cluster_assigner.hpp"
#include <pluginlib/class_list_macros.hpp>

namespace hexalloc
{

void CapacityKMeans::onInitialize()
{
  // declare parameters used by the cluster assigner
  node_->declare_parameter(name_ + ".max_kmeans_iterations", 300);
  node_->declare_parameter(name_ + ".kmeans_tolerance", 1e-4);
  node_->declare_parameter(name_ + ".spare_slack", 0.5);
  // 0 selects max(200, 10 * number of vehicles)
  node_->declare_parameter(name_ + ".max_passes", 0);
}

void CapacityKMeans::onProcess(PlanningContext &context)
{
  ClusterAssignerOptions options;
  options.seed = static_cast<unsigned int>(node_->get_parameter(name_ + ".seed").as_int());
  options.max_kmeans_iterations = static_cast<int>(node_->get_parameter(name_ + ".max_kmeans_iterations").as_int());
  options.kmeans_tolerance = node_->get_parameter(name_ + ".kmeans_tolerance").as_double();
  options.spare_slack = node_->get_parameter(name_ + ".spare_slack").as_double();
  auto max_passes = node_->get_parameter(name_ + ".max_passes").as_int();
  options.max_passes = max_passes > 0 ? static_cast<std::size_t>(max_passes) : 0;

  ClusterAssigner assigner(options);
  context.result = assigner.assign(context.cells, context.fleet);

  RCLCPP_INFO(node_->get_logger(), "Assignment plugin [%s] distributed %zu cells over %zu vehicles in %zu passes.",
    name_.c_str(), context.cells.size(), context.fleet.size(), context.result->passes);
}

}  // namespace hexalloc

PLUGINLIB_EXPORT_CLASS(hexalloc::CapacityKMeans, hexalloc::AssignmentStrategy)
