#ifndef HEXALLOC_ZONE_PLANNER_HPP_
#define HEXALLOC_ZONE_PLANNER_HPP_

#include <memory>
#include <vector>
#include "rclcpp/rclcpp.hpp"
#include "grid_map_core/GridMap.hpp"
#include "grid_map_msgs/msg/grid_map.hpp"
#include <pluginlib/class_loader.hpp>
#include "hexalloc/assignment_strategy.hpp"
#include "hexalloc/cell_filter_base.hpp"
#include "hexalloc/planning_context.hpp"


class ZonePlanner : public rclcpp::Node{
	public:
		ZonePlanner();

		// Runs grid generation, filters and assignment. Returns false if the run failed.
		bool plan();

	private:
		void loadPlugins();
		hexalloc::Polygon boundaryFromParameters() const;
		std::vector<hexalloc::Vehicle> fleetFromParameters() const;
		void logSummary(const hexalloc::PlanningContext & context) const;
		void exportResult(const hexalloc::PlanningContext & context) const;
		void publishResult(const hexalloc::PlanningContext & context);

		pluginlib::ClassLoader<hexalloc::CellFilterBase> filter_loader_;
		pluginlib::ClassLoader<hexalloc::AssignmentStrategy> strategy_loader_;
		std::vector<hexalloc::CellFilterBase::Ptr> filters_;
		hexalloc::AssignmentStrategy::Ptr strategy_;

		rclcpp::Publisher<grid_map_msgs::msg::GridMap>::SharedPtr grid_map_publisher_;
		grid_map::GridMap grid_map_;

	};

#endif  // HEXALLOC_ZONE_PLANNER_HPP_
