#ifndef HEXALLOC_ASSIGNMENT_STRATEGY_HPP_
#define HEXALLOC_ASSIGNMENT_STRATEGY_HPP_

#include <memory>
#include <string>
#include <rclcpp/rclcpp.hpp>
#include "hexalloc/planning_context.hpp"

namespace hexalloc
{
  class AssignmentStrategy
  {
  public:
    using Ptr = std::shared_ptr<AssignmentStrategy>;

    virtual ~AssignmentStrategy() = default;

    void initialize(rclcpp::Node *node, const std::string &name)
    {
      node_ = node;
      name_ = name;

      node_->declare_parameter(name_ + ".seed", 42);

      this->onInitialize();
    };

    void process(PlanningContext &context){
      context.result.reset();
      RCLCPP_DEBUG(node_->get_logger(), "Assignment plugin [%s] received %zu cells.", name_.c_str(), context.cells.size());
      // Throws ZeroWorkloadError when there is nothing to assign
      this->onProcess(context);
    }

    protected:
    // The logic step: read context cells and fleet -> assign -> write context result
    virtual void onProcess(PlanningContext &context) = 0;
    virtual void onInitialize() = 0;

    std::string name_;
    rclcpp::Node *node_;
  };
} // namespace hexalloc

#endif // HEXALLOC_ASSIGNMENT_STRATEGY_HPP_
