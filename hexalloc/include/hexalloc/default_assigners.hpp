#ifndef HEXALLOC_DEFAULT_ASSIGNERS_HPP_
#define HEXALLOC_DEFAULT_ASSIGNERS_HPP_

#include "hexalloc/assignment_strategy.hpp"

namespace hexalloc
{

// k-means seeding followed by greedy capacity rebalancing
class CapacityKMeans : public AssignmentStrategy
{
protected:
  void onInitialize() override;
  void onProcess(PlanningContext &context) override;
};

}  // namespace hexalloc

#endif  // HEXALLOC_DEFAULT_ASSIGNERS_HPP_
