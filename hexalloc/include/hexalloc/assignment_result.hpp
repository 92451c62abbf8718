#ifndef HEXALLOC_ASSIGNMENT_RESULT_HPP_
#define HEXALLOC_ASSIGNMENT_RESULT_HPP_

#include <cstddef>
#include <vector>

namespace hexalloc
{

// Relative tolerance under which a bucket workload still counts as within capacity
constexpr double kCapacityTolerance = 1e-9;

inline bool exceedsCapacity(double workload, double capacity)
{
  return workload > capacity + kCapacityTolerance * (capacity > 1.0 ? capacity : 1.0);
}

struct PartitionStats {
    std::size_t cell_count = 0;
    double workload = 0.0;
    double capacity = 0.0;
    double battery_fraction = 0.0;

    bool overCapacity() const
    {
      return exceedsCapacity(workload, capacity);
    }
};

struct ZoneAssignment {
    int vehicle_id = 0;

    // Indices into the cell vector the assignment was computed on, ascending
    std::vector<std::size_t> cell_indices;

    PartitionStats stats;
};

struct AssignmentResult {
    // One zone per vehicle, in fleet order
    std::vector<ZoneAssignment> zones;

    // Rebalancing passes executed
    std::size_t passes = 0;

    // True when no zone ended above its capacity
    bool converged = false;

    /// @brief Zone of the given vehicle.
    /// @throws std::out_of_range if the vehicle is not part of the result.
    const ZoneAssignment & zoneFor(int vehicle_id) const;
};

}  // namespace hexalloc

#endif  // HEXALLOC_ASSIGNMENT_RESULT_HPP_
