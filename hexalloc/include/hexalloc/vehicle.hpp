#ifndef HEXALLOC_VEHICLE_HPP_
#define HEXALLOC_VEHICLE_HPP_

#include <optional>

namespace hexalloc
{

struct Vehicle {
    int id = 0;

    // Remaining battery in (0, 1]
    double battery_fraction = 1.0;

    // Workload budget. Computed from the battery fraction when not supplied.
    std::optional<double> capacity_workload;
};

}  // namespace hexalloc

#endif  // HEXALLOC_VEHICLE_HPP_
