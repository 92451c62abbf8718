#include "hexalloc/assignment_result.hpp"
#include <stdexcept>
#include <string>

namespace hexalloc
{

const ZoneAssignment & AssignmentResult::zoneFor(int vehicle_id) const
{
  for (const auto & zone : zones) {
    if (zone.vehicle_id == vehicle_id) {
      return zone;
    }
  }
  throw std::out_of_range("No zone for vehicle " + std::to_string(vehicle_id));
}

}  // namespace hexalloc
