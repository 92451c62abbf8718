#include "hexalloc/zone_exporter.hpp"
#include "hexalloc/exceptions.hpp"
#include <fstream>
#include <iomanip>
#include <limits>

namespace
{

nlohmann::json ringCoordinates(const hexalloc::Polygon::ring_type & ring)
{
  nlohmann::json coordinates = nlohmann::json::array();
  for (const auto & p : ring) {
    coordinates.push_back({p.x(), p.y()});
  }
  return coordinates;
}

nlohmann::json polygonCoordinates(const hexalloc::Polygon & polygon)
{
  nlohmann::json rings = nlohmann::json::array();
  rings.push_back(ringCoordinates(polygon.outer()));
  for (const auto & inner : polygon.inners()) {
    rings.push_back(ringCoordinates(inner));
  }
  return rings;
}

nlohmann::json cellGeometry(const hexalloc::MultiPolygon & shape)
{
  if (shape.size() == 1) {
    return {{"type", "Polygon"}, {"coordinates", polygonCoordinates(shape.front())}};
  }
  nlohmann::json parts = nlohmann::json::array();
  for (const auto & polygon : shape) {
    parts.push_back(polygonCoordinates(polygon));
  }
  return {{"type", "MultiPolygon"}, {"coordinates", parts}};
}

}  // namespace

void hexalloc::ZoneExporter::writeCsv(const std::string & path, const std::vector<GridCell> & cells, const AssignmentResult & result)
{
  std::ofstream out(path);
  if (!out) {
    throw ExportError("Cannot open " + path + " for writing");
  }

  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  out << "uav_id,hex_id,centroid_x,centroid_y,area_m2,priority,restricted\n";
  for (const auto & zone : result.zones) {
    for (size_t idx : zone.cell_indices) {
      const auto & cell = cells.at(idx);
      out << zone.vehicle_id << ',' << cell.id << ','
          << cell.center.x() << ',' << cell.center.y() << ','
          << cell.area << ',' << cell.priority << ','
          << (cell.restricted ? "True" : "False") << '\n';
    }
  }

  if (!out) {
    throw ExportError("Failed writing " + path);
  }
}

nlohmann::json hexalloc::ZoneExporter::toGeoJson(const std::vector<GridCell> & cells, const AssignmentResult & result)
{
  nlohmann::json features = nlohmann::json::array();
  for (const auto & zone : result.zones) {
    for (size_t idx : zone.cell_indices) {
      const auto & cell = cells.at(idx);
      features.push_back({
        {"type", "Feature"},
        {"properties", {
          {"uav_id", zone.vehicle_id},
          {"hex_id", cell.id},
          {"area_m2", cell.area},
          {"priority", cell.priority},
          {"restricted", cell.restricted}}},
        {"geometry", cellGeometry(cell.polygon)}
      });
    }
  }
  return {{"type", "FeatureCollection"}, {"features", features}};
}

void hexalloc::ZoneExporter::writeGeoJson(const std::string & path, const std::vector<GridCell> & cells, const AssignmentResult & result)
{
  std::ofstream out(path);
  if (!out) {
    throw ExportError("Cannot open " + path + " for writing");
  }
  out << toGeoJson(cells, result).dump();
  if (!out) {
    throw ExportError("Failed writing " + path);
  }
}
