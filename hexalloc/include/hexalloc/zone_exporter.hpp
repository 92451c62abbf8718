#ifndef HEXALLOC_ZONE_EXPORTER_HPP_
#define HEXALLOC_ZONE_EXPORTER_HPP_

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hexalloc/assignment_result.hpp"
#include "hexalloc/grid_cell.hpp"

namespace hexalloc
{

class ZoneExporter
{
public:
  // Delete constructor to prevent instantiation
  ZoneExporter() = delete;

  /// @brief Writes one row per assigned cell, zones in fleet order.
  /// @param path Output file, overwritten.
  /// @param cells Cell vector the result indexes into.
  /// @param result Assignment to export.
  /// @throws ExportError if the file cannot be written.
  static void writeCsv(const std::string & path, const std::vector<GridCell> & cells, const AssignmentResult & result);

  /// @brief Builds a GeoJSON FeatureCollection with one feature per assigned cell.
  static nlohmann::json toGeoJson(const std::vector<GridCell> & cells, const AssignmentResult & result);

  /// @brief Writes toGeoJson() to a file.
  /// @throws ExportError if the file cannot be written.
  static void writeGeoJson(const std::string & path, const std::vector<GridCell> & cells, const AssignmentResult & result);
};

}  // namespace hexalloc

#endif  // HEXALLOC_ZONE_EXPORTER_HPP_
