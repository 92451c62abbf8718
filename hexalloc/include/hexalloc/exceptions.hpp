#ifndef HEXALLOC_EXCEPTIONS_HPP_
#define HEXALLOC_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace hexalloc
{

// Total workload of a cell set is zero or negative, so no capacity split exists.
class ZeroWorkloadError : public std::runtime_error
{
public:
  explicit ZeroWorkloadError(const std::string & message)
  : std::runtime_error(message) {}
};

class InvalidGeometryError : public std::runtime_error
{
public:
  explicit InvalidGeometryError(const std::string & message)
  : std::runtime_error(message) {}
};

class InvalidFleetError : public std::runtime_error
{
public:
  explicit InvalidFleetError(const std::string & message)
  : std::runtime_error(message) {}
};

// A cell carries a value no workload can be derived from, e.g. a negative priority.
class InvalidCellError : public std::runtime_error
{
public:
  explicit InvalidCellError(const std::string & message)
  : std::runtime_error(message) {}
};

class ExportError : public std::runtime_error
{
public:
  explicit ExportError(const std::string & message)
  : std::runtime_error(message) {}
};

}  // namespace hexalloc

#endif  // HEXALLOC_EXCEPTIONS_HPP_
