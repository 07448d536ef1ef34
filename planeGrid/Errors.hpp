#pragma once
#include <stdexcept>
#include <string>

namespace planeGrid
{
// The three corners of a frame are (nearly) collinear and span no plane.
class DegenerateFrameError : public std::runtime_error
{
 public:
  explicit DegenerateFrameError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};

class InvalidGridSizeError : public std::invalid_argument
{
 private:
  int size;

 public:
  explicit InvalidGridSizeError(int size)
    : std::invalid_argument("Grid size must be positive, got " + std::to_string(size))
    , size(size)
  {
  }

  int gridSize() const { return size; }
};
}
