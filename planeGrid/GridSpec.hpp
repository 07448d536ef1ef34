#pragma once
#include "Errors.hpp"
#include "Logger.hpp"

namespace planeGrid
{
// Single place where grid sizes are checked, logs and throws for size <= 0
inline void checkGridSize(int size)
{
  if (size <= 0)
  {
    PLANEGRID_ERROR("Invalid grid size " << size);
    throw InvalidGridSizeError(size);
  }
}

// A (possibly fractional) position on a size x size grid over the unit square.
// row and col run from 0 to size, integer values are grid lines.
struct GridSpec
{
  int size;
  double row;
  double col;

  void validate() const { checkGridSize(size); }
};

// Integer cell address, both indices in [0, size)
struct GridIndex
{
  int row;
  int col;

  bool operator==(const GridIndex& other) const { return row == other.row && col == other.col; }
  bool operator!=(const GridIndex& other) const { return !(*this == other); }
};
}
