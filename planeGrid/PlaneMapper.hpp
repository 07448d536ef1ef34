#pragma once
#include "CornerFrame.hpp"
#include "GridSpec.hpp"
#include "Point.hpp"

#include <glm/glm.hpp>
#include <optional>

namespace planeGrid
{
// Affine map from the reference unit square onto the plane through a CornerFrame.
// All queries are const and read only the frame, so a mapper can be shared between threads.
class PlaneMapper
{
 public:
  // Slack in unit coordinates when deciding whether a point lies inside the square
  static constexpr double BOUNDARY_EPS = 1e-9;

 private:
  CornerFrame m_frame;

 public:
  explicit PlaneMapper(const CornerFrame& frame)
    : m_frame(frame)
  {
  }

  const CornerFrame& frame() const { return m_frame; }

  // origin + u * colBasis + v * rowBasis, no clamping
  Point3 mapUnit(double u, double v) const;

  // mapUnit(col / size, row / size), throws InvalidGridSizeError for size <= 0
  Point3 mapGridCell(int size, double row, double col) const;
  Point3 mapGridCell(const GridSpec& spec) const;

  // Center of the cell with 0-based integer indices, throws std::out_of_range outside [0, size)
  Point3 cellCenter(int size, int row, int col) const;

  // Homogeneous matrix taking reference (u, v, 0, 1) to mapUnit(u, v).
  // The third column is the unit normal so the matrix is invertible.
  glm::dmat4 transform() const;

  // Inverse of mapUnit. Points off the plane are projected orthogonally first.
  Point<2> toUnit(const Point3& p) const;

  // Closest point on the plane
  Point3 project(const Point3& p) const;

  // Cell containing the projection of p, nullopt if it falls outside the square
  std::optional<GridIndex> locateCell(int size, const Point3& p) const;
};
}
