#include "PlaneMapper.hpp"

#include "Errors.hpp"
#include "Logger.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

using namespace planeGrid;

static glm::dvec3 toGlm(const Point3& p)
{
  return glm::dvec3(p[0], p[1], p[2]);
}

Point3 PlaneMapper::mapUnit(double u, double v) const
{
  return m_frame.origin() + u * m_frame.colBasis() + v * m_frame.rowBasis();
}

Point3 PlaneMapper::mapGridCell(int size, double row, double col) const
{
  // columns run along colBasis, rows along rowBasis
  return mapGridCell(GridSpec { size, row, col });
}

Point3 PlaneMapper::mapGridCell(const GridSpec& spec) const
{
  spec.validate();
  double n = static_cast<double>(spec.size);
  return mapUnit(spec.col / n, spec.row / n);
}

Point3 PlaneMapper::cellCenter(int size, int row, int col) const
{
  checkGridSize(size);
  if (row < 0 || row >= size || col < 0 || col >= size)
  {
    PLANEGRID_ERROR("Cell (" << row << ", " << col << ") is outside a grid of size " << size);
    throw std::out_of_range("Cell (" + std::to_string(row) + ", " + std::to_string(col) + ") is outside a grid of size "
                            + std::to_string(size));
  }
  return mapGridCell(size, row + 0.5, col + 0.5);
}

glm::dmat4 PlaneMapper::transform() const
{
  glm::dmat4 M(1.0);
  M[0] = glm::dvec4(toGlm(m_frame.colBasis()), 0.0);
  M[1] = glm::dvec4(toGlm(m_frame.rowBasis()), 0.0);
  M[2] = glm::dvec4(toGlm(m_frame.normal().normalized()), 0.0);
  M[3] = glm::dvec4(toGlm(m_frame.origin()), 1.0);
  return M;
}

Point<2> PlaneMapper::toUnit(const Point3& p) const
{
  Vector<3> c = m_frame.colBasis();
  Vector<3> r = m_frame.rowBasis();
  Vector<3> w = p - m_frame.origin();

  // least squares solve of [c r] * (u, v)^T = w
  Eigen::Matrix<double, 3, 2> A;
  A << c[0], r[0],
       c[1], r[1],
       c[2], r[2];
  Eigen::Vector3d b(w[0], w[1], w[2]);

  Eigen::Vector2d uv = A.colPivHouseholderQr().solve(b);
  return Point<2> { uv[0], uv[1] };
}

Point3 PlaneMapper::project(const Point3& p) const
{
  Point<2> uv = toUnit(p);
  return mapUnit(uv[0], uv[1]);
}

std::optional<GridIndex> PlaneMapper::locateCell(int size, const Point3& p) const
{
  checkGridSize(size);
  Point<2> uv = toUnit(p);

  for (double t : uv)
  {
    // also rejects NaN
    if (!(t >= -BOUNDARY_EPS && t <= 1.0 + BOUNDARY_EPS))
    {
      return std::nullopt;
    }
  }

  // the far boundary belongs to the last cell; clamp in double, t * size may exceed INT_MAX
  auto toIndex = [size](double t)
  { return static_cast<int>(std::clamp(std::floor(t * size), 0.0, size - 1.0)); };

  return GridIndex { toIndex(uv[1]), toIndex(uv[0]) };
}
