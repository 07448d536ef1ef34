#pragma once
#include "Point.hpp"

#include <glm/glm.hpp>

namespace planeGrid
{
// Three corners of a square sampled in 3D space. The reference points
// (0,0,0), (1,0,0) and (0,1,0) map to origin, colCorner and rowCorner.
// Throws DegenerateFrameError if |colBasis x rowBasis| <= epsilon * |colBasis| * |rowBasis|,
// i.e. epsilon bounds the sine of the angle between the bases, independent of scale.
class CornerFrame
{
 public:
  static constexpr double DEFAULT_EPSILON = 1e-12;

 private:
  Point3 m_origin;
  Point3 m_colCorner;
  Point3 m_rowCorner;
  double m_epsilon;

 public:
  CornerFrame(const Point3& origin, const Point3& colCorner, const Point3& rowCorner, double epsilon = DEFAULT_EPSILON);

  // Build a frame from a plane-local -> world transform, local coordinates are (u, v, 0)
  static CornerFrame fromTransform(const glm::dmat4& planeToWorld, double epsilon = DEFAULT_EPSILON);

  const Point3& origin() const { return m_origin; }
  const Point3& colCorner() const { return m_colCorner; }
  const Point3& rowCorner() const { return m_rowCorner; }
  double tolerance() const { return m_epsilon; }

  // Derived on every call so they can never go stale
  Vector<3> colBasis() const { return m_colCorner - m_origin; }
  Vector<3> rowBasis() const { return m_rowCorner - m_origin; }

  // Unnormalized normal, colBasis x rowBasis
  Vector<3> normal() const { return colBasis() % rowBasis(); }

  // Area of the parallelogram spanned by the corners
  double area() const { return normal().len(); }

  std::string toString() const;
};
}
