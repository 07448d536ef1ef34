#include "CornerFrame.hpp"

#include "Errors.hpp"
#include "Logger.hpp"

#include <cmath>

using namespace planeGrid;

CornerFrame::CornerFrame(const Point3& origin, const Point3& colCorner, const Point3& rowCorner, double epsilon)
  : m_origin(origin)
  , m_colCorner(colCorner)
  , m_rowCorner(rowCorner)
  , m_epsilon(epsilon)
{
  if (!std::isfinite(epsilon) || epsilon < 0.0)
  {
    PLANEGRID_ERROR("Invalid degeneracy tolerance " << epsilon);
    throw std::invalid_argument("Degeneracy tolerance must be finite and non-negative");
  }

  // |c x r| = |c| |r| sin(angle), so this bounds the angle and does not depend on scale
  double spanned = area();
  double bound = epsilon * colBasis().len() * rowBasis().len();
  // NaN corners compare false here and are passed through
  if (spanned <= bound)
  {
    PLANEGRID_ERROR("Degenerate corner frame " << toString() << ", |colBasis x rowBasis| = " << spanned
                                               << ", bound " << bound);
    throw DegenerateFrameError("Corner points are collinear: " + toString());
  }
}

CornerFrame CornerFrame::fromTransform(const glm::dmat4& planeToWorld, double epsilon)
{
  glm::dvec3 o = glm::dvec3(planeToWorld * glm::dvec4(0.0, 0.0, 0.0, 1.0));
  glm::dvec3 c = glm::dvec3(planeToWorld * glm::dvec4(1.0, 0.0, 0.0, 1.0));
  glm::dvec3 r = glm::dvec3(planeToWorld * glm::dvec4(0.0, 1.0, 0.0, 1.0));

  return CornerFrame(Point3 { o.x, o.y, o.z }, Point3 { c.x, c.y, c.z }, Point3 { r.x, r.y, r.z }, epsilon);
}

std::string CornerFrame::toString() const
{
  return "{origin: " + m_origin.toString() + ", col: " + m_colCorner.toString() + ", row: " + m_rowCorner.toString() + "}";
}
