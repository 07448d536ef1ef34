#include "Point.hpp"

namespace planeGrid
{
// cross product for 3D points
Point<3> operator%(const Point<3>& a, const Point<3>& b)
{
  return Point<3> {
    a[1] * b[2] - a[2] * b[1],
    a[2] * b[0] - a[0] * b[2],
    a[0] * b[1] - a[1] * b[0]
  };
}
}
