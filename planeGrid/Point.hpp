#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <string>

namespace planeGrid
{
// Coordinates of a point or a displacement in dim-dimensional space.
// Plain aggregate, so Point<3> { x, y, z } works.
template<size_t dim>
class Point : public std::array<double, dim>
{
 public:
  std::string toString() const
  {
    std::string result = "(";
    for (size_t i = 0; i < dim; ++i)
    {
      if (i > 0)
        result += ", ";
      result += std::to_string((*this)[i]);
    }
    return result + ")";
  }

  // dot product
  double operator*(const Point<dim>& other) const
  {
    return std::inner_product(this->begin(), this->end(), other.begin(), 0.0);
  }

  double len() const { return std::sqrt((*this) * (*this)); }

  // Unit vector in the same direction, used for plane normals
  Point<dim> normalized() const
  {
    double length = len();
    if (length == 0)
    {
      throw std::runtime_error("Cannot normalize a zero-length vector");
    }
    Point<dim> result {};
    std::transform(this->begin(), this->end(), result.begin(), [length](double c) { return c / length; });
    return result;
  }
};

namespace detail
{
template<size_t dim, typename Op>
Point<dim> componentwise(const Point<dim>& a, const Point<dim>& b, Op op)
{
  Point<dim> result {};
  std::transform(a.begin(), a.end(), b.begin(), result.begin(), op);
  return result;
}
}

template<size_t dim>
Point<dim> operator+(const Point<dim>& a, const Point<dim>& b)
{
  return detail::componentwise(a, b, std::plus<double>());
}

template<size_t dim>
Point<dim> operator-(const Point<dim>& a, const Point<dim>& b)
{
  return detail::componentwise(a, b, std::minus<double>());
}

template<size_t dim>
Point<dim> operator*(double scalar, const Point<dim>& a)
{
  Point<dim> result {};
  std::transform(a.begin(), a.end(), result.begin(), [scalar](double c) { return scalar * c; });
  return result;
}

template<size_t dim>
Point<dim> operator*(const Point<dim>& a, double scalar)
{
  return scalar * a;
}

// cross product, 3D only
Point<3> operator%(const Point<3>& a, const Point<3>& b);

template<size_t dim>
using Vector = Point<dim>;

using Point3 = Point<3>;
}
