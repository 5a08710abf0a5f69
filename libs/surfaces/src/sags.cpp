/**
 * @file sags.cpp
 * @brief Surface-height profile evaluation.
 * @author Watosn
 */

#include "rowlandoptics/surfaces/sags.hpp"

#include <cmath>
#include <limits>

namespace rowlandoptics::surfaces {
namespace {

// Conic sag with zero conic constant, written in curvature form so that a
// flat surface (infinite radius) needs no special case beyond c = 0.
double spherical_height(double radius_mm, double r2) {
  if (radius_mm == 0.0) {
    return 0.0;
  }
  const double c = 1.0 / radius_mm;
  const double arg = 1.0 - c * c * r2;
  if (arg < 0.0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return c * r2 / (1.0 + std::sqrt(arg));
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

double sag_mm(const Sag& sag, double x_mm, double y_mm) {
  return std::visit(Overloaded{
                        [&](const SphericalSag& s) { return spherical_height(s.radius_mm, x_mm * x_mm + y_mm * y_mm); },
                        [&](const CylindricalSag& s) { return spherical_height(s.radius_mm, x_mm * x_mm); },
                    },
                    sag);
}

double sag_radius_mm(const Sag& sag) {
  return std::visit([](const auto& s) { return s.radius_mm; }, sag);
}

}  // namespace rowlandoptics::surfaces
