/**
 * @file apertures.cpp
 * @brief Aperture containment and area.
 * @author Watosn
 */

#include "rowlandoptics/surfaces/apertures.hpp"

#include <cmath>

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::surfaces {
namespace {

struct ContainsVisitor {
  double x{};
  double y{};

  bool operator()(const CircularAperture& a) const {
    const double dx = x - a.offset.x;
    const double dy = y - a.offset.y;
    return dx * dx + dy * dy <= a.radius * a.radius;
  }

  bool operator()(const RectangularAperture& a) const {
    return std::abs(x - a.offset_mm.x) <= a.half_width_mm.x && std::abs(y - a.offset_mm.y) <= a.half_width_mm.y;
  }
};

struct AreaVisitor {
  double operator()(const CircularAperture& a) const { return core::constants::kPi * a.radius * a.radius; }
  double operator()(const RectangularAperture& a) const { return 4.0 * a.half_width_mm.x * a.half_width_mm.y; }
};

}  // namespace

bool aperture_contains(const Aperture& aperture, double x, double y) {
  return std::visit(ContainsVisitor{.x = x, .y = y}, aperture);
}

double aperture_area(const Aperture& aperture) { return std::visit(AreaVisitor{}, aperture); }

}  // namespace rowlandoptics::surfaces
