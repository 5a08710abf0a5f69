/**
 * @file surface.cpp
 * @brief Surface descriptor helpers.
 * @author Watosn
 */

#include "rowlandoptics/surfaces/surface.hpp"

#include <variant>

#include <fmt/format.h>

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::surfaces {
namespace {

std::string describe_sag(const Sag& sag) {
  if (std::holds_alternative<CylindricalSag>(sag)) {
    return fmt::format("cylindrical(r={:.6g} mm)", sag_radius_mm(sag));
  }
  return fmt::format("spherical(r={:.6g} mm)", sag_radius_mm(sag));
}

std::string describe_aperture(const Aperture& aperture) {
  if (const auto* c = std::get_if<CircularAperture>(&aperture)) {
    return fmt::format("circular(r={:.9g})", c->radius);
  }
  const auto& r = std::get<RectangularAperture>(aperture);
  return fmt::format("rectangular({:.6g} x {:.6g} mm, offset {:.6g},{:.6g})",
                     2.0 * r.half_width_mm.x,
                     2.0 * r.half_width_mm.y,
                     r.offset_mm.x,
                     r.offset_mm.y);
}

}  // namespace

core::Vec2 sensor_extent_mm(const SensorGeometry& sensor) {
  return core::Vec2{
      static_cast<double>(sensor.num_pixel[0]) * sensor.width_pixel_um.x * core::constants::kMmPerUm,
      static_cast<double>(sensor.num_pixel[1]) * sensor.width_pixel_um.y * core::constants::kMmPerUm,
  };
}

bool operator==(const Surface& a, const Surface& b) {
  return a.name == b.name && a.sag == b.sag && a.aperture == b.aperture && a.aperture_mechanical == b.aperture_mechanical
         && a.material == b.material && a.rulings == b.rulings && a.sensor == b.sensor
         && a.is_field_stop == b.is_field_stop && a.is_pupil_stop == b.is_pupil_stop
         && core::same_transform(a.transformation, b.transformation);
}

core::Vec3 surface_vertex_mm(const Surface& surface) { return core::apply(surface.transformation, core::Vec3{}); }

std::string describe(const Surface& surface) {
  const auto v = surface_vertex_mm(surface);
  std::string out = fmt::format("{}: vertex=({:.6f}, {:.6f}, {:.6f}) mm", surface.name, v.x, v.y, v.z);
  if (surface.sag) {
    out += " sag=" + describe_sag(*surface.sag);
  }
  if (surface.aperture) {
    out += " aperture=" + describe_aperture(*surface.aperture);
  }
  if (surface.aperture_mechanical) {
    out += " mechanical=" + describe_aperture(*surface.aperture_mechanical);
  }
  if (surface.material) {
    out += " material=" + surface.material->name();
  }
  if (surface.rulings) {
    out += fmt::format(" rulings(d={:.6g} um, m={})", surface.rulings->spacing_um(0.0), surface.rulings->diffraction_order());
  }
  if (surface.sensor) {
    out += fmt::format(" sensor({}x{} px)", surface.sensor->num_pixel[0], surface.sensor->num_pixel[1]);
  }
  if (surface.is_field_stop) {
    out += " [field stop]";
  }
  if (surface.is_pupil_stop) {
    out += " [pupil stop]";
  }
  return out;
}

}  // namespace rowlandoptics::surfaces
