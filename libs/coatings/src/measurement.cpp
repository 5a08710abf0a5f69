/**
 * @file measurement.cpp
 * @brief Reflectance table parsing and interpolation.
 * @author Watosn
 */

#include "rowlandoptics/coatings/measurement.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace rowlandoptics::coatings {
namespace {

constexpr double kPercent = 100.0;

bool blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool parse_row(std::string line, double& wavelength_nm, double& reflectance_pct) {
  std::replace(line.begin(), line.end(), ',', ' ');
  std::istringstream ss(line);
  if (!(ss >> wavelength_nm >> reflectance_pct)) {
    return false;
  }
  std::string rest;
  if (ss >> rest) {
    return false;
  }
  return std::isfinite(wavelength_nm) && std::isfinite(reflectance_pct);
}

}  // namespace

core::Status validate_measurement(const ReflectanceMeasurement& measurement) {
  if (measurement.wavelength_nm.size() == 0 || measurement.wavelength_nm.size() != measurement.reflectance.size()) {
    return core::Status::InputError;
  }
  if (!measurement.wavelength_nm.allFinite() || !measurement.reflectance.allFinite()
      || !std::isfinite(measurement.incidence_rad)) {
    return core::Status::InputError;
  }
  if ((measurement.wavelength_nm <= 0.0).any()) {
    return core::Status::InputError;
  }
  return core::Status::Ok;
}

MeasurementResult load_reflectance_table(const std::filesystem::path& path, double incidence_rad) {
  std::ifstream in(path);
  if (!in) {
    return MeasurementResult{.status = core::Status::DataUnavailable};
  }

  std::vector<double> wavelength;
  std::vector<double> reflectance;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    if (!header_consumed) {
      header_consumed = true;
      continue;
    }
    if (blank(line)) {
      continue;
    }
    double w = 0.0;
    double r = 0.0;
    if (!parse_row(line, w, r)) {
      return MeasurementResult{.status = core::Status::InputError};
    }
    wavelength.push_back(w);
    reflectance.push_back(r / kPercent);
  }

  MeasurementResult out{};
  out.measurement.wavelength_nm = Eigen::Map<const Eigen::ArrayXd>(wavelength.data(), static_cast<Eigen::Index>(wavelength.size()));
  out.measurement.reflectance = Eigen::Map<const Eigen::ArrayXd>(reflectance.data(), static_cast<Eigen::Index>(reflectance.size()));
  out.measurement.incidence_rad = incidence_rad;
  out.status = validate_measurement(out.measurement);
  return out;
}

core::BuildResult<MeasuredMirror> MeasuredMirror::Create(const Config& config) {
  if (const auto s = validate_measurement(config.measurement); s != core::Status::Ok) {
    return {.status = s};
  }

  // Interpolation needs ascending wavelengths.
  const auto& m = config.measurement;
  std::vector<Eigen::Index> order(static_cast<std::size_t>(m.wavelength_nm.size()));
  std::iota(order.begin(), order.end(), Eigen::Index{0});
  std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
    return m.wavelength_nm[a] < m.wavelength_nm[b];
  });

  Config sorted = config;
  for (std::size_t i = 0; i < order.size(); ++i) {
    const auto k = static_cast<Eigen::Index>(i);
    sorted.measurement.wavelength_nm[k] = m.wavelength_nm[order[i]];
    sorted.measurement.reflectance[k] = m.reflectance[order[i]];
  }
  return {.value = std::unique_ptr<MeasuredMirror>(new MeasuredMirror(std::move(sorted)))};
}

Eigen::ArrayXd MeasuredMirror::efficiency(const surfaces::IncidentRays& rays, const core::Vec3& /*normal*/) const {
  const auto& w = config_.measurement.wavelength_nm;
  const auto& r = config_.measurement.reflectance;
  const auto n = w.size();
  Eigen::ArrayXd out(rays.wavelength_nm.size());
  for (Eigen::Index i = 0; i < rays.wavelength_nm.size(); ++i) {
    const double x = rays.wavelength_nm[i];
    if (x <= w[0]) {
      out[i] = r[0];
      continue;
    }
    if (x >= w[n - 1]) {
      out[i] = r[n - 1];
      continue;
    }
    const auto* hi = std::upper_bound(w.data(), w.data() + n, x);
    const auto k = static_cast<Eigen::Index>(hi - w.data());
    const double t = (x - w[k - 1]) / (w[k] - w[k - 1]);
    out[i] = r[k - 1] + t * (r[k] - r[k - 1]);
  }
  return out;
}

}  // namespace rowlandoptics::coatings
