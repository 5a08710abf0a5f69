/**
 * @file measurement.hpp
 * @brief Measured reflectance tables and the mirror they describe.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include <Eigen/Dense>

#include "rowlandoptics/core/types.hpp"
#include "rowlandoptics/surfaces/materials.hpp"

namespace rowlandoptics::coatings {

/**
 * @brief Reflectance measured at a single angle of incidence.
 *
 * `reflectance` is a fraction (not percent), one value per wavelength.
 */
struct ReflectanceMeasurement {
  Eigen::ArrayXd wavelength_nm{};
  Eigen::ArrayXd reflectance{};
  double incidence_rad{};
};

/**
 * @brief Loaded measurement and status.
 */
struct MeasurementResult {
  ReflectanceMeasurement measurement{};
  rowlandoptics::core::Status status{rowlandoptics::core::Status::Ok};
};

/**
 * @brief Check a measurement for use as fit or interpolation input.
 *
 * Empty, mismatched or non-finite data is an `InputError`.
 */
[[nodiscard]] rowlandoptics::core::Status validate_measurement(const ReflectanceMeasurement& measurement);

/**
 * @brief Read a two-column reflectance table.
 *
 * The first line is a header. Each following non-blank line holds wavelength
 * [nm] and reflectance [%], separated by whitespace or a comma.
 */
[[nodiscard]] MeasurementResult load_reflectance_table(const std::filesystem::path& path, double incidence_rad);

/**
 * @brief Mirror whose reflectance is interpolated from a measurement.
 *
 * Values outside the measured band are clamped to the nearest end point.
 * The angle of incidence of the query is ignored.
 */
class MeasuredMirror final : public rowlandoptics::surfaces::IMaterial {
 public:
  struct Config {
    std::string name{"measured mirror"};
    ReflectanceMeasurement measurement{};
  };

  static rowlandoptics::core::BuildResult<MeasuredMirror> Create(const Config& config);

  [[nodiscard]] std::string name() const override { return config_.name; }
  [[nodiscard]] Eigen::ArrayXd efficiency(const rowlandoptics::surfaces::IncidentRays& rays,
                                          const rowlandoptics::core::Vec3& normal) const override;

  [[nodiscard]] const ReflectanceMeasurement& measurement() const { return config_.measurement; }

 private:
  explicit MeasuredMirror(Config config) : config_(std::move(config)) {}

  Config config_{};
};

}  // namespace rowlandoptics::coatings
