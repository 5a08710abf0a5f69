/**
 * @file feed_optic_coating.hpp
 * @brief As-designed and witness-sample coatings of the feed optics.
 * @author Watosn
 */
#pragma once

#include <filesystem>

#include "rowlandoptics/coatings/coating_fit.hpp"
#include "rowlandoptics/coatings/measurement.hpp"
#include "rowlandoptics/coatings/multilayer.hpp"

namespace rowlandoptics::coatings {

/**
 * @brief Nominal feed-optic coating: 25 nm MgF2 over 50 nm Al on a 3 mm SiO2 substrate.
 */
[[nodiscard]] rowlandoptics::core::BuildResult<MultilayerMirror> feed_optic_coating_design();

/**
 * @brief Reflectance of the coating witness sample, read from a measurement table.
 */
[[nodiscard]] rowlandoptics::core::BuildResult<MeasuredMirror> coating_witness_measured(
    const std::filesystem::path& table, double incidence_rad);

/**
 * @brief Feed-optic design calibrated against the witness measurement.
 */
[[nodiscard]] CoatingFitResult coating_witness_fit(const std::filesystem::path& table,
                                                   double incidence_rad,
                                                   const CoatingFitConfig& config = {});

}  // namespace rowlandoptics::coatings
