/**
 * @file coating_fit_cli.cpp
 * @brief Fit the feed-optic coating model to a measured witness table.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "rowlandoptics/coatings/feed_optic_coating.hpp"
#include "rowlandoptics/core/constants.hpp"

int main(int argc, char** argv) {
  if (argc > 3) {
    spdlog::error("usage: coating_fit_cli [witness_table] [incidence_deg]");
    spdlog::error("table: header row, then <wavelength_nm> <reflectance_pct> per line");
    return 1;
  }

  std::filesystem::path table{};
  if (argc >= 2) {
    table = argv[1];
  } else if (const char* env = std::getenv("ROWLANDOPTICS_WITNESS_FILE"); env != nullptr && *env != '\0') {
    table = env;
  } else {
    spdlog::error("no witness table given and ROWLANDOPTICS_WITNESS_FILE is not set");
    return 1;
  }
  const double incidence_deg = (argc >= 3) ? std::atof(argv[2]) : 15.0;
  const double incidence_rad = incidence_deg * rowlandoptics::core::constants::kDegToRad;

  spdlog::info("fitting feed optic coating to {} at {} deg", table.string(), incidence_deg);
  const auto fit = rowlandoptics::coatings::coating_witness_fit(table, incidence_rad);
  if (fit.status != rowlandoptics::core::Status::Ok) {
    spdlog::error("coating fit failed: {} (optimizer code {})", rowlandoptics::core::to_string(fit.status),
                  fit.optimizer_code);
    return 2;
  }
  spdlog::info("converged after {} iterations, {} evaluations (code {})", fit.iterations, fit.function_evaluations,
               fit.optimizer_code);

  const auto& config = fit.coating->config();
  for (const auto& layer : config.layers) {
    fmt::print("layer {:<6} thickness_nm={:.3f} interface_width_nm={:.3f}\n", layer.chemical, layer.thickness_nm,
               layer.interface_width_nm);
  }
  fmt::print("substrate {} interface_width_nm={:.3f}\n", config.substrate.chemical,
             config.substrate.interface_width_nm);
  fmt::print("rms_initial={:.6g} rms_final={:.6g}\n", fit.rms_initial, fit.rms_final);
  return 0;
}
