/**
 * @file optical_system.cpp
 * @brief Component assembly.
 * @author Watosn
 */

#include "rowlandoptics/components/optical_system.hpp"

#include <utility>

namespace rowlandoptics::components {

void OpticalSystem::add(std::unique_ptr<Component> component) {
  if (!component) {
    return;
  }
  components_.push_back(std::move(component));
}

std::vector<surfaces::Surface> OpticalSystem::surfaces() const {
  std::vector<surfaces::Surface> out{};
  out.reserve(components_.size());
  for (const auto& component : components_) {
    out.push_back(component->surface());
  }
  return out;
}

}  // namespace rowlandoptics::components
