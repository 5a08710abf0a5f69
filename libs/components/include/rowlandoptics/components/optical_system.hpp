/**
 * @file optical_system.hpp
 * @brief Ordered assembly of instrument components.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "rowlandoptics/components/component.hpp"

namespace rowlandoptics::components {

/**
 * @brief Owns components in light-path order and exports their surfaces.
 */
class OpticalSystem final {
 public:
  /**
   * @brief Append one component; null components are ignored.
   */
  void add(std::unique_ptr<Component> component);
  /**
   * @brief Surfaces of all components, in insertion order.
   */
  [[nodiscard]] std::vector<rowlandoptics::surfaces::Surface> surfaces() const;

  [[nodiscard]] std::size_t size() const { return components_.size(); }
  [[nodiscard]] const Component& at(std::size_t index) const { return *components_.at(index); }

 private:
  std::vector<std::unique_ptr<Component>> components_{};
};

}  // namespace rowlandoptics::components
