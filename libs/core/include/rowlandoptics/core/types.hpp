/**
 * @file types.hpp
 * @brief Core value types for rowlandoptics.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <memory>

namespace rowlandoptics::core {

/**
 * @brief Standard status code used by factories and model outputs.
 *
 * `RangeError` flags a physically invalid parameter, `InputError` malformed or
 * empty input data, `OptimizationError` a fit that did not converge.
 */
enum class Status : std::uint8_t { Ok, RangeError, InputError, OptimizationError, DataUnavailable };

inline const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::RangeError:
      return "range error";
    case Status::InputError:
      return "input error";
    case Status::OptimizationError:
      return "optimization error";
    case Status::DataUnavailable:
      return "data unavailable";
  }
  return "unknown";
}

/**
 * @brief Cartesian 2-vector (aperture half-widths, pixel pitch, offsets).
 */
struct Vec2 {
  double x{};
  double y{};

  friend bool operator==(const Vec2&, const Vec2&) = default;
};

/**
 * @brief Cartesian 3-vector.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};

  friend bool operator==(const Vec3&, const Vec3&) = default;
};

inline Vec2 operator*(double s, const Vec2& v) { return Vec2{s * v.x, s * v.y}; }
inline Vec2 operator/(const Vec2& v, double s) { return Vec2{v.x / s, v.y / s}; }

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }

inline bool is_finite(const Vec2& v) { return std::isfinite(v.x) && std::isfinite(v.y); }
inline bool is_finite(const Vec3& v) { return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z); }

/**
 * @brief True when `value` is finite and not negative.
 */
inline bool is_non_negative(double value) { return std::isfinite(value) && value >= 0.0; }

/**
 * @brief Owned object paired with the status of the factory that built it.
 *
 * `value` is null whenever `status != Status::Ok`.
 */
template <typename T>
struct BuildResult {
  std::unique_ptr<T> value{};
  Status status{Status::Ok};
};

}  // namespace rowlandoptics::core
