// declref/model/handles.hpp - Stable handles into the API model
//
// Declarations and modules are addressed by small value handles instead of
// pointers, so they can be copied freely and used as keys by later stages.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace declref
{

// ============================================================================
// DeclId - Handle of a declaration node in a DeclarationGraph
// ============================================================================

class DeclId
{
public:
  /// Invalid/unknown handle sentinel
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  /// Create an invalid handle
  constexpr DeclId() noexcept : value_(k_invalid_value) {}

  /// Create a handle from an arena index
  constexpr explicit DeclId(uint32_t value) noexcept : value_(value) {}

  [[nodiscard]] static constexpr DeclId invalid() noexcept { return DeclId(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != k_invalid_value; }

  /// Arena index
  [[nodiscard]] constexpr uint32_t value() const noexcept { return value_; }

  [[nodiscard]] constexpr bool operator==(DeclId other) const noexcept
  {
    return value_ == other.value_;
  }
  [[nodiscard]] constexpr bool operator!=(DeclId other) const noexcept
  {
    return value_ != other.value_;
  }
  [[nodiscard]] constexpr bool operator<(DeclId other) const noexcept
  {
    return value_ < other.value_;
  }

private:
  uint32_t value_;
};

// ============================================================================
// ModuleId - Handle of a module in a SymbolTable
// ============================================================================

class ModuleId
{
public:
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  constexpr ModuleId() noexcept : value_(k_invalid_value) {}
  constexpr explicit ModuleId(uint32_t value) noexcept : value_(value) {}

  [[nodiscard]] static constexpr ModuleId invalid() noexcept { return ModuleId(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != k_invalid_value; }
  [[nodiscard]] constexpr uint32_t value() const noexcept { return value_; }

  [[nodiscard]] constexpr bool operator==(ModuleId other) const noexcept
  {
    return value_ == other.value_;
  }
  [[nodiscard]] constexpr bool operator!=(ModuleId other) const noexcept
  {
    return value_ != other.value_;
  }

private:
  uint32_t value_;
};

}  // namespace declref

namespace std
{

template <>
struct hash<declref::DeclId>
{
  size_t operator()(declref::DeclId id) const noexcept { return hash<uint32_t>{}(id.value()); }
};

template <>
struct hash<declref::ModuleId>
{
  size_t operator()(declref::ModuleId id) const noexcept { return hash<uint32_t>{}(id.value()); }
};

}  // namespace std
