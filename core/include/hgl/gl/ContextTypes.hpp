#pragma once
#include <cstdint>

namespace hgl {

class OsMesaContext;

struct GlVersion {
  std::uint8_t major{3};
  std::uint8_t minor{3};
};

enum class GlProfile {
  Unspecified,
  Core,
  Compatibility
};

enum class Robustness {
  NotRobust,
  NoError,
  RobustNoResetNotification,
  RobustLoseContextOnReset,
  TryRobustNoResetNotification,
  TryRobustLoseContextOnReset
};

struct PhysicalSize {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

// Capability preferences negotiated at context creation.
struct ContextAttribs {
  GlProfile profile{GlProfile::Unspecified};
  Robustness robustness{Robustness::NotRobust};
  const OsMesaContext* sharing{nullptr};  // OSMesa cannot share; non-null aborts
};

} // namespace hgl
