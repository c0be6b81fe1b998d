#pragma once

#include <cstddef>
#include <cstdint>

namespace scenesync::core::config {

// Surface size when the caller gives none.
inline constexpr double kDefaultSurfaceWidth = 300.0;
inline constexpr double kDefaultSurfaceHeight = 150.0;

// Values assumed when a property is absent.
inline constexpr double kDefaultOpacity = 1.0;
inline constexpr double kDefaultScale = 1.0;

// click, mousemove, mouseover, mouseout, mouseup, mousedown
inline constexpr std::size_t kEventKindCount = 6;

inline constexpr std::size_t kMaxRetainedDiagnostics = 4096;

}  // namespace scenesync::core::config
