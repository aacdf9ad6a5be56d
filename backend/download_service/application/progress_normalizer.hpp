#pragma once
#include <optional>
#include <string_view>
#include "domain/download.hpp"
#include "domain/media.hpp"

namespace download_service {

// Maps the engine's raw progress reports onto ProgressEvent. Pure; malformed
// numbers never throw, they fall through to the next way of computing a
// percentage.
class ProgressNormalizer {
public:
  static ProgressEvent normalize(const RawProgress& raw);

  // "42.5%", " 42.5 %" or a colourised terminal string; nullopt unless the
  // remainder is a finite number.
  static std::optional<double> parsePercent(std::string_view text);

  static std::optional<double> resolvePercent(const RawProgress& raw);
};

}
