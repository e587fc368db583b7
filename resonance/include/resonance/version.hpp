#pragma once

#define RESONANCE_VERSION "1.3.0"

namespace resonance {
namespace version {

inline const char* string() {
    return RESONANCE_VERSION;
}

} // namespace version
} // namespace resonance
