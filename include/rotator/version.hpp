#pragma once

#define ROTATOR_VERSION "0.3.1"

namespace rotator {
namespace version {

inline const char* string() {
    return ROTATOR_VERSION;
}

} // namespace version
} // namespace rotator
