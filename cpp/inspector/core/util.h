#ifndef MODEL_INSPECTOR_UTIL_H
#define MODEL_INSPECTOR_UTIL_H

#include <cstdint>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace inspector {

// Milliseconds from the host's monotonic clock.
inline double hostNowMs() {
    return emscripten_get_now();
}

inline std::int64_t toTimestampMs(double ms) noexcept {
    return static_cast<std::int64_t>(ms);
}

} // namespace inspector

#endif // MODEL_INSPECTOR_UTIL_H
