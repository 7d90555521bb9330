#ifndef CADSTRING_CORE_UTIL_H
#define CADSTRING_CORE_UTIL_H

// Millisecond clock used to time live drag updates (DragStats).
// Browser builds use the Emscripten high-resolution timer.

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds and tests
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

#endif // CADSTRING_CORE_UTIL_H
