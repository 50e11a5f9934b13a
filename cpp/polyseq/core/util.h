#ifndef POLYSEQ_CORE_UTIL_H
#define POLYSEQ_CORE_UTIL_H

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

#endif // POLYSEQ_CORE_UTIL_H
