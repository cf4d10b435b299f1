/**
 * VitaFetch - Async utilities
 * Redelivery onto the UI thread
 */

#pragma once

#include <functional>
#include <borealis.hpp>

namespace vitafetch {

/**
 * Schedules a closure on some execution context. Image tasks use it to
 * deliver their completion where views may be touched.
 */
using Dispatcher = std::function<void(std::function<void()>)>;

/**
 * Run a closure on the borealis UI thread (next frame).
 */
inline void syncOnMain(std::function<void()> work) {
    brls::sync([work]() {
        work();
    });
}

/**
 * Run a closure immediately on the calling thread.
 * For engines that already finish on the UI thread.
 */
inline void runInline(std::function<void()> work) {
    work();
}

} // namespace vitafetch
