//! # Fake Module Images
//!
//! Export tables and entry points that stand in for compiled modules when
//! running on `FakeNativeBinding`.
//!
//! | Image        | Table id | Exports                               | Initializer |
//! |--------------|----------|---------------------------------------|-------------|
//! | math         | "math"   | Add (callable), Pi (data), Scale      | math.init   |
//! | broken       | "broken" | First, Second (missing), Third        | none        |
//! | anonymous    | ""       | Value (data)                          | none        |

#pragma once

#include "fake_native.hpp"

#include "modload/abi.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace modload::test {

// ============================================================================
// math
// ============================================================================

inline std::atomic<int> math_init_calls{0};

/// Milliseconds math.init sleeps, to hold other openers in Pending.
inline std::atomic<int> math_init_delay_ms{0};

inline int32_t math_add(int32_t a, int32_t b) {
    return a + b;
}

inline double math_scale(double x) {
    return x * 2.0;
}

inline double math_pi = 3.141592653589793;

inline void math_init() {
    if (int delay = math_init_delay_ms.load(); delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    math_init_calls.fetch_add(1);
}

inline const ModloadExport MATH_EXPORTS[] = {
    {"math.Add", MODLOAD_EXPORT_CALLABLE, "fn(I32, I32) -> I32"},
    {"math.Pi", MODLOAD_EXPORT_DATA, "F64"},
    {"math.Scale", MODLOAD_EXPORT_CALLABLE, "fn(F64) -> F64"},
};

inline const ModloadExportTable MATH_TABLE = {MODLOAD_ABI_VERSION, "math", 3, MATH_EXPORTS};

inline const ModloadExportTable* math_exports() {
    return &MATH_TABLE;
}

/// Installs the full math image.
inline void install_math(FakeImage& image) {
    image.symbols[MODLOAD_EXPORT_TABLE_SYMBOL] = fn_address(&math_exports);
    image.symbols["math.init"] = fn_address(&math_init);
    image.symbols["math.Add"] = fn_address(&math_add);
    image.symbols["math.Pi"] = &math_pi;
    image.symbols["math.Scale"] = fn_address(&math_scale);
}

// ============================================================================
// broken: declares three exports, the image only has two
// ============================================================================

inline int32_t broken_first() {
    return 1;
}

inline int32_t broken_third() {
    return 3;
}

inline const ModloadExport BROKEN_EXPORTS[] = {
    {"broken.First", MODLOAD_EXPORT_CALLABLE, "fn() -> I32"},
    {"broken.Second", MODLOAD_EXPORT_CALLABLE, "fn() -> I32"},
    {"broken.Third", MODLOAD_EXPORT_CALLABLE, "fn() -> I32"},
};

inline const ModloadExportTable BROKEN_TABLE = {MODLOAD_ABI_VERSION, "broken", 3, BROKEN_EXPORTS};

inline const ModloadExportTable* broken_exports() {
    return &BROKEN_TABLE;
}

inline void install_broken(FakeImage& image) {
    image.symbols[MODLOAD_EXPORT_TABLE_SYMBOL] = fn_address(&broken_exports);
    image.symbols["broken.First"] = fn_address(&broken_first);
    image.symbols["broken.Third"] = fn_address(&broken_third);
}

// ============================================================================
// anonymous: no module id in the table
// ============================================================================

inline int64_t anonymous_value = 42;

inline const ModloadExport ANONYMOUS_EXPORTS[] = {
    {"Value", MODLOAD_EXPORT_DATA, "I64"},
};

inline const ModloadExportTable ANONYMOUS_TABLE = {MODLOAD_ABI_VERSION, nullptr, 1,
                                                   ANONYMOUS_EXPORTS};

inline const ModloadExportTable* anonymous_exports() {
    return &ANONYMOUS_TABLE;
}

inline void install_anonymous(FakeImage& image) {
    image.symbols[MODLOAD_EXPORT_TABLE_SYMBOL] = fn_address(&anonymous_exports);
    image.symbols["Value"] = &anonymous_value;
}

} // namespace modload::test
