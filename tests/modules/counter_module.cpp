// Test module "counter": counts its initializer runs and Bump calls.

#include "modload/abi.h"

#include <cstdint>

namespace {
int32_t init_runs = 0;
int32_t bumps = 0;
} // namespace

extern "C" {

MODLOAD_API void counter_init(void) MODLOAD_SYMBOL_NAME("counter.init");
MODLOAD_API int32_t counter_init_runs(void) MODLOAD_SYMBOL_NAME("counter.InitRuns");
MODLOAD_API void counter_bump(void) MODLOAD_SYMBOL_NAME("counter.Bump");
MODLOAD_API int32_t counter_value(void) MODLOAD_SYMBOL_NAME("counter.Value");

void counter_init(void) {
    ++init_runs;
}

int32_t counter_init_runs(void) {
    return init_runs;
}

void counter_bump(void) {
    ++bumps;
}

int32_t counter_value(void) {
    return bumps;
}

static const ModloadExport COUNTER_EXPORTS[] = {
    {"counter.InitRuns", MODLOAD_EXPORT_CALLABLE, "fn() -> I32"},
    {"counter.Bump", MODLOAD_EXPORT_CALLABLE, "fn()"},
    {"counter.Value", MODLOAD_EXPORT_CALLABLE, "fn() -> I32"},
};

static const ModloadExportTable COUNTER_TABLE = {MODLOAD_ABI_VERSION, "counter", 3,
                                                 COUNTER_EXPORTS};

MODLOAD_API const ModloadExportTable* modload_module_exports(void) {
    return &COUNTER_TABLE;
}

} // extern "C"
