/*
 * Module ABI: the C interface between a loadable module and modload.
 *
 * A loadable module exports:
 *   - modload_module_exports()  → returns the module's export table
 *   - <module_id>.init          → optional, called once before publication
 *   - every symbol named in the export table
 *
 * Export names are qualified with the module identifier ("math.Add"). The
 * loader strips that prefix when it builds the symbol directory, so callers
 * look up "Add". Dotted names are not valid C identifiers; producers give
 * them to the assembler with MODLOAD_SYMBOL_NAME.
 *
 * The ABI uses only C types. The module owns every pointer it returns and
 * must keep the table alive for the lifetime of the process.
 */

#ifndef MODLOAD_ABI_H
#define MODLOAD_ABI_H

#include <stdint.h>

/* ===== Export macros ===== */

#ifdef _WIN32
#define MODLOAD_API __declspec(dllexport)
#else
#define MODLOAD_API __attribute__((visibility("default")))
#endif

/* Assembler-level symbol name for a declaration (GCC / Clang, ELF):
 *
 *   extern "C" MODLOAD_API int32_t math_add(int32_t, int32_t)
 *       MODLOAD_SYMBOL_NAME("math.Add");
 */
#if defined(__GNUC__) || defined(__clang__)
#define MODLOAD_SYMBOL_NAME(name) __asm__(name)
#else
#define MODLOAD_SYMBOL_NAME(name)
#endif

/* ===== ABI version ===== */

#define MODLOAD_ABI_VERSION 1

/* Name of the export-table entry point every module must provide. */
#define MODLOAD_EXPORT_TABLE_SYMBOL "modload_module_exports"

/* Suffix appended to the module identifier to name the initializer. */
#define MODLOAD_INIT_SUFFIX ".init"

/* ===== Export table ===== */

typedef enum ModloadExportKind {
    MODLOAD_EXPORT_DATA = 0,    /* address of a variable */
    MODLOAD_EXPORT_CALLABLE = 1 /* entry point of a function */
} ModloadExportKind;

typedef struct ModloadExport {
    const char* name;            /* qualified name, e.g. "math.Add"        */
    uint32_t kind;               /* ModloadExportKind                      */
    const char* type_descriptor; /* producer-defined, e.g. "fn(I32) -> I32" */
} ModloadExport;

typedef struct ModloadExportTable {
    uint32_t abi_version;         /* Must equal MODLOAD_ABI_VERSION          */
    const char* module_id;        /* e.g. "math"; NULL = derive from file    */
    uint32_t count;               /* number of entries in `exports`          */
    const ModloadExport* exports; /* ordered export declarations             */
} ModloadExportTable;

/* Function pointer typedefs for dynamic loading */
typedef const ModloadExportTable* (*ModloadExportsFn)(void);
typedef void (*ModloadInitFn)(void);

#endif /* MODLOAD_ABI_H */
