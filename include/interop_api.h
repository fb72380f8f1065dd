#pragma once

#if defined(_WIN32)
    #if defined(CHROMASEQ_EXPORT)
        #define CHROMASEQ_C_API __declspec(dllexport)
    #else
        #define CHROMASEQ_C_API __declspec(dllimport)
    #endif
#else
    #define CHROMASEQ_C_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage; empty until a call on this thread fails
CHROMASEQ_C_API const char* chromaseq_get_last_error();
CHROMASEQ_C_API const char* chromaseq_get_version();

// =============================================================================
//  Color Conversion
// =============================================================================

// "#RRGGBB" (the '#' is optional) -> three channels in [0, 1]
CHROMASEQ_C_API bool chromaseq_hex_to_rgb(const char* hex, double* out_rgb3);

// Caller frees the result with chromaseq_free_string
CHROMASEQ_C_API char* chromaseq_rgb_to_hex(double r, double g, double b);

// =============================================================================
//  Generation & Inversion (default method parameters, additive seed)
// =============================================================================

CHROMASEQ_C_API char* chromaseq_generate_hex(const char* method, int64_t seed, uint32_t index);

typedef struct CInversionResult {
    bool found;
    uint32_t index;     // valid only when found
    double distance;    // closest miss when not found; infinity for an empty range
} CInversionResult;

// Returns false on error; an exhausted search is success with found == false
CHROMASEQ_C_API bool chromaseq_invert_hex(const char* hex, const char* method, int64_t seed,
                                          uint32_t max_search, double tolerance,
                                          CInversionResult* out_result);

// =============================================================================
//  JSON Request Contract
// =============================================================================

// Runs one tool with a JSON params object and returns the JSON response.
// Tool-level failures come back as {"error": ...}; null only for bad arguments.
CHROMASEQ_C_API char* chromaseq_handle_request(const char* tool, const char* params_json);

CHROMASEQ_C_API void chromaseq_free_string(char* str);

#ifdef __cplusplus
}
#endif
