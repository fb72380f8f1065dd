#include <interop_api.h>
#include <api/request_handler.hpp>
#include <color/color_space.hpp>
#include <config/engine_config.hpp>
#include <inversion/color_inverter.hpp>
#include <sequence/sequence_generator.hpp>
#include <utils/logger.hpp>
#include <stdexcept>
#include <cstring>
#include <cstdlib>
#include <string>

// Thread-local error storage
thread_local std::string g_last_error;

const char* chromaseq_get_last_error() {
    return g_last_error.c_str();
}

const char* chromaseq_get_version() {
    return "0.1.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
    Chromaseq::Logger::debug(std::string("C API call failed: ") + e.what());
}

static void require(const void* ptr, const char* name) {
    if (!ptr) {
        throw Chromaseq::ChromaseqError(Chromaseq::ErrorKind::InvalidParameter,
                                        std::string(name) + " must not be null");
    }
}

#define INTEROP_TRY_CATCH(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

// Helper for string duplication
static char* strdup_safe(const std::string& str) {
#ifdef _WIN32
    return _strdup(str.c_str());
#else
    return strdup(str.c_str());
#endif
}

// =============================================================================
//  Color Conversion
// =============================================================================

bool chromaseq_hex_to_rgb(const char* hex, double* out_rgb3) {
    INTEROP_TRY_CATCH({
        require(hex, "hex");
        require(out_rgb3, "out_rgb3");
        const auto rgb = chromaseq::color::hex_to_rgb(hex);
        out_rgb3[0] = rgb.r;
        out_rgb3[1] = rgb.g;
        out_rgb3[2] = rgb.b;
        return true;
    })
}

char* chromaseq_rgb_to_hex(double r, double g, double b) {
    INTEROP_TRY_CATCH_PTR({
        return strdup_safe(chromaseq::color::rgb_to_hex({r, g, b}));
    })
}

// =============================================================================
//  Generation & Inversion
// =============================================================================

char* chromaseq_generate_hex(const char* method, int64_t seed, uint32_t index) {
    INTEROP_TRY_CATCH_PTR({
        require(method, "method");
        const auto m = chromaseq::sequence::parse_method(method);
        return strdup_safe(chromaseq::sequence::SequenceGenerator::hex(m, index, chromaseq::sequence::Seed(seed)));
    })
}

bool chromaseq_invert_hex(const char* hex, const char* method, int64_t seed,
                          uint32_t max_search, double tolerance,
                          CInversionResult* out_result) {
    INTEROP_TRY_CATCH({
        require(hex, "hex");
        require(method, "method");
        require(out_result, "out_result");

        Chromaseq::InversionOptions options;
        options.max_search = max_search;
        options.tolerance = tolerance;

        const auto result = Chromaseq::ColorInverter::invert_hex(
            hex, chromaseq::sequence::parse_method(method), chromaseq::sequence::Seed(seed), options);

        out_result->found = result.found;
        out_result->index = result.index.value_or(0);
        out_result->distance = result.distance;
        return true;
    })
}

// =============================================================================
//  JSON Request Contract
// =============================================================================

char* chromaseq_handle_request(const char* tool, const char* params_json) {
    INTEROP_TRY_CATCH_PTR({
        require(tool, "tool");

        nlohmann::json params = nlohmann::json::object();
        if (params_json && *params_json) {
            params = nlohmann::json::parse(params_json, nullptr, false);
            if (params.is_discarded()) {
                return strdup_safe(Chromaseq::error_response(Chromaseq::ErrorKind::InvalidParameter,
                                                             "params is not valid JSON").dump());
            }
        }

        static const Chromaseq::RequestHandler handler(Chromaseq::EngineConfig::load_from_env());
        return strdup_safe(handler.handle(tool, params)
                               .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    })
}

void chromaseq_free_string(char* str) {
    if (str) free(str);
}
