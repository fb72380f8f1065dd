#include <api/request_handler.hpp>
#include <analysis/discrepancy.hpp>
#include <color/color_space.hpp>
#include <inversion/color_inverter.hpp>
#include <sequence/sequence_generator.hpp>
#include <utils/logger.hpp>
#include <utils/overloaded.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Chromaseq {

using json = nlohmann::json;
namespace seq = chromaseq::sequence;
namespace col = chromaseq::color;

namespace {

const json& method_params(const json& request) {
    if (request.contains("params") && request["params"].is_object()) {
        return request["params"];
    }
    return request;
}

MatchPolicy parse_policy(const std::string& tag) {
    if (tag == "nearest") return MatchPolicy::Nearest;
    if (tag == "first") return MatchPolicy::FirstWithinTolerance;
    throw ChromaseqError(ErrorKind::InvalidParameter, "Unknown match policy: " + tag);
}

uint32_t read_u32(const json& params, const char* key) {
    const json& value = params.at(key);
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             std::string(key) + " must be an integer in 0.." +
                             std::to_string(std::numeric_limits<uint32_t>::max()));
    }
    return value.get<uint32_t>();
}

uint32_t read_u32(const json& params, const char* key, uint32_t fallback) {
    return params.contains(key) ? read_u32(params, key) : fallback;
}

uint32_t check_limit(const char* key, uint32_t value, uint32_t limit) {
    if (value > limit) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             std::string(key) + " " + std::to_string(value) +
                             " exceeds the configured limit of " + std::to_string(limit));
    }
    return value;
}

// Invalid UTF-8 echoed back from a request is replaced instead of failing the dump.
std::string dump_line(const json& response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

json finite_or_null(double value) {
    return std::isfinite(value) ? json(value) : json(nullptr);
}

json seed_json(const seq::Seed& seed) {
    return json{{"value", seed.value}, {"mode", seq::to_string(seed.mode)}};
}

} // namespace

json error_response(ErrorKind kind, const std::string& message) {
    return json{{"error", {{"kind", to_string(kind)}, {"message", message}}}};
}

RequestHandler::RequestHandler(const EngineConfig& config) : config_(config) {}

std::vector<std::string> RequestHandler::available_tools() {
    return {"generate", "invert", "compare", "predict", "convert"};
}

seq::Method RequestHandler::method_from_json(const json& request) {
    if (!request.contains("method") || !request["method"].is_string()) {
        throw ChromaseqError(ErrorKind::InvalidParameter, "Request is missing the 'method' tag");
    }

    seq::Method method = seq::parse_method(request["method"].get<std::string>());
    const json& p = method_params(request);

    std::visit(overloaded{
        [&](seq::Golden& m) {
            m.saturation = p.value("saturation", m.saturation);
            m.lightness = p.value("lightness", m.lightness);
        },
        [&](seq::Plastic& m) {
            m.lightness = p.value("lightness", m.lightness);
        },
        [&](seq::Halton& m) {
            if (p.contains("bases")) {
                const auto bases = p["bases"].get<std::vector<uint32_t>>();
                if (bases.size() != 3) {
                    throw ChromaseqError(ErrorKind::InvalidParameter,
                                         "halton: expected exactly 3 bases, got " + std::to_string(bases.size()));
                }
                std::copy(bases.begin(), bases.end(), m.bases.begin());
            }
            if (p.contains("mode")) m.mode = seq::parse_color_mode(p["mode"].get<std::string>());
        },
        [&](seq::RSequence& m) {
            m.dim = read_u32(p, "dim", m.dim);
            m.lightness = p.value("lightness", m.lightness);
        },
        [&](seq::Kronecker& m) {
            m.alpha = p.value("alpha", m.alpha);
            m.saturation = p.value("saturation", m.saturation);
            m.lightness = p.value("lightness", m.lightness);
        },
        [&](seq::Sobol& m) {
            if (p.contains("mode")) m.mode = seq::parse_color_mode(p["mode"].get<std::string>());
        },
        [&](seq::Pisot& m) {
            m.theta = p.value("theta", m.theta);
            m.saturation = p.value("saturation", m.saturation);
            m.lightness = p.value("lightness", m.lightness);
        },
        [&](seq::ContinuedFraction& m) {
            if (p.contains("cf_type")) {
                m.kind = chromaseq::math::parse_continued_fraction_kind(p["cf_type"].get<std::string>());
            }
            m.saturation = p.value("saturation", m.saturation);
            m.lightness = p.value("lightness", m.lightness);
        },
    }, method);

    seq::validate(method);
    return method;
}

seq::Seed RequestHandler::seed_from_json(const json& request) {
    seq::Seed seed;
    seed.value = request.value("seed", int64_t{0});
    if (request.contains("seed_mode")) {
        seed.mode = seq::parse_seed_mode(request["seed_mode"].get<std::string>());
    }
    return seed;
}

json RequestHandler::handle(const std::string& tool, const json& params) const {
    try {
        if (!params.is_object()) {
            throw ChromaseqError(ErrorKind::InvalidParameter, "Request parameters must be a JSON object");
        }

        Logger::debug("Handling '" + tool + "' request");

        if (tool == "generate") return generate(params);
        if (tool == "invert") return invert(params);
        if (tool == "compare") return compare(params);
        if (tool == "predict") return predict(params);
        if (tool == "convert") return convert(params);

        json response = error_response(ErrorKind::InvalidParameter, "Unknown tool: " + tool);
        response["available_tools"] = available_tools();
        response["tool"] = tool;
        return response;
    } catch (const ChromaseqError& e) {
        Logger::warn(std::string(to_string(e.kind())) + " in '" + tool + "': " + e.what());
        json response = error_response(e.kind(), e.what());
        response["tool"] = tool;
        return response;
    } catch (const json::exception& e) {
        Logger::warn("Malformed '" + tool + "' request: " + std::string(e.what()));
        json response = error_response(ErrorKind::InvalidParameter, e.what());
        response["tool"] = tool;
        return response;
    } catch (const std::exception& e) {
        Logger::error("'" + tool + "' request failed: " + std::string(e.what()));
        json response = error_response(ErrorKind::Internal, e.what());
        response["tool"] = tool;
        return response;
    }
}

std::string RequestHandler::handle_line(const std::string& line) const {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        Logger::warn("Rejected request line: " + std::string(e.what()));
        return dump_line(error_response(ErrorKind::InvalidParameter, e.what()));
    }

    if (!request.is_object() || !request.contains("tool") || !request["tool"].is_string()) {
        return dump_line(error_response(ErrorKind::InvalidParameter,
                                        "Request must be an object with a string 'tool' field"));
    }

    const json params = request.contains("params") ? request["params"] : json::object();
    return dump_line(handle(request["tool"].get<std::string>(), params));
}

json RequestHandler::generate(const json& params) const {
    const seq::Method method = method_from_json(params);
    const seq::Seed seed = seed_from_json(params);
    const uint32_t count = check_limit("count", read_u32(params, "count"), config_.max_count);

    return json{
        {"colors", seq::SequenceGenerator::generate_hex(method, seed, count)},
        {"method", seq::method_name(method)},
        {"seed", seed_json(seed)},
        {"count", count},
        {"start_index", seq::start_index(method)}
    };
}

json RequestHandler::invert(const json& params) const {
    const seq::Method method = method_from_json(params);
    const seq::Seed seed = seed_from_json(params);
    const std::string hex = params.at("hex").get<std::string>();

    InversionOptions options;
    options.max_search = read_u32(params, "max_search", config_.max_search);
    options.tolerance = params.value("tolerance", config_.tolerance);
    if (params.contains("policy")) options.policy = parse_policy(params["policy"].get<std::string>());

    const col::RGB color = col::hex_to_rgb(hex);
    const uint64_t span = static_cast<uint64_t>(options.max_search) + 1 - seq::start_index(method);

    const InversionResult result = span >= config_.parallel_threshold
        ? ColorInverter::invert_parallel(color, method, seed, options, config_.threads)
        : ColorInverter::invert(color, method, seed, options);

    json response{
        {"found", result.found},
        {"index", result.index ? json(*result.index) : json(nullptr)},
        {"distance", finite_or_null(result.distance)},
        {"hex", hex},
        {"method", seq::method_name(method)},
        {"seed", seed_json(seed)},
        {"max_search", options.max_search},
        {"tolerance", options.tolerance}
    };
    if (result.found) {
        response["verification"] = seq::SequenceGenerator::hex(method, *result.index, seed);
    }
    return response;
}

json RequestHandler::compare(const json& params) const {
    const uint32_t n = check_limit("n", read_u32(params, "n", 1000), config_.max_count);
    const seq::Seed seed = seed_from_json(params);

    std::vector<seq::Method> methods;
    if (params.contains("methods")) {
        for (const auto& entry : params.at("methods")) {
            methods.push_back(entry.is_string() ? seq::parse_method(entry.get<std::string>())
                                                : method_from_json(entry));
        }
    } else {
        for (const char* tag : {"golden", "plastic", "halton", "kronecker", "sobol"}) {
            methods.push_back(seq::parse_method(tag));
        }
    }
    if (methods.empty()) {
        throw ChromaseqError(ErrorKind::InvalidParameter, "compare needs at least one method");
    }

    const ComparisonReport report = DiscrepancyAnalyzer::compare_sequences(n, methods, seed);

    json discrepancy = json::object();
    json ranking = json::array();
    for (const auto& entry : report.ranking) {
        discrepancy[entry.method_name] = entry.dispersion;
        ranking.push_back(entry.method_name);
    }

    return json{
        {"n", n},
        {"discrepancy", discrepancy},
        {"ranking", ranking},
        {"best", report.best()->method_name},
        {"worst", report.worst()->method_name},
        {"metric", "Standard deviation of gaps in [0,1)"}
    };
}

json RequestHandler::predict(const json& params) const {
    const seq::Method method = method_from_json(params);
    const seq::Seed seed = seed_from_json(params);
    const uint32_t index = read_u32(params, "index");
    const col::RGB observed = col::hex_to_rgb(params.at("observed_hex").get<std::string>());
    const double tolerance = params.value("tolerance", config_.tolerance);

    const Prediction prediction = ColorInverter::predict(method, seed, index, observed, tolerance);

    return json{
        {"matches", prediction.matches},
        {"predicted", prediction.predicted_hex},
        {"observed", prediction.observed_hex},
        {"distance", prediction.distance},
        {"tolerance", prediction.tolerance},
        {"index", index},
        {"method", seq::method_name(method)},
        {"seed", seed_json(seed)}
    };
}

json RequestHandler::convert(const json& params) const {
    const col::RGB rgb = col::hex_to_rgb(params.at("hex").get<std::string>());
    const col::HSL hsl = col::rgb_to_hsl(rgb);

    return json{
        {"hex", col::rgb_to_hex(rgb)},
        {"rgb", {rgb.r, rgb.g, rgb.b}},
        {"hsl", {hsl.h, hsl.s, hsl.l}}
    };
}

} // namespace Chromaseq
