/**
 * @file request_handler.hpp
 * @brief Transport-agnostic JSON request/response contract
 *
 * Tools:
 *   generate {method, params?, seed?, seed_mode?, count}
 *   invert   {hex, method, params?, seed?, seed_mode?, max_search?, tolerance?,
 *             policy? ("first" default, "nearest")}
 *   compare  {n?, methods?, seed?, seed_mode?}
 *   predict  {index, observed_hex, method, params?, seed?, seed_mode?, tolerance?}
 *   convert  {hex}
 *
 * Method parameters are read from the nested "params" object when present,
 * otherwise from the request itself. Parameters that belong to a different
 * method are ignored. Failures never throw out of handle(); they come back as
 * {"error": {"kind": ..., "message": ...}, "tool": ...}.
 */

#pragma once

#include <export.hpp>
#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <sequence/method.hpp>
#include <sequence/seed.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Chromaseq {

class CHROMASEQ_API RequestHandler {
public:
    explicit RequestHandler(const EngineConfig& config = EngineConfig());

    nlohmann::json handle(const std::string& tool, const nlohmann::json& params) const;

    /**
     * @brief One line of the stdio protocol: {"tool": ..., "params": {...}}
     *        in, one compact JSON document out.
     */
    std::string handle_line(const std::string& line) const;

    static std::vector<std::string> available_tools();

    /**
     * @brief Method tag plus its parameters from a request object.
     * @throws ChromaseqError (UnknownMethod, InvalidParameter)
     */
    static chromaseq::sequence::Method method_from_json(const nlohmann::json& request);

    static chromaseq::sequence::Seed seed_from_json(const nlohmann::json& request);

    const EngineConfig& config() const { return config_; }

private:
    nlohmann::json generate(const nlohmann::json& params) const;
    nlohmann::json invert(const nlohmann::json& params) const;
    nlohmann::json compare(const nlohmann::json& params) const;
    nlohmann::json predict(const nlohmann::json& params) const;
    nlohmann::json convert(const nlohmann::json& params) const;

    EngineConfig config_;
};

/**
 * @brief {"error": {"kind": ..., "message": ...}}
 */
CHROMASEQ_API nlohmann::json error_response(ErrorKind kind, const std::string& message);

} // namespace Chromaseq
