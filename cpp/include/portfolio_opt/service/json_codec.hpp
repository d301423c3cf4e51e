#pragma once

#include "governor.hpp"
#include "../core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace portfolio_opt {

// Request <-> JSON. Decoding throws ValidationError naming the missing or
// mistyped field; range checks are left to validate_request().
[[nodiscard]] nlohmann::json to_json(const OptimizationRequest& request);
[[nodiscard]] OptimizationRequest request_from_json(const nlohmann::json& j);

// Parse a raw body. Malformed JSON is a ValidationError on field "body".
[[nodiscard]] OptimizationRequest parse_request(std::string_view body);

// Result <-> JSON. Every field survives a round trip exactly.
[[nodiscard]] nlohmann::json to_json(const OptimizationResult& result);
[[nodiscard]] OptimizationResult result_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const JobGovernor::Stats& stats);

// Human readable summary placed in the result's "message"
[[nodiscard]] std::string result_message(const OptimizationResult& result);

// {"success": false, "error": kind, "field": field or null, "message": message}
[[nodiscard]] nlohmann::json error_body(
    std::string_view kind,
    const std::optional<std::string>& field,
    std::string_view message
);

}  // namespace portfolio_opt
