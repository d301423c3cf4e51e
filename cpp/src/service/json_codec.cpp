#include "portfolio_opt/service/json_codec.hpp"
#include "portfolio_opt/core/errors.hpp"
#include <cmath>
#include <limits>
#include <sstream>

namespace portfolio_opt {

using nlohmann::json;

namespace {

const json& member(const json& j, const char* key, const std::string& field) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw ValidationError(field, field + ": missing field");
    }
    return *it;
}

// Optional members: absent and null both mean "not given"
const json* optional_member(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

double read_number(const json& value, const std::string& field) {
    if (!value.is_number()) {
        throw ValidationError(field, field + ": expected a number");
    }
    return value.get<double>();
}

int64_t read_integer(const json& value, const std::string& field) {
    if (value.is_number_integer()) {
        if (value.is_number_unsigned()
            && value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw ValidationError(field, field + ": integer out of range");
        }
        return value.get<int64_t>();
    }
    // Integral floats are accepted, as clients often send 3.0 for 3
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
            return static_cast<int64_t>(d);
        }
    }
    throw ValidationError(field, field + ": expected an integer");
}

double number_field(const json& j, const char* key) {
    return read_number(member(j, key, key), key);
}

std::vector<double> number_array(const json& value, const std::string& field) {
    if (!value.is_array()) {
        throw ValidationError(field, field + ": expected an array of numbers");
    }
    std::vector<double> out;
    out.reserve(value.size());
    for (const auto& element : value) {
        out.push_back(read_number(element, field));
    }
    return out;
}

std::vector<int> sector_array(const json& value, const std::string& field) {
    if (!value.is_array()) {
        throw ValidationError(field, field + ": expected an array of sector codes");
    }
    std::vector<int> out;
    out.reserve(value.size());
    for (const auto& element : value) {
        const int64_t code = read_integer(element, field);
        if (code < std::numeric_limits<int>::min() || code > std::numeric_limits<int>::max()) {
            throw ValidationError(field, field + ": sector code out of range");
        }
        out.push_back(static_cast<int>(code));
    }
    return out;
}

std::vector<bool> qualified_array(const json& value, const std::string& field) {
    if (!value.is_array()) {
        throw ValidationError(field, field + ": expected an array of booleans");
    }
    std::vector<bool> out;
    out.reserve(value.size());
    for (const auto& element : value) {
        if (element.is_boolean()) {
            out.push_back(element.get<bool>());
        } else if (element.is_number()) {
            out.push_back(element.get<double>() != 0.0);
        } else {
            throw ValidationError(field, field + ": expected booleans or 0/1");
        }
    }
    return out;
}

AssetColumns columns_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("columns", "columns: expected an object");
    }
    AssetColumns columns;

    // Older clients send the longer key for dividend growth
    const json* div_growth = optional_member(j, "div_growth_rates");
    if (div_growth == nullptr) div_growth = optional_member(j, "dividend_growth_rates");
    if (div_growth == nullptr) {
        throw ValidationError("columns.div_growth_rates", "columns.div_growth_rates: missing field");
    }
    columns.div_growth_rates = number_array(*div_growth, "columns.div_growth_rates");

    columns.cagr_rates = number_array(
        member(j, "cagr_rates", "columns.cagr_rates"), "columns.cagr_rates");
    columns.yields = number_array(
        member(j, "yields", "columns.yields"), "columns.yields");
    columns.expense_ratios = number_array(
        member(j, "expense_ratios", "columns.expense_ratios"), "columns.expense_ratios");
    columns.sector = sector_array(
        member(j, "sector", "columns.sector"), "columns.sector");
    columns.qualified = qualified_array(
        member(j, "qualified", "columns.qualified"), "columns.qualified");
    return columns;
}

json metrics_to_json(const Metrics& m) {
    return json{
        {"div_growth", m.agg_div_growth},
        {"cagr", m.agg_cagr},
        {"yield", m.agg_yield},
        {"gross_yield", m.gross_yield},
        {"expense_ratio", m.expense_ratio},
        {"qualified_income", m.qualified_income},
        {"non_qualified_income", m.non_qualified_income},
        {"after_tax_income", m.after_tax_income},
        {"sector_hhi", m.sector_hhi},
    };
}

Metrics metrics_from_json(const json& j) {
    Metrics m;
    m.agg_div_growth = j.at("div_growth").get<double>();
    m.agg_cagr = j.at("cagr").get<double>();
    m.agg_yield = j.at("yield").get<double>();
    m.gross_yield = j.at("gross_yield").get<double>();
    m.expense_ratio = j.at("expense_ratio").get<double>();
    m.qualified_income = j.at("qualified_income").get<double>();
    m.non_qualified_income = j.at("non_qualified_income").get<double>();
    m.after_tax_income = j.at("after_tax_income").get<double>();
    m.sector_hhi = j.at("sector_hhi").get<double>();
    return m;
}

json violations_to_json(const Violations& v) {
    return json{
        {"div_growth", v.div_growth},
        {"cagr", v.cagr},
        {"yield", v.yield},
        {"income", v.income},
        {"diversification", v.diversification},
        {"sector", v.sector},
        {"simplex", v.simplex},
    };
}

Violations violations_from_json(const json& j) {
    Violations v;
    v.div_growth = j.at("div_growth").get<double>();
    v.cagr = j.at("cagr").get<double>();
    v.yield = j.at("yield").get<double>();
    v.income = j.at("income").get<double>();
    v.diversification = j.at("diversification").get<double>();
    v.sector = j.at("sector").get<double>();
    v.simplex = j.at("simplex").get<double>();
    return v;
}

}  // namespace

json to_json(const OptimizationRequest& request) {
    const auto& c = request.columns;
    json j{
        {"dimension", request.dimension},
        {"lower_bounds", request.lower_bounds},
        {"upper_bounds", request.upper_bounds},
        {"initial_capital", request.initial_capital},
        {"salary", request.salary},
        {"required_income", request.required_income},
        {"min_div_growth", request.min_div_growth},
        {"min_cagr", request.min_cagr},
        {"min_yield", request.min_yield},
        {"div_preference", request.div_preference},
        {"cagr_preference", request.cagr_preference},
        {"yield_preference", request.yield_preference},
        {"filing_status", to_string(request.filing_status)},
        {"redistribution_threshold", request.redistribution_threshold},
        {"columns", {
            {"div_growth_rates", c.div_growth_rates},
            {"cagr_rates", c.cagr_rates},
            {"yields", c.yields},
            {"expense_ratios", c.expense_ratios},
            {"sector", c.sector},
            {"qualified", c.qualified},
        }},
    };
    if (request.seed) j["seed"] = *request.seed;
    if (request.max_sector_hhi) j["max_sector_hhi"] = *request.max_sector_hhi;
    if (request.timeout_ms) j["timeout_ms"] = *request.timeout_ms;
    return j;
}

OptimizationRequest request_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("body", "body: expected a JSON object");
    }

    OptimizationRequest request;
    const int64_t dimension = read_integer(member(j, "dimension", "dimension"), "dimension");
    if (dimension < std::numeric_limits<int>::min() || dimension > std::numeric_limits<int>::max()) {
        throw ValidationError("dimension", "dimension: out of range");
    }
    request.dimension = static_cast<int>(dimension);
    request.lower_bounds = number_array(member(j, "lower_bounds", "lower_bounds"), "lower_bounds");
    request.upper_bounds = number_array(member(j, "upper_bounds", "upper_bounds"), "upper_bounds");

    request.initial_capital = number_field(j, "initial_capital");
    request.salary = number_field(j, "salary");
    request.required_income = number_field(j, "required_income");
    request.min_div_growth = number_field(j, "min_div_growth");
    request.min_cagr = number_field(j, "min_cagr");
    request.min_yield = number_field(j, "min_yield");
    request.div_preference = number_field(j, "div_preference");
    request.cagr_preference = number_field(j, "cagr_preference");
    request.yield_preference = number_field(j, "yield_preference");

    const json& status = member(j, "filing_status", "filing_status");
    if (!status.is_string()) {
        throw ValidationError("filing_status", "filing_status: expected a string");
    }
    request.filing_status = parse_filing_status(status.get<std::string>());

    if (const json* value = optional_member(j, "redistribution_threshold")) {
        request.redistribution_threshold = read_number(*value, "redistribution_threshold");
    }

    request.columns = columns_from_json(member(j, "columns", "columns"));

    if (const json* value = optional_member(j, "seed")) {
        if (!value->is_number_unsigned()) {
            throw ValidationError("seed", "seed: expected a non-negative integer");
        }
        request.seed = value->get<uint64_t>();
    }
    if (const json* value = optional_member(j, "max_sector_hhi")) {
        request.max_sector_hhi = read_number(*value, "max_sector_hhi");
    }
    if (const json* value = optional_member(j, "timeout_ms")) {
        request.timeout_ms = read_integer(*value, "timeout_ms");
    }
    return request;
}

OptimizationRequest parse_request(std::string_view body) {
    json j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded()) {
        throw ValidationError("body", "body: malformed JSON");
    }
    return request_from_json(j);
}

json to_json(const OptimizationResult& result) {
    return json{
        {"success", true},
        {"feasible", result.score.feasible},
        {"x", result.weights},
        {"weights", result.weights},
        {"objective_value", result.score.fitness},
        {"metrics", metrics_to_json(result.score.metrics)},
        {"violations", violations_to_json(result.score.violations)},
        {"iterations", result.iterations},
        {"termination_reason", to_string(result.termination_reason)},
        {"seed", result.seed},
        {"fitness_history", result.fitness_history},
        {"message", result_message(result)},
    };
}

OptimizationResult result_from_json(const json& j) {
    OptimizationResult result;
    result.weights = j.at("x").get<std::vector<double>>();
    result.score.feasible = j.at("feasible").get<bool>();
    result.score.fitness = j.at("objective_value").get<double>();
    result.score.metrics = metrics_from_json(j.at("metrics"));
    result.score.violations = violations_from_json(j.at("violations"));
    result.iterations = j.at("iterations").get<int>();
    result.termination_reason = parse_termination_reason(j.at("termination_reason").get<std::string>());
    result.seed = j.at("seed").get<uint64_t>();
    if (const auto it = j.find("fitness_history"); it != j.end()) {
        result.fitness_history = it->get<std::vector<double>>();
    }
    return result;
}

json to_json(const JobGovernor::Stats& stats) {
    return json{
        {"slots", stats.slots},
        {"queue_capacity", stats.queue_capacity},
        {"running", stats.running},
        {"queued", stats.queued},
        {"peak_running", stats.peak_running},
        {"admitted", stats.admitted},
        {"rejected", stats.rejected},
        {"completed", stats.completed},
        {"deadline_exceeded", stats.deadline_exceeded},
        {"cancelled", stats.cancelled},
        {"failed", stats.failed},
    };
}

std::string result_message(const OptimizationResult& result) {
    std::ostringstream out;
    out << (result.score.feasible ? "Feasible allocation found" : "No feasible allocation found")
        << " after " << result.iterations << " iterations ("
        << to_string(result.termination_reason) << ")";
    if (!result.score.feasible) {
        out << ", max violation " << result.score.violations.max();
    }
    return out.str();
}

json error_body(
    std::string_view kind,
    const std::optional<std::string>& field,
    std::string_view message
) {
    json j{
        {"success", false},
        {"error", std::string(kind)},
        {"message", std::string(message)},
    };
    j["field"] = field ? json(*field) : json(nullptr);
    return j;
}

}  // namespace portfolio_opt
