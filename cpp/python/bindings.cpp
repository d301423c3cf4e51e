#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <chrono>
#include <optional>

#include "portfolio_opt/portfolio_opt.hpp"

namespace py = pybind11;

namespace {

portfolio_opt::OptimizationResult run_optimizer(
    const portfolio_opt::OptimizationRequest& request,
    std::optional<uint64_t> seed,
    std::optional<int64_t> timeout_ms,
    const portfolio_opt::SwarmOptimizer::Config& config,
    int n_starts
) {
    portfolio_opt::validate_request(request);
    const uint64_t used_seed = portfolio_opt::seed_or_secure(seed ? seed : request.seed);

    portfolio_opt::StopCondition stop;
    const auto budget = timeout_ms ? timeout_ms : request.timeout_ms;
    if (budget) {
        stop = portfolio_opt::StopCondition::after(std::chrono::milliseconds(*budget));
    }

    // The search touches no Python objects
    py::gil_scoped_release release;
    if (n_starts > 1) {
        portfolio_opt::MultiStartOptimizer::Config multistart;
        multistart.n_starts = n_starts;
        return portfolio_opt::MultiStartOptimizer(config, multistart).optimize(request, used_seed, stop);
    }
    return portfolio_opt::SwarmOptimizer(config).optimize(request, used_seed, stop);
}

}  // namespace

PYBIND11_MODULE(portfolio_opt_cpp, m) {
    m.doc() = "C++ implementation of the tax-aware portfolio allocation optimizer";

    // Exceptions
    auto validation_error = py::register_exception<portfolio_opt::ValidationError>(
        m, "ValidationError", PyExc_ValueError);
    py::register_exception<portfolio_opt::InvalidFilingStatus>(
        m, "InvalidFilingStatus", validation_error.ptr());
    py::register_exception<portfolio_opt::OverloadError>(m, "OverloadError", PyExc_RuntimeError);
    py::register_exception<portfolio_opt::InternalFault>(m, "InternalFault", PyExc_ArithmeticError);

    py::enum_<portfolio_opt::FilingStatus>(m, "FilingStatus")
        .value("Single", portfolio_opt::FilingStatus::Single)
        .value("MarriedFilingJointly", portfolio_opt::FilingStatus::MarriedFilingJointly)
        .value("MarriedFilingSeparately", portfolio_opt::FilingStatus::MarriedFilingSeparately)
        .value("HeadOfHousehold", portfolio_opt::FilingStatus::HeadOfHousehold);

    py::enum_<portfolio_opt::TerminationReason>(m, "TerminationReason")
        .value("MaxIterations", portfolio_opt::TerminationReason::MaxIterations)
        .value("Stagnation", portfolio_opt::TerminationReason::Stagnation)
        .value("DeadlineExceeded", portfolio_opt::TerminationReason::DeadlineExceeded)
        .value("Cancelled", portfolio_opt::TerminationReason::Cancelled);

    m.def("parse_filing_status", [](const std::string& name) {
        return portfolio_opt::parse_filing_status(name);
    });

    // AssetColumns
    py::class_<portfolio_opt::AssetColumns>(m, "AssetColumns")
        .def(py::init<>())
        .def_readwrite("div_growth_rates", &portfolio_opt::AssetColumns::div_growth_rates)
        .def_readwrite("cagr_rates", &portfolio_opt::AssetColumns::cagr_rates)
        .def_readwrite("yields", &portfolio_opt::AssetColumns::yields)
        .def_readwrite("expense_ratios", &portfolio_opt::AssetColumns::expense_ratios)
        .def_readwrite("sector", &portfolio_opt::AssetColumns::sector)
        .def_readwrite("qualified", &portfolio_opt::AssetColumns::qualified);

    // OptimizationRequest
    py::class_<portfolio_opt::OptimizationRequest>(m, "OptimizationRequest")
        .def(py::init<>())
        .def_readwrite("dimension", &portfolio_opt::OptimizationRequest::dimension)
        .def_readwrite("lower_bounds", &portfolio_opt::OptimizationRequest::lower_bounds)
        .def_readwrite("upper_bounds", &portfolio_opt::OptimizationRequest::upper_bounds)
        .def_readwrite("initial_capital", &portfolio_opt::OptimizationRequest::initial_capital)
        .def_readwrite("salary", &portfolio_opt::OptimizationRequest::salary)
        .def_readwrite("required_income", &portfolio_opt::OptimizationRequest::required_income)
        .def_readwrite("min_div_growth", &portfolio_opt::OptimizationRequest::min_div_growth)
        .def_readwrite("min_cagr", &portfolio_opt::OptimizationRequest::min_cagr)
        .def_readwrite("min_yield", &portfolio_opt::OptimizationRequest::min_yield)
        .def_readwrite("div_preference", &portfolio_opt::OptimizationRequest::div_preference)
        .def_readwrite("cagr_preference", &portfolio_opt::OptimizationRequest::cagr_preference)
        .def_readwrite("yield_preference", &portfolio_opt::OptimizationRequest::yield_preference)
        .def_readwrite("filing_status", &portfolio_opt::OptimizationRequest::filing_status)
        .def_readwrite("redistribution_threshold", &portfolio_opt::OptimizationRequest::redistribution_threshold)
        .def_readwrite("columns", &portfolio_opt::OptimizationRequest::columns)
        .def_readwrite("seed", &portfolio_opt::OptimizationRequest::seed)
        .def_readwrite("max_sector_hhi", &portfolio_opt::OptimizationRequest::max_sector_hhi)
        .def_readwrite("timeout_ms", &portfolio_opt::OptimizationRequest::timeout_ms)
        .def_static("from_json", [](const std::string& body) {
            return portfolio_opt::parse_request(body);
        })
        .def("to_json", [](const portfolio_opt::OptimizationRequest& self) {
            return portfolio_opt::to_json(self).dump();
        })
        .def("validate", &portfolio_opt::validate_request);

    // Metrics
    py::class_<portfolio_opt::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readonly("agg_div_growth", &portfolio_opt::Metrics::agg_div_growth)
        .def_readonly("agg_cagr", &portfolio_opt::Metrics::agg_cagr)
        .def_readonly("agg_yield", &portfolio_opt::Metrics::agg_yield)
        .def_readonly("gross_yield", &portfolio_opt::Metrics::gross_yield)
        .def_readonly("expense_ratio", &portfolio_opt::Metrics::expense_ratio)
        .def_readonly("qualified_income", &portfolio_opt::Metrics::qualified_income)
        .def_readonly("non_qualified_income", &portfolio_opt::Metrics::non_qualified_income)
        .def_readonly("after_tax_income", &portfolio_opt::Metrics::after_tax_income)
        .def_readonly("sector_hhi", &portfolio_opt::Metrics::sector_hhi);

    // Violations
    py::class_<portfolio_opt::Violations>(m, "Violations")
        .def(py::init<>())
        .def_readonly("div_growth", &portfolio_opt::Violations::div_growth)
        .def_readonly("cagr", &portfolio_opt::Violations::cagr)
        .def_readonly("yield_", &portfolio_opt::Violations::yield)
        .def_readonly("income", &portfolio_opt::Violations::income)
        .def_readonly("diversification", &portfolio_opt::Violations::diversification)
        .def_readonly("sector", &portfolio_opt::Violations::sector)
        .def_readonly("simplex", &portfolio_opt::Violations::simplex)
        .def("max", &portfolio_opt::Violations::max);

    // Score
    py::class_<portfolio_opt::Score>(m, "Score")
        .def(py::init<>())
        .def_readonly("feasible", &portfolio_opt::Score::feasible)
        .def_readonly("fitness", &portfolio_opt::Score::fitness)
        .def_readonly("metrics", &portfolio_opt::Score::metrics)
        .def_readonly("violations", &portfolio_opt::Score::violations);

    // OptimizationResult
    py::class_<portfolio_opt::OptimizationResult>(m, "OptimizationResult")
        .def(py::init<>())
        .def_readonly("weights", &portfolio_opt::OptimizationResult::weights)
        .def_readonly("score", &portfolio_opt::OptimizationResult::score)
        .def_readonly("iterations", &portfolio_opt::OptimizationResult::iterations)
        .def_readonly("termination_reason", &portfolio_opt::OptimizationResult::termination_reason)
        .def_readonly("seed", &portfolio_opt::OptimizationResult::seed)
        .def_readonly("fitness_history", &portfolio_opt::OptimizationResult::fitness_history)
        .def_property_readonly("feasible", [](const portfolio_opt::OptimizationResult& self) {
            return self.score.feasible;
        })
        .def("to_json", [](const portfolio_opt::OptimizationResult& self) {
            return portfolio_opt::to_json(self).dump();
        })
        .def("__repr__", [](const portfolio_opt::OptimizationResult& self) {
            return "OptimizationResult(" + portfolio_opt::result_message(self) + ")";
        });

    // Tax model
    m.def("ordinary_tax", &portfolio_opt::ordinary_tax,
          py::arg("ordinary_income"), py::arg("filing_status"));
    m.def("qualified_tax", &portfolio_opt::qualified_tax,
          py::arg("qualified_income"), py::arg("ordinary_income"), py::arg("filing_status"));
    m.def("after_tax_income", &portfolio_opt::after_tax_income,
          py::arg("qualified_income"), py::arg("ordinary_income"), py::arg("filing_status"));

    // ConstraintEvaluator
    py::class_<portfolio_opt::ConstraintEvaluator::Config>(m, "EvaluatorConfig")
        .def(py::init<>())
        .def_readwrite("penalty_coefficient", &portfolio_opt::ConstraintEvaluator::Config::penalty_coefficient)
        .def_readwrite("tolerance", &portfolio_opt::ConstraintEvaluator::Config::tolerance);

    py::class_<portfolio_opt::ConstraintEvaluator>(m, "ConstraintEvaluator")
        .def(py::init<>())
        .def(py::init<const portfolio_opt::ConstraintEvaluator::Config&>())
        .def("evaluate", [](const portfolio_opt::ConstraintEvaluator& self,
                            const std::vector<double>& weights,
                            const portfolio_opt::OptimizationRequest& request) {
            portfolio_opt::validate_request(request);
            return self.evaluate(weights, request);
        }, py::arg("weights"), py::arg("request"));

    // SwarmOptimizer
    py::class_<portfolio_opt::SwarmOptimizer::Config>(m, "SwarmConfig")
        .def(py::init<>())
        .def_readwrite("n_particles", &portfolio_opt::SwarmOptimizer::Config::n_particles)
        .def_readwrite("max_iterations", &portfolio_opt::SwarmOptimizer::Config::max_iterations)
        .def_readwrite("w", &portfolio_opt::SwarmOptimizer::Config::w)
        .def_readwrite("c1", &portfolio_opt::SwarmOptimizer::Config::c1)
        .def_readwrite("c2", &portfolio_opt::SwarmOptimizer::Config::c2)
        .def_readwrite("init_velocity", &portfolio_opt::SwarmOptimizer::Config::init_velocity)
        .def_readwrite("vel_max", &portfolio_opt::SwarmOptimizer::Config::vel_max)
        .def_readwrite("stagnation_window", &portfolio_opt::SwarmOptimizer::Config::stagnation_window)
        .def_readwrite("stagnation_epsilon", &portfolio_opt::SwarmOptimizer::Config::stagnation_epsilon)
        .def_readwrite("repair_passes", &portfolio_opt::SwarmOptimizer::Config::repair_passes)
        .def_readwrite("eval_threads", &portfolio_opt::SwarmOptimizer::Config::eval_threads)
        .def_readwrite("verbose", &portfolio_opt::SwarmOptimizer::Config::verbose);

    m.def("optimize", &run_optimizer,
        "Run the swarm optimizer on a request and return the best allocation",
        py::arg("request"),
        py::arg("seed") = py::none(),
        py::arg("timeout_ms") = py::none(),
        py::arg("config") = portfolio_opt::SwarmOptimizer::Config{},
        py::arg("n_starts") = 1);
}
