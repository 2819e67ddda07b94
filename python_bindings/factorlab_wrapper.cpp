/**
 * @file factorlab_wrapper.cpp
 * @brief Pybind11 bindings for the FactorLab C++ core
 *
 * Exposes the backtest loop, statistics, cost models and optimizer to the
 * Python reporting and data layers.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <factorlab/Errors.hpp>
#include <factorlab/FactorBacktester.hpp>
#include <factorlab/FactorScores.hpp>
#include <factorlab/Logging.hpp>
#include <factorlab/MeanVarianceOptimizer.hpp>
#include <factorlab/PerformanceStats.hpp>
#include <factorlab/QuantileBucketer.hpp>
#include <factorlab/ReturnLinker.hpp>
#include <factorlab/TransactionCost.hpp>

namespace py = pybind11;

PYBIND11_MODULE(factorlab_core, m) {
    m.doc() = "FactorLab C++ Core - factor backtesting, performance statistics and portfolio analytics";

    // =========================================================================
    // Errors
    // =========================================================================
    auto validation_error = py::register_exception<factorlab::ValidationError>(
        m, "ValidationError", PyExc_ValueError);
    py::register_exception<factorlab::SchemaError>(m, "SchemaError", validation_error.ptr());
    py::register_exception<factorlab::CardinalityError>(m, "CardinalityError", validation_error.ptr());

    // =========================================================================
    // Panel
    // =========================================================================
    py::class_<factorlab::ObservationPanel>(m, "ObservationPanel",
        "Cross-sectional observation panel with named factor columns (NaN = missing)")
        .def(py::init<>())
        .def("add_row", &factorlab::ObservationPanel::add_row,
             py::arg("date"), py::arg("entity_id"), py::arg("realized_return"),
             py::arg("factors") = std::map<std::string, double>{},
             "Append one observation")
        .def("set_columns", &factorlab::ObservationPanel::set_columns,
             py::arg("dates"), py::arg("entity_ids"), py::arg("realized_returns"),
             "Bulk load the key and return columns")
        .def("set_factor", &factorlab::ObservationPanel::set_factor,
             py::arg("name"), py::arg("values"),
             "Attach or replace a named factor column")
        .def("has_factor", &factorlab::ObservationPanel::has_factor, py::arg("name"))
        .def("validate", &factorlab::ObservationPanel::validate, py::arg("factor_name"),
             "Raise SchemaError / ValidationError if the panel cannot be backtested")
        .def_property_readonly("dates", &factorlab::ObservationPanel::dates)
        .def_property_readonly("entity_ids", &factorlab::ObservationPanel::entity_ids)
        .def_property_readonly("realized_returns", &factorlab::ObservationPanel::realized_returns)
        .def("__len__", &factorlab::ObservationPanel::size)
        .def("__repr__", [](const factorlab::ObservationPanel& p) {
            return "<ObservationPanel rows=" + std::to_string(p.size()) +
                   " factors=" + std::to_string(p.factors().size()) + ">";
        });

    // =========================================================================
    // Bucketer
    // =========================================================================
    py::class_<factorlab::BucketerParams>(m, "BucketerParams", "Quantile bucketing parameters")
        .def(py::init<>())
        .def_readwrite("n_buckets", &factorlab::BucketerParams::n_buckets,
                       "Number of buckets, >= 2 (default: 5)")
        .def_readwrite("skip_undersized_dates", &factorlab::BucketerParams::skip_undersized_dates,
                       "Skip dates with fewer rankable rows than buckets (default: False)");

    py::class_<factorlab::QuantileBucketer>(m, "QuantileBucketer",
        "Per-date quantile bucketer; bucket 1 = lowest factor, 0 = unassigned")
        .def(py::init<>())
        .def(py::init<const factorlab::BucketerParams&>(), py::arg("params"))
        .def("assign",
             py::overload_cast<const std::vector<factorlab::Date>&, const std::vector<double>&>(
                 &factorlab::QuantileBucketer::assign, py::const_),
             py::arg("dates"), py::arg("factor_values"))
        .def("assign",
             py::overload_cast<const factorlab::ObservationPanel&, const std::string&>(
                 &factorlab::QuantileBucketer::assign, py::const_),
             py::arg("panel"), py::arg("factor_name"))
        .def_static("partition_sizes", &factorlab::QuantileBucketer::partition_sizes,
                    py::arg("n"), py::arg("n_buckets"))
        .def_property_readonly("params", &factorlab::QuantileBucketer::params)
        .def("last_latency_ns", &factorlab::QuantileBucketer::last_latency_ns);

    // =========================================================================
    // Backtester
    // =========================================================================
    py::class_<factorlab::BacktestParams>(m, "BacktestParams",
        "Backtest configuration. Bucket 1 holds the LOWEST factor values.")
        .def(py::init<>())
        .def_readwrite("factor_name", &factorlab::BacktestParams::factor_name,
                       "Panel factor column used for ranking (default: 'factor')")
        .def_readwrite("n_buckets", &factorlab::BacktestParams::n_buckets,
                       "Number of quantile buckets (default: 5)")
        .def_readwrite("skip_undersized_dates", &factorlab::BacktestParams::skip_undersized_dates,
                       "Skip dates that cannot fill every bucket instead of raising (default: False)")
        .def("__repr__", [](const factorlab::BacktestParams& p) {
            return "<BacktestParams factor=" + p.factor_name +
                   " n_buckets=" + std::to_string(p.n_buckets) + ">";
        });

    py::class_<factorlab::ReturnSeries>(m, "ReturnSeries", "Date-indexed return series")
        .def_readonly("dates", &factorlab::ReturnSeries::dates)
        .def_property_readonly("values", [](const factorlab::ReturnSeries& s) -> Eigen::VectorXd {
            return s.values;
        });

    py::class_<factorlab::BucketReturns>(m, "BucketReturns", "Per-bucket period returns")
        .def_readonly("dates", &factorlab::BucketReturns::dates)
        .def_property_readonly("returns", [](const factorlab::BucketReturns& b) -> Eigen::MatrixXd {
            return b.returns;
        }, "T x N matrix of mean bucket returns")
        .def_property_readonly("counts", [](const factorlab::BucketReturns& b) -> Eigen::MatrixXi {
            return b.counts;
        }, "T x N matrix of bucket member counts")
        .def("bucket", &factorlab::BucketReturns::bucket, py::arg("bucket"));

    py::class_<factorlab::BacktestResult>(m, "BacktestResult", "Output of one backtest run")
        .def_readonly("assignments", &factorlab::BacktestResult::assignments)
        .def_readonly("bucket_returns", &factorlab::BacktestResult::bucket_returns)
        .def_property_readonly("cumulative", [](const factorlab::BacktestResult& r) -> Eigen::MatrixXd {
            return r.cumulative;
        }, "T x N cumulative returns per bucket")
        .def_readonly("latency_ns", &factorlab::BacktestResult::latency_ns)
        .def("cumulative_bucket", &factorlab::BacktestResult::cumulative_bucket, py::arg("bucket"));

    py::class_<factorlab::FactorBacktester>(m, "FactorBacktester",
        R"doc(
        Cross-sectional quantile factor backtester.

        Example:
            >>> import factorlab_core as fl
            >>> params = fl.BacktestParams()
            >>> params.factor_name = "vq_score"
            >>> result = fl.FactorBacktester(params).run(panel)
            >>> stats = fl.FactorBacktester.performance_stats(result, 1)
        )doc")
        .def(py::init<>())
        .def(py::init<const factorlab::BacktestParams&>(), py::arg("params"))
        .def("run", &factorlab::FactorBacktester::run, py::arg("panel"))
        .def_static("performance_stats", &factorlab::FactorBacktester::performance_stats,
                    py::arg("result"), py::arg("bucket"),
                    py::arg("params") = factorlab::StatsParams{})
        .def_static("long_short_returns", &factorlab::FactorBacktester::long_short_returns,
                    py::arg("bucket_returns"), py::arg("long_bucket"), py::arg("short_bucket"))
        .def_static("composite_returns", &factorlab::FactorBacktester::composite_returns,
                    py::arg("panel"))
        .def_property_readonly("params", &factorlab::FactorBacktester::params)
        .def("last_latency_ns", &factorlab::FactorBacktester::last_latency_ns)
        .def("avg_latency_ns", &factorlab::FactorBacktester::avg_latency_ns)
        .def("reset_profiling", &factorlab::FactorBacktester::reset_profiling);

    // =========================================================================
    // Return linking & statistics
    // =========================================================================
    m.def("link_returns",
          [](const Eigen::VectorXd& r) -> Eigen::VectorXd { return factorlab::link_returns(r); },
          py::arg("period_returns"), "Geometrically link period returns into a cumulative series");

    py::class_<factorlab::StatsParams>(m, "StatsParams", "Statistics context")
        .def(py::init<>())
        .def_readwrite("periods_per_year", &factorlab::StatsParams::periods_per_year,
                       "Periods per year (default: 12)")
        .def_readwrite("risk_free_rate", &factorlab::StatsParams::risk_free_rate,
                       "Per-period risk-free rate (default: 0)");

    py::class_<factorlab::PerformanceStats>(m, "PerformanceStats", "Performance statistics bundle")
        .def_readonly("total_return", &factorlab::PerformanceStats::total_return)
        .def_readonly("annualized_return", &factorlab::PerformanceStats::annualized_return)
        .def_readonly("annualized_vol", &factorlab::PerformanceStats::annualized_vol)
        .def_readonly("sharpe", &factorlab::PerformanceStats::sharpe, "NaN when volatility is zero")
        .def_readonly("max_drawdown", &factorlab::PerformanceStats::max_drawdown)
        .def("__repr__", [](const factorlab::PerformanceStats& s) {
            return "<PerformanceStats total=" + std::to_string(s.total_return) +
                   " ann=" + std::to_string(s.annualized_return) +
                   " vol=" + std::to_string(s.annualized_vol) +
                   " sharpe=" + std::to_string(s.sharpe) +
                   " mdd=" + std::to_string(s.max_drawdown) + ">";
        });

    m.def("stats_from_period_returns",
          [](const Eigen::VectorXd& r, const factorlab::StatsParams& p) {
              return factorlab::stats_from_period_returns(r, p);
          }, py::arg("period_returns"), py::arg("params") = factorlab::StatsParams{});
    m.def("stats_from_cumulative",
          [](const Eigen::VectorXd& c, const factorlab::StatsParams& p) {
              return factorlab::stats_from_cumulative(c, p);
          }, py::arg("cumulative"), py::arg("params") = factorlab::StatsParams{});
    m.def("historical_var",
          [](const Eigen::VectorXd& r, double confidence) {
              return factorlab::historical_var(r, confidence);
          }, py::arg("period_returns"), py::arg("confidence") = 0.95);
    m.def("expected_shortfall",
          [](const Eigen::VectorXd& r, double confidence) {
              return factorlab::expected_shortfall(r, confidence);
          }, py::arg("period_returns"), py::arg("confidence") = 0.95);

    // =========================================================================
    // Transaction costs
    // =========================================================================
    py::class_<factorlab::SqrtImpactParams>(m, "SqrtImpactParams", "Square-root impact calibration")
        .def(py::init<>())
        .def_readwrite("k", &factorlab::SqrtImpactParams::k, "Calibration constant (default: 0.1)")
        .def_readwrite("daily_vol", &factorlab::SqrtImpactParams::daily_vol,
                       "Realized daily volatility (default: 0.02)");

    py::class_<factorlab::AlmgrenChrissParams>(m, "AlmgrenChrissParams", "Almgren-Chriss parameters")
        .def(py::init<double, double, double>(),
             py::arg("permanent_cost_per_share"), py::arg("eta"), py::arg("time_horizon") = 1.0)
        .def_readwrite("permanent_cost_per_share", &factorlab::AlmgrenChrissParams::permanent_cost_per_share)
        .def_readwrite("eta", &factorlab::AlmgrenChrissParams::eta)
        .def_readwrite("time_horizon", &factorlab::AlmgrenChrissParams::time_horizon,
                       "Execution horizon, must be > 0 (default: 1)");

    m.def("sqrt_impact",
          [](const Eigen::VectorXd& v, const factorlab::SqrtImpactParams& p) -> Eigen::VectorXd {
              return factorlab::sqrt_impact(v, p);
          }, py::arg("trade_fractions"), py::arg("params") = factorlab::SqrtImpactParams{});
    m.def("almgren_chriss",
          [](const Eigen::VectorXd& s, const factorlab::AlmgrenChrissParams& p) -> Eigen::VectorXd {
              return factorlab::almgren_chriss(s, p);
          }, py::arg("shares"), py::arg("params"));

    // =========================================================================
    // Optimizer
    // =========================================================================
    py::class_<factorlab::WeightBounds>(m, "WeightBounds", "Per-asset clip bounds")
        .def(py::init<>())
        .def(py::init<double, double>(), py::arg("lower"), py::arg("upper"))
        .def_readwrite("lower", &factorlab::WeightBounds::lower)
        .def_readwrite("upper", &factorlab::WeightBounds::upper);

    py::class_<factorlab::OptimizerParams>(m, "OptimizerParams", "Mean-variance optimizer parameters")
        .def(py::init<>())
        .def_readwrite("risk_aversion", &factorlab::OptimizerParams::risk_aversion,
                       "Lambda (default: 1.0); cancels after normalization")
        .def_readwrite("weight_bounds", &factorlab::OptimizerParams::weight_bounds,
                       "Optional WeightBounds for clip-then-renormalize")
        .def_readwrite("pinv_rcond", &factorlab::OptimizerParams::pinv_rcond);

    py::class_<factorlab::OptimizationResult>(m, "OptimizationResult")
        .def_property_readonly("weights", [](const factorlab::OptimizationResult& r) -> Eigen::VectorXd {
            return r.weights;
        })
        .def_property_readonly("expected_returns", [](const factorlab::OptimizationResult& r) -> Eigen::VectorXd {
            return r.expected_returns;
        })
        .def_property_readonly("covariance", [](const factorlab::OptimizationResult& r) -> Eigen::MatrixXd {
            return r.covariance;
        })
        .def_readonly("clipped", &factorlab::OptimizationResult::clipped)
        .def_readonly("equal_weight_fallback", &factorlab::OptimizationResult::equal_weight_fallback)
        .def_readonly("latency_ns", &factorlab::OptimizationResult::latency_ns);

    py::class_<factorlab::MeanVarianceOptimizer>(m, "MeanVarianceOptimizer",
        R"doc(
        Closed-form mean-variance weights w ~ pinv(Sigma) * mu, normalized to sum to 1.

        Example:
            >>> import factorlab_core as fl
            >>> import numpy as np
            >>> opt = fl.MeanVarianceOptimizer()
            >>> w = opt.optimize_map(np.random.randn(60, 4) * 0.01, ["A", "B", "C", "D"])
        )doc")
        .def(py::init<>())
        .def(py::init<const factorlab::OptimizerParams&>(), py::arg("params"))
        .def("optimize", [](factorlab::MeanVarianceOptimizer& self,
                            const Eigen::Ref<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>& returns) {
             // Convert to column-major for internal processing
             Eigen::MatrixXd returns_col = returns;
             return self.optimize(returns_col);
        }, py::arg("returns"), "Optimize a (T, N) NumPy return matrix")
        .def("optimize_map", [](factorlab::MeanVarianceOptimizer& self,
                                const Eigen::Ref<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>& returns,
                                const std::vector<std::string>& symbols) {
             return self.optimize_map(returns, symbols);
        }, py::arg("returns"), py::arg("symbols"), "Optimize and return a symbol -> weight dict")
        .def_property_readonly("params", &factorlab::MeanVarianceOptimizer::params)
        .def("set_params", &factorlab::MeanVarianceOptimizer::set_params, py::arg("params"))
        .def("last_latency_ns", &factorlab::MeanVarianceOptimizer::last_latency_ns);

    // =========================================================================
    // Factor scores
    // =========================================================================
    py::class_<factorlab::Fundamentals>(m, "Fundamentals", "Fundamental ratios for one entity")
        .def(py::init<>())
        .def(py::init<double, double, double, double, double>(),
             py::arg("pe_ratio"), py::arg("pb_ratio"), py::arg("ev_ebitda"),
             py::arg("roe"), py::arg("de_ratio"))
        .def_readwrite("pe_ratio", &factorlab::Fundamentals::pe_ratio)
        .def_readwrite("pb_ratio", &factorlab::Fundamentals::pb_ratio)
        .def_readwrite("ev_ebitda", &factorlab::Fundamentals::ev_ebitda)
        .def_readwrite("roe", &factorlab::Fundamentals::roe)
        .def_readwrite("de_ratio", &factorlab::Fundamentals::de_ratio);

    py::class_<factorlab::FactorScores>(m, "FactorScores", "Derived value / quality scores")
        .def_readonly("earnings_yield", &factorlab::FactorScores::earnings_yield)
        .def_readonly("book_to_market", &factorlab::FactorScores::book_to_market)
        .def_readonly("ev_ebitda_inverse", &factorlab::FactorScores::ev_ebitda_inverse)
        .def_readonly("value_score", &factorlab::FactorScores::value_score)
        .def_readonly("quality_score", &factorlab::FactorScores::quality_score)
        .def_readonly("vq_score", &factorlab::FactorScores::vq_score);

    m.def("compute_factor_scores", &factorlab::compute_factor_scores, py::arg("universe"));

    // =========================================================================
    // Module-level utilities
    // =========================================================================
    m.def("set_log_level", [](const std::string& level) {
        factorlab::set_log_level(spdlog::level::from_str(level));
    }, py::arg("level"), "Set the 'factorlab' logger level (trace, debug, info, warn, err, off)");

    m.def("get_version", []() { return "1.0.0"; }, "Get FactorLab Core version");

    m.attr("__version__") = "1.0.0";
}
