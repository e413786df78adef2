/// @file main.cpp
/// @brief evalkit-run: score a dataset file with configured metrics

#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

#include <CLI/CLI.hpp>

#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "evaluation/context.h"
#include "evaluation/dataset.h"
#include "evaluation/engine.h"
#include "evaluation/metric_factory.h"

namespace {

constexpr char kVersion[] = "1.0.0";

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitItemsFailed = 2;

evalkit::eval::EvalContext* g_context = nullptr;

// Only touches an atomic flag, so it is safe inside a signal handler.
void SignalHandler(int /*signal*/) {
    if (g_context) {
        g_context->Cancel();
    }
}

void InstallSignalHandlers() {
#ifdef _WIN32
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
#else
    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

int Fail(const std::string& what, const absl::Status& status) {
    EVALKIT_LOG_ERROR("{}: {}", what, std::string(status.message()));
    evalkit::ShutdownLogging();
    return kExitConfigError;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"evalkit-run - score model outputs in a dataset with heuristic metrics"};

    std::string config_path;
    std::string dataset_path;
    std::string log_level;
    int concurrency = 0;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("-d,--dataset", dataset_path,
                   "JSON array or JSON-lines file of records to evaluate");
    app.add_option("--concurrency", concurrency, "Number of items evaluated in parallel");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "evalkit-run v" << kVersion << std::endl;
        return kExitOk;
    }

    // Logging comes up first so that configuration problems are reported
    evalkit::LogConfig log_config;
    log_config.name = "evalkit-run";
    log_config.level = evalkit::ParseLogLevel(log_level.empty() ? "info" : log_level);
    evalkit::InitLogging(log_config);

    // File, then environment, then command line
    evalkit::Config config;
    if (!config_path.empty()) {
        auto loaded = evalkit::Config::LoadFromFile(config_path);
        if (!loaded.ok()) {
            return Fail("Failed to load config", loaded.status());
        }
        config = std::move(*loaded);
        EVALKIT_LOG_INFO("Loaded configuration from {}", config_path);
    }
    config.Merge(evalkit::Config::LoadFromEnvironment());

    if (concurrency > 0) {
        config.Set("evaluation.concurrency", static_cast<int64_t>(concurrency));
    }
    if (!dataset_path.empty()) {
        config.Set("dataset.path", dataset_path);
    }
    if (log_level.empty() && config.HasKey("logging.level")) {
        evalkit::SetLogLevel(evalkit::ParseLogLevel(config.GetString("logging.level")));
    }

    const std::string records_path = config.GetString("dataset.path");
    if (records_path.empty()) {
        return Fail("No dataset given",
                    evalkit::MakeError(evalkit::ErrorCode::kConfigurationError,
                                       "pass --dataset or set dataset.path"));
    }

    auto metrics = evalkit::eval::CreateMetrics(config);
    if (!metrics.ok()) {
        return Fail("Invalid metric configuration", metrics.status());
    }
    if (metrics->empty()) {
        return Fail("Invalid metric configuration",
                    evalkit::MakeError(evalkit::ErrorCode::kConfigurationError,
                                       "evaluation.metrics is empty"));
    }

    auto records = evalkit::eval::LoadRecords(records_path);
    if (!records.ok()) {
        return Fail("Failed to load dataset", records.status());
    }

    auto progress = [](int completed, int total, const evalkit::eval::EvaluationResult& result) {
        if (completed == total || completed % 100 == 0) {
            EVALKIT_LOG_INFO("Progress: {}/{}", completed, total);
        } else {
            EVALKIT_LOG_DEBUG("Progress: {}/{} ({})", completed, total, result.item_id);
        }
    };

    auto engine = evalkit::eval::Engine::FromConfig(std::move(*metrics), config, {progress});

    EVALKIT_LOG_INFO("Configuration:");
    EVALKIT_LOG_INFO("  Dataset: {} ({} records)", records_path, records->size());
    EVALKIT_LOG_INFO("  Metrics: {}", engine.Metrics().size());
    EVALKIT_LOG_INFO("  Concurrency: {}", engine.Concurrency());

    auto mapper = evalkit::eval::DefaultInputMapper(
        config.GetString("dataset.input_key", "input"),
        config.GetString("dataset.output_key", "output"),
        config.GetString("dataset.expected_key", "expected"));

    auto ctx = evalkit::eval::EvalContext::WithCancel(evalkit::eval::EvalContext::Background());
    g_context = ctx.get();
    InstallSignalHandlers();

    evalkit::eval::DatasetEvaluator evaluator(engine, std::move(mapper));
    auto results = evaluator.Evaluate(*ctx, *records);
    g_context = nullptr;

    if (ctx->Done()) {
        EVALKIT_LOG_WARN("Evaluation interrupted: {}", std::string(ctx->Err().message()));
    }

    std::cout << results.ToJson().dump(2) << std::endl;

    EVALKIT_LOG_INFO("Summary:");
    for (const auto& [name, value] : results.Summary()) {
        EVALKIT_LOG_INFO("  {}: {:.4f}", name, value);
    }

    const size_t failed = results.Failed().size();
    EVALKIT_LOG_INFO("Evaluated {} items, {} failed", results.size(), failed);
    evalkit::ShutdownLogging();

    return failed > 0 ? kExitItemsFailed : kExitOk;
}
