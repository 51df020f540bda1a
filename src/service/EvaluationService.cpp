#include <prism/core/CoreTypes.hpp>
#include <prism/service/EvaluationService.hpp>
#include <prism/service/MetricExtractor.hpp>

#include <fstream>

namespace prism {

namespace {

constexpr std::size_t kHealthDetailLimit = 300;

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

/// Split one CSV record; `in` is positioned after it on return
bool ReadCsvRecord(std::istream &in, std::vector<std::string> &fields) {
    fields.clear();
    std::string field;
    bool quoted = false;
    bool any = false;
    char c;
    while (in.get(c)) {
        any = true;
        if (quoted) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get(c);
                    field += '"';
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c == '\n') {
            break;
        } else if (c != '\r') {
            field += c;
        }
    }
    if (!any) {
        return false;
    }
    fields.push_back(std::move(field));
    return true;
}

} // namespace

EvaluationService::EvaluationService(Executor &executor, std::shared_ptr<ProcessRunner> runner,
                                     std::shared_ptr<ResultCache> cache,
                                     std::shared_ptr<Metrics> metrics,
                                     std::shared_ptr<ExperimentTracker> tracker,
                                     TimeoutConfig timeouts)
    : executor_(executor), runner_(std::move(runner)), cache_(std::move(cache)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<NullMetrics>()),
      tracker_(tracker ? std::move(tracker) : std::make_shared<NullTracker>()),
      timeouts_(timeouts) {}

// =============================================================================
// Cascade
// =============================================================================

std::future<EvaluationResult>
EvaluationService::EvaluateAsync(const EvaluationParams &params,
                                 std::optional<std::chrono::milliseconds> timeout) {
    auto op = std::make_shared<PendingOperation<EvaluationResult>>();
    auto future = op->promise.get_future();
    const auto deadline = timeout.value_or(timeouts_.cascade);

    executor_.PostToCoordinator([this, op, params, deadline] {
        try {
            const auto key = cache_->KeyFor(kCascadeOp, params);
            if (auto hit = cache_->Lookup(key)) {
                GetLogService().Debug("Cache hit " + key);
                Track(*hit);
                op->TrySettle(std::move(*hit));
                return;
            }

            BoundedHooks<EvaluationResult> hooks;
            hooks.on_success = [this, key](const EvaluationResult &result) {
                cache_->Store(key, result);
                Track(result);
            };
            hooks.on_failure = [this](const std::exception_ptr &error) {
                metrics_->Increment(metric_names::kCascadeErrors);
                GetLogService().Warning("Cascade failed: " + DescribeFailure(error).message);
            };

            executor_.RunBounded<EvaluationResult>(
                op, kCascadeOp, deadline,
                [this, params, deadline] {
                    const auto start = std::chrono::steady_clock::now();
                    auto output = runner_->Run(params.ToCascadeArgs(), deadline);
                    const double duration = SecondsSince(start);
                    metrics_->Increment(metric_names::kCascadeTotal);
                    metrics_->Observe(metric_names::kCascadeDuration, duration);
                    ObserveThreads();
                    RequireSuccess(output, kCascadeOp);
                    return BuildResult(params, output, duration);
                },
                std::move(hooks));
        } catch (const std::exception &) {
            op->TryFail(std::current_exception());
        }
    });
    return future;
}

EvaluationResult EvaluationService::Evaluate(const EvaluationParams &params,
                                             std::optional<std::chrono::milliseconds> timeout) {
    executor_.RequireOffCoordinator("Evaluate");
    return EvaluateAsync(params, timeout).get();
}

EvaluationResult EvaluationService::BuildResult(const EvaluationParams &params,
                                                const ProcessOutput &output, double duration_s) {
    EvaluationResult result;
    result.run_id = NewRunId();
    result.timestamp = UtcTimestamp();
    result.params = params;
    result.duration_s = duration_s;

    auto parsed = nlohmann::json::parse(output.stdout_text, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        result.metrics = MetricExtractor::FromStructured(parsed);
        result.raw_output = std::move(parsed);
    } else {
        result.metrics = MetricExtractor::FromText(output.stdout_text);
        result.raw_output = nlohmann::json{{"raw", output.stdout_text}};
    }
    return result;
}

// =============================================================================
// Other simulator commands
// =============================================================================

ProcessOutput EvaluationService::RunBlocking(const std::vector<std::string> &args,
                                             const std::string &stage,
                                             std::chrono::milliseconds timeout) {
    executor_.RequireOffCoordinator(stage);
    auto op = std::make_shared<PendingOperation<ProcessOutput>>();
    auto future = op->promise.get_future();
    executor_.PostToCoordinator([this, op, args, stage, timeout] {
        executor_.RunBounded<ProcessOutput>(op, stage, timeout, [this, args, timeout] {
            auto output = runner_->Run(args, timeout);
            ObserveThreads();
            return output;
        });
    });
    return future.get();
}

nlohmann::json EvaluationService::Characterize() {
    auto output = RunBlocking({"characterize"}, "characterize", timeouts_.characterize);
    RequireSuccess(output, "characterize");
    auto out = ParseJsonOrRaw(output.stdout_text);
    if (out.is_object()) {
        if (!out.contains("run_id")) {
            out["run_id"] = NewRunId();
        }
        if (!out.contains("timestamp")) {
            out["timestamp"] = UtcTimestamp();
        }
    }
    return out;
}

TruthTableResult EvaluationService::TruthTable(const std::vector<double> &ctrl,
                                               const std::optional<std::string> &out_csv,
                                               const ResultStore &store) {
    if (ctrl.empty()) {
        throw InvalidArgumentError("ctrl", "at least one control power is required");
    }
    const std::string path =
        out_csv && !out_csv->empty() ? *out_csv : store.ReserveTempFile("truth_table", ".csv");

    std::vector<std::string> args = {"truth-table"};
    for (double c : ctrl) {
        args.emplace_back("--ctrl");
        args.push_back(FormatNumber(c));
    }
    args.emplace_back("--out");
    args.push_back(path);

    auto output = RunBlocking(args, "truth_table", timeouts_.truth_table);
    RequireSuccess(output, "truth-table");

    TruthTableResult result;
    result.run_id = NewRunId();
    result.timestamp = UtcTimestamp();
    result.path = path;
    result.rows = ReadCsvRows(path);
    return result;
}

HealthStatus EvaluationService::Health() {
    HealthStatus status;
    try {
        auto output = RunBlocking({"--help"}, "health", timeouts_.health);
        status.healthy = output.exit_code == 0;
        status.detail = output.stderr_text.substr(0, kHealthDetailLimit);
        if (!status.healthy && status.detail.empty()) {
            status.detail = "exit code " + std::to_string(output.exit_code);
        }
    } catch (const std::exception &e) {
        status.healthy = false;
        status.detail = e.what();
    }
    return status;
}

// =============================================================================
// Side channels
// =============================================================================

void EvaluationService::Track(const EvaluationResult &result) {
    try {
        tracker_->LogRun(result.run_id, result.params.ToJSON(), result.metrics);
    } catch (const std::exception &e) {
        GetLogService().Debug(std::string("Experiment tracking skipped: ") + e.what());
    }
}

void EvaluationService::ObserveThreads() {
    metrics_->Set(metric_names::kThreads, static_cast<double>(executor_.ActiveWorkers()));
}

// =============================================================================
// CSV
// =============================================================================

std::vector<std::map<std::string, std::string>> ReadCsvRows(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError("open", path, "cannot open CSV");
    }
    std::vector<std::map<std::string, std::string>> rows;
    std::vector<std::string> header;
    if (!ReadCsvRecord(in, header)) {
        return rows;
    }
    std::vector<std::string> fields;
    while (ReadCsvRecord(in, fields)) {
        if (fields.size() == 1 && fields[0].empty()) {
            continue; // blank line
        }
        std::map<std::string, std::string> row;
        for (std::size_t i = 0; i < header.size() && i < fields.size(); ++i) {
            row[header[i]] = fields[i];
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace prism
