#include <prism/core/CoreTypes.hpp>
#include <prism/service/SweepExecutor.hpp>

#include <algorithm>
#include <future>

namespace prism {

SweepResult SweepExecutor::Run(const std::vector<EvaluationParams> &requests) {
    std::vector<std::optional<EvaluationParams>> params(requests.begin(), requests.end());
    nlohmann::json causes = nlohmann::json::array();
    for (const auto &p : requests) {
        causes.push_back(p.ToJSON());
    }
    return Execute(params, {}, causes);
}

SweepResult SweepExecutor::Run(const nlohmann::json &configs) {
    if (!configs.is_array()) {
        throw InvalidArgumentError("configs", "expected an array of parameter objects");
    }
    std::vector<std::optional<EvaluationParams>> params;
    std::vector<SweepError> rejected;
    for (std::size_t i = 0; i < configs.size(); ++i) {
        try {
            params.emplace_back(EvaluationParams::FromJSON(configs[i]));
        } catch (const InvalidArgumentError &e) {
            params.emplace_back(std::nullopt);
            rejected.push_back(SweepError{e.what(), e.kind(), i, configs[i]});
        }
    }
    return Execute(params, std::move(rejected), configs);
}

SweepResult SweepExecutor::Execute(const std::vector<std::optional<EvaluationParams>> &params,
                                   std::vector<SweepError> rejected,
                                   const nlohmann::json &causes) {
    service_.executor().RequireOffCoordinator("Sweep");

    SweepResult result;
    result.run_id = NewRunId();
    result.timestamp = UtcTimestamp();
    LogContextManager::ScopedContext ctx("sweep", result.run_id);

    // Fan out everything first
    std::vector<std::optional<std::future<EvaluationResult>>> pending;
    pending.reserve(params.size());
    for (const auto &p : params) {
        if (p) {
            pending.emplace_back(service_.EvaluateAsync(*p));
        } else {
            pending.emplace_back(std::nullopt);
        }
    }

    // Gather in input order; each future settles by its own deadline
    std::size_t next_rejected = 0;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (!pending[i]) {
            result.errors.push_back(std::move(rejected[next_rejected++]));
            continue;
        }
        try {
            result.ok.push_back(pending[i]->get());
        } catch (const std::exception &) {
            auto info = DescribeFailure(std::current_exception());
            result.errors.push_back(SweepError{info.message, info.kind, i, causes[i]});
        }
    }

    GetLogService().Info("Sweep " + result.run_id + ": " + std::to_string(result.count_ok()) +
                         " ok, " + std::to_string(result.count_error()) + " failed");

    if (store_ != nullptr) {
        try {
            store_->Write("sweep", result.run_id, result.ToJSON());
        } catch (const IOError &e) {
            GetLogService().Error(std::string("Sweep result not persisted: ") + e.what());
        }
    }
    return result;
}

} // namespace prism
