#include <prism/service/Executor.hpp>

namespace prism {

Executor::Executor(std::size_t worker_threads)
    : worker_count_(worker_threads == 0 ? 1 : worker_threads), guard_(io_.get_executor()),
      pool_(worker_count_) {
    std::promise<void> started;
    auto ready = started.get_future();
    coordinator_ = std::thread([this, &started] {
        coordinator_id_.store(std::this_thread::get_id());
        started.set_value();
        io_.run();
    });
    ready.wait();
    GetLogService().Debug("Executor started with " + std::to_string(worker_count_) +
                          " workers");
}

Executor::~Executor() { Shutdown(); }

void Executor::Shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    pool_.join();
    guard_.reset();
    io_.stop();
    if (coordinator_.joinable()) {
        coordinator_.join();
    }
}

} // namespace prism
