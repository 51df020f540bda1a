#include <prism/exec/ProcessRunner.hpp>
#include <prism/io/LogService.hpp>

#include <boost/asio.hpp>
#include <boost/version.hpp>

#if BOOST_VERSION < 108800
#include <boost/process.hpp>
namespace bp = boost::process;
#else
#include <boost/process/v1.hpp>
namespace bp = boost::process::v1;
#endif

#include <cstdlib>
#include <filesystem>
#include <future>

namespace prism {

SubprocessRunner::SubprocessRunner(SimulatorConfig config) : config_(std::move(config)) {}

std::string SubprocessRunner::Describe() const {
    std::string cmd = config_.executable;
    for (const auto &a : config_.prefix_args) {
        cmd += " " + a;
    }
    return cmd;
}

std::string SubprocessRunner::ExtendSearchPath(const std::string &existing,
                                               const std::string &source_dir) {
    std::error_code ec;
    if (source_dir.empty() || !std::filesystem::is_directory(source_dir, ec)) {
        return "";
    }
    return existing.empty() ? source_dir : existing + ":" + source_dir;
}

ProcessOutput SubprocessRunner::Run(const std::vector<std::string> &args,
                                    std::chrono::milliseconds timeout) {
    const std::string command = args.empty() ? Describe() : Describe() + " " + args.front();

    auto exe = bp::search_path(config_.executable);
    if (std::filesystem::path(config_.executable).has_parent_path()) {
        exe = decltype(exe)(config_.executable);
    }
    if (exe.empty()) {
        throw SimulationFailedError(command, -1, "executable not found: " + config_.executable);
    }

    std::vector<std::string> full_args = config_.prefix_args;
    full_args.insert(full_args.end(), args.begin(), args.end());

    bp::environment env = boost::this_process::environment();
    const char *current = std::getenv(config_.search_path_var.c_str());
    auto extended = ExtendSearchPath(current != nullptr ? current : "", config_.source_dir);
    if (!extended.empty()) {
        env[config_.search_path_var] = extended;
    }

    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    std::future<int> exit_code;

    bp::child child;
    try {
        child = bp::child(exe, bp::args(full_args), bp::std_in.close(), bp::std_out > out,
                          bp::std_err > err, bp::on_exit = exit_code, env, ios);
    } catch (const bp::process_error &e) {
        throw SimulationFailedError(command, -1, e.what());
    }

    ios.run_for(timeout);

    if (exit_code.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        std::error_code ec;
        child.terminate(ec);
        if (ec) {
            GetLogService().Warning("Failed to terminate '" + command + "': " + ec.message());
        }
        throw TimeoutError(command, timeout);
    }

    ProcessOutput result;
    result.exit_code = exit_code.get();
    result.stdout_text = out.get();
    result.stderr_text = err.get();
    return result;
}

} // namespace prism
