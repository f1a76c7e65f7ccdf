#include "execution/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include <system_error>
#include <thread>
#include "common/exceptions.hpp"
#include "common/status.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/stream_demux.hpp"
#include "execution/supervisor.hpp"
#include "execution/workspace.hpp"
#include "sandbox/sandbox.hpp"

namespace runner {
using namespace std;

executor_options executor_options::from_config() {
    executor_options options;
    options.temp_dir = TEMP_DIR;
    options.profile = sandbox::confinement_profile::from_config();
    options.image_prefix = IMAGE_PREFIX;
    options.max_timeout = MAX_TIMEOUT;
    options.log_grace = LOG_GRACE;
    options.kill_grace = KILL_GRACE;
    options.ready_timeout = READY_TIMEOUT;
    return options;
}

executor::executor(sandbox::container_runtime &runtime, executor_options options)
    : runtime(runtime), options(move(options)) {}

execution_outcome executor::execute(const execution_request &request) const {
    elapsed_time timer;
    execution_state state = execution_state::PENDING;
    string tag = "-";
    auto transit = [&](execution_state next) {
        state = next;
        LOG(INFO) << "[" << tag << "] " << get_display_message(next);
    };

    execution_outcome outcome;
    unique_ptr<workspace> ws;
    try {
        if (request.timeout.count() <= 0 || request.timeout > options.max_timeout)
            throw invalid_request_error(fmt::format("Timeout must be between 1 and {} ms, got {} ms",
                                                    options.max_timeout.count(), request.timeout.count()));

        transit(execution_state::MATERIALIZING);
        ws = make_unique<workspace>(options.temp_dir);
        tag = ws->name();
        vector<string> files = ws->materialize(request.files);

        transit(execution_state::RESOLVING);
        language_plan plan = resolve_plan(request.lang, files, options.image_prefix);
        LOG(INFO) << "[" << tag << "] " << get_language_name(request.lang) << " job, image " << plan.image_name
                  << ", entry " << plan.entry_file << ", command: " << plan.run_command;

        transit(execution_state::STARTING);
        auto sandbox = sandbox::launch_sandbox(runtime, plan.image_name, plan.run_command, ws->root(),
                                               options.profile, options.ready_timeout);

        transit(execution_state::RUNNING);
        optional<string> supervisory_error;
        try {
            supervise(*sandbox, request.timeout, options.kill_grace);
        } catch (execution_timeout_error &ex) {
            LOG(WARNING) << "[" << tag << "] " << ex.what();
            supervisory_error = ex.what();
        } catch (daemon_error &ex) {
            LOG(ERROR) << "[" << tag << "] Lost track of container " << sandbox->id() << ": " << ex.what();
            supervisory_error = ex.what();
        }

        transit(execution_state::FINALIZING);
        // 容器结束后输出流中可能还有没到达的帧
        this_thread::sleep_for(options.log_grace);
        demuxed_output streams;
        drain(sandbox->output_chunks(), streams);
        if (!supervisory_error)
            supervisory_error = sandbox->stream_error();
        optional<int> exit_code;
        if (!supervisory_error)
            exit_code = sandbox->inspect_exit_code();
        outcome = aggregate(streams, exit_code, supervisory_error);
    } catch (runner_exception &ex) {
        LOG(WARNING) << "[" << tag << "] " << get_display_message(state) << " failed: " << ex.what();
        VLOG(1) << ex;
        outcome = failed_outcome(ex.what());
    } catch (system_error &ex) {
        LOG(ERROR) << "[" << tag << "] " << get_display_message(state) << " failed: " << ex.what();
        outcome = failed_outcome(ex.what());
    }

    transit(execution_state::CLEANING_UP);
    if (ws) ws->remove();

    transit(execution_state::DONE);
    LOG(INFO) << "[" << tag << "] Finished in " << timer.duration<chrono::milliseconds>().count() << " ms, success: "
              << boolalpha << outcome.success << ", exit code: " << outcome.exit_code;
    return outcome;
}

execution_outcome executor::execute(const string &language, const vector<source_file> &files,
                                    optional<chrono::milliseconds> timeout) const {
    execution_request request;
    try {
        request.lang = parse_language(language);
    } catch (unsupported_language_error &ex) {
        LOG(WARNING) << "Rejected job: " << ex.what();
        return failed_outcome(ex.what());
    }
    request.files = files;
    if (timeout) request.timeout = *timeout;
    return execute(request);
}

}  // namespace runner
