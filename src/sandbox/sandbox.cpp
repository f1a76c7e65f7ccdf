#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"

namespace runner::sandbox {
using namespace std;

confinement_profile confinement_profile::from_config() {
    confinement_profile profile;
    profile.memory_bytes = MEMORY_LIMIT;
    profile.cpu_quota = CPU_QUOTA;
    profile.cpu_period = CPU_PERIOD;
    profile.workspace_mount = WORKSPACE_MOUNT;
    profile.scratch_mount = SCRATCH_MOUNT;
    profile.scratch_size = SCRATCH_SIZE;
    profile.output_limit = OUTPUT_LIMIT;
    return profile;
}

vector<string> wrap_command(const string &command, const confinement_profile &profile) {
    if (profile.scratch_mount.empty())
        return {"sh", "-c", command};
    return {"sh", "-c",
            fmt::format("cp -a {}/. {}/ && cd {} && {}",
                        profile.workspace_mount, profile.scratch_mount, profile.scratch_mount, command)};
}

unique_ptr<sandbox_handle> launch_sandbox(container_runtime &runtime, const string &image, const string &command,
                                          const filesystem::path &workspace, const confinement_profile &profile,
                                          chrono::milliseconds ready_timeout) {
    container_spec spec;
    spec.image = image;
    spec.command = wrap_command(command, profile);
    spec.workspace = workspace;
    spec.profile = profile;

    string id = runtime.create_container(spec);
    LOG(INFO) << "Created container " << id << " from image " << image;

    // 从这里开始，任何异常都会让 handle 析构并删除容器
    auto handle = make_unique<sandbox_handle>(runtime, id, profile.output_limit);
    handle->attach(ready_timeout);
    handle->start();
    return handle;
}

sandbox_handle::sandbox_handle(container_runtime &runtime, string id, int64_t output_limit)
    : runtime(runtime), container_id(move(id)), output_limit(output_limit) {}

sandbox_handle::~sandbox_handle() {
    if (!started) {
        try {
            runtime.remove_container(container_id);
            VLOG(1) << "Removed unstarted container " << container_id;
        } catch (exception &ex) {
            LOG(WARNING) << "Unable to remove container " << container_id << ": " << ex.what();
        }
    } else if (exit_status.valid() && exit_status.wait_for(chrono::seconds(0)) != future_status::ready) {
        try_kill();
    }

    cancelled = true;
    if (output_thread.joinable())
        output_thread.join();
    if (exit_status.valid())
        exit_status.wait();
}

const string &sandbox_handle::id() const {
    return container_id;
}

shared_future<int> sandbox_handle::completion() const {
    return exit_status;
}

void sandbox_handle::attach(chrono::milliseconds ready_timeout) {
    output_thread = thread([this] {
        bool signalled = false;
        ready_callback on_ready = [this, &signalled] {
            if (signalled) return;
            signalled = true;
            ready.count_down();
        };
        // 请求失败时也要计数，否则 launch_sandbox 会一直等到超时
        defer {
            on_ready();
            chunks.close();
        };

        try {
            runtime.attach_output(
                container_id, [this](string chunk) { collect(move(chunk)); }, cancelled, on_ready);
        } catch (exception &ex) {
            LOG(WARNING) << "Output stream of container " << container_id << " failed: " << ex.what();
            lock_guard<mutex> guard(error_mut);
            if (!output_error)
                output_error = ex.what();
        }
    });

    exit_status = async(launch::async, [this] {
                      bool signalled = false;
                      ready_callback on_ready = [this, &signalled] {
                          if (signalled) return;
                          signalled = true;
                          ready.count_down();
                      };
                      try {
                          int code = runtime.wait_container(container_id, cancelled, on_ready);
                          on_ready();
                          return code;
                      } catch (exception &ex) {
                          {
                              lock_guard<mutex> guard(error_mut);
                              wait_error = ex.what();
                          }
                          on_ready();
                          throw;
                      }
                  }).share();

    if (ready.wait_for(boost::chrono::milliseconds(ready_timeout.count())) == boost::cv_status::timeout)
        throw sandbox_creation_error(fmt::format("Container {} was not ready within {} ms", container_id, ready_timeout.count()));

    lock_guard<mutex> guard(error_mut);
    if (wait_error)
        throw sandbox_creation_error(fmt::format("Unable to wait for container {}: {}", container_id, *wait_error));
    if (output_error)
        throw sandbox_creation_error(fmt::format("Unable to attach to container {}: {}", container_id, *output_error));
}

void sandbox_handle::collect(string chunk) {
    if (output_truncated) return;
    if (output_bytes + static_cast<int64_t>(chunk.size()) > output_limit) {
        output_truncated = true;
        LOG(WARNING) << "Container " << container_id << " exceeded the output limit of " << output_limit
                     << " bytes, killing";
        {
            lock_guard<mutex> guard(error_mut);
            output_error = fmt::format("Output limit exceeded ({} bytes)", output_limit);
        }
        try_kill();
        return;
    }
    output_bytes += chunk.size();
    chunks.push(move(chunk));
}

void sandbox_handle::start() {
    runtime.start_container(container_id);
    started = true;
    LOG(INFO) << "Started container " << container_id;
}

bool sandbox_handle::try_kill() noexcept {
    try {
        runtime.kill_container(container_id);
        LOG(INFO) << "Killed container " << container_id;
        return true;
    } catch (exception &ex) {
        LOG(WARNING) << "Unable to kill container " << container_id << ", it may have already exited: " << ex.what();
        return false;
    }
}

optional<int> sandbox_handle::inspect_exit_code() {
    try {
        if (auto code = runtime.inspect_exit_code(container_id))
            return code;
    } catch (runner_exception &ex) {
        LOG(WARNING) << "Unable to inspect container " << container_id << ": " << ex.what();
    }

    if (exit_status.valid() && exit_status.wait_for(chrono::seconds(0)) == future_status::ready) {
        try {
            return exit_status.get();
        } catch (runner_exception &ex) {
            VLOG(1) << "No exit status of container " << container_id << ": " << ex.what();
        }
    }
    return nullopt;
}

concurrent_queue<string> &sandbox_handle::output_chunks() {
    return chunks;
}

optional<string> sandbox_handle::stream_error() const {
    lock_guard<mutex> guard(error_mut);
    return output_error;
}

void sandbox_handle::abandon() {
    LOG(WARNING) << "Abandoning pending requests of container " << container_id;
    cancelled = true;
}

}  // namespace runner::sandbox
