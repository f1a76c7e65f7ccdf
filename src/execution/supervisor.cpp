#include "execution/supervisor.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

int supervise(sandbox::sandbox_handle &sandbox, chrono::milliseconds timeout, chrono::milliseconds kill_grace) {
    auto completion = sandbox.completion();
    // wait_for 会把时长换算为纳秒并加到当前时间上，过大的时长会溢出
    const auto longest = chrono::duration_cast<chrono::milliseconds>(chrono::nanoseconds::max()) / 4;
    if (completion.wait_for(min(timeout, longest)) == future_status::ready)
        return completion.get();

    LOG(WARNING) << "Container " << sandbox.id() << " exceeded the time limit of " << timeout.count() << " ms, killing";
    sandbox.try_kill();
    if (completion.wait_for(kill_grace) != future_status::ready)
        sandbox.abandon();
    throw execution_timeout_error(fmt::format("Execution timeout ({} ms)", timeout.count()));
}

}  // namespace runner
