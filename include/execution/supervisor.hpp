#pragma once

#include <chrono>
#include "sandbox/sandbox.hpp"

namespace runner {

/**
 * @brief 让容器的自然结束与时间限制竞争
 * 容器先结束时直接返回退出码；时间限制先到时杀死容器（杀死失败只记录日志，
 * 容器可能正在退出），并在 kill_grace 内等待 wait 请求返回，超过后放弃等待
 * @param sandbox 已经启动的容器
 * @param timeout 时间限制
 * @param kill_grace 杀死容器后等待 wait 请求返回的最长时间
 * @return wait 请求返回的退出码
 * @throw execution_timeout_error 超出时间限制
 * @throw daemon_error wait 请求失败
 */
int supervise(sandbox::sandbox_handle &sandbox, std::chrono::milliseconds timeout,
              std::chrono::milliseconds kill_grace);

}  // namespace runner
