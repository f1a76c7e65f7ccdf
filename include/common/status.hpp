#pragma once

namespace runner {

/**
 * @brief 表示一次执行任务所处的阶段
 * 任务严格按照顺序推进，任何阶段失败时都会直接跳到 CLEANING_UP，
 * 每个任务最终都会且只会到达一次 DONE
 */
enum class execution_state {
    /**
     * @brief 任务刚被创建，还没有开始处理
     */
    PENDING = 0,

    /**
     * @brief 正在创建临时工作目录并写入源文件
     */
    MATERIALIZING = 1,

    /**
     * @brief 正在根据语言选择镜像、入口文件和运行命令
     */
    RESOLVING = 2,

    /**
     * @brief 正在创建并启动容器
     */
    STARTING = 3,

    /**
     * @brief 容器正在运行，等待程序结束或者超时
     */
    RUNNING = 4,

    /**
     * @brief 程序已经结束（或已被杀死），正在收集输出和退出码
     */
    FINALIZING = 5,

    /**
     * @brief 正在删除临时工作目录
     */
    CLEANING_UP = 6,

    /**
     * @brief 任务结束
     */
    DONE = 7
};

const char *get_display_message(execution_state state);

}  // namespace runner
