#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace runner {

/**
 * @brief 执行引擎所有异常的基类
 * 构造时会记录调用栈，输出到日志时可以打印出异常抛出的位置
 */
struct runner_exception : std::exception {
    runner_exception();
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交的文件路径不合法
 * 路径规范化之后跑出了工作目录（比如包含 ../），或者是绝对路径、空路径。
 * 在创建任何容器之前就会抛出
 */
struct invalid_path_error : public runner_exception {
    explicit invalid_path_error(const std::string &message);
};

/**
 * @brief 表示不支持的编程语言
 */
struct unsupported_language_error : public runner_exception {
    explicit unsupported_language_error(const std::string &message);
};

/**
 * @brief 表示找不到与语言匹配的入口文件
 */
struct entry_file_not_found_error : public runner_exception {
    explicit entry_file_not_found_error(const std::string &message);
};

/**
 * @brief 表示容器创建或者启动失败
 * 一般是镜像不存在，或者资源限制被守护进程拒绝
 */
struct sandbox_creation_error : public runner_exception {
    explicit sandbox_creation_error(const std::string &message);
};

/**
 * @brief 表示程序运行超出时间限制，容器已被强制杀死
 */
struct execution_timeout_error : public runner_exception {
    explicit execution_timeout_error(const std::string &message);
};

/**
 * @brief 表示与容器守护进程通信失败，通常由 CURL 产生
 */
struct daemon_error : public runner_exception {
    explicit daemon_error(const std::string &message);
};

/**
 * @brief 表示执行请求的格式不正确
 */
struct invalid_request_error : public runner_exception {
    explicit invalid_request_error(const std::string &message);
};

}  // namespace runner
