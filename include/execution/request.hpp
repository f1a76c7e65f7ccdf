#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <vector>
#include "execution/language.hpp"
#include "execution/workspace.hpp"
#include "config.hpp"

namespace runner {

/**
 * @brief 一次执行请求
 */
struct execution_request {
    language lang = language::PYTHON;

    /**
     * @brief 源文件，按提交顺序排列，不为空
     */
    std::vector<source_file> files;

    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
};

void from_json(const nlohmann::json &j, source_file &file);

/**
 * @brief 解析 JSON 格式的执行请求
 * @code{.json}
 * {
 *     "language": "java",
 *     "files": [
 *         {"path": "src/Main.java", "content": "public class Main { ... }"}
 *     ],
 *     "timeoutMs": 1000
 * }
 * @endcode
 * 时间限制也可以用 timeout 字段提供，两者都没有时使用 DEFAULT_TIMEOUT
 * @throw invalid_request_error 缺少字段、字段类型不正确、文件列表为空或者时间限制不是正数
 * @throw unsupported_language_error 语言不在支持列表中
 */
execution_request parse_request(const nlohmann::json &document);

}  // namespace runner
