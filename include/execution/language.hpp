#pragma once

#include <string>
#include <vector>

namespace runner {

/**
 * @brief 支持的编程语言
 * 每种语言对应一个预先构建好的镜像，镜像中包含该语言的编译器或者解释器
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    C,
    CPP,
    JAVA
};

/**
 * @brief 解析语言名，不区分大小写
 * 除了 python、javascript、c、cpp、java 之外，还接受 js、node、c++ 这几个别名
 * @throw unsupported_language_error 语言不在支持列表中
 */
language parse_language(const std::string &name);

/**
 * @brief 语言的规范名称，比如 "cpp"
 */
const char *get_language_name(language lang);

/**
 * @brief 语言对应的镜像名
 * @param prefix 镜像名前缀，一般为 IMAGE_PREFIX
 * @return 比如 prefix 为 "runner-" 时，javascript 对应 "runner-node"
 */
std::string get_image_name(language lang, const std::string &prefix);

/**
 * @brief 判断文件是否为该语言的源文件（按扩展名），只有扩展名的文件（比如 .c）不算
 */
bool has_language_extension(language lang, const std::string &path);

/**
 * @brief 一次执行的运行方案，计算完成后不再修改
 */
struct language_plan {
    /**
     * @brief 运行该语言的镜像名
     */
    std::string image_name;

    /**
     * @brief 入口文件相对于工作目录的路径
     */
    std::string entry_file;

    /**
     * @brief 在容器内通过 sh -c 执行的命令
     * 编译型语言为 "编译 && 运行" 的形式，编译失败时命令返回非零值，
     * 编译器的输出会出现在 stderr 中
     */
    std::string run_command;
};

/**
 * @brief 选择入口文件
 * 优先选择扩展名匹配且文件名为规范入口名的文件（main.py、main.js、main.c、
 * 包含 main. 的 C++ 文件、Main.java），比较时检查路径是否等于 name 或以 /name 结尾；
 * 找不到时选择第一个扩展名匹配的文件
 * @param files 工作目录中的文件（规范化的相对路径，按提交顺序）
 * @throw entry_file_not_found_error 没有扩展名匹配的文件
 */
std::string select_entry_file(language lang, const std::vector<std::string> &files);

/**
 * @brief 根据语言和文件列表计算运行方案
 * 入口文件路径会被拼接进 shell 命令，因此要求只包含 [A-Za-z0-9._/-] 且不以 - 开头
 * @throw entry_file_not_found_error 没有扩展名匹配的文件
 * @throw invalid_path_error 入口文件路径包含不允许出现在命令中的字符
 */
language_plan resolve_plan(language lang, const std::vector<std::string> &files, const std::string &image_prefix);

}  // namespace runner
