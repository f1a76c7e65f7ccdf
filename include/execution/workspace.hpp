#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * 这个头文件包含执行任务的工作目录
 * 1. source_file 类（表示调用者提交的一个源文件）
 * 2. workspace 类（表示一个任务独占的临时目录）
 */
namespace runner {

/**
 * @brief 调用者提交的一个源文件
 */
struct source_file {
    /**
     * @brief 相对于工作目录的路径
     * 允许使用反斜杠作为分隔符，写入前会统一转换为正斜杠
     * @code{.json}
     * "src/Main.java"
     * @endcode
     */
    std::string path;

    /**
     * @brief 文件内容，原样写入
     */
    std::string content;
};

/**
 * @brief 表示一个任务独占的临时工作目录
 * 构造时在 parent 下创建一个唯一命名的目录，析构时无条件删除整个目录，
 * 因此无论任务成功、失败、超时还是中途抛出异常，工作目录都会被清理
 */
struct workspace {
    /**
     * @param parent 存放工作目录的文件夹，一般为 TEMP_DIR
     * @throw std::system_error 无法创建目录时抛出
     */
    explicit workspace(const std::filesystem::path &parent);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    ~workspace();

    /**
     * @brief 工作目录的根路径
     */
    const std::filesystem::path &root() const;

    /**
     * @brief 工作目录的文件夹名，日志中用于区分不同的任务
     */
    std::string name() const;

    /**
     * @brief 将源文件按顺序写入工作目录
     * 对每个文件，先创建缺少的父目录（目录已存在不视为错误），再写入文件内容。
     * 路径相同的文件，后写入的会覆盖先写入的
     * @param files 调用者提交的源文件
     * @return 写入的文件相对于根路径的规范化路径（使用正斜杠），按首次出现的顺序排列且不重复
     * @throw invalid_path_error 某个文件的路径跑出了工作目录
     */
    std::vector<std::string> materialize(const std::vector<source_file> &files);

    /**
     * @brief 删除工作目录
     * 删除失败时只记录日志，不会抛出异常。重复调用是安全的
     * @return 目录是否已被删除
     */
    bool remove() noexcept;

private:
    std::filesystem::path dir;
    bool removed = false;
};

}  // namespace runner
