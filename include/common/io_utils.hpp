#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开时抛出
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 原样写入文件，文件已存在时将被覆盖
 * @param path 文件路径，父目录必须已经存在
 * @param content 写入的内容
 * @throw std::system_error 文件无法打开或者写入失败时抛出
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将反斜杠转换为正斜杠，并做词法上的规范化（去除 . 和多余的 /）
 * @param subpath 用户提交的相对路径
 * @return 规范化之后的相对路径，比如 "src\\.\\Main.java" 变为 "src/Main.java"
 */
std::string normalize_path(const std::string &subpath);

/**
 * @brief 计算 subpath 在 root 下的实际路径，并确保结果不会跑出 root
 * 这里用于防止目录遍历攻击，如果拿到的文件名包含 "../" 并且
 * 规范化之后指向 root 之外的位置，写文件时就有可能覆盖系统文件。
 * @param root 工作目录
 * @param subpath 被检查的文件名，允许使用反斜杠作为分隔符
 * @return root 下的绝对路径
 * @throw invalid_path_error subpath 为空、为绝对路径或者跑出了 root
 */
std::filesystem::path resolve_safe_path(const std::filesystem::path &root, const std::string &subpath);

/**
 * @brief 在 parent 下创建一个唯一命名的临时文件夹
 * @param parent 临时文件夹的父目录
 * @param prefix 临时文件夹名的前缀，后面会附加 6 个随机字符
 * @return 新创建的文件夹路径
 * @throw std::system_error 创建失败时抛出
 */
std::filesystem::path create_temp_directory(const std::filesystem::path &parent, const std::string &prefix);

/**
 * @brief 确定并创建存放工作目录的临时文件夹
 * 工作目录会被绑定挂载进容器，守护进程要求使用绝对路径
 * @param configured 用户指定的文件夹，为空时使用系统临时目录（TMPDIR）
 * @return 已经存在的绝对路径
 * @throw std::filesystem::filesystem_error 系统临时目录不存在或者无法创建文件夹
 */
std::filesystem::path prepare_temp_root(const std::filesystem::path &configured);

}  // namespace runner
