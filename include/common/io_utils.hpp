#pragma once

#include <filesystem>
#include <string>

namespace validator {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文件开头最多 limit 个字节
 * 用于读取选手程序的输出，避免把超大的文件整个读进内存
 * @param truncated 若文件比 limit 长，则设为 true
 */
std::string read_file_prefix(const std::filesystem::path &path, size_t limit, bool &truncated);

/**
 * @brief 将 content 写入文件，文件已存在则覆盖
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于评测系统
 * 运行时需要 root 权限，如果拿到的文件名包含 "../" 或者是绝对路径，
 * 那么最后有可能导致系统重要文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 截断过长的文本，截断后以 "..." 结尾
 */
std::string excerpt(const std::string &text, size_t limit);

}  // namespace validator
