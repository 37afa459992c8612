#pragma once

#include <filesystem>
#include <string>

namespace polyrun {

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
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 写入失败时，错误码为 errno
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 检查文件名是否只由字母、数字、下划线、点和减号组成，且不是 "." 或 ".."
 */
bool is_safe_filename(const std::string &filename);

/**
 * @brief 断言 filename 一定不会跳出工作目录
 * 这里用于确保写入提交文件时不会出现目录遍历攻击，如果拿到的文件名
 * 包含 "../" 或者是绝对路径，那么最后有可能导致宿主机的文件被覆盖。
 * @param filename 被检查的文件名
 * @throw invalid_submission 文件名不安全时
 */
const std::string &assert_safe_path(const std::string &filename);

}  // namespace polyrun
