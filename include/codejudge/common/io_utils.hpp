#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 覆盖写入文本文件
 * @throws std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 选手代码决定了 Java 源文件的文件名，如果拿到的文件名包含 "../"，
 * 那么最后有可能写到工作目录之外。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 在 root 下创建一个名字随机的新文件夹
 * 文件夹名为 prefix + uuid，create_directory 保证不会和已有的文件夹重名
 * @param root 父文件夹
 * @param prefix 文件夹名前缀
 * @return 新文件夹的路径
 */
std::filesystem::path create_unique_directory(const std::filesystem::path &root, const std::string &prefix);

/**
 * @brief 递归删除文件夹，失败时只记录日志
 * @return 是否删除成功
 */
bool remove_directory_quietly(const std::filesystem::path &dir) noexcept;

}  // namespace codejudge
