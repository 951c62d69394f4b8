#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace codejudge {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 按照 execvp 的规则查找可执行文件
 * 包含 '/' 的名字直接检查该路径，否则依次查找 PATH 中的目录
 * @param name 程序名或程序路径
 * @return 可执行文件的路径，找不到时返回 nullopt
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief 还原 HTML 实体转义过的源代码
 * 仅处理 &lt; &gt; &amp; &quot; &#39; 五种
 */
std::string html_unescape(const std::string &text);

/**
 * @brief 截断过长的文本，截断后追加提示
 * @param text 原文本
 * @param limit 最大字节数
 */
std::string truncate_text(const std::string &text, std::size_t limit);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codejudge
