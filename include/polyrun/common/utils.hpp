#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
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

namespace polyrun {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

bool is_number(const std::string &s);

/**
 * @brief 根据用户名或者用户 id 查找 uid
 * @return uid，若用户不存在返回 -1
 */
int get_userid(const std::string &name);

/**
 * @brief 根据组名或者组 id 查找 gid
 * @return gid，若组不存在返回 -1
 */
int get_groupid(const std::string &name);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace polyrun
