#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "polyrun/language/language_spec.hpp"

namespace polyrun {

/**
 * @brief 语言标识符到编译运行方式的映射
 * 在启动时构建一次，之后只读，可以在多个线程间共享。
 * 标识符和别名不区分大小写。
 */
struct language_registry {
    language_registry() = default;

    explicit language_registry(const std::vector<language_spec> &specs);

    /**
     * @brief 添加一种语言，若标识符已存在则替换原有的设置
     */
    void add(const language_spec &spec);

    /**
     * @brief 根据标识符或别名查找语言
     * @return 找不到时返回 nullptr
     */
    const language_spec *find(const std::string &identifier) const;

    /**
     * @brief 根据标识符或别名查找语言
     * @throw unsupported_language 找不到时
     */
    const language_spec &resolve(const std::string &identifier) const;

    /**
     * @brief 所有语言的标识符（不含别名），按添加顺序排列
     */
    std::vector<std::string> identifiers() const;

    size_t size() const;

    /**
     * @brief 将 JSON 中的语言加入本表
     * JSON 可以是语言数组，也可以是带 "languages" 数组的对象
     */
    void merge(const nlohmann::json &j);

    /**
     * @brief 内置的语言：c、cpp、java、python、javascript、csharp
     */
    static language_registry builtin();

    /**
     * @brief 从 JSON 文件读取语言设置
     * @param with_builtin 为真时在内置语言的基础上添加或替换
     */
    static language_registry load_file(const std::filesystem::path &path, bool with_builtin = true);

private:
    std::vector<language_spec> specs;
    // 小写的标识符和别名到 specs 下标的映射
    std::map<std::string, size_t> index;
};

}  // namespace polyrun
