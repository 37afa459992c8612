#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "polyrun/runner/limits.hpp"

namespace polyrun {

/**
 * @brief 一个测试点
 */
struct test_case {
    std::string name;
    std::string input;
    std::string expected_output;
};

/**
 * @brief 一次代码执行请求
 */
struct submission {
    /**
     * @brief 调用方给出的编号，原样返回在结果中，可以为空
     */
    std::string id;

    /**
     * @brief 语言标识符或别名
     */
    std::string language;

    /**
     * @brief 源代码，会被写入语言规定的源文件名
     */
    std::string source;

    /**
     * @brief 标准输入
     */
    std::optional<std::string> stdin_data;

    /**
     * @brief 与源代码放在同一目录下的附加文件，文件名到文件内容
     */
    std::map<std::string, std::string> files;

    /**
     * @brief 对语言默认运行限制的覆盖
     */
    limits_override limits;

    /**
     * @brief 测试点，非空时按测试点评测
     */
    std::vector<test_case> tests;
};

void from_json(const nlohmann::json &j, test_case &test);

void from_json(const nlohmann::json &j, submission &sub);

}  // namespace polyrun
