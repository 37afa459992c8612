#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

/**
 * @brief 读取 j[keys...]，不存在时返回 def_value
 * @throw std::invalid_argument 值存在但类型不正确
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 若 j[keys...] 存在，则读入 value，否则 value 保持不变
 * @throw std::invalid_argument 值存在但类型不正确
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return;
    try {
        value = ref->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 将 JSON 序列化为一行文本
 * 程序输出不一定是合法的 UTF-8，非法的字节会被替换为 U+FFFD 而不是抛出异常
 */
inline std::string dump_line(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace nlohmann
