#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace polyrun {

struct polyrun_exception : std::exception {
    polyrun_exception();
    explicit polyrun_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const polyrun_exception &ex);

    template <typename T>
    polyrun_exception operator<<(const T &t) const {
        return polyrun_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 比如文件系统损坏、fork 失败等与提交内容无关的错误
 */
struct internal_error : public polyrun_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示宿主机资源耗尽
 * 一般是创建工作目录时磁盘空间、inode 或配额不足，或者同时存在的工作目录过多
 */
struct resource_exhausted : public polyrun_exception {
    resource_exhausted();
    explicit resource_exhausted(const std::string &message);
};

/**
 * @brief 表示提交使用了未注册的语言
 */
struct unsupported_language : public polyrun_exception {
    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 表示提交本身不合法，比如文件名试图跳出工作目录
 */
struct invalid_submission : public polyrun_exception {
    explicit invalid_submission(const std::string &message);
};

}  // namespace polyrun
