#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace validator {

struct validator_exception : std::exception {
    validator_exception();
    explicit validator_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const validator_exception &ex);

    template <typename T>
    validator_exception operator<<(const T &t) const {
        return validator_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测引擎的内部错误
 * 一般是 runguard 本身或者运行目录的问题，与选手代码无关
 */
struct internal_error : public validator_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示沙箱无法建立（对应 SandboxSetupFailed）
 * 比如 cgroup 创建失败、chroot 失败、runguard 无法启动
 */
struct sandbox_error : public internal_error {
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示评测队列已满，提交被拒绝
 * 调度器会先自动重试一次，仍然失败时才抛出
 */
struct overloaded_error : public validator_exception {
    explicit overloaded_error(const std::string &message);
};

}  // namespace validator
