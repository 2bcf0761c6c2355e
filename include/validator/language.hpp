#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "sandbox/executor.hpp"
#include "validator/submission.hpp"

namespace validator {

/**
 * @brief 编译错误
 * 选手代码无法通过编译，或者找不到题目要求的函数
 */
struct compilation_error : public validator_exception {
    /**
     * @brief 编译器的输出，已经截断
     */
    std::string error_log;

    compilation_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 一种语言的编译和运行方式
 * 命令中可以使用 {dir}（沙箱内看到的程序目录）和 {source}（源代码文件名）
 *
 * @code{.json}
 * "cpp": {
 *     "source": "main.cpp",
 *     "compile": ["g++", "-O2", "-std=c++17", "-o", "{dir}/program", "{dir}/{source}"],
 *     "run": ["{dir}/program"],
 *     "entry_pattern": "\\b{entry}\\s*\\("
 * }
 * @endcode
 */
struct language {
    std::string name;

    /**
     * @brief 选手代码保存的文件名
     */
    std::string source;

    /**
     * @brief 编译命令，为空表示解释执行不需要编译
     */
    std::vector<std::string> compile;

    std::vector<std::string> run;

    /**
     * @brief 检查选手代码中是否定义了题目要求的函数的正则表达式，{entry} 会被替换为函数名
     * 为空表示不检查
     */
    std::string entry_pattern;

    int64_t compile_time_limit_ms = -1;

    int64_t compile_memory_limit = -1;
};

void from_json(const nlohmann::json &j, language &lang);

/**
 * @brief 从 JSON 文件中读取所有语言的配置
 * 文件内容为语言名到语言配置的映射
 */
std::map<std::string, language> load_languages(const std::filesystem::path &path);

/**
 * @brief 将命令中的 {source} 替换为源代码文件名
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command, const language &lang);

/**
 * @brief 检查选手代码中是否定义了名为 entry 的函数
 * @return 若语言没有配置 entry_pattern，返回 true
 */
bool has_entry_point(const language &lang, const std::string &source_code, const std::string &entry);

/**
 * @brief 编译步骤，根据选手代码的语言生成可运行的程序
 */
struct compiler {
    virtual ~compiler();

    /**
     * @brief 编译选手代码
     * @param submit 选手提交
     * @param workdir 提交的工作目录，编译器在其中创建 program 和 scratch 目录
     * @param token 取消标记
     * @return 可以在沙箱中运行的程序
     * @throw compilation_error 选手代码编译失败
     * @throw sandbox_error 沙箱建立失败（已经重试过）
     */
    virtual artifact compile(const submission &submit, const std::filesystem::path &workdir, cancellation_token &token) = 0;
};

/**
 * @brief 通过配置文件中的命令编译选手代码
 * 编译命令也在沙箱中运行，此时程序目录可写
 */
struct toolchain : public compiler {
    toolchain(executor &exec, std::map<std::string, language> languages);

    artifact compile(const submission &submit, const std::filesystem::path &workdir, cancellation_token &token) override;

    const std::map<std::string, language> &languages() const;

private:
    executor &exec;
    std::map<std::string, language> langs;
};

}  // namespace validator
