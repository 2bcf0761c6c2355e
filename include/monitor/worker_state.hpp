#pragma once

namespace validator {

enum class worker_state {
    /**
     * @brief worker 线程已经启动
     */
    START,

    /**
     * @brief worker 正在评测一个提交
     */
    JUDGING,

    /**
     * @brief worker 空闲，正在等待新的提交
     */
    IDLE,

    /**
     * @brief worker 因为异常而崩溃，information 中为原因
     */
    CRASHED,

    /**
     * @brief worker 线程已经退出
     */
    STOPPED
};

const char *get_display_message(worker_state state);

}  // namespace validator
