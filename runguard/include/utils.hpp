#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @brief 根据用户名查找用户 id
 * @throw std::runtime_error 用户不存在时
 */
int get_userid(const char *name);

/**
 * @brief 根据组名查找组 id
 * @throw std::runtime_error 组不存在时
 */
int get_groupid(const char *name);

/**
 * @brief 解析 src:dst[:rw] 格式的挂载描述
 */
struct mount_point parse_mount_point(const std::string &spec);
