#pragma once

#include <sys/types.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace polyrun {

/**
 * @brief /proc/[pid]/stat 中我们关心的字段
 * @see man 5 proc
 */
struct proc_stat {
    pid_t pid;
    char state;
    pid_t ppid;
    pid_t pgrp;
    // 常驻内存页数
    int64_t rss_pages;
};

/**
 * @brief 解析 /proc/[pid]/stat 的一行内容
 * 进程名可能包含空格和括号，因此从最后一个 ')' 之后开始解析
 * @return 格式不正确时返回 nullopt
 */
std::optional<proc_stat> parse_proc_stat(const std::string &line);

/**
 * @brief 读取指定进程的 /proc/[pid]/stat
 * @return 进程不存在时返回 nullopt
 */
std::optional<proc_stat> read_proc_stat(pid_t pid);

/**
 * @brief 列出进程组 pgid 中所有存活的进程（不包括僵尸进程）
 */
std::vector<proc_stat> list_process_group(pid_t pgid);

/**
 * @brief 统计进程组 pgid 中所有进程的常驻内存之和（字节）
 */
int64_t process_group_rss(pid_t pgid);

/**
 * @brief 读取进程所在的挂载命名空间，如 "mnt:[4026531840]"
 * @return 进程不存在、已经成为僵尸进程或者没有权限时返回空字符串
 */
std::string read_mount_namespace(pid_t pid);

/**
 * @brief 列出挂载命名空间 ns 中所有存活的进程
 */
std::vector<pid_t> list_mount_namespace(const std::string &ns);

/**
 * @brief 列出当前挂载命名空间中的所有挂载点，父挂载点在前
 * 挂载点路径中的空格等字符在 /proc/self/mountinfo 中以 \ooo 转义，返回值是转义前的路径
 */
std::vector<std::string> list_mount_points();

}  // namespace polyrun
