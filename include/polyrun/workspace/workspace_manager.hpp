#pragma once

#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace polyrun {

/**
 * @brief 一次提交独占的工作目录
 */
struct workspace {
    /**
     * @brief 随机生成的 uuid，同时是目录名的一部分
     */
    std::string id;

    /**
     * @brief 工作目录的绝对路径
     */
    std::filesystem::path path;
};

/**
 * @brief 管理运行目录下的所有工作目录
 * 每次提交都会在运行目录下创建一个以 uuid 命名的文件夹，编译和运行都在这个文件夹下进行，
 * 提交处理完成后删除。多个线程可以同时调用。
 */
struct workspace_manager {
    /**
     * @param root 运行目录，所有的工作目录都创建在这个文件夹下
     * @param max_workspaces 最多同时存在的工作目录数，小于等于 0 表示不限制
     * @param owner_uid 若不为 -1，工作目录及写入的文件的所有者会被修改为该用户，以便运行用户能够读写
     * @param owner_gid 工作目录及写入的文件的所有组
     */
    explicit workspace_manager(const std::filesystem::path &root, int max_workspaces = -1,
                               int owner_uid = -1, int owner_gid = -1);

    /**
     * @brief 创建一个新的工作目录
     * @throw resource_exhausted 磁盘空间或者 inode 不足，或者工作目录数达到上限
     * @throw internal_error 其他无法创建文件夹的情况
     */
    workspace provision();

    /**
     * @brief 在工作目录下写入一个文件
     * @param filename 文件名，不能包含路径
     * @throw invalid_submission 文件名不安全
     * @throw resource_exhausted 磁盘空间不足
     */
    void write_file(const workspace &ws, const std::string &filename, const std::string &content);

    /**
     * @brief 删除工作目录
     * 可以重复调用。删除失败时只记录日志，不会抛出异常。
     */
    void dispose(const workspace &ws) noexcept;

    /**
     * @brief 当前存在的工作目录数
     */
    size_t active() const;

    const std::filesystem::path &root() const;

private:
    std::filesystem::path root_dir;
    int max_workspaces;
    int owner_uid, owner_gid;

    mutable std::mutex mut;
    std::set<std::string> live;
};

/**
 * @brief 在构造时创建工作目录，析构时删除
 */
struct scoped_workspace {
    explicit scoped_workspace(workspace_manager &manager);
    ~scoped_workspace();

    scoped_workspace(const scoped_workspace &) = delete;
    scoped_workspace &operator=(const scoped_workspace &) = delete;

    const workspace &get() const;

    const std::filesystem::path &path() const;

private:
    workspace_manager &manager;
    workspace ws;
};

}  // namespace polyrun
