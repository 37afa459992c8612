#include "polyrun/workspace/workspace_manager.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "polyrun/common/exceptions.hpp"
#include "polyrun/common/io_utils.hpp"
#include "polyrun/common/utils.hpp"

namespace polyrun {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 磁盘空间、配额、文件描述符不足时不是内部错误，而是资源耗尽，调用方可以稍后重试
 */
static bool is_exhaustion(const error_code &ec) {
    if (ec.category() != generic_category() && ec.category() != system_category())
        return false;
    switch (ec.value()) {
        case ENOSPC:
        case EDQUOT:
        case EMFILE:
        case ENFILE:
            return true;
        default:
            return false;
    }
}

/**
 * @brief 运行的程序可能会把自己创建的文件夹设为只读，删除前恢复所有者的权限
 */
static void make_writable(const fs::path &dir) {
    error_code ec;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_symlink(ec)) continue;
        fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        ec.clear();
    }
}

workspace_manager::workspace_manager(const fs::path &root, int max_workspaces, int owner_uid, int owner_gid)
    : root_dir(fs::absolute(root)), max_workspaces(max_workspaces), owner_uid(owner_uid), owner_gid(owner_gid) {
}

workspace workspace_manager::provision() {
    lock_guard<mutex> guard(mut);

    if (max_workspaces > 0 && live.size() >= (size_t)max_workspaces)
        throw resource_exhausted(fmt::format("Too many workspaces ({} in use)", live.size()));

    error_code ec;
    fs::create_directories(root_dir, ec);
    if (ec) {
        if (is_exhaustion(ec))
            throw resource_exhausted(fmt::format("Unable to create run directory {}: {}", root_dir, ec.message()));
        throw internal_error(fmt::format("Unable to create run directory {}: {}", root_dir, ec.message()));
    }

    workspace ws;
    ws.id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    ws.path = root_dir / ("run-" + ws.id);

    if (!fs::create_directory(ws.path, ec)) {
        if (!ec) ec = make_error_code(errc::file_exists);
        if (is_exhaustion(ec))
            throw resource_exhausted(fmt::format("Unable to create workspace {}: {}", ws.path, ec.message()));
        throw internal_error(fmt::format("Unable to create workspace {}: {}", ws.path, ec.message()));
    }

    if (owner_uid >= 0 && chown(ws.path.c_str(), owner_uid, owner_gid) != 0) {
        int err = errno;
        fs::remove_all(ws.path, ec);
        throw internal_error(fmt::format("Unable to change owner of workspace {}: {}", ws.path, strerror(err)));
    }

    live.insert(ws.id);
    LOG(INFO) << "workspace " << ws.path << " provisioned";
    return ws;
}

void workspace_manager::write_file(const workspace &ws, const string &filename, const string &content) {
    fs::path path = ws.path / assert_safe_path(filename);
    try {
        write_file_content(path, content);
    } catch (system_error &ex) {
        if (is_exhaustion(ex.code()))
            throw resource_exhausted(fmt::format("Unable to write {}: {}", path, ex.code().message()));
        throw internal_error(fmt::format("Unable to write {}: {}", path, ex.code().message()));
    }

    if (owner_uid >= 0 && chown(path.c_str(), owner_uid, owner_gid) != 0)
        throw internal_error(fmt::format("Unable to change owner of {}: {}", path, strerror(errno)));
}

void workspace_manager::dispose(const workspace &ws) noexcept {
    {
        lock_guard<mutex> guard(mut);
        live.erase(ws.id);
    }

    if (ws.path.empty()) return;

    error_code ec;
    fs::remove_all(ws.path, ec);
    if (ec) {
        make_writable(ws.path);
        ec.clear();
        fs::remove_all(ws.path, ec);
    }

    if (ec)
        LOG(ERROR) << "unable to remove workspace " << ws.path << ": " << ec.message();
    else
        LOG(INFO) << "workspace " << ws.path << " disposed";
}

size_t workspace_manager::active() const {
    lock_guard<mutex> guard(mut);
    return live.size();
}

const fs::path &workspace_manager::root() const {
    return root_dir;
}

scoped_workspace::scoped_workspace(workspace_manager &manager)
    : manager(manager), ws(manager.provision()) {
}

scoped_workspace::~scoped_workspace() {
    manager.dispose(ws);
}

const workspace &scoped_workspace::get() const {
    return ws;
}

const fs::path &scoped_workspace::path() const {
    return ws.path;
}

}  // namespace polyrun
