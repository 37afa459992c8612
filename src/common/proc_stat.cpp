#include "polyrun/common/proc_stat.hpp"
#include <unistd.h>
#include <cctype>
#include <filesystem>
#include <sstream>
#include "polyrun/common/io_utils.hpp"

namespace polyrun {
using namespace std;
namespace fs = std::filesystem;

optional<proc_stat> parse_proc_stat(const string &line) {
    auto lparen = line.find('(');
    auto rparen = line.rfind(')');
    if (lparen == string::npos || rparen == string::npos || rparen < lparen)
        return nullopt;

    proc_stat stat;
    try {
        stat.pid = stoi(line.substr(0, lparen));
    } catch (exception &) {
        return nullopt;
    }

    // 字段 3 (state) 起，rss 是第 24 个字段
    istringstream fields(line.substr(rparen + 1));
    vector<string> tokens;
    string token;
    while (fields >> token && tokens.size() < 22)
        tokens.push_back(token);
    if (tokens.size() < 22 || tokens[0].size() != 1)
        return nullopt;

    try {
        stat.state = tokens[0][0];
        stat.ppid = stoi(tokens[1]);
        stat.pgrp = stoi(tokens[2]);
        stat.rss_pages = stoll(tokens[21]);
    } catch (exception &) {
        return nullopt;
    }
    return stat;
}

optional<proc_stat> read_proc_stat(pid_t pid) {
    string content = read_file_content(fs::path("/proc") / to_string(pid) / "stat", "");
    if (content.empty()) return nullopt;
    return parse_proc_stat(content);
}

/**
 * @brief 列出 /proc 下的所有进程号
 */
static vector<pid_t> list_pids() {
    vector<pid_t> pids;
    error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const string name = it->path().filename().string();
        if (name.empty() || !isdigit(static_cast<unsigned char>(name[0]))) continue;

        try {
            pids.push_back(stoi(name));
        } catch (exception &) {
            continue;
        }
    }
    return pids;
}

vector<proc_stat> list_process_group(pid_t pgid) {
    vector<proc_stat> result;
    for (pid_t pid : list_pids()) {
        // 在遍历过程中进程可能已经退出
        auto stat = read_proc_stat(pid);
        if (stat && stat->pgrp == pgid && stat->state != 'Z')
            result.push_back(*stat);
    }
    return result;
}

int64_t process_group_rss(pid_t pgid) {
    static const int64_t page_size = sysconf(_SC_PAGESIZE);
    int64_t pages = 0;
    for (auto &stat : list_process_group(pgid))
        pages += stat.rss_pages;
    return pages * page_size;
}

string read_mount_namespace(pid_t pid) {
    error_code ec;
    fs::path link = fs::read_symlink(fs::path("/proc") / to_string(pid) / "ns" / "mnt", ec);
    if (ec) return "";
    return link.string();
}

vector<pid_t> list_mount_namespace(const string &ns) {
    vector<pid_t> result;
    if (ns.empty()) return result;
    for (pid_t pid : list_pids())
        if (read_mount_namespace(pid) == ns)
            result.push_back(pid);
    return result;
}

/**
 * @brief 还原 mountinfo 中 \ooo 形式的八进制转义
 */
static string unescape_mount_path(const string &path) {
    string result;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '\\' && i + 3 < path.size() &&
            isdigit(static_cast<unsigned char>(path[i + 1])) &&
            isdigit(static_cast<unsigned char>(path[i + 2])) &&
            isdigit(static_cast<unsigned char>(path[i + 3]))) {
            result += (char)((path[i + 1] - '0') * 64 + (path[i + 2] - '0') * 8 + (path[i + 3] - '0'));
            i += 3;
        } else {
            result += path[i];
        }
    }
    return result;
}

vector<string> list_mount_points() {
    // 每一行: mount-id parent-id major:minor root mount-point options ...
    istringstream mountinfo(read_file_content("/proc/self/mountinfo"));
    vector<string> result;
    string line;
    while (getline(mountinfo, line)) {
        istringstream fields(line);
        string mount_id, parent_id, device, root, mount_point;
        if (fields >> mount_id >> parent_id >> device >> root >> mount_point)
            result.push_back(unescape_mount_path(mount_point));
    }
    return result;
}

}  // namespace polyrun
