#include "polyrun/runner/process_runner.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <system_error>
#include "polyrun/common/defer.hpp"
#include "polyrun/common/proc_stat.hpp"
#include "polyrun/common/utils.hpp"
#include "polyrun/runner/cgroup.hpp"

namespace polyrun {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

// 每次轮询最多从一个管道读取的块数，避免输出很快的程序让我们无法检查超时
static const int MAX_READS_PER_POLL = 16;

// 子进程退出后，最多再花多少时间读取管道中残留的输出
static const int DRAIN_TIMEOUT_MS = 500;

// 清理挂载命名空间时最多发送几轮 SIGKILL
static const int MAX_SWEEP_ROUNDS = 100;

static const char *DEFAULT_PATH = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

[[noreturn]] static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

struct file_descriptor {
    int fd = -1;

    file_descriptor() = default;
    file_descriptor(const file_descriptor &) = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;
    ~file_descriptor() { reset(); }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }

    bool is_open() const { return fd >= 0; }
};

static void make_pipe(file_descriptor &read_end, file_descriptor &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipe");
    read_end.fd = fds[0];
    write_end.fd = fds[1];
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

/**
 * @brief 子进程在 exec 之前失败时通过管道告诉父进程的信息
 */
struct child_error {
    int stage;
    int err;
};

enum child_stage {
    STAGE_SYNC,
    STAGE_SETSID,
    STAGE_UNSHARE,
    STAGE_ID_MAP,
    STAGE_MOUNT,
    STAGE_SIGNALS,
    STAGE_REDIRECT,
    STAGE_CHDIR,
    STAGE_RLIMIT,
    STAGE_SETGID,
    STAGE_SETUID,
    STAGE_EXEC
};

static const char *stage_names[] = {
    "synchronizing with parent",
    "setsid",
    "unsharing namespaces",
    "writing id maps",
    "remounting file systems",
    "resetting signals",
    "redirecting standard streams",
    "changing working directory",
    "setting resource limits",
    "setting group id",
    "setting user id",
    "exec"};

/**
 * @brief fork 之前算好的 rlimit 设置
 * fork 之后子进程中只能调用 async-signal-safe 的函数，不能再分配内存
 */
struct child_limits {
    rlim_t cpu_seconds = RLIM_INFINITY;
    rlim_t file_size = RLIM_INFINITY;
    rlim_t nproc = RLIM_INFINITY;
};

[[noreturn]] static void child_fail(int fd, int stage) {
    child_error e{stage, errno};
    ssize_t ret = write(fd, &e, sizeof(e));
    (void)ret;
    _exit(127);
}

static bool set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

/**
 * @brief fork 之前准备好的命名空间设置
 */
struct isolation_plan {
    int flags = 0;

    /**
     * @brief 写入 /proc/self/uid_map 和 gid_map 的内容，为空时不创建 user 命名空间
     */
    string uid_map, gid_map;

    vector<string> mount_points;
};

static bool write_proc_file(const char *path, const char *content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    size_t size = strlen(content);
    ssize_t nwritten = write(fd, content, size);
    close(fd);
    return nwritten == (ssize_t)size;
}

/**
 * @brief 将挂载点重新挂载为只读
 * 在 user 命名空间中不能清除继承下来的 nosuid、nodev、noexec 和 atime 标志，
 * 因此重新挂载时要带上这些标志
 */
static bool remount_readonly(const char *target) {
    struct statvfs st;
    if (statvfs(target, &st) != 0)
        return errno == ENOENT || errno == EACCES;

    unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY;
    if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (st.f_flag & ST_NOATIME)
        flags |= MS_NOATIME;
    else if (st.f_flag & ST_RELATIME)
        flags |= MS_RELATIME;
    else
        flags |= MS_STRICTATIME;

    if (mount(nullptr, target, nullptr, flags, nullptr) == 0) return true;
    // 被后来的挂载点遮住或者无法访问的挂载点，子进程同样无法写入
    return errno == ENOENT || errno == EACCES || errno == EINVAL;
}

/**
 * @brief 在子进程中建立命名空间，只能调用 async-signal-safe 的函数
 */
static int enter_namespaces(const isolation_plan &plan, const string &work_dir) {
    if (unshare(plan.flags) != 0) return STAGE_UNSHARE;

    if (!plan.uid_map.empty()) {
        if (!write_proc_file("/proc/self/setgroups", "deny") ||
            !write_proc_file("/proc/self/uid_map", plan.uid_map.c_str()) ||
            !write_proc_file("/proc/self/gid_map", plan.gid_map.c_str()))
            return STAGE_ID_MAP;
    }

    // 挂载点的改动不能传播回宿主的命名空间
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return STAGE_MOUNT;
    // 工作目录在所有挂载点变成只读之前绑定到自身，成为一个独立的可写挂载点
    if (mount(work_dir.c_str(), work_dir.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) return STAGE_MOUNT;
    for (auto &target : plan.mount_points) {
        if (target == work_dir) continue;
        if (!remount_readonly(target.c_str())) return STAGE_MOUNT;
    }
    return -1;
}

/**
 * @brief 杀死挂载命名空间 ns 中的所有进程
 * 调用了 setsid 的后代进程离开了子进程的进程组，但仍然留在子进程的命名空间中
 */
static void kill_namespace(const string &ns) {
    static const struct timespec sweep_delay = {0, 10000000L};  // 0.01s
    for (int round = 0; round < MAX_SWEEP_ROUNDS; ++round) {
        vector<pid_t> members = list_mount_namespace(ns);
        if (members.empty()) return;
        for (pid_t member : members) {
            LOG(INFO) << "killing process " << member << " left in " << ns;
            if (kill(member, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "unable to kill process " << member << ": " << strerror(errno);
        }
        nanosleep(&sweep_delay, nullptr);
    }
    LOG(WARNING) << "processes in " << ns << " are still alive after " << MAX_SWEEP_ROUNDS << " rounds of SIGKILL";
}

struct output_stream {
    file_descriptor fd;
    string data;
    int64_t limit = -1;
    int64_t total = 0;
    bool truncated = false;
};

/**
 * @brief 从非阻塞的管道中读取数据
 * 超过 limit 的数据会被读出并丢弃，同时设置 truncated
 */
static void pump(output_stream &s) {
    char buf[BUF_SIZE];
    for (int i = 0; i < MAX_READS_PER_POLL && s.fd.is_open(); ++i) {
        ssize_t nread = read(s.fd.fd, buf, BUF_SIZE);
        if (nread > 0) {
            s.total += nread;
            size_t keep = nread;
            if (s.limit >= 0) {
                int64_t room = max<int64_t>(s.limit - (int64_t)s.data.size(), 0);
                if (room < nread) {
                    keep = room;
                    s.truncated = true;
                }
            }
            s.data.append(buf, keep);
        } else if (nread == 0) {
            // EOF
            s.fd.reset();
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            error(errno, fmt::format("reading from pipe {}", s.fd.fd));
        }
    }
}

struct input_stream {
    file_descriptor fd;
    const string *data = nullptr;
    size_t offset = 0;
};

/**
 * @brief 向子进程的 stdin 写入数据，写完后关闭管道
 * 子进程提前关闭 stdin 时丢弃剩余数据
 */
static void feed(input_stream &in) {
    while (in.fd.is_open() && in.data && in.offset < in.data->size()) {
        size_t to_write = min<size_t>(in.data->size() - in.offset, BUF_SIZE * MAX_READS_PER_POLL);
        ssize_t nwritten = write(in.fd.fd, in.data->data() + in.offset, to_write);
        if (nwritten >= 0) {
            in.offset += nwritten;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else if (errno == EPIPE) {
            LOG(INFO) << "child closed stdin, " << in.data->size() - in.offset << " bytes discarded";
            break;
        } else {
            error(errno, "writing to stdin of child");
        }
    }
    in.fd.reset();
}

/**
 * @brief 杀死进程组，先尝试 SIGTERM，0.1s 后 SIGKILL
 */
static void terminate_group(pid_t pgid) {
    LOG(INFO) << "sending SIGTERM to process group " << pgid;
    if (kill(-pgid, SIGTERM) != 0 && errno != ESRCH)
        error(errno, "sending SIGTERM to command");

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pgid;
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
}

static int64_t to_ms(const struct timeval &tv) {
    return (int64_t)tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

enum class kill_reason {
    NONE,
    WALL_TIME,
    CANCELLED,
    MEMORY
};

process_runner::~process_runner() = default;

local_process_runner::local_process_runner(const sandbox_options &options)
    : options(options) {
    static once_flag sigpipe_flag, cgroup_flag;
    // 向已经退出的子进程的 stdin 写入数据时，不能让 SIGPIPE 杀死我们
    call_once(sigpipe_flag, []() { signal(SIGPIPE, SIG_IGN); });
    if (options.use_cgroup)
        call_once(cgroup_flag, []() { cgroup_guard::init(); });
}

int64_t local_process_runner::spawn_count() const {
    return spawned.load();
}

bool local_process_runner::check_isolation(const filesystem::path &dir) {
    if (!options.isolate) return true;

    run_request request;
    request.command = {"true"};
    request.work_dir = dir;
    request.limits.timeout_ms = 10000;
    run_result result = run(request);
    if (result.stat != status::SUCCESS) {
        LOG(WARNING) << "unable to isolate user programs: " << result.error;
        return false;
    }
    return true;
}

run_result local_process_runner::run(const run_request &request) {
    try {
        return run_process(request);
    } catch (exception &ex) {
        LOG(ERROR) << "unable to run command " << (request.command.empty() ? "" : request.command[0])
                   << ": " << ex.what();
        run_result result;
        result.stat = status::INTERNAL_ERROR;
        result.error = ex.what();
        return result;
    }
}

run_result local_process_runner::run_process(const run_request &request) {
    const resource_limits &limits = request.limits;
    run_result result;

    if (request.command.empty()) {
        result.stat = status::INTERNAL_ERROR;
        result.error = "Empty command";
        return result;
    }

    // 在 fork 之前准备好 argv、envp，子进程中不能分配内存
    vector<string> args = request.command;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    string work_dir = request.work_dir.string();
    map<string, string> env = {
        {"PATH", get_env("PATH", DEFAULT_PATH)},
        {"HOME", work_dir},
        {"TMPDIR", work_dir},
        {"LANG", "C.UTF-8"}};
    for (auto &[key, value] : request.env) env[key] = value;
    vector<string> env_strings;
    for (auto &[key, value] : env) env_strings.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_strings) envp.push_back(entry.data());
    envp.push_back(nullptr);

    child_limits child_lim;
    if (limits.cpu_time_ms > 0) {
        // 硬限制比软限制多一秒：到达软限制时内核发送 SIGXCPU，到达硬限制时发送 SIGKILL。
        // 默认情况下 SIGXCPU 不会被捕获，这样我们可以通过 SIGXCPU 判断 CPU 时间超限
        child_lim.cpu_seconds = (rlim_t)ceil(limits.cpu_time_ms / 1000.0);
    }
    if (limits.file_size_bytes > 0) child_lim.file_size = limits.file_size_bytes;
    if (limits.proc_limit > 0) child_lim.nproc = limits.proc_limit;
    const int run_uid = options.run_uid, run_gid = options.run_gid;

    isolation_plan plan;
    if (options.isolate) {
        plan.flags = CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;
        if (run_uid < 0 && run_gid < 0) {
            // 在新的 user 命名空间中保持原来的用户和组
            plan.flags |= CLONE_NEWUSER;
            plan.uid_map = fmt::format("{0} {0} 1\n", geteuid());
            plan.gid_map = fmt::format("{0} {0} 1\n", getegid());
        }
        plan.mount_points = list_mount_points();
    }

    file_descriptor stdin_r, stdout_w, stderr_w, err_w, sync_r;
    input_stream in;
    output_stream out, err;
    file_descriptor err_r, sync_w;
    make_pipe(stdin_r, in.fd);
    make_pipe(out.fd, stdout_w);
    make_pipe(err.fd, stderr_w);
    make_pipe(err_r, err_w);
    out.limit = err.limit = limits.max_output_bytes;
    if (request.stdin_data) in.data = &*request.stdin_data;

    // 子进程需要等父进程把它放进 cgroup 之后才能 exec
    unique_ptr<job_cgroup> cg;
    int64_t job_id = spawned++;
    if (options.use_cgroup) {
        cg = make_unique<job_cgroup>(
            fmt::format("{}/job_{}_{}", options.cgroup_root, getpid(), job_id),
            limits.memory_bytes);
        make_pipe(sync_r, sync_w);
    }

    pid_t pid = fork();
    if (pid == -1) error(errno, "unable to fork");

    if (pid == 0) {  // child process, run the command
        int efd = err_w.fd;

        if (sync_r.is_open()) {
            char c;
            ssize_t nread;
            do {
                nread = read(sync_r.fd, &c, 1);
            } while (nread == -1 && errno == EINTR);
            if (nread != 1) child_fail(efd, STAGE_SYNC);
        }

        // run the command in a separate process group,
        // so the command and all its child processes can be killed
        // off with one signal
        if (setsid() == -1) child_fail(efd, STAGE_SETSID);

        if (plan.flags) {
            int stage = enter_namespaces(plan, work_dir);
            if (stage >= 0) child_fail(efd, stage);
            // 等待父进程记录我们的挂载命名空间
            if (raise(SIGSTOP) != 0) child_fail(efd, STAGE_SYNC);
        }

        {
            sigset_t emptymask;
            struct sigaction sigact;
            if (sigemptyset(&emptymask) != 0) child_fail(efd, STAGE_SIGNALS);
            sigact.sa_handler = SIG_DFL;
            sigact.sa_flags = 0;
            sigact.sa_mask = emptymask;
            for (int sig : {SIGPIPE, SIGINT, SIGTERM, SIGCHLD, SIGXCPU, SIGXFSZ})
                if (sigaction(sig, &sigact, nullptr) != 0) child_fail(efd, STAGE_SIGNALS);
            if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) child_fail(efd, STAGE_SIGNALS);
        }

        // 将管道连接到 stdin/stdout/stderr，dup2 得到的文件描述符不带 O_CLOEXEC
        if (dup2(stdin_r.fd, STDIN_FILENO) < 0 ||
            dup2(stdout_w.fd, STDOUT_FILENO) < 0 ||
            dup2(stderr_w.fd, STDERR_FILENO) < 0)
            child_fail(efd, STAGE_REDIRECT);

        if (chdir(work_dir.c_str()) != 0) child_fail(efd, STAGE_CHDIR);

        if (child_lim.cpu_seconds != RLIM_INFINITY &&
            !set_rlimit(RLIMIT_CPU, child_lim.cpu_seconds, child_lim.cpu_seconds + 1))
            child_fail(efd, STAGE_RLIMIT);
        if (child_lim.file_size != RLIM_INFINITY &&
            !set_rlimit(RLIMIT_FSIZE, child_lim.file_size, child_lim.file_size))
            child_fail(efd, STAGE_RLIMIT);
        if (child_lim.nproc != RLIM_INFINITY &&
            !set_rlimit(RLIMIT_NPROC, child_lim.nproc, child_lim.nproc))
            child_fail(efd, STAGE_RLIMIT);
        if (!set_rlimit(RLIMIT_CORE, 0, 0)) child_fail(efd, STAGE_RLIMIT);

        if (run_gid >= 0) {
            if (setgid(run_gid) != 0) child_fail(efd, STAGE_SETGID);
            gid_t aux_groups[1] = {(gid_t)run_gid};
            if (setgroups(1, aux_groups) != 0) child_fail(efd, STAGE_SETGID);
        }
        if (run_uid >= 0) {
            if (setuid(run_uid) != 0) child_fail(efd, STAGE_SETUID);
        }

        execvpe(argv[0], argv.data(), envp.data());
        child_fail(efd, STAGE_EXEC);
    }

    // watchdog
    bool reaped = false;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    };

    stdin_r.reset();
    stdout_w.reset();
    stderr_w.reset();
    err_w.reset();
    sync_r.reset();

    if (cg) {
        cg->attach(pid);
        char c = 0;
        if (write(sync_w.fd, &c, 1) != 1) error(errno, "resuming child");
        sync_w.reset();
    }

    // 子进程建立命名空间之后会暂停自己，此时它一定还没有退出
    string job_ns;
    if (plan.flags) {
        int wstatus = 0;
        pid_t ret;
        do {
            ret = waitpid(pid, &wstatus, WUNTRACED);
        } while (ret == -1 && errno == EINTR);
        if (ret == -1) error(errno, "waiting for child to enter namespaces");

        if (WIFSTOPPED(wstatus)) {
            job_ns = read_mount_namespace(pid);
            if (kill(pid, SIGCONT) != 0) error(errno, "resuming child");
        } else {
            // 建立命名空间失败，错误原因在 err_r 中
            reaped = true;
        }
    }

    {
        // exec 成功时管道因为 O_CLOEXEC 被关闭，我们读到 EOF
        child_error e;
        ssize_t nread;
        do {
            nread = read(err_r.fd, &e, sizeof(e));
        } while (nread == -1 && errno == EINTR);
        if (nread == sizeof(e)) {
            waitpid(pid, nullptr, 0);
            reaped = true;
            string message = fmt::format("Unable to start command {}: {} ({})",
                                         args[0], strerror(e.err), stage_names[e.stage]);
            LOG(ERROR) << message;
            result.stat = status::INTERNAL_ERROR;
            result.error = message;
            return result;
        }
        err_r.reset();
    }


    auto start = chrono::steady_clock::now();
    optional<chrono::steady_clock::time_point> deadline;
    if (limits.timeout_ms > 0) deadline = start + chrono::milliseconds(limits.timeout_ms);

    set_nonblock(in.fd.fd);
    set_nonblock(out.fd.fd);
    set_nonblock(err.fd.fd);
    feed(in);

    kill_reason reason = kill_reason::NONE;
    int64_t peak_rss = 0;
    while (true) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (out.fd.is_open()) fds[nfds++] = {out.fd.fd, POLLIN, 0};
        if (err.fd.is_open()) fds[nfds++] = {err.fd.fd, POLLIN, 0};
        if (in.fd.is_open()) fds[nfds++] = {in.fd.fd, POLLOUT, 0};

        int timeout = options.poll_interval_ms;
        if (deadline && reason == kill_reason::NONE) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(*deadline - chrono::steady_clock::now()).count();
            timeout = (int)max<int64_t>(0, min<int64_t>(remaining, timeout));
        }

        if (nfds > 0) {
            if (poll(fds, nfds, timeout) == -1 && errno != EINTR)
                error(errno, "waiting for child data");
        } else {
            struct timespec ts = {timeout / 1000, (long)(timeout % 1000) * 1000000L};
            nanosleep(&ts, nullptr);
        }

        pump(out);
        pump(err);
        if (in.fd.is_open()) feed(in);

        // 只检查子进程是否退出而不回收，这样进程组号在我们杀死残留进程之前不会被重用
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno != EINTR) error(errno, "waiting on child");
        } else if (info.si_pid == pid) {
            break;
        }

        auto now = chrono::steady_clock::now();
        if (reason != kill_reason::NONE) {
            // 已经发送过信号，但是子进程还没有退出
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                error(errno, "sending SIGKILL to command");
            continue;
        }

        if (deadline && now >= *deadline) {
            reason = kill_reason::WALL_TIME;
            LOG(WARNING) << "Time Limit Exceeded (hard wall time): aborting command " << args[0];
        } else if (request.cancel && request.cancel->expired(now)) {
            reason = kill_reason::CANCELLED;
            LOG(WARNING) << "execution cancelled: aborting command " << args[0];
        } else if (!cg && limits.memory_bytes > 0) {
            int64_t rss = process_group_rss(pid);
            peak_rss = max(peak_rss, rss);
            if (rss > limits.memory_bytes) {
                reason = kill_reason::MEMORY;
                LOG(WARNING) << "Memory Limit Exceeded (" << rss << " bytes): aborting command " << args[0];
            }
        }

        if (reason != kill_reason::NONE)
            terminate_group(pid);
    }

    // 杀死进程组内残留的所有进程，以确保子进程结束后没有进程留驻系统
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to process group");
    if (cg) cg->kill_all();
    if (!job_ns.empty()) kill_namespace(job_ns);

    int wstatus = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    while (wait4(pid, &wstatus, 0, &usage) == -1) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
    reaped = true;

    auto drain_deadline = chrono::steady_clock::now() + chrono::milliseconds(DRAIN_TIMEOUT_MS);
    while (out.fd.is_open() || err.fd.is_open()) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(drain_deadline - chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            LOG(WARNING) << "output pipes of " << args[0] << " are still open after the command exited";
            break;
        }
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out.fd.is_open()) fds[nfds++] = {out.fd.fd, POLLIN, 0};
        if (err.fd.is_open()) fds[nfds++] = {err.fd.fd, POLLIN, 0};
        if (poll(fds, nfds, (int)remaining) == -1 && errno != EINTR)
            error(errno, "waiting for child data");
        pump(out);
        pump(err);
    }
    in.fd.reset();

    result.wall_time_ms = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
    result.stdout_data = move(out.data);
    result.stderr_data = move(err.data);
    result.stdout_truncated = out.truncated;
    result.stderr_truncated = err.truncated;

    bool is_oom = false;
    if (cg) {
        result.cpu_time_ms = cg->cpu_usage_ns() / 1000000;
        result.memory_bytes = cg->max_memory_usage();
        is_oom = cg->is_oom();
    } else {
        result.cpu_time_ms = to_ms(usage.ru_utime) + to_ms(usage.ru_stime);
        // ru_maxrss 的单位是 KB
        result.memory_bytes = max<int64_t>(peak_rss, (int64_t)usage.ru_maxrss * 1024);
    }

    if (WIFEXITED(wstatus)) {
        result.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        result.signal = WTERMSIG(wstatus);
        result.exit_code = 128 + *result.signal;
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", wstatus));
    }

    LOG(INFO) << fmt::format("{} finished: exitcode {}, real {}ms, cpu {}ms, memory {}kB",
                             args[0], result.exit_code, result.wall_time_ms, result.cpu_time_ms,
                             result.memory_bytes / 1024);

    if (reason == kill_reason::WALL_TIME) {
        result.stat = status::TIMEOUT;
        result.timed_out = true;
        result.error = fmt::format("Time Limit Exceeded (wall time limit {}ms)", limits.timeout_ms);
    } else if (reason == kill_reason::CANCELLED) {
        result.stat = status::TIMEOUT;
        result.timed_out = true;
        result.error = request.cancel && request.cancel->is_cancelled()
                           ? "Execution cancelled"
                           : "Time Limit Exceeded (request deadline)";
    } else if (reason == kill_reason::MEMORY || is_oom) {
        result.stat = status::RESOURCE_EXCEEDED;
        result.error = fmt::format("Memory Limit Exceeded (limit {} bytes)", limits.memory_bytes);
    } else if (result.signal == SIGXCPU ||
               (limits.cpu_time_ms > 0 && (result.cpu_time_ms > limits.cpu_time_ms ||
                                           (!result.signal && result.exit_code == 128 + SIGXCPU)))) {
        // 通过 shell 运行时，被信号杀死的是 shell 的子进程，shell 以 128 + 信号编号退出
        result.stat = status::RESOURCE_EXCEEDED;
        result.error = fmt::format("CPU Time Limit Exceeded (limit {}ms)", limits.cpu_time_ms);
    } else if (result.signal == SIGXFSZ ||
               (limits.file_size_bytes > 0 && !result.signal && result.exit_code == 128 + SIGXFSZ)) {
        result.stat = status::RESOURCE_EXCEEDED;
        result.error = fmt::format("File Size Limit Exceeded (limit {} bytes)", limits.file_size_bytes);
    } else if (result.signal) {
        result.stat = status::RUNTIME_ERROR;
        result.error = fmt::format("Command terminated with signal {} ({})", *result.signal, strsignal(*result.signal));
    } else if (result.exit_code != 0) {
        result.stat = status::RUNTIME_ERROR;
        result.error = fmt::format("Command exited with code {}", result.exit_code);
    } else {
        result.stat = status::SUCCESS;
    }

    if (result.stat != status::SUCCESS)
        LOG(WARNING) << args[0] << ": " << result.error;

    return result;
}

}  // namespace polyrun
