#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include "polyrun/common/concurrent_queue.hpp"
#include "polyrun/common/io_utils.hpp"
#include "polyrun/common/utils.hpp"
#include "polyrun/engine/concurrency_limiter.hpp"
#include "polyrun/engine/engine_config.hpp"
#include "polyrun/engine/executor.hpp"
#include "polyrun/language/language_registry.hpp"
#include "polyrun/runner/process_runner.hpp"
#include "polyrun/workspace/workspace_manager.hpp"
#include "polyrun/worker.hpp"
using namespace std;

polyrun::concurrent_queue<polyrun::batch_job> submission_queue;

void sigintHandler(int /* signum */) {
    polyrun::stop_workers();
}

/**
 * @brief 按行读取提交，空行忽略
 * @return 是否读到了输入末尾，被 SIGINT 打断时返回 false
 */
static bool enqueue_lines(istream &is, size_t &seq) {
    string line;
    while (!polyrun::workers_stopped() && getline(is, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) continue;
        submission_queue.push({++seq, line});
    }
    return !polyrun::workers_stopped();
}

/**
 * @brief 读取提交文件
 * 文件可以是一个 JSON 对象、一个 JSON 数组，或者每行一个 JSON 对象
 */
static void enqueue_file(const filesystem::path &path, size_t &seq) {
    string content = polyrun::read_file_content(path);
    nlohmann::json j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_object()) {
        submission_queue.push({++seq, j.dump()});
    } else if (j.is_array()) {
        for (auto &elem : j) submission_queue.push({++seq, elem.dump()});
    } else {
        istringstream is(content);
        enqueue_lines(is, seq);
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    // SIGINT 需要打断阻塞中的读取，因此不设置 SA_RESTART
    struct sigaction sa = {};
    sa.sa_handler = sigintHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);

    namespace po = boost::program_options;
    po::options_description desc("polyrun options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("run-dir", po::value<string>(), "set the directory where workspaces of submissions are created. You can either pass it from environ RUNDIR")
        ("languages", po::value<string>(), "load additional language definitions from the given JSON file, overriding built-in languages with the same id. You can either pass it from environ LANGUAGES")
        ("max-concurrency", po::value<size_t>(), "set the maximum number of executions running simultaneously, default to the number of hardware threads. You can either pass it from environ MAXCONCURRENCY")
        ("admission-timeout", po::value<int64_t>(), "set how long in milliseconds a submission waits for a free execution slot before it is rejected, default to 200. You can either pass it from environ ADMISSIONTIMEOUT")
        ("workers", po::value<size_t>(), "set the number of worker threads consuming submissions, default to max-concurrency")
        ("max-workspaces", po::value<int>(), "set the maximum number of workspaces existing at the same time")
        ("use-cgroup", "account and limit memory of user programs with cgroup, requires root privilege")
        ("no-isolate", "do not run user programs in separate namespaces, a run user is required then")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("submission", po::value<vector<string>>(), "read submissions from the given file instead of standard input, '-' for standard input")
        ("list-languages", "display supported languages and exit")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "polyrun: Compile and run submissions written in multiple languages in isolated workspaces" << endl
             << "Submissions are read as JSON, one per line, and results are written as JSON, one per line" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "polyrun 1.0" << endl;
        return EXIT_SUCCESS;
    }

    polyrun::engine_config config;
    nlohmann::json config_json;
    if (vm.count("config")) {
        filesystem::path config_file = vm["config"].as<string>();
        CHECK(filesystem::is_regular_file(config_file))
            << "Configuration file " << config_file << " does not exist";
        try {
            config_json = nlohmann::json::parse(polyrun::read_file_content(config_file));
            config_json.get_to(config);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config_file << " is malformed: " << e.what();
        }
    }

    if (vm.count("run-dir")) {
        config.run_dir = vm["run-dir"].as<string>();
    } else if (getenv("RUNDIR")) {
        config.run_dir = getenv("RUNDIR");
    }

    if (vm.count("languages")) {
        config.languages_file = vm["languages"].as<string>();
    } else if (getenv("LANGUAGES")) {
        config.languages_file = getenv("LANGUAGES");
    }

    if (vm.count("max-concurrency")) {
        config.max_concurrency = vm["max-concurrency"].as<size_t>();
    } else if (getenv("MAXCONCURRENCY")) {
        config.max_concurrency = boost::lexical_cast<size_t>(getenv("MAXCONCURRENCY"));
    }

    if (vm.count("admission-timeout")) {
        config.admission_timeout_ms = vm["admission-timeout"].as<int64_t>();
    } else if (getenv("ADMISSIONTIMEOUT")) {
        config.admission_timeout_ms = boost::lexical_cast<int64_t>(getenv("ADMISSIONTIMEOUT"));
    }
    CHECK(config.admission_timeout_ms >= 0) << "Admission timeout should not be negative";

    if (vm.count("max-workspaces")) config.max_workspaces = vm["max-workspaces"].as<int>();
    if (vm.count("use-cgroup")) config.sandbox.use_cgroup = true;
    if (vm.count("no-isolate")) config.sandbox.isolate = false;

    if (vm.count("run-user")) {
        config.run_user = vm["run-user"].as<string>();
    } else if (getenv("RUNUSER")) {
        config.run_user = getenv("RUNUSER");
    }

    if (vm.count("run-group")) {
        config.run_group = vm["run-group"].as<string>();
    } else if (getenv("RUNGROUP")) {
        config.run_group = getenv("RUNGROUP");
    }

    if (!config.run_user.empty()) {
        config.sandbox.run_uid = polyrun::get_userid(config.run_user);
        CHECK(config.sandbox.run_uid >= 0) << "Run user " << config.run_user << " does not exist";
        // 只设置了用户时，使用同名的组
        string group = config.run_group.empty() ? config.run_user : config.run_group;
        config.sandbox.run_gid = polyrun::get_groupid(group);
        CHECK(config.sandbox.run_gid >= 0) << "Run group " << group << " does not exist";
    } else if (!config.run_group.empty()) {
        config.sandbox.run_gid = polyrun::get_groupid(config.run_group);
        CHECK(config.sandbox.run_gid >= 0) << "Run group " << config.run_group << " does not exist";
    }

    if ((config.sandbox.use_cgroup || config.sandbox.run_uid >= 0 || config.sandbox.run_gid >= 0) && getuid() != 0) {
        cerr << "You should run this program in privileged mode when cgroup or run user is enabled" << endl;
        return EXIT_FAILURE;
    }

    polyrun::language_registry registry;
    try {
        registry = config.languages_file.empty()
                       ? polyrun::language_registry::builtin()
                       : polyrun::language_registry::load_file(config.languages_file);
        if (config_json.is_object() && config_json.count("languages"))
            registry.merge(config_json.at("languages"));
    } catch (std::exception& e) {
        LOG(FATAL) << "Unable to load language definitions: " << e.what() << endl
                   << boost::diagnostic_information(e);
    }

    if (vm.count("list-languages")) {
        for (auto& id : registry.identifiers()) {
            const polyrun::language_spec& spec = registry.resolve(id);
            cout << id;
            for (auto& alias : spec.aliases) cout << " " << alias;
            cout << endl;
        }
        return EXIT_SUCCESS;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    polyrun::workspace_manager workspaces(config.run_dir, config.max_workspaces,
                                          config.sandbox.run_uid, config.sandbox.run_gid);

    if (config.sandbox.isolate) {
        polyrun::scoped_workspace scratch(workspaces);
        if (!polyrun::local_process_runner(config.sandbox).check_isolation(scratch.path())) {
            CHECK(config.sandbox.run_uid >= 0)
                << "Unable to isolate user programs in namespaces, configure a run user or allow unprivileged user namespaces";
            LOG(WARNING) << "Namespaces are not available, user programs are only confined by run user " << config.run_user;
            config.sandbox.isolate = false;
        }
    }
    CHECK(config.sandbox.isolate || config.sandbox.run_uid >= 0)
        << "User programs must either run in separate namespaces or as a dedicated run user";
    if (getuid() == 0 && config.sandbox.run_uid < 0)
        LOG(WARNING) << "User programs run as root, configure a run user to confine them";

    polyrun::local_process_runner runner(config.sandbox);
    polyrun::concurrency_limiter limiter(config.concurrency());
    polyrun::executor exec(registry, workspaces, runner, limiter, config);
    polyrun::result_writer writer(cout);

    size_t worker_count = vm.count("workers") ? vm["workers"].as<size_t>() : config.concurrency();
    CHECK(worker_count > 0) << "At least one worker is required";

    LOG(INFO) << "polyrun started with " << registry.size() << " languages, " << config.concurrency()
              << " execution slots and " << worker_count << " workers, workspaces in " << config.run_dir;

    vector<thread> worker_threads;
    for (size_t i = 0; i < worker_count; ++i)
        worker_threads.push_back(polyrun::start_worker(i, exec, submission_queue, writer));

    size_t seq = 0;
    vector<string> sources = vm.count("submission") ? vm["submission"].as<vector<string>>() : vector<string>{"-"};
    for (auto& source : sources) {
        if (polyrun::workers_stopped()) break;
        if (source == "-") {
            enqueue_lines(cin, seq);
        } else if (!filesystem::is_regular_file(source)) {
            LOG(ERROR) << "Submission file " << source << " does not exist";
        } else {
            enqueue_file(source, seq);
        }
    }

    if (polyrun::workers_stopped())
        LOG(ERROR) << "Received SIGINT, stopping workers";

    submission_queue.close();
    for (auto& th : worker_threads)
        th.join();

    LOG(INFO) << seq << " submissions processed";
    return 0;
}
