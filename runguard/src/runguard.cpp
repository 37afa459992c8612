#include <glog/logging.h>
#include <math.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "polyrun/common/io_utils.hpp"
#include "polyrun/common/utils.hpp"
#include "polyrun/runner/process_runner.hpp"
#include "polyrun/runner/run_meta.hpp"

using namespace std;

/**
 * @brief 以秒为单位的时间限制，可以是小数
 */
struct time_limit {
    double seconds;
};

void validate(boost::any& v, const vector<string>& values, size_t*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    if (s.empty() || s[0] == '-') {
        throw validation_error(validation_error::invalid_option_value);
    }

    v = boost::lexical_cast<size_t>(s);
}

void validate(boost::any& v, const vector<string>& values, struct time_limit*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    struct time_limit result;
    string const& s = validators::get_single_string(values);
    try {
        result.seconds = boost::lexical_cast<double>(s);
    } catch (boost::bad_lexical_cast&) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (!isfinite(result.seconds) || result.seconds <= 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

static ofstream metafile;

template <typename T>
void append_meta(const char* key, T message) {
    if (!metafile) return;
    metafile << key << ": " << message << endl;
}

/**
 * @brief 将捕获的输出写入文件，未指定文件时写到 runguard 自己的输出流
 */
static void write_stream(const string& filename, const string& data, ostream& fallback) {
    if (filename.empty())
        fallback << data << flush;
    else
        polyrun::write_file_content(filename, data);
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id. If only 'user' is set, this defaults to the same")
        ("wall-time,T", po::value<time_limit>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("cpu-time,t", po::value<time_limit>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<size_t>(), "set maximum memory consumption of the command in KB")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<size_t>(), "set maximum process living simutanously")
        ("stream-size", po::value<size_t>(), "truncate command output streams at the size in KB")
        ("work-dir,d", po::value<string>(), "run command in the given directory, default to current directory")
        ("use-cgroup", "account and limit memory with cgroup, requires root privilege")
        ("no-isolate", "do not run command in separate namespaces, command may then write outside work directory")
        ("standard-input-file,i", po::value<string>(), "feed the content of the file to command standard input")
        ("standard-output-file,o", po::value<string>(), "write command standard output to file")
        ("standard-error-file,e", po::value<string>(), "write command standard error to file")
        ("variable,V", po::value<vector<string>>(), "add additional environment variables (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, memory usage, ...) to file")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "Runguard: Running user program in protected mode with system resource access limitations." << endl
                 << "This app requires root privilege if either 'use-cgroup' or 'user' option is provided." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }

        if (vm.count("version")) {
            cout << "runguard (polyrun) 1.0" << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    polyrun::sandbox_options sandbox;
    polyrun::run_request request;

    if (vm.count("user")) {
        string user = vm["user"].as<string>();
        sandbox.run_uid = polyrun::get_userid(user);
        if (sandbox.run_uid < 0) {
            cerr << "User " << user << " does not exist" << endl;
            return 1;
        }
    }

    if (vm.count("group") || vm.count("user")) {
        string group = vm.count("group") ? vm["group"].as<string>() : vm["user"].as<string>();
        sandbox.run_gid = polyrun::get_groupid(group);
        if (sandbox.run_gid < 0) {
            cerr << "Group " << group << " does not exist" << endl;
            return 1;
        }
    }

    if (vm.count("use-cgroup")) sandbox.use_cgroup = true;
    if (vm.count("no-isolate")) sandbox.isolate = false;

    if (vm.count("variable")) {
        for (auto& variable : vm["variable"].as<vector<string>>()) {
            auto eq = variable.find('=');
            if (eq == string::npos || eq == 0) {
                cerr << "Malformed environment variable " << variable << endl;
                return 1;
            }
            request.env[variable.substr(0, eq)] = variable.substr(eq + 1);
        }
    }

    // runguard 只受命令行给出的限制
    request.limits.timeout_ms = -1;
    if (vm.count("wall-time")) request.limits.timeout_ms = llround(vm["wall-time"].as<time_limit>().seconds * 1000);
    if (vm.count("cpu-time")) request.limits.cpu_time_ms = llround(vm["cpu-time"].as<time_limit>().seconds * 1000);
    if (vm.count("memory-limit")) request.limits.memory_bytes = (int64_t)vm["memory-limit"].as<size_t>() * 1024;
    if (vm.count("file-limit")) request.limits.file_size_bytes = (int64_t)vm["file-limit"].as<size_t>() * 1024;
    if (vm.count("nproc")) request.limits.proc_limit = (int)vm["nproc"].as<size_t>();
    if (vm.count("stream-size")) request.limits.max_output_bytes = (int64_t)vm["stream-size"].as<size_t>() * 1024;

    request.work_dir = vm.count("work-dir") ? filesystem::absolute(vm["work-dir"].as<string>()) : filesystem::current_path();
    request.command = vm["cmd"].as<vector<string>>();

    if (vm.count("out-meta")) {
        metafile.open(vm["out-meta"].as<string>(), ofstream::out);
        if (!metafile) {
            cerr << "Unable to open meta file " << vm["out-meta"].as<string>() << endl;
            return 1;
        }
    }

    if (vm.count("standard-input-file")) {
        string stdin_file = vm["standard-input-file"].as<string>();
        if (!filesystem::is_regular_file(stdin_file)) {
            append_meta("internal-error", "Standard input file " + stdin_file + " does not exist");
            cerr << "Standard input file " << stdin_file << " does not exist" << endl;
            return 1;
        }
        request.stdin_data = polyrun::read_file_content(stdin_file);
    }

    polyrun::run_result result;
    try {
        polyrun::local_process_runner runner(sandbox);
        result = runner.run(request);
    } catch (std::exception& e) {
        append_meta("internal-error", e.what());
        LOG(ERROR) << "runguard failed: " << e.what();
        return 1;
    }

    try {
        write_stream(vm.count("standard-output-file") ? vm["standard-output-file"].as<string>() : "", result.stdout_data, cout);
        write_stream(vm.count("standard-error-file") ? vm["standard-error-file"].as<string>() : "", result.stderr_data, cerr);
    } catch (std::system_error& e) {
        append_meta("internal-error", e.what());
        LOG(ERROR) << "Unable to write output of command: " << e.what();
        return 1;
    }

    if (metafile) polyrun::write_run_meta(metafile, result);

    if (result.stat == polyrun::status::INTERNAL_ERROR) return 1;
    return result.exit_code < 0 ? 1 : result.exit_code;
}
