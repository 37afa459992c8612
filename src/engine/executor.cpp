#include "polyrun/engine/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "polyrun/common/exceptions.hpp"
#include "polyrun/common/io_utils.hpp"
#include "polyrun/common/stl_utils.hpp"
#include "polyrun/common/utils.hpp"

namespace polyrun {
using namespace std;

string normalize_output(const string &output) {
    string result = boost::algorithm::replace_all_copy(output, "\r\n", "\n");
    boost::algorithm::trim(result);
    return result;
}

/**
 * @brief 执行 fn，将其抛出的异常转换为状态和诊断信息
 * @return fn 正常返回时为 nullopt
 */
template <typename Fn>
static optional<pair<status, string>> run_guarded(const string &id, Fn &&fn) {
    try {
        fn();
        return nullopt;
    } catch (invalid_submission &ex) {
        LOG(WARNING) << "submission " << id << " is invalid: " << ex.what();
        return make_pair(status::INVALID_SUBMISSION, string(ex.what()));
    } catch (unsupported_language &ex) {
        LOG(WARNING) << "submission " << id << ": " << ex.what();
        return make_pair(status::UNSUPPORTED_LANGUAGE, string(ex.what()));
    } catch (resource_exhausted &ex) {
        LOG(WARNING) << "submission " << id << " cannot be executed: " << ex.what();
        return make_pair(status::RESOURCE_EXHAUSTED, string(ex.what()));
    } catch (polyrun_exception &ex) {
        LOG(ERROR) << "submission " << id << " failed with internal error: " << ex;
        return make_pair(status::INTERNAL_ERROR, "Internal error: " + string(ex.what()));
    } catch (exception &ex) {
        LOG(ERROR) << "submission " << id << " failed with internal error: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return make_pair(status::INTERNAL_ERROR, "Internal error: " + string(ex.what()));
    }
}

executor::executor(const language_registry &registry,
                   workspace_manager &workspaces,
                   process_runner &runner,
                   concurrency_limiter &limiter,
                   const engine_config &config)
    : registry(registry), workspaces(workspaces), runner(runner), limiter(limiter), config(config) {}

bool executor::validate(const submission &sub, string &reason) const {
    if (boost::algorithm::trim_copy(sub.language).empty()) {
        reason = "Language is required";
        return false;
    }

    if (boost::algorithm::trim_copy(sub.source).empty()) {
        reason = "Source code is empty";
        return false;
    }

    if (sub.source.size() > config.max_source_bytes) {
        reason = fmt::format("Source code is too large ({} bytes, at most {} bytes)", sub.source.size(), config.max_source_bytes);
        return false;
    }

    size_t total = sub.source.size();
    if (sub.stdin_data) {
        if (sub.stdin_data->size() > config.max_stdin_bytes) {
            reason = fmt::format("Standard input is too large ({} bytes, at most {} bytes)", sub.stdin_data->size(), config.max_stdin_bytes);
            return false;
        }
        total += sub.stdin_data->size();
    }

    if (sub.files.size() > config.max_files) {
        reason = fmt::format("Too many files ({}, at most {})", sub.files.size(), config.max_files);
        return false;
    }

    for (auto &[name, content] : sub.files) {
        if (!is_safe_filename(name)) {
            reason = fmt::format("Invalid file name: {}", name);
            return false;
        }
        total += content.size();
    }

    for (auto &test : sub.tests) {
        if (test.input.size() > config.max_stdin_bytes) {
            reason = fmt::format("Input of test {} is too large ({} bytes, at most {} bytes)", test.name, test.input.size(), config.max_stdin_bytes);
            return false;
        }
        total += test.input.size();
    }

    if (total > config.max_total_bytes) {
        reason = fmt::format("Submission is too large ({} bytes, at most {} bytes)", total, config.max_total_bytes);
        return false;
    }

    if (!sub.limits.is_valid()) {
        reason = "Resource limits must be positive";
        return false;
    }

    return true;
}

resource_limits executor::effective_run_limits(const language_spec &spec, const submission &sub) const {
    return sub.limits.apply(spec.run_limits).clamp(config.max_run_limits);
}

void executor::prepare(const workspace &ws, const language_spec &spec, const submission &sub) {
    workspaces.write_file(ws, spec.source_file, sub.source);
    for (auto &[name, content] : sub.files) {
        if (name == spec.source_file)
            throw invalid_submission(fmt::format("File {} conflicts with the source file", name));
        workspaces.write_file(ws, name, content);
    }
}

optional<compile_failure> executor::compile(const workspace &ws, const language_spec &spec,
                                            const resource_limits &run_limits,
                                            const cancellation_token *cancel, run_result &compile_result) {
    if (!spec.has_compile_step()) return nullopt;

    command_context ctx{spec.source_file, ws.path, run_limits.memory_bytes};
    run_request request;
    request.command = expand_command(spec.compile_command, ctx);
    request.work_dir = ws.path;
    request.env = expand_env(spec.env, ctx);
    request.limits = spec.compile_limits;
    request.cancel = cancel;

    LOG(INFO) << "compiling " << spec.source_file << " in " << ws.path;
    compile_result = runner.run(request);
    if (compile_result.stat == status::SUCCESS) return nullopt;

    compile_failure failure;
    failure.compile = compile_result;
    if (compile_result.stat == status::INTERNAL_ERROR) {
        failure.stat = status::INTERNAL_ERROR;
        failure.diagnostic = "Unable to run compiler: " + compile_result.error;
    } else if (compile_result.timed_out && cancel && cancel->expired()) {
        failure.stat = status::TIMEOUT;
        failure.diagnostic = compile_result.error;
    } else {
        failure.stat = status::COMPILE_ERROR;
        failure.diagnostic = compile_result.stderr_data;
        if (!compile_result.stdout_data.empty()) {
            if (!failure.diagnostic.empty() && failure.diagnostic.back() != '\n')
                failure.diagnostic += '\n';
            failure.diagnostic += compile_result.stdout_data;
        }
        if (failure.diagnostic.empty()) {
            if (compile_result.stat == status::RUNTIME_ERROR && !compile_result.signal)
                failure.diagnostic = fmt::format("Compilation failed with exit code {}", compile_result.exit_code);
            else
                failure.diagnostic = "Compilation failed: " + compile_result.error;
        }
    }
    return failure;
}

run_result executor::run(const workspace &ws, const language_spec &spec, const resource_limits &run_limits,
                         const optional<string> &stdin_data, const cancellation_token *cancel) {
    command_context ctx{spec.source_file, ws.path, run_limits.memory_bytes};
    run_request request;
    request.command = expand_command(spec.run_command, ctx);
    request.work_dir = ws.path;
    request.stdin_data = stdin_data;
    request.env = expand_env(spec.env, ctx);
    request.limits = run_limits;
    request.cancel = cancel;

    LOG(INFO) << "running " << request.command[0] << " in " << ws.path;
    return runner.run(request);
}

execution_result assemble_result(const string &id, stage_result &&stage) {
    execution_result result;
    result.id = id;
    visit(overloaded{
              [&](compile_failure &failure) {
                  result.stat = failure.stat;
                  if (failure.stat == status::COMPILE_ERROR) {
                      result.compile_error = failure.diagnostic;
                      result.message = "Compilation failed";
                  } else {
                      result.message = failure.diagnostic;
                      result.timed_out = failure.stat == status::TIMEOUT;
                  }
              },
              [&](run_outcome &outcome) {
                  run_result &run = outcome.run;
                  result.stat = run.stat;
                  result.stdout_data = move(run.stdout_data);
                  result.stderr_data = move(run.stderr_data);
                  result.stdout_truncated = run.stdout_truncated;
                  result.stderr_truncated = run.stderr_truncated;
                  result.exit_code = run.exit_code;
                  result.signal = run.signal.value_or(-1);
                  result.cpu_time_ms = run.cpu_time_ms;
                  result.memory_bytes = run.memory_bytes;
                  result.timed_out = run.timed_out;
                  result.message = run.error;
              }},
          stage);
    return result;
}

execution_result executor::execute(const submission &sub, const cancellation_token *cancel) {
    elapsed_time timer;
    execution_result result;
    result.id = sub.id;

    string reason;
    if (!validate(sub, reason)) {
        LOG(WARNING) << "submission " << sub.id << " is invalid: " << reason;
        result.stat = status::INVALID_SUBMISSION;
        result.message = reason;
        return result;
    }

    const language_spec *spec = registry.find(sub.language);
    if (!spec) {
        LOG(WARNING) << "submission " << sub.id << ": unsupported language " << sub.language;
        result.stat = status::UNSUPPORTED_LANGUAGE;
        result.message = fmt::format("Unsupported language: {}", sub.language);
        return result;
    }

    auto token = limiter.acquire(chrono::milliseconds(config.admission_timeout_ms));
    if (!token) {
        LOG(WARNING) << "submission " << sub.id << " rejected, " << limiter.in_use() << " executions in progress";
        result.stat = status::REJECTED;
        result.message = fmt::format("Server busy: {} executions in progress, try again later", limiter.capacity());
        return result;
    }

    LOG(INFO) << "execution of submission " << sub.id << " started, language " << spec->id;

    auto failure = run_guarded(sub.id, [&]() {
        scoped_workspace ws(workspaces);
        prepare(ws.get(), *spec, sub);

        resource_limits run_limits = effective_run_limits(*spec, sub);
        run_result compile_result;
        auto compile_failed = compile(ws.get(), *spec, run_limits, cancel, compile_result);
        stage_result stage = compile_failed
                                 ? stage_result(move(*compile_failed))
                                 : stage_result(run_outcome{move(compile_result),
                                                            run(ws.get(), *spec, run_limits, sub.stdin_data, cancel)});
        result = assemble_result(sub.id, move(stage));
    });

    if (failure) {
        result = execution_result();
        result.id = sub.id;
        result.stat = failure->first;
        result.message = failure->second;
    }

    result.duration_ms = timer.duration<chrono::milliseconds>().count();
    LOG(INFO) << "execution of submission " << sub.id << " finished: " << get_status_name(result.stat)
              << " in " << result.duration_ms << "ms";
    return result;
}

test_report executor::execute_tests(const submission &sub, const cancellation_token *cancel) {
    elapsed_time timer;
    test_report report;
    report.id = sub.id;
    report.total = sub.tests.size();

    auto finish = [&](status stat, const string &message) {
        report.verdict = get_verdict_name(stat);
        report.message = message;
        report.duration_ms = timer.duration<chrono::milliseconds>().count();
        return report;
    };

    string reason;
    if (!validate(sub, reason)) {
        LOG(WARNING) << "submission " << sub.id << " is invalid: " << reason;
        return finish(status::INVALID_SUBMISSION, reason);
    }

    const language_spec *spec = registry.find(sub.language);
    if (!spec) {
        LOG(WARNING) << "submission " << sub.id << ": unsupported language " << sub.language;
        return finish(status::UNSUPPORTED_LANGUAGE, fmt::format("Unsupported language: {}", sub.language));
    }

    if (sub.tests.empty())
        return finish(status::SUCCESS, "");

    auto token = limiter.acquire(chrono::milliseconds(config.admission_timeout_ms));
    if (!token) {
        LOG(WARNING) << "submission " << sub.id << " rejected, " << limiter.in_use() << " executions in progress";
        return finish(status::REJECTED, fmt::format("Server busy: {} executions in progress, try again later", limiter.capacity()));
    }

    LOG(INFO) << "judging submission " << sub.id << " with " << sub.tests.size() << " tests, language " << spec->id;

    auto failure = run_guarded(sub.id, [&]() {
        scoped_workspace ws(workspaces);
        prepare(ws.get(), *spec, sub);

        resource_limits run_limits = effective_run_limits(*spec, sub);
        run_result compile_result;
        if (auto compile_failed = compile(ws.get(), *spec, run_limits, cancel, compile_result)) {
            execution_result result = assemble_result(sub.id, move(*compile_failed));
            report.verdict = get_verdict_name(result.stat);
            report.compile_error = result.compile_error;
            report.message = result.message;
            return;
        }

        // 第一个没有通过的测试点决定总评测结果
        optional<string> first_failure;
        for (size_t i = 0; i < sub.tests.size(); ++i) {
            const test_case &test = sub.tests[i];
            test_case_result case_result;
            case_result.name = test.name.empty() ? fmt::format("test{}", i + 1) : test.name;
            case_result.expected_output = test.expected_output;
            case_result.execution = assemble_result(
                "", run_outcome{compile_result, run(ws.get(), *spec, run_limits, test.input, cancel)});

            const execution_result &execution = case_result.execution;
            if (execution.stat != status::SUCCESS) {
                case_result.outcome = test_outcome::ERROR;
                if (!first_failure) {
                    first_failure = get_verdict_name(execution.stat);
                    report.message = fmt::format("{}: {}", case_result.name, execution.message);
                }
            } else if (normalize_output(execution.stdout_data) == normalize_output(test.expected_output)) {
                case_result.outcome = test_outcome::PASS;
                ++report.passed;
            } else {
                case_result.outcome = test_outcome::FAIL;
                if (!first_failure) first_failure = "WrongAnswer";
            }
            report.results.push_back(move(case_result));

            if (cancel && cancel->expired()) {
                LOG(WARNING) << "judging of submission " << sub.id << " cancelled after " << i + 1 << " tests";
                break;
            }
        }
        report.verdict = first_failure.value_or(get_verdict_name(status::SUCCESS));
    });

    if (failure) {
        report.results.clear();
        report.passed = 0;
        return finish(failure->first, failure->second);
    }

    report.duration_ms = timer.duration<chrono::milliseconds>().count();
    LOG(INFO) << "judging of submission " << sub.id << " finished: " << report.verdict
              << ", " << report.passed << "/" << report.total << " passed";
    return report;
}

}  // namespace polyrun
