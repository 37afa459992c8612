#include "gtest/gtest.h"
#include "polyrun/engine/engine_config.hpp"
#include "polyrun/engine/result.hpp"
#include "polyrun/engine/submission.hpp"
#include "polyrun/language/language_spec.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace polyrun;
using namespace nlohmann;

TEST(JsonTest, ParseSubmission) {
    auto j = json::parse(R"json({
        "id": "abc",
        "language": "python",
        "source": "print(input())",
        "stdin": "hello",
        "limits": {"timeoutMs": 2000, "memoryBytes": 67108864},
        "files": {"data.txt": "1 2 3"},
        "tests": [{"name": "sample", "input": "1", "expectedOutput": "1"}, {"expectedOutput": ""}]
    })json");
    submission sub = j.get<submission>();
    EXPECT_EQ(sub.id, "abc");
    EXPECT_EQ(sub.language, "python");
    EXPECT_EQ(sub.source, "print(input())");
    EXPECT_EQ(sub.stdin_data, optional<string>("hello"));
    EXPECT_EQ(sub.limits.timeout_ms, optional<int64_t>(2000));
    EXPECT_EQ(sub.limits.memory_bytes, optional<int64_t>(67108864));
    EXPECT_FALSE(sub.limits.cpu_time_ms);
    EXPECT_EQ(sub.files.at("data.txt"), "1 2 3");
    ASSERT_EQ(sub.tests.size(), 2u);
    EXPECT_EQ(sub.tests[0].name, "sample");
    EXPECT_EQ(sub.tests[1].input, "");
}

TEST(JsonTest, ParseMinimalSubmission) {
    submission sub = json::parse(R"({"language": "c", "source": "int main(){}"})").get<submission>();
    EXPECT_EQ(sub.id, "");
    EXPECT_FALSE(sub.stdin_data);
    EXPECT_TRUE(sub.files.empty());
    EXPECT_TRUE(sub.tests.empty());

    submission null_stdin = json::parse(R"({"language": "c", "source": "x", "stdin": null})").get<submission>();
    EXPECT_FALSE(null_stdin.stdin_data);
}

TEST(JsonTest, RejectMistypedSubmission) {
    EXPECT_THROW(json::parse(R"({"language": 1, "source": "x"})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "c", "source": "x", "files": ["a"]})").get<submission>(), invalid_argument);
    EXPECT_ANY_THROW(json::parse(R"({"language": "c", "source": "x", "tests": [{"input": "1"}]})").get<submission>());
}

TEST(JsonTest, SerializeExecutionResult) {
    execution_result result;
    result.id = "abc";
    result.stat = status::COMPILE_ERROR;
    result.compile_error = "main.c:1: error";
    result.message = "Compilation failed";

    json expected = json::parse(R"({
        "id": "abc",
        "status": "CompileError",
        "statusMessage": "Compilation Error",
        "stdout": "",
        "stderr": "",
        "stdoutTruncated": false,
        "stderrTruncated": false,
        "exitCode": -1,
        "signal": -1,
        "durationMs": 0,
        "cpuTimeMs": 0,
        "memoryBytes": 0,
        "timedOut": false,
        "compileError": "main.c:1: error",
        "message": "Compilation failed"
    })");
    EXPECT_JSON_EQ(json(result), expected);
}

TEST(JsonTest, OptionalResultFieldsOmitted) {
    execution_result result;
    result.stat = status::SUCCESS;
    json j = result;
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("compileError"));
    EXPECT_FALSE(j.contains("message"));
    EXPECT_EQ(j.at("statusMessage"), "Success");
}

TEST(JsonTest, VerdictNames) {
    EXPECT_EQ(get_verdict_name(status::SUCCESS), "Accepted");
    EXPECT_EQ(get_verdict_name(status::TIMEOUT), "TimeLimitExceeded");
    EXPECT_EQ(get_verdict_name(status::RESOURCE_EXCEEDED), "ResourceExceeded");
    EXPECT_EQ(get_verdict_name(status::REJECTED), "Rejected");
    EXPECT_STREQ(get_outcome_name(test_outcome::PASS), "Pass");
    EXPECT_STREQ(get_outcome_name(test_outcome::ERROR), "Error");
}

TEST(JsonTest, EngineConfig) {
    engine_config config;
    size_t default_files = config.max_files;
    json::parse(R"({
        "runDir": "/var/lib/polyrun",
        "maxConcurrency": 3,
        "admissionTimeoutMs": 1000,
        "maxSourceBytes": 100,
        "maxRunLimits": {"timeoutMs": 5000},
        "sandbox": {"useCgroup": true, "cgroupRoot": "/test", "runUser": "nobody", "isolate": false}
    })").get_to(config);

    EXPECT_EQ(config.run_dir.string(), "/var/lib/polyrun");
    EXPECT_EQ(config.max_concurrency, 3u);
    EXPECT_EQ(config.concurrency(), 3u);
    EXPECT_EQ(config.admission_timeout_ms, 1000);
    EXPECT_EQ(config.max_source_bytes, 100u);
    EXPECT_EQ(config.max_files, default_files);
    EXPECT_EQ(config.max_run_limits.timeout_ms, 5000);
    EXPECT_EQ(config.max_run_limits.memory_bytes, engine_config::default_max_run_limits().memory_bytes);
    EXPECT_TRUE(config.sandbox.use_cgroup);
    EXPECT_EQ(config.sandbox.cgroup_root, "/test");
    EXPECT_FALSE(config.sandbox.isolate);
    EXPECT_EQ(config.run_user, "nobody");

    EXPECT_THROW(json::parse(R"({"maxConcurrency": "many"})").get_to(config), invalid_argument);
}

TEST(JsonTest, DefaultConcurrency) {
    engine_config config;
    EXPECT_EQ(config.max_concurrency, 0u);
    EXPECT_GE(config.concurrency(), 1u);
    EXPECT_EQ(config.admission_timeout_ms, 200);
    EXPECT_TRUE(config.sandbox.isolate);
    EXPECT_EQ(config.max_source_bytes, 50000u);
    EXPECT_EQ(config.max_stdin_bytes, 10000u);
    EXPECT_EQ(config.max_total_bytes, 200000u);
}

TEST(JsonTest, LanguageSpecRoundTrip) {
    language_spec spec = json::parse(R"({
        "id": "go",
        "aliases": ["golang"],
        "sourceFile": "main.go",
        "compile": ["go", "build", "-o", "main", "{source}"],
        "run": ["./main"],
        "env": {"GOCACHE": "{workdir}/.cache"}
    })").get<language_spec>();
    EXPECT_TRUE(spec.has_compile_step());
    EXPECT_EQ(spec.env.at("GOCACHE"), "{workdir}/.cache");
    EXPECT_EQ(spec.run_limits.memory_bytes, default_run_limits().memory_bytes);

    language_spec copy = json(spec).get<language_spec>();
    EXPECT_EQ(copy.compile_command, spec.compile_command);
    EXPECT_EQ(copy.run_command, spec.run_command);
    EXPECT_EQ(copy.aliases, spec.aliases);
    EXPECT_EQ(copy.compile_limits.timeout_ms, spec.compile_limits.timeout_ms);
}
