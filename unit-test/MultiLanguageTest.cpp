#include "gtest/gtest.h"
#include "polyrun/engine/executor.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace polyrun;
namespace fs = std::filesystem;

/**
 * 使用内置语言运行 hello world 和语法错误的程序
 * 对应的工具链不存在时跳过
 */
class MultiLanguageTest : public ::testing::Test {
protected:
    MultiLanguageTest()
        : run_dir(make_temp_dir("polyrun-lang")),
          registry(language_registry::builtin()),
          config(test_config(run_dir)),
          workspaces(run_dir),
          runner(config.sandbox),
          limiter(config.concurrency()),
          exec(registry, workspaces, runner, limiter, config) {}

    ~MultiLanguageTest() override {
        fs::remove_all(run_dir);
    }

    execution_result run(const string &language, const string &source) {
        submission sub;
        sub.id = language;
        sub.language = language;
        sub.source = source;
        return exec.execute(sub);
    }

    void test_hello(const string &language, const string &source) {
        execution_result result = run(language, source);
        EXPECT_EQ(result.stat, status::SUCCESS) << result.message << result.compile_error.value_or("") << result.stderr_data;
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_EQ(result.stdout_data, "hello world\n");
        EXPECT_TRUE(fs::is_empty(run_dir));
    }

    void test_syntax_error(const string &language, const string &source) {
        execution_result result = run(language, source);
        EXPECT_EQ(result.stat, status::COMPILE_ERROR);
        ASSERT_TRUE(result.compile_error);
        EXPECT_FALSE(result.compile_error->empty());
        EXPECT_EQ(result.stdout_data, "");
        EXPECT_TRUE(fs::is_empty(run_dir));
    }

    fs::path run_dir;
    language_registry registry;
    engine_config config;
    workspace_manager workspaces;
    local_process_runner runner;
    concurrency_limiter limiter;
    executor exec;
};

TEST_F(MultiLanguageTest, CTest) {
    if (!has_program("gcc")) GTEST_SKIP() << "gcc is not installed";
    test_hello("c", R"(
#include <stdio.h>
int main() { puts("hello world"); return 0; })");
    test_syntax_error("c", "int main() { return 0 }");
}

TEST_F(MultiLanguageTest, CppTest) {
    if (!has_program("g++")) GTEST_SKIP() << "g++ is not installed";
    test_hello("cpp", R"(
#include <iostream>
int main() { std::cout << "hello world" << std::endl; })");
    test_syntax_error("c++", "int main() { undefined_symbol; }");
}

TEST_F(MultiLanguageTest, JavaTest) {
    if (!has_program("javac") || !has_program("java")) GTEST_SKIP() << "JDK is not installed";
    test_hello("java", R"(
public class Main {
    public static void main(String[] args) {
        System.out.println("hello world");
    }
})");
    test_syntax_error("java", "public class Main { void f() { int x = } }");
}

TEST_F(MultiLanguageTest, PythonTest) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not installed";
    test_hello("python", "print('hello world')");

    // 解释型语言的语法错误是运行时错误
    execution_result result = run("py", "print('unterminated)");
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_NE(result.stderr_data.find("SyntaxError"), string::npos);
}

TEST_F(MultiLanguageTest, JavaScriptTest) {
    if (!has_program("node")) GTEST_SKIP() << "node is not installed";
    test_hello("javascript", "console.log('hello world');");

    execution_result result = run("js", "throw new Error('boom');");
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_NE(result.exit_code, 0);
}

TEST_F(MultiLanguageTest, CSharpTest) {
    if (!has_program("dotnet")) GTEST_SKIP() << "dotnet is not installed";
    test_hello("csharp", R"(
using System;
class Program {
    static void Main() { Console.WriteLine("hello world"); }
})");
}

TEST_F(MultiLanguageTest, PythonInfiniteLoop) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not installed";
    submission sub;
    sub.language = "python";
    sub.source = "while True:\n    pass\n";
    sub.limits.timeout_ms = 1000;
    execution_result result = exec.execute(sub);
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.duration_ms, 6000);
}
