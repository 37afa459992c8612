#include "polyrun/language/language_registry.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include "polyrun/common/exceptions.hpp"
#include "polyrun/common/io_utils.hpp"

namespace polyrun {
using namespace std;
using namespace nlohmann;

language_registry::language_registry(const vector<language_spec> &specs) {
    for (auto &spec : specs) add(spec);
}

void language_registry::add(const language_spec &spec) {
    string key = boost::algorithm::to_lower_copy(spec.id);
    bool replaced = false;
    for (auto &existing : specs) {
        if (boost::algorithm::to_lower_copy(existing.id) == key) {
            existing = spec;
            replaced = true;
            break;
        }
    }
    if (!replaced) specs.push_back(spec);

    // 别名不能覆盖其他语言的标识符
    index.clear();
    for (size_t i = 0; i < specs.size(); ++i)
        for (auto &alias : specs[i].aliases)
            index[boost::algorithm::to_lower_copy(alias)] = i;
    for (size_t i = 0; i < specs.size(); ++i)
        index[boost::algorithm::to_lower_copy(specs[i].id)] = i;
}

const language_spec *language_registry::find(const string &identifier) const {
    auto it = index.find(boost::algorithm::to_lower_copy(identifier));
    if (it == index.end()) return nullptr;
    return &specs[it->second];
}

const language_spec &language_registry::resolve(const string &identifier) const {
    const language_spec *spec = find(identifier);
    if (!spec) throw unsupported_language(identifier);
    return *spec;
}

vector<string> language_registry::identifiers() const {
    vector<string> result;
    for (auto &spec : specs) result.push_back(spec.id);
    return result;
}

size_t language_registry::size() const {
    return specs.size();
}

void language_registry::merge(const json &j) {
    const json &languages = j.is_object() ? j.at("languages") : j;
    for (auto &entry : languages) {
        language_spec spec = entry.get<language_spec>();
        if (spec.id.empty() || spec.source_file.empty() || spec.run_command.empty())
            throw invalid_argument("language definition requires id, sourceFile and run: " + entry.dump());
        assert_safe_path(spec.source_file);
        if (find(spec.id)) LOG(INFO) << "language " << spec.id << " overridden";
        add(spec);
    }
}

language_registry language_registry::load_file(const filesystem::path &path, bool with_builtin) {
    if (!filesystem::is_regular_file(path))
        throw invalid_argument("language file " + path.string() + " does not exist");
    language_registry registry = with_builtin ? builtin() : language_registry();
    registry.merge(json::parse(read_file_content(path)));
    return registry;
}

language_registry language_registry::builtin() {
    language_registry registry;

    {
        language_spec c;
        c.id = "c";
        c.source_file = "main.c";
        c.compile_command = {"gcc", "-O2", "-std=c11", "-o", "main", "{source}", "-lm"};
        c.run_command = {"./main"};
        c.compile_limits = default_compile_limits();
        c.run_limits = default_run_limits();
        registry.add(c);
    }

    {
        language_spec cpp;
        cpp.id = "cpp";
        cpp.aliases = {"c++", "cxx"};
        cpp.source_file = "main.cpp";
        cpp.compile_command = {"g++", "-O2", "-std=c++17", "-o", "main", "{source}", "-lm"};
        cpp.run_command = {"./main"};
        cpp.compile_limits = default_compile_limits();
        cpp.run_limits = default_run_limits();
        registry.add(cpp);
    }

    {
        // JVM 预留的内存较多，给更宽松的内存限制
        language_spec java;
        java.id = "java";
        java.source_file = "Main.java";
        java.compile_command = {"javac", "-J-Xmx512m", "-encoding", "UTF-8", "-d", ".", "{source}"};
        java.run_command = {"java", "-cp", ".", "-XX:MaxRAM={memoryMb}m", "-XX:+UseSerialGC", "Main"};
        java.compile_limits = default_compile_limits();
        java.compile_limits.timeout_ms = 60000;
        java.compile_limits.cpu_time_ms = 60000;
        java.run_limits = default_run_limits();
        java.run_limits.memory_bytes = 512LL * 1024 * 1024;
        registry.add(java);
    }

    {
        language_spec python;
        python.id = "python";
        python.aliases = {"py", "python3"};
        python.source_file = "app.py";
        python.run_command = {"python3", "-B", "-E", "-S", "{source}"};
        python.compile_limits = default_compile_limits();
        python.run_limits = default_run_limits();
        registry.add(python);
    }

    {
        language_spec javascript;
        javascript.id = "javascript";
        javascript.aliases = {"js", "node", "nodejs"};
        javascript.source_file = "index.js";
        javascript.run_command = {"node", "--max-old-space-size={memoryMb}", "{source}"};
        javascript.compile_limits = default_compile_limits();
        javascript.run_limits = default_run_limits();
        registry.add(javascript);
    }

    {
        // dotnet 需要一个项目文件，因此先创建控制台项目，再用提交的代码替换 Program.cs
        language_spec csharp;
        csharp.id = "csharp";
        csharp.aliases = {"cs", "c#"};
        csharp.source_file = "Submission.cs";
        csharp.compile_command = {
            "sh", "-c",
            "dotnet new console -n Submission -o . --force >/dev/null"
            " && mv {source} Program.cs"
            " && dotnet build -c Release -o build -p:UseSharedCompilation=false -nologo"};
        csharp.run_command = {"./build/Submission"};
        csharp.env = {
            {"DOTNET_CLI_HOME", "{workdir}"},
            {"XDG_DATA_HOME", "{workdir}"},
            {"DOTNET_CLI_TELEMETRY_OPTOUT", "1"},
            {"DOTNET_NOLOGO", "1"},
            {"DOTNET_SKIP_FIRST_TIME_EXPERIENCE", "1"},
            {"MSBUILDDISABLENODEREUSE", "1"}};
        csharp.compile_limits = default_compile_limits();
        csharp.compile_limits.timeout_ms = 120000;
        csharp.compile_limits.cpu_time_ms = -1;
        csharp.compile_limits.memory_bytes = 2048LL * 1024 * 1024;
        csharp.run_limits = default_run_limits();
        csharp.run_limits.memory_bytes = 512LL * 1024 * 1024;
        registry.add(csharp);
    }

    return registry;
}

}  // namespace polyrun
