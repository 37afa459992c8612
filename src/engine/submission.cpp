#include "polyrun/engine/submission.hpp"
#include "polyrun/common/json_utils.hpp"

namespace polyrun {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &test) {
    test.name = get_value_def<string>(j, "", "name");
    test.input = get_value_def<string>(j, "", "input");
    j.at("expectedOutput").get_to(test.expected_output);
}

void from_json(const json &j, submission &sub) {
    sub.id = get_value_def<string>(j, "", "id");
    sub.language = get_value_def<string>(j, "", "language");
    sub.source = get_value_def<string>(j, "", "source");
    if (exists(j, "stdin")) sub.stdin_data = j.at("stdin").get<string>();
    assign_optional(j, sub.files, "files");
    if (exists(j, "limits")) j.at("limits").get_to(sub.limits);
    assign_optional(j, sub.tests, "tests");
}

}  // namespace polyrun
