#include "model/submission.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace autograder {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &tc) {
    tc.id = assert_safe_id(j.at("id").get<string>());
    tc.assignment_id = get_value_def(j, tc.assignment_id, "assignment_id");
    tc.input = get_value_def(j, string(), "input");
    tc.expected_output = get_value_def(j, string(), "expected_output");
}

void to_json(json &j, const test_case &tc) {
    j = {{"id", tc.id},
         {"assignment_id", tc.assignment_id},
         {"input", tc.input},
         {"expected_output", tc.expected_output}};
}

void from_json(const json &j, submission &submit) {
    submit.id = assert_safe_id(j.at("id").get<string>());
    submit.student_id = get_value_def(j, string(), "student_id");
    submit.assignment_id = assert_safe_id(j.at("assignment_id").get<string>());
    submit.source_path = j.at("source_path").get<string>();
    submit.compiled = parse_compile_state(get_value_def(j, string("unknown"), "compiled"));
    submit.confirmed = get_value_def(j, false, "confirmed");
    submit.created_at = get_value_def<time_t>(j, 0, "created_at");
}

void to_json(json &j, const submission &submit) {
    j = {{"id", submit.id},
         {"student_id", submit.student_id},
         {"assignment_id", submit.assignment_id},
         {"source_path", submit.source_path.string()},
         {"compiled", to_string(submit.compiled)},
         {"confirmed", submit.confirmed},
         {"created_at", submit.created_at}};
}

}  // namespace autograder
