#include "judge/comparator.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace autograder {
using namespace std;
using namespace nlohmann;

size_t submission_results::passed() const {
    return count_if(tests.begin(), tests.end(), [](const test_result &r) { return r.passed; });
}

static size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 1;  // 后续字节或者不可能出现的首字节
}

vector<string> split_characters(const string &text) {
    vector<string> characters;
    size_t i = 0;
    while (i < text.size()) {
        size_t length = sequence_length(text[i]);
        if (length > 1) {
            if (i + length > text.size()) {
                length = 1;
            } else {
                for (size_t k = 1; k < length; ++k)
                    if (((unsigned char)text[i + k] & 0xC0) != 0x80) {
                        length = 1;
                        break;
                    }
            }
        }
        characters.push_back(text.substr(i, length));
        i += length;
    }
    return characters;
}

test_result compare_output(const string &input, const string &expected, const string &actual) {
    test_result result;
    result.passed = actual == expected;
    result.input = input;
    result.expected_output = expected;

    vector<string> expected_chars = split_characters(expected);
    vector<string> actual_chars = split_characters(actual);
    result.missing_output = (long)expected_chars.size() - (long)actual_chars.size();

    result.output.reserve(actual_chars.size());
    for (size_t i = 0; i < actual_chars.size(); ++i) {
        annotated_char c;
        c.ch = actual_chars[i];
        c.incorrect = i >= expected_chars.size() || actual_chars[i] != expected_chars[i];
        c.newline = actual_chars[i] == "\n";
        result.output.push_back(c);
    }
    return result;
}

string grade_summary(const submission_results &results, size_t total) {
    if (results.compiled != compile_state::COMPILED)
        return get_display_message(compile_state::FAILED);
    size_t passed = results.passed();
    double percent = total == 0 ? 0 : 100.0 * passed / total;
    return fmt::format("{:.2f}% ({}/{})", percent, passed, total);
}

void to_json(json &j, const annotated_char &c) {
    j = {{"char", c.ch},
         {"incorrect", c.incorrect},
         {"newline", c.newline}};
}

void to_json(json &j, const test_result &result) {
    j = {{"passed", result.passed},
         {"input", result.input},
         {"expected_output", result.expected_output},
         {"output", result.output},
         {"missing_output", result.missing_output}};
}

void to_json(json &j, const submission_results &results) {
    j = {{"compiled", results.compiled == compile_state::COMPILED},
         {"tests", results.tests}};
}

}  // namespace autograder
