#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace autograder {
using namespace std;

// clang-format off
static const unordered_map<compile_state, const char *> state_display = boost::assign::map_list_of
    (compile_state::UNKNOWN, "Ungraded")
    (compile_state::FAILED, "Compilation Failed or Timed Out")
    (compile_state::COMPILED, "Compiled");

static const unordered_map<compile_state, const char *> state_string = boost::assign::map_list_of
    (compile_state::UNKNOWN, "unknown")
    (compile_state::FAILED, "failed")
    (compile_state::COMPILED, "compiled");
// clang-format on

const char *get_display_message(compile_state state) {
    return state_display.at(state);
}

string to_string(compile_state state) {
    return state_string.at(state);
}

compile_state parse_compile_state(const string &value) {
    for (auto &[state, name] : state_string)
        if (value == name) return state;
    throw invalid_argument("unrecognized compile state " + value);
}

}  // namespace autograder
