#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace runner {
using namespace std;

// clang-format off
static const unordered_map<execution_state, const char *> state_string = boost::assign::map_list_of
    (execution_state::PENDING, "Pending")
    (execution_state::MATERIALIZING, "Materializing")
    (execution_state::RESOLVING, "Resolving")
    (execution_state::STARTING, "Starting")
    (execution_state::RUNNING, "Running")
    (execution_state::FINALIZING, "Finalizing")
    (execution_state::CLEANING_UP, "Cleaning Up")
    (execution_state::DONE, "Done");
// clang-format on

const char *get_display_message(execution_state state) {
    return state_string.at(state);
}

}  // namespace runner
