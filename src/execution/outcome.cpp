#include "execution/outcome.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>

namespace runner {
using namespace std;

execution_outcome aggregate(const demuxed_output &streams, optional<int> exit_code,
                            const optional<string> &supervisory_error) {
    execution_outcome outcome;
    outcome.output = boost::algorithm::trim_copy(streams.output);

    string error;
    if (supervisory_error) {
        error = boost::algorithm::trim_copy(*supervisory_error);
        outcome.exit_code = -1;
    } else {
        error = boost::algorithm::trim_copy(streams.error);
        outcome.exit_code = exit_code.value_or(-1);
    }

    // stderr 非空（即使只有空白）也视为失败
    outcome.success = !supervisory_error && outcome.exit_code == 0 && streams.error.empty();
    if (error.empty() && outcome.exit_code != 0)
        error = fmt::format("Process exited with code {}", outcome.exit_code);
    if (!error.empty())
        outcome.error = error;
    return outcome;
}

execution_outcome failed_outcome(const string &message) {
    return aggregate(demuxed_output(), nullopt, message);
}

nlohmann::json to_json(const execution_outcome &outcome) {
    nlohmann::json j;
    j["success"] = outcome.success;
    j["output"] = outcome.output;
    if (outcome.error)
        j["error"] = *outcome.error;
    else
        j["error"] = nullptr;
    j["exitCode"] = outcome.exit_code;
    return j;
}

}  // namespace runner
