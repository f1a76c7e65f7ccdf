#include "execution/request.hpp"
#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;
using nlohmann::json;

void from_json(const json &j, source_file &file) {
    if (!j.is_object() || !j.count("path") || !j.at("path").is_string())
        throw invalid_request_error("Each file requires a string path: " + j.dump());
    if (!j.count("content") || !j.at("content").is_string())
        throw invalid_request_error("File " + j.at("path").get<string>() + " requires string content");
    j.at("path").get_to(file.path);
    j.at("content").get_to(file.content);
}

static chrono::milliseconds parse_timeout(const json &value) {
    long long ms = 0;
    if (value.is_number_integer()) {
        ms = value.get<long long>();
    } else if (value.is_string()) {
        try {
            ms = boost::lexical_cast<long long>(value.get<string>());
        } catch (boost::bad_lexical_cast &) {
            throw invalid_request_error("Timeout is not a number: " + value.dump());
        }
    } else {
        throw invalid_request_error("Timeout is not a number: " + value.dump());
    }
    if (ms <= 0)
        throw invalid_request_error("Timeout must be positive: " + value.dump());
    if (ms > MAX_TIMEOUT.count())
        throw invalid_request_error(fmt::format("Timeout must not exceed {} ms: {}", MAX_TIMEOUT.count(), value.dump()));
    return chrono::milliseconds(ms);
}

execution_request parse_request(const json &document) {
    if (!document.is_object())
        throw invalid_request_error("Request must be a JSON object");
    if (!document.count("language") || !document.at("language").is_string())
        throw invalid_request_error("Request requires a string language");
    if (!document.count("files") || !document.at("files").is_array() || document.at("files").empty())
        throw invalid_request_error("Request requires a non-empty files array");

    execution_request request;
    request.lang = parse_language(document.at("language").get<string>());
    request.files = document.at("files").get<vector<source_file>>();
    if (document.count("timeoutMs") && !document.at("timeoutMs").is_null())
        request.timeout = parse_timeout(document.at("timeoutMs"));
    else if (document.count("timeout") && !document.at("timeout").is_null())
        request.timeout = parse_timeout(document.at("timeout"));
    return request;
}

}  // namespace runner
