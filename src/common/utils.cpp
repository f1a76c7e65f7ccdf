#include "common/utils.hpp"
#include <cstdlib>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

bool has_env(const string &key) {
    char *result = getenv(key.c_str());
    return result && *result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
