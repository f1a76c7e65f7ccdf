#include "common/io_utils.hpp"
#include <stdlib.h>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), fmt::format("unable to open {}", path));
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), fmt::format("unable to create {}", path));
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), fmt::format("unable to write {}", path));
}

string normalize_path(const string &subpath) {
    string slashed = subpath;
    replace(slashed.begin(), slashed.end(), '\\', '/');
    if (slashed.empty()) return slashed;
    string normal = fs::path(slashed).lexically_normal().generic_string();
    // "src/" 规范化之后保留了末尾的 /，这里统一去掉
    while (normal.size() > 1 && normal.back() == '/')
        normal.pop_back();
    return normal;
}

fs::path resolve_safe_path(const fs::path &root, const string &subpath) {
    string normal = normalize_path(subpath);
    if (normal.empty() || normal == ".")
        throw invalid_path_error("Invalid file path: \"" + subpath + "\"");

    fs::path relative(normal);
    if (relative.has_root_directory() || relative.has_root_name())
        throw invalid_path_error("Absolute file path is not allowed: " + subpath);

    fs::path base = root.lexically_normal();
    fs::path resolved = (base / relative).lexically_normal();
    fs::path back = resolved.lexically_relative(base);
    if (back.empty() || back == "." || *back.begin() == "..")
        throw invalid_path_error("File path escapes the workspace: " + subpath);
    return resolved;
}

fs::path create_temp_directory(const fs::path &parent, const string &prefix) {
    string pattern = (parent / (prefix + "XXXXXX")).string();
    vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data()))
        throw system_error(errno, system_category(), fmt::format("unable to create temporary directory in {}", parent));
    return fs::path(buffer.data());
}

fs::path prepare_temp_root(const fs::path &configured) {
    fs::path root = configured.empty() ? fs::temp_directory_path() : configured;
    fs::create_directories(root);
    return fs::absolute(root);
}

}  // namespace runner
