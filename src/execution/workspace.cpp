#include "execution/workspace.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <system_error>
#include "common/io_utils.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const fs::path &parent)
    : dir(create_temp_directory(parent, "code-runner-")) {
    VLOG(1) << "Created workspace " << dir;
}

workspace::~workspace() {
    remove();
}

const fs::path &workspace::root() const {
    return dir;
}

string workspace::name() const {
    return dir.filename().string();
}

vector<string> workspace::materialize(const vector<source_file> &files) {
    vector<string> paths;
    for (auto &file : files) {
        fs::path target = resolve_safe_path(dir, file.path);
        fs::create_directories(target.parent_path());
        write_file_content(target, file.content);

        string relative = target.lexically_relative(dir).generic_string();
        if (find(paths.begin(), paths.end(), relative) == paths.end())
            paths.push_back(relative);
        VLOG(2) << "Wrote " << file.content.size() << " bytes to " << target;
    }
    return paths;
}

bool workspace::remove() noexcept {
    if (removed) return true;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(WARNING) << "Failed to cleanup workspace " << dir << ": " << ec.message();
        return false;
    }
    removed = true;
    VLOG(1) << "Removed workspace " << dir;
    return true;
}

}  // namespace runner
