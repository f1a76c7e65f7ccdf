#include "execution/language.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/assign.hpp>
#include <map>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

namespace {

/**
 * @brief 每种语言的固定配置
 */
struct language_traits {
    const char *name;

    /**
     * @brief 展示给用户的名称，比如 "C++"
     */
    const char *display;

    /**
     * @brief 镜像名后缀，完整镜像名为 IMAGE_PREFIX + image
     */
    const char *image;

    /**
     * @brief 源文件扩展名，第一个为主扩展名
     */
    vector<string> extensions;

    /**
     * @brief 规范入口文件名
     */
    const char *entry_name;
};

// clang-format off
const map<language, language_traits> traits_table = boost::assign::map_list_of
    (language::PYTHON,     language_traits{"python",     "Python",     "python", {".py"},          "main.py"})
    (language::JAVASCRIPT, language_traits{"javascript", "JavaScript", "node",   {".js"},          "main.js"})
    (language::C,          language_traits{"c",          "C",          "c",      {".c"},           "main.c"})
    (language::CPP,        language_traits{"cpp",        "C++",        "cpp",    {".cpp", ".cxx"}, "main."})
    (language::JAVA,       language_traits{"java",       "Java",       "java",   {".java"},        "Main.java"});

const map<string, language> language_names = boost::assign::map_list_of
    ("python", language::PYTHON)
    ("javascript", language::JAVASCRIPT)
    ("js", language::JAVASCRIPT)
    ("node", language::JAVASCRIPT)
    ("c", language::C)
    ("cpp", language::CPP)
    ("c++", language::CPP)
    ("java", language::JAVA);
// clang-format on

bool is_entry_name(language lang, const string &path) {
    const string entry = traits_table.at(lang).entry_name;
    if (lang == language::CPP)
        return path.find(entry) != string::npos;
    return path == entry || boost::algorithm::ends_with(path, "/" + entry);
}

string strip_extension(language lang, const string &path) {
    for (auto &ext : traits_table.at(lang).extensions)
        if (boost::algorithm::ends_with(path, ext))
            return path.substr(0, path.size() - ext.size());
    return path;
}

bool is_command_safe(const string &path) {
    if (path.empty() || path.front() == '-') return false;
    return all_of(path.begin(), path.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '/' || c == '-';
    });
}

string build_command(language lang, const string &entry) {
    switch (lang) {
        case language::PYTHON:
            return fmt::format("python {}", entry);
        case language::JAVASCRIPT:
            return fmt::format("node {}", entry);
        case language::C: {
            string binary = strip_extension(lang, entry);
            return fmt::format("gcc {} -o {} && ./{}", entry, binary, binary);
        }
        case language::CPP: {
            string binary = strip_extension(lang, entry);
            return fmt::format("g++ {} -o {} && ./{}", entry, binary, binary);
        }
        case language::JAVA: {
            // javac 将 class 文件输出到当前目录，因此先切换到入口文件所在目录
            auto slash = entry.find_last_of('/');
            string dir = slash == string::npos ? "." : entry.substr(0, slash);
            string file = slash == string::npos ? entry : entry.substr(slash + 1);
            return fmt::format("cd {} && javac {} && java {}", dir, file, strip_extension(lang, file));
        }
    }
    throw unsupported_language_error(fmt::format("Unsupported language: {}", static_cast<int>(lang)));
}

}  // namespace

language parse_language(const string &name) {
    auto it = language_names.find(boost::algorithm::to_lower_copy(name));
    if (it == language_names.end())
        throw unsupported_language_error("Unsupported language: " + name);
    return it->second;
}

const char *get_language_name(language lang) {
    return traits_table.at(lang).name;
}

string get_image_name(language lang, const string &prefix) {
    return prefix + traits_table.at(lang).image;
}

bool has_language_extension(language lang, const string &path) {
    auto slash = path.find_last_of('/');
    string file = slash == string::npos ? path : path.substr(slash + 1);
    auto &extensions = traits_table.at(lang).extensions;
    // 文件名必须在扩展名之前还有内容，否则 src/.c 会被编译为 src/
    return any_of(extensions.begin(), extensions.end(), [&](const string &ext) {
        return file.size() > ext.size() && boost::algorithm::ends_with(file, ext);
    });
}

string select_entry_file(language lang, const vector<string> &files) {
    auto entry = find_if(files.begin(), files.end(), [&](const string &path) {
        return has_language_extension(lang, path) && is_entry_name(lang, path);
    });
    if (entry == files.end())
        entry = find_if(files.begin(), files.end(), [&](const string &path) {
            return has_language_extension(lang, path);
        });
    if (entry == files.end())
        throw entry_file_not_found_error(fmt::format("No {} file found", traits_table.at(lang).display));
    return *entry;
}

language_plan resolve_plan(language lang, const vector<string> &files, const string &image_prefix) {
    language_plan plan;
    plan.image_name = get_image_name(lang, image_prefix);
    plan.entry_file = select_entry_file(lang, files);
    if (!is_command_safe(plan.entry_file))
        throw invalid_path_error("Entry file path contains unsupported characters: " + plan.entry_file);
    plan.run_command = build_command(lang, plan.entry_file);
    VLOG(1) << "Resolved " << get_language_name(lang) << " plan: image=" << plan.image_name
            << ", entry=" << plan.entry_file << ", command=" << plan.run_command;
    return plan;
}

}  // namespace runner
