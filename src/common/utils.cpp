#include "codejudge/common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>
#include <vector>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

static bool is_executable_file(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

optional<fs::path> find_executable(const string &name) {
    if (name.empty()) return nullopt;
    if (name.find('/') != string::npos) {
        if (is_executable_file(name)) return fs::path(name);
        return nullopt;
    }

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
        if (is_executable_file(candidate)) return candidate;
    }
    return nullopt;
}

string html_unescape(const string &text) {
    if (text.find('&') == string::npos) return text;
    string result = text;
    boost::replace_all(result, "&lt;", "<");
    boost::replace_all(result, "&gt;", ">");
    boost::replace_all(result, "&quot;", "\"");
    boost::replace_all(result, "&#39;", "'");
    // &amp; 最后处理，避免 "&amp;lt;" 被还原两次
    boost::replace_all(result, "&amp;", "&");
    return result;
}

string truncate_text(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "\n... (truncated)";
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codejudge
