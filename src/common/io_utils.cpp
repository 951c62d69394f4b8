#include "codejudge/common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

fs::path create_unique_directory(const fs::path &root, const string &prefix) {
    fs::create_directories(root);
    // uuid 冲突的概率可以忽略，但 create_directory 返回 false 时仍然重试
    for (int attempt = 0; attempt < 8; ++attempt) {
        static thread_local boost::uuids::random_generator generator;
        fs::path dir = root / (prefix + boost::lexical_cast<string>(generator()));
        if (fs::create_directory(dir)) return dir;
    }
    throw system_error(EEXIST, system_category(), "unable to allocate a directory in " + root.string());
}

bool remove_directory_quietly(const fs::path &dir) noexcept {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
        return false;
    }
    return true;
}

}  // namespace codejudge
