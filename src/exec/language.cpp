#include "codejudge/exec/language.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <map>
#include <stdexcept>

namespace codejudge {
using namespace std;

// clang-format off
static const map<string, language> language_aliases = boost::assign::map_list_of
    ("javascript", language::JAVASCRIPT)
    ("js", language::JAVASCRIPT)
    ("node", language::JAVASCRIPT)
    ("typescript", language::TYPESCRIPT)
    ("ts", language::TYPESCRIPT)
    ("python", language::PYTHON)
    ("python3", language::PYTHON)
    ("py", language::PYTHON)
    ("java", language::JAVA)
    ("cpp", language::CPP)
    ("c++", language::CPP);
// clang-format on

language parse_language(const string &name) {
    string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    auto it = language_aliases.find(key);
    if (it == language_aliases.end())
        throw invalid_argument("Unsupported language: " + name);
    return it->second;
}

const char *to_string(language lang) {
    switch (lang) {
        case language::JAVASCRIPT: return "javascript";
        case language::TYPESCRIPT: return "typescript";
        case language::PYTHON: return "python";
        case language::JAVA: return "java";
        case language::CPP: return "cpp";
    }
    throw invalid_argument("Unknown language");
}

bool is_script_language(language lang) {
    return lang == language::JAVASCRIPT || lang == language::TYPESCRIPT;
}

}  // namespace codejudge
