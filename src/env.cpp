#include "codejudge/env.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <filesystem>
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

template <typename T>
static void load_value(const char *key, T &value) {
    const char *raw = getenv(key);
    if (!raw) return;
    try {
        value = boost::lexical_cast<T>(boost::algorithm::trim_copy(string(raw)));
    } catch (boost::bad_lexical_cast &) {
        LOG(WARNING) << "Environment variable " << key << "=" << raw << " is malformed, keeping " << value;
    }
}

static void load_switch(const char *key, bool &value) {
    const char *raw = getenv(key);
    if (!raw) return;
    string s = boost::algorithm::to_lower_copy(string(raw));
    if (s == "on" || s == "true" || s == "1" || s == "yes")
        value = true;
    else if (s == "off" || s == "false" || s == "0" || s == "no")
        value = false;
    else
        LOG(WARNING) << "Environment variable " << key << "=" << raw << " should be on or off";
}

void load_environment() {
    load_value("TIMELIMIT", TIME_LIMIT_MS);
    load_value("COMPILETIMELIMIT", COMPILE_TIME_LIMIT_MS);
    load_value("OUTPUTLIMIT", OUTPUT_LIMIT);
    load_value("ERRORLIMIT", ERROR_LIMIT);
    load_value("SANDBOXMEMLIMIT", SANDBOX_MEMORY_LIMIT_KB);

    if (getenv("RUNDIR")) {
        RUN_DIR = filesystem::path(getenv("RUNDIR"));
    } else {
        error_code ec;
        auto tmp = filesystem::temp_directory_path(ec);
        if (!ec) RUN_DIR = tmp;
    }

    PYTHON_BIN = get_env("PYTHON_BIN", PYTHON_BIN);
    JAVAC_BIN = get_env("JAVAC_BIN", JAVAC_BIN);
    JAVA_BIN = get_env("JAVA_BIN", JAVA_BIN);
    GXX_BIN = get_env("GXX_BIN", GXX_BIN);

    EXECUTOR_MODE = boost::algorithm::to_lower_copy(get_env("EXECUTOR_MODE", EXECUTOR_MODE));
    REMOTE_URL = get_env("PISTON_URL", get_env("PISTON_API_URL", REMOTE_URL));
    load_switch("REMOTE_EXECUTOR", REMOTE_ENABLED);
    load_value("REMOTE_TIMEOUT", REMOTE_TIMEOUT_MS);
    load_value("REMOTE_FAILURE_THRESHOLD", REMOTE_FAILURE_THRESHOLD);
    load_value("REMOTE_COOLDOWN", REMOTE_COOLDOWN_MS);

    for (language lang : {language::JAVASCRIPT, language::TYPESCRIPT, language::PYTHON, language::JAVA, language::CPP}) {
        string key = "PISTON_" + boost::algorithm::to_upper_copy(string(to_string(lang))) + "_VERSION";
        if (getenv(key.c_str())) REMOTE_VERSIONS[lang] = getenv(key.c_str());
    }

    COMPARISON_MODE = boost::algorithm::to_lower_copy(get_env("COMPARISON_MODE", COMPARISON_MODE));

    if (getenv("TYPESCRIPT_JS")) TYPESCRIPT_JS = filesystem::path(getenv("TYPESCRIPT_JS"));
}

}  // namespace codejudge
