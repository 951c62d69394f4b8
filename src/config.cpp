#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

int TIME_LIMIT_MS = 3000;
int COMPILE_TIME_LIMIT_MS = 10000;
int MEMORY_SAMPLE_INTERVAL_MS = 60;
size_t OUTPUT_LIMIT = 8 << 20;  // 8M
size_t ERROR_LIMIT = 4096;

filesystem::path RUN_DIR = "/tmp";

string PYTHON_BIN = "python3";
string JAVAC_BIN = "javac";
string JAVA_BIN = "java";
string GXX_BIN = "g++";

string EXECUTOR_MODE = "auto";
string REMOTE_URL = "https://emkc.org/api/v2/piston";
bool REMOTE_ENABLED = true;
int REMOTE_TIMEOUT_MS = 15000;
map<language, string> REMOTE_VERSIONS = {
    {language::PYTHON, "3.11.0"},
    {language::CPP, "10.2.0"},
    {language::JAVA, "15.0.2"}};
int REMOTE_FAILURE_THRESHOLD = 3;
int REMOTE_COOLDOWN_MS = 30000;

string COMPARISON_MODE = "relaxed";
filesystem::path TYPESCRIPT_JS;
size_t SANDBOX_MEMORY_LIMIT_KB = 1 << 18;  // 256M

}  // namespace codejudge
