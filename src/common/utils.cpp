#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <vector>

namespace codegrade {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

optional<filesystem::path> find_program(const string &program) {
    if (program.empty()) return nullopt;
    if (program.find('/') != string::npos) {
        if (::access(program.c_str(), X_OK) == 0) return filesystem::path(program);
        return nullopt;
    }

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / program;
        std::error_code ec;
        if (filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return nullopt;
}

string to_lower(const string &str) {
    return boost::algorithm::to_lower_copy(str);
}

string generate_uuid() {
    // random_generator is not thread safe, so every call owns one
    return boost::lexical_cast<string>(boost::uuids::random_generator()());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codegrade
