#include "grading/language.hpp"
#include <algorithm>
#include "common/utils.hpp"
#include "grading/harness.hpp"

namespace codegrade {
using namespace std;

string language::source_name() const {
    return "main." + extension;
}

const vector<language> &available_languages() {
    // clang-format off
    static const vector<language> languages = {
        {"javascript", {"js", "node"},      "js",    "javascript", "node",    {},           harness::javascript},
        {"python",     {"py", "python3"},   "py",    "python",     "python3", {"-I", "-B"}, harness::python},
        {"typescript", {"ts"},              "ts",    "typescript", nullopt,   {},           nullptr},
        {"java",       {},                  "java",  "java",       nullopt,   {},           nullptr},
        {"cpp",        {"c++"},             "cpp",   "cpp",        nullopt,   {},           nullptr},
        {"c",          {},                  "c",     "c",          nullopt,   {},           nullptr},
        {"csharp",     {"cs"},              "cs",    "csharp",     nullopt,   {},           nullptr},
        {"php",        {},                  "php",   "php",        nullopt,   {},           nullptr},
        {"ruby",       {"rb"},              "rb",    "ruby",       nullopt,   {},           nullptr},
        {"go",         {"golang"},          "go",    "go",         nullopt,   {},           nullptr},
        {"rust",       {"rs"},              "rs",    "rust",       nullopt,   {},           nullptr},
        {"kotlin",     {"kt"},              "kt",    "kotlin",     nullopt,   {},           nullptr},
        {"swift",      {},                  "swift", "swift",      nullopt,   {},           nullptr},
    };
    // clang-format on
    return languages;
}

const language *find_language(const string &id) {
    string key = to_lower(id);
    for (auto &lang : available_languages()) {
        if (lang.id == key || find(lang.aliases.begin(), lang.aliases.end(), key) != lang.aliases.end())
            return &lang;
    }
    return nullptr;
}

const language &get_language(const string &id) {
    const language *lang = find_language(id);
    if (!lang) throw language_unsupported(id);
    return *lang;
}

}  // namespace codegrade
