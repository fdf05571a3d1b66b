#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <fstream>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace codegrade {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string());
    if (!fin) throw io_error("Unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::out | ios::trunc | ios::binary);
    if (!fout) throw io_error("Unable to create " + path.string());
    fout << content;
    fout.close();
    if (!fout) throw io_error("Unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath.find('/') == 0)
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

scoped_workdir::scoped_workdir(const fs::path &parent, const string &id)
    : dir(parent / assert_safe_path(id)) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw io_error("Unable to create directory " + dir.string() + ": " + ec.message());
}

scoped_workdir::~scoped_workdir() {
    remove();
}

const fs::path &scoped_workdir::path() const {
    return dir;
}

fs::path scoped_workdir::write(const string &name, const string &content) const {
    fs::path file = dir / assert_safe_path(name);
    write_file_content(file, content);
    return file;
}

bool scoped_workdir::remove() noexcept {
    if (removed) return true;
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(ERROR) << "Unable to clean up " << dir << ": " << ec.message();
        return false;
    }
    removed = true;
    return true;
}

}  // namespace codegrade
