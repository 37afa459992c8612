#include "polyrun/common/io_utils.hpp"
#include <errno.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include "polyrun/common/exceptions.hpp"

namespace polyrun {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    errno = 0;
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno ? errno : EIO, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw system_error(errno ? errno : EIO, system_category(), "unable to write " + path.string());
}

bool is_safe_filename(const string &filename) {
    if (filename.empty() || filename == "." || filename == "..")
        return false;
    if (filename.find("..") != string::npos)
        return false;
    return all_of(filename.begin(), filename.end(), [](unsigned char c) {
        return isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

const string &assert_safe_path(const string &filename) {
    if (!is_safe_filename(filename))
        throw invalid_submission("filename is not safe: " + filename);
    return filename;
}

}  // namespace polyrun
