#include "common/io_utils.hpp"
#include <fstream>
#include "common/exceptions.hpp"

namespace oj {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw execution_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    if (fin.bad()) throw execution_error("Unable to read file " + path.string());
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw execution_error("Unable to create file " + path.string());
    fout << content;
    fout.flush();
    if (!fout) throw execution_error("Unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw execution_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace oj
