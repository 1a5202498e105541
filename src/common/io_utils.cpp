#include "common/io_utils.hpp"
#include <fmt/core.h>
#include <fstream>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw data_error(fmt::format("Unable to read file {}", path.string()));
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

vector<string> read_file_lines(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw data_error(fmt::format("Unable to read file {}", path.string()));
    vector<string> lines;
    string line;
    while (getline(fin, line))
        lines.push_back(line);
    return lines;
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw data_error(fmt::format("Unable to write file {}", path.string()));
    fout << content;
    fout.close();
    if (!fout)
        throw data_error(fmt::format("Unable to write file {}", path.string()));
}

void write_once(const fs::path &path, const string &content) {
    if (fs::exists(path))
        throw data_error(fmt::format("File {} has already been written", path.string()));
    write_file_content(path, content);
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw internal_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace grader
