#include "Utils.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <dirent.h>
#include <errno.h>
#include <cstring>

using namespace std;

namespace utils {

string join_path(const string &a, const string &b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_slash_end = (a.back() == '/');
    bool b_slash_start = (b.front() == '/');

    if (a_slash_end && b_slash_start) {
        return a + b.substr(1);
    } else if (!a_slash_end && !b_slash_start) {
        return a + "/" + b;
    } else {
        return a + b;
    }
}

static bool mkdir_single(const string &path) {
    if (path.empty()) return true;
    int rc = ::mkdir(path.c_str(), 0755);
    if (rc == 0) return true;
    if (errno == EEXIST) return true;
    return false;
}

vector<string> split_path(const string &path) {
    vector<string> parts;
    string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) {
                parts.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

bool ensure_dir(const string &path) {
    if (path.empty()) return true;

    vector<string> parts = split_path(path);
    string cur;
    if (path.front() == '/') {
        cur = "/";
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (cur == "/" || cur.empty())
            cur += parts[i];
        else
            cur = join_path(cur, parts[i]);

        if (!mkdir_single(cur)) {
            struct stat st{};
            if (::stat(cur.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
                return false;
            }
        }
    }

    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool file_exists(const string &path) {
    struct stat st{};
    return (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode));
}

uint64_t file_size(const string &path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        return (uint64_t)st.st_size;
    }
    return 0;
}

bool is_plain_filename(const string &name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        if (c == '/' || c == '\\') return false;
        if ((unsigned char)c < 0x20 || c == 0x7f) return false;
    }
    return true;
}

bool list_regular_files(const string &dir, vector<string> &names, string &err) {
    names.clear();
    DIR *d = ::opendir(dir.c_str());
    if (!d) {
        err = string("opendir: ") + strerror(errno);
        return false;
    }
    while (struct dirent *ent = ::readdir(d)) {
        string name = ent->d_name;
        if (name == "." || name == "..") continue;
        if (file_exists(join_path(dir, name))) names.push_back(name);
    }
    ::closedir(d);
    return true;
}

bool remove_file(const string &path) {
    if (::unlink(path.c_str()) == 0) return true;
    return errno == ENOENT;
}

} // namespace utils
