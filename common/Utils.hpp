#pragma once
#include <string>
#include <vector>
#include <cstdint>

using namespace std;

namespace utils {

// Join 2 paths with exactly one '/'
string join_path(const string &a, const string &b);

// "mkdir -p": create every missing level.
// true if the directory exists or was created.
bool ensure_dir(const string &path);

// Regular file exists
bool file_exists(const string &path);

// File size in bytes, 0 if missing / error
uint64_t file_size(const string &path);

// Split path on '/', dropping empty components
vector<string> split_path(const string &path);

// A name usable inside the flat storage namespace: one path segment,
// no separators, not "." / "..", no control characters.
bool is_plain_filename(const string &name);

// Names of the regular files directly inside dir, in readdir order.
bool list_regular_files(const string &dir, vector<string> &names, string &err);

// unlink, ignoring a missing file
bool remove_file(const string &path);

} // namespace utils
