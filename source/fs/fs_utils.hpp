#pragma once

#include <string>
#include <vector>

namespace fsx {

bool exists(const std::string& p);
bool isdir(const std::string& p);
bool isfile(const std::string& p);
long file_size(const std::string& p);
bool makedirs(const std::string& path);
// errno of the first failure is left in *err when given
bool rmtree(const std::string& root, int* err=nullptr);

struct DirEnt {
    std::string path;
    bool is_dir;
    bool is_file;
};

std::vector<DirEnt> list_dirents(const std::string& root);
// same as list_dirents but reports opendir failure (errno in err)
bool list_dirents_checked(const std::string& root, std::vector<DirEnt>& out, int& err);

std::string base_name(const std::string& p);
std::string parent_dir(const std::string& p);
std::string strip_ext(const std::string& p);
std::string ext_lower(const std::string& p);
std::string join(const std::string& a, const std::string& b);

bool read_file(const std::string& p, std::string& out);

} // namespace fsx
