#include "fs_utils.hpp"

#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>
#include <cerrno>
#include <cctype>
#include <cstdio>
#include <algorithm>

namespace fsx {

bool exists(const std::string& p){
    struct stat st{};
    return lstat(p.c_str(), &st)==0;
}

bool isdir(const std::string& p){
    struct stat st{};
    return stat(p.c_str(), &st)==0 && S_ISDIR(st.st_mode);
}

bool isfile(const std::string& p){
    struct stat st{};
    return stat(p.c_str(), &st)==0 && S_ISREG(st.st_mode);
}

long file_size(const std::string& p){
    struct stat st{};
    return stat(p.c_str(), &st)==0 ? (long)st.st_size : -1;
}

bool makedirs(const std::string& path){
    if(path.empty()) return false;
    size_t start=0; std::string cur;
    if(path[0]=='/'){cur="/"; start=1;}
    size_t i=start;
    while(i<=path.size()){
        size_t j=path.find('/',i);
        std::string token=(j==std::string::npos)?path.substr(i):path.substr(i,j-i);
        if(!token.empty()){
            if(!cur.empty() && cur.back()!='/') cur.push_back('/');
            cur+=token;
            if(!isdir(cur) && mkdir(cur.c_str(),0777)!=0 && errno!=EEXIST) return false;
        }
        if(j==std::string::npos) break;
        i=j+1;
    }
    return isdir(path);
}

bool rmtree(const std::string& root, int* err){
    struct stat lst{};
    if(lstat(root.c_str(), &lst)!=0) return true;
    if(!S_ISDIR(lst.st_mode)){
        if(unlink(root.c_str())!=0){ if(err) *err=errno; return false; }
        return true;
    }
    DIR* d=opendir(root.c_str()); if(!d){ if(err) *err=errno; return false; }
    struct dirent* e;
    while((e=readdir(d))){
        if(e->d_name[0]=='.' && (e->d_name[1]=='\0' || (e->d_name[1]=='.' && e->d_name[2]=='\0'))) continue;
        std::string p=root+"/"+e->d_name;
        struct stat st{}; if(lstat(p.c_str(),&st)!=0) continue;
        if(S_ISDIR(st.st_mode)){ if(!rmtree(p, err)) { closedir(d); return false; } }
        else { if(unlink(p.c_str())!=0) { if(err) *err=errno; closedir(d); return false; } }
    }
    closedir(d);
    if(rmdir(root.c_str())!=0){ if(err) *err=errno; return false; }
    return true;
}

bool list_dirents_checked(const std::string& root, std::vector<DirEnt>& out, int& err){
    out.clear(); err=0;
    DIR* d=opendir(root.c_str()); if(!d){ err=errno; return false; }
    while(auto* e=readdir(d)){
        if(e->d_name[0]=='.' && (e->d_name[1]=='\0' || (e->d_name[1]=='.' && e->d_name[2]=='\0'))) continue;
        std::string p=root+"/"+e->d_name; struct stat st{};
        if(stat(p.c_str(),&st)!=0) continue;
        out.push_back({p, S_ISDIR(st.st_mode), S_ISREG(st.st_mode)});
    }
    closedir(d);
    std::sort(out.begin(), out.end(), [](const DirEnt& a, const DirEnt& b){ return a.path < b.path; });
    return true;
}

std::vector<DirEnt> list_dirents(const std::string& root){
    std::vector<DirEnt> out; int err=0;
    list_dirents_checked(root, out, err);
    return out;
}

std::string base_name(const std::string& p){
    std::string s=p;
    while(s.size()>1 && s.back()=='/') s.pop_back();
    auto slash=s.find_last_of('/'); return (slash==std::string::npos)?s:s.substr(slash+1);
}

std::string parent_dir(const std::string& p){
    std::string s=p;
    while(s.size()>1 && s.back()=='/') s.pop_back();
    auto slash=s.find_last_of('/');
    if(slash==std::string::npos) return ".";
    if(slash==0) return "/";
    return s.substr(0, slash);
}

std::string strip_ext(const std::string& p){
    auto slash=p.find_last_of('/');
    auto dot=p.find_last_of('.');
    if(dot==std::string::npos || (slash!=std::string::npos && dot<slash)) return p;
    return p.substr(0,dot);
}

std::string ext_lower(const std::string& p){
    std::string b=base_name(p);
    auto dot=b.find_last_of('.'); if(dot==std::string::npos || dot==0) return {};
    std::string e=b.substr(dot);
    for(char& c: e) c=(char)tolower((unsigned char)c);
    return e;
}

std::string join(const std::string& a, const std::string& b){
    if(a.empty()) return b;
    if(a.back()=='/') return a+b;
    return a+"/"+b;
}

bool read_file(const std::string& p, std::string& out){
    FILE* f=fopen(p.c_str(),"rb"); if(!f) return false;
    out.clear();
    char buf[1<<14];
    size_t n;
    while((n=fread(buf,1,sizeof(buf),f))>0) out.append(buf,n);
    bool ok=!ferror(f);
    fclose(f);
    return ok;
}

} // namespace fsx
