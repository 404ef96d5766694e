#include "zip_utils.hpp"

#include "fs/fs_utils.hpp"

#include <cstdio>
#include <cstdint>
#include <vector>
#include <string>
#include <algorithm>
#include <zlib.h>

namespace zipx {

namespace {
constexpr uint32_t kSigEocd    = 0x06054b50;
constexpr uint32_t kSigCentral = 0x02014b50;
constexpr uint32_t kSigLocal   = 0x04034b50;

struct CentralEntry {
    uint32_t sig=0;
    uint16_t version_made=0;
    uint16_t version_needed=0;
    uint16_t flags=0;
    uint16_t method=0;
    uint16_t mod_time=0;
    uint16_t mod_date=0;
    uint32_t crc32=0;
    uint32_t comp_size=0;
    uint32_t uncomp_size=0;
    uint16_t name_len=0;
    uint16_t extra_len=0;
    uint16_t comment_len=0;
    uint16_t disk_start=0;
    uint16_t int_attr=0;
    uint32_t ext_attr=0;
    uint32_t local_ofs=0;
    std::string name;
};

struct LocalHeader {
    uint32_t sig=0;
    uint16_t version=0;
    uint16_t flags=0;
    uint16_t method=0;
    uint16_t mod_time=0;
    uint16_t mod_date=0;
    uint32_t crc32=0;
    uint32_t comp_size=0;
    uint32_t uncomp_size=0;
    uint16_t name_len=0;
    uint16_t extra_len=0;
};

// RAII for the archive handle; every early return in the readers below closes it
struct File {
    FILE* f=nullptr;
    explicit File(const std::string& p, const char* mode) : f(fopen(p.c_str(), mode)) {}
    ~File(){ if(f) fclose(f); }
    File(const File&) = delete;
    File& operator=(const File&) = delete;
};

bool read_u16(FILE* f, uint16_t& out){
    uint8_t b[2]; if(fread(b,1,2,f)!=2) return false;
    out = b[0] | (uint16_t(b[1])<<8);
    return true;
}
bool read_u32(FILE* f, uint32_t& out){
    uint8_t b[4]; if(fread(b,1,4,f)!=4) return false;
    out = b[0] | (uint32_t(b[1])<<8) | (uint32_t(b[2])<<16) | (uint32_t(b[3])<<24);
    return true;
}

bool read_eocd(FILE* f, long& cd_ofs, uint16_t& entries, long& file_size){
    if(fseek(f,0,SEEK_END)!=0) return false;
    file_size = ftell(f);
    if(file_size < 22) return false;
    long search_start = std::max<long>(0, file_size - 65536 - 22);
    for(long pos = file_size - 22; pos >= search_start; --pos){
        if(fseek(f,pos,SEEK_SET)!=0) return false;
        uint32_t sig=0;
        if(!read_u32(f,sig)) continue;
        if(sig==kSigEocd){
            uint16_t disk=0, disk_cd=0, entries_disk=0;
            if(!read_u16(f,disk)) return false;
            if(!read_u16(f,disk_cd)) return false;
            if(!read_u16(f,entries_disk)) return false;
            if(!read_u16(f,entries)) return false;
            uint32_t cd_size=0;
            uint32_t cd_ofs32=0;
            if(!read_u32(f,cd_size)) return false;
            if(!read_u32(f,cd_ofs32)) return false;
            cd_ofs = static_cast<long>(cd_ofs32);
            return cd_ofs <= pos && static_cast<long>(cd_size) <= pos - cd_ofs;
        }
    }
    return false;
}

bool read_central(FILE* f, long cd_ofs, uint16_t entries, long file_size, std::vector<CentralEntry>& out){
    if(fseek(f, cd_ofs, SEEK_SET)!=0) return false;
    out.clear();
    for(uint16_t i=0;i<entries;i++){
        CentralEntry ce{};
        if(!read_u32(f, ce.sig)) return false;
        if(ce.sig!=kSigCentral) return false;
        if(!read_u16(f, ce.version_made)) return false;
        if(!read_u16(f, ce.version_needed)) return false;
        if(!read_u16(f, ce.flags)) return false;
        if(!read_u16(f, ce.method)) return false;
        if(!read_u16(f, ce.mod_time)) return false;
        if(!read_u16(f, ce.mod_date)) return false;
        if(!read_u32(f, ce.crc32)) return false;
        if(!read_u32(f, ce.comp_size)) return false;
        if(!read_u32(f, ce.uncomp_size)) return false;
        if(!read_u16(f, ce.name_len)) return false;
        if(!read_u16(f, ce.extra_len)) return false;
        if(!read_u16(f, ce.comment_len)) return false;
        if(!read_u16(f, ce.disk_start)) return false;
        if(!read_u16(f, ce.int_attr)) return false;
        if(!read_u32(f, ce.ext_attr)) return false;
        if(!read_u32(f, ce.local_ofs)) return false;
        if(static_cast<long>(ce.local_ofs) >= file_size) return false;

        ce.name.resize(ce.name_len);
        if(ce.name_len && fread(&ce.name[0],1,ce.name_len,f)!=ce.name_len) return false;
        if(fseek(f, ce.extra_len + ce.comment_len, SEEK_CUR)!=0) return false;
        out.push_back(std::move(ce));
    }
    return true;
}

bool open_central(FILE* f, std::vector<CentralEntry>& cen, std::string& log, const std::string& zip_path){
    long cd_ofs=0, file_size=0; uint16_t entries=0;
    if(!read_eocd(f, cd_ofs, entries, file_size)){ log += "[zip] EOCD not found: " + zip_path + "\n"; return false; }
    if(!read_central(f, cd_ofs, entries, file_size, cen)){ log += "[zip] central read fail: " + zip_path + "\n"; return false; }
    return true;
}

// rejects absolute paths, drive letters and any ".." segment; drops "." and empty segments
bool sanitize(const std::string& name, std::string& out){
    out.clear();
    if(name.find(':')!=std::string::npos) return false;
    if(!name.empty() && (name[0]=='/' || name[0]=='\\')) return false;
    std::string tmp=name; std::replace(tmp.begin(), tmp.end(), '\\', '/');
    std::vector<std::string> parts;
    size_t i=0; while(i<=tmp.size()){
        size_t j=tmp.find('/', i);
        std::string seg=(j==std::string::npos)?tmp.substr(i):tmp.substr(i, j-i);
        if(seg=="..") return false;
        if(seg.find('\0')!=std::string::npos) return false;
        if(seg!="." && !seg.empty()) parts.push_back(seg);
        if(j==std::string::npos) break;
        i = j + 1;
    }
    for(size_t k=0;k<parts.size();++k){ if(k) out.push_back('/'); out+=parts[k]; }
    return !out.empty();
}

bool ensure_parent(const std::string& out_path){
    auto slash=out_path.find_last_of('/');
    if(slash==std::string::npos) return true;
    std::string d=out_path.substr(0,slash);
    return fsx::isdir(d) || fsx::makedirs(d);
}

bool extract_one(FILE* f, const CentralEntry& ce, const std::string& out_root, std::string& log){
    if(fseek(f, ce.local_ofs, SEEK_SET)!=0) return false;
    LocalHeader lh{};
    if(!read_u32(f, lh.sig)) return false;
    if(lh.sig!=kSigLocal){ log += "[zip] bad local header: " + ce.name + "\n"; return false; }
    if(!read_u16(f, lh.version)) return false;
    if(!read_u16(f, lh.flags)) return false;
    if(!read_u16(f, lh.method)) return false;
    if(!read_u16(f, lh.mod_time)) return false;
    if(!read_u16(f, lh.mod_date)) return false;
    if(!read_u32(f, lh.crc32)) return false;
    if(!read_u32(f, lh.comp_size)) return false;
    if(!read_u32(f, lh.uncomp_size)) return false;
    if(!read_u16(f, lh.name_len)) return false;
    if(!read_u16(f, lh.extra_len)) return false;
    if(fseek(f, lh.name_len + lh.extra_len, SEEK_CUR)!=0) return false;
    long data_pos = ftell(f);

    std::string safe;
    if(!sanitize(ce.name, safe)){ log += "[zip] skip unsafe path: " + ce.name + "\n"; return true; }
    std::string out_path = out_root + "/" + safe;

    if(ce.name.back()=='/' || ce.name.back()=='\\'){
        return fsx::isdir(out_path) || fsx::makedirs(out_path);
    }
    if(ce.method!=0 && ce.method!=8){
        log += "[zip] unsupported method " + std::to_string(ce.method) + " for " + ce.name + "\n";
        return false;
    }
    if(!ensure_parent(out_path)){ log += "[zip] mkdir fail for " + out_path + "\n"; return false; }

    FILE* out=fopen(out_path.c_str(),"wb");
    if(!out){ log += "[zip] open fail: " + out_path + "\n"; return false; }

    uLong crc = crc32(0L, Z_NULL, 0);
    size_t written = 0;
    bool ok = true;
    if(ce.method == 0){
        const size_t CHUNK=1<<16; std::vector<unsigned char> buf(CHUNK);
        size_t remain=ce.comp_size;
        long pos=data_pos;
        while(remain>0){
            size_t want=std::min(remain, CHUNK);
            if(fseek(f, pos, SEEK_SET)!=0){ ok=false; break; }
            size_t got=fread(buf.data(),1,want,f);
            if(got!=want){ ok=false; break; }
            pos += (long)got; remain -= got;
            crc = crc32(crc, buf.data(), (uInt)got);
            written += got;
            if(fwrite(buf.data(),1,got,out)!=got){ ok=false; break; }
        }
    } else {
        const size_t CHUNK = 1<<15;
        std::vector<unsigned char> inbuf(CHUNK), outbuf(CHUNK);
        z_stream strm{};
        if(inflateInit2(&strm, -MAX_WBITS)!=Z_OK){ fclose(out); return false; }
        size_t remain = ce.comp_size; long pos=data_pos;
        int zr = Z_OK;
        while(remain>0 && ok && zr!=Z_STREAM_END){
            size_t want=std::min(remain, CHUNK);
            if(fseek(f, pos, SEEK_SET)!=0){ ok=false; break; }
            size_t got=fread(inbuf.data(),1,want,f);
            if(got!=want){ ok=false; break; }
            pos += (long)got; remain -= got;
            strm.next_in=inbuf.data(); strm.avail_in=(uInt)got;
            while(strm.avail_in>0 && zr!=Z_STREAM_END){
                strm.next_out=outbuf.data(); strm.avail_out=CHUNK;
                zr=inflate(&strm, Z_NO_FLUSH);
                if(zr!=Z_OK && zr!=Z_STREAM_END){ ok=false; break; }
                size_t have = CHUNK - strm.avail_out;
                crc = crc32(crc, outbuf.data(), (uInt)have);
                written += have;
                if(have && fwrite(outbuf.data(),1,have,out)!=have){ ok=false; break; }
            }
        }
        inflateEnd(&strm);
    }
    if(fclose(out)!=0) ok=false;
    if(!ok){ log += "[zip] extract fail: " + ce.name + "\n"; return false; }
    if(written!=ce.uncomp_size || crc!=ce.crc32){
        log += "[zip] crc mismatch: " + ce.name + "\n";
        return false;
    }
    return true;
}
} // namespace

bool list_entries(const std::string& zip_path, std::vector<std::string>& names, std::string& log){
    names.clear();
    File zf(zip_path, "rb");
    if(!zf.f){ log += "[zip] open fail: " + zip_path + "\n"; return false; }
    std::vector<CentralEntry> cen;
    if(!open_central(zf.f, cen, log, zip_path)) return false;
    names.reserve(cen.size());
    for(auto& ce : cen) names.push_back(ce.name);
    return true;
}

bool unzip_to(const std::string& zip_path, const std::string& out_root, std::string& log){
    File zf(zip_path, "rb");
    if(!zf.f){ log += "[zip] open fail: " + zip_path + "\n"; return false; }
    std::vector<CentralEntry> cen;
    if(!open_central(zf.f, cen, log, zip_path)) return false;
    if(!fsx::isdir(out_root) && !fsx::makedirs(out_root)){ log += "[zip] mkdir fail: " + out_root + "\n"; return false; }
    size_t okc=0, failc=0;
    for(const auto& ce: cen){
        if(ce.name.empty()) continue;
        if(extract_one(zf.f, ce, out_root, log)) okc++; else failc++;
    }
    char msg[128]; snprintf(msg,sizeof(msg),"[zip] extracted ok=%zu failed=%zu -> ", okc, failc);
    log += msg; log += out_root; log += "\n";
    return failc==0;
}

} // namespace zipx
