#include "log_sink.hpp"

#include "fs/fs_utils.hpp"

#include <cstdio>
#include <cstring>

namespace logx {

LogSink::LogSink(std::string path, bool echo_lines) : file_path(std::move(path)), echo(echo_lines) {}

LogSink::~LogSink(){
    drain();
    flush(true);
}

void LogSink::enforceWindow(){
    while(log_lines_bytes > LOG_WINDOW_BYTES && !log_lines.empty()){
        log_lines_bytes -= log_lines.front().size();
        log_lines.pop_front();
    }
}

void LogSink::appendLine(const std::string& line){
    log_lines.emplace_back(line);
    log_lines_bytes += line.size();
    log_disk_buffer.append(line);
    log_disk_buffer.push_back('\n');
    if(echo) fprintf(stderr, "%s\n", line.c_str());
    enforceWindow();
}

void LogSink::drain(){
    if(log.empty()) return;
    std::string cleaned;
    cleaned.reserve(log.size());
    for(char c : log){
        if(c!='\r') cleaned.push_back(c);
    }
    size_t pos = 0;
    while(true){
        size_t nl = cleaned.find('\n', pos);
        if(nl == std::string::npos) break;
        log_partial_line.append(cleaned, pos, nl - pos);
        appendLine(log_partial_line);
        log_partial_line.clear();
        pos = nl + 1;
    }
    if(pos < cleaned.size()){
        log_partial_line.append(cleaned, pos, cleaned.size() - pos);
    }
    log.clear();
}

void LogSink::maybeFlush(){
    drain();
    if(log_disk_buffer.size() >= LOG_FLUSH_CHUNK_BYTES) flush(false);
}

void LogSink::flush(bool force){
    if(log_disk_buffer.empty() && !(force && !log_partial_line.empty())) return;
    if(file_path.empty()){ log_disk_buffer.clear(); return; }
    fsx::makedirs(fsx::parent_dir(file_path));
    bool truncate = false;
    long existing = fsx::file_size(file_path);
    if(existing >= 0 && static_cast<size_t>(existing) > LOG_MAX_FILE_BYTES){
        truncate = true;
    }
    FILE* fp = fopen(file_path.c_str(), truncate ? "wb" : "ab");
    if(!fp){
        log_disk_buffer.clear();
        return;
    }
    if(truncate){
        const char* note = "[log] truncated (exceeded 3 MB)\n";
        fwrite(note, 1, strlen(note), fp);
    }
    if(!log_disk_buffer.empty()){
        fwrite(log_disk_buffer.data(), 1, log_disk_buffer.size(), fp);
        log_disk_buffer.clear();
    }
    if(force && !log_partial_line.empty()){
        fwrite(log_partial_line.data(), 1, log_partial_line.size(), fp);
        fputc('\n', fp);
        if(echo) fprintf(stderr, "%s\n", log_partial_line.c_str());
        log_partial_line.clear();
    }
    fclose(fp);
}

} // namespace logx
