#include "log.hpp"
#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <atomic>
#include <sys/time.h>

static std::mutex        g_log_mtx;
static FILE*             g_log_file = nullptr;
static std::atomic<bool> g_verbose{false};

static void log_line(FILE* out, const char* level, const char* fmt, va_list ap){
    char msg[1024];
    vsnprintf(msg, sizeof(msg), fmt, ap);

    timeval tv{}; gettimeofday(&tv, nullptr);
    struct tm tm2; localtime_r(&tv.tv_sec, &tm2);
    char ts[32]; strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm2);

    std::lock_guard<std::mutex> lk(g_log_mtx);
    fprintf(out, "%s.%03ld %s %s\n", ts, (long)(tv.tv_usec/1000), level, msg);
    fflush(out);
    if(g_log_file){
        fprintf(g_log_file, "%s.%03ld %s %s\n", ts, (long)(tv.tv_usec/1000), level, msg);
        fflush(g_log_file);
    }
}

void rfs_log(const char* fmt, ...){
    va_list ap; va_start(ap, fmt);
    log_line(stdout, "INFO ", fmt, ap);
    va_end(ap);
}

void rfs_err(const char* fmt, ...){
    va_list ap; va_start(ap, fmt);
    log_line(stderr, "ERROR", fmt, ap);
    va_end(ap);
}

void rfs_debug(const char* fmt, ...){
    if(!g_verbose.load(std::memory_order_relaxed)) return;
    va_list ap; va_start(ap, fmt);
    log_line(stdout, "DEBUG", fmt, ap);
    va_end(ap);
}

bool rfs_log_open(const char* path){
    FILE* f = fopen(path, "a");
    if(!f){ perror("rfs_log_open"); return false; }
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if(g_log_file) fclose(g_log_file);
    g_log_file = f;
    return true;
}

void rfs_log_close(){
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if(g_log_file){ fclose(g_log_file); g_log_file = nullptr; }
}

void rfs_log_set_verbose(bool on){
    g_verbose.store(on);
}
