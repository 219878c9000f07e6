#pragma once

// ── Logging ───────────────────────────────────────────────────────────────
// printf-style, one timestamped line per call. Mirrored into a file once
// rfs_log_open() succeeded. Not for use on the capture callback.
void rfs_log(const char* fmt, ...)   __attribute__((format(printf,1,2)));
void rfs_err(const char* fmt, ...)   __attribute__((format(printf,1,2)));
void rfs_debug(const char* fmt, ...) __attribute__((format(printf,1,2)));

bool rfs_log_open(const char* path);
void rfs_log_close();
void rfs_log_set_verbose(bool on);
