#include "RingSyncLog.h"
#include <stdio.h>

void SyncLog::printf(uint8_t flag, const char *fmt, ...) {
    if (!enabled(flag)) return;
    va_list args;
    va_start(args, fmt);
    _emit(fmt, args);
    va_end(args);
}

void SyncLog::error(const char *fmt, ...) {
    if (!_sink) return;
    va_list args;
    va_start(args, fmt);
    _emit(fmt, args);
    va_end(args);
}

void SyncLog::_emit(const char *fmt, va_list args) {
    char line[RINGSYNC_LOG_LINE_MAX];
    int n = vsnprintf(line, sizeof(line), fmt, args);
    if (n < 0) return;
    _sink(line);  // truncated lines are still emitted
}
