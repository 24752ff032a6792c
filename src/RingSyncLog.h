#pragma once
#include <stdarg.h>
#include <stdint.h>

#ifndef RINGSYNC_LOG_LINE_MAX
    #define RINGSYNC_LOG_LINE_MAX 128
#endif

// Debug log flags
enum DebugLog {
    LOG_TX     = 0x01,  // Advertisement publishing
    LOG_RX     = 0x02,  // Scan bursts and received tokens
    LOG_RENDER = 0x04,  // Follower rendering and loss handling
    LOG_ROLE   = 0x08,  // Role changes and radio initialization
    LOG_HEALTH = 0x10,  // Periodic sync health report
    LOG_ALL    = 0xFF   // All messages
};

// Receives one formatted line without trailing newline
typedef void (*LogFn)(const char *line);

class SyncLog {
public:
    SyncLog(LogFn sink = nullptr, uint8_t flags = 0) : _sink(sink), _flags(flags) {}

    void setSink(LogFn sink) { _sink = sink; }
    void setFlags(uint8_t flags) { _flags = flags; }
    uint8_t flags() const { return _flags; }
    bool enabled(uint8_t flag) const { return _sink && (_flags & flag); }

    // Printed only when the flag is enabled
    void printf(uint8_t flag, const char *fmt, ...);
    // Always printed when a sink is set
    void error(const char *fmt, ...);

private:
    void _emit(const char *fmt, va_list args);

    LogFn   _sink;
    uint8_t _flags;
};
