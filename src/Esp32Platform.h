#pragma once
#include <Arduino.h>
#include "libclock/fastmillis.h"

// Starts the libclock hardware timer. Call once from setup() before RingSync::begin().
void esp32PlatformInit();

// ClockFn backed by the libclock timer
uint32_t esp32Millis();

// LogFn printing to Serial
void esp32SerialLog(const char *line);
