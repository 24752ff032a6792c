#include "Esp32Platform.h"

static bool timersInitialized = false;

void esp32PlatformInit() {
    if (timersInitialized) return;

    Serial.println("[RingSync] Initializing timer...");
    Serial.print("[RingSync] Chip: ");
    Serial.println(ESP.getChipModel());
    Serial.printf("[RingSync] CPU Freq: %d MHz\n", getCpuFrequencyMhz());
    Serial.flush();

    fastinit();
    timersInitialized = true;

    delay(100);  // Give timers time to start counting

    uint64_t test1 = fastmicros64();
    delayMicroseconds(1000);
    uint64_t test2 = fastmicros64();

    Serial.printf("[RingSync] Timer test: %llu -> %llu (diff: %llu us)\n",
                  test1, test2, test2 - test1);
    Serial.flush();

    if (test1 == test2) {
        Serial.println("[RingSync ERROR] Timer not counting! Using millis() fallback.");
        Serial.flush();
        timersInitialized = false;
    }
}

uint32_t esp32Millis() {
    if (!timersInitialized) return millis();
    return (uint32_t)(fastmicros64() / 1000);  // double-read protected
}

void esp32SerialLog(const char *line) {
    Serial.println(line);
    Serial.flush();
}
