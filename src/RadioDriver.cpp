#include "RadioDriver.h"

const char *radioStatusName(RadioStatus status) {
    switch (status) {
        case RadioStatus::OK:              return "OK";
        case RadioStatus::NOT_ADVERTISING: return "NOT_ADVERTISING";
        case RadioStatus::TRANSIENT:       return "TRANSIENT";
        case RadioStatus::NO_MEMORY:       return "NO_MEMORY";
        case RadioStatus::UNAVAILABLE:     return "UNAVAILABLE";
    }
    return "UNKNOWN";
}
