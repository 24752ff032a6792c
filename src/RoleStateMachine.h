#pragma once
#include <stdint.h>

enum class SyncRole : uint8_t {
    UNINITIALIZED,  // No role selected yet, or torn down
    LEADING,        // Pattern source
    FOLLOWING       // Mirrors the leader
};

// Side effects requested by a transition, executed by the caller in bit order
enum RoleAction {
    ACTION_NONE             = 0x00,
    ACTION_TEARDOWN_RADIO   = 0x01,  // Stop advertising/scanning and release the radio
    ACTION_RESET_ANIMATOR   = 0x02,
    ACTION_RESET_PEER       = 0x04,  // Fresh PeerSyncState and dark ring
    ACTION_INIT_RADIO       = 0x08,
    ACTION_SEED_ADVERTISING = 0x10,  // Only if ACTION_INIT_RADIO succeeded
    ACTION_ANNOUNCE         = 0x20   // Log the new role
};

struct RoleState {
    SyncRole role;
    bool     radioActive;
    bool     localOnly;  // Radio disabled or failed; animate locally only
};

struct RoleTransition {
    RoleState next;
    uint8_t   actions;
};

RoleState initialRoleState();

// Pure transition: previous state and externally selected role in,
// next state and actions out. Re-entering the current role is a no-op.
RoleTransition nextRoleState(const RoleState &prev, SyncRole desired, bool radioEnabled);

// Outcome of ACTION_INIT_RADIO or a manual radio retry
RoleState afterRadioInit(const RoleState &state, bool ok);

// Radio reported UNAVAILABLE mid-role
RoleState afterRadioLoss(const RoleState &state);

const char *syncRoleName(SyncRole role);
