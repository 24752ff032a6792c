#include "RoleStateMachine.h"

RoleState initialRoleState() {
    RoleState state = {SyncRole::UNINITIALIZED, false, false};
    return state;
}

RoleTransition nextRoleState(const RoleState &prev, SyncRole desired, bool radioEnabled) {
    RoleTransition t;
    t.next = prev;
    t.actions = ACTION_NONE;

    if (desired == prev.role) return t;

    t.actions |= ACTION_ANNOUNCE;
    if (prev.radioActive) t.actions |= ACTION_TEARDOWN_RADIO;

    t.next.role = desired;
    t.next.radioActive = false;
    t.next.localOnly = false;

    if (desired == SyncRole::UNINITIALIZED) return t;

    // Followers fall back to the local animation without a radio
    t.actions |= ACTION_RESET_ANIMATOR;
    if (desired == SyncRole::FOLLOWING) t.actions |= ACTION_RESET_PEER;

    if (!radioEnabled) {
        t.next.localOnly = true;
        return t;
    }
    t.actions |= ACTION_INIT_RADIO;
    if (desired == SyncRole::LEADING) t.actions |= ACTION_SEED_ADVERTISING;
    return t;
}

RoleState afterRadioInit(const RoleState &state, bool ok) {
    RoleState next = state;
    if (state.role == SyncRole::UNINITIALIZED) return next;
    next.radioActive = ok;
    next.localOnly = !ok;
    return next;
}

RoleState afterRadioLoss(const RoleState &state) {
    RoleState next = state;
    if (state.role == SyncRole::UNINITIALIZED) return next;
    next.radioActive = false;
    next.localOnly = true;
    return next;
}

const char *syncRoleName(SyncRole role) {
    switch (role) {
        case SyncRole::UNINITIALIZED: return "UNINITIALIZED";
        case SyncRole::LEADING:       return "LEADER";
        case SyncRole::FOLLOWING:     return "FOLLOWER";
    }
    return "UNKNOWN";
}
