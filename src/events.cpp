#include "events.hpp"

namespace zonetrade {

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::DailyReset: return "DAILY_RESET";
        case EventKind::ZoneCreated: return "ZONE_CREATED";
        case EventKind::ZoneInvalidated: return "ZONE_INVALIDATED";
        case EventKind::ZoneExpired: return "ZONE_EXPIRED";
        case EventKind::ZoneConsumed: return "ZONE_CONSUMED";
        case EventKind::UnicornSetup: return "UNICORN_SETUP";
        case EventKind::EntryArmed: return "ENTRY_ARMED";
        case EventKind::EntryTimeout: return "ENTRY_TIMEOUT";
        case EventKind::EntryCancelled: return "ENTRY_CANCELLED";
        case EventKind::EntryLong: return "ENTRY_LONG";
        case EventKind::EntryShort: return "ENTRY_SHORT";
        case EventKind::BreakevenSet: return "BREAKEVEN_SET";
        case EventKind::PartialExit: return "PARTIAL_EXIT";
        case EventKind::TrailActivated: return "TRAIL_ACTIVATED";
        case EventKind::ExitStop: return "EXIT_STOP";
        case EventKind::ExitBreakeven: return "EXIT_BREAKEVEN";
        case EventKind::ExitTrail: return "EXIT_TRAIL";
        case EventKind::ExitTarget: return "EXIT_TARGET";
        case EventKind::ExitTimeStop: return "EXIT_TIME_STOP";
        case EventKind::ExitEndOfDay: return "EXIT_END_OF_DAY";
    }
    return "?";
}

const char* commandTypeName(CommandType type) {
    switch (type) {
        case CommandType::OpenLong: return "open_long";
        case CommandType::OpenShort: return "open_short";
        case CommandType::PartialClose: return "partial_close";
        case CommandType::CloseAll: return "close_all";
    }
    return "?";
}

} // namespace zonetrade
