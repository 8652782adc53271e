#pragma once

#include <string>
#include <vector>

namespace zonetrade {

enum class EventKind {
    DailyReset,
    ZoneCreated,
    ZoneInvalidated,
    ZoneExpired,
    ZoneConsumed,
    UnicornSetup,
    EntryArmed,
    EntryTimeout,
    EntryCancelled,
    EntryLong,
    EntryShort,
    BreakevenSet,
    PartialExit,
    TrailActivated,
    ExitStop,
    ExitBreakeven,
    ExitTrail,
    ExitTarget,
    ExitTimeStop,
    ExitEndOfDay,
};

const char* eventKindName(EventKind kind);

/// One line of engine output. The engine never prints; hosts decide what to do with these.
struct Event {
    EventKind kind{EventKind::ZoneCreated};
    long bar_index{0};
    double price{0};
    std::string tag;  // model name and zone bounds, or exit details
};

/// Event stamped with the bar's timestamp, as kept by hosts for the event log.
struct EventRecord {
    std::string timestamp;
    Event event;
};

enum class CommandType { OpenLong, OpenShort, PartialClose, CloseAll };

const char* commandTypeName(CommandType type);

/// Order instruction for the execution gateway. quantity is unused by CloseAll.
struct OrderCommand {
    CommandType type{CommandType::CloseAll};
    int quantity{0};
};

} // namespace zonetrade
