#pragma once

#include <optional>
#include <string>
#include <vector>

namespace timeline_model {

// One timeline's horizontal track. Declared bounds are optional.
struct Lane {
    std::string id;
    std::string name;
    std::optional<double> declared_start;
    std::optional<double> declared_end;
};

// A thinker (or any dated entity) placed on a lane at its anchor year.
// birth/death years are kept so that the shared year range can widen on both.
struct PositionedEntity {
    std::string id;
    std::string lane_id;
    std::optional<double> anchor_year; // resolved; empty -> excluded from layout
    std::string label;
    std::optional<double> birth_year;
    std::optional<double> death_year;
};

enum class EventKind {
    Council,
    Publication,
    War,
    Invention,
    Cultural,
    Political,
    Other
};

struct MarkerEvent {
    std::string id;
    std::string lane_id;
    double year = 0;
    std::string label;
    EventKind kind = EventKind::Other;
};

// Directed connection between two entities.
struct Relation {
    std::string id;
    std::string from_entity_id;
    std::string to_entity_id;
    std::string label;
};

struct TimelineData {
    std::string name;
    std::vector<Lane> lanes;
    std::vector<PositionedEntity> entities;
    std::vector<MarkerEvent> events;
    std::vector<Relation> relations;
};

// Priority: explicit override -> death year -> birth year -> none.
inline std::optional<double> resolve_anchor_year(const std::optional<double>& explicit_year,
    const std::optional<double>& birth_year,
    const std::optional<double>& death_year)
{
    if (explicit_year) return explicit_year;
    if (death_year) return death_year;
    if (birth_year) return birth_year;
    return std::nullopt;
}

inline const char* event_kind_name(EventKind kind) {
    switch (kind) {
    case EventKind::Council: return "council";
    case EventKind::Publication: return "publication";
    case EventKind::War: return "war";
    case EventKind::Invention: return "invention";
    case EventKind::Cultural: return "cultural";
    case EventKind::Political: return "political";
    case EventKind::Other: break;
    }
    return "other";
}

inline EventKind event_kind_from_string(const std::string& s) {
    if (s == "council") return EventKind::Council;
    if (s == "publication") return EventKind::Publication;
    if (s == "war") return EventKind::War;
    if (s == "invention") return EventKind::Invention;
    if (s == "cultural") return EventKind::Cultural;
    if (s == "political") return EventKind::Political;
    return EventKind::Other;
}

// UTF-8 glyph drawn at the event's position.
inline const char* event_kind_symbol(EventKind kind) {
    switch (kind) {
    case EventKind::Council: return "\xE2\x96\xB3";     // △
    case EventKind::Publication: return "\xE2\x96\xA2"; // ▢
    case EventKind::War: return "\xE2\x97\x87";         // ◇
    case EventKind::Invention: return "\xE2\x98\x85";   // ★
    case EventKind::Cultural: return "\xE2\x97\x8F";    // ●
    case EventKind::Political: return "\xE2\x96\xA0";   // ■
    case EventKind::Other: break;
    }
    return "\xE2\x97\x8B"; // ○
}

} // namespace timeline_model
