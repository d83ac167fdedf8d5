#include <timeline_loaders/demo_timeline.hpp>
#include <optional>

namespace timeline_loaders {

timeline_model::TimelineData generate_demo_timeline() {
    using timeline_model::EventKind;
    timeline_model::TimelineData out;
    out.name = "Philosophy timeline (demo)";

    auto add_lane = [&](const char* id, const char* name, std::optional<double> start, std::optional<double> end) {
        out.lanes.push_back({ id, name, start, end });
    };
    auto add_thinker = [&](const char* id, const char* lane, const char* name,
                           std::optional<double> birth, std::optional<double> death,
                           std::optional<double> anchor = std::nullopt)
    {
        timeline_model::PositionedEntity e;
        e.id = id;
        e.lane_id = lane;
        e.label = name;
        e.birth_year = birth;
        e.death_year = death;
        e.anchor_year = timeline_model::resolve_anchor_year(anchor, birth, death);
        out.entities.push_back(std::move(e));
    };
    auto add_event = [&](const char* id, const char* lane, const char* name, double year, EventKind kind) {
        out.events.push_back({ id, lane, year, name, kind });
    };
    auto connect = [&](const char* from, const char* to, const char* label) {
        out.relations.push_back({ std::string(from) + "->" + to, from, to, label });
    };

    add_lane("enlightenment", "Enlightenment", 1700, 1900);
    add_lane("modern", "Modern", 1850, 1950);

    add_thinker("kant", "enlightenment", "Immanuel Kant", 1724, std::nullopt, 1724);
    add_thinker("hegel", "enlightenment", "G. W. F. Hegel", 1770, std::nullopt, 1770);
    add_thinker("kant_late", "enlightenment", "Kant (late works)", 1724, 1804, 1804);
    add_thinker("hegel_late", "enlightenment", "Hegel (Berlin)", 1770, 1831, 1831);
    add_thinker("hume", "enlightenment", "David Hume", 1711, 1776, 1760);
    add_thinker("rousseau", "enlightenment", "Jean-Jacques Rousseau", 1712, 1778, 1762);
    add_thinker("husserl", "modern", "Edmund Husserl", 1859, 1938, 1900);
    add_thinker("nietzsche", "modern", "Friedrich Nietzsche", 1844, 1900, 1883);
    add_thinker("heidegger", "modern", "Martin Heidegger", 1889, 1976, 1927);

    add_event("critique", "enlightenment", "Critique of Pure Reason", 1781, EventKind::Publication);
    add_event("revolution", "enlightenment", "French Revolution", 1789, EventKind::Political);
    add_event("phenomenology", "enlightenment", "Phenomenology of Spirit", 1807, EventKind::Publication);
    add_event("napoleonic", "enlightenment", "Napoleonic Wars", 1803, EventKind::War);
    add_event("logical_investigations", "modern", "Logical Investigations", 1900, EventKind::Publication);
    add_event("telephone", "modern", "Telephone", 1876, EventKind::Invention);
    add_event("great_war", "modern", "First World War", 1914, EventKind::War);
    add_event("vienna", "modern", "Vienna Circle", 1924, EventKind::Cultural);

    connect("kant", "hegel", "critique");
    connect("hume", "kant", "awakened");
    connect("hegel_late", "husserl", "influence");
    connect("husserl", "heidegger", "mentor");
    connect("nietzsche", "heidegger", "");

    return out;
}

} // namespace timeline_loaders
