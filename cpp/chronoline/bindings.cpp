#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "chronoline/engine.h"

#ifdef EMSCRIPTEN

#include <memory>
#include <string>
#include <vector>

using chronoline::Background;
using chronoline::Colour;
using chronoline::Date;
using chronoline::Entity;
using chronoline::EntityId;
using chronoline::EntityOut;
using chronoline::FilledBox;
using chronoline::Heading;
using chronoline::InteractionEvent;
using chronoline::InteractionEventType;
using chronoline::Tag;
using chronoline::TextOut;
using chronoline::TextSize;
using chronoline::TimelineEngine;
using chronoline::VerticalLine;

namespace {

// Ids cross into JS as doubles; timeline ids stay well inside 2^53.
double idToJs(EntityId id) { return static_cast<double>(id); }
EntityId idFromJs(const emscripten::val& v) { return static_cast<EntityId>(v.as<double>()); }

emscripten::val colourToJs(const Colour& c) {
    return emscripten::val(c.toHex());
}

emscripten::val dateToJs(const Date& d) {
    emscripten::val out = emscripten::val::object();
    out.set("year", d.year());
    if (d.month()) out.set("month", static_cast<int>(*d.month()));
    if (d.day()) out.set("day", static_cast<int>(*d.day()));
    return out;
}

std::optional<Date> dateFromJs(const emscripten::val& v) {
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    std::optional<std::int64_t> month;
    std::optional<std::int64_t> day;
    if (!v["month"].isUndefined() && !v["month"].isNull()) month = v["month"].as<int>();
    if (!v["day"].isUndefined() && !v["day"].isNull()) day = v["day"].as<int>();
    return Date::fromParts(v["year"].as<int>(), month, day);
}

emscripten::val boxToJs(const FilledBox& box) {
    emscripten::val out = emscripten::val::object();
    out.set("x", box.positionAndSize.position.x);
    out.set("y", box.positionAndSize.position.y);
    out.set("width", box.positionAndSize.width);
    out.set("height", box.positionAndSize.height);
    out.set("fillColour", colourToJs(box.fillColour));
    if (box.borderStyle) {
        out.set("borderColour", colourToJs(box.borderStyle->colour));
        out.set("borderThickness", box.borderStyle->thickness);
    }
    return out;
}

emscripten::val textToJs(const TextOut& text) {
    emscripten::val out = emscripten::val::object();
    out.set("x", text.topLeft.x);
    out.set("y", text.topLeft.y);
    out.set("text", text.text);
    out.set("colour", colourToJs(text.colour));
    out.set("fontSize", text.fontSize);
    return out;
}

Entity entityFromJs(const emscripten::val& v) {
    Entity entity;
    entity.id = idFromJs(v["id"]);
    entity.name = v["name"].as<std::string>();
    if (auto start = dateFromJs(v["start"])) entity.start = *start;
    entity.end = dateFromJs(v["end"]);
    const emscripten::val tags = v["tags"];
    if (!tags.isUndefined() && !tags.isNull()) {
        std::vector<Tag> parsed;
        const unsigned length = tags["length"].as<unsigned>();
        for (unsigned i = 0; i < length; ++i) {
            const emscripten::val t = tags[i];
            Tag tag;
            if (!t["name"].isUndefined() && !t["name"].isNull()) tag.name = t["name"].as<std::string>();
            tag.value = t["value"].as<std::string>();
            parsed.push_back(std::move(tag));
        }
        entity.tags = std::move(parsed);
    }
    return entity;
}

emscripten::val entityToJs(const Entity& entity) {
    emscripten::val out = emscripten::val::object();
    out.set("id", idToJs(entity.id));
    out.set("name", entity.name);
    out.set("start", dateToJs(entity.start));
    if (entity.end) out.set("end", dateToJs(*entity.end));
    return out;
}

std::vector<Entity> entitiesFromJs(const emscripten::val& array) {
    std::vector<Entity> out;
    const unsigned length = array["length"].as<unsigned>();
    out.reserve(length);
    for (unsigned i = 0; i < length; ++i) out.push_back(entityFromJs(array[i]));
    return out;
}

std::vector<EntityId> idsFromJs(const emscripten::val& array) {
    std::vector<EntityId> out;
    const unsigned length = array["length"].as<unsigned>();
    out.reserve(length);
    for (unsigned i = 0; i < length; ++i) out.push_back(idFromJs(array[i]));
    return out;
}

const char* eventTypeName(InteractionEventType type) {
    switch (type) {
        case InteractionEventType::SingleClick: return "SingleClick";
        case InteractionEventType::DoubleClick: return "DoubleClick";
        case InteractionEventType::TripleClick: return "TripleClick";
        case InteractionEventType::Hover: return "Hover";
    }
    return "Unknown";
}

} // namespace

EMSCRIPTEN_BINDINGS(chronoline_module) {
    emscripten::value_object<TimelineEngine::EngineStats>("EngineStats")
        .field("generation", &TimelineEngine::EngineStats::generation)
        .field("entityCount", &TimelineEngine::EngineStats::entityCount)
        .field("visibleEntityCount", &TimelineEngine::EngineStats::visibleEntityCount)
        .field("rowCount", &TimelineEngine::EngineStats::rowCount)
        .field("decadeCount", &TimelineEngine::EngineStats::decadeCount)
        .field("recalculateCount", &TimelineEngine::EngineStats::recalculateCount)
        .field("measureCacheHits", &TimelineEngine::EngineStats::measureCacheHits)
        .field("measureCacheMisses", &TimelineEngine::EngineStats::measureCacheMisses)
        .field("lastRecalculateMs", &TimelineEngine::EngineStats::lastRecalculateMs);

    emscripten::value_object<TimelineEngine::LayoutDigest>("LayoutDigest")
        .field("lo", &TimelineEngine::LayoutDigest::lo)
        .field("hi", &TimelineEngine::LayoutDigest::hi);

    emscripten::class_<TimelineEngine>("TimelineEngine")
        // measure(fontSizePx, text) -> {width, height}
        .constructor(emscripten::optional_override([](emscripten::val measure) {
            return new TimelineEngine([measure](double fontSizePx, const std::string& text) {
                const emscripten::val size = measure(fontSizePx, text);
                return TextSize{size["width"].as<double>(), size["height"].as<double>()};
            });
        }), emscripten::allow_raw_pointers())
        .function("setEntities", emscripten::optional_override([](TimelineEngine& self, emscripten::val entities) {
            self.setEntities(entitiesFromJs(entities));
        }))
        .function("addEntities", emscripten::optional_override([](TimelineEngine& self, emscripten::val entities) {
            self.addEntities(entitiesFromJs(entities));
        }))
        .function("removeEntities", emscripten::optional_override([](TimelineEngine& self, emscripten::val ids) {
            self.removeEntities(idsFromJs(ids));
        }))
        .function("clearEntities", &TimelineEngine::clearEntities)
        .function("entityCount", emscripten::optional_override([](const TimelineEngine& self) {
            return static_cast<unsigned>(self.entityCount());
        }))
        .function("rowCount", &TimelineEngine::rowCount)
        // predicate(entity) -> bool, evaluated by the host's tag expression parser
        .function("setTagBoolExprEntityFilter", emscripten::optional_override([](TimelineEngine& self, emscripten::val predicate) {
            self.setTagBoolExprEntityFilter(chronoline::makeTagExpression([predicate](const Entity& entity) {
                return predicate(entityToJs(entity)).as<bool>();
            }));
        }))
        .function("removeTagBoolExprEntityFilter", &TimelineEngine::removeTagBoolExprEntityFilter)
        .function("setDateLimits", emscripten::optional_override([](TimelineEngine& self, emscripten::val start, emscripten::val end) {
            self.setDateLimits(dateFromJs(start), dateFromJs(end));
        }))
        .function("startAndEndDecades", emscripten::optional_override([](const TimelineEngine& self) {
            const auto [start, end] = self.startAndEndDecades();
            emscripten::val out = emscripten::val::array();
            out.call<void>("push", start);
            out.call<void>("push", end);
            return out;
        }))
        .function("setFontSizePx", &TimelineEngine::setFontSizePx)
        .function("effectiveFontSizePx", &TimelineEngine::effectiveFontSizePx)
        .function("zoomIn", &TimelineEngine::zoomIn)
        .function("zoomOut", &TimelineEngine::zoomOut)
        .function("setZoom", &TimelineEngine::setZoom)
        .function("zoom", &TimelineEngine::zoom)
        .function("setDatetimeScale", &TimelineEngine::setDatetimeScale)
        .function("datetimeScale", &TimelineEngine::datetimeScale)
        .function("addToGlobalOffset", &TimelineEngine::addToGlobalOffset)
        .function("setCanvasMax", &TimelineEngine::setCanvasMax)
        .function("setStickyText", &TimelineEngine::setStickyText)
        .function("setThemeFromHex", emscripten::optional_override([](TimelineEngine& self, emscripten::val theme) {
            chronoline::TimelineColours colours = self.colours();
            auto apply = [&](const char* key, Colour& target) {
                const emscripten::val v = theme[key];
                if (v.isUndefined() || v.isNull()) return;
                if (auto parsed = Colour::fromHex(v.as<std::string>())) target = *parsed;
            };
            apply("backgroundA", colours.background.a);
            apply("backgroundB", colours.background.b);
            apply("dividingLine", colours.dividingLine.colour);
            apply("entityTextBox", colours.entity.textBox.fillColour);
            apply("entityDateBox", colours.entity.dateBox.fillColour);
            apply("entityText", colours.entity.textColour);
            apply("headingBox", colours.heading.rect.fillColour);
            apply("headingText", colours.heading.textColour);
            self.setColours(colours);
        }))
        .function("entitiesForDrawing", emscripten::optional_override([](const TimelineEngine& self) {
            emscripten::val out = emscripten::val::array();
            for (const EntityOut& e : self.entitiesForDrawing()) {
                emscripten::val item = emscripten::val::object();
                item.set("entity", entityToJs(e.entity));
                item.set("text", textToJs(e.text));
                item.set("textBox", boxToJs(e.textBox));
                item.set("dateBox", boxToJs(e.dateBox));
                item.set("isSelected", e.isSelected);
                out.call<void>("push", item);
            }
            return out;
        }))
        .function("headingsForDrawing", emscripten::optional_override([](const TimelineEngine& self) {
            emscripten::val out = emscripten::val::array();
            for (const Heading& h : self.headingsForDrawing()) {
                emscripten::val item = emscripten::val::object();
                item.set("text", textToJs(h.text));
                item.set("textBox", boxToJs(h.textBox));
                out.call<void>("push", item);
            }
            return out;
        }))
        .function("linesForDrawing", emscripten::optional_override([](const TimelineEngine& self) {
            emscripten::val out = emscripten::val::array();
            for (const VerticalLine& l : self.linesForDrawing()) {
                emscripten::val item = emscripten::val::object();
                item.set("x", l.x);
                item.set("colour", colourToJs(l.style.colour));
                item.set("thickness", l.style.thickness);
                out.call<void>("push", item);
            }
            return out;
        }))
        .function("backgroundsForDrawing", emscripten::optional_override([](const TimelineEngine& self) {
            emscripten::val out = emscripten::val::array();
            for (const Background& b : self.backgroundsForDrawing()) {
                emscripten::val item = emscripten::val::object();
                item.set("x", b.x);
                item.set("width", b.width);
                item.set("colour", colourToJs(b.colour));
                out.call<void>("push", item);
            }
            return out;
        }))
        .function("clickOnEntity", emscripten::optional_override([](TimelineEngine& self, double id) {
            self.clickOnEntity(static_cast<EntityId>(id));
        }))
        .function("doubleClickOnEntity", emscripten::optional_override([](TimelineEngine& self, double id) {
            self.doubleClickOnEntity(static_cast<EntityId>(id));
        }))
        .function("tripleClickOnEntity", emscripten::optional_override([](TimelineEngine& self, double id) {
            self.tripleClickOnEntity(static_cast<EntityId>(id));
        }))
        .function("hoverOverEntity", emscripten::optional_override([](TimelineEngine& self, emscripten::val id) {
            if (id.isUndefined() || id.isNull()) {
                self.hoverOverEntity(std::nullopt);
            } else {
                self.hoverOverEntity(idFromJs(id));
            }
        }))
        .function("drainInteractionEvents", emscripten::optional_override([](TimelineEngine& self) {
            emscripten::val out = emscripten::val::array();
            for (const InteractionEvent& ev : self.drainInteractionEvents()) {
                emscripten::val item = emscripten::val::object();
                item.set("type", std::string(eventTypeName(ev.type)));
                item.set("entityId", idToJs(ev.entityId));
                out.call<void>("push", item);
            }
            return out;
        }))
        .function("setIdsOfSelectedEntities", emscripten::optional_override([](TimelineEngine& self, emscripten::val ids) {
            self.setIdsOfSelectedEntities(idsFromJs(ids));
        }))
        .function("clearIdsOfSelectedEntities", &TimelineEngine::clearIdsOfSelectedEntities)
        .function("getStats", &TimelineEngine::getStats)
        .function("getLayoutDigest", &TimelineEngine::getLayoutDigest);
}
#endif
