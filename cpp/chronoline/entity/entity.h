#pragma once

#include "chronoline/core/date.h"
#include "chronoline/core/types.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chronoline {

// A tag is a value with an optional namespace name, e.g. "person" or "type:battle".
struct Tag {
    std::optional<std::string> name{};
    std::string value{};

    bool operator==(const Tag& other) const { return name == other.name && value == other.value; }
    bool operator!=(const Tag& other) const { return !(*this == other); }
};

/**
 * Entity: the unit drawn on a timeline. Loaded and validated upstream; the
 * engine assumes `end`, when present, is not before `start`.
 */
struct Entity {
    EntityId id{0};
    std::string name{};
    Date start{};
    std::optional<Date> end{};
    std::optional<std::vector<Tag>> tags{};

    bool hasTag(const Tag& tag) const {
        if (!tags) return false;
        for (const Tag& t : *tags) {
            if (t == tag) return true;
        }
        return false;
    }

    bool operator==(const Entity& other) const {
        return id == other.id && name == other.name && start == other.start && end == other.end && tags == other.tags;
    }
};

/**
 * TagExpression: boolean tag expression evaluated by an external parser.
 * The engine only ever asks whether an entity matches.
 */
class TagExpression {
public:
    virtual ~TagExpression() = default;
    virtual bool matches(const Entity& entity) const = 0;
};

// Adapts any callable to the TagExpression interface.
class PredicateTagExpression final : public TagExpression {
public:
    explicit PredicateTagExpression(std::function<bool(const Entity&)> predicate)
        : predicate_(std::move(predicate)) {}

    bool matches(const Entity& entity) const override {
        return predicate_ ? predicate_(entity) : true;
    }

private:
    std::function<bool(const Entity&)> predicate_;
};

inline std::unique_ptr<TagExpression> makeTagExpression(std::function<bool(const Entity&)> predicate) {
    return std::make_unique<PredicateTagExpression>(std::move(predicate));
}

} // namespace chronoline
