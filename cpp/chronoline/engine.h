#pragma once

#include "chronoline/core/date.h"
#include "chronoline/core/types.h"
#include "chronoline/entity/entity.h"
#include "chronoline/entity/working_entity.h"
#include "chronoline/interaction/interaction_events.h"
#include "chronoline/layout/date_range.h"
#include "chronoline/layout/layout_params.h"
#include "chronoline/render/colours.h"
#include "chronoline/render/primitives.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chronoline {

/**
 * TimelineEngine: lays out dated entities as a zoomable, pannable timeline.
 *
 * Every mutator ends in a full recalculation (filters, date range, text
 * measurement, widths, x positions, rows, y positions, headings, offset
 * clamp), so the query methods are pure reads of a consistent layout.
 * Panning and resizing only move or clamp the offset.
 *
 * Single-threaded; the host serializes calls.
 */
class TimelineEngine {
    friend class TimelineEngineTestAccessor;
public:
    struct EngineStats {
        std::uint32_t generation;
        std::uint32_t entityCount;
        std::uint32_t visibleEntityCount;
        std::uint32_t rowCount;
        std::uint32_t decadeCount;
        std::uint32_t recalculateCount;
        std::uint32_t measureCacheHits;
        std::uint32_t measureCacheMisses;
        float lastRecalculateMs;
    };

    struct LayoutDigest {
        std::uint32_t lo;
        std::uint32_t hi;

        bool operator==(const LayoutDigest& other) const noexcept { return lo == other.lo && hi == other.hi; }
        bool operator!=(const LayoutDigest& other) const noexcept { return !(*this == other); }
    };

    static constexpr std::size_t kMaxMeasureCacheEntries = 4096;

    explicit TimelineEngine(MeasureTextFn measureText);

    TimelineEngine(const TimelineEngine&) = delete;
    TimelineEngine& operator=(const TimelineEngine&) = delete;

    // ==========================================================================
    // Entities
    // ==========================================================================

    void setEntities(const std::vector<Entity>& entities);
    // Entities whose id is already present are ignored.
    void addEntities(const std::vector<Entity>& entities);
    void removeEntities(const std::vector<EntityId>& ids);
    void clearEntities();

    // All entities, filtered or not.
    std::size_t entityCount() const noexcept { return workingEntities_.size(); }
    std::size_t visibleEntityCount() const noexcept;
    std::uint32_t rowCount() const noexcept { return rowCount_; }

    // ==========================================================================
    // Filters
    // ==========================================================================

    void setTagBoolExprEntityFilter(std::unique_ptr<TagExpression> expr);
    void removeTagBoolExprEntityFilter();
    bool hasTagBoolExprEntityFilter() const noexcept { return entityFilter_ != nullptr; }

    void setDateLimits(std::optional<Date> start, std::optional<Date> end);
    std::pair<std::optional<Date>, std::optional<Date>> dateLimits() const;

    // (decadeRangeStart, decadeRangeEnd)
    std::pair<std::int32_t, std::int32_t> startAndEndDecades() const noexcept;

    // ==========================================================================
    // Layout parameters, zoom and pan
    // ==========================================================================

    void setFontSizePx(double fontSizePx);
    void setLayoutParams(const ScalableLayoutParams& params);
    const ScalableLayoutParams& layoutParams() const noexcept { return fixedLayoutParams_; }
    // Font size after zoom.
    double effectiveFontSizePx() const noexcept { return zoomedLayoutParams_.fontSizePx; }

    /**
     * Zoom around a local point so that it stays where it is on screen.
     * A factor that would overshoot the zoom limit is reduced to land on it;
     * calls made at the limit do nothing.
     */
    void zoomIn(double factor, double localX, double localY);
    void zoomOut(double factor, double localX, double localY);
    void setZoom(double zoom);
    double zoom() const noexcept { return zoom_; }

    void setDatetimeScale(double scale);
    double datetimeScale() const noexcept { return datetimeScale_; }

    void addToGlobalOffset(double dx, double dy);
    const TimelineOffset& globalOffset() const noexcept { return offset_; }

    void setCanvasMax(double x, double y);
    const Size& canvasSize() const noexcept { return canvasSize_; }

    void setStickyText(bool stickyText) noexcept { stickyText_ = stickyText; }
    bool stickyText() const noexcept { return stickyText_; }

    // ==========================================================================
    // Theme
    // ==========================================================================

    void setColours(const TimelineColours& colours);
    const TimelineColours& colours() const noexcept { return colours_; }

    void setTagColours(const TagColours& tagColours);
    const TagColours& tagColours() const noexcept { return tagColours_; }

    // Replaces the system clock's date for open-ended entities (nullopt restores it).
    void setTodayOverride(std::optional<Date> today);
    const std::optional<Date>& todayOverride() const noexcept { return todayOverride_; }

    // ==========================================================================
    // Queries (canvas space, culled to the canvas)
    // ==========================================================================

    std::vector<EntityOut> entitiesForDrawing() const;
    std::vector<Heading> headingsForDrawing() const;
    std::vector<VerticalLine> linesForDrawing() const;
    std::vector<Background> backgroundsForDrawing() const;

    // ==========================================================================
    // Interaction
    // ==========================================================================

    void clickOnEntity(EntityId id);
    void doubleClickOnEntity(EntityId id);
    void tripleClickOnEntity(EntityId id);
    // nullopt clears hover without queueing an event.
    void hoverOverEntity(std::optional<EntityId> id);
    std::vector<InteractionEvent> drainInteractionEvents();
    std::size_t pendingInteractionEventCount() const noexcept { return interactionEvents_.size(); }

    // Adds to the selection.
    void selectEntities(const std::vector<EntityId>& ids);
    std::vector<EntityId> idsOfSelectedEntities() const { return selectedIds_; }
    void setIdsOfSelectedEntities(const std::vector<EntityId>& ids);
    void addIdOfSelectedEntity(EntityId id);
    void removeIdFromSelectedEntities(EntityId id);
    void clearIdsOfSelectedEntities();

    // ==========================================================================
    // Diagnostics
    // ==========================================================================

    EngineStats getStats() const noexcept;
    LayoutDigest getLayoutDigest() const noexcept;

private:
    struct MeasureKey {
        double fontSize;
        std::string text;

        bool operator==(const MeasureKey& other) const noexcept {
            return fontSize == other.fontSize && text == other.text;
        }
    };

    struct MeasureKeyHash {
        std::size_t operator()(const MeasureKey& key) const noexcept;
    };

    MeasureTextFn measureText_;
    MeasureTextFn cachedMeasure_;

    std::vector<WorkingEntity> workingEntities_{};
    std::unique_ptr<TagExpression> entityFilter_{};
    TimelineDateRange dateRange_{};
    std::vector<Heading> headings_{};
    std::uint32_t rowCount_{0};
    std::size_t nextInsertionIndex_{0};

    ScalableLayoutParams fixedLayoutParams_{};
    ScalableLayoutParams zoomedLayoutParams_{};
    MeasuredLayoutParams measuredLayoutParams_{};

    TimelineColours colours_{};
    TagColours tagColours_{};

    TimelineOffset offset_{};
    Size canvasSize_{};
    double zoom_{1.0};
    double datetimeScale_{1.0};
    bool stickyText_{true};
    std::optional<Date> todayOverride_{};

    std::vector<EntityId> selectedIds_{};
    std::vector<InteractionEvent> interactionEvents_{};

    mutable std::unordered_map<MeasureKey, TextSize, MeasureKeyHash> measureCache_{};
    mutable std::uint32_t measureCacheHits_{0};
    mutable std::uint32_t measureCacheMisses_{0};

    std::uint32_t generation_{0};
    std::uint32_t recalculateCount_{0};
    float lastRecalculateMs_{0.0f};

    // engine_recalculate.cpp
    void recalculate();
    void updateEntitiesFiltered();
    void updateMeasuredLayoutParams();
    void remeasureEntities();
    void applyEntityColours(WorkingEntity& entity) const;
    void sortEntities();
    TextSize measureCached(double fontSizePx, const std::string& text) const;
    Date today() const;

    // engine_view.cpp
    void updateZoomedLayoutParams();
    void clampGlobalOffset();
    double headerHeight() const noexcept;
    // Extra y offset for the year heading band, when shown.
    double headerAutoOffset() const noexcept;

    // engine_entities.cpp
    void syncSelectionFlags();
};

} // namespace chronoline
