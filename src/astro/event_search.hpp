#pragma once

/// @file event_search.hpp
/// @brief Rise, set and transit instants found by stepping and bisection.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "core/types.hpp"

#include <optional>

namespace darksky::astro
{
    /// @brief Horizon and meridian events of a body.
    enum class EventKind
    {
        Rising,     ///< Upper limb crosses the refracted horizon upward
        Setting,    ///< Upper limb crosses the refracted horizon downward
        Transit,    ///< Upper culmination (hour angle crosses zero)
    };

    /// @brief Static search for the next occurrence of an event after a start instant.
    ///
    /// The search walks forward in fixed steps from the start Julian Date,
    /// brackets the first sign change of the event function and refines it
    /// by bisection. A body that never crosses the horizon inside the search
    /// span (circumpolar or never rising) yields std::nullopt.
    class EventSearch
    {
    public:
        EventSearch() = delete;

        static constexpr f64 kStepDays       = 10.0 / 1440.0;   ///< 10 minutes
        static constexpr f64 kToleranceDays  = 0.5 / 86400.0;   ///< 0.5 seconds
        static constexpr f64 kDefaultSpanDays = 3.0;

        /// @brief First event strictly after @p start_jd (Julian Date, UT).
        [[nodiscard]] static std::optional<f64> next_event(
            Body body,
            const ObserverLocation& observer,
            f64 start_jd,
            EventKind kind,
            f64 span_days = kDefaultSpanDays
        );

        [[nodiscard]] static std::optional<f64> next_rising(
            Body body, const ObserverLocation& observer, f64 start_jd);

        [[nodiscard]] static std::optional<f64> next_setting(
            Body body, const ObserverLocation& observer, f64 start_jd);

        [[nodiscard]] static std::optional<f64> next_transit(
            Body body, const ObserverLocation& observer, f64 start_jd);

        static constexpr f64 kPhaseStepDays    = 1.0;
        static constexpr f64 kLunationSpanDays = 35.0;  ///< Longer than one synodic month

        /// @brief First new moon strictly after @p start_jd (Julian Date, UT):
        /// the upward zero crossing of Ephemeris::moon_sun_elongation.
        [[nodiscard]] static std::optional<f64> next_new_moon(f64 start_jd);

    private:
        /// @brief Event function whose sign change marks the event.
        [[nodiscard]] static f64 evaluate(Body body, const ObserverLocation& observer,
                                          f64 jd, EventKind kind);

        /// @brief True when the step from @p before to @p after is the wanted crossing.
        [[nodiscard]] static bool is_crossing(f64 before, f64 after, EventKind kind);
    };

} // namespace darksky::astro
