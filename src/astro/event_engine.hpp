#pragma once

/// @file event_engine.hpp
/// @brief Rise/set/transit windows of the Sun, the Moon and the Galactic Center.

#include "astro/ephemeris.hpp"
#include "astro/location.hpp"
#include "core/types.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <optional>
#include <vector>

namespace darksky::astro
{
    /// @brief Order in which a window pairs the horizon events of a body.
    enum class PairingMode
    {
        SettingThenRising,  ///< Object-free interval (Sun, Moon)
        RisingThenSetting,  ///< Visibility interval with transit (Galactic Center)
    };

    [[nodiscard]] PairingMode pairing_mode(Body body);

    /// @brief Retry policy for an event that precedes the one it must follow.
    ///
    /// Initial → Shifted (recompute from an anchor one day later) → Failed.
    enum class AnchorState
    {
        Initial,
        Shifted,
        Failed,
    };

    /// @brief One step of the one-shift-then-fail policy.
    [[nodiscard]] AnchorState advance_anchor(AnchorState state);

    /// @brief An event instant with its civil time in the observer's zone.
    struct LocalEvent
    {
        absl::Time utc;
        absl::CivilSecond local;
    };

    /// @brief Paired horizon events of one body.
    ///
    /// SettingThenRising windows satisfy set < rise.
    /// RisingThenSetting windows satisfy rise < transit ≤ set.
    struct AstronomicalWindow
    {
        Body body;
        PairingMode mode;
        LocalEvent rise;
        LocalEvent set;
        std::optional<LocalEvent> transit;

        /// @brief Event that opens the window (set, or rise for RisingThenSetting).
        [[nodiscard]] const LocalEvent& opens() const
        {
            return mode == PairingMode::SettingThenRising ? set : rise;
        }

        /// @brief Event that closes the window.
        [[nodiscard]] const LocalEvent& closes() const
        {
            return mode == PairingMode::SettingThenRising ? rise : set;
        }
    };

    /// @brief Local dates on which the Galactic Center season starts and ends.
    struct MilkyWaySeason
    {
        absl::CivilDay start;   ///< First date the core rises in the evening
        absl::CivilDay end;     ///< First later date the core sets in the evening
    };

    /// @brief Stateless computation of consecutive astronomical windows.
    ///
    /// Each window is computed from a day anchor (local midnight of a calendar
    /// date, in UTC). Anchors advance one day at a time; a window whose opening
    /// event repeats the previous window's is dropped so that the result holds
    /// distinct consecutive windows.
    class EventEngine
    {
    public:
        explicit EventEngine(i32 window_count = 4);

        [[nodiscard]] i32 window_count() const noexcept { return m_window_count; }

        /// @brief Consecutive windows for @p body starting on local date @p start.
        /// @throws core::InconsistentEphemerisError when an event is missing or
        ///         the ordering cannot be established within one anchor shift.
        [[nodiscard]] std::vector<AstronomicalWindow> windows(
            const Location& location, Body body, absl::CivilDay start) const;

        /// @brief Window built from a single day anchor (Julian Date, UT).
        [[nodiscard]] static AstronomicalWindow window_at(
            const Location& location, Body body, f64 anchor_jd);

        /// @brief Altitude of the Galactic Center at upper culmination (degrees),
        /// refraction included when above the horizon. Independent of date.
        [[nodiscard]] static f64 max_altitude(const Location& location);

        /// @brief Milky Way season of @p year, or std::nullopt if the core never
        /// rises and later sets in the evening at this location.
        [[nodiscard]] static std::optional<MilkyWaySeason> milky_way_season(
            const Location& location, i32 year);

        /// @brief Local dates of every new moon in @p year, in order.
        /// @throws core::InconsistentEphemerisError if a lunation has no new moon.
        [[nodiscard]] static std::vector<absl::CivilDay> new_moon_dates(
            const Location& location, i32 year);

    private:
        [[nodiscard]] static AstronomicalWindow setting_then_rising(
            const Location& location, Body body, f64 anchor_jd);

        [[nodiscard]] static AstronomicalWindow rising_then_setting(
            const Location& location, Body body, f64 anchor_jd);

        i32 m_window_count;
    };

} // namespace darksky::astro
