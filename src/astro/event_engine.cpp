/// @file event_engine.cpp
/// @brief Window pairing, anchor shifting and location-only statistics.

#include "astro/event_engine.hpp"

#include "astro/event_search.hpp"
#include "astro/time_system.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace darksky::astro
{

namespace
{

LocalEvent make_event(const Location& location, f64 jd)
{
    const absl::Time utc = TimeSystem::to_time(jd);
    return LocalEvent{.utc = utc, .local = location.to_local(utc)};
}

std::string format_anchor(f64 anchor_jd)
{
    return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", TimeSystem::to_time(anchor_jd), absl::UTCTimeZone());
}

[[noreturn]] void fail(const Location& location, Body body, f64 anchor_jd, const std::string& reason)
{
    core::ErrorContext context = location.error_context("astronomical_windows");
    context.when = format_anchor(anchor_jd);

    DSK_CORE_ERROR("Inconsistent ephemeris for {} at ({:.4f}, {:.4f}), anchor {}: {}",
                   body_name(body), location.latitude(), location.longitude(),
                   *context.when, reason);
    throw core::InconsistentEphemerisError(
        fmt::format("{}: {}", body_name(body), reason), std::move(context));
}

f64 require_event(std::optional<f64> event, const Location& location, Body body,
                  f64 anchor_jd, const char* what)
{
    if (!event)
    {
        fail(location, body, anchor_jd, fmt::format("no {} within the search span", what));
    }
    return *event;
}

// Local time of day in ("18:00:00", "23:59:59"]
bool is_evening(const absl::CivilSecond& local)
{
    const i32 seconds = static_cast<i32>(local.hour()) * 3600
                      + static_cast<i32>(local.minute()) * 60
                      + static_cast<i32>(local.second());
    return seconds > 18 * 3600 && seconds <= 23 * 3600 + 59 * 60 + 59;
}

} // namespace

PairingMode pairing_mode(Body body)
{
    return body == Body::GalacticCenter ? PairingMode::RisingThenSetting
                                        : PairingMode::SettingThenRising;
}

AnchorState advance_anchor(AnchorState state)
{
    switch (state)
    {
        case AnchorState::Initial: return AnchorState::Shifted;
        case AnchorState::Shifted: return AnchorState::Failed;
        case AnchorState::Failed:  return AnchorState::Failed;
    }
    return AnchorState::Failed;
}

EventEngine::EventEngine(i32 window_count)
    : m_window_count(window_count)
{
}

// -----------------------------------------------------------------
// Consecutive windows
// -----------------------------------------------------------------

std::vector<AstronomicalWindow> EventEngine::windows(
    const Location& location, Body body, absl::CivilDay start) const
{
    std::vector<AstronomicalWindow> result;
    if (m_window_count <= 0)
    {
        return result;
    }
    result.reserve(static_cast<std::size_t>(m_window_count));

    // A body skips at most one day per window; three times the count is ample
    const i32 max_anchors = m_window_count * 3;

    absl::CivilDay day = start;
    for (i32 attempt = 0; attempt < max_anchors && static_cast<i32>(result.size()) < m_window_count; ++attempt, ++day)
    {
        const f64 anchor_jd = TimeSystem::julian_date(location.local_midnight(day));
        AstronomicalWindow window = window_at(location, body, anchor_jd);

        if (!result.empty() && window.opens().utc <= result.back().opens().utc)
        {
            DSK_CORE_TRACE("{} window from anchor {} repeats the previous one, skipped",
                           body_name(body), format_anchor(anchor_jd));
            continue;
        }
        result.push_back(window);
    }

    if (static_cast<i32>(result.size()) < m_window_count)
    {
        fail(location, body, TimeSystem::julian_date(location.local_midnight(start)),
             fmt::format("only {} of {} distinct windows found", result.size(), m_window_count));
    }

    return result;
}

AstronomicalWindow EventEngine::window_at(const Location& location, Body body, f64 anchor_jd)
{
    if (pairing_mode(body) == PairingMode::SettingThenRising)
    {
        return setting_then_rising(location, body, anchor_jd);
    }
    return rising_then_setting(location, body, anchor_jd);
}

// -----------------------------------------------------------------
// Setting-then-rising: S from the anchor, R from the anchor or one
// day later, S < R required.
// -----------------------------------------------------------------

AstronomicalWindow EventEngine::setting_then_rising(const Location& location, Body body, f64 anchor_jd)
{
    const ObserverLocation observer = location.observer();

    const f64 set = require_event(EventSearch::next_setting(body, observer, anchor_jd),
                                  location, body, anchor_jd, "setting");

    f64 rise_anchor = anchor_jd;
    f64 rise = require_event(EventSearch::next_rising(body, observer, rise_anchor),
                             location, body, rise_anchor, "rising");

    AnchorState state = AnchorState::Initial;
    while (!(set < rise))
    {
        state = advance_anchor(state);
        if (state == AnchorState::Failed)
        {
            fail(location, body, anchor_jd, "rising precedes setting after shifting the anchor");
        }
        rise_anchor += 1.0;
        rise = require_event(EventSearch::next_rising(body, observer, rise_anchor),
                             location, body, rise_anchor, "rising");
    }

    return AstronomicalWindow{
        .body    = body,
        .mode    = PairingMode::SettingThenRising,
        .rise    = make_event(location, rise),
        .set     = make_event(location, set),
        .transit = std::nullopt,
    };
}

// -----------------------------------------------------------------
// Rising-then-setting: R from the anchor, St from the anchor or one
// day later, T the earliest of three anchored transits with
// R < T <= St.
// -----------------------------------------------------------------

AstronomicalWindow EventEngine::rising_then_setting(const Location& location, Body body, f64 anchor_jd)
{
    const ObserverLocation observer = location.observer();

    const f64 rise = require_event(EventSearch::next_rising(body, observer, anchor_jd),
                                   location, body, anchor_jd, "rising");

    f64 set_anchor = anchor_jd;
    f64 set = require_event(EventSearch::next_setting(body, observer, set_anchor),
                            location, body, set_anchor, "setting");

    AnchorState state = AnchorState::Initial;
    while (!(rise < set))
    {
        state = advance_anchor(state);
        if (state == AnchorState::Failed)
        {
            fail(location, body, anchor_jd, "setting precedes rising after shifting the anchor");
        }
        set_anchor += 1.0;
        set = require_event(EventSearch::next_setting(body, observer, set_anchor),
                            location, body, set_anchor, "setting");
    }

    std::optional<f64> transit;
    const std::array<f64, 3> transit_anchors{anchor_jd - 0.5, anchor_jd, anchor_jd + 0.5};
    for (const f64 candidate_anchor : transit_anchors)
    {
        const std::optional<f64> candidate = EventSearch::next_transit(body, observer, candidate_anchor);
        if (!candidate || !(rise < *candidate && *candidate <= set))
        {
            continue;
        }
        if (!transit || *candidate < *transit)
        {
            transit = candidate;
        }
    }

    if (!transit)
    {
        fail(location, body, anchor_jd, "no transit between rising and setting");
    }

    return AstronomicalWindow{
        .body    = body,
        .mode    = PairingMode::RisingThenSetting,
        .rise    = make_event(location, rise),
        .set     = make_event(location, set),
        .transit = make_event(location, *transit),
    };
}

// -----------------------------------------------------------------
// Maximum altitude at upper culmination: 90° - |φ - δ|
// -----------------------------------------------------------------

f64 EventEngine::max_altitude(const Location& location)
{
    const f64 dec_deg = Ephemeris::galactic_center_j2000().dec * astro_constants::kRadToDeg;
    const f64 geometric = 90.0 - std::abs(location.latitude() - dec_deg);

    if (geometric <= 0.0)
    {
        return geometric;
    }
    const f64 refraction = Coordinates::refraction(geometric * astro_constants::kDegToRad);
    return geometric + refraction * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Milky Way season
// -----------------------------------------------------------------

std::optional<MilkyWaySeason> EventEngine::milky_way_season(const Location& location, i32 year)
{
    const ObserverLocation observer = location.observer();
    const absl::CivilDay first(year, 1, 1);
    const absl::CivilDay last(year, 12, 31);

    std::optional<absl::CivilDay> season_start;
    for (absl::CivilDay day = first; day <= last; ++day)
    {
        const f64 anchor_jd = TimeSystem::julian_date(location.local_midnight(day));

        if (!season_start)
        {
            const std::optional<f64> rise =
                EventSearch::next_rising(Body::GalacticCenter, observer, anchor_jd);
            if (rise)
            {
                const LocalEvent event = make_event(location, *rise);
                if (is_evening(event.local))
                {
                    season_start = absl::CivilDay(event.local);
                }
            }
            continue;
        }

        const std::optional<f64> set =
            EventSearch::next_setting(Body::GalacticCenter, observer, anchor_jd);
        if (set)
        {
            const LocalEvent event = make_event(location, *set);
            if (is_evening(event.local))
            {
                DSK_CORE_DEBUG("Milky Way season {} at ({:.4f}, {:.4f}): {} .. {}",
                               year, location.latitude(), location.longitude(),
                               absl::FormatCivilTime(*season_start),
                               absl::FormatCivilTime(absl::CivilDay(event.local)));
                return MilkyWaySeason{.start = *season_start, .end = absl::CivilDay(event.local)};
            }
        }
    }

    DSK_CORE_ERROR("Milky Way season not found for ({:.4f}, {:.4f}) in {}",
                   location.latitude(), location.longitude(), year);
    return std::nullopt;
}

// -----------------------------------------------------------------
// New moons
//
// The scan starts a lunation before local New Year so that a new
// moon early on January 1st local time is not missed, and keeps the
// dates whose local calendar year is @p year.
// -----------------------------------------------------------------

std::vector<absl::CivilDay> EventEngine::new_moon_dates(const Location& location, i32 year)
{
    const absl::CivilDay first(year, 1, 1);
    f64 cursor = TimeSystem::julian_date(location.local_midnight(first)) - EventSearch::kLunationSpanDays;

    std::vector<absl::CivilDay> dates;
    while (true)
    {
        const std::optional<f64> new_moon = EventSearch::next_new_moon(cursor);
        if (!new_moon)
        {
            core::ErrorContext context = location.error_context("new_moon_dates");
            context.when = format_anchor(cursor);
            throw core::InconsistentEphemerisError(
                fmt::format("No new moon within {} days", EventSearch::kLunationSpanDays), context);
        }

        const absl::CivilDay local(make_event(location, *new_moon).local);
        if (local.year() > year)
        {
            break;
        }
        if (local.year() == year)
        {
            dates.push_back(local);
        }
        cursor = *new_moon + EventSearch::kPhaseStepDays;
    }

    DSK_CORE_DEBUG("{} new moons in {} at ({:.4f}, {:.4f})",
                   dates.size(), year, location.latitude(), location.longitude());
    return dates;
}

} // namespace darksky::astro
