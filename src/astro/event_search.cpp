/// @file event_search.cpp
/// @brief Step-and-bisect search for horizon crossings and culminations.

#include "astro/event_search.hpp"

#include <cmath>

namespace darksky::astro
{

std::optional<f64> EventSearch::next_rising(Body body, const ObserverLocation& observer, f64 start_jd)
{
    return next_event(body, observer, start_jd, EventKind::Rising);
}

std::optional<f64> EventSearch::next_setting(Body body, const ObserverLocation& observer, f64 start_jd)
{
    return next_event(body, observer, start_jd, EventKind::Setting);
}

std::optional<f64> EventSearch::next_transit(Body body, const ObserverLocation& observer, f64 start_jd)
{
    return next_event(body, observer, start_jd, EventKind::Transit);
}

// -----------------------------------------------------------------
// Event functions
//
// Rising/Setting: altitude of the upper limb above the refracted
//   horizon, negative below. Rising is − → +, Setting is + → −.
// Transit: hour angle in (-π, π], culmination is − → +. The jump
//   from +π to −π at lower culmination is the opposite direction and
//   never matches.
// -----------------------------------------------------------------

f64 EventSearch::evaluate(Body body, const ObserverLocation& observer, f64 jd, EventKind kind)
{
    if (kind == EventKind::Transit)
    {
        return Ephemeris::hour_angle(body, observer, jd);
    }
    return Ephemeris::altitude_above_horizon(body, observer, jd);
}

bool EventSearch::is_crossing(f64 before, f64 after, EventKind kind)
{
    switch (kind)
    {
        case EventKind::Rising:
            return before < 0.0 && after >= 0.0;
        case EventKind::Setting:
            return before >= 0.0 && after < 0.0;
        case EventKind::Transit:
            // Reject the wrap-around: a real culmination moves by a small angle per step
            return before < 0.0 && after >= 0.0 && (after - before) < astro_constants::kHalfPi;
    }
    return false;
}

std::optional<f64> EventSearch::next_event(
    Body body,
    const ObserverLocation& observer,
    f64 start_jd,
    EventKind kind,
    f64 span_days)
{
    const f64 end_jd = start_jd + span_days;

    f64 lo = start_jd;
    f64 f_lo = evaluate(body, observer, lo, kind);

    while (lo < end_jd)
    {
        const f64 hi = lo + kStepDays;
        const f64 f_hi = evaluate(body, observer, hi, kind);

        if (is_crossing(f_lo, f_hi, kind))
        {
            // Bisection keeps the invariant: crossing lies in (a, b]
            f64 a = lo;
            f64 b = hi;
            f64 f_a = f_lo;
            while (b - a > kToleranceDays)
            {
                const f64 mid = 0.5 * (a + b);
                const f64 f_mid = evaluate(body, observer, mid, kind);
                if (is_crossing(f_a, f_mid, kind))
                {
                    b = mid;
                }
                else
                {
                    a = mid;
                    f_a = f_mid;
                }
            }
            return b;
        }

        lo = hi;
        f_lo = f_hi;
    }

    return std::nullopt;
}

// -----------------------------------------------------------------
// New moon
//
// The elongation falls from +π to −π at full moon, so the only
// − → + step inside one day is the new moon itself.
// -----------------------------------------------------------------

std::optional<f64> EventSearch::next_new_moon(f64 start_jd)
{
    const f64 end_jd = start_jd + kLunationSpanDays;

    f64 lo = start_jd;
    f64 f_lo = Ephemeris::moon_sun_elongation(lo);

    while (lo < end_jd)
    {
        const f64 hi = lo + kPhaseStepDays;
        const f64 f_hi = Ephemeris::moon_sun_elongation(hi);

        if (f_lo < 0.0 && f_hi >= 0.0)
        {
            f64 a = lo;
            f64 b = hi;
            while (b - a > kToleranceDays)
            {
                const f64 mid = 0.5 * (a + b);
                if (Ephemeris::moon_sun_elongation(mid) >= 0.0)
                {
                    b = mid;
                }
                else
                {
                    a = mid;
                }
            }
            return b;
        }

        lo = hi;
        f_lo = f_hi;
    }

    return std::nullopt;
}

} // namespace darksky::astro
