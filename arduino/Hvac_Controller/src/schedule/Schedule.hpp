// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------------------------

enum class ScheduleMode {
    Manual,
    Schedule
};

inline const char *toString (const ScheduleMode mode) {
    return mode == ScheduleMode::Schedule ? "schedule" : "manual";
}
inline std::optional<ScheduleMode> scheduleModeFromString (const std::string &mode) {
    if (mode == "manual")
        return ScheduleMode::Manual;
    if (mode == "schedule")
        return ScheduleMode::Schedule;
    return std::nullopt;
}

// -----------------------------------------------------------------------------------------------

// "HH:MM" <-> minutes since midnight
inline std::optional<int> parseTimeOfDay (const std::string &text) {
    const auto colon = text.find (':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || text.length () - colon - 1 != 2)
        return std::nullopt;
    int hours = 0, minutes = 0;
    for (size_t i = 0; i < text.length (); i++) {
        if (i == colon)
            continue;
        if (! std::isdigit (static_cast<unsigned char> (text [i])))
            return std::nullopt;
        if (i < colon)
            hours = hours * 10 + (text [i] - '0');
        else
            minutes = minutes * 10 + (text [i] - '0');
    }
    if (hours > 23 || minutes > 59)
        return std::nullopt;
    return hours * 60 + minutes;
}
inline std::string formatTimeOfDay (const int minutes) {
    char buffer [sizeof ("HH:MM")];
    snprintf (buffer, sizeof (buffer), "%02d:%02d", (minutes / 60) % 24, minutes % 60);
    return buffer;
}

inline std::string toTitleCase (const std::string &text) {
    std::string result (text);
    bool boundary = true;
    for (auto &c : result) {
        const unsigned char u = static_cast<unsigned char> (c);
        c = static_cast<char> (boundary ? std::toupper (u) : std::tolower (u));
        boundary = ! std::isalpha (u);
    }
    return result;
}

// -----------------------------------------------------------------------------------------------

struct SchedulePeriod {
    std::string label;
    int start;    // minutes since midnight
    int heat, cool;

    bool operator== (const SchedulePeriod &other) const {
        return label == other.label && start == other.start && heat == other.heat && cool == other.cool;
    }
};
using SchedulePeriods = std::vector<SchedulePeriod>;

struct ScheduleTransition {
    SchedulePeriod period;
    bool tomorrow;

    std::string describe () const {
        return toTitleCase (period.label) + " at " + formatTimeOfDay (period.start) + (tomorrow ? " (tomorrow)" : "");
    }
};

// -----------------------------------------------------------------------------------------------

struct Schedule {
    ScheduleMode mode = ScheduleMode::Manual;
    SchedulePeriods weekday, weekend;

    static bool isWeekend (const int wday) {
        return wday == 0 || wday == 6;
    }
    static int minutesOf (const struct tm &now) {
        return now.tm_hour * 60 + now.tm_min;
    }
    static SchedulePeriods sorted (const SchedulePeriods &periods) {
        SchedulePeriods result (periods);
        std::stable_sort (result.begin (), result.end (), [] (const SchedulePeriod &a, const SchedulePeriod &b) {
            return a.start < b.start;
        });
        return result;
    }

    const SchedulePeriods &periodsFor (const int wday) const {
        return isWeekend (wday) ? weekend : weekday;
    }

    // last period started at or before now, or the day's final period carried over from the night before
    std::optional<SchedulePeriod> activePeriod (const struct tm &now) const {
        const auto periods = sorted (periodsFor (now.tm_wday));
        if (periods.empty ())
            return std::nullopt;
        const int minutes = minutesOf (now);
        SchedulePeriod active = periods.back ();
        for (const auto &period : periods)
            if (period.start <= minutes)
                active = period;
        return active;
    }

    std::optional<ScheduleTransition> nextTransition (const struct tm &now) const {
        const auto periods = sorted (periodsFor (now.tm_wday));
        if (periods.empty ())
            return std::nullopt;
        const int minutes = minutesOf (now);
        for (const auto &period : periods)
            if (period.start > minutes)
                return ScheduleTransition { .period = period, .tomorrow = false };
        const auto following = sorted (periodsFor ((now.tm_wday + 1) % 7));
        if (following.empty ())
            return std::nullopt;
        return ScheduleTransition { .period = following.front (), .tomorrow = true };
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
