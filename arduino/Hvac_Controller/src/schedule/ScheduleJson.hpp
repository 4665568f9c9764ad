// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class ScheduleJson {
public:
    static Schedule defaults () {
        return Schedule {
            .mode = ScheduleMode::Manual,
            .weekday = {
                { .label = "sleep", .start = 22 * 60 + 0, .heat = 65, .cool = 78 },
                { .label = "wake", .start = 6 * 60 + 30, .heat = 70, .cool = 76 },
                { .label = "home", .start = 8 * 60 + 0, .heat = 68, .cool = 75 },
                { .label = "away", .start = 17 * 60 + 0, .heat = 62, .cool = 80 } },
            .weekend = {
                { .label = "sleep", .start = 22 * 60 + 0, .heat = 65, .cool = 78 },
                { .label = "wake", .start = 8 * 60 + 0, .heat = 70, .cool = 76 },
                { .label = "home", .start = 9 * 60 + 0, .heat = 68, .cool = 75 },
                { .label = "away", .start = 17 * 60 + 0, .heat = 62, .cool = 80 } }
        };
    }

    static void serialize (JsonVariant obj, const SchedulePeriods &periods) {
        JsonArray array = obj.to<JsonArray> ();
        for (const auto &period : periods) {
            JsonObject item = array.add<JsonObject> ();
            item ["period"] = period.label;
            item ["start"] = formatTimeOfDay (period.start);
            item ["heat"] = period.heat;
            item ["cool"] = period.cool;
        }
    }
    static void serialize (JsonVariant obj, const Schedule &schedule) {
        obj ["mode"] = ::toString (schedule.mode);
        serialize (obj ["weekday"].to<JsonVariant> (), schedule.weekday);
        serialize (obj ["weekend"].to<JsonVariant> (), schedule.weekend);
    }
    static std::string toString (const Schedule &schedule) {
        JsonDocument doc;
        serialize (doc.to<JsonVariant> (), schedule);
        std::string output;
        serializeJson (doc, output);
        return output;
    }

    static std::optional<SchedulePeriod> deserializePeriod (JsonVariantConst item) {
        if (! item ["period"].is<const char *> () || ! item ["start"].is<const char *> () || ! item ["heat"].is<int> () || ! item ["cool"].is<int> ())
            return std::nullopt;
        const auto start = parseTimeOfDay (item ["start"].as<std::string> ());
        if (! start.has_value ())
            return std::nullopt;
        return SchedulePeriod { .label = item ["period"].as<std::string> (), .start = *start, .heat = item ["heat"].as<int> (), .cool = item ["cool"].as<int> () };
    }
    static std::optional<SchedulePeriods> deserializePeriods (JsonVariantConst array) {
        if (! array.is<JsonArrayConst> ())
            return std::nullopt;
        SchedulePeriods periods;
        for (JsonVariantConst item : array.as<JsonArrayConst> ()) {
            const auto period = deserializePeriod (item);
            if (period.has_value ())
                periods.push_back (*period);
            else
                DEBUG_PRINTF ("ScheduleJson::deserialize: period rejected (missing field or bad time)\n");
        }
        return periods;
    }
    // absent or malformed parts keep the defaults
    static Schedule deserialize (JsonVariantConst obj) {
        Schedule schedule = defaults ();
        if (obj ["mode"].is<const char *> ()) {
            const auto mode = scheduleModeFromString (obj ["mode"].as<std::string> ());
            if (mode.has_value ())
                schedule.mode = *mode;
        }
        const auto weekday = deserializePeriods (obj ["weekday"]), weekend = deserializePeriods (obj ["weekend"]);
        if (weekday.has_value ())
            schedule.weekday = *weekday;
        if (weekend.has_value ())
            schedule.weekend = *weekend;
        return schedule;
    }
    static Schedule fromString (const std::string &content) {
        JsonDocument doc;
        DeserializationError error;
        if ((error = deserializeJson (doc, content)) != DeserializationError::Ok || ! doc.is<JsonObjectConst> ()) {
            DEBUG_PRINTF ("ScheduleJson::fromString: deserializeJson fault: %s, using defaults\n", error ? error.c_str () : "not an object");
            return defaults ();
        }
        return deserialize (doc.as<JsonVariantConst> ());
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
