// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <functional>

namespace abcd_bus {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

struct RetryPolicy {
    int maxAttempts;
    interval_t backoff;
};

template <typename F>
auto retry (const RetryPolicy &policy, F &&attempt) -> decltype (attempt ()) {
    for (int number = 1; number <= policy.maxAttempts; number++) {
        auto result = attempt ();
        if (result.has_value ())
            return result;
        if (number < policy.maxAttempts && policy.backoff > 0)
            std::this_thread::sleep_for (std::chrono::milliseconds (policy.backoff));
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------------------------

template <typename T>
class CachedReading {
    mutable std::mutex _mutex;
    std::optional<T> _value;

public:
    static bool plausible (const std::optional<T> &value) {
        return value.has_value () && *value != T (0);
    }
    // fresh plausible values replace the cache, otherwise the last known good value stands
    std::optional<T> update (const std::optional<T> &fresh) {
        std::lock_guard<std::mutex> guard (_mutex);
        if (plausible (fresh))
            _value = fresh;
        return _value;
    }
    std::optional<T> get () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _value;
    }
};

// -----------------------------------------------------------------------------------------------

struct Status {
    std::optional<int> indoorTemp, outdoorTemp, heatSetpoint, coolSetpoint;
};

struct EnergyRecord {
    static constexpr size_t SIZE = 10;
    int hpHeat, cooling, elecHeat, fan, reheat;
    int total () const {
        return hpHeat + cooling + elecHeat + fan + reheat;
    }
};
using EnergyRecords = std::vector<EnergyRecord>;

struct YearlyEnergy {
    static constexpr size_t SIZE_MINIMUM = 37;
    struct Current {
        int hpHeat, elecHeat, cooling;
    } current;
    struct Previous {
        int hpHeat, elecHeat, cooling, fan;
    } previous;
    int currentTotal () const {
        return current.hpHeat + current.elecHeat + current.cooling;
    }
};

struct SetpointResult {
    enum class Outcome {
        AlreadyAtTarget,
        Confirmed,
        Unconfirmed,
        ProfileUnreadable
    };
    Outcome outcome;
    std::optional<int> observed;
    int roundsWritten = 0;

    bool succeeded () const {
        return outcome == Outcome::AlreadyAtTarget || outcome == Outcome::Confirmed;
    }
    static const char *toString (const Outcome outcome) {
        switch (outcome) {
        case Outcome::AlreadyAtTarget :
            return "already-at-target";
        case Outcome::Confirmed :
            return "confirmed";
        case Outcome::Unconfirmed :
            return "unconfirmed";
        case Outcome::ProfileUnreadable :
            return "profile-unreadable";
        default :
            return "undefined";
        }
    }
};

// -----------------------------------------------------------------------------------------------

namespace ComfortProfile {
    inline constexpr size_t OFFSET_HEAT_SETPOINT = 25;
    inline constexpr size_t OFFSET_COOL_SETPOINT = 26;
}    // namespace ComfortProfile

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class Device {
public:
    struct Config {
        RetryPolicy profileRead = { .maxAttempts = 3, .backoff = 500 };
        int writeRounds = 6;
        interval_t writeInterval = 5 * 1000;
    };
    struct Statistics {
        counter_t readFailures, fallbacks, cachedReadings, setpointsConfirmed, setpointsUnconfirmed, setpointsUnchanged, setpointsUnreadable;
    };

private:
    struct Source {
        DeviceAddress device;
        TableId table;
        size_t offset;
    };
    static inline const Source INDOOR_PRIMARY { DeviceAddress::Thermostat, Tables::ThermostatIndoor, 60 },
        INDOOR_FALLBACK { DeviceAddress::HeatPump, Tables::HeatPumpIndoor, 10 },
        OUTDOOR_PRIMARY { DeviceAddress::HeatPump, Tables::HeatPumpOutdoor, 32 },
        OUTDOOR_FALLBACK { DeviceAddress::Thermostat, Tables::ThermostatOutdoor, 16 };

    const Config _config;
    Transport &_transport;

    CachedReading<int> _indoorTemp, _outdoorTemp, _heatSetpoint, _coolSetpoint;
    mutable std::mutex _energyMutex;
    EnergyRecords _dailyEnergy;
    std::optional<YearlyEnergy> _yearlyEnergy;

    Counter _readFailures, _fallbacks, _cachedReadings;
    Counter _setpointsConfirmed, _setpointsUnconfirmed, _setpointsUnchanged, _setpointsUnreadable;

    std::optional<Bytes> readTableQuietly (const DeviceAddress device, const TableId &table) {
        try {
            return _transport.readTable (device, table);
        } catch (const TransportError &e) {
            _readFailures++;
            DEBUG_PRINTF ("Device::read: device=%s, table=%s, failed: %s\n", toString (device), table.toString ().c_str (), e.what ());
            return std::nullopt;
        }
    }
    std::optional<int> readByte (const Source &source) {
        const auto data = readTableQuietly (source.device, source.table);
        if (data.has_value () && data->size () > source.offset)
            return static_cast<int> ((*data) [source.offset]);
        return std::nullopt;
    }
    std::optional<int> readWithFallback (const Source &primary, const Source &fallback) {
        const auto value = readByte (primary);
        if (CachedReading<int>::plausible (value))
            return value;
        _fallbacks++;
        return readByte (fallback);
    }
    std::optional<int> cache (CachedReading<int> &reading, const std::optional<int> &fresh) {
        if (! CachedReading<int>::plausible (fresh))
            _cachedReadings++;
        return reading.update (fresh);
    }
    void pause (const interval_t interval) const {
        if (interval > 0)
            std::this_thread::sleep_for (std::chrono::milliseconds (interval));
    }

    static int decodeUInt16 (const Bytes &data, const size_t offset) {
        return (offset + 2 <= data.size ()) ? static_cast<int> (Frame::getUInt16 (&data [offset])) : 0;
    }

public:
    explicit Device (Transport &transport) :
        Device (Config {}, transport) { }
    Device (const Config &config, Transport &transport) :
        _config (config),
        _transport (transport) { }

    std::optional<Bytes> readComfortProfile () {
        return retry (_config.profileRead, [&] () -> std::optional<Bytes> {
            try {
                auto data = _transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile);
                if (data.has_value () && data->size () > ComfortProfile::OFFSET_COOL_SETPOINT)
                    return data;
            } catch (const TransportError &e) {
                _readFailures++;
                DEBUG_PRINTF ("Device::readComfortProfile: failed: %s\n", e.what ());
            }
            return std::nullopt;
        });
    }

    Status getStatus () {
        const auto indoor = readWithFallback (INDOOR_PRIMARY, INDOOR_FALLBACK);
        const auto outdoor = readWithFallback (OUTDOOR_PRIMARY, OUTDOOR_FALLBACK);
        const auto profile = readComfortProfile ();
        const auto heat = profile.has_value () ? std::optional<int> ((*profile) [ComfortProfile::OFFSET_HEAT_SETPOINT]) : std::nullopt;
        const auto cool = profile.has_value () ? std::optional<int> ((*profile) [ComfortProfile::OFFSET_COOL_SETPOINT]) : std::nullopt;
        return {
            .indoorTemp = cache (_indoorTemp, indoor),
            .outdoorTemp = cache (_outdoorTemp, outdoor),
            .heatSetpoint = cache (_heatSetpoint, heat),
            .coolSetpoint = cache (_coolSetpoint, cool)
        };
    }

    EnergyRecords getDailyEnergy () {
        const auto data = readTableQuietly (DeviceAddress::Thermostat, Tables::DailyEnergy);
        EnergyRecords records;
        if (data.has_value ())
            for (size_t offset = 0; offset + EnergyRecord::SIZE <= data->size (); offset += EnergyRecord::SIZE)
                records.push_back ({ .hpHeat = (*data) [offset + 0], .cooling = (*data) [offset + 1], .elecHeat = (*data) [offset + 2], .fan = (*data) [offset + 3], .reheat = (*data) [offset + 4] });
        std::lock_guard<std::mutex> guard (_energyMutex);
        if (! records.empty ())
            _dailyEnergy = records;
        else
            _cachedReadings++;
        return _dailyEnergy;
    }

    std::optional<YearlyEnergy> getYearlyEnergy () {
        const auto data = readTableQuietly (DeviceAddress::Thermostat, Tables::YearlyEnergy);
        std::lock_guard<std::mutex> guard (_energyMutex);
        if (! data.has_value () || data->size () < YearlyEnergy::SIZE_MINIMUM) {
            _cachedReadings++;
            return _yearlyEnergy;
        }
        _yearlyEnergy = YearlyEnergy {
            .current = { .hpHeat = decodeUInt16 (*data, 3), .elecHeat = decodeUInt16 (*data, 7), .cooling = decodeUInt16 (*data, 11) },
            .previous = { .hpHeat = decodeUInt16 (*data, 23), .elecHeat = decodeUInt16 (*data, 27), .cooling = decodeUInt16 (*data, 19), .fan = decodeUInt16 (*data, 35) }
        };
        return _yearlyEnergy;
    }

    // The thermostat rewrites 00400a on its own schedule and repeats each setpoint at several
    // positions, so every round re-reads the profile and patches every byte equal to the old value.
    SetpointResult writeSetpoint (const int target, const size_t byteOffset) {
        const auto profile = readComfortProfile ();
        if (! profile.has_value () || byteOffset >= profile->size () || target < 0 || target > 0xFF) {
            _setpointsUnreadable++;
            DEBUG_PRINTF ("Device::writeSetpoint: could not read current setpoints (offset=%u, target=%d)\n", static_cast<unsigned> (byteOffset), target);
            return { .outcome = SetpointResult::Outcome::ProfileUnreadable, .observed = std::nullopt };
        }

        const uint8_t current = (*profile) [byteOffset], replacement = static_cast<uint8_t> (target);
        if (current == replacement) {
            _setpointsUnchanged++;
            return { .outcome = SetpointResult::Outcome::AlreadyAtTarget, .observed = current };
        }

        DEBUG_PRINTF ("Device::writeSetpoint: byte[%u]: %d -> %d\n", static_cast<unsigned> (byteOffset), current, target);
        int roundsWritten = 0;
        for (int round = 1; round <= _config.writeRounds; round++) {
            try {
                auto data = _transport.readTable (DeviceAddress::Thermostat, Tables::ComfortProfile);
                if (data.has_value ()) {
                    std::replace (data->begin (), data->end (), current, replacement);
                    _transport.writeTable (DeviceAddress::Thermostat, Tables::ComfortProfile, *data);
                    roundsWritten++;
                }
            } catch (const TransportError &e) {
                DEBUG_PRINTF ("Device::writeSetpoint: round %d failed: %s\n", round, e.what ());
            }
            pause (_config.writeInterval);
        }

        const auto verify = readComfortProfile ();
        const std::optional<int> observed = (verify.has_value () && byteOffset < verify->size ()) ? std::optional<int> ((*verify) [byteOffset]) : std::nullopt;
        if (observed.has_value () && *observed == target) {
            _setpointsConfirmed++;
            DEBUG_PRINTF ("Device::writeSetpoint: confirmed %dF (rounds=%d)\n", target, roundsWritten);
            return { .outcome = SetpointResult::Outcome::Confirmed, .observed = observed, .roundsWritten = roundsWritten };
        }
        _setpointsUnconfirmed++;
        if (observed.has_value ())
            DEBUG_PRINTF ("Device::writeSetpoint: verification got %d, expected %d (rounds=%d)\n", *observed, target, roundsWritten);
        else
            DEBUG_PRINTF ("Device::writeSetpoint: verification unreadable, expected %d (rounds=%d)\n", target, roundsWritten);
        return { .outcome = SetpointResult::Outcome::Unconfirmed, .observed = observed, .roundsWritten = roundsWritten };
    }
    bool setSetpoint (const int target, const size_t byteOffset) {
        return writeSetpoint (target, byteOffset).succeeded ();
    }

    bool isOpen () const {
        return _transport.isOpen ();
    }
    // false once the link has failed underneath, even where the failure was absorbed as "no data"
    bool healthy () const {
        return _transport.healthy ();
    }
    Statistics statistics () const {
        return { .readFailures = _readFailures, .fallbacks = _fallbacks, .cachedReadings = _cachedReadings, .setpointsConfirmed = _setpointsConfirmed, .setpointsUnconfirmed = _setpointsUnconfirmed, .setpointsUnchanged = _setpointsUnchanged, .setpointsUnreadable = _setpointsUnreadable };
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace abcd_bus

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
