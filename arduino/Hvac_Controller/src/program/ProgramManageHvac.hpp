// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class ScheduleStore {
public:
    virtual ~ScheduleStore () = default;
    virtual std::optional<std::string> load () = 0;
    virtual bool save (const std::string &content) = 0;
};

// -----------------------------------------------------------------------------------------------

class ProgramManageHvac : public Component, public Diagnosticable {
public:
    typedef struct {
        abcd_bus::ConnectionManager::Config connection;
        ScheduleRunner::Config scheduler;
    } Config;

    enum class RequestStatus {
        Accepted,
        OutOfRange,
        Unavailable
    };
    struct Request {
        RequestStatus status;
        std::optional<std::shared_future<abcd_bus::SetpointResult>> result;
    };

    class Snapshot : public JsonSerializable {
        template <typename T>
        static void set (T dst, const std::optional<int> &value) {
            if (value.has_value ())
                dst.set (*value);
            else
                dst.set (nullptr);
        }

    public:
        bool available = false;
        abcd_bus::Status status;
        std::optional<int> heatPending, coolPending;
        abcd_bus::EnergyRecords daily;
        std::optional<abcd_bus::YearlyEnergy> yearly;
        std::optional<int> energyYesterday, energyTwoDaysAgo, energyYearToDate;
        ScheduleMode mode = ScheduleMode::Manual;
        std::optional<SchedulePeriod> activePeriod;
        std::optional<std::string> nextTransition;

        void serialize (JsonVariant &obj) const override {
            obj ["available"] = available;
            JsonObject tmp = obj ["tmp"].to<JsonObject> ();
            set (tmp ["indoor"], status.indoorTemp);
            set (tmp ["outdoor"], status.outdoorTemp);
            JsonObject set_ = obj ["set"].to<JsonObject> ();
            set (set_ ["heat"], status.heatSetpoint);
            set (set_ ["cool"], status.coolSetpoint);
            if (heatPending.has_value () || coolPending.has_value ()) {
                JsonObject pending = set_ ["pending"].to<JsonObject> ();
                set (pending ["heat"], heatPending);
                set (pending ["cool"], coolPending);
            }
            JsonObject nrg = obj ["nrg"].to<JsonObject> ();
            set (nrg ["yesterday"], energyYesterday);
            set (nrg ["two_days"], energyTwoDaysAgo);
            set (nrg ["ytd"], energyYearToDate);
            if (yearly.has_value ()) {
                JsonObject year = nrg ["year"].to<JsonObject> ();
                JsonObject current = year ["current"].to<JsonObject> ();
                current ["hp_heat"] = yearly->current.hpHeat;
                current ["elec_heat"] = yearly->current.elecHeat;
                current ["cooling"] = yearly->current.cooling;
                JsonObject previous = year ["previous"].to<JsonObject> ();
                previous ["hp_heat"] = yearly->previous.hpHeat;
                previous ["elec_heat"] = yearly->previous.elecHeat;
                previous ["cooling"] = yearly->previous.cooling;
                previous ["fan"] = yearly->previous.fan;
            }
            JsonObject sch = obj ["sch"].to<JsonObject> ();
            sch ["mode"] = toString (mode);
            if (activePeriod.has_value ()) {
                sch ["period"] = activePeriod->label;
                sch ["heat"] = activePeriod->heat;
                sch ["cool"] = activePeriod->cool;
            }
            if (nextTransition.has_value ())
                sch ["next"] = *nextTransition;
        }
    };

private:
    const Config &config;
    ScheduleStore &_store;
    const ScheduleRunner::ClockFunc _clock;

    mutable std::mutex _scheduleMutex;
    Schedule _schedule;

    abcd_bus::ConnectionManager _connection;
    SetpointWriter _writer;
    ScheduleRunner _scheduler;

    std::atomic<bool> _enabled { false }, _refreshRequested { false };
    Counter _requestsAccepted, _requestsRejected, _snapshots, _snapshotFailures, _persistFailures;

    bool persist (const Schedule &schedule) {
        if (_store.save (ScheduleJson::toString (schedule)))
            return true;
        _persistFailures++;
        DEBUG_PRINTF ("ProgramManageHvac::persist: schedule store failed\n");
        return false;
    }
    bool applyScheduled (const SetpointKind kind, const int target) {
        return _connection.withDevice ([&] (abcd_bus::Device &device) {
            return device.setSetpoint (target, setpointOffset (kind));
        });
    }
    void completed (const SetpointKind kind, const int target, const std::optional<abcd_bus::SetpointResult> &result) {
        DEBUG_PRINTF ("ProgramManageHvac::completed: %s=%d, %s\n", toString (kind), target, result.has_value () ? abcd_bus::SetpointResult::toString (result->outcome) : "failed");
        _refreshRequested = true;
        _connection.withDevice ([&] (abcd_bus::Device &device) {
            device.getStatus ();
        });
    }

public:
    ProgramManageHvac (const Config &cfg, const abcd_bus::ConnectionManager::ConnectorFactory &factory, ScheduleStore &store, const ScheduleRunner::ClockFunc &clock = ScheduleRunner::localClock) :
        config (cfg),
        _store (store),
        _clock (clock),
        _connection (config.connection, factory),
        _writer ([&] (const SetpointKind kind, const int target) {
            return _connection.withDevice ([&] (abcd_bus::Device &device) {
                return device.writeSetpoint (target, setpointOffset (kind));
            });
        },
                 [&] (const SetpointKind kind, const int target, const std::optional<abcd_bus::SetpointResult> &result) {
                     completed (kind, target, result);
                 }),
        _scheduler (config.scheduler, [&] () { return schedule (); }, [&] (const SetpointKind kind, const int target) { return applyScheduled (kind, target); }, clock) { }
    ~ProgramManageHvac () {
        end ();
    }

    void begin () override {
        const auto content = _store.load ();
        {
            std::lock_guard<std::mutex> guard (_scheduleMutex);
            _schedule = content.has_value () ? ScheduleJson::fromString (*content) : ScheduleJson::defaults ();
            DEBUG_PRINTF ("ProgramManageHvac::begin: schedule %s, mode=%s, weekday=%u, weekend=%u\n", content.has_value () ? "loaded" : "defaulted", toString (_schedule.mode), static_cast<unsigned> (_schedule.weekday.size ()), static_cast<unsigned> (_schedule.weekend.size ()));
        }
        try {
            _connection.acquire ();
        } catch (const abcd_bus::ConnectionError &e) {
            DEBUG_PRINTF ("ProgramManageHvac::begin: %s, service disabled\n", e.what ());
            return;
        }
        _enabled = true;
        _writer.start ();
        _scheduler.start ();
    }
    void end () override {
        _scheduler.stop ();
        _writer.stop ();
        _connection.close ();
        _enabled = false;
    }

    Request requestSetpoint (const SetpointKind kind, const int temperature) {
        const SetpointRange range = SetpointRange::of (kind);
        if (! range.contains (temperature)) {
            _requestsRejected++;
            DEBUG_PRINTF ("ProgramManageHvac::requestSetpoint: %s=%d out of range %d-%d\n", toString (kind), temperature, range.minimum, range.maximum);
            return { .status = RequestStatus::OutOfRange, .result = std::nullopt };
        }
        if (! _enabled) {
            _requestsRejected++;
            DEBUG_PRINTF ("ProgramManageHvac::requestSetpoint: %s=%d, service disabled\n", toString (kind), temperature);
            return { .status = RequestStatus::Unavailable, .result = std::nullopt };
        }
        {
            std::lock_guard<std::mutex> guard (_scheduleMutex);
            if (_schedule.mode == ScheduleMode::Schedule) {
                DEBUG_PRINTF ("ProgramManageHvac::requestSetpoint: manual request, leaving schedule mode\n");
                _schedule.mode = ScheduleMode::Manual;
                persist (_schedule);
            }
        }
        _scheduler.reset ();
        _requestsAccepted++;
        return { .status = RequestStatus::Accepted, .result = _writer.submit (kind, temperature) };
    }

    bool setMode (const ScheduleMode mode) {
        bool persisted;
        {
            std::lock_guard<std::mutex> guard (_scheduleMutex);
            _schedule.mode = mode;
            persisted = persist (_schedule);
        }
        DEBUG_PRINTF ("ProgramManageHvac::setMode: mode=%s\n", toString (mode));
        if (mode == ScheduleMode::Schedule)
            _scheduler.reset ();
        return persisted;
    }
    bool setSchedule (const std::optional<SchedulePeriods> &weekday, const std::optional<SchedulePeriods> &weekend) {
        std::lock_guard<std::mutex> guard (_scheduleMutex);
        if (weekday.has_value ())
            _schedule.weekday = *weekday;
        if (weekend.has_value ())
            _schedule.weekend = *weekend;
        DEBUG_PRINTF ("ProgramManageHvac::setSchedule: weekday=%u, weekend=%u\n", static_cast<unsigned> (_schedule.weekday.size ()), static_cast<unsigned> (_schedule.weekend.size ()));
        return persist (_schedule);
    }
    Schedule schedule () const {
        std::lock_guard<std::mutex> guard (_scheduleMutex);
        return _schedule;
    }

    Snapshot snapshot () {
        Snapshot snapshot;
        _snapshots++;
        if (_enabled) {
            try {
                _connection.withDevice ([&] (abcd_bus::Device &device) {
                    snapshot.status = device.getStatus ();
                    snapshot.daily = device.getDailyEnergy ();
                    snapshot.yearly = device.getYearlyEnergy ();
                });
                snapshot.available = true;
            } catch (const std::exception &e) {
                _snapshotFailures++;
                DEBUG_PRINTF ("ProgramManageHvac::snapshot: bus read failed: %s\n", e.what ());
            }
        }
        if ((snapshot.heatPending = _writer.optimistic (SetpointKind::Heat)).has_value ())
            snapshot.status.heatSetpoint = snapshot.heatPending;
        if ((snapshot.coolPending = _writer.optimistic (SetpointKind::Cool)).has_value ())
            snapshot.status.coolSetpoint = snapshot.coolPending;
        if (snapshot.daily.size () > 0)
            snapshot.energyYesterday = snapshot.daily [0].total ();
        if (snapshot.daily.size () > 1)
            snapshot.energyTwoDaysAgo = snapshot.daily [1].total ();
        if (snapshot.yearly.has_value ())
            snapshot.energyYearToDate = snapshot.yearly->currentTotal ();
        const Schedule current = schedule ();
        snapshot.mode = current.mode;
        const auto now = _clock ();
        if (now.has_value ()) {
            snapshot.activePeriod = current.activePeriod (*now);
            const auto next = current.nextTransition (*now);
            if (next.has_value ())
                snapshot.nextTransition = next->describe ();
        }
        return snapshot;
    }

    bool enabled () const {
        return _enabled;
    }
    // set once a setpoint write has resolved, cleared by the read
    bool refreshRequested () {
        return _refreshRequested.exchange (false);
    }

protected:
    void collectDiagnostics (JsonVariant &obj) const override {
        JsonObject hvac = obj ["hvac"].to<JsonObject> ();
        hvac ["enabled"] = _enabled.load ();
        hvac ["connected"] = _connection.connected ();
        const auto connection = _connection.statistics ();
        JsonObject con = hvac ["connection"].to<JsonObject> ();
        con ["connects"] = connection.connects;
        con ["discards"] = connection.discards;
        con ["retries"] = connection.retries;
        con ["failures"] = connection.failures;
        const auto transport = _connection.transportStatistics ();
        if (transport.has_value ()) {
            JsonObject bus = hvac ["bus"].to<JsonObject> ();
            bus ["reads"] = transport->reads;
            bus ["responses"] = transport->responses;
            bus ["timeouts"] = transport->timeouts;
            bus ["writes"] = transport->writes;
            bus ["failures"] = transport->failures;
        }
        const auto device = _connection.deviceStatistics ();
        if (device.has_value ()) {
            JsonObject dev = hvac ["device"].to<JsonObject> ();
            dev ["readFailures"] = device->readFailures;
            dev ["fallbacks"] = device->fallbacks;
            dev ["cached"] = device->cachedReadings;
            JsonObject setpoints = dev ["setpoints"].to<JsonObject> ();
            setpoints ["confirmed"] = device->setpointsConfirmed;
            setpoints ["unconfirmed"] = device->setpointsUnconfirmed;
            setpoints ["unchanged"] = device->setpointsUnchanged;
            setpoints ["unreadable"] = device->setpointsUnreadable;
        }
        const auto writer = _writer.statistics ();
        JsonObject wri = hvac ["writer"].to<JsonObject> ();
        wri ["submitted"] = writer.submitted;
        wri ["succeeded"] = writer.succeeded;
        wri ["unsucceeded"] = writer.unsucceeded;
        wri ["failed"] = writer.failed;
        wri ["pending"] = _writer.pending ();
        const auto scheduler = _scheduler.statistics ();
        JsonObject sch = hvac ["scheduler"].to<JsonObject> ();
        sch ["ticks"] = scheduler.ticks;
        sch ["unsynchronised"] = scheduler.unsynchronised;
        sch ["applies"] = scheduler.applies;
        sch ["failures"] = scheduler.failures;
        const auto applied = _scheduler.lastApplied ();
        if (applied.has_value ())
            sch ["applied"] = *applied;
        JsonObject req = hvac ["requests"].to<JsonObject> ();
        req ["accepted"] = static_cast<counter_t> (_requestsAccepted);
        req ["rejected"] = static_cast<counter_t> (_requestsRejected);
        hvac ["snapshots"] = static_cast<counter_t> (_snapshots);
        hvac ["snapshotFailures"] = static_cast<counter_t> (_snapshotFailures);
        hvac ["persistFailures"] = static_cast<counter_t> (_persistFailures);
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
