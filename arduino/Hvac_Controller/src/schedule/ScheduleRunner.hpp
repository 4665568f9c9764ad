// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class ScheduleRunner {
public:
    struct Config {
        interval_t interval = 60 * 1000;
        int minimumYear = 2024;
    };
    struct Statistics {
        counter_t ticks, unsynchronised, applies, failures;
    };
    using ScheduleFunc = std::function<Schedule ()>;
    using ClockFunc = std::function<std::optional<struct tm> ()>;
    using ApplyFunc = std::function<bool (SetpointKind, int)>;

    static std::optional<struct tm> localClock () {
        struct tm now;
        const time_t t = time (nullptr);
        if (localtime_r (&t, &now) == nullptr)
            return std::nullopt;
        return now;
    }

private:
    const Config config;
    const ScheduleFunc _schedule;
    const ApplyFunc _apply;
    const ClockFunc _clock;

    mutable std::mutex _mutex;
    std::condition_variable _condition;
    std::optional<std::string> _lastApplied;
    unsigned long _generation = 0;
    bool _stopping = false;
    std::thread _thread;

    Counter _ticks, _unsynchronised, _applies, _failures;

    bool apply (const SetpointKind kind, const int target) {
        try {
            if (_apply (kind, target))
                return true;
            DEBUG_PRINTF ("ScheduleRunner::apply: %s=%d not confirmed\n", toString (kind), target);
        } catch (const std::exception &e) {
            DEBUG_PRINTF ("ScheduleRunner::apply: %s=%d failed: %s\n", toString (kind), target, e.what ());
        }
        _failures++;
        return false;
    }

    void run () {
        std::unique_lock<std::mutex> lock (_mutex);
        while (! _stopping) {
            lock.unlock ();
            exception_catcher ([&] () {
                tick ();
            });
            lock.lock ();
            _condition.wait_for (lock, std::chrono::milliseconds (config.interval), [&] () {
                return _stopping;
            });
        }
    }

public:
    ScheduleRunner (const Config &cfg, const ScheduleFunc &schedule, const ApplyFunc &apply, const ClockFunc &clock = localClock) :
        config (cfg),
        _schedule (schedule),
        _apply (apply),
        _clock (clock) { }
    ~ScheduleRunner () {
        stop ();
    }

    void start () {
        std::lock_guard<std::mutex> guard (_mutex);
        if (_thread.joinable ())
            return;
        _stopping = false;
        _thread = std::thread (&ScheduleRunner::run, this);
    }
    void stop () {
        {
            std::lock_guard<std::mutex> guard (_mutex);
            _stopping = true;
        }
        _condition.notify_all ();
        if (_thread.joinable ())
            _thread.join ();
    }

    // one evaluation, applies the active period when it differs from the last one applied
    void tick () {
        _ticks++;
        const auto now = _clock ();
        if (! now.has_value () || now->tm_year + 1900 < config.minimumYear) {
            _unsynchronised++;
            DEBUG_PRINTF ("ScheduleRunner::tick: clock not synchronised, skipped\n");
            return;
        }
        const Schedule schedule = _schedule ();
        if (schedule.mode != ScheduleMode::Schedule)
            return;
        const auto period = schedule.activePeriod (*now);
        if (! period.has_value ())
            return;
        unsigned long generation;
        {
            std::lock_guard<std::mutex> guard (_mutex);
            if (_lastApplied == period->label)
                return;
            generation = _generation;
        }
        DEBUG_PRINTF ("ScheduleRunner::tick: period changed to '%s' (heat=%d, cool=%d)\n", period->label.c_str (), period->heat, period->cool);
        apply (SetpointKind::Heat, period->heat);
        apply (SetpointKind::Cool, period->cool);
        _applies++;
        std::lock_guard<std::mutex> guard (_mutex);
        if (generation == _generation)
            _lastApplied = period->label;
    }
    void reset () {
        std::lock_guard<std::mutex> guard (_mutex);
        _lastApplied.reset ();
        _generation++;
    }

    std::optional<std::string> lastApplied () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _lastApplied;
    }
    Statistics statistics () const {
        return { .ticks = _ticks, .unsynchronised = _unsynchronised, .applies = _applies, .failures = _failures };
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
