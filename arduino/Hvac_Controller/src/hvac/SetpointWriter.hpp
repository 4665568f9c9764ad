// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <array>
#include <condition_variable>
#include <deque>
#include <future>

// -----------------------------------------------------------------------------------------------

enum class SetpointKind {
    Heat = 0,
    Cool = 1
};

inline const char *toString (const SetpointKind kind) {
    return kind == SetpointKind::Heat ? "heat" : "cool";
}
inline std::optional<SetpointKind> setpointKindFromString (const std::string &kind) {
    if (kind == "heat")
        return SetpointKind::Heat;
    if (kind == "cool")
        return SetpointKind::Cool;
    return std::nullopt;
}
inline size_t setpointOffset (const SetpointKind kind) {
    return kind == SetpointKind::Heat ? abcd_bus::ComfortProfile::OFFSET_HEAT_SETPOINT : abcd_bus::ComfortProfile::OFFSET_COOL_SETPOINT;
}

struct SetpointRange {
    int minimum, maximum;
    bool contains (const int temperature) const {
        return temperature >= minimum && temperature <= maximum;
    }
    static SetpointRange of (const SetpointKind kind) {
        return kind == SetpointKind::Heat ? SetpointRange { .minimum = 55, .maximum = 85 } : SetpointRange { .minimum = 60, .maximum = 90 };
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class SetpointWriter {
public:
    using WriteFunc = std::function<abcd_bus::SetpointResult (SetpointKind, int)>;
    // result is absent when the write raised rather than resolved
    using CompletionFunc = std::function<void (SetpointKind, int, const std::optional<abcd_bus::SetpointResult> &)>;
    struct Statistics {
        counter_t submitted, succeeded, unsucceeded, failed;
    };

private:
    struct Request {
        SetpointKind kind;
        int target;
        std::promise<abcd_bus::SetpointResult> promise;
    };
    struct Optimistic {
        std::optional<int> value;
        int pending = 0;
    };

    const WriteFunc _write;
    const CompletionFunc _completion;

    mutable std::mutex _mutex;
    std::condition_variable _condition;
    std::deque<Request> _requests;
    std::array<Optimistic, 2> _optimistic;
    bool _stopping = false;
    std::thread _thread;

    Counter _submitted, _succeeded, _unsucceeded, _failed;

    void resolve (Request &request) {
        std::optional<abcd_bus::SetpointResult> result;
        try {
            result = _write (request.kind, request.target);
            (result->succeeded () ? _succeeded : _unsucceeded)++;
            DEBUG_PRINTF ("SetpointWriter::resolve: %s=%d, outcome=%s\n", toString (request.kind), request.target, abcd_bus::SetpointResult::toString (result->outcome));
            request.promise.set_value (*result);
        } catch (const std::exception &e) {
            _failed++;
            DEBUG_PRINTF ("SetpointWriter::resolve: %s=%d, failed: %s\n", toString (request.kind), request.target, e.what ());
            request.promise.set_exception (std::current_exception ());
        }
        {
            std::lock_guard<std::mutex> guard (_mutex);
            auto &optimistic = _optimistic [static_cast<size_t> (request.kind)];
            if (--optimistic.pending == 0)
                optimistic.value.reset ();
        }
        if (_completion)
            exception_catcher ([&] () {
                _completion (request.kind, request.target, result);
            });
    }

    void run () {
        std::unique_lock<std::mutex> lock (_mutex);
        while (true) {
            _condition.wait (lock, [&] () {
                return _stopping || ! _requests.empty ();
            });
            if (_stopping)
                break;
            Request request = std::move (_requests.front ());
            _requests.pop_front ();
            lock.unlock ();
            resolve (request);
            lock.lock ();
        }
        for (auto &request : _requests)
            request.promise.set_exception (std::make_exception_ptr (std::runtime_error ("SetpointWriter: stopped before the request was written")));
        _requests.clear ();
        for (auto &optimistic : _optimistic)
            optimistic = Optimistic {};
    }

public:
    SetpointWriter (const WriteFunc &write, const CompletionFunc &completion = nullptr) :
        _write (write),
        _completion (completion) { }
    ~SetpointWriter () {
        stop ();
    }

    void start () {
        std::lock_guard<std::mutex> guard (_mutex);
        if (_thread.joinable ())
            return;
        _stopping = false;
        _thread = std::thread (&SetpointWriter::run, this);
    }
    // finishes the write in progress, requests still queued resolve with an error
    void stop () {
        {
            std::lock_guard<std::mutex> guard (_mutex);
            _stopping = true;
        }
        _condition.notify_all ();
        if (_thread.joinable ())
            _thread.join ();
    }

    std::shared_future<abcd_bus::SetpointResult> submit (const SetpointKind kind, const int target) {
        std::shared_future<abcd_bus::SetpointResult> future;
        {
            std::lock_guard<std::mutex> guard (_mutex);
            if (_stopping || ! _thread.joinable ())
                throw std::runtime_error ("SetpointWriter: not running");
            _requests.push_back (Request { .kind = kind, .target = target, .promise = {} });
            future = _requests.back ().promise.get_future ().share ();
            auto &optimistic = _optimistic [static_cast<size_t> (kind)];
            optimistic.value = target;
            optimistic.pending++;
        }
        _submitted++;
        DEBUG_PRINTF ("SetpointWriter::submit: %s=%d\n", toString (kind), target);
        _condition.notify_one ();
        return future;
    }

    std::optional<int> optimistic (const SetpointKind kind) const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _optimistic [static_cast<size_t> (kind)].value;
    }
    size_t pending () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _requests.size ();
    }
    Statistics statistics () const {
        return { .submitted = _submitted, .succeeded = _succeeded, .unsucceeded = _unsucceeded, .failed = _failed };
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
