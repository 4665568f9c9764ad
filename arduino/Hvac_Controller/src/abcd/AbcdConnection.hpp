// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <memory>
#include <type_traits>
#include <utility>

namespace abcd_bus {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class ConnectionManager {
public:
    struct Config {
        Transport::Config transport;
        Device::Config device;
    };
    struct Statistics {
        counter_t connects, discards, retries, failures;
    };
    using ConnectorFactory = std::function<std::unique_ptr<Connector> ()>;

private:
    struct Connection {
        std::unique_ptr<Connector> connector;
        Transport transport;
        Device device;
        Connection (const Config &config, std::unique_ptr<Connector> c) :
            connector (std::move (c)),
            transport (config.transport, *connector),
            device (config.device, transport) { }
        ~Connection () {
            connector->end ();
        }
    };

    const Config _config;
    const ConnectorFactory _factory;
    mutable std::mutex _mutex;
    std::shared_ptr<Connection> _connection;

    Counter _connects, _discards, _retries, _failures;

    std::shared_ptr<Connection> create () {
        auto connector = _factory ();
        if (! connector || ! connector->begin () || ! connector->isOpen ()) {
            _failures++;
            throw ConnectionError ("abcd_bus::ConnectionManager: no serial connector available");
        }
        _connects++;
        DEBUG_PRINTF ("ConnectionManager::create: connected (count=%lu)\n", static_cast<counter_t> (_connects));
        return std::make_shared<Connection> (_config, std::move (connector));
    }

public:
    explicit ConnectionManager (const ConnectorFactory &factory) :
        ConnectionManager (Config {}, factory) { }
    ConnectionManager (const Config &config, const ConnectorFactory &factory) :
        _config (config),
        _factory (factory) { }

    // shared handle to the current device, recreated when absent, closed or faulted
    std::shared_ptr<Device> acquire () {
        std::lock_guard<std::mutex> guard (_mutex);
        if (_connection && ! _connection->transport.healthy ()) {
            DEBUG_PRINTF ("ConnectionManager::acquire: connector %s, reconnecting\n", _connection->connector->isOpen () ? "faulted" : "closed");
            _connection.reset ();
            _discards++;
        }
        if (! _connection)
            _connection = create ();
        return std::shared_ptr<Device> (_connection, &_connection->device);
    }
    void discard (const std::shared_ptr<Device> &device) {
        std::lock_guard<std::mutex> guard (_mutex);
        if (_connection && &_connection->device == device.get ()) {
            _connection.reset ();
            _discards++;
        }
    }
    void close () {
        std::lock_guard<std::mutex> guard (_mutex);
        _connection.reset ();
    }

    // runs fn on a live device; when the transport fails during the call, whether it raised or
    // the device absorbed it, the connection is replaced and fn runs once more
    template <typename F>
    auto withDevice (F &&fn) -> decltype (fn (std::declval<Device &> ())) {
        using Result = decltype (fn (std::declval<Device &> ()));
        auto device = acquire ();
        try {
            if constexpr (std::is_void_v<Result>) {
                fn (*device);
                if (device->healthy ())
                    return;
            } else {
                Result result = fn (*device);
                if (device->healthy ())
                    return result;
            }
            DEBUG_PRINTF ("ConnectionManager::withDevice: transport faulted, reconnecting and retrying\n");
        } catch (const TransportError &e) {
            DEBUG_PRINTF ("ConnectionManager::withDevice: transport failed, reconnecting and retrying: %s\n", e.what ());
        }
        discard (device);
        _retries++;
        device = acquire ();
        return fn (*device);
    }

    bool connected () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _connection && _connection->transport.healthy ();
    }
    std::optional<Transport::Statistics> transportStatistics () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _connection ? std::optional<Transport::Statistics> (_connection->transport.statistics ()) : std::nullopt;
    }
    std::optional<Device::Statistics> deviceStatistics () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _connection ? std::optional<Device::Statistics> (_connection->device.statistics ()) : std::nullopt;
    }
    Statistics statistics () const {
        return { .connects = _connects, .discards = _discards, .retries = _retries, .failures = _failures };
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace abcd_bus

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
