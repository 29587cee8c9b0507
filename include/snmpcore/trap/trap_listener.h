#pragma once

#include <snmpcore/config.h>
#include <snmpcore/result.h>
#include <snmpcore/types.h>
#include <snmpcore/error_reporter.h>
#include <snmpcore/trap/listener_registry.h>
#include <snmpcore/trap/source_filter.h>
#include <snmpcore/trap/trap_types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace trap {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

enum class ListenerState : uint8_t {
    IDLE,
    BINDING,
    LISTENING,
    STOPPED
};

enum class ListenerMode : uint8_t {
    CONTINUOUS,   // every record goes to the sink as it arrives
    BATCH         // records are kept and returned by collect() after the timeout
};

std::string to_string(ListenerState state);

constexpr std::chrono::milliseconds DEFAULT_BATCH_TIMEOUT{30000};

struct TrapListenerOptions {
    uint32_t port = 162;
    std::string bind_address = "0.0.0.0";
    std::vector<std::string> allowed_sources;
    std::optional<std::string> filter_oid;
    std::optional<std::string> filter_community;
    bool include_raw_payload = false;

    // Listening time measured from start. BATCH defaults to 30s; CONTINUOUS
    // runs until stop() unless a timeout is given.
    std::optional<std::chrono::milliseconds> timeout;
    ListenerMode mode = ListenerMode::CONTINUOUS;
};

struct TrapListenerInfo {
    uint16_t port = 0;
    std::string bind_address;
    ListenerState state = ListenerState::IDLE;
    ListenerMode mode = ListenerMode::CONTINUOUS;
    std::vector<std::string> allowed_sources;
    SystemTimestamp created_at;
    uint64_t trap_count = 0;
    uint64_t datagrams_received = 0;
    uint64_t bytes_received = 0;
    uint64_t dropped_by_source = 0;
    uint64_t dropped_by_content = 0;
    uint64_t parse_errors = 0;
    std::optional<SNMPError> last_error;
};

/**
 * UDP receiver for notification datagrams.
 *
 * start() reserves the port in the registry, binds a non-blocking socket
 * and spawns a receive thread that polls it. Each datagram is checked
 * against the source filter, parsed, turned into a TrapRecord and checked
 * against the content filters before it is emitted. Datagrams rejected by
 * the source filter are dropped silently. Parse failures are counted and
 * the listener keeps running.
 *
 * The listener stops on stop(), when its timeout elapses, or on a fatal
 * socket error. Stopping closes the socket and releases the port.
 *
 * When owned by a shared_ptr, the receive thread holds a reference while
 * the sink runs, so a sink may stop and release its own listener.
 */
class SNMPCORE_API TrapListener : public std::enable_shared_from_this<TrapListener> {
public:
    TrapListener(ListenerRegistry& registry,
                 std::shared_ptr<TrapParser> parser = nullptr,
                 std::shared_ptr<ErrorReporter> reporter = nullptr);
    ~TrapListener();

    TrapListener(const TrapListener&) = delete;
    TrapListener& operator=(const TrapListener&) = delete;

    /**
     * Bind and start receiving
     * @param sink Required in CONTINUOUS mode, ignored in BATCH mode
     */
    Result<void> start(const TrapListenerOptions& options, TrapSink sink = nullptr);

    /**
     * Stop receiving, close the socket and release the port. Idempotent.
     */
    void stop();

    /**
     * BATCH mode: block until the listener stops and return the records
     * in arrival order. Returns nothing in CONTINUOUS mode.
     */
    std::vector<TrapRecord> collect();

    /**
     * Block until the listener stops or the wait elapses
     * @return true if the listener is stopped
     */
    bool wait_until_stopped(std::chrono::milliseconds max_wait);

    TrapListenerInfo get_info() const;

    ListenerState state() const { return state_.load(); }

    uint16_t port() const { return port_; }

private:
    Result<void> open_socket(const std::string& bind_address, uint16_t port);
    void receive_loop();
    void handle_datagram(const Bytes& datagram, const std::string& source_address,
                         uint16_t source_port);
    bool passes_content_filters(const TrapRecord& record) const;
    void emit(TrapRecord record);
    void finish(std::optional<SNMPError> fatal_error);
    void close_socket();

    ListenerRegistry& registry_;
    std::shared_ptr<TrapParser> parser_;
    std::shared_ptr<ErrorReporter> reporter_;

    TrapListenerOptions options_;
    SourceFilter source_filter_;
    TrapSink sink_;
    uint16_t port_ = 0;
    SystemTimestamp created_at_;
    std::optional<Timestamp> deadline_;

    SocketHandle socket_ = INVALID_SOCKET_HANDLE;
    bool port_registered_ = false;
    std::thread receive_thread_;
    std::weak_ptr<TrapListener> self_;
    std::shared_ptr<TrapListener> last_owner_;   // set when the sink released every other owner
    std::atomic<bool> should_stop_{false};
    std::atomic<ListenerState> state_{ListenerState::IDLE};

    mutable std::mutex mutex_;
    std::condition_variable stopped_cv_;
    std::vector<TrapRecord> records_;
    std::optional<SNMPError> last_error_;

    std::atomic<uint64_t> trap_count_{0};
    std::atomic<uint64_t> datagrams_received_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> dropped_by_source_{0};
    std::atomic<uint64_t> dropped_by_content_{0};
    std::atomic<uint64_t> parse_errors_{0};
};

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
