#include <snmpcore/trap/trap_listener.h>
#include <snmpcore/security/input_validator.h>

#include <algorithm>
#include <cstring>

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace snmpcore {
namespace v1 {
namespace trap {

namespace {

constexpr int kPollIntervalMs = 50;

bool is_would_block_error(int error) {
    return error == EWOULDBLOCK || error == EAGAIN;
}

Result<void> set_socket_nonblocking(SocketHandle socket) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1 || fcntl(socket, F_SETFL, flags | O_NONBLOCK) == -1) {
        return make_error<void>(SNMPError::SOCKET_ERROR, "Failed to make trap socket non-blocking");
    }
    return make_result();
}

bool socket_address_to_endpoint(const sockaddr_storage& addr, std::string& address,
                                uint16_t& port) {
    char addr_str[INET6_ADDRSTRLEN];

    if (addr.ss_family == AF_INET) {
        const auto* ipv4 = reinterpret_cast<const sockaddr_in*>(&addr);
        if (!inet_ntop(AF_INET, &(ipv4->sin_addr), addr_str, sizeof(addr_str))) {
            return false;
        }
        port = ntohs(ipv4->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        const auto* ipv6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        if (!inet_ntop(AF_INET6, &(ipv6->sin6_addr), addr_str, sizeof(addr_str))) {
            return false;
        }
        port = ntohs(ipv6->sin6_port);
    } else {
        return false;
    }

    address = addr_str;
    return true;
}

}  // namespace

std::string to_string(ListenerState state) {
    switch (state) {
        case ListenerState::IDLE: return "IDLE";
        case ListenerState::BINDING: return "BINDING";
        case ListenerState::LISTENING: return "LISTENING";
        case ListenerState::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

TrapListener::TrapListener(ListenerRegistry& registry,
                           std::shared_ptr<TrapParser> parser,
                           std::shared_ptr<ErrorReporter> reporter)
    : registry_(registry)
    , parser_(parser ? std::move(parser) : std::make_shared<RawTrapParser>())
    , reporter_(std::move(reporter)) {
}

TrapListener::~TrapListener() {
    stop();
    if (receive_thread_.joinable()) {
        // Released by its own receive thread after the loop returned
        receive_thread_.detach();
    }
}

Result<void> TrapListener::start(const TrapListenerOptions& options, TrapSink sink) {
    auto current = state_.load();
    if (current == ListenerState::BINDING || current == ListenerState::LISTENING) {
        return make_error<void>(SNMPError::STATE_MACHINE_ERROR, "Trap listener is already running");
    }
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }

    auto port_check = security::InputValidator::validate_port(options.port);
    if (!port_check) {
        return make_error<void>(port_check.error(),
                                "Invalid port number: " + std::to_string(options.port) +
                                    ". Must be between 1 and 65535.");
    }
    if (options.mode == ListenerMode::CONTINUOUS && !sink) {
        return make_error<void>(SNMPError::INVALID_PARAMETER,
                                "Continuous trap listener requires a sink");
    }
    if (options.timeout && options.timeout->count() <= 0) {
        return make_error<void>(SNMPError::INVALID_TIMEOUT, "Trap listener timeout must be positive");
    }

    const auto port = static_cast<uint16_t>(options.port);
    SNMPCORE_RETURN_IF_ERROR(registry_.try_register(port));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        options_ = options;
        source_filter_ = SourceFilter(options.allowed_sources);
        sink_ = std::move(sink);
        port_ = port;
        port_registered_ = true;
        created_at_ = std::chrono::system_clock::now();
        records_.clear();
        last_error_.reset();
    }
    trap_count_ = 0;
    datagrams_received_ = 0;
    bytes_received_ = 0;
    dropped_by_source_ = 0;
    dropped_by_content_ = 0;
    parse_errors_ = 0;
    should_stop_ = false;
    state_ = ListenerState::BINDING;

    for (const auto& rule : source_filter_.rejected_rules()) {
        SNMPCORE_REPORT_WARNING(reporter_, SNMPError::INVALID_PARAMETER,
                                "Ignoring malformed allowed source: " + rule);
    }

    auto bind_result = open_socket(options.bind_address, port);
    if (!bind_result) {
        finish(bind_result.error());
        SNMPCORE_REPORT_WARNING(reporter_, bind_result.error(), bind_result.error_message());
        return bind_result;
    }

    auto timeout = options.timeout;
    if (!timeout && options.mode == ListenerMode::BATCH) {
        timeout = DEFAULT_BATCH_TIMEOUT;
    }
    deadline_.reset();
    if (timeout) {
        deadline_ = Clock::now() + *timeout;
    }

    state_ = ListenerState::LISTENING;
    self_ = weak_from_this();
    last_owner_.reset();
    try {
        receive_thread_ = std::thread([this] {
            receive_loop();
            auto owner = std::move(last_owner_);
        });
    } catch (const std::system_error& e) {
        finish(SNMPError::INTERNAL_ERROR);
        return make_error<void>(SNMPError::INTERNAL_ERROR,
                                std::string("Failed to start trap receive thread: ") + e.what());
    }

    SNMPCORE_REPORT_INFO(reporter_, "Trap listener started on " + options.bind_address + ":" +
                                        std::to_string(port));
    return make_result();
}

void TrapListener::stop() {
    should_stop_ = true;
    if (receive_thread_.joinable() && receive_thread_.get_id() != std::this_thread::get_id()) {
        receive_thread_.join();
    }
    finish(std::nullopt);
}

std::vector<TrapRecord> TrapListener::collect() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (options_.mode != ListenerMode::BATCH || state_.load() == ListenerState::IDLE) {
        return {};
    }
    stopped_cv_.wait(lock, [this] { return state_.load() == ListenerState::STOPPED; });

    std::vector<TrapRecord> out;
    out.swap(records_);
    return out;
}

bool TrapListener::wait_until_stopped(std::chrono::milliseconds max_wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    return stopped_cv_.wait_for(lock, max_wait,
                                [this] { return state_.load() == ListenerState::STOPPED; });
}

TrapListenerInfo TrapListener::get_info() const {
    TrapListenerInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        info.port = port_;
        info.bind_address = options_.bind_address;
        info.mode = options_.mode;
        info.allowed_sources = source_filter_.rules();
        info.created_at = created_at_;
        info.last_error = last_error_;
    }
    info.state = state_.load();
    info.trap_count = trap_count_.load();
    info.datagrams_received = datagrams_received_.load();
    info.bytes_received = bytes_received_.load();
    info.dropped_by_source = dropped_by_source_.load();
    info.dropped_by_content = dropped_by_content_.load();
    info.parse_errors = parse_errors_.load();
    return info;
}

Result<void> TrapListener::open_socket(const std::string& bind_address, uint16_t port) {
    sockaddr_storage addr;
    socklen_t addr_len = 0;
    std::memset(&addr, 0, sizeof(addr));

    auto* ipv4 = reinterpret_cast<sockaddr_in*>(&addr);
    auto* ipv6 = reinterpret_cast<sockaddr_in6*>(&addr);
    if (inet_pton(AF_INET, bind_address.c_str(), &(ipv4->sin_addr)) == 1) {
        ipv4->sin_family = AF_INET;
        ipv4->sin_port = htons(port);
        addr_len = sizeof(sockaddr_in);
    } else if (inet_pton(AF_INET6, bind_address.c_str(), &(ipv6->sin6_addr)) == 1) {
        ipv6->sin6_family = AF_INET6;
        ipv6->sin6_port = htons(port);
        addr_len = sizeof(sockaddr_in6);
    } else {
        return make_error<void>(SNMPError::INVALID_HOST, "Invalid bind address: " + bind_address);
    }

    SocketHandle fd = ::socket(addr.ss_family, SOCK_DGRAM, IPPROTO_UDP);
    if (fd == INVALID_SOCKET_HANDLE) {
        return make_error<void>(SNMPError::SOCKET_ERROR,
                                std::string("Failed to create trap socket: ") + std::strerror(errno));
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        ::close(fd);
        return make_error<void>(SNMPError::SOCKET_ERROR, "Failed to set SO_REUSEADDR on trap socket");
    }

    auto nb_result = set_socket_nonblocking(fd);
    if (!nb_result) {
        ::close(fd);
        return nb_result;
    }

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), addr_len) != 0) {
        int error = errno;
        ::close(fd);
        const std::string where = bind_address + ":" + std::to_string(port);
        if (error == EADDRINUSE) {
            return make_error<void>(SNMPError::ADDRESS_IN_USE, "Address already in use: " + where);
        }
        return make_error<void>(SNMPError::SOCKET_ERROR,
                                "Failed to bind trap socket to " + where + ": " + std::strerror(error));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    socket_ = fd;
    return make_result();
}

void TrapListener::receive_loop() {
    Bytes buffer(SNMPCORE_MAX_DATAGRAM_SIZE);

    while (!should_stop_) {
        int wait_ms = kPollIntervalMs;
        if (deadline_) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline_ - Clock::now());
            if (remaining.count() <= 0) {
                finish(std::nullopt);
                return;
            }
            wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), kPollIntervalMs));
        }

        pollfd pfd;
        pfd.fd = socket_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            finish(SNMPError::SOCKET_ERROR);
            return;
        }
        if (ready == 0) {
            continue;
        }
        if (pfd.revents & POLLNVAL) {
            finish(SNMPError::SOCKET_ERROR);
            return;
        }

        // Drain everything queued on the socket
        while (!should_stop_) {
            sockaddr_storage source_addr;
            socklen_t addr_len = sizeof(source_addr);
            ssize_t received = recvfrom(socket_, buffer.data(), buffer.size(), 0,
                                        reinterpret_cast<sockaddr*>(&source_addr), &addr_len);
            if (received < 0) {
                int error = errno;
                if (is_would_block_error(error)) {
                    break;
                }
                if (error == EINTR || error == ECONNREFUSED) {
                    continue;
                }
                finish(SNMPError::RECEIVE_ERROR);
                return;
            }

            std::string source_address;
            uint16_t source_port = 0;
            if (!socket_address_to_endpoint(source_addr, source_address, source_port)) {
                continue;
            }

            handle_datagram(Bytes(buffer.begin(), buffer.begin() + received),
                            source_address, source_port);
        }
    }
}

void TrapListener::handle_datagram(const Bytes& datagram, const std::string& source_address,
                                   uint16_t source_port) {
    datagrams_received_++;
    bytes_received_ += datagram.size();

    if (!source_filter_.allows(source_address)) {
        dropped_by_source_++;
        return;
    }

    Result<ParsedTrap> parsed = make_error<ParsedTrap>(SNMPError::DECODE_ERROR);
    try {
        parsed = parser_->parse(datagram);
    } catch (const std::exception& e) {
        parsed = make_error<ParsedTrap>(SNMPError::DECODE_ERROR, e.what());
    }
    if (!parsed) {
        parse_errors_++;
        SNMPCORE_REPORT_DEBUG(reporter_, "Discarding malformed trap from " + source_address + ": " +
                                             parsed.error_message());
        return;
    }

    TrapRecord record;
    record.trap_id = generate_trap_id();
    record.received_at = std::chrono::system_clock::now();
    record.source_address = source_address;
    record.source_port = source_port;
    record.version = parsed->version;
    record.community = parsed->community.value_or(std::string());
    record.pdu_type_code = static_cast<uint8_t>(parsed->pdu_type);
    record.pdu_type_name = pdu_display_name(parsed->pdu_type);
    record.enterprise = parsed->enterprise;
    record.agent_address = parsed->agent_address;
    record.generic_trap = parsed->generic_trap;
    record.specific_trap = parsed->specific_trap;
    record.uptime = parsed->uptime;
    record.varbinds = std::move(parsed->varbinds);
    record.payload_size = datagram.size();
    if (options_.include_raw_payload) {
        record.raw_payload = base64_encode(datagram);
    }

    if (!passes_content_filters(record)) {
        dropped_by_content_++;
        return;
    }

    emit(std::move(record));
}

bool TrapListener::passes_content_filters(const TrapRecord& record) const {
    if (options_.filter_community && record.community != *options_.filter_community) {
        return false;
    }
    if (options_.filter_oid) {
        const std::string& prefix = *options_.filter_oid;
        return std::any_of(record.varbinds.begin(), record.varbinds.end(),
                           [&prefix](const VarBind& vb) {
                               return vb.oid.compare(0, prefix.size(), prefix) == 0;
                           });
    }
    return true;
}

void TrapListener::emit(TrapRecord record) {
    trap_count_++;

    if (options_.mode == ListenerMode::BATCH) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
        return;
    }

    auto lease = self_.lock();
    try {
        sink_(std::move(record));
    } catch (const std::exception& e) {
        SNMPCORE_REPORT_WARNING(reporter_, SNMPError::INTERNAL_ERROR,
                                std::string("Trap sink failed: ") + e.what());
    }
    if (lease && lease.use_count() == 1) {
        // The sink dropped every other owner; destroy once the loop exits
        should_stop_ = true;
        last_owner_ = std::move(lease);
    }
}

void TrapListener::finish(std::optional<SNMPError> fatal_error) {
    bool was_listening = false;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_listening = state_.load() == ListenerState::LISTENING;
        bool was_running = port_registered_ || socket_ != INVALID_SOCKET_HANDLE;
        close_socket();
        if (port_registered_) {
            registry_.unregister(port_);
            port_registered_ = false;
        }
        if (fatal_error) {
            last_error_ = fatal_error;
        }
        port = port_;
        if (state_.load() != ListenerState::IDLE || was_running) {
            state_ = ListenerState::STOPPED;
        }
    }
    stopped_cv_.notify_all();

    // Bind failures are reported by start()
    if (!was_listening) {
        return;
    }
    if (fatal_error) {
        SNMPCORE_REPORT_WARNING(reporter_, *fatal_error,
                                "Trap listener on port " + std::to_string(port) +
                                    " stopped on socket error");
    } else {
        SNMPCORE_REPORT_INFO(reporter_, "Trap listener on port " + std::to_string(port) +
                                            " stopped after " + std::to_string(trap_count_.load()) +
                                            " traps");
    }
}

void TrapListener::close_socket() {
    if (socket_ != INVALID_SOCKET_HANDLE) {
        ::close(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
