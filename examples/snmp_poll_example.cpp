/**
 * Device Polling Example
 *
 * Polls a simulated device through SnmpService and receives one trap
 * on a loopback listener.
 */

#include <snmpcore/service/snmp_service.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <map>
#include <thread>

using namespace snmpcore::v1;

namespace {

// In-memory agent standing in for a real wire protocol implementation
class SimulatedHandle : public transport::DeviceHandle {
public:
    explicit SimulatedHandle(const std::map<std::string, VarBind>& mib) : mib_(mib) {}

    Result<VarBindList> get(const std::vector<std::string>& oids) override {
        VarBindList out;
        for (const auto& oid : oids) {
            auto it = mib_.find(oid);
            if (it == mib_.end()) {
                VarBind missing(oid, ObjectType::NO_SUCH_OBJECT, std::monostate{});
                missing.error = "noSuchObject";
                out.push_back(std::move(missing));
            } else {
                out.push_back(it->second);
            }
        }
        return make_result(std::move(out));
    }

    Result<VarBindList> bulk_get(const std::vector<std::string>& oids, uint32_t,
                                 uint32_t max_repetitions) override {
        VarBindList out;
        for (const auto& oid : oids) {
            auto it = mib_.upper_bound(oid);
            for (uint32_t i = 0; i < max_repetitions && it != mib_.end(); ++i, ++it) {
                out.push_back(it->second);
            }
        }
        return make_result(std::move(out));
    }

    Result<size_t> walk(const std::string& root, size_t max_items,
                        const std::function<bool(const VarBind&)>& on_item) override {
        size_t delivered = 0;
        for (auto it = mib_.upper_bound(root);
             it != mib_.end() && it->first.compare(0, root.size() + 1, root + ".") == 0 &&
             delivered < max_items;
             ++it) {
            ++delivered;
            if (!on_item(it->second)) {
                break;
            }
        }
        return make_result(delivered);
    }

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

private:
    const std::map<std::string, VarBind>& mib_;
    bool open_ = true;
};

class SimulatedTransport : public transport::DeviceTransport {
public:
    SimulatedTransport() {
        add("1.3.6.1.2.1.1.1.0", ObjectType::OCTET_STRING, std::string("Simulated switch"));
        add("1.3.6.1.2.1.1.3.0", ObjectType::TIME_TICKS, uint64_t{4200});
        add("1.3.6.1.2.1.1.5.0", ObjectType::OCTET_STRING, std::string("lab-sw-01"));
        for (int i = 1; i <= 3; ++i) {
            add("1.3.6.1.2.1.2.2.1.2." + std::to_string(i), ObjectType::OCTET_STRING,
                "port" + std::to_string(i));
        }
    }

    Result<std::shared_ptr<transport::DeviceHandle>> open_handle(
        const transport::HandleOptions& options) override {
        std::cout << "[TRANSPORT] Opening handle to " << options.host << ":" << options.port
                  << " (timeout " << options.timeout.count() << " ms)" << std::endl;
        return make_result(std::shared_ptr<transport::DeviceHandle>(
            std::make_shared<SimulatedHandle>(mib_)));
    }

private:
    void add(const std::string& oid, ObjectType type, VarBindValue value) {
        mib_[oid] = VarBind(oid, type, std::move(value));
    }

    std::map<std::string, VarBind> mib_;
};

void print_response(const std::string& title, const Result<service::QueryResponse>& response) {
    std::cout << "\n=== " << title << " ===" << std::endl;
    if (!response) {
        std::cout << "Failed: " << response.error_message() << std::endl;
        return;
    }
    std::cout << "Operation: " << service::to_string(response->operation)
              << (response->cached ? " (cached)" : "") << std::endl;
    for (const auto& vb : response->varbinds) {
        std::cout << "  " << to_string(vb) << std::endl;
    }
}

void send_test_trap(uint16_t port) {
    // v2c trap, community "public", empty PDU
    const uint8_t datagram[] = {0x30, 0x0D, 0x02, 0x01, 0x01, 0x04, 0x06, 'p', 'u', 'b',
                                'l',  'i',  'c',  0xA7, 0x00};

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        std::cout << "Failed to create sender socket" << std::endl;
        return;
    }
    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(port);
    to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::sendto(fd, datagram, sizeof(datagram), 0, reinterpret_cast<sockaddr*>(&to),
                 sizeof(to)) < 0) {
        std::cout << "Failed to send trap" << std::endl;
    }
    ::close(fd);
}

}  // namespace

int main() {
    std::cout << "snmpcore " << SNMPCORE_VERSION_STRING << " polling example" << std::endl;

    service::ServiceConfig config;
    config.host_policy.allow_loopback = true;
    config.rate_limit.max_requests_per_window = 10;

    auto reporter = std::make_shared<ErrorReporter>();
    service::SnmpService snmp(std::make_shared<SimulatedTransport>(), config, reporter);
    auto init_result = snmp.init();
    if (!init_result) {
        std::cout << "Failed to initialize: " << init_result.error_message() << std::endl;
        return 1;
    }

    service::DeviceTarget device;
    device.host = "127.0.0.1";
    device.credentials = Credentials::from_community("lab_ro");

    print_response("GET", snmp.get(device, {"1.3.6.1.2.1.1.1.0", "1.3.6.1.2.1.1.5.0"}));
    print_response("GET again", snmp.get(device, {"1.3.6.1.2.1.1.5.0"}));
    print_response("GETBULK", snmp.bulk_get(device, {"1.3.6.1.2.1.2.2.1.2"}, 0, 2));
    print_response("WALK", snmp.walk(device, "1.3.6.1.2.1.2.2.1.2"));

    // Trap listener
    trap::TrapListenerOptions options;
    options.port = 10162;
    options.bind_address = "127.0.0.1";
    options.include_raw_payload = true;

    auto listener = snmp.start_trap_listener(options, [](trap::TrapRecord record) {
        std::cout << "[TRAP] " << record.trap_id << " from " << record.source_address << ":"
                  << record.source_port << " " << record.pdu_type_name << " community="
                  << record.community << std::endl;
    });
    if (!listener) {
        std::cout << "Failed to start trap listener: " << listener.error_message() << std::endl;
    } else {
        send_test_trap(10162);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        snmp.stop_trap_listener(10162);
        std::cout << "Traps received: " << (*listener)->get_info().trap_count << std::endl;
    }

    auto cache_stats = snmp.response_cache()->get_statistics();
    std::cout << "\n=== Cache Statistics ===" << std::endl;
    std::cout << "Entries: " << cache_stats.total_entries << std::endl;
    std::cout << "Hits: " << cache_stats.total_hits << std::endl;
    std::cout << "Misses: " << cache_stats.total_misses << std::endl;

    auto pool_status = snmp.session_pool()->get_status();
    std::cout << "\n=== Session Pool ===" << std::endl;
    std::cout << "Sessions: " << pool_status.size << "/" << pool_status.max_size << std::endl;
    std::cout << "Requests: " << pool_status.metrics.total_requests << std::endl;

    snmp.teardown();
    return 0;
}
