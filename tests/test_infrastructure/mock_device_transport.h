#ifndef SNMPCORE_MOCK_DEVICE_TRANSPORT_H
#define SNMPCORE_MOCK_DEVICE_TRANSPORT_H

#include <snmpcore/transport/device_transport.h>
#include <snmpcore/result.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace snmpcore {
namespace test {

using namespace snmpcore::v1;

/**
 * Orders OIDs by numeric component ("1.3.6.1.2" < "1.3.6.1.10")
 */
struct OidLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

/**
 * Simulated agent data and failure controls shared by a transport and
 * every handle it opens.
 */
struct MockAgentState {
    std::map<std::string, VarBind, OidLess> mib;

    std::chrono::milliseconds latency{0};
    size_t fail_next_requests = 0;
    SNMPError request_error = SNMPError::TIMEOUT;
    std::string request_error_message = "Request timed out";

    std::atomic<uint64_t> get_calls{0};
    std::atomic<uint64_t> bulk_calls{0};
    std::atomic<uint64_t> walk_calls{0};
    std::atomic<uint64_t> close_calls{0};

    std::mutex mutex;
};

/**
 * Mock Device Handle
 *
 * Answers GET, GETBULK and walks from the shared agent MIB with:
 * - Optional latency
 * - Error injection for the next N requests
 * - Call accounting
 */
class MockDeviceHandle : public transport::DeviceHandle {
public:
    MockDeviceHandle(std::shared_ptr<MockAgentState> agent, transport::HandleOptions options);

    Result<VarBindList> get(const std::vector<std::string>& oids) override;
    Result<VarBindList> bulk_get(const std::vector<std::string>& oids,
                                 uint32_t non_repeaters,
                                 uint32_t max_repetitions) override;
    Result<size_t> walk(const std::string& root,
                        size_t max_items,
                        const std::function<bool(const VarBind&)>& on_item) override;
    void close() override;
    bool is_open() const override;

    const transport::HandleOptions& options() const { return options_; }

    // Simulate a dropped socket
    void break_handle() { open_ = false; }

private:
    Result<void> begin_request();

    std::shared_ptr<MockAgentState> agent_;
    transport::HandleOptions options_;
    std::atomic<bool> open_{true};
};

/**
 * Mock Device Transport
 *
 * Opens MockDeviceHandle instances against one simulated agent and
 * records every handle it creates.
 */
class MockDeviceTransport : public transport::DeviceTransport {
public:
    MockDeviceTransport();

    Result<std::shared_ptr<transport::DeviceHandle>> open_handle(
        const transport::HandleOptions& options) override;

    // Agent data
    void set_value(const std::string& oid, ObjectType type, VarBindValue value);
    void load_system_group(const std::string& sys_descr = "Mock agent");
    void load_interface_table(size_t interfaces);

    // Error injection
    void fail_next_opens(size_t count, const std::string& message = "Socket creation failed");
    void fail_next_requests(size_t count, SNMPError error = SNMPError::TIMEOUT,
                            const std::string& message = "Request timed out");
    void set_latency(std::chrono::milliseconds latency);
    // Delay open_handle() for one host, simulating an unreachable device
    void set_open_latency(const std::string& host, std::chrono::milliseconds latency);

    // Accounting
    uint64_t open_count() const { return open_calls_.load(); }
    uint64_t get_count() const { return agent_->get_calls.load(); }
    uint64_t bulk_count() const { return agent_->bulk_calls.load(); }
    uint64_t walk_count() const { return agent_->walk_calls.load(); }
    uint64_t close_count() const { return agent_->close_calls.load(); }

    std::vector<std::shared_ptr<MockDeviceHandle>> handles() const;
    std::shared_ptr<MockDeviceHandle> last_handle() const;

private:
    std::shared_ptr<MockAgentState> agent_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<MockDeviceHandle>> handles_;
    size_t fail_next_opens_ = 0;
    std::string open_error_message_;
    std::map<std::string, std::chrono::milliseconds> open_latency_;
    std::atomic<uint64_t> open_calls_{0};
};

}  // namespace test
}  // namespace snmpcore

#endif // SNMPCORE_MOCK_DEVICE_TRANSPORT_H
