#pragma once

#include <snmpcore/result.h>
#include <snmpcore/types.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace transport {

/**
 * Parameters for opening a protocol handle to one device
 */
struct HandleOptions {
    std::string host;
    uint16_t port = 161;
    SnmpVersion version = SnmpVersion::V2C;
    Credentials credentials;
    std::chrono::milliseconds timeout{5000};
    uint32_t retries = 3;
};

/**
 * Capability for request/response exchanges with one device.
 *
 * Implementations encode requests, apply the timeout and retry policy they
 * were opened with and decode responses. Errors are reported as transport
 * error codes. close() releases the underlying socket and never fails.
 */
class DeviceHandle {
public:
    virtual ~DeviceHandle() = default;

    /**
     * GET the given OIDs
     */
    virtual Result<VarBindList> get(const std::vector<std::string>& oids) = 0;

    /**
     * GETBULK with the given repetition parameters
     */
    virtual Result<VarBindList> bulk_get(const std::vector<std::string>& oids,
                                         uint32_t non_repeaters,
                                         uint32_t max_repetitions) = 0;

    /**
     * Walk the subtree under root, invoking on_item for each binding.
     * The walk stops after max_items bindings or when on_item returns false.
     * @return Number of bindings delivered
     */
    virtual Result<size_t> walk(const std::string& root,
                                size_t max_items,
                                const std::function<bool(const VarBind&)>& on_item) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/**
 * Factory for device handles; the wire protocol lives behind it
 */
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual Result<std::shared_ptr<DeviceHandle>> open_handle(const HandleOptions& options) = 0;
};

}  // namespace transport
}  // namespace v1
}  // namespace snmpcore
