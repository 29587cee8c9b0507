#pragma once

#include <snmpcore/config.h>
#include <snmpcore/result.h>

#include <cstdint>
#include <mutex>
#include <set>
#include <vector>

namespace snmpcore {
namespace v1 {
namespace trap {

/**
 * Ports owned by active trap listeners.
 *
 * One registry is owned by the service and shared by reference with every
 * listener it starts; it enforces at most one listener per port.
 * try_register() is atomic, so two concurrent starts on the same port
 * cannot both succeed. The registry accepts reservations only between
 * init() and teardown().
 */
class SNMPCORE_API ListenerRegistry {
public:
    ListenerRegistry() = default;

    ListenerRegistry(const ListenerRegistry&) = delete;
    ListenerRegistry& operator=(const ListenerRegistry&) = delete;

    Result<void> init();

    /**
     * Drop every reservation and refuse new ones. Listeners still running
     * must be stopped by their owner.
     */
    void teardown();

    bool is_initialized() const;

    /**
     * Reserve a port
     * @return PORT_IN_USE if another listener holds it
     */
    Result<void> try_register(uint16_t port);

    void unregister(uint16_t port);

    bool is_registered(uint16_t port) const;

    std::vector<uint16_t> active_ports() const;

private:
    mutable std::mutex mutex_;
    std::set<uint16_t> ports_;
    bool initialized_ = false;
};

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
