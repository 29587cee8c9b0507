#include <snmpcore/trap/listener_registry.h>

#include <string>

namespace snmpcore {
namespace v1 {
namespace trap {

Result<void> ListenerRegistry::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return make_error<void>(SNMPError::ALREADY_INITIALIZED,
                                "Listener registry is already initialized");
    }
    initialized_ = true;
    return make_result();
}

void ListenerRegistry::teardown() {
    std::lock_guard<std::mutex> lock(mutex_);
    ports_.clear();
    initialized_ = false;
}

bool ListenerRegistry::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

Result<void> ListenerRegistry::try_register(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return make_error<void>(SNMPError::NOT_INITIALIZED,
                                "Listener registry is not initialized");
    }
    if (!ports_.insert(port).second) {
        return make_error<void>(SNMPError::PORT_IN_USE,
                                "Port " + std::to_string(port) +
                                    " is already in use by another trap listener");
    }
    return make_result();
}

void ListenerRegistry::unregister(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    ports_.erase(port);
}

bool ListenerRegistry::is_registered(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_.count(port) > 0;
}

std::vector<uint16_t> ListenerRegistry::active_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<uint16_t>(ports_.begin(), ports_.end());
}

}  // namespace trap
}  // namespace v1
}  // namespace snmpcore
