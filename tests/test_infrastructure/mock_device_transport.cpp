#include "mock_device_transport.h"

#include <cstdlib>
#include <sstream>
#include <thread>

namespace snmpcore {
namespace test {

namespace {

std::vector<uint32_t> split_oid(const std::string& oid) {
    std::vector<uint32_t> parts;
    std::istringstream stream(oid);
    std::string item;
    while (std::getline(stream, item, '.')) {
        parts.push_back(static_cast<uint32_t>(std::strtoul(item.c_str(), nullptr, 10)));
    }
    return parts;
}

bool in_subtree(const std::string& oid, const std::string& root) {
    return oid.size() > root.size() && oid.compare(0, root.size(), root) == 0 &&
           oid[root.size()] == '.';
}

}  // namespace

bool OidLess::operator()(const std::string& a, const std::string& b) const {
    return split_oid(a) < split_oid(b);
}

// MockDeviceHandle

MockDeviceHandle::MockDeviceHandle(std::shared_ptr<MockAgentState> agent,
                                   transport::HandleOptions options)
    : agent_(std::move(agent))
    , options_(std::move(options)) {
}

Result<void> MockDeviceHandle::begin_request() {
    if (!open_.load()) {
        return make_error<void>(SNMPError::TRANSPORT_ERROR, "Session is closed");
    }

    std::chrono::milliseconds latency{0};
    {
        std::lock_guard<std::mutex> lock(agent_->mutex);
        latency = agent_->latency;
        if (agent_->fail_next_requests > 0) {
            agent_->fail_next_requests--;
            return make_error<void>(agent_->request_error, agent_->request_error_message);
        }
    }

    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
    return make_result();
}

Result<VarBindList> MockDeviceHandle::get(const std::vector<std::string>& oids) {
    agent_->get_calls++;
    SNMPCORE_RETURN_IF_ERROR(begin_request());

    std::lock_guard<std::mutex> lock(agent_->mutex);
    VarBindList out;
    for (const auto& oid : oids) {
        auto it = agent_->mib.find(oid);
        if (it != agent_->mib.end()) {
            out.push_back(it->second);
        } else {
            VarBind missing(oid, ObjectType::NO_SUCH_OBJECT, std::monostate{});
            missing.error = "noSuchObject";
            out.push_back(std::move(missing));
        }
    }
    return make_result(std::move(out));
}

Result<VarBindList> MockDeviceHandle::bulk_get(const std::vector<std::string>& oids,
                                               uint32_t non_repeaters,
                                               uint32_t max_repetitions) {
    agent_->bulk_calls++;
    SNMPCORE_RETURN_IF_ERROR(begin_request());

    std::lock_guard<std::mutex> lock(agent_->mutex);
    VarBindList out;
    for (size_t i = 0; i < oids.size(); ++i) {
        const uint32_t repetitions = i < non_repeaters ? 1 : max_repetitions;
        auto it = agent_->mib.upper_bound(oids[i]);
        for (uint32_t r = 0; r < repetitions; ++r) {
            if (it == agent_->mib.end()) {
                VarBind end(oids[i], ObjectType::END_OF_MIB_VIEW, std::monostate{});
                end.error = "endOfMibView";
                out.push_back(std::move(end));
                break;
            }
            out.push_back(it->second);
            ++it;
        }
    }
    return make_result(std::move(out));
}

Result<size_t> MockDeviceHandle::walk(const std::string& root,
                                      size_t max_items,
                                      const std::function<bool(const VarBind&)>& on_item) {
    agent_->walk_calls++;
    SNMPCORE_RETURN_IF_ERROR(begin_request());

    VarBindList subtree;
    {
        std::lock_guard<std::mutex> lock(agent_->mutex);
        for (auto it = agent_->mib.upper_bound(root);
             it != agent_->mib.end() && in_subtree(it->first, root) && subtree.size() < max_items;
             ++it) {
            subtree.push_back(it->second);
        }
    }

    size_t delivered = 0;
    for (const auto& vb : subtree) {
        ++delivered;
        if (!on_item(vb)) {
            break;
        }
    }
    return make_result(delivered);
}

void MockDeviceHandle::close() {
    if (open_.exchange(false)) {
        agent_->close_calls++;
    }
}

bool MockDeviceHandle::is_open() const {
    return open_.load();
}

// MockDeviceTransport

MockDeviceTransport::MockDeviceTransport()
    : agent_(std::make_shared<MockAgentState>()) {
}

Result<std::shared_ptr<transport::DeviceHandle>> MockDeviceTransport::open_handle(
    const transport::HandleOptions& options) {
    open_calls_++;

    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = open_latency_.find(options.host);
        if (it != open_latency_.end()) {
            delay = it->second;
        }
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_next_opens_ > 0) {
        fail_next_opens_--;
        return make_error<std::shared_ptr<transport::DeviceHandle>>(
            SNMPError::HANDLE_CREATION_FAILED, open_error_message_);
    }

    auto handle = std::make_shared<MockDeviceHandle>(agent_, options);
    handles_.push_back(handle);
    return make_result(std::shared_ptr<transport::DeviceHandle>(handle));
}

void MockDeviceTransport::set_value(const std::string& oid, ObjectType type, VarBindValue value) {
    std::lock_guard<std::mutex> lock(agent_->mutex);
    agent_->mib[oid] = VarBind(oid, type, std::move(value));
}

void MockDeviceTransport::load_system_group(const std::string& sys_descr) {
    set_value("1.3.6.1.2.1.1.1.0", ObjectType::OCTET_STRING, sys_descr);
    set_value("1.3.6.1.2.1.1.2.0", ObjectType::OBJECT_IDENTIFIER, std::string("1.3.6.1.4.1.8072.3.2.10"));
    set_value("1.3.6.1.2.1.1.3.0", ObjectType::TIME_TICKS, uint64_t{123456});
    set_value("1.3.6.1.2.1.1.4.0", ObjectType::OCTET_STRING, std::string("noc@example.net"));
    set_value("1.3.6.1.2.1.1.5.0", ObjectType::OCTET_STRING, std::string("core-sw-01"));
    set_value("1.3.6.1.2.1.1.6.0", ObjectType::OCTET_STRING, std::string("Rack 4"));
}

void MockDeviceTransport::load_interface_table(size_t interfaces) {
    for (size_t i = 1; i <= interfaces; ++i) {
        const std::string index = std::to_string(i);
        set_value("1.3.6.1.2.1.2.2.1.1." + index, ObjectType::INTEGER, static_cast<int64_t>(i));
        set_value("1.3.6.1.2.1.2.2.1.2." + index, ObjectType::OCTET_STRING, "eth" + index);
        set_value("1.3.6.1.2.1.2.2.1.8." + index, ObjectType::INTEGER, int64_t{1});
        set_value("1.3.6.1.2.1.2.2.1.10." + index, ObjectType::COUNTER32, uint64_t{1000} * i);
    }
}

void MockDeviceTransport::fail_next_opens(size_t count, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_opens_ = count;
    open_error_message_ = message;
}

void MockDeviceTransport::fail_next_requests(size_t count, SNMPError error,
                                             const std::string& message) {
    std::lock_guard<std::mutex> lock(agent_->mutex);
    agent_->fail_next_requests = count;
    agent_->request_error = error;
    agent_->request_error_message = message;
}

void MockDeviceTransport::set_latency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(agent_->mutex);
    agent_->latency = latency;
}

void MockDeviceTransport::set_open_latency(const std::string& host, std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_latency_[host] = latency;
}

std::vector<std::shared_ptr<MockDeviceHandle>> MockDeviceTransport::handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_;
}

std::shared_ptr<MockDeviceHandle> MockDeviceTransport::last_handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.empty() ? nullptr : handles_.back();
}

}  // namespace test
}  // namespace snmpcore
