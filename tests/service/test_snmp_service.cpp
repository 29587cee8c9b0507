#include <gtest/gtest.h>
#include <snmpcore/service/snmp_service.h>
#include "../test_infrastructure/mock_device_transport.h"
#include "../test_infrastructure/test_utilities.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace snmpcore::v1;
using namespace snmpcore::v1::service;
using snmpcore::test::MockDeviceTransport;
using snmpcore::test::TrapDatagramBuilder;
using snmpcore::test::UdpTrapSender;
using snmpcore::test::wait_for;
using namespace std::chrono_literals;

namespace {
const std::string kSysDescr = "1.3.6.1.2.1.1.1.0";
const std::string kSysName = "1.3.6.1.2.1.1.5.0";
const std::string kSysUpTime = "1.3.6.1.2.1.1.3.0";
}  // namespace

class SnmpServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<MockDeviceTransport>();
        transport_->load_system_group("Linux core-sw-01 5.15");
        transport_->load_interface_table(4);

        config_.rate_limit.max_requests_per_window = 100;
        config_.cache.cleanup_interval = std::chrono::hours(1);
        config_.sessions.cleanup_interval = std::chrono::hours(1);

        target_.host = "192.0.2.10";
        target_.credentials = Credentials::from_community("n0c-Monitor_42");
    }

    std::unique_ptr<SnmpService> make_service() {
        auto service = std::make_unique<SnmpService>(transport_, config_);
        EXPECT_TRUE(service->init().is_success());
        return service;
    }

    std::shared_ptr<MockDeviceTransport> transport_;
    ServiceConfig config_;
    DeviceTarget target_;
};

TEST_F(SnmpServiceTest, LifecycleGuards) {
    SnmpService service(transport_, config_);
    EXPECT_EQ(service.get(target_, {kSysName}).error(), SNMPError::NOT_INITIALIZED);
    EXPECT_EQ(service.start_trap_listener(trap::TrapListenerOptions{}).error(),
              SNMPError::NOT_INITIALIZED);
    EXPECT_EQ(service.session_pool(), nullptr);

    ASSERT_TRUE(service.init().is_success());
    EXPECT_TRUE(service.is_initialized());
    EXPECT_EQ(service.init().error(), SNMPError::ALREADY_INITIALIZED);
    EXPECT_NE(service.rate_limiter(), nullptr);
    EXPECT_NE(service.response_cache(), nullptr);
    EXPECT_TRUE(service.listener_registry().is_initialized());

    service.teardown();
    EXPECT_FALSE(service.is_initialized());
    EXPECT_EQ(service.get(target_, {kSysName}).error(), SNMPError::NOT_INITIALIZED);

    // A torn down service can be initialized again
    EXPECT_TRUE(service.init().is_success());
}

TEST_F(SnmpServiceTest, InitValidatesConfiguration) {
    SnmpService no_transport(nullptr, config_);
    EXPECT_EQ(no_transport.init().error(), SNMPError::INVALID_CONFIGURATION);

    config_.cache.max_cache_size = 0;
    SnmpService bad_cache(transport_, config_);
    EXPECT_EQ(bad_cache.init().error(), SNMPError::INVALID_CONFIGURATION);
    EXPECT_FALSE(bad_cache.is_initialized());
}

TEST_F(SnmpServiceTest, GetFetchesThenServesFromCache) {
    auto service = make_service();

    auto first = service->get(target_, {kSysDescr, kSysName});
    ASSERT_TRUE(first.is_success()) << first.error_message();
    EXPECT_FALSE(first->cached);
    EXPECT_FALSE(first->session_id.empty());
    EXPECT_EQ(first->operation, QueryOperation::GET);
    ASSERT_EQ(first->varbinds.size(), 2u);
    EXPECT_EQ(std::get<std::string>(first->varbinds[0].value), "Linux core-sw-01 5.15");
    EXPECT_EQ(std::get<std::string>(first->varbinds[1].value), "core-sw-01");
    EXPECT_EQ(transport_->get_count(), 1u);

    auto second = service->get(target_, {kSysName, kSysDescr});
    ASSERT_TRUE(second.is_success());
    EXPECT_TRUE(second->cached);
    EXPECT_TRUE(second->session_id.empty());
    EXPECT_EQ(second->varbinds[0].oid, kSysName);
    EXPECT_EQ(transport_->get_count(), 1u);
}

// Only the OIDs missing from the cache go to the device
TEST_F(SnmpServiceTest, PartialCacheHit) {
    auto service = make_service();
    ASSERT_TRUE(service->get(target_, {kSysName}).is_success());

    auto mixed = service->get(target_, {kSysDescr, kSysName, kSysUpTime});
    ASSERT_TRUE(mixed.is_success());
    EXPECT_FALSE(mixed->cached);
    ASSERT_EQ(mixed->varbinds.size(), 3u);
    EXPECT_EQ(mixed->varbinds[0].oid, kSysDescr);
    EXPECT_EQ(mixed->varbinds[1].oid, kSysName);
    EXPECT_EQ(mixed->varbinds[2].oid, kSysUpTime);
    EXPECT_EQ(transport_->get_count(), 2u);
    EXPECT_EQ(service->response_cache()->size(), 3u);
}

TEST_F(SnmpServiceTest, MissingObjectsAreNotCached) {
    auto service = make_service();
    const std::string missing = "1.3.6.1.2.1.1.99.0";

    auto first = service->get(target_, {missing});
    ASSERT_TRUE(first.is_success());
    ASSERT_EQ(first->varbinds.size(), 1u);
    EXPECT_EQ(first->varbinds[0].type, ObjectType::NO_SUCH_OBJECT);

    ASSERT_TRUE(service->get(target_, {missing}).is_success());
    EXPECT_EQ(transport_->get_count(), 2u);
}

TEST_F(SnmpServiceTest, CacheBypass) {
    auto service = make_service();
    ASSERT_TRUE(service->get(target_, {kSysName}).is_success());
    auto bypass = service->get(target_, {kSysName}, false);
    ASSERT_TRUE(bypass.is_success());
    EXPECT_FALSE(bypass->cached);
    EXPECT_EQ(transport_->get_count(), 2u);

    config_.enable_cache = false;
    auto uncached = make_service();
    ASSERT_TRUE(uncached->get(target_, {kSysName}).is_success());
    EXPECT_EQ(uncached->response_cache()->size(), 0u);
}

TEST_F(SnmpServiceTest, SessionsAreReused) {
    auto service = make_service();
    auto a = service->get(target_, {kSysName});
    auto b = service->get(target_, {kSysDescr});
    ASSERT_TRUE(a.is_success());
    ASSERT_TRUE(b.is_success());
    EXPECT_EQ(a->session_id, b->session_id);
    EXPECT_EQ(transport_->open_count(), 1u);

    auto status = service->session_pool()->get_status();
    EXPECT_EQ(status.size, 1u);
    EXPECT_EQ(status.active_connections, 0u);
    EXPECT_EQ(status.metrics.total_requests, 2u);
}

TEST_F(SnmpServiceTest, BulkGet) {
    auto service = make_service();
    auto bulk = service->bulk_get(target_, {"1.3.6.1.2.1.2.2.1.2"}, 0, 3);
    ASSERT_TRUE(bulk.is_success()) << bulk.error_message();
    EXPECT_EQ(bulk->operation, QueryOperation::BULK_GET);
    ASSERT_EQ(bulk->varbinds.size(), 3u);
    EXPECT_EQ(bulk->varbinds[0].oid, "1.3.6.1.2.1.2.2.1.2.1");
    EXPECT_EQ(bulk->varbinds[2].oid, "1.3.6.1.2.1.2.2.1.2.3");

    auto again = service->bulk_get(target_, {"1.3.6.1.2.1.2.2.1.2"}, 0, 3);
    ASSERT_TRUE(again.is_success());
    EXPECT_TRUE(again->cached);
    EXPECT_EQ(transport_->bulk_count(), 1u);

    // Different repetition parameters are a different query
    ASSERT_TRUE(service->bulk_get(target_, {"1.3.6.1.2.1.2.2.1.2"}, 0, 2).is_success());
    EXPECT_EQ(transport_->bulk_count(), 2u);

    EXPECT_EQ(service->bulk_get(target_, {kSysName}, 2, 3).error(), SNMPError::INVALID_PARAMETER);
    EXPECT_EQ(service->bulk_get(target_, {kSysName}, 0, 0).error(), SNMPError::INVALID_MAX_VARBINDS);
}

TEST_F(SnmpServiceTest, Walk) {
    auto service = make_service();
    auto walk = service->walk(target_, "1.3.6.1.2.1.2.2.1.10");
    ASSERT_TRUE(walk.is_success()) << walk.error_message();
    EXPECT_EQ(walk->operation, QueryOperation::WALK);
    ASSERT_EQ(walk->varbinds.size(), 4u);
    EXPECT_EQ(std::get<uint64_t>(walk->varbinds[3].value), 4000u);

    auto limited = service->walk(target_, "1.3.6.1.2.1.2.2.1", 5);
    ASSERT_TRUE(limited.is_success());
    EXPECT_EQ(limited->varbinds.size(), 5u);

    auto cached = service->walk(target_, "1.3.6.1.2.1.2.2.1.10");
    ASSERT_TRUE(cached.is_success());
    EXPECT_TRUE(cached->cached);
    EXPECT_EQ(transport_->walk_count(), 2u);

    EXPECT_EQ(service->walk(target_, "not.an.oid").error(), SNMPError::INVALID_OID);
}

TEST_F(SnmpServiceTest, ValidationHappensBeforeIo) {
    auto service = make_service();

    DeviceTarget bad = target_;
    bad.host = "file://etc/passwd";
    EXPECT_EQ(service->get(bad, {kSysName}).error(), SNMPError::INVALID_HOST);

    bad = target_;
    bad.host = "127.0.0.1";
    EXPECT_EQ(service->get(bad, {kSysName}).error(), SNMPError::INVALID_HOST);

    bad = target_;
    bad.credentials = Credentials::from_community("bad community");
    EXPECT_EQ(service->get(bad, {kSysName}).error(), SNMPError::INVALID_COMMUNITY);

    bad = target_;
    bad.version = SnmpVersion::V3;
    EXPECT_EQ(service->get(bad, {kSysName}).error(), SNMPError::INVALID_PARAMETER);

    EXPECT_EQ(service->get(target_, {}).error(), SNMPError::INVALID_OID);
    EXPECT_EQ(service->get(target_, {kSysName, kSysName}).error(), SNMPError::INVALID_OID);

    EXPECT_EQ(transport_->open_count(), 0u);
    EXPECT_EQ(service->rate_limiter()->tracked_devices(), 0u);
}

TEST_F(SnmpServiceTest, RateLimitDenial) {
    config_.rate_limit.max_requests_per_window = 2;
    config_.rate_limit.block_duration = std::chrono::milliseconds(30000);
    auto service = make_service();

    ASSERT_TRUE(service->get(target_, {kSysName}, false).is_success());
    ASSERT_TRUE(service->get(target_, {kSysName}, false).is_success());

    auto denied = service->get(target_, {kSysName}, false);
    EXPECT_EQ(denied.error(), SNMPError::RATE_LIMITED);
    EXPECT_EQ(denied.error_message(), "Rate limit exceeded for 192.0.2.10. Retry after 30 seconds");
    EXPECT_EQ(transport_->get_count(), 2u);
}

TEST_F(SnmpServiceTest, TransportErrorsAreWrappedAndRedacted) {
    auto service = make_service();
    transport_->fail_next_requests(1, SNMPError::TIMEOUT, "no response community=n0c-Monitor_42");

    auto result = service->get(target_, {kSysName});
    EXPECT_EQ(result.error(), SNMPError::TIMEOUT);
    EXPECT_EQ(result.error_message().rfind("SNMP GET failed for 192.0.2.10: ", 0), 0u);
    EXPECT_EQ(result.error_message().find("n0c-Monitor_42"), std::string::npos);

    auto status = service->session_pool()->get_status();
    EXPECT_EQ(status.metrics.total_errors, 1u);
    EXPECT_EQ(status.active_connections, 0u);

    // The session survives a failed exchange
    ASSERT_TRUE(service->get(target_, {kSysName}).is_success());
    EXPECT_EQ(transport_->open_count(), 1u);
}

TEST_F(SnmpServiceTest, HandleCreationFailure) {
    auto service = make_service();
    transport_->fail_next_opens(1);

    auto result = service->walk(target_, "1.3.6.1.2.1.1");
    EXPECT_EQ(result.error(), SNMPError::HANDLE_CREATION_FAILED);
    EXPECT_EQ(service->session_pool()->size(), 0u);
}

TEST_F(SnmpServiceTest, ConcurrentQueries) {
    auto service = make_service();
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&service, &failures, t, this]() {
            for (int i = 0; i < 10; ++i) {
                auto oid = "1.3.6.1.2.1.2.2.1.10." + std::to_string(1 + (t + i) % 4);
                if (!service->get(target_, {oid}, false)) {
                    failures++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(transport_->open_count(), 8u);
}

TEST_F(SnmpServiceTest, TrapListenersAreOwnedByService) {
    auto service = make_service();

    std::mutex mutex;
    std::vector<trap::TrapRecord> records;
    trap::TrapListenerOptions options;
    options.port = 36262;
    options.bind_address = "127.0.0.1";

    auto listener = service->start_trap_listener(options, [&](trap::TrapRecord record) {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back(std::move(record));
    });
    ASSERT_TRUE(listener.is_success()) << listener.error_message();

    auto duplicate = service->start_trap_listener(options, [](trap::TrapRecord) {});
    EXPECT_EQ(duplicate.error(), SNMPError::PORT_IN_USE);

    UdpTrapSender sender;
    ASSERT_TRUE(sender.send(TrapDatagramBuilder::v2c_trap("monitor"), 36262));
    ASSERT_TRUE(wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return records.size() == 1;
    }, 300ms));

    auto infos = service->trap_listeners();
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].port, 36262);
    EXPECT_EQ(infos[0].trap_count, 1u);

    EXPECT_TRUE(service->stop_trap_listener(36262));
    EXPECT_FALSE(service->stop_trap_listener(36262));
    EXPECT_EQ((*listener)->state(), trap::ListenerState::STOPPED);

    // Teardown stops whatever is still running
    ASSERT_TRUE(service->start_trap_listener(options, [](trap::TrapRecord) {}).is_success());
    service->teardown();
    EXPECT_FALSE(service->listener_registry().is_registered(36262));
}

TEST_F(SnmpServiceTest, SinkCanStopItsOwnListener) {
    auto service = make_service();

    std::atomic<int> delivered{0};
    std::atomic<bool> stopped{false};
    trap::TrapListenerOptions options;
    options.port = 36263;
    options.bind_address = "127.0.0.1";

    std::weak_ptr<trap::TrapListener> watched;
    {
        auto started = service->start_trap_listener(options, [&](trap::TrapRecord) {
            delivered++;
            stopped = service->stop_trap_listener(36263);
        });
        ASSERT_TRUE(started.is_success()) << started.error_message();
        watched = *started;
    }

    UdpTrapSender sender;
    ASSERT_TRUE(sender.send(TrapDatagramBuilder::v2c_trap("monitor"), 36263));
    ASSERT_TRUE(wait_for([&] { return watched.expired(); }, 500ms));

    EXPECT_EQ(delivered.load(), 1);
    EXPECT_TRUE(stopped.load());
    EXPECT_FALSE(service->listener_registry().is_registered(36263));
    EXPECT_TRUE(service->trap_listeners().empty());

    // The port is free again
    ASSERT_TRUE(service->start_trap_listener(options, [](trap::TrapRecord) {}).is_success());
    EXPECT_TRUE(service->stop_trap_listener(36263));
}

TEST_F(SnmpServiceTest, OperationNames) {
    EXPECT_EQ(to_string(QueryOperation::GET), "get");
    EXPECT_EQ(to_string(QueryOperation::BULK_GET), "getBulk");
    EXPECT_EQ(to_string(QueryOperation::WALK), "walk");
}
