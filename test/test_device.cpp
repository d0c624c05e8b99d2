#include "BLEDevice.h"
#include "platforms/SimulatedTransport.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace GattLink::BLE;
using namespace GattLink::BLE::Test;

namespace {

class FixedDescriptorResolver : public IDescriptorResolver {
public:
    explicit FixedDescriptorResolver(uint16_t handle) : _handle(handle) {}
    uint16_t configHandleFor(const Characteristic&) const override { return _handle; }
    const char* name() const override { return "fixed"; }

private:
    uint16_t _handle;
};

// Discovery parks until release() is called
class BlockingDiscoveryTransport : public SimulatedTransport {
public:
    OperationResult discoverServices(ServiceCatalog& catalog) override {
        {
            std::unique_lock<std::mutex> lock(_gate_mutex);
            _entered = true;
            _gate.notify_all();
            _gate.wait(lock, [this]() { return _released; });
        }
        return SimulatedTransport::discoverServices(catalog);
    }

    void waitUntilEntered() {
        std::unique_lock<std::mutex> lock(_gate_mutex);
        _gate.wait(lock, [this]() { return _entered; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(_gate_mutex);
        _released = true;
        _gate.notify_all();
    }

private:
    std::mutex _gate_mutex;
    std::condition_variable _gate;
    bool _entered = false;
    bool _released = false;
};

} // namespace

class BLEDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<SimulatedTransport>("test");
        transport->setServiceTable(heartRateTable());
    }

    std::shared_ptr<BLEDevice> open(const DeviceConfig& config = DeviceConfig()) {
        return std::make_shared<BLEDevice>("AA:BB:CC:DD:EE:FF", transport, config);
    }

    std::shared_ptr<SimulatedTransport> transport;
};

TEST_F(BLEDeviceTest, HeartRateSubscriptionLifecycle) {
    std::shared_ptr<BLEDevice> device = open();

    int calls = 0;
    NotificationCallback cb = [&](uint16_t, const Bytes&) { calls++; };

    EXPECT_EQ(10, device->getHandle("2a37", "180d"));

    device->subscribe("2a37", "180d", cb, false);
    std::vector<SimulatedTransport::WriteRecord> writes = transport->getWritesTo(11);
    ASSERT_EQ(1u, writes.size());
    EXPECT_TRUE(sameBytes(bytesOf({0x01, 0x00}), writes[0].data));

    device->subscribe("2a37", "180d", cb, false);
    EXPECT_EQ(1u, transport->getWritesTo(11).size());

    device->receiveNotification(10, bytesOf({0x00, 0x40}));
    EXPECT_EQ(2, calls);

    device->unsubscribe("2a37", "180d");
    writes = transport->getWritesTo(11);
    ASSERT_EQ(2u, writes.size());
    EXPECT_TRUE(sameBytes(bytesOf({0x00, 0x00}), writes[1].data));

    device->receiveNotification(10, bytesOf({0x00, 0x41}));
    EXPECT_EQ(2, calls);
    EXPECT_FALSE(device->isSubscribed("2a37", "180d"));
}

TEST_F(BLEDeviceTest, PeripheralNotificationsReachCallback) {
    std::shared_ptr<BLEDevice> device = open();

    std::vector<uint16_t> handles;
    CallbackHandle cb = device->subscribe("2a37", "180d", [&](uint16_t handle, const Bytes&) {
        handles.push_back(handle);
    });
    ASSERT_TRUE(static_cast<bool>(cb));

    EXPECT_TRUE(transport->notifyValue(10, bytesOf({0x00, 0x50})));
    ASSERT_EQ(1u, handles.size());
    EXPECT_EQ(10, handles[0]);

    device->unsubscribe("2a37", "180d");
    EXPECT_FALSE(transport->notifyValue(10, bytesOf({0x00, 0x51})));
    EXPECT_EQ(1u, handles.size());
}

TEST_F(BLEDeviceTest, SameCallbackHandleRegisteredOnce) {
    std::shared_ptr<BLEDevice> device = open();

    int calls = 0;
    CallbackHandle cb = makeCallbackHandle([&](uint16_t, const Bytes&) { calls++; });
    device->subscribe("2a37", "180d", cb);
    device->subscribe("2a37", "180d", cb);

    device->receiveNotification(10, bytesOf({0x00}));
    EXPECT_EQ(1, calls);
}

TEST_F(BLEDeviceTest, SubscribeWithoutCallbackConfiguresOnly) {
    std::shared_ptr<BLEDevice> device = open();

    device->subscribe("2a19", "180f");
    EXPECT_TRUE(device->isSubscribed("2a19", "180f"));
    EXPECT_EQ(1u, transport->getWritesTo(21).size());

    device->receiveNotification(20, bytesOf({0x55}));
    EXPECT_EQ(1.0f, device->getStats()["notifications_dropped"]);
}

TEST_F(BLEDeviceTest, IndicationSubscription) {
    std::shared_ptr<BLEDevice> device = open();

    device->subscribe("2a37", "180d", CallbackHandle(), true);

    std::vector<SimulatedTransport::WriteRecord> writes = transport->getWritesTo(11);
    ASSERT_EQ(1u, writes.size());
    EXPECT_TRUE(sameBytes(bytesOf({0x02, 0x00}), writes[0].data));
}

TEST_F(BLEDeviceTest, UnsubscribeWhenNotSubscribedIsNoOp) {
    std::shared_ptr<BLEDevice> device = open();

    EXPECT_NO_THROW(device->unsubscribe("2a37", "180d"));
    EXPECT_TRUE(transport->getWrites().empty());
}

TEST_F(BLEDeviceTest, DiscoveredDescriptorStrategy) {
    ServiceCatalog table;
    Service* svc = table.addService(uuid("180d"), 1, 20);
    svc->addCharacteristic(Characteristic(uuid("2a37"), 3, 5));
    transport->setServiceTable(table);

    DeviceConfig adjacent;
    std::shared_ptr<BLEDevice> first = open(adjacent);
    first->subscribe("2a37", "180d");
    EXPECT_EQ(1u, transport->getWritesTo(4).size());
    first.reset();

    transport->clearWrites();

    DeviceConfig discovered;
    discovered.descriptor_strategy = DescriptorStrategy::DISCOVERED;
    std::shared_ptr<BLEDevice> second = open(discovered);
    second->subscribe("2a37", "180d");
    EXPECT_EQ(1u, transport->getWritesTo(5).size());
    EXPECT_TRUE(transport->getWritesTo(4).empty());
}

TEST_F(BLEDeviceTest, CustomDescriptorResolver) {
    std::shared_ptr<BLEDevice> device = open();
    device->setDescriptorResolver(std::make_shared<FixedDescriptorResolver>(0x0100));
    device->subscribe("2a37", "180d");

    EXPECT_EQ(1u, transport->getWritesTo(0x0100).size());
}

TEST_F(BLEDeviceTest, UnsubscribeClearsDescriptorEnabledEarlier) {
    std::shared_ptr<BLEDevice> device = open();
    device->subscribe("2a37", "180d");
    ASSERT_EQ(1u, transport->getWritesTo(11).size());

    device->setDescriptorResolver(std::make_shared<FixedDescriptorResolver>(0x0100));
    device->unsubscribe("2a37", "180d");

    std::vector<SimulatedTransport::WriteRecord> writes = transport->getWritesTo(11);
    ASSERT_EQ(2u, writes.size());
    EXPECT_TRUE(sameBytes(bytesOf({0x00, 0x00}), writes[1].data));
    EXPECT_TRUE(transport->getWritesTo(0x0100).empty());
    EXPECT_FALSE(transport->notifyValue(10, bytesOf({0x01})));
}

TEST_F(BLEDeviceTest, CharWriteAndRead) {
    std::shared_ptr<BLEDevice> device = open();

    device->charWrite("2a38", bytesOf({0x02}), "180d", true);

    std::vector<SimulatedTransport::WriteRecord> writes = transport->getWritesTo(13);
    ASSERT_EQ(1u, writes.size());
    EXPECT_TRUE(writes[0].with_response);
    EXPECT_TRUE(sameBytes(bytesOf({0x02}), device->charRead("2a38", "180d")));

    transport->setAttributeValue(20, bytesOf({87}));
    EXPECT_TRUE(sameBytes(bytesOf({87}), device->charRead("2a19")));

    device->charWriteHandle(13, bytesOf({0x03}));
    EXPECT_TRUE(sameBytes(bytesOf({0x03}), device->charReadHandle(13)));
    EXPECT_FALSE(transport->getWritesTo(13).back().with_response);
}

TEST_F(BLEDeviceTest, LookupErrors) {
    std::shared_ptr<BLEDevice> device = open();

    EXPECT_THROW(device->getHandle("zz", "180d"), InvalidUUIDError);
    EXPECT_THROW(device->getHandle("2a37", "not a uuid"), InvalidUUIDError);
    EXPECT_EQ(0u, transport->getDiscoveryCount());

    EXPECT_THROW(device->charWrite("2a37", bytesOf({1}), "180f"), CharacteristicNotFoundError);
    EXPECT_THROW(device->subscribe("2a99"), CharacteristicNotFoundError);

    // Every miss costs exactly one discovery
    EXPECT_EQ(2u, transport->getDiscoveryCount());
    EXPECT_TRUE(transport->getWrites().empty());
}

TEST_F(BLEDeviceTest, AmbiguousUnscopedLookup) {
    transport->setServiceTable(duplicatedCharacteristicTable());
    std::shared_ptr<BLEDevice> device = open();

    EXPECT_THROW(device->getHandle("2a19"), AmbiguousCharacteristicError);
    EXPECT_EQ(40, device->getHandle("2a19", "1234"));

    device->setAmbiguityPolicy(AmbiguityPolicy::FIRST_MATCH);
    EXPECT_EQ(20, device->getHandle("2a19"));
}

TEST_F(BLEDeviceTest, TransportFailuresRaiseTransportError) {
    std::shared_ptr<BLEDevice> device = open();
    device->getHandle("2a38", "180d");

    transport->failNextWrite(OperationResult::INSUFFICIENT_ENC);
    try {
        device->charWrite("2a38", bytesOf({1}), "180d");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(OperationResult::INSUFFICIENT_ENC, e.result());
        EXPECT_EQ(13, e.handle());
    }

    EXPECT_THROW(device->charReadHandle(0x0999), TransportError);

    transport->failNextWrite(OperationResult::BUSY);
    EXPECT_THROW(device->subscribe("2a37", "180d"), TransportError);
    EXPECT_FALSE(device->isSubscribed("2a37", "180d"));
}

TEST_F(BLEDeviceTest, BondAndRSSI) {
    transport->setRSSI(-71);
    std::shared_ptr<BLEDevice> device = open();

    EXPECT_EQ("AA:BB:CC:DD:EE:FF", device->getAddress());
    EXPECT_EQ("BLEDevice[AA:BB:CC:DD:EE:FF/test]", device->toString());
    EXPECT_TRUE(device->isConnected());

    EXPECT_FALSE(transport->isBonded());
    device->bond(true);
    EXPECT_TRUE(transport->isBonded());
    EXPECT_EQ(-71, device->getRSSI());
}

TEST_F(BLEDeviceTest, DisconnectDropsSessionState) {
    std::shared_ptr<BLEDevice> device = open();
    device->subscribe("2a37", "180d");
    ASSERT_FALSE(device->getServices()->empty());

    device->disconnect();

    EXPECT_FALSE(device->isConnected());
    EXPECT_TRUE(device->getServices()->empty());
    EXPECT_EQ(0.0f, device->getStats()["subscriptions"]);
    EXPECT_THROW(device->getRSSI(), TransportError);
    EXPECT_THROW(device->bond(), TransportError);
    EXPECT_THROW(device->getHandle("2a37", "180d"), TransportError);
}

TEST_F(BLEDeviceTest, ExplicitDiscovery) {
    std::shared_ptr<BLEDevice> device = open();
    EXPECT_TRUE(device->getServices()->empty());

    ServiceCatalog::Ptr catalog = device->discoverServices();
    EXPECT_EQ(2u, catalog->size());
    EXPECT_EQ(catalog, device->getServices());

    Characteristic chr = device->getCharacteristic("2a37", "180d");
    EXPECT_EQ(11, chr.cccd_handle);
    EXPECT_EQ(1u, transport->getDiscoveryCount());
}

TEST_F(BLEDeviceTest, Statistics) {
    std::shared_ptr<BLEDevice> device = open();

    std::map<std::string, float> stats = device->getStats();
    EXPECT_EQ(-1.0f, stats["notification_age"]);

    device->subscribe("2a37", "180d", [](uint16_t, const Bytes&) {
        throw std::runtime_error("boom");
    });
    device->receiveNotification(10, bytesOf({0x00}));
    device->receiveNotification(30, bytesOf({0x00}));

    stats = device->getStats();
    EXPECT_EQ(1.0f, stats["catalog_refreshes"]);
    EXPECT_EQ(1.0f, stats["config_writes"]);
    EXPECT_EQ(1.0f, stats["subscriptions"]);
    EXPECT_EQ(2.0f, stats["notifications_received"]);
    EXPECT_EQ(1.0f, stats["notifications_dispatched"]);
    EXPECT_EQ(1.0f, stats["notifications_dropped"]);
    EXPECT_EQ(1.0f, stats["callback_failures"]);
}

TEST_F(BLEDeviceTest, CallbackMayCallBackIntoSession) {
    std::shared_ptr<BLEDevice> device = open();

    int calls = 0;
    device->subscribe("2a37", "180d", [&](uint16_t, const Bytes& value) {
        calls++;
        device->charWrite("2a38", value, "180d");
        device->unsubscribe("2a37", "180d");
    });

    transport->notifyValue(10, bytesOf({0x07}));
    EXPECT_EQ(1, calls);
    EXPECT_TRUE(sameBytes(bytesOf({0x07}), transport->getAttributeValue(13)));
    EXPECT_FALSE(device->isSubscribed("2a37", "180d"));

    EXPECT_FALSE(transport->notifyValue(10, bytesOf({0x08})));
    EXPECT_EQ(1, calls);
}

TEST_F(BLEDeviceTest, ConcurrentSubscribeWritesOnce) {
    std::shared_ptr<BLEDevice> device = open();
    device->discoverServices();

    std::atomic<int> calls(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.push_back(std::thread([&]() {
            device->subscribe("2a37", "180d", [&](uint16_t, const Bytes&) { calls++; });
        }));
    }
    for (std::thread& t : threads) {
        t.join();
    }

    EXPECT_EQ(1u, transport->getWritesTo(11).size());

    device->receiveNotification(10, bytesOf({0x01}));
    EXPECT_EQ(8, calls.load());
}

TEST_F(BLEDeviceTest, NotificationsDuringSubscribeChurn) {
    std::shared_ptr<BLEDevice> device = open();
    device->discoverServices();

    std::atomic<bool> running(true);
    std::atomic<int> calls(0);

    std::thread notifier([&]() {
        while (running.load()) {
            transport->injectNotification(10, bytesOf({0x01}));
        }
    });

    for (int i = 0; i < 50; i++) {
        device->subscribe("2a37", "180d", [&](uint16_t, const Bytes&) { calls++; });
        device->unsubscribe("2a37", "180d");
    }

    running = false;
    notifier.join();

    EXPECT_FALSE(device->isSubscribed("2a37", "180d"));
    EXPECT_EQ(100u, transport->getWritesTo(11).size());
}

TEST_F(BLEDeviceTest, DestructorDetachesFromTransport) {
    int calls = 0;
    {
        std::shared_ptr<BLEDevice> device = open();
        device->subscribe("2a37", "180d", [&](uint16_t, const Bytes&) { calls++; });
    }

    EXPECT_NO_THROW(transport->injectNotification(10, bytesOf({0x01})));
    EXPECT_EQ(0, calls);
}

TEST_F(BLEDeviceTest, DestructionRacesWithDelivery) {
    std::atomic<bool> running(true);
    std::atomic<int> calls(0);

    std::thread notifier([&]() {
        while (running.load()) {
            transport->injectNotification(10, bytesOf({0x01}));
            std::this_thread::yield();
        }
    });

    for (int i = 0; i < 200; i++) {
        std::shared_ptr<BLEDevice> device = open();
        device->subscribe("2a37", "180d", [&](uint16_t, const Bytes&) { calls++; });
    }

    running = false;
    notifier.join();

    int settled = calls.load();
    transport->injectNotification(10, bytesOf({0x02}));
    EXPECT_EQ(settled, calls.load());
}

TEST(BLEDeviceDiscovery, DispatchNotBlockedByDiscovery) {
    std::shared_ptr<BlockingDiscoveryTransport> transport =
        std::make_shared<BlockingDiscoveryTransport>();
    transport->setServiceTable(heartRateTable());
    BLEDevice device("AA:BB:CC:DD:EE:FF", transport);

    std::thread discovery([&]() { device.discoverServices(); });
    transport->waitUntilEntered();

    std::future<void> delivered = std::async(std::launch::async, [&]() {
        device.receiveNotification(10, bytesOf({0x01}));
    });
    std::future_status status = delivered.wait_for(std::chrono::seconds(5));

    transport->release();
    discovery.join();
    delivered.get();

    EXPECT_EQ(std::future_status::ready, status);
    EXPECT_EQ(1.0f, device.getStats()["notifications_received"]);
    EXPECT_EQ(2u, device.getServices()->size());
}
