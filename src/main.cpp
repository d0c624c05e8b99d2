// gattlink demo
// Heart rate monitor session against a simulated peripheral

#include <string>
#include <cstring>
#include <cstdio>

// Logging
#include <Log.h>

// GATT client session
#include "BLEDevice.h"
#include "platforms/SimulatedTransport.h"

using namespace GattLink::BLE;

// Heart Rate service (0x180d)
static const char* HRS_SERVICE = "180d";
static const char* HRS_MEASUREMENT = "2a37";
static const char* HRS_BODY_SENSOR_LOCATION = "2a38";
static const char* HRS_CONTROL_POINT = "2a39";

// Battery service (0x180f)
static const char* BAS_SERVICE = "180f";
static const char* BAS_LEVEL = "2a19";

static const char* PERIPHERAL_ADDRESS = "C0:FF:EE:00:18:0D";
static const int MEASUREMENT_COUNT = 5;

// Command line settings
struct DemoSettings {
    RNS::LogLevel log_level = RNS::LOG_INFO;
    bool use_indication = false;
};

DemoSettings settings;

// Global instances
std::shared_ptr<SimulatedTransport> peripheral;
BLEDevice* device = nullptr;

// Received measurements
int measurements_received = 0;

Bytes bytes_of(const uint8_t* data, size_t size) {
    return Bytes(data, size);
}

bool parse_args(int argc, char** argv) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-v") == 0) {
            settings.log_level = RNS::LOG_DEBUG;
        } else if (strcmp(argv[i], "-q") == 0) {
            settings.log_level = RNS::LOG_WARNING;
        } else if (strcmp(argv[i], "-i") == 0) {
            settings.use_indication = true;
        } else {
            fprintf(stderr, "usage: %s [-v] [-q] [-i]\n", argv[0]);
            fprintf(stderr, "  -v  debug logging\n");
            fprintf(stderr, "  -q  warnings and errors only\n");
            fprintf(stderr, "  -i  subscribe with indications\n");
            return false;
        }
    }
    return true;
}

void setup_peripheral() {
    INFO("Building simulated heart rate sensor...");

    ServiceCatalog table;

    Service* hrs = table.addService(BLEUUID::fromString(HRS_SERVICE), 0x0008, 0x0011);
    hrs->addCharacteristic(Characteristic(BLEUUID::fromString(HRS_MEASUREMENT), 0x000A, 0x000B));
    hrs->addCharacteristic(Characteristic(BLEUUID::fromString(HRS_BODY_SENSOR_LOCATION), 0x000D));
    hrs->addCharacteristic(Characteristic(BLEUUID::fromString(HRS_CONTROL_POINT), 0x000F));

    Service* bas = table.addService(BLEUUID::fromString(BAS_SERVICE), 0x0012, 0x0016);
    bas->addCharacteristic(Characteristic(BLEUUID::fromString(BAS_LEVEL), 0x0014, 0x0015));

    peripheral = std::make_shared<SimulatedTransport>("simulated-hrs");
    peripheral->setServiceTable(table);
    peripheral->setRSSI(-58);

    const uint8_t chest = 0x01;
    peripheral->setAttributeValue(0x000D, bytes_of(&chest, 1));
    const uint8_t battery = 87;
    peripheral->setAttributeValue(0x0014, bytes_of(&battery, 1));
}

void setup_session() {
    INFO("Opening session with " + std::string(PERIPHERAL_ADDRESS) + "...");

    DeviceConfig config;
    config.descriptor_strategy = DescriptorStrategy::DISCOVERED;

    device = new BLEDevice(PERIPHERAL_ADDRESS, peripheral, config);
    device->bond();

    INFO("  RSSI: " + std::to_string(device->getRSSI()) + " dBm");
    INFO("  Measurement handle: " + handleToString(device->getHandle(HRS_MEASUREMENT, HRS_SERVICE)));
    INFO("  Battery level handle: " + handleToString(device->getHandle(BAS_LEVEL, BAS_SERVICE)));

    Bytes location = device->charRead(HRS_BODY_SENSOR_LOCATION, HRS_SERVICE);
    INFO("  Body sensor location: " + std::string(location.size() > 0 && location.data()[0] == 0x01 ? "chest" : "other"));
}

void on_measurement(uint16_t handle, const Bytes& value) {
    // Flags bit 0 selects a 16-bit heart rate value
    if (value.size() < 2) {
        WARNING("Short heart rate measurement on " + handleToString(handle));
        return;
    }
    const uint8_t* data = value.data();
    int bpm = (data[0] & 0x01) && value.size() >= 3 ? (data[1] | (data[2] << 8)) : data[1];

    measurements_received++;
    INFO("  Heart rate: " + std::to_string(bpm) + " bpm");
}

void run_measurements() {
    INFO("Subscribing to heart rate measurements...");
    device->subscribe(HRS_MEASUREMENT, HRS_SERVICE, on_measurement, settings.use_indication);

    // Reset energy expended through the control point
    const uint8_t reset = 0x01;
    device->charWrite(HRS_CONTROL_POINT, bytes_of(&reset, 1), HRS_SERVICE, true);

    uint16_t handle = device->getHandle(HRS_MEASUREMENT, HRS_SERVICE);
    for (int i = 0; i < MEASUREMENT_COUNT; i++) {
        uint8_t measurement[2] = { 0x00, static_cast<uint8_t>(62 + i * 3) };
        peripheral->notifyValue(handle, bytes_of(measurement, sizeof(measurement)));
    }

    Bytes battery = device->charRead(BAS_LEVEL, BAS_SERVICE);
    if (battery.size() > 0) {
        INFO("  Battery level: " + std::to_string(battery.data()[0]) + "%");
    }

    INFO("Unsubscribing...");
    device->unsubscribe(HRS_MEASUREMENT, HRS_SERVICE);

    // Peripheral has notifications disabled again
    uint8_t late[2] = { 0x00, 99 };
    if (peripheral->notifyValue(handle, bytes_of(late, sizeof(late)))) {
        WARNING("Notification delivered after unsubscribe");
    }
}

void print_stats() {
    INFO("Session statistics:");
    std::map<std::string, float> stats = device->getStats();
    for (const auto& entry : stats) {
        INFO("  " + entry.first + ": " + std::to_string(static_cast<int>(entry.second)));
    }
}

int main(int argc, char** argv) {
    if (!parse_args(argc, argv)) {
        return 2;
    }
    RNS::loglevel(settings.log_level);

    INFO("gattlink heart rate demo");

    int status = 0;
    try {
        setup_peripheral();
        setup_session();
        run_measurements();
        print_stats();

        if (measurements_received != MEASUREMENT_COUNT) {
            ERROR("Expected " + std::to_string(MEASUREMENT_COUNT) + " measurements, got " +
                  std::to_string(measurements_received));
            status = 1;
        }
    } catch (const BLEError& e) {
        ERROR("Session failed: " + std::string(e.what()));
        status = 1;
    }

    if (device) {
        device->disconnect();
        delete device;
        device = nullptr;
    }

    return status;
}
