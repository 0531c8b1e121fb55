#include "LedgerStore.hpp"
#include "Logger.hpp"
#include "TestCheck.hpp"
#include "../devhistory-shared/include/DeviceHistorySerializer.hpp"
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace DevHistoryShared;
using TestCheck::expect;

namespace {

const std::string FLASH_ID = "USB\\VID_0781&PID_5581\\4C530001230923117272";

std::string tempPath(const std::string& name) {
    return "devhistory_" + std::to_string(getpid()) + "_" + name + ".json";
}

void writeText(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

bool fileExists(const std::string& path) {
    return access(path.c_str(), F_OK) == 0;
}

} // namespace

int main() {
    Logger::getInstance().setConsoleOutput(false);
    std::cout << "=== Testing LedgerStore ===" << std::endl;

    TestCheck::section("1. Missing file:");
    {
        LedgerStore store(tempPath("missing"));
        auto ledger = store.load();
        expect(ledger.devices.empty(), "missing file loads as an empty ledger");
        expect(ledger.version == LEDGER_VERSION, "empty ledger has the current version");
    }

    TestCheck::section("2. Save and reload:");
    {
        const std::string path = tempPath("roundtrip");
        LedgerStore store(path);

        KnownDeviceLedger ledger;
        KnownDevice device;
        device.deviceId = FLASH_ID;
        device.name = "Ultra USB 3.0";
        device.vidPid = "0781:5581";
        device.deviceClass = "DiskDrive";
        device.manufacturer = "SanDisk";
        device.firstSeen = "2024-05-01 10:00:00";
        device.lastSeen = "2024-05-02 11:00:00";
        device.timesSeen = 3;
        device.currentlyConnected = true;
        device.nickname = "Backup stick";

        StorageInfo info;
        info.model = "SanDisk Ultra";
        info.totalBytes = 30752636928ULL;
        info.partitionCount = 1;
        VolumeInfo volume;
        volume.driveLetter = "/media/user/BACKUP";
        volume.volumeName = "BACKUP";
        volume.fileSystem = "vfat";
        info.volumes.push_back(volume);
        device.storageInfo = info;
        ledger.devices[FLASH_ID] = device;

        expect(store.save(ledger), "save succeeds");
        expect(fileExists(path), "ledger file written");
        expect(!fileExists(path + ".tmp"), "temporary file replaced");

        auto loaded = store.load();
        auto it = loaded.devices.find(FLASH_ID);
        expect(it != loaded.devices.end(), "device present after reload");
        if (it != loaded.devices.end()) {
            const KnownDevice& reloaded = it->second;
            expect(reloaded.timesSeen == 3, "timesSeen preserved");
            expect(reloaded.currentlyConnected, "connected flag preserved");
            expect(reloaded.nickname && *reloaded.nickname == "Backup stick", "nickname preserved");
            expect(reloaded.storageInfo && reloaded.storageInfo->volumes.size() == 1, "volumes preserved");
            expect(reloaded.storageInfo && reloaded.storageInfo->totalBytes == 30752636928ULL,
                   "64-bit sizes preserved");
        }

        std::ifstream in(path);
        json document;
        in >> document;
        expect(document["version"] == LEDGER_VERSION, "document carries the version");
        expect(document["devices"][FLASH_ID]["vid_pid"] == "0781:5581", "device keyed by id with snake_case fields");

        std::remove(path.c_str());
    }

    TestCheck::section("3. Tolerant parsing:");
    {
        const std::string path = tempPath("tolerant");
        writeText(path, R"({
            "version": 1,
            "devices": {
                "USB\\VID_046D&PID_C31C\\1-2": {
                    "device_id": "USB\\VID_046D&PID_C31C\\1-2",
                    "name": "Keyboard",
                    "first_seen": "2023-01-01 00:00:00",
                    "times_seen": 4,
                    "future_field": {"anything": true}
                },
                "broken": "not an object"
            },
            "extra": 42
        })");

        LedgerStore store(path);
        auto ledger = store.load();
        auto it = ledger.devices.find("USB\\VID_046D&PID_C31C\\1-2");
        expect(ledger.devices.size() == 1, "malformed entry skipped, valid entry kept");
        expect(it != ledger.devices.end() && it->second.timesSeen == 4, "known fields read");
        expect(it != ledger.devices.end() && !it->second.nickname, "missing nickname is absent");
        expect(it != ledger.devices.end() && !it->second.storageInfo, "missing storage info is absent");
        expect(it != ledger.devices.end() && it->second.lastSeen == "2023-01-01 00:00:00",
               "missing lastSeen falls back to firstSeen");
        expect(it != ledger.devices.end() && !it->second.currentlyConnected, "missing connected flag is false");

        std::remove(path.c_str());
    }

    TestCheck::section("4. Corrupt documents:");
    {
        const std::string path = tempPath("corrupt");
        writeText(path, "{ \"version\": 2, \"devices\": { ");
        expect(LedgerStore(path).load().devices.empty(), "truncated JSON loads as empty");

        writeText(path, "[1, 2, 3]");
        expect(LedgerStore(path).load().devices.empty(), "non-object root loads as empty");

        writeText(path, "{\"version\": 2, \"devices\": []}");
        expect(LedgerStore(path).load().devices.empty(), "devices not an object loads as empty");

        std::remove(path.c_str());
    }

    TestCheck::section("5. Write failures:");
    {
        LedgerStore store("devhistory-no-such-dir/ledger.json");
        expect(!store.save(KnownDeviceLedger()), "save into a missing directory reports failure");

        const std::string path = tempPath("direct");
        LedgerStore direct(path, false);
        expect(direct.save(KnownDeviceLedger()), "non-atomic save succeeds");
        expect(direct.load().devices.empty(), "empty ledger reloads");
        std::remove(path.c_str());
    }

    TestCheck::section("6. Non-UTF-8 strings:");
    {
        const std::string path = tempPath("latin1");
        LedgerStore store(path);

        KnownDeviceLedger ledger;
        KnownDevice device;
        device.deviceId = FLASH_ID;
        device.name = "Ultra USB 3.0";
        device.firstSeen = "2024-01-01 00:00:00";
        device.lastSeen = "2024-01-01 00:00:00";
        device.timesSeen = 1;
        device.currentlyConnected = true;

        StorageInfo info;
        info.model = "SanDisk Ultra";
        VolumeInfo volume;
        volume.driveLetter = "/mnt/caf\xe9";
        volume.volumeName = "CAF\xc9";
        info.volumes.push_back(volume);
        device.storageInfo = info;
        ledger.devices[FLASH_ID] = device;

        expect(store.save(ledger), "ledger with a Latin-1 mount point saves");

        ledger.devices[FLASH_ID].lastSeen = "2024-01-02 09:30:00";
        ledger.devices[FLASH_ID].currentlyConnected = false;
        expect(store.save(ledger), "later saves keep succeeding");

        auto loaded = store.load();
        auto it = loaded.devices.find(FLASH_ID);
        expect(it != loaded.devices.end() && it->second.lastSeen == "2024-01-02 09:30:00",
               "later change reached the file");
        expect(it != loaded.devices.end() && it->second.storageInfo &&
                   it->second.storageInfo->volumes.size() == 1 &&
                   it->second.storageInfo->volumes[0].driveLetter.compare(0, 8, "/mnt/caf") == 0,
               "invalid bytes replaced, rest of the path kept");

        std::remove(path.c_str());
    }

    return TestCheck::finish("LedgerStore");
}
