#include "DeviceClassifier.hpp"
#include "StorageMatcher.hpp"
#include "TestCheck.hpp"
#include "UdevInventorySource.hpp"
#include <sstream>

using namespace DevHistoryShared;
using TestCheck::expect;

namespace {

DriveCandidate makeDrive(const std::string& syspath, const std::string& serial) {
    DriveCandidate drive;
    drive.syspath = syspath;
    drive.serialNumber = serial;
    drive.bus = "usb";
    return drive;
}

} // namespace

int main() {
    std::cout << "=== Testing StorageMatcher and DeviceClassifier ===" << std::endl;

    TestCheck::section("1. Serial suffix:");
    {
        expect(StorageMatcher::serialSuffix("USB\\VID_0781&PID_5581\\4c530001230923117272") == "4C530001230923117272",
               "suffix is the upper-cased text after the last backslash");
        expect(StorageMatcher::serialSuffix("USB\\VID_0781&PID_5581\\") == "", "trailing backslash gives an empty suffix");
        expect(StorageMatcher::normalizeSerial(" 4c53 0001\t") == "4C530001", "serial normalization strips whitespace");
    }

    TestCheck::section("2. Drive selection:");
    {
        std::vector<DriveCandidate> drives;
        drives.push_back(makeDrive("/sys/devices/pci0000:00/0000:00:17.0/ata1/host0/block/sda", "S3Z9NB0K123456"));
        drives.push_back(makeDrive("/sys/devices/pci0000:00/0000:00:14.0/usb2/2-1/block/sdb", "4C530001230923117272"));

        auto match = StorageMatcher::selectDrive(drives, "4C530001230923117272");
        expect(match && *match == 1, "exact serial match");

        match = StorageMatcher::selectDrive(drives, "4C530001230923117272&0");
        expect(match && *match == 1, "drive serial contained in the suffix");

        drives[1].serialNumber = "XX4C530001230923117272YY";
        match = StorageMatcher::selectDrive(drives, "4C530001230923117272");
        expect(match && *match == 1, "suffix contained in the drive serial");

        drives[1].serialNumber = "";
        match = StorageMatcher::selectDrive(drives, "2-1");
        expect(match && *match == 1, "syspath fallback for serial-less drives");

        expect(!StorageMatcher::selectDrive(drives, "NOPE1234"), "no match yields nothing");
        expect(!StorageMatcher::selectDrive(drives, ""), "empty suffix never matches");

        std::vector<DriveCandidate> twins;
        twins.push_back(makeDrive("/sys/block/sdc", "ABC123"));
        twins.push_back(makeDrive("/sys/block/sdd", "ABC123"));
        match = StorageMatcher::selectDrive(twins, "ABC123");
        expect(match && *match == 0, "first match wins");

        expect(!StorageMatcher::selectDrive(std::vector<DriveCandidate>(), "ABC123"), "no drives yields nothing");
    }

    TestCheck::section("3. Mount table:");
    {
        std::istringstream table(
            "sysfs /sys sysfs rw,nosuid 0 0\n"
            "/dev/sda2 / ext4 rw,relatime 0 0\n"
            "/dev/sdb1 /media/user/MY\\040STICK vfat rw,nosuid 0 0\n"
            "/dev/sdb1 /mnt/again vfat rw 0 0\n"
            "garbage\n");
        auto mounts = StorageMatcher::parseMountTable(table);

        expect(mounts.size() == 2, "only block-device mounts kept");
        expect(mounts.count("/dev/sdb1") && mounts["/dev/sdb1"].mountPoint == "/media/user/MY STICK",
               "octal escapes decoded");
        expect(mounts.count("/dev/sdb1") && mounts["/dev/sdb1"].fileSystem == "vfat", "filesystem type kept");
        expect(StorageMatcher::decodeMountField("a\\04") == "a\\04", "truncated escape left alone");
    }

    TestCheck::section("4. Vendor/product parsing:");
    {
        DeviceRecord record("USB\\VID_0781&PID_5581\\AAA", "Flash", "DiskDrive");
        expect(record.vendorProductId() && *record.vendorProductId() == "0781:5581", "vid and pid parsed");

        DeviceRecord noPid("USB\\VID_0781\\AAA", "Flash", "DiskDrive");
        expect(!noPid.vendorProductId(), "missing PID marker yields nothing");

        DeviceRecord shortPid("USB\\VID_0781&PID_55", "Flash", "DiskDrive");
        expect(!shortPid.vendorProductId(), "truncated PID yields nothing");

        expect(UdevInventorySource::buildDeviceId("0781", "55a1", "4C53") == "USB\\VID_0781&PID_55A1\\4C53",
               "device ids use upper-case vendor and product");
    }

    TestCheck::section("5. Devices sharing a serial:");
    {
        const std::string sharedId = UdevInventorySource::buildDeviceId("090c", "1000", "0123456789ABCDEF");
        DeviceMap devices;
        expect(UdevInventorySource::uniqueDeviceId(devices, sharedId, "1-2") == sharedId,
               "first device keeps the plain id");

        devices[sharedId] = DeviceRecord(sharedId, "Flash Disk", "DiskDrive");
        std::string second = UdevInventorySource::uniqueDeviceId(devices, sharedId, "1-3");
        expect(second == sharedId + "&1-3", "second device gets its port path appended");
        devices[second] = DeviceRecord(second, "Flash Disk", "DiskDrive");
        expect(devices.size() == 2, "both devices tracked");

        DeviceRecord extended(second, "Flash Disk", "DiskDrive");
        expect(extended.vendorProductId() && *extended.vendorProductId() == "090C:1000",
               "extended id keeps the vendor/product tag");

        std::vector<DriveCandidate> drives;
        drives.push_back(makeDrive("/sys/block/sdc", "0123456789ABCDEF"));
        auto match = StorageMatcher::selectDrive(drives, StorageMatcher::serialSuffix(second));
        expect(match && *match == 0, "extended id still matches the drive serial");
    }

    TestCheck::section("6. Storage predicate:");
    {
        expect(DeviceClassifier::isStorageDevice(DeviceRecord("X", "Flash", "DiskDrive")), "DiskDrive class");
        expect(DeviceClassifier::isStorageDevice(DeviceRecord("X", "UAS", "SCSIAdapter")), "SCSIAdapter class");
        expect(DeviceClassifier::isStorageDevice(DeviceRecord("X", "USB Storage Device", "USB")),
               "USB class with Storage in the name");
        expect(DeviceClassifier::isStorageDevice(DeviceRecord("X", "USB Mass Storage Device", "Ports")),
               "Mass Storage in the name");
        expect(!DeviceClassifier::isStorageDevice(DeviceRecord("X", "Keyboard", "HIDClass")), "HID is not storage");
        expect(!DeviceClassifier::isStorageDevice(DeviceRecord("X", "Storage Box", "Image")),
               "Storage in the name needs the USB class tag");

        DeviceRecord bare;
        bare.deviceId = "X";
        expect(!DeviceClassifier::isStorageDevice(bare), "record without name or class is not storage");
    }

    TestCheck::section("7. Class names and sizes:");
    {
        expect(DeviceClassifier::usbClassName(0x08) == "DiskDrive", "mass storage class");
        expect(DeviceClassifier::usbClassName(0x03) == "HIDClass", "HID class");
        expect(DeviceClassifier::usbClassName(0x42) == "USB", "unknown class falls back to USB");
        expect(DeviceClassifier::formatBytes(512) == "512 B", "bytes");
        expect(DeviceClassifier::formatBytes(1536ULL * 1024 * 1024) == "1.50 GB", "gigabytes");
    }

    return TestCheck::finish("StorageMatcher");
}
