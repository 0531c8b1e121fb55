#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

// A whole-disk block device as seen by the enrichment lookup
struct DriveCandidate {
    std::string syspath;
    std::string devnode;
    std::string model;
    std::string serialNumber;
    uint64_t sizeBytes{0};
    std::string bus;
    std::string firmware;
    bool removable{false};
};

struct MountEntry {
    std::string mountPoint;
    std::string fileSystem;
};

class StorageMatcher {
public:
    // Upper-cased text after the last backslash of a device id
    static std::string serialSuffix(const std::string& deviceId);

    // First drive whose serial contains or is contained in the suffix,
    // falling back to a drive whose syspath contains it
    static std::optional<size_t> selectDrive(const std::vector<DriveCandidate>& drives,
                                             const std::string& suffix);

    // devnode -> first mount of that device, from /proc/mounts content
    static std::map<std::string, MountEntry> parseMountTable(std::istream& input);

    // Undoes the octal escapes (\040 etc.) used in the mount table
    static std::string decodeMountField(const std::string& field);

    static std::string normalizeSerial(const std::string& serial);
};
