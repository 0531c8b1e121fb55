#include "StorageMatcher.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool isOctal(char c) {
    return c >= '0' && c <= '7';
}

} // namespace

std::string StorageMatcher::serialSuffix(const std::string& deviceId) {
    size_t pos = deviceId.find_last_of('\\');
    std::string suffix = (pos == std::string::npos) ? deviceId : deviceId.substr(pos + 1);
    return toUpper(suffix);
}

std::string StorageMatcher::normalizeSerial(const std::string& serial) {
    std::string normalized;
    for (char c : serial) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            normalized += c;
        }
    }
    return toUpper(normalized);
}

std::optional<size_t> StorageMatcher::selectDrive(const std::vector<DriveCandidate>& drives,
                                                  const std::string& suffix) {
    if (suffix.empty()) {
        return std::nullopt;
    }

    for (size_t i = 0; i < drives.size(); ++i) {
        std::string serial = normalizeSerial(drives[i].serialNumber);
        if (!serial.empty() &&
            (serial.find(suffix) != std::string::npos || suffix.find(serial) != std::string::npos)) {
            return i;
        }

        if (toUpper(drives[i].syspath).find(suffix) != std::string::npos) {
            return i;
        }
    }
    return std::nullopt;
}

std::map<std::string, MountEntry> StorageMatcher::parseMountTable(std::istream& input) {
    std::map<std::string, MountEntry> mounts;
    std::string line;

    while (std::getline(input, line)) {
        std::istringstream iss(line);
        std::string device, mountPoint, fsType;
        if (!(iss >> device >> mountPoint >> fsType)) {
            continue;
        }
        if (device.empty() || device[0] != '/') {
            continue;
        }

        device = decodeMountField(device);
        if (mounts.find(device) == mounts.end()) {
            mounts[device] = {decodeMountField(mountPoint), fsType};
        }
    }
    return mounts;
}

std::string StorageMatcher::decodeMountField(const std::string& field) {
    std::string decoded;
    decoded.reserve(field.size());

    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            isOctal(field[i + 1]) && isOctal(field[i + 2]) && isOctal(field[i + 3])) {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
            decoded += static_cast<char>(value);
            i += 3;
        } else {
            decoded += field[i];
        }
    }
    return decoded;
}
