#include "ConfigLoader.hpp"
#include "DeviceClassifier.hpp"
#include "DeviceTracker.hpp"
#include "LedgerStore.hpp"
#include "Logger.hpp"
#include "SnapshotPublisher.hpp"
#include "UdevInventorySource.hpp"
#include "UdevStorageEnricher.hpp"
#include "../devhistory-shared/include/DeviceHistorySerializer.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <sys/select.h>
#include <unistd.h>
#include <vector>

using namespace DevHistoryShared;

namespace {

std::atomic<bool> g_running(true);
std::mutex g_outputMutex;

void signalHandler(int) {
    g_running = false;
}

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS]\n\n";
    std::cout << "USB Device History Tracker\n";
    std::cout << "Tracks USB connect/disconnect activity and keeps a persistent history of every device seen.\n\n";
    std::cout << "Optional Arguments:\n";
    std::cout << "  -c, --config FILE        Path to configuration JSON file\n";
    std::cout << "  --ledger FILE            Override the device history file\n";
    std::cout << "  --dump-snapshot          Print the initial snapshot as JSON and exit\n";
    std::cout << "  -v, --verbose            Log at DEBUG level to the console\n";
    std::cout << "  -h, --help               Display this help message and exit\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " -c config/device-history.json\n";
    std::cout << "  " << programName << " --ledger /var/lib/devhistory/cache.json --dump-snapshot\n";
}

void printCommands() {
    std::cout << "Commands:\n";
    std::cout << "  list                     Show connected devices\n";
    std::cout << "  history                  Show every known device with its index\n";
    std::cout << "  rename <n|id> <text>     Set a nickname (empty text clears it)\n";
    std::cout << "  forget <n|id>            Remove a device from the history\n";
    std::cout << "  clear                    Clear the event log\n";
    std::cout << "  help                     Show this list\n";
    std::cout << "  quit                     Exit\n";
}

void printDevices(const AppSnapshot& snapshot) {
    std::cout << "Connected devices (" << snapshot.devices.size() << "):\n";
    for (const auto& device : snapshot.devices) {
        std::cout << "  " << device.name
                  << "  [" << (device.vidPid ? *device.vidPid : "?") << "]"
                  << "  " << device.deviceClass;
        if (device.manufacturer) {
            std::cout << "  " << *device.manufacturer;
        }
        std::cout << "\n";

        auto storage = snapshot.storageInfo.find(device.deviceId);
        if (storage != snapshot.storageInfo.end()) {
            std::cout << "      " << storage->second.model << ", "
                      << DeviceClassifier::formatBytes(storage->second.totalBytes);
            for (const auto& volume : storage->second.volumes) {
                std::cout << ", " << volume.driveLetter;
                if (!volume.volumeName.empty()) {
                    std::cout << " (" << volume.volumeName << ")";
                }
            }
            std::cout << "\n";
        }
    }
}

// std::map iteration order gives stable indices between two history calls
std::vector<std::string> historyOrder(const AppSnapshot& snapshot) {
    std::vector<std::string> ids;
    for (const auto& pair : snapshot.knownDevices) {
        ids.push_back(pair.first);
    }
    return ids;
}

void printHistory(const AppSnapshot& snapshot) {
    std::cout << "Known devices (" << snapshot.knownDevices.size() << "):\n";
    size_t index = 1;
    for (const auto& pair : snapshot.knownDevices) {
        const KnownDevice& device = pair.second;
        std::cout << "  " << index++ << ". "
                  << (device.currentlyConnected ? "* " : "  ")
                  << device.name;
        if (device.nickname) {
            std::cout << " \"" << *device.nickname << "\"";
        }
        std::cout << "  [" << device.vidPid << "]"
                  << "  seen " << device.timesSeen << "x"
                  << ", first " << device.firstSeen
                  << ", last " << device.lastSeen << "\n";
    }
}

std::string eventLine(const DeviceEvent& event) {
    std::string line = "[" + event.timestamp + "] " +
                       (event.kind == EventKind::CONNECT ? "+ " : "- ") + event.name;
    if (event.vidPid) {
        line += " [" + *event.vidPid + "]";
    }
    return line;
}

// Accepts a 1-based index into the history listing or a literal device id
std::string resolveDevice(const AppSnapshot& snapshot, const std::string& ref) {
    if (!ref.empty() && ref.find_first_not_of("0123456789") == std::string::npos) {
        auto ids = historyOrder(snapshot);
        size_t index = std::strtoul(ref.c_str(), nullptr, 10);
        if (index >= 1 && index <= ids.size()) {
            return ids[index - 1];
        }
        return "";
    }
    return snapshot.knownDevices.count(ref) ? ref : "";
}

std::string snapshotText(const AppSnapshot& snapshot) {
    return DeviceHistorySerializer::appSnapshotToJson(snapshot).dump(2, ' ', false, json::error_handler_t::replace);
}

bool handleCommand(const std::string& line, SnapshotPublisher& publisher) {
    std::istringstream input(line);
    std::string command;
    input >> command;

    if (command.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(g_outputMutex);
    SnapshotPtr snapshot = publisher.snapshot();

    if (command == "quit" || command == "exit") {
        return false;
    } else if (command == "help") {
        printCommands();
    } else if (command == "list") {
        printDevices(*snapshot);
    } else if (command == "history") {
        printHistory(*snapshot);
    } else if (command == "clear") {
        publisher.clearEvents();
        std::cout << "Event log cleared.\n";
    } else if (command == "rename" || command == "forget") {
        std::string ref;
        input >> ref;
        std::string deviceId = resolveDevice(*snapshot, ref);
        if (deviceId.empty()) {
            std::cout << "Unknown device: " << ref << "\n";
            return true;
        }

        if (command == "forget") {
            if (publisher.forgetDevice(deviceId)) {
                std::cout << "Forgot " << deviceId << "\n";
            }
        } else {
            std::string text;
            std::getline(input, text);
            if (publisher.setNickname(deviceId, text)) {
                std::cout << "Nickname updated for " << deviceId << "\n";
            }
        }
    } else {
        std::cout << "Unknown command: " << command << " (type help)\n";
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string ledgerFile;
    bool dumpSnapshot = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a file path argument." << std::endl;
                return 1;
            }
        } else if (arg == "--ledger") {
            if (i + 1 < argc) {
                ledgerFile = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a file path argument." << std::endl;
                return 1;
            }
        } else if (arg == "--dump-snapshot") {
            dumpSnapshot = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            std::cerr << "Use -h or --help for usage information." << std::endl;
            return 1;
        }
    }

    ConfigLoader loader;
    if (!configFile.empty() && !loader.loadFromFile(configFile)) {
        std::cerr << "Error: Failed to load config file: " << configFile << std::endl;
        return 1;
    }
    if (!ledgerFile.empty()) {
        loader.setLedgerFile(ledgerFile);
    }
    TrackerConfig config = loader.getConfig();

    Logger& logger = Logger::getInstance();
    logger.setLogFile(config.logFile);
    if (verbose) {
        logger.setLogLevel(LogLevel::DEBUG);
        logger.setConsoleOutput(true);
    } else {
        if (!logger.setLogLevel(config.logLevel)) {
            LOG_WARNING("Unknown log level '" + config.logLevel + "', keeping INFO");
        }
        logger.setConsoleOutput(config.logToConsole);
    }

    LOG_INFO("USB Device History Tracker starting...");
    LOG_INFO("Ledger file: " + config.ledgerFile);

    UdevInventorySource inventory(config.includeRootHubs);
    UdevStorageEnricher enricher;
    SnapshotPublisher publisher;
    LedgerStore store(config.ledgerFile, config.atomicLedgerWrites);
    DeviceTracker tracker(config, inventory, enricher, publisher, store);

    if (!tracker.initialize()) {
        auto snapshot = publisher.snapshot();
        if (dumpSnapshot) {
            std::cout << snapshotText(*snapshot) << std::endl;
        }
        std::cerr << "Error: " << (snapshot->error ? *snapshot->error : "initialization failed") << std::endl;
        return 1;
    }

    if (dumpSnapshot) {
        std::cout << snapshotText(*publisher.snapshot()) << std::endl;
        return 0;
    }

    // Print only the events appended since the previous notification
    size_t printedEvents = 0;
    publisher.registerObserver([&printedEvents](const SnapshotPtr& snapshot) {
        std::lock_guard<std::mutex> lock(g_outputMutex);
        if (snapshot->events.size() < printedEvents) {
            printedEvents = 0;
        }
        for (size_t i = printedEvents; i < snapshot->events.size(); ++i) {
            std::cout << eventLine(snapshot->events[i]) << std::endl;
        }
        printedEvents = snapshot->events.size();
    });

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    {
        std::lock_guard<std::mutex> lock(g_outputMutex);
        std::cout << "USB Device History Tracker - history in " << config.ledgerFile << "\n";
        printDevices(*publisher.snapshot());
        std::cout << "Type help for commands.\n";
        std::cout.flush();
    }

    if (!tracker.start()) {
        std::cerr << "Error: Failed to start device tracker" << std::endl;
        return 1;
    }

    std::string line;
    while (g_running) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(STDIN_FILENO, &readSet);

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 200000;

        int ready = select(STDIN_FILENO + 1, &readSet, nullptr, nullptr, &timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("select() on stdin failed");
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!handleCommand(line, publisher)) {
            break;
        }
        std::cout.flush();
    }

    tracker.stop();

    LOG_INFO("USB Device History Tracker stopped");
    std::cout << "USB Device History Tracker stopped." << std::endl;
    return 0;
}
