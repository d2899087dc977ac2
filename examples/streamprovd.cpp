// StreamProv - Dedicated stream provisioning service
// streamprovd - Provisioning daemon

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "streamprov/api/provisioning_service.hpp"
#include "streamprov/core/config_manager.hpp"

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "StreamProv provisioning daemon v1.0.0\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     Configuration file (.json, .yaml, .yml)\n"
              << "      --init-pool       Create the database, seed the port pool and exit\n"
              << "      --dump-config     Print the effective configuration and exit\n"
              << "  -h, --help            Show this help\n"
              << "\nEnvironment variables STREAMPROV_* override file values.\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    bool initPoolOnly = false;
    bool dumpOnly = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--init-pool") {
            initPoolOnly = true;
        } else if (arg == "--dump-config") {
            dumpOnly = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    streamprov::core::ConfigManager configManager;
    configManager.setLogCallback([](const std::string& message) {
        std::cerr << "[CONFIG] " << message << std::endl;
    });

    auto loaded = configPath.empty()
        ? configManager.loadDefaults()
        : configManager.loadFromFile(configPath);
    if (loaded.isError()) {
        std::cerr << "[ERROR] " << loaded.error().message;
        if (!loaded.error().field.empty()) {
            std::cerr << " (" << loaded.error().field << ")";
        }
        std::cerr << std::endl;
        return 1;
    }
    configManager.applyEnvironmentOverrides();

    if (dumpOnly) {
        std::cout << configManager.dumpConfig() << std::endl;
        return 0;
    }

    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "[ERROR] Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    streamprov::api::ProvisioningService service;
    auto initialized = service.initialize(configManager.getConfig());
    if (initialized.isError()) {
        std::cerr << "[ERROR] Failed to initialize: " << initialized.error().message << std::endl;
        return 1;
    }

    if (initPoolOnly) {
        auto status = service.portPool()->status();
        if (status.isError()) {
            std::cerr << "[ERROR] Pool status unavailable: " << status.error().message << std::endl;
            return 1;
        }
        std::cout << "Port pool " << status.value().rangeStart << "-" << status.value().rangeEnd
                  << ": " << status.value().available << " available, "
                  << status.value().allocated << " allocated" << std::endl;
        service.stop();
        return 0;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto started = service.start();
    if (started.isError()) {
        std::cerr << "[ERROR] Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    service.stop();
    return 0;
}
