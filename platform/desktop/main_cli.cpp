/**
 * @file main_cli.cpp
 * @brief Command-line entry point for the nRF Cloud device simulator
 *
 * Normal mode provisions the device if needed, opens the broker session and
 * runs the telemetry event loop with single-key console commands. --diag
 * runs the connectivity checks against existing credentials instead.
 *
 * Exit status: 0 success, 1 fatal error or bad usage, 2 configuration error,
 * 3 diagnostics found a failing step.
 *
 * @date 2025
 * @version 1.0
 */

#include "CertificateStore.hpp"
#include "CloudDirectory.hpp"
#include "ConsoleInput.hpp"
#include "DeviceProvisioner.hpp"
#include "DeviceSessionContext.hpp"
#include "Errors.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include "OpenSslCredentialGenerator.hpp"
#include "OpenSslHttpClient.hpp"
#include "PahoMqttClient.hpp"
#include "RouteInterpolator.hpp"
#include "SessionManager.hpp"
#include "SimulatorConfig.hpp"
#include "TemperatureModel.hpp"
#include "TomlConfig.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "domain/CommandQueue.hpp"
#include "domain/DiagnosticRunner.hpp"
#include "domain/NormalRunner.hpp"
#include "domain/TelemetryScheduler.hpp"
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace nrfsim;

namespace {

constexpr int kExitFatal = 1;
constexpr int kExitConfig = 2;
constexpr int kExitDiagnosticsFailed = 3;

/// Cleared by SIGINT/SIGTERM
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running.store(false);
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] [config-file]\n"
              << "Options:\n"
              << "  --config <file>    Configuration file (default: simulator.toml)\n"
              << "  --diag             Run connection diagnostics instead of the simulator\n"
              << "  --help             Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [nrf_cloud]\n"
              << "  api_key = \"your-api-key\"\n"
              << "  device_id = \"kid-gps-sim-001\"\n"
              << "\n  [simulation]\n"
              << "  location_interval_seconds = 300\n"
              << "  temperature_interval_seconds = 300\n"
              << "\nNRF_CLOUD_API_KEY and NRF_DEVICE_ID override the file.\n"
              << std::endl;
}

std::string remediationHint(const SimulatorError& error) {
    const std::string& stage = error.stage();
    if (stage == "provisioning") {
        return "Check that the certs directory is writable and that www.amazontrust.com is reachable.";
    }
    if (stage == "directory") {
        return "Check the API key and network access to the nRF Cloud REST API.";
    }
    if (stage == "connection") {
        return "Check network access to the MQTT broker on port 8883. Deleting the device's "
               ".mqtt_info.json forces re-registration.";
    }
    return "See the log above for details.";
}

int runDiagnostics(const SimulatorConfig& config,
                   std::shared_ptr<CloudDirectory> directory,
                   std::shared_ptr<DeviceProvisioner> provisioner) {
    DeviceIdentity identity{config.deviceId, config.apiKey};
    auto context = provisioner->attachExisting(identity);

    // One attempt per connect: a failing check should report, not back off
    adapters::ExponentialBackoffRetryPolicy singleAttempt(std::chrono::milliseconds(1000), 2.0,
                                                          std::chrono::seconds(60), 1);
    auto policies = std::make_shared<adapters::DefaultPolicyEngine>(
        singleAttempt, adapters::ExponentialBackoffRetryPolicy(std::chrono::milliseconds(1000), 2.0,
                                                               std::chrono::seconds(60), 3), 3);

    SessionSettings settings;
    settings.autoReconnect = false;

    auto session = std::make_shared<SessionManager>(std::make_shared<PahoMqttClient>(), context, policies, settings);
    session->setRegistrationProvider([provisioner, identity]() {
        return provisioner->lookupRouting(identity.deviceId);
    });

    domain::DiagnosticSettings diagSettings;
    diagSettings.observationWindow = std::chrono::seconds(config.observationSeconds);
    diagSettings.postSubscribeWindow = std::chrono::seconds(config.postSubscribeSeconds);

    domain::DiagnosticRunner runner(directory, session, identity.deviceId, diagSettings);
    auto report = runner.run();
    return report.passed() ? 0 : kExitDiagnosticsFailed;
}

int runSimulator(const SimulatorConfig& config,
                 std::shared_ptr<DeviceProvisioner> provisioner,
                 std::shared_ptr<ports::IPolicyEngine> policies) {
    DeviceIdentity identity{config.deviceId, config.apiKey};
    auto context = provisioner->provision(identity);

    auto session = std::make_shared<SessionManager>(std::make_shared<PahoMqttClient>(), context, policies);
    session->setRegistrationProvider([provisioner, context]() {
        return provisioner->registerWithRetry(context->identity().deviceId, context->bundle().certificatePem);
    });

    auto clock = std::make_shared<SystemClock>();
    auto rng = std::make_shared<StandardRng>();
    auto route = std::make_shared<RouteInterpolator>(
        static_cast<double>(config.locationIntervalSeconds) * RouteInterpolator::kStepsPerSegment,
        config.maxJitterMeters, rng);
    auto temperature = std::make_shared<TemperatureModel>(config.temperatureBase, config.temperatureVariation, rng);

    ShadowConfig shadow;
    shadow.counterEnable = config.counterEnable;
    shadow.locationInterval = config.locationIntervalSeconds;

    auto scheduler = std::make_shared<domain::TelemetryScheduler>(
        session, clock, route, temperature, policies, shadow,
        std::chrono::seconds(config.temperatureIntervalSeconds));
    auto commands = std::make_shared<domain::CommandQueue>();

    domain::NormalRunner runner(session, scheduler, commands, identity.deviceId, config.appVersion);
    runner.setInterruptCheck([]() { return !g_running.load(); });

    ConsoleInput input(commands);
    runner.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    bool diagMode = false;
    std::string configFile = "simulator.toml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--diag") {
            diagMode = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file name" << std::endl;
                printUsage(argv[0]);
                return kExitFatal;
            }
            configFile = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return kExitFatal;
        } else {
            configFile = arg;
        }
    }

    std::cout << "============================================================" << std::endl;
    std::cout << "  Kid GPS Tracker - nRF Cloud Device Simulator" << std::endl;
    std::cout << "  Creates a virtual device (no hardware needed)" << std::endl;
    std::cout << "============================================================" << std::endl;

    SimulatorConfig config;
    try {
        config = TomlConfig::loadFromFile(configFile);
        TomlConfig::validate(config);
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        std::cerr << "[Config] Copy simulator.toml.example to " << configFile << " and fill it in." << std::endl;
        return kExitConfig;
    }

    std::cout << "[Config] Device: " << config.deviceId << std::endl;
    std::cout << "[Config] API: " << config.apiHost << std::endl;

    try {
        auto http = std::make_shared<OpenSslHttpClient>();
        auto policies = std::make_shared<adapters::DefaultPolicyEngine>();
        auto certificates = std::make_shared<CertificateStore>(
            config.certsDir, std::make_shared<OpenSslCredentialGenerator>(), http);
        auto directory = std::make_shared<CloudDirectory>(config.apiHost, config.apiKey, http);
        auto cache = std::make_shared<ConnectionInfoCache>(config.certsDir);
        auto provisioner = std::make_shared<DeviceProvisioner>(certificates, directory, cache, policies);

        if (diagMode) {
            return runDiagnostics(config, directory, provisioner);
        }
        return runSimulator(config, provisioner, policies);

    } catch (const SimulatorError& e) {
        std::cerr << std::endl;
        std::cerr << "[Simulator] Fatal " << e.stage() << " error: " << e.what() << std::endl;
        std::cerr << "[Simulator] " << remediationHint(e) << std::endl;
        return kExitFatal;
    } catch (const std::exception& e) {
        std::cerr << std::endl;
        std::cerr << "[Simulator] Unexpected error: " << e.what() << std::endl;
        return kExitFatal;
    }
}
