#include "CommandChannel.h"
#include "HapticsConfig.h"
#include "Logging.h"
#include "TlsStream.h"

#include "../device/evdev_rumble.h"
#include "../device/haptic_device.h"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) { g_running.store(false); }

bool fileReadable(const std::string& path) {
    std::ifstream f(path);
    return static_cast<bool>(f);
}

bool splitHostPort(const std::string& addr, std::string* host, int* port) {
    const std::size_t colon = addr.rfind(':');
    if (colon == std::string::npos) {
        *host = addr;
        std::cout << "Server port not specified, assuming default port: '" << addr << ":" << *port << "'\n";
        return true;
    }
    *host = addr.substr(0, colon);
    try {
        *port = std::stoi(addr.substr(colon + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host->empty() && *port > 0 && *port < 65536;
}

void printUsage() {
    std::cout << "haptic_receiver usage:\n"
              << "  haptic_receiver [host:port] [-c config.json] [-w] [-k] [--ca-file f] [--pin sha256]\n"
              << "                  [--device-dir dir] [-r] [--record-dir dir] [--list-devices]\n"
              << "                  [--fingerprint cert.pem] [-v]\n"
              << "  -r, --record       write applied commands to <record-dir>/<server>/<date time>.rec\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/receiver.json";
    bool config_explicit = false;
    bool write_config = false;
    bool list_devices = false;
    bool verbose = false;

    std::string server_addr;
    bool insecure = false;
    std::string ca_file;
    std::string pin;
    std::string device_dir;
    std::string fingerprint_file;
    bool record = false;
    std::string record_dir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
            config_explicit = true;
        } else if (arg == "-w" || arg == "--write-config") {
            write_config = true;
        } else if (arg == "-k" || arg == "--insecure") {
            insecure = true;
        } else if (arg == "--ca-file" && i + 1 < argc) {
            ca_file = argv[++i];
        } else if (arg == "--pin" && i + 1 < argc) {
            pin = argv[++i];
        } else if (arg == "--device-dir" && i + 1 < argc) {
            device_dir = argv[++i];
        } else if (arg == "-r" || arg == "--record") {
            record = true;
        } else if (arg == "--record-dir" && i + 1 < argc) {
            record_dir = argv[++i];
            record = true;
        } else if (arg == "--list-devices") {
            list_devices = true;
        } else if (arg == "--fingerprint" && i + 1 < argc) {
            fingerprint_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && server_addr.empty()) {
            server_addr = arg;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    std::string err;
    if (!fingerprint_file.empty()) {
        std::string fp;
        if (!rh::certificateFileFingerprint(fingerprint_file, &fp, &err)) {
            std::cerr << "/!\\ " << err << "\n";
            return 1;
        }
        std::cout << fp << "\n";
        return 0;
    }

    rh::ReceiverConfigV1 cfg;
    if (!write_config && (config_explicit || fileReadable(config_path))) {
        if (!rh::loadReceiverConfig(config_path, &cfg, &err)) {
            std::cerr << "/!\\ " << rh::errorCodeName(rh::ErrorCode::ConfigError) << ": " << err << "\n";
            return 1;
        }
    }
    if (!device_dir.empty()) cfg.device_dir = device_dir;

    if (write_config || list_devices) {
        std::vector<std::unique_ptr<rh::device::HapticDevice>> found =
            rh::device::discoverEvdevRumbleDevices(cfg.device_dir);
        if (list_devices) {
            for (const auto& d : found) std::cout << d->id() << "  " << d->name() << "\n";
            if (found.empty()) std::cout << "No rumble capable devices found in " << cfg.device_dir << "\n";
            return 0;
        }
        // The sample maps every connected rumble device onto its own target.
        for (const auto& d : found) {
            cfg.devices.targets_by_device[d->id()] = d->id();
            cfg.devices.enabled_devices.push_back(d->id());
        }
        rh::finalizeReceiverConfig(&cfg);
        if (!rh::saveReceiverConfig(config_path, cfg, &err)) {
            std::cerr << "/!\\ " << err << "\n";
            return 1;
        }
        std::cout << "Wrote sample configuration with " << found.size() << " device(s) to: " << config_path << "\n";
        return 0;
    }

    if (!server_addr.empty()) {
        int port = cfg.channel.port_i32;
        if (!splitHostPort(server_addr, &cfg.channel.host, &port)) {
            std::cerr << "/!\\ invalid server address '" << server_addr << "'\n";
            return 1;
        }
        cfg.channel.port_i32 = port;
    }
    if (insecure) cfg.channel.insecure_u32 = 1u;
    if (!ca_file.empty()) cfg.channel.ca_file = ca_file;
    if (!pin.empty()) {
        cfg.channel.pinned_sha256 = rh::normalizeFingerprint(pin);
        if (ca_file.empty()) cfg.channel.ca_file.clear();
    }
    if (record) cfg.recording.enabled_u32 = 1u;
    if (!record_dir.empty()) cfg.recording.destination_dir = record_dir;
    if (verbose) cfg.logging.console_level = "debug";
    cfg.logging.component = "receiver";
    rh::finalizeReceiverConfig(&cfg);

    if (!cfg.channel.insecure_u32 && cfg.channel.pinned_sha256.empty() && !fileReadable(cfg.channel.ca_file)) {
        std::cerr << "/!\\ TLS certificate '" << cfg.channel.ca_file
                  << "' cannot be read; copy the server certificate, pin it with --pin or pass --insecure\n";
        return 1;
    }

    if (!rh::setupLogging(cfg.logging, &err)) {
        std::cerr << "/!\\ logging: " << err << "\n";
        return 1;
    }
    std::vector<char> text(4096);
    rh::exportReceiverConfigText(cfg, text.data(), static_cast<int>(text.size()));
    spdlog::debug("effective configuration:\n{}", text.data());

    const std::string dir = cfg.device_dir;
    rh::device::DeviceRegistry registry(cfg.devices, [dir]() { return rh::device::discoverEvdevRumbleDevices(dir); });
    const std::size_t found = registry.discover();
    if (found == 0) {
        spdlog::warn("no rumble capable devices in {}; commands will be acknowledged {}", dir,
                     rh::ackStatusName(rh::AckStatus::DeviceError));
    }
    for (const auto& st : registry.status()) {
        spdlog::info("device {} ({}) -> target '{}'", st.device_id, st.name, st.target);
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    rh::ChannelClient client(cfg.channel, registry, cfg.recording);
    const rh::ErrorCode rc = client.run(g_running);

    const rh::ReceiverStats st = client.stats();
    spdlog::info("received {} commands ({} malformed), acks ok={} err={} unknown={} stale={}, {} pre-empted",
                 st.commands_received, st.commands_malformed, st.acks.ok, st.acks.device_error,
                 st.acks.unknown_target, st.acks.stale, st.preemptions);

    if (rc != rh::ErrorCode::None) {
        std::cerr << "/!\\ " << rh::errorCodeName(rc) << ": " << client.lastErrorText() << "\n";
        rh::shutdownLogging();
        return 2;
    }
    rh::shutdownLogging();
    return 0;
}
