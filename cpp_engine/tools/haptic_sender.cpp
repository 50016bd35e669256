#include "HapticsConfig.h"
#include "HapticsSender.h"
#include "Logging.h"

#include "../audio/pulse_capture_source.h"
#include "../audio/sndfile_source.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) { g_running.store(false); }

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

bool fileReadable(const std::string& path) {
    std::ifstream f(path);
    return static_cast<bool>(f);
}

// "host:port", "host" or ":port".
bool splitHostPort(const std::string& addr, std::string* host, int* port) {
    const std::size_t colon = addr.rfind(':');
    if (colon == std::string::npos) {
        *host = addr;
        return true;
    }
    *host = addr.substr(0, colon);
    try {
        *port = std::stoi(addr.substr(colon + 1));
    } catch (const std::exception&) {
        return false;
    }
    return *port > 0 && *port < 65536;
}

void printUsage() {
    std::cout << "haptic_sender usage:\n"
              << "  haptic_sender [-c config.json] [-w] [-l host:port] [-k] [--ssl-cert f] [--ssl-key f]\n"
              << "                [-f audio_file] [-m all|bass|mid|treble] [--mpv-socket path] [--no-player]\n"
              << "                [--print-config] [-v]\n"
              << "  Without -f the default PulseAudio monitor is captured live.\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/sender.json";
    bool config_explicit = false;
    bool write_config = false;
    bool print_config = false;
    bool verbose = false;

    // Overrides applied after the file is loaded.
    std::string listen;
    bool insecure = false;
    std::string ssl_cert;
    std::string ssl_key;
    std::string audio_file;
    std::string audio_mode;
    std::string mpv_socket;
    bool no_player = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
            config_explicit = true;
        } else if (arg == "-w" || arg == "--write-config") {
            write_config = true;
        } else if ((arg == "-l" || arg == "--listen") && i + 1 < argc) {
            listen = argv[++i];
        } else if (arg == "-k" || arg == "--insecure") {
            insecure = true;
        } else if (arg == "--ssl-cert" && i + 1 < argc) {
            ssl_cert = argv[++i];
        } else if (arg == "--ssl-key" && i + 1 < argc) {
            ssl_key = argv[++i];
        } else if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
            audio_file = argv[++i];
        } else if ((arg == "-m" || arg == "--audio-mode") && i + 1 < argc) {
            audio_mode = toLower(argv[++i]);
        } else if (arg == "--mpv-socket" && i + 1 < argc) {
            mpv_socket = argv[++i];
        } else if (arg == "--no-player") {
            no_player = true;
        } else if (arg == "--print-config") {
            print_config = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    rh::SenderConfigV1 cfg;
    std::string err;
    if (write_config) {
        rh::finalizeSenderConfig(&cfg);
        if (!rh::saveSenderConfig(config_path, cfg, &err)) {
            std::cerr << "/!\\ " << err << "\n";
            return 1;
        }
        std::cout << "Wrote sample configuration to: " << config_path << "\n";
        return 0;
    }
    if (config_explicit || fileReadable(config_path)) {
        if (!rh::loadSenderConfig(config_path, &cfg, &err)) {
            std::cerr << "/!\\ " << rh::errorCodeName(rh::ErrorCode::ConfigError) << ": " << err << "\n";
            return 1;
        }
    }

    if (!listen.empty()) {
        int port = cfg.channel.port_i32;
        if (!splitHostPort(listen, &cfg.channel.bind_address, &port)) {
            std::cerr << "/!\\ invalid listen address '" << listen << "'\n";
            return 1;
        }
        cfg.channel.port_i32 = port;
    }
    if (insecure) cfg.channel.insecure_u32 = 1u;
    if (!ssl_cert.empty()) cfg.channel.cert_file = ssl_cert;
    if (!ssl_key.empty()) cfg.channel.key_file = ssl_key;
    if (!audio_file.empty()) cfg.audio_file = audio_file;
    if (!audio_mode.empty()) {
        rh::FrequencyBand band = rh::FrequencyBand::All;
        if (!rh::parseFrequencyBand(audio_mode, &band)) {
            std::cerr << "/!\\ audio mode must be 'all', 'bass', 'mid' or 'treble'\n";
            return 1;
        }
        cfg.detector.band_mask_u32 = rh::bandMaskFor(band);
    }
    if (!mpv_socket.empty()) cfg.tracker.socket_path = mpv_socket;
    if (no_player) cfg.follow_player_u32 = 0u;
    if (verbose) cfg.logging.console_level = "debug";
    cfg.logging.component = "sender";
    rh::finalizeSenderConfig(&cfg);

    std::vector<char> text(8192);
    rh::exportSenderConfigText(cfg, text.data(), static_cast<int>(text.size()));
    if (print_config) {
        std::cout << text.data();
        return 0;
    }

    if (!cfg.channel.insecure_u32 && (!fileReadable(cfg.channel.cert_file) || !fileReadable(cfg.channel.key_file))) {
        std::cerr << "/!\\ TLS certificate '" << cfg.channel.cert_file << "' or key '" << cfg.channel.key_file
                  << "' cannot be read; create them or pass --insecure to disable encryption\n";
        return 1;
    }

    if (!rh::setupLogging(cfg.logging, &err)) {
        std::cerr << "/!\\ logging: " << err << "\n";
        return 1;
    }
    spdlog::debug("effective configuration:\n{}", text.data());

    std::unique_ptr<rh::AudioSource> source;
    if (!cfg.audio_file.empty()) {
        source = rh::audio::SndFileSource::open(cfg.audio_file, &err);
    } else {
        source = rh::audio::PulseCaptureSource::open(cfg.capture_source, static_cast<int>(cfg.capture_rate_hz_u32), &err);
    }
    if (!source) {
        spdlog::critical("{}: {}", rh::errorCodeName(rh::ErrorCode::DecodeError), err);
        std::cerr << "/!\\ cannot open audio: " << err << "\n";
        return 1;
    }

    std::unique_ptr<rh::PlaybackTracker> tracker;
    if (!source->isLive() && cfg.follow_player_u32) {
        tracker = std::make_unique<rh::PlaybackTracker>(cfg.tracker,
                                                        std::make_unique<rh::UnixSocketIpc>(cfg.tracker.socket_path));
    }

    rh::ChannelServer server(cfg.channel);
    if (!server.start(&err)) {
        spdlog::critical("channel: {}", err);
        std::cerr << "/!\\ cannot start command channel: " << err << "\n";
        return 1;
    }
    if (!cfg.channel.insecure_u32) {
        std::string fp;
        if (rh::certificateFileFingerprint(cfg.channel.cert_file, &fp, &err)) {
            spdlog::info("channel: certificate sha256 {}", fp);
        }
    }

    rh::HapticsSender sender(cfg.pipeline, cfg.detector, cfg.scheduler, *source, tracker.get(),
                             [&server](const rh::Dispatch& d) {
                                 if (d.preempted_command_id != 0) {
                                     spdlog::debug("sender: command {} pre-empts {} on '{}'", d.command.command_id,
                                                   d.preempted_command_id, d.command.device_target);
                                 }
                                 return server.dispatch(d.command);
                             });

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    if (tracker && !tracker->start()) {
        spdlog::critical("playback tracker failed to start");
        server.stop();
        return 1;
    }
    if (!sender.start()) {
        spdlog::critical("sender: {}", sender.lastErrorText());
        if (tracker) tracker->stop();
        server.stop();
        return 1;
    }

    double next_report_s = rh::monotonicNow_s() + 10.0;
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (rh::monotonicNow_s() < next_report_s) continue;
        next_report_s += 10.0;

        const rh::SenderStats ss = sender.stats();
        const rh::ChannelServerStats cs = server.stats();
        spdlog::info("status: {} receivers, {} impulses, {} dispatched ({} unrouted), acks ok={} err={} "
                     "unknown={} stale={}, {} ack timeouts, scheduler {}",
                     server.activeSessionCount(), ss.impulses_extracted, ss.scheduler.dispatched,
                     ss.commands_unrouted, cs.acks.ok, cs.acks.device_error, cs.acks.unknown_target, cs.acks.stale,
                     cs.ack_timeouts, rh::schedulerStateName(ss.scheduler_state));
    }

    spdlog::info("shutting down");
    sender.stop();
    if (tracker) tracker->stop();
    server.stop();
    rh::shutdownLogging();
    return 0;
}
