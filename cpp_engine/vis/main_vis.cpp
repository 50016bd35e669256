// main_vis.cpp: haptic monitor (detector and scheduler tuning)
// - Runs ImpulseExtractor + EventScheduler against a simulated player clock
// - Player controls (play/pause, speed, seek) change PlaybackState the way the
//   mpv tracker does: pause/speed bump the sequence, seek bumps sequence and seek count
// - Plots per-band level/onset/threshold, detected impulses and dispatched commands
// - Detector sliders rebuild the extractor at the current position
// - Audio: --file <clip> (libsndfile) or a generated drum pattern

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "EventScheduler.h"
#include "HapticsConfig.h"
#include "ImpulseExtractor.h"
#include "Logging.h"

#include "../audio/sndfile_source.h"

#include "imgui.h"
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#include <GLFW/glfw3.h>
#include <GL/gl.h>

#include <spdlog/spdlog.h>

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    return EXIT_FAILURE;
}

// ============================================================
// Generated clip: kick on every beat, snare on 2 and 4, closed hat on eighths
// ============================================================

static constexpr double kPi = 3.14159265358979323846;

static std::unique_ptr<rh::MemoryAudioSource> make_drum_clip(double seconds, int rate_hz, double bpm) {
    const long frames = static_cast<long>(seconds * rate_hz);
    std::vector<float> pcm(static_cast<std::size_t>(frames), 0.0f);
    std::mt19937 rng(7u);
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);

    const double beat_s = 60.0 / bpm;
    auto add_hit = [&](double t0_s, double len_s, double gain, bool tonal, double freq_hz) {
        const long f0 = static_cast<long>(t0_s * rate_hz);
        const long n = static_cast<long>(len_s * rate_hz);
        for (long i = 0; i < n && f0 + i < frames; ++i) {
            const double t = static_cast<double>(i) / rate_hz;
            const double env = std::exp(-t / (0.25 * len_s));
            const double s = tonal ? std::sin(2.0 * kPi * freq_hz * t) : static_cast<double>(noise(rng));
            pcm[static_cast<std::size_t>(f0 + i)] += static_cast<float>(gain * env * s);
        }
    };

    int beat = 0;
    for (double t = 0.25; t < seconds; t += beat_s, ++beat) {
        add_hit(t, 0.15, 0.8, true, 55.0);
        if (beat % 2 == 1) add_hit(t, 0.12, 0.35, false, 0.0);
        add_hit(t + 0.5 * beat_s, 0.03, 0.12, false, 0.0);
    }
    for (auto& s : pcm) s = std::max(-1.0f, std::min(1.0f, s));
    return std::make_unique<rh::MemoryAudioSource>(std::move(pcm), rate_hz, 1);
}

// ============================================================
// Simulated player
// ============================================================

struct SimPlayer {
    double position_s = 0.0;
    double captured_at_s = 0.0;
    double speed = 1.0;
    bool paused = true;
    bool end_of_media = false;
    std::uint64_t sequence = 0;
    std::uint64_t seek_count = 0;
    double duration_s = 0.0;

    rh::PlaybackState state() const {
        rh::PlaybackState s;
        s.position_s = position_s;
        s.rate = (paused || end_of_media) ? 0.0 : speed;
        s.sequence = sequence;
        s.seek_count = seek_count;
        s.captured_at_s = captured_at_s;
        s.end_of_media = end_of_media;
        return s;
    }

    double positionAt(double now_s) const { return state().positionAt(now_s); }

    void reanchor(double now_s) {
        position_s = positionAt(now_s);
        captured_at_s = now_s;
    }

    void setPaused(bool p, double now_s) {
        if (p == paused) return;
        reanchor(now_s);
        paused = p;
        ++sequence;
    }

    void setSpeed(double v, double now_s) {
        reanchor(now_s);
        speed = v;
        if (!paused) ++sequence;
    }

    void seek(double pos_s, double now_s) {
        position_s = std::max(0.0, std::min(pos_s, duration_s));
        captured_at_s = now_s;
        end_of_media = false;
        ++sequence;
        ++seek_count;
    }

    void update(double now_s) {
        if (!end_of_media && positionAt(now_s) >= duration_s) {
            reanchor(now_s);
            position_s = duration_s;
            end_of_media = true;
            ++sequence;
        }
    }
};

// ============================================================
// Rolling traces
// ============================================================

struct BandTrace {
    std::vector<double> level;
    std::vector<double> onset;
    std::vector<double> threshold;
};

struct MonitorTrace {
    static constexpr std::size_t kMaxHops = 6000;

    std::vector<double> t;
    std::array<BandTrace, rh::kNumFrequencyBands> bands;

    std::vector<double> impulse_t;
    std::vector<double> impulse_mag;

    std::vector<double> command_t;   // media time of the source impulse
    std::vector<double> command_int;
    std::vector<double> lateness_ms; // collect time - dispatch time

    void clear() { *this = MonitorTrace(); }

    void addFrame(const rh::ExtractorFrameV1& f) {
        if (t.size() >= kMaxHops) {
            const std::size_t drop = kMaxHops / 4;
            t.erase(t.begin(), t.begin() + drop);
            for (auto& b : bands) {
                b.level.erase(b.level.begin(), b.level.begin() + drop);
                b.onset.erase(b.onset.begin(), b.onset.begin() + drop);
                b.threshold.erase(b.threshold.begin(), b.threshold.begin() + drop);
            }
        }
        t.push_back(f.t_s);
        for (int i = 0; i < rh::kNumFrequencyBands; ++i) {
            bands[i].level.push_back(f.level_0_1[i]);
            bands[i].onset.push_back(f.onset[i]);
            bands[i].threshold.push_back(f.threshold[i]);
        }
    }
};

// ============================================================
// Pipeline under test
// ============================================================

struct MonitorPipeline {
    rh::AudioSource* source = nullptr;
    rh::ImpulseDetectorConfigV1 detector;
    rh::SchedulerConfigV1 scheduler_cfg;
    double lookahead_s = 1.0;

    std::unique_ptr<rh::ImpulseExtractor> extractor;
    std::unique_ptr<rh::EventScheduler> scheduler;
    MonitorTrace trace;
    bool extraction_done = false;
    std::string status;

    void rebuild(double position_s) {
        extractor = std::make_unique<rh::ImpulseExtractor>(*source, detector);
        extractor->setFrameObserver([this](const rh::ExtractorFrameV1& f) { trace.addFrame(f); });
        scheduler = std::make_unique<rh::EventScheduler>(scheduler_cfg);
        scheduler->begin();
        trace.clear();
        restart(position_s);
    }

    void restart(double position_s) {
        extraction_done = !extractor->restart(position_s);
        status = extraction_done ? extractor->lastErrorText() : std::string();
    }

    void step(const SimPlayer& player, double now_s) {
        const rh::PlaybackState st = player.state();
        while (!extraction_done && extractor->consumedTime_s() < st.positionAt(now_s) + lookahead_s) {
            rh::ImpulseEvent ev;
            const rh::ExtractStatus r = extractor->nextImpulse(&ev);
            if (r == rh::ExtractStatus::Impulse) {
                trace.impulse_t.push_back(ev.timestamp_s);
                trace.impulse_mag.push_back(ev.magnitude_0_1);
                scheduler->submit(ev, st, now_s);
            } else {
                extraction_done = true;
                status = (r == rh::ExtractStatus::Error) ? extractor->lastErrorText() : "end of audio";
            }
        }

        std::vector<rh::Dispatch> due;
        scheduler->collectDue(st, now_s, &due);
        for (const auto& d : due) {
            trace.command_t.push_back(d.command.impulse_timestamp_s);
            trace.command_int.push_back(d.command.intensity_0_1);
            trace.lateness_ms.push_back(1000.0 * (now_s - d.command.dispatch_time_s));
        }
    }
};

static void plot_band(const char* title, const MonitorTrace& tr, int band, double t0, double t1) {
    const int count = static_cast<int>(tr.t.size());
    if (count <= 1) return;
    if (ImPlot::BeginPlot(title, ImVec2(-1, 170))) {
        ImPlot::SetupAxes("media time (s)", nullptr);
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
        ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 1.0, ImGuiCond_Once);
        const BandTrace& b = tr.bands[static_cast<std::size_t>(band)];
        ImPlot::PlotLine("level", tr.t.data(), b.level.data(), count);
        ImPlot::PlotLine("onset", tr.t.data(), b.onset.data(), count);
        ImPlot::PlotLine("threshold", tr.t.data(), b.threshold.data(), count);
        ImPlot::EndPlot();
    }
}

int main(int argc, char** argv) {
    std::string audio_file;
    std::string config_file;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--file" && i + 1 < argc) {
            audio_file = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            std::fprintf(stderr, "haptic_monitor [--file clip.wav] [--config sender.json]\n");
            return EXIT_FAILURE;
        }
    }

    rh::SenderConfigV1 cfg;
    std::string err;
    if (!config_file.empty() && !rh::loadSenderConfig(config_file, &cfg, &err)) return fail(err.c_str());
    cfg.logging.component = "monitor";
    cfg.logging.file_sinks_u32 = 0;
    if (!rh::setupLogging(cfg.logging, &err)) return fail(err.c_str());

    std::unique_ptr<rh::AudioSource> source;
    double duration_s = 0.0;
    if (!audio_file.empty()) {
        std::unique_ptr<rh::audio::SndFileSource> f = rh::audio::SndFileSource::open(audio_file, &err);
        if (!f) return fail(err.c_str());
        duration_s = f->duration_s();
        source = std::move(f);
    } else {
        std::unique_ptr<rh::MemoryAudioSource> m = make_drum_clip(60.0, 44100, 120.0);
        duration_s = static_cast<double>(m->frameCount()) / m->sampleRate_hz();
        source = std::move(m);
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 800, "RemoteHaptics Monitor", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();
    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        ImGui_ImplGlfw_Shutdown();
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }

    SimPlayer player;
    player.duration_s = duration_s;
    player.captured_at_s = rh::monotonicNow_s();

    MonitorPipeline pipe;
    pipe.source = source.get();
    pipe.detector = cfg.detector;
    pipe.scheduler_cfg = cfg.scheduler;
    pipe.lookahead_s = cfg.pipeline.lookahead_s;
    pipe.rebuild(0.0);

    float window_s = 8.0f;
    float speed = 1.0f;
    float seek_to = 0.0f;
    int band_mode = static_cast<int>(rh::FrequencyBand::All);
    bool show_config = false;
    std::vector<char> config_text(8192);

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        const double now_s = rh::monotonicNow_s();
        player.update(now_s);
        pipe.step(player, now_s);
        const double pos_s = player.positionAt(now_s);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_Once);
        ImGui::SetNextWindowSize(ImVec2(360, 760), ImGuiCond_Once);
        ImGui::Begin("Player / Detector");
        ImGui::Text("position %.2f / %.2f s", pos_s, player.duration_s);
        ImGui::Text("sequence %llu  seeks %llu", static_cast<unsigned long long>(player.sequence),
                    static_cast<unsigned long long>(player.seek_count));
        if (ImGui::Button(player.paused ? "Play" : "Pause")) player.setPaused(!player.paused, now_s);
        ImGui::SameLine();
        if (ImGui::Button("Restart")) {
            player.seek(0.0, now_s);
            pipe.restart(0.0);
        }
        if (ImGui::SliderFloat("speed", &speed, 0.25f, 2.0f, "%.2fx")) player.setSpeed(speed, now_s);
        ImGui::SliderFloat("seek to (s)", &seek_to, 0.0f, static_cast<float>(player.duration_s));
        if (ImGui::Button("Seek")) {
            player.seek(seek_to, now_s);
            pipe.restart(player.position_s);
        }

        ImGui::Separator();
        bool detector_changed = false;
        const char* bands[] = {"all", "bass", "mid", "treble"};
        if (ImGui::Combo("band", &band_mode, bands, rh::kNumFrequencyBands)) {
            pipe.detector.band_mask_u32 = rh::bandMaskFor(static_cast<rh::FrequencyBand>(band_mode));
            detector_changed = true;
        }
        float thr_k = static_cast<float>(pipe.detector.threshold_k);
        float floor = static_cast<float>(pipe.detector.threshold_floor_0_1);
        float interval = static_cast<float>(pipe.detector.min_interval_s);
        float history = static_cast<float>(pipe.detector.history_s);
        if (ImGui::SliderFloat("threshold k", &thr_k, 0.0f, 5.0f)) {
            pipe.detector.threshold_k = thr_k;
            detector_changed = true;
        }
        if (ImGui::SliderFloat("threshold floor", &floor, 0.0f, 0.5f)) {
            pipe.detector.threshold_floor_0_1 = floor;
            detector_changed = true;
        }
        if (ImGui::SliderFloat("min interval (s)", &interval, 0.0f, 0.5f)) {
            pipe.detector.min_interval_s = interval;
            detector_changed = true;
        }
        if (ImGui::SliderFloat("history (s)", &history, 0.05f, 2.0f)) {
            pipe.detector.history_s = history;
            detector_changed = true;
        }
        if (detector_changed) pipe.rebuild(pos_s);

        ImGui::SliderFloat("plot window (s)", &window_s, 1.0f, 30.0f);

        ImGui::Separator();
        const rh::SchedulerStats& st = pipe.scheduler->stats();
        ImGui::Text("scheduler: %s", rh::schedulerStateName(pipe.scheduler->state()));
        ImGui::Text("pending %zu  paused queue %zu", pipe.scheduler->pendingCount(), pipe.scheduler->queuedCount());
        ImGui::Text("submitted %llu  dispatched %llu", static_cast<unsigned long long>(st.submitted),
                    static_cast<unsigned long long>(st.dispatched));
        ImGui::Text("rescheduled %llu  discarded (seq) %llu", static_cast<unsigned long long>(st.rescheduled),
                    static_cast<unsigned long long>(st.discarded_stale));
        ImGui::Text("late drops %llu  overflow %llu  pre-empted %llu", static_cast<unsigned long long>(st.dropped_late),
                    static_cast<unsigned long long>(st.dropped_overflow),
                    static_cast<unsigned long long>(st.preempted));
        if (!pipe.status.empty()) ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.2f, 1.0f), "extractor: %s", pipe.status.c_str());

        ImGui::Checkbox("show config", &show_config);
        if (show_config) {
            rh::SenderConfigV1 shown = cfg;
            shown.detector = pipe.detector;
            rh::exportSenderConfigText(shown, config_text.data(), static_cast<int>(config_text.size()));
            ImGui::TextUnformatted(config_text.data());
        }
        ImGui::End();

        ImGui::SetNextWindowPos(ImVec2(380, 10), ImGuiCond_Once);
        ImGui::SetNextWindowSize(ImVec2(890, 760), ImGuiCond_Once);
        ImGui::Begin("Traces");
        const double t1 = pos_s + 0.25 * window_s;
        const double t0 = t1 - window_s;
        plot_band("Active band", pipe.trace, band_mode, t0, t1);

        if (ImPlot::BeginPlot("Impulses and commands", ImVec2(-1, 220))) {
            ImPlot::SetupAxes("media time (s)", "0..1");
            ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
            ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 1.05, ImGuiCond_Always);
            if (!pipe.trace.impulse_t.empty()) {
                ImPlot::PlotScatter("impulse", pipe.trace.impulse_t.data(), pipe.trace.impulse_mag.data(),
                                    static_cast<int>(pipe.trace.impulse_t.size()));
            }
            if (!pipe.trace.command_t.empty()) {
                ImPlot::PlotStems("command", pipe.trace.command_t.data(), pipe.trace.command_int.data(),
                                  static_cast<int>(pipe.trace.command_t.size()));
            }
            const double xs[2] = {pos_s, pos_s};
            const double ys[2] = {0.0, 1.05};
            ImPlot::PlotLine("playhead", xs, ys, 2);
            ImPlot::EndPlot();
        }

        if (ImPlot::BeginPlot("Dispatch lateness", ImVec2(-1, 180))) {
            ImPlot::SetupAxes("command", "ms");
            ImPlot::SetupAxisLimits(ImAxis_Y1, -5.0, 40.0, ImGuiCond_Once);
            if (!pipe.trace.lateness_ms.empty()) {
                ImPlot::PlotLine("collect - dispatch", pipe.trace.lateness_ms.data(),
                                 static_cast<int>(pipe.trace.lateness_ms.size()));
            }
            ImPlot::EndPlot();
        }
        ImGui::End();

        ImGui::Render();
        int display_w = 0;
        int display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.06f, 0.06f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }

    ImPlot::DestroyContext();
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    rh::shutdownLogging();
    return 0;
}
