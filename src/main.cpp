#include "audio_capture.hpp"
#include "command_router.hpp"
#include "config.hpp"
#include "dictionary.hpp"
#include "recording_session.hpp"
#include "transcriber.hpp"
#include "transcription_dispatcher.hpp"
#include <atomic>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <poll.h>
#include <unistd.h>

static std::atomic<bool> g_should_quit{false};

void signal_handler(int signum) {
    (void)signum;
    g_should_quit.store(true);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -q, --quality MODE     Quality mode: fast, balanced, accurate, best (default: balanced)\n"
              << "  -m, --model-dir DIR    Directory containing models (default: models)\n"
              << "  -t, --threads N        CPU threads per transcription (default: 4)\n"
              << "  -l, --language LANG    Language hint (default: ja)\n"
              << "  -c, --concurrency N    Simultaneous transcriptions (default: 2)\n"
              << "  -s, --max-seconds N    Auto-stop after N seconds (default: 30)\n"
              << "  -p, --prompt TEXT      Initial prompt with vocabulary hints\n"
              << "  -d, --dict FROM=TO     Add a dictionary replacement (repeatable)\n"
              << "  --gpu                  Use GPU acceleration if whisper was built with it\n"
              << "  --no-flac              Encode recordings as WAV\n"
              << "  --list-devices         List input devices and exit\n"
              << "  -h, --help             Show this help\n"
              << "\nCommands (one per line on stdin):\n"
              << "  start, start-paste, stop, toggle, status, devices, quit\n"
              << "\nEnvironment:\n"
              << "  INPUT_DEVICE_PRIORITY  Comma-separated input device names, most preferred first\n"
              << std::endl;
}

// Waits up to timeout_ms for a line on stdin
static bool stdin_ready(int timeout_ms) {
    if (std::cin.rdbuf()->in_avail() > 0) return true;
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    return poll(&pfd, 1, timeout_ms) > 0;
}

int main(int argc, char* argv[]) {
    voxpipe::Config config;
    config.apply_environment();

    std::vector<voxpipe::WordEntry> dictionary_entries;
    bool list_devices = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-q") == 0 || strcmp(argv[i], "--quality") == 0) && i + 1 < argc) {
            const char* mode = argv[++i];
            if (strcmp(mode, "fast") == 0) {
                config.whisper.model_quality = voxpipe::ModelQuality::Fast;
            } else if (strcmp(mode, "balanced") == 0) {
                config.whisper.model_quality = voxpipe::ModelQuality::Balanced;
            } else if (strcmp(mode, "accurate") == 0) {
                config.whisper.model_quality = voxpipe::ModelQuality::Accurate;
            } else if (strcmp(mode, "best") == 0) {
                config.whisper.model_quality = voxpipe::ModelQuality::Best;
            } else {
                std::cerr << "Unknown quality mode: " << mode << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model-dir") == 0) && i + 1 < argc) {
            config.whisper.model_dir = argv[++i];
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            config.whisper.n_threads = std::atoi(argv[++i]);
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            config.dispatch.language = argv[++i];
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--concurrency") == 0) && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            config.dispatch.max_concurrent = n > 0 ? static_cast<size_t>(n) : 1;
        }
        else if ((strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--max-seconds") == 0) && i + 1 < argc) {
            int secs = std::atoi(argv[++i]);
            if (secs <= 0) {
                std::cerr << "Invalid max seconds: " << argv[i] << std::endl;
                return 1;
            }
            config.max_recording_seconds = secs;
        }
        else if ((strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--prompt") == 0) && i + 1 < argc) {
            config.whisper.initial_prompt = argv[++i];
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--dict") == 0) && i + 1 < argc) {
            std::string pair = argv[++i];
            size_t eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Dictionary entry must be FROM=TO: " << pair << std::endl;
                return 1;
            }
            voxpipe::WordEntry entry;
            entry.surface = pair.substr(0, eq);
            entry.replacement = pair.substr(eq + 1);
            dictionary_entries.push_back(entry);
        }
        else if (strcmp(argv[i], "--gpu") == 0) {
            config.whisper.use_gpu = true;
        }
        else if (strcmp(argv[i], "--no-flac") == 0) {
            config.encoding.prefer_flac = false;
        }
        else if (strcmp(argv[i], "--list-devices") == 0) {
            list_devices = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    voxpipe::AudioCapture audio(config.capture_config(), config.processing, config.encoding);
    if (!audio.initialize()) {
        std::cerr << "Failed to initialize audio capture" << std::endl;
        return 1;
    }

    if (list_devices) {
        for (const auto& name : audio.list_input_devices()) {
            std::cout << name << std::endl;
        }
        return 0;
    }

    std::cout << "voxpipe - voice capture and transcription\n" << std::endl;
    std::cout << "Quality: " << voxpipe::get_profile(config.whisper.model_quality).name << std::endl;
    std::cout << "Model: " << config.whisper.get_model_path() << std::endl;
    std::cout << "Threads: " << config.whisper.n_threads << std::endl;
    std::cout << "Language: " << config.dispatch.language << std::endl;
    std::cout << "Concurrency: " << config.dispatch.max_concurrent << std::endl;
    std::cout << "Auto-stop: " << config.max_recording_seconds << "s" << std::endl;
    std::cout << "Encoding: " << (config.encoding.prefer_flac ? "flac" : "wav") << std::endl;
    std::cout << std::endl;

    voxpipe::Transcriber transcriber;
    if (!transcriber.initialize(config.whisper.get_model_path(), config.whisper.n_threads,
                                config.whisper.use_gpu)) {
        std::cerr << "Failed to initialize transcriber" << std::endl;
        return 1;
    }
    transcriber.set_profile(voxpipe::get_profile(config.whisper.model_quality));
    if (!config.whisper.initial_prompt.empty()) {
        transcriber.set_initial_prompt(config.whisper.initial_prompt);
    }

    voxpipe::InMemoryDictRepository dictionary(dictionary_entries);

    voxpipe::TranscriptionDispatcher dispatcher(transcriber, dictionary, config.dispatch);
    dispatcher.set_text_consumer([](const voxpipe::TranscriptionOutcome& outcome) {
        std::cout << "[session " << outcome.session_id << (outcome.paste ? ", paste" : "")
                  << "] " << outcome.text << std::endl;
    });
    dispatcher.start();

    voxpipe::RecordingSession session(audio, config.session_config());
    voxpipe::CommandRouter router(session, dispatcher);
    router.set_device_lister([&audio]() { return audio.list_input_devices(); });

    std::cout << "Ready. Type a command (start, stop, toggle, status, devices, quit)." << std::endl;

    std::string line;
    while (!g_should_quit.load()) {
        if (!stdin_ready(100)) continue;
        if (!std::getline(std::cin, line)) break;
        if (line == "quit" || line == "exit") break;
        if (line.empty()) continue;

        voxpipe::Command cmd;
        if (!voxpipe::parse_command(line, cmd)) {
            std::cerr << "Unknown command: " << line << std::endl;
            continue;
        }

        voxpipe::Response resp = router.handle(cmd);
        (resp.ok ? std::cout : std::cerr) << resp.msg << std::endl;
    }

    std::cout << "Shutting down..." << std::endl;

    // Whatever is still recording is transcribed before exit
    if (session.is_recording()) {
        voxpipe::Response resp = router.handle(voxpipe::Command::stop());
        (resp.ok ? std::cout : std::cerr) << resp.msg << std::endl;
    }
    // An auto-stop that fired first is still submitting its recording
    session.wait_auto_stop_idle();
    dispatcher.shutdown();
    audio.shutdown();

    return 0;
}
