#include "command_router.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace voxpipe {

bool parse_command(const std::string& line, Command& out) {
    size_t start = line.find_first_not_of(" \t\r\n");
    size_t end = line.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return false;
    std::string word = line.substr(start, end - start + 1);

    if (word == "start") {
        out = Command::start();
    } else if (word == "start-paste") {
        out = Command::start(true);
    } else if (word == "stop") {
        out = Command::stop();
    } else if (word == "toggle") {
        out = Command::toggle();
    } else if (word == "status") {
        out = Command::status();
    } else if (word == "devices") {
        out = Command{CommandKind::ListDevices};
    } else {
        return false;
    }
    return true;
}

CommandRouter::CommandRouter(RecordingSession& session, TranscriptionDispatcher& dispatcher)
    : session_(session)
    , dispatcher_(dispatcher) {
    // A timed-out recording takes the same route as a manual stop
    session_.set_auto_stop_handler([this](StopResult result) {
        if (!result.status.success) {
            std::cerr << "Auto-stop failed: " << result.status.error << std::endl;
            return;
        }
        enqueue(std::move(result));
    });
}

CommandRouter::~CommandRouter() {
    session_.set_auto_stop_handler(nullptr);
    // A handler copied before the reset may still be calling into this router
    session_.wait_auto_stop_idle();
}

Response CommandRouter::handle(const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::Start:
            return handle_start(cmd);
        case CommandKind::Stop:
            return handle_stop();
        case CommandKind::Toggle:
            if (session_.is_recording()) {
                return handle_stop();
            }
            return handle_start(cmd);
        case CommandKind::Status:
            return handle_status();
        case CommandKind::ListDevices:
            return handle_list_devices();
        default:
            return Response{false, "unknown command"};
    }
}

Response CommandRouter::handle_start(const Command& cmd) {
    RecordingOptions options;
    options.prompt = cmd.prompt;
    options.paste = cmd.paste;
    options.music_was_playing = cmd.music_was_playing;

    StartResult result = session_.start(options);
    if (!result.status.success) {
        return Response{false, result.status.error};
    }

    auto max_secs = std::chrono::duration_cast<std::chrono::seconds>(
        session_.config().max_duration).count();
    return Response{true, "recording started (auto-stop in " + std::to_string(max_secs) + "s)"};
}

Response CommandRouter::handle_stop() {
    StopResult result = session_.stop();
    if (!result.status.success) {
        return Response{false, result.status.error};
    }

    enqueue(std::move(result));
    return Response{true, "recording stopped; queued"};
}

Response CommandRouter::handle_status() const {
    return Response{true, session_.is_recording() ? "state=Recording" : "state=Idle"};
}

Response CommandRouter::handle_list_devices() const {
    std::vector<std::string> devices;
    if (device_lister_) devices = device_lister_();

    if (devices.empty()) {
        return Response{true, "No input devices detected"};
    }

    std::string msg;
    for (size_t i = 0; i < devices.size(); ++i) {
        if (i > 0) msg += "\n";
        msg += devices[i];
    }
    return Response{true, msg};
}

void CommandRouter::enqueue(StopResult result) {
    TranscriptionJob job;
    job.audio = std::move(result.audio);
    job.session_id = result.session_id;
    job.paste = result.paste;
    job.resume_music = result.music_was_playing;

    std::cout << "Queued session " << job.session_id << " (" << job.audio.bytes.size()
              << " bytes " << job.audio.mime_type << ", " << result.duration_ms << "ms)"
              << std::endl;

    // Outcome reaches the text consumer; the future is not needed here
    dispatcher_.submit(std::move(job));
}

} // namespace voxpipe
