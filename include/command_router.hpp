#pragma once

#include "recording_session.hpp"
#include "transcription_dispatcher.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace voxpipe {

enum class CommandKind {
    Start,
    Stop,
    Toggle,       // Stop when recording, Start otherwise
    Status,
    ListDevices
};

struct Command {
    CommandKind kind = CommandKind::Status;

    // Start / Toggle only
    bool paste = false;
    std::optional<std::string> prompt;
    bool music_was_playing = false;

    static Command start(bool paste = false, std::optional<std::string> prompt = std::nullopt) {
        Command cmd;
        cmd.kind = CommandKind::Start;
        cmd.paste = paste;
        cmd.prompt = std::move(prompt);
        return cmd;
    }
    static Command stop() { return Command{CommandKind::Stop}; }
    static Command toggle(bool paste = false) {
        Command cmd;
        cmd.kind = CommandKind::Toggle;
        cmd.paste = paste;
        return cmd;
    }
    static Command status() { return Command{CommandKind::Status}; }
};

struct Response {
    bool ok = false;
    std::string msg;
};

// Parses "start", "stop", "toggle", "status", "devices"
bool parse_command(const std::string& line, Command& out);

// Entry point for external commands. Owns no state of its own: recording
// state lives in the session, queued work in the dispatcher.
class CommandRouter {
public:
    using DeviceLister = std::function<std::vector<std::string>()>;

    CommandRouter(RecordingSession& session, TranscriptionDispatcher& dispatcher);
    ~CommandRouter();

    CommandRouter(const CommandRouter&) = delete;
    CommandRouter& operator=(const CommandRouter&) = delete;

    Response handle(const Command& cmd);

    void set_device_lister(DeviceLister lister) { device_lister_ = std::move(lister); }

private:
    Response handle_start(const Command& cmd);
    Response handle_stop();
    Response handle_status() const;
    Response handle_list_devices() const;

    // Hands a finished recording to the dispatcher (manual stop and auto-stop)
    void enqueue(StopResult result);

    RecordingSession& session_;
    TranscriptionDispatcher& dispatcher_;
    DeviceLister device_lister_;
};

} // namespace voxpipe
