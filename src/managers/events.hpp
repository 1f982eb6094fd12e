#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Broadcast channel from the engine to observers (UI layer). Events for one
// terminal session or one upload task always come from a single thread, so
// per-session and per-task ordering is preserved.

enum class TerminalStatus {
    Connecting,
    Connected,
    Disconnected,
    Error,
};

const char* terminal_status_name(TerminalStatus status);

struct TerminalStatusEvent {
    std::string session_id;
    std::string connection_id;
    TerminalStatus status;
    std::optional<std::string> error;
};

struct TerminalOutputEvent {
    std::string session_id;
    uint64_t seq;
    std::string data;
};

enum class UploadStage {
    Compress,
    Upload,
    RemoteUnzip,
    Cleanup,
    Done,
    Error,
    Canceled,
};

const char* upload_stage_name(UploadStage stage);

struct ByteProgress {
    uint64_t transferred = 0;
    uint64_t total = 0;
    int percent = 0;
};

struct CompressProgress {
    size_t entries_done = 0;
    size_t entries_total = 0;
};

struct UploadEvent {
    std::string task_id;
    std::string connection_id;
    UploadStage stage;
    std::optional<std::string> message;
    std::optional<ByteProgress> bytes;
    std::optional<CompressProgress> compress;
};

struct DownloadEvent {
    std::string connection_id;
    std::string remote_path;
    std::string local_path;
    ByteProgress bytes;
};

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_terminal_status(const TerminalStatusEvent& event) = 0;
    virtual void on_terminal_output(const TerminalOutputEvent& event) = 0;
    virtual void on_upload(const UploadEvent& event) = 0;
    virtual void on_download(const DownloadEvent& event) = 0;
};

// Discards everything.
class NullEventSink : public EventSink {
public:
    void on_terminal_status(const TerminalStatusEvent&) override {}
    void on_terminal_output(const TerminalOutputEvent&) override {}
    void on_upload(const UploadEvent&) override {}
    void on_download(const DownloadEvent&) override {}
};

ByteProgress make_progress(uint64_t transferred, uint64_t total);
