#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <managers/events.hpp>
#include <managers/output_ring.hpp>

// Renders engine events on the console. Terminal output is written raw so
// an attached shell behaves like a local one.
class ConsoleEventSink : public EventSink {
public:
    void on_terminal_status(const TerminalStatusEvent& event) override;
    void on_terminal_output(const TerminalOutputEvent& event) override;
    void on_upload(const UploadEvent& event) override;
    void on_download(const DownloadEvent& event) override;

    // Start echoing a terminal session. `backlog` returns what the session
    // produced so far; it is printed first and later events are only
    // printed past its last sequence number.
    void watch_session(const std::string& session_id,
                       const std::function<OutputSnapshot()>& backlog);
    void unwatch_session();

    // Set once the watched terminal session disconnects or fails.
    bool session_ended() const { return session_ended_; }

    // Last terminal stage seen for an upload task (done, error or canceled).
    bool upload_finished() const { return upload_finished_; }
    bool upload_failed() const { return upload_failed_; }
    void reset_upload();

private:
    std::mutex mutex_;
    std::string watched_;
    uint64_t printed_seq_ = 0;
    std::atomic<bool> session_ended_{false};
    std::atomic<bool> upload_finished_{false};
    std::atomic<bool> upload_failed_{false};
};
