#include "console_sink.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

void ConsoleEventSink::watch_session(const std::string& session_id,
                                     const std::function<OutputSnapshot()>& backlog) {
    std::lock_guard<std::mutex> lock(mutex_);
    watched_ = session_id;
    session_ended_ = false;
    auto snapshot = backlog();
    for (const auto& chunk : snapshot.chunks) std::cout << chunk.data;
    std::cout.flush();
    printed_seq_ = snapshot.last_seq;
}

void ConsoleEventSink::unwatch_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    watched_.clear();
    printed_seq_ = 0;
}

void ConsoleEventSink::reset_upload() {
    upload_finished_ = false;
    upload_failed_ = false;
}

void ConsoleEventSink::on_terminal_status(const TerminalStatusEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (event.session_id != watched_) return;
    if (event.status == TerminalStatus::Disconnected || event.status == TerminalStatus::Error) {
        session_ended_ = true;
    }
    if (event.error) {
        std::cout << "\r\n" << theme::fail(*event.error) << std::flush;
    }
}

void ConsoleEventSink::on_terminal_output(const TerminalOutputEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (event.session_id != watched_ || event.seq <= printed_seq_) return;
    printed_seq_ = event.seq;
    std::cout.write(event.data.data(), static_cast<std::streamsize>(event.data.size()));
    std::cout.flush();
}

void ConsoleEventSink::on_upload(const UploadEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (event.stage) {
        case UploadStage::Compress:
            if (event.compress && event.compress->entries_total > 0) {
                std::cout << fmt::format("\r    compress  {}/{} entries",
                                         event.compress->entries_done,
                                         event.compress->entries_total) << std::flush;
            }
            break;
        case UploadStage::Upload:
            if (event.bytes) {
                std::cout << fmt::format("\r    upload    {:>3}%  {} / {} bytes",
                                         event.bytes->percent, event.bytes->transferred,
                                         event.bytes->total) << std::flush;
            }
            break;
        case UploadStage::RemoteUnzip:
            std::cout << "\n" << theme::step("Extracting on remote host");
            break;
        case UploadStage::Cleanup:
            break;
        case UploadStage::Done:
            std::cout << "\n" << theme::ok("Upload complete");
            upload_finished_ = true;
            break;
        case UploadStage::Error:
            std::cout << "\n" << theme::fail(event.message.value_or("Upload failed"));
            upload_failed_ = true;
            upload_finished_ = true;
            break;
        case UploadStage::Canceled:
            std::cout << "\n" << theme::info("Upload canceled");
            upload_failed_ = true;
            upload_finished_ = true;
            break;
    }
}

void ConsoleEventSink::on_download(const DownloadEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << fmt::format("\r    download  {:>3}%  {} / {} bytes", event.bytes.percent,
                             event.bytes.transferred, event.bytes.total) << std::flush;
}
