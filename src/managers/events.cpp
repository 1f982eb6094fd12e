#include "events.hpp"

const char* terminal_status_name(TerminalStatus status) {
    switch (status) {
    case TerminalStatus::Connecting:   return "connecting";
    case TerminalStatus::Connected:    return "connected";
    case TerminalStatus::Disconnected: return "disconnected";
    case TerminalStatus::Error:        return "error";
    }
    return "unknown";
}

const char* upload_stage_name(UploadStage stage) {
    switch (stage) {
    case UploadStage::Compress:    return "compress";
    case UploadStage::Upload:      return "upload";
    case UploadStage::RemoteUnzip: return "remote_unzip";
    case UploadStage::Cleanup:     return "cleanup";
    case UploadStage::Done:        return "done";
    case UploadStage::Error:       return "error";
    case UploadStage::Canceled:    return "canceled";
    }
    return "unknown";
}

ByteProgress make_progress(uint64_t transferred, uint64_t total) {
    ByteProgress p;
    p.transferred = transferred;
    p.total = total;
    p.percent = total > 0 ? static_cast<int>((transferred * 100) / total) : 100;
    return p;
}
