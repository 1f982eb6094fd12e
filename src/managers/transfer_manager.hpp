#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <ssh/transport.hpp>
#include "dir_lister.hpp"
#include "events.hpp"
#include "file_session_manager.hpp"

enum class UploadKind {
    File,
    Folder,
};

const char* upload_kind_name(UploadKind kind);
std::optional<UploadKind> parse_upload_kind(const std::string& value);

// Thrown inside a worker when the task was canceled between two steps.
class TransferCanceled : public std::runtime_error {
public:
    TransferCanceled() : std::runtime_error("Upload canceled") {}
};

// Uploads (single file, or folder via local zip + remote unzip) and
// downloads over the connection's File Session. Each upload runs on its own
// worker thread and reports through EventSink::on_upload; downloads run on
// the caller's thread.
class TransferManager {
public:
    TransferManager(FileSessionManager& sessions, DirLister& lister, EventSink& events,
                    std::string remote_tmp_dir = DEFAULT_REMOTE_TMP_DIR);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Validate the local path and start the worker. Returns the task id.
    // The kind is inferred from the local path when not given.
    std::string upload_start(const std::string& connection_id, const std::string& remote_dir,
                             const std::string& local_path,
                             std::optional<UploadKind> kind = std::nullopt);

    // Idempotent. False when no running task has that id, or the task is
    // past its last cancel point.
    bool upload_cancel(const std::string& task_id);

    // Stream a remote file to local_path, creating local parent directories.
    // Bytes land in a sibling temp file renamed over local_path on success,
    // so a failure leaves an existing local_path untouched.
    void download(const std::string& connection_id, const std::string& remote_path,
                  const std::string& local_path);

    size_t running_tasks();

    // Block until every started task has finished.
    void wait_all();

    // Cancel and join every task.
    void shutdown();

private:
    struct Task {
        std::string id;
        std::string connection_id;
        std::string remote_dir;
        std::filesystem::path local_path;
        UploadKind kind = UploadKind::File;
        std::atomic<bool> canceled{false};
        std::atomic<bool> finished{false};
        std::mutex cancel_mutex;
        std::function<void()> cancel_fn;   // stage-specific, guarded by cancel_mutex
        bool committed = false;            // past the last cancel point, guarded by cancel_mutex
        std::thread worker;
    };

    FileSessionManager& sessions_;
    DirLister& lister_;
    EventSink& events_;
    std::string remote_tmp_dir_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Task>> tasks_;
    uint64_t next_id_ = 1;

    void run_task(const std::shared_ptr<Task>& task);
    void upload_file(Task& task);
    void upload_folder(Task& task);

    // Stream a local file to remote_path emitting Upload-stage progress.
    // Canceling aborts the open remote handle; the partial remote file is
    // removed and TransferCanceled thrown. `last_stage` commits the task
    // once every byte is written.
    void stream_upload(Task& task, const std::filesystem::path& local,
                       const std::string& remote_path, bool last_stage);

    void set_cancel(Task& task, std::function<void()> fn);
    void check_canceled(const Task& task);

    // Last cancel point of a pipeline: throws TransferCanceled if a cancel
    // landed, otherwise later cancels are refused.
    void commit(Task& task);

    void emit(const Task& task, UploadStage stage,
              std::optional<std::string> message = std::nullopt,
              std::optional<ByteProgress> bytes = std::nullopt,
              std::optional<CompressProgress> compress = std::nullopt);

    void reap_finished();
};
