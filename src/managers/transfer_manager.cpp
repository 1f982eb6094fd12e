#include "transfer_manager.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/archive.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <vector>
#include <fmt/format.h>
#include "progress_throttle.hpp"
#include "remote_ops.hpp"

namespace fs = std::filesystem;

const char* upload_kind_name(UploadKind kind) {
    switch (kind) {
        case UploadKind::File:   return "file";
        case UploadKind::Folder: return "folder";
    }
    return "file";
}

std::optional<UploadKind> parse_upload_kind(const std::string& value) {
    if (value == "file") return UploadKind::File;
    if (value == "folder") return UploadKind::Folder;
    return std::nullopt;
}

TransferManager::TransferManager(FileSessionManager& sessions, DirLister& lister,
                                 EventSink& events, std::string remote_tmp_dir)
    : sessions_(sessions), lister_(lister), events_(events),
      remote_tmp_dir_(std::move(remote_tmp_dir)) {
}

TransferManager::~TransferManager() {
    shutdown();
}

// ── Task bookkeeping ──────────────────────────────────────────

std::string TransferManager::upload_start(const std::string& connection_id,
                                          const std::string& remote_dir,
                                          const std::string& local_path,
                                          std::optional<UploadKind> kind) {
    reap_finished();

    fs::path local(local_path);
    std::error_code ec;
    auto status = fs::status(local, ec);
    if (ec || !fs::exists(status)) {
        throw std::runtime_error("Local path not found: " + local_path);
    }
    UploadKind actual = fs::is_directory(status) ? UploadKind::Folder : UploadKind::File;
    if (kind && *kind != actual) {
        throw std::runtime_error(fmt::format("{} is not a {}", local_path, upload_kind_name(*kind)));
    }

    auto task = std::make_shared<Task>();
    task->connection_id = connection_id;
    task->remote_dir = remote_dir;
    task->local_path = local;
    task->kind = actual;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task->id = fmt::format("upload-{}-{}", next_id_++, random_token(3));
        tasks_[task->id] = task;
        task->worker = std::thread(&TransferManager::run_task, this, task);
    }
    hostlink_log(fmt::format("Upload {} started: {} {} -> {}:{}", task->id,
                             upload_kind_name(actual), local_path, connection_id, remote_dir));
    return task->id;
}

bool TransferManager::upload_cancel(const std::string& task_id) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) return false;
        task = it->second;
    }
    if (task->finished) return false;

    std::lock_guard<std::mutex> lock(task->cancel_mutex);
    if (task->committed) return false;
    if (task->canceled.exchange(true)) return true;

    hostlink_log(fmt::format("Upload {} cancel requested", task_id));
    if (task->cancel_fn) {
        try {
            task->cancel_fn();
        } catch (const std::exception& e) {
            hostlink_log(fmt::format("Upload {} cancel hook failed: {}", task_id, e.what()));
        }
    }
    return true;
}

size_t TransferManager::running_tasks() {
    reap_finished();
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TransferManager::reap_finished() {
    std::vector<std::shared_ptr<Task>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->second->finished) {
                done.push_back(it->second);
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& task : done) {
        if (task->worker.joinable()) task->worker.join();
    }
}

void TransferManager::wait_all() {
    std::map<std::string, std::shared_ptr<Task>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(tasks_);
    }
    for (auto& [id, task] : all) {
        if (task->worker.joinable()) task->worker.join();
    }
}

void TransferManager::shutdown() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, task] : tasks_) ids.push_back(id);
    }
    for (const auto& id : ids) upload_cancel(id);
    wait_all();
}

void TransferManager::set_cancel(Task& task, std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(task.cancel_mutex);
    task.cancel_fn = std::move(fn);
}

void TransferManager::check_canceled(const Task& task) {
    if (task.canceled) throw TransferCanceled();
}

void TransferManager::commit(Task& task) {
    std::lock_guard<std::mutex> lock(task.cancel_mutex);
    if (task.canceled) throw TransferCanceled();
    task.committed = true;
    task.cancel_fn = nullptr;
}

void TransferManager::emit(const Task& task, UploadStage stage,
                           std::optional<std::string> message,
                           std::optional<ByteProgress> bytes,
                           std::optional<CompressProgress> compress) {
    UploadEvent ev;
    ev.task_id = task.id;
    ev.connection_id = task.connection_id;
    ev.stage = stage;
    ev.message = std::move(message);
    ev.bytes = bytes;
    ev.compress = compress;
    events_.on_upload(ev);
}

// ── Worker ────────────────────────────────────────────────────

void TransferManager::run_task(const std::shared_ptr<Task>& task) {
    try {
        if (task->kind == UploadKind::Folder) {
            upload_folder(*task);
        } else {
            upload_file(*task);
        }
        hostlink_log(fmt::format("Upload {} done", task->id));
        emit(*task, UploadStage::Done);
    } catch (const TransferCanceled&) {
        hostlink_log(fmt::format("Upload {} canceled", task->id));
        emit(*task, UploadStage::Canceled);
    } catch (const std::exception& e) {
        if (task->canceled) {
            hostlink_log(fmt::format("Upload {} canceled ({})", task->id, e.what()));
            emit(*task, UploadStage::Canceled);
        } else {
            hostlink_log(fmt::format("Upload {} failed: {}", task->id, e.what()));
            emit(*task, UploadStage::Error, std::string(e.what()));
        }
    }
    task->finished = true;
}

void TransferManager::upload_file(Task& task) {
    std::string target = sessions_.with_session(task.connection_id, [&](FileSession& s) {
        std::string dir = s.resolve_path(task.remote_dir);
        sftp_mkdir_recursive(*s.sftp(), dir);
        return dir;
    });
    check_canceled(task);

    std::string remote_path = posix_join(target, task.local_path.filename().string());
    stream_upload(task, task.local_path, remote_path, true);
    lister_.invalidate(task.connection_id, target);
}

void TransferManager::upload_folder(Task& task) {
    fs::path zip_path = platform::temp_file("hostlink_upload", ".zip");
    std::string target;
    std::string tmp_dir;
    std::string remote_archive;

    auto cleanup = [&]() {
        if (!remote_archive.empty() && sessions_.has_session(task.connection_id)) {
            try {
                sessions_.with_session(task.connection_id, [&](FileSession& s) {
                    auto sftp = s.sftp();
                    if (sftp->stat(remote_archive)) sftp->unlink(remote_archive);
                    try {
                        sftp->rmdir(tmp_dir);
                    } catch (const SftpError&) {
                        // still in use by another upload
                    }
                });
            } catch (const std::exception& e) {
                hostlink_log(fmt::format("Upload {} remote cleanup failed: {}", task.id, e.what()));
            }
        }
        platform::remove_quietly(zip_path);
    };

    try {
        std::string name = task.local_path.filename().string();
        size_t total_entries = platform::count_archive_entries(task.local_path);
        emit(task, UploadStage::Compress, "Compressing " + name, std::nullopt,
             CompressProgress{0, total_entries});

        // Compression polls the flag between entries.
        ProgressThrottle throttle;
        platform::create_zip(zip_path, task.local_path, [&](size_t done, size_t total) {
            check_canceled(task);
            if (throttle.should_emit(done, total)) {
                emit(task, UploadStage::Compress, std::nullopt, std::nullopt,
                     CompressProgress{done, total});
            }
        });
        check_canceled(task);

        sessions_.with_session(task.connection_id, [&](FileSession& s) {
            target = s.resolve_path(task.remote_dir);
            tmp_dir = posix_join(target, remote_tmp_dir_);
            auto sftp = s.sftp();
            sftp_mkdir_recursive(*sftp, target);
            sftp_mkdir_recursive(*sftp, tmp_dir);
        });
        remote_archive = posix_join(tmp_dir, task.id + ".zip");
        check_canceled(task);

        stream_upload(task, zip_path, remote_archive, false);
        check_canceled(task);

        emit(task, UploadStage::RemoteUnzip, "Extracting on remote host");
        // The exec channel watches the cancel flag and closes itself.
        sessions_.with_session(task.connection_id, [&](FileSession& s) {
            auto probe = s.transport().exec("command -v unzip", TOOL_PROBE_TIMEOUT_MS, &task.canceled);
            if (probe.failed()) throw ToolMissingError("unzip", tool_install_hint("unzip"));

            std::string cmd = fmt::format("unzip -o -q {} -d {}",
                                          shell_escape(remote_archive), shell_escape(target));
            auto r = s.transport().exec(cmd, REMOTE_ARCHIVE_TIMEOUT_MS, &task.canceled);
            hostlink_log_ssh(task.connection_id, cmd, r);
            if (r.failed()) {
                throw SshError(fmt::format("unzip failed (exit {}): {}", r.exit_code, r.get_output()));
            }
        });
        commit(task);

        emit(task, UploadStage::Cleanup);
        cleanup();
        lister_.invalidate(task.connection_id, target);
    } catch (const std::exception&) {
        cleanup();
        throw;
    }
}

void TransferManager::stream_upload(Task& task, const fs::path& local,
                                    const std::string& remote_path, bool last_stage) {
    int64_t size = platform::local_file_size(local);
    if (size < 0) throw std::runtime_error("Cannot stat local file: " + local.string());
    uint64_t total = static_cast<uint64_t>(size);

    emit(task, UploadStage::Upload, "Uploading " + local.filename().string(),
         make_progress(0, total));

    sessions_.with_session(task.connection_id, [&](FileSession& s) {
        std::ifstream in(local, std::ios::binary);
        if (!in) throw std::runtime_error("Cannot open local file: " + local.string());

        auto sftp = s.sftp();
        std::shared_ptr<RemoteFile> file = sftp->open(remote_path, OpenMode::WriteTruncate);
        set_cancel(task, [file]() { file->abort(); });

        try {
            ProgressThrottle throttle;
            std::vector<char> buf(TRANSFER_CHUNK_SIZE);
            uint64_t sent = 0;
            while (true) {
                check_canceled(task);
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                auto n = in.gcount();
                if (in.bad()) throw std::runtime_error("Read error on " + local.string());
                if (n <= 0) break;
                file->write(buf.data(), static_cast<size_t>(n));
                sent += static_cast<uint64_t>(n);
                if (throttle.should_emit(sent, total)) {
                    emit(task, UploadStage::Upload, std::nullopt, make_progress(sent, total));
                }
            }
            if (last_stage) {
                commit(task);
            } else {
                set_cancel(task, nullptr);
                check_canceled(task);
            }
            file->close();
        } catch (const std::exception&) {
            set_cancel(task, nullptr);
            if (!task.canceled) throw;
            // Drop the stream and the partial remote file.
            try {
                file->close();
                sftp->unlink(remote_path);
            } catch (const std::exception& e) {
                hostlink_log(fmt::format("Upload {} partial cleanup failed: {}", task.id, e.what()));
            }
            throw TransferCanceled();
        }
    });
}

// ── Download ──────────────────────────────────────────────────

void TransferManager::download(const std::string& connection_id, const std::string& remote_path,
                               const std::string& local_path) {
    fs::path local(local_path);
    std::error_code ec;
    if (local.has_parent_path()) fs::create_directories(local.parent_path(), ec);
    if (ec) {
        throw std::runtime_error(fmt::format("Cannot create {}: {}",
                                             local.parent_path().string(), ec.message()));
    }
    fs::path part = local;
    part += ".part-" + random_token(4);

    try {
        sessions_.with_session(connection_id, [&](FileSession& s) {
            std::string resolved = s.resolve_path(remote_path);
            auto sftp = s.sftp();
            auto attrs = sftp->stat(resolved);
            if (!attrs) {
                throw SftpError(SFTP_STATUS_NO_SUCH_FILE, "No such file: " + resolved);
            }
            uint64_t total = attrs->size;

            auto file = sftp->open(resolved, OpenMode::Read);
            std::ofstream out(part, std::ios::binary | std::ios::trunc);
            if (!out) throw std::runtime_error("Cannot write local file: " + part.string());

            ProgressThrottle throttle;
            std::vector<char> buf(TRANSFER_CHUNK_SIZE);
            uint64_t received = 0;
            while (true) {
                size_t n = file->read(buf.data(), buf.size());
                if (n == 0) break;
                out.write(buf.data(), static_cast<std::streamsize>(n));
                if (!out) throw std::runtime_error("Write error on " + part.string());
                received += n;
                if (throttle.should_emit(received, total)) {
                    events_.on_download(DownloadEvent{connection_id, resolved, local_path,
                                                      make_progress(received, total)});
                }
            }
            file->close();
            out.close();
            if (!out) throw std::runtime_error("Write error on " + part.string());

            fs::rename(part, local, ec);
            if (ec) {
                throw std::runtime_error(fmt::format("Cannot replace {}: {}", local_path, ec.message()));
            }
            if (received < total) {
                events_.on_download(DownloadEvent{connection_id, resolved, local_path,
                                                  make_progress(received, total)});
            }
        });
    } catch (const std::exception& e) {
        hostlink_log(fmt::format("Download {}:{} failed: {}", connection_id, remote_path, e.what()));
        platform::remove_quietly(part);
        throw;
    }
}
