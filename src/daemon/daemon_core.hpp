#pragma once

#include "audio/audio_buffer.hpp"
#include "config.hpp"
#include "document/document.hpp"
#include "document/result_sink.hpp"
#include "errors.hpp"
#include "jobs/interactive_queue.hpp"
#include "jobs/job_executor.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "profiles/profile_registry.hpp"
#include "recorder.hpp"
#include "ring_buffer.hpp"
#include "storage/history_db.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Portable daemon logic: everything behind the IPC commands. Runs on the
// interactive thread; workers reach it only through the InteractiveQueue.
class DaemonCore {
public:
    // Wakes the event loop so it calls on_wakeup().
    using NotifyCallback = std::function<void()>;

    // Returned by handle_command when the reply will be sent later.
    static constexpr const char* WAITING = "waiting";

    DaemonCore(Config config, bool verbose, const ProfileRegistry& registry,
               RingBuffer& ring_buf, AudioCapture& audio, IpcServer& ipc,
               NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // history_path empty: <data_dir>/history.db
    bool init(const std::string& history_path = {});

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd,
                                  int client_fd = -1);

    // Drains work posted by the workers. Interactive thread only.
    void on_wakeup();

    void remove_waiting_client(int fd);

    const Document& document() const { return document_; }
    RecorderState recorder_state() const { return recorder_.state(); }
    size_t runner_count() const { return runners_.size(); }

    void shutdown();

private:
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_profiles(const nlohmann::json& cmd);
    nlohmann::json handle_add_profile(const nlohmann::json& cmd);
    nlohmann::json handle_remove_profile(const nlohmann::json& cmd);
    nlohmann::json handle_runners(const nlohmann::json& cmd);
    nlohmann::json handle_load_audio(const nlohmann::json& cmd);
    nlohmann::json handle_save_audio(const nlohmann::json& cmd);
    nlohmann::json handle_remove_audio(const nlohmann::json& cmd);
    nlohmann::json handle_audio(const nlohmann::json& cmd);
    nlohmann::json handle_record_start(const nlohmann::json& cmd);
    nlohmann::json handle_record_stop(const nlohmann::json& cmd, int client_fd);
    nlohmann::json handle_record_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_run(const nlohmann::json& cmd, int client_fd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_job(const nlohmann::json& cmd);
    nlohmann::json handle_text(const nlohmann::json& cmd);
    nlohmann::json handle_insert(const nlohmann::json& cmd);
    nlohmann::json handle_erase(const nlohmann::json& cmd);
    nlohmann::json handle_caret(const nlohmann::json& cmd);
    nlohmann::json handle_undo(const nlohmann::json& cmd);
    nlohmann::json handle_redo(const nlohmann::json& cmd);
    nlohmann::json handle_open_text(const nlohmann::json& cmd);
    nlohmann::json handle_insert_file(const nlohmann::json& cmd);
    nlohmann::json handle_save_text(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    std::expected<std::string, Error> add_runner(const std::string& profile, std::string name,
                                                 const nlohmann::json& params);
    std::string add_clip(AudioBuffer clip, const std::string& prefix, std::string name = {});

    // Submits and either answers now, or registers client_fd as a waiter.
    nlohmann::json dispatch(const std::string& runner_name, const std::string& clip_id,
                            bool wait, int client_fd);

    void on_job_progress(uint64_t job_id, double progress);
    void on_job_delivered(const std::shared_ptr<TranscriptionJob>& job, DeliveryStatus status);
    void remember_job(std::shared_ptr<TranscriptionJob> job);

    void add_truncation(nlohmann::json& resp);
    nlohmann::json job_response(const TranscriptionJob& job) const;
    nlohmann::json document_json() const;

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    const ProfileRegistry& registry_;
    RingBuffer& ring_buf_;
    IpcServer& ipc_;

    InteractiveQueue queue_;
    Document document_;
    ResultSink sink_;
    Recorder recorder_;
    HistoryDb history_db_;
    std::unique_ptr<JobExecutor> executor_;

    std::map<std::string, std::shared_ptr<JobRunner>> runners_;
    std::map<std::string, AudioBuffer> clips_;
    uint64_t next_clip_ = 1;

    // Runner waiting for the current recording (record-and-run).
    std::optional<std::string> record_runner_;

    std::map<uint64_t, std::shared_ptr<TranscriptionJob>> jobs_;
    std::map<uint64_t, std::vector<int>> waiting_clients_;
    std::map<uint64_t, double> progress_sent_;
    std::map<uint64_t, std::string> job_messages_;

    bool shut_down_ = false;
};
