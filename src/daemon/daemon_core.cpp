#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>
#include <utility>

using json = nlohmann::json;

namespace {

constexpr size_t MAX_FINISHED_JOBS = 100;
constexpr double PROGRESS_STEP = 0.01;

json ok() {
    return {{"status", "ok"}};
}

json error_response(const Error& err) {
    return {{"status", "error"}, {"error", error_name(err.code)}, {"message", err.message}};
}

json error_response(ErrorCode code, std::string message) {
    return error_response(Error{code, std::move(message)});
}

json clip_json(const std::string& id, const AudioBuffer& clip) {
    return {
        {"id", id},
        {"source", clip.source()},
        {"sample_rate", clip.sample_rate()},
        {"channels", clip.channels()},
        {"frames", clip.frame_count()},
        {"duration", clip.duration()},
    };
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, const ProfileRegistry& registry,
                       RingBuffer& ring_buf, AudioCapture& audio, IpcServer& ipc,
                       NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      registry_(registry), ring_buf_(ring_buf), ipc_(ipc),
      document_(config_.document.max_undo),
      sink_(document_, queue_),
      recorder_(ring_buf_, audio) {
    queue_.set_notify(std::move(notify));

    sink_.set_message_handler([this](const TranscriptionJob& job, const std::string& message) {
        log(message);
        job_messages_[job.id()] = message;
    });
    sink_.set_delivered_handler([this](const std::shared_ptr<TranscriptionJob>& job, DeliveryStatus status) {
        on_job_delivered(job, status);
    });
}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init(const std::string& history_path) {
    std::string db_path = history_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = !data.empty() ? data + "/history.db" : "/tmp/sttpad/history.db";
    }
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    if (!config_.document.path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(config_.document.path, ec)) {
            if (auto r = document_.load(config_.document.path); !r) {
                std::println(stderr, "document: {}", r.error().describe());
            }
        }
    }

    executor_ = std::make_unique<JobExecutor>(
        config_.worker_count(),
        [this](std::shared_ptr<TranscriptionJob> job) { sink_.deliver(std::move(job)); },
        [this](const std::shared_ptr<TranscriptionJob>& job, double p) {
            queue_.post([this, id = job->id(), p] { on_job_progress(id, p); });
        });

    for (auto& inst : config_.profiles) {
        auto name = add_runner(inst.type, inst.name, inst.params);
        if (!name) {
            std::println(stderr, "config: profile '{}': {}", inst.type, name.error().describe());
            continue;
        }
        log("Runner " + *name + " ready");
    }

    log(std::format("Core ready: {} workers, {} runners", executor_->worker_count(), runners_.size()));
    return true;
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd, int client_fd) {
    try {
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "profiles") return handle_profiles(cmd);
        if (cmd_str == "add_profile") return handle_add_profile(cmd);
        if (cmd_str == "remove_profile") return handle_remove_profile(cmd);
        if (cmd_str == "runners") return handle_runners(cmd);
        if (cmd_str == "load_audio") return handle_load_audio(cmd);
        if (cmd_str == "save_audio") return handle_save_audio(cmd);
        if (cmd_str == "remove_audio") return handle_remove_audio(cmd);
        if (cmd_str == "audio") return handle_audio(cmd);
        if (cmd_str == "record_start") return handle_record_start(cmd);
        if (cmd_str == "record_stop") return handle_record_stop(cmd, client_fd);
        if (cmd_str == "record_cancel") return handle_record_cancel(cmd);
        if (cmd_str == "run") return handle_run(cmd, client_fd);
        if (cmd_str == "cancel") return handle_cancel(cmd);
        if (cmd_str == "job") return handle_job(cmd);
        if (cmd_str == "text") return handle_text(cmd);
        if (cmd_str == "insert") return handle_insert(cmd);
        if (cmd_str == "erase") return handle_erase(cmd);
        if (cmd_str == "caret") return handle_caret(cmd);
        if (cmd_str == "undo") return handle_undo(cmd);
        if (cmd_str == "redo") return handle_redo(cmd);
        if (cmd_str == "open_text") return handle_open_text(cmd);
        if (cmd_str == "insert_file") return handle_insert_file(cmd);
        if (cmd_str == "save_text") return handle_save_text(cmd);
        if (cmd_str == "history") return handle_history(cmd);
    } catch (const json::exception& e) {
        return error_response(ErrorCode::InvalidParameter, std::string("malformed request: ") + e.what());
    }
    return {{"status", "error"}, {"message", "unknown command"}};
}

void DaemonCore::on_wakeup() {
    queue_.drain();
}

void DaemonCore::remove_waiting_client(int fd) {
    for (auto& [id, fds] : waiting_clients_) {
        std::erase(fds, fd);
    }
    std::erase_if(waiting_clients_, [](const auto& kv) { return kv.second.empty(); });
}

void DaemonCore::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    if (recorder_.state() == RecorderState::Recording) {
        recorder_.cancel(false);
    }

    if (executor_) {
        log("Stopping workers...");
        executor_->shutdown();
    }

    // Deliver what the workers finished while stopping.
    queue_.drain();
}

// --- status and profiles ---

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = ok();
    resp["state"] = recorder_.state() == RecorderState::Recording ? "recording" : "idle";
    if (recorder_.state() == RecorderState::Recording) {
        resp["duration"] = recorder_.duration();
        resp["max_duration"] = recorder_.max_duration();
        resp["limit_reached"] = recorder_.limit_reached();
        if (recorder_.limit_reached()) resp["dropped_seconds"] = recorder_.dropped_seconds();
        if (record_runner_) resp["record_and_run"] = *record_runner_;
    }
    resp["pending"] = executor_ ? executor_->pending_count() : 0;
    resp["running"] = executor_ ? executor_->running_count() : 0;
    resp["workers"] = executor_ ? executor_->worker_count() : 0;
    resp["runners"] = runners_.size();
    resp["audio"] = clips_.size();
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_profiles(const json& /*cmd*/) {
    json resp = ok();
    resp["profiles"] = json::array();
    for (const auto* desc : registry_.descriptors()) {
        resp["profiles"].push_back(descriptor_to_json(*desc));
    }
    return resp;
}

std::expected<std::string, Error> DaemonCore::add_runner(const std::string& profile, std::string name,
                                                         const json& params) {
    if (name.empty()) {
        name = profile;
        for (int n = 2; runners_.contains(name); ++n) {
            name = std::format("{}-{}", profile, n);
        }
    } else if (runners_.contains(name)) {
        return std::unexpected(Error{ErrorCode::InvalidParameter, std::format("runner name '{}' in use", name)});
    }

    auto runner = registry_.create(profile, params);
    if (!runner) return std::unexpected(runner.error());

    runners_.emplace(name, std::shared_ptr<JobRunner>(std::move(*runner)));
    return name;
}

json DaemonCore::handle_add_profile(const json& cmd) {
    auto profile = cmd.value("profile", "");
    auto params = cmd.contains("params") ? cmd["params"] : json::object();

    auto name = add_runner(profile, cmd.value("name", ""), params);
    if (!name) return error_response(name.error());

    log("Added runner " + *name + " (" + profile + ")");
    json resp = ok();
    resp["runner"] = *name;
    resp["params"] = runners_.at(*name)->params().to_json();
    return resp;
}

json DaemonCore::handle_remove_profile(const json& cmd) {
    auto name = cmd.value("runner", "");
    auto it = runners_.find(name);
    if (it == runners_.end()) {
        return error_response(ErrorCode::UnknownRunner, std::format("no runner '{}'", name));
    }
    if (it->second->busy() || record_runner_ == name) {
        return error_response(ErrorCode::RunnerBusy, std::format("runner '{}' has a job in flight", name));
    }

    runners_.erase(it);
    log("Removed runner " + name);
    return ok();
}

json DaemonCore::handle_runners(const json& /*cmd*/) {
    json resp = ok();
    resp["runners"] = json::array();
    for (auto& [name, runner] : runners_) {
        resp["runners"].push_back({
            {"name", name},
            {"profile", runner->profile_id()},
            {"busy", runner->busy()},
            {"record_and_run", runner->record_and_run()},
            {"params", runner->params().to_json()},
        });
    }
    return resp;
}

// --- audio clips ---

std::string DaemonCore::add_clip(AudioBuffer clip, const std::string& prefix, std::string name) {
    if (name.empty() || clips_.contains(name)) {
        do {
            name = std::format("{}-{}", prefix, next_clip_++);
        } while (clips_.contains(name));
    }
    clips_.insert_or_assign(name, std::move(clip));
    return name;
}

json DaemonCore::handle_load_audio(const json& cmd) {
    auto path = cmd.value("path", "");
    if (path.empty()) return error_response(ErrorCode::InvalidParameter, "missing path");

    auto clip = AudioBuffer::decode_file(path);
    if (!clip) return error_response(clip.error());

    auto id = add_clip(std::move(*clip), "audio", cmd.value("name", ""));
    log(std::format("Loaded {} as {} ({:.1f}s)", path, id, clips_.at(id).duration()));

    json resp = ok();
    resp["audio"] = clip_json(id, clips_.at(id));
    return resp;
}

json DaemonCore::handle_save_audio(const json& cmd) {
    auto id = cmd.value("audio", "");
    auto path = cmd.value("path", "");
    auto it = clips_.find(id);
    if (it == clips_.end()) return error_response(ErrorCode::UnknownAudio, std::format("no audio '{}'", id));
    if (path.empty()) return error_response(ErrorCode::InvalidParameter, "missing path");

    auto format_name = cmd.value("format", "pcm16");
    wav::SampleFormat format;
    if (format_name == "pcm16") {
        format = wav::SampleFormat::Pcm16;
    } else if (format_name == "float32") {
        format = wav::SampleFormat::Float32;
    } else {
        return error_response(ErrorCode::InvalidParameter, "format must be pcm16 or float32");
    }

    if (auto r = it->second.save(path, format); !r) return error_response(r.error());
    return ok();
}

json DaemonCore::handle_remove_audio(const json& cmd) {
    auto id = cmd.value("audio", "");
    if (clips_.erase(id) == 0) {
        return error_response(ErrorCode::UnknownAudio, std::format("no audio '{}'", id));
    }
    return ok();
}

json DaemonCore::handle_audio(const json& /*cmd*/) {
    json resp = ok();
    resp["audio"] = json::array();
    for (auto& [id, clip] : clips_) {
        resp["audio"].push_back(clip_json(id, clip));
    }
    return resp;
}

// --- recording ---

json DaemonCore::handle_record_start(const json& /*cmd*/) {
    if (auto r = recorder_.start(); !r) return error_response(r.error());
    log("Recording started");
    return {{"status", "ok"}, {"state", "recording"}};
}

json DaemonCore::handle_record_stop(const json& cmd, int client_fd) {
    auto clip = recorder_.finish();
    auto target = std::exchange(record_runner_, std::nullopt);
    if (!clip) return error_response(clip.error());

    auto id = add_clip(std::move(*clip), "rec");
    log(std::format("Recording stopped, {:.1f}s audio stored as {}", clips_.at(id).duration(), id));

    json resp;
    if (target) {
        resp = dispatch(*target, id, cmd.value("wait", false), client_fd);
    } else {
        resp = ok();
        resp["audio"] = clip_json(id, clips_.at(id));
    }
    add_truncation(resp);
    return resp;
}

json DaemonCore::handle_record_cancel(const json& /*cmd*/) {
    if (recorder_.state() != RecorderState::Recording) {
        return error_response(ErrorCode::InvalidState, "not recording");
    }

    record_runner_.reset();
    auto partial = recorder_.cancel(config_.recording.keep_partial_on_cancel);

    json resp = ok();
    if (partial) {
        auto id = add_clip(std::move(*partial), "rec");
        resp["audio"] = clip_json(id, clips_.at(id));
        log("Recording cancelled, partial clip kept as " + id);
        add_truncation(resp);
    } else {
        log("Recording cancelled");
    }
    return resp;
}

// Audio past audio.max_seconds is lost; say so in the reply.
void DaemonCore::add_truncation(json& resp) {
    if (!recorder_.limit_reached()) return;
    resp["truncated"] = true;
    resp["dropped_seconds"] = recorder_.dropped_seconds();
    log(std::format("Recording hit the {:.0f}s limit, {:.1f}s dropped",
                    recorder_.max_duration(), recorder_.dropped_seconds()));
}

// --- jobs ---

json DaemonCore::handle_run(const json& cmd, int client_fd) {
    auto runner_name = cmd.value("runner", "");
    auto it = runners_.find(runner_name);
    if (it == runners_.end()) {
        return error_response(ErrorCode::UnknownRunner, std::format("no runner '{}'", runner_name));
    }

    auto clip_id = cmd.value("audio", "");
    if (clip_id.empty() && it->second->record_and_run()) {
        if (it->second->busy()) {
            return error_response(ErrorCode::RunnerBusy, std::format("runner '{}' has a job in flight", runner_name));
        }
        if (auto r = recorder_.start(); !r) return error_response(r.error());
        record_runner_ = runner_name;
        log("Recording for " + runner_name);
        return {{"status", "ok"}, {"state", "recording"}, {"runner", runner_name}};
    }

    return dispatch(runner_name, clip_id, cmd.value("wait", false), client_fd);
}

json DaemonCore::dispatch(const std::string& runner_name, const std::string& clip_id,
                          bool wait, int client_fd) {
    auto runner = runners_.find(runner_name);
    if (runner == runners_.end()) {
        return error_response(ErrorCode::UnknownRunner, std::format("no runner '{}'", runner_name));
    }
    auto clip = clips_.find(clip_id);
    if (clip == clips_.end()) {
        return error_response(ErrorCode::UnknownAudio, std::format("no audio '{}'", clip_id));
    }
    if (!executor_) return error_response(ErrorCode::InvalidState, "core not initialised");

    auto job = executor_->submit(runner->second, clip->second, document_.caret());
    if (!job) return error_response(job.error());

    auto id = (*job)->id();
    remember_job(*job);
    log(std::format("Job {} queued on {} ({:.1f}s audio, ~{:.1f}s)", id, runner_name,
                    clip->second.duration(), runner->second->estimate_duration(clip->second)));

    if ((*job)->is_terminal()) return job_response(**job);

    if (wait && client_fd >= 0) {
        waiting_clients_[id].push_back(client_fd);
        return {{"status", WAITING}, {"job", id}};
    }

    json resp = ok();
    resp["job"] = id;
    resp["state"] = job_state_name((*job)->state());
    return resp;
}

json DaemonCore::handle_cancel(const json& cmd) {
    auto id = cmd.value("job", uint64_t{0});
    if (!executor_) return error_response(ErrorCode::InvalidState, "core not initialised");

    auto result = executor_->cancel(id);
    if (!result) {
        if (auto it = jobs_.find(id); it != jobs_.end()) {
            json resp = ok();
            resp["job"] = id;
            resp["result"] = "finished";
            resp["state"] = job_state_name(it->second->state());
            return resp;
        }
        return error_response(result.error());
    }

    json resp = ok();
    resp["job"] = id;
    switch (*result) {
        case JobExecutor::CancelResult::Discarded: {
            resp["result"] = "discarded";
            jobs_.erase(id);
            json notice = {{"status", "ok"}, {"job", id}, {"state", "discarded"}};
            if (auto w = waiting_clients_.find(id); w != waiting_clients_.end()) {
                for (int fd : w->second) ipc_.send_response(fd, notice);
                waiting_clients_.erase(w);
            }
            log(std::format("Job {} discarded before dispatch", id));
            break;
        }
        case JobExecutor::CancelResult::Requested:
            resp["result"] = "requested";
            log(std::format("Job {} cancellation requested", id));
            break;
        case JobExecutor::CancelResult::AlreadyFinished:
            resp["result"] = "finished";
            break;
    }
    return resp;
}

json DaemonCore::handle_job(const json& cmd) {
    auto id = cmd.value("job", uint64_t{0});
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return error_response(ErrorCode::UnknownJob, std::format("no job {}", id));
    }
    return job_response(*it->second);
}

void DaemonCore::remember_job(std::shared_ptr<TranscriptionJob> job) {
    jobs_[job->id()] = std::move(job);

    auto finished = static_cast<size_t>(std::ranges::count_if(jobs_, [](const auto& kv) { return kv.second->is_terminal(); }));
    for (auto it = jobs_.begin(); finished > MAX_FINISHED_JOBS && it != jobs_.end();) {
        if (it->second->is_terminal() && it->second->delivered()) {
            job_messages_.erase(it->first);
            it = jobs_.erase(it);
            --finished;
        } else {
            ++it;
        }
    }
}

void DaemonCore::on_job_progress(uint64_t job_id, double progress) {
    auto w = waiting_clients_.find(job_id);
    if (w == waiting_clients_.end()) return;

    auto& last = progress_sent_[job_id];
    if (progress - last < PROGRESS_STEP) return;
    last = progress;

    json msg = {{"status", "progress"}, {"job", job_id}, {"progress", progress}};
    for (int fd : w->second) {
        ipc_.send_response(fd, msg);
    }
}

void DaemonCore::on_job_delivered(const std::shared_ptr<TranscriptionJob>& job, DeliveryStatus status) {
    const auto state = job->state();
    auto err = job->error();

    if (status == DeliveryStatus::Inserted) {
        log(std::format("Job {} inserted {} bytes at {}", job->id(),
                        job->result().value_or("").size(), job->caret_offset()));
    }

    JobRecord record{
        .job_id = job->id(),
        .profile = job->runner_id(),
        .audio_source = job->audio().source(),
        .audio_duration = job->audio().duration(),
        .processing_time = job->processing_seconds(),
        .state = std::string(job_state_name(state)),
        .text = job->result().value_or(""),
        .error = err ? err->describe() : std::string(),
    };
    if (history_db_.is_open() && !history_db_.insert(record)) {
        log(std::format("Job {} not recorded in history", job->id()));
    }

    progress_sent_.erase(job->id());

    auto w = waiting_clients_.find(job->id());
    if (w == waiting_clients_.end()) return;

    auto resp = job_response(*job);
    for (int fd : w->second) {
        ipc_.send_response(fd, resp);
    }
    waiting_clients_.erase(w);
}

json DaemonCore::job_response(const TranscriptionJob& job) const {
    json resp = job.to_json();
    auto state = job.state();
    resp.erase("id");
    resp["job"] = job.id();

    if (state == JobState::Failed) {
        resp["status"] = "error";
    } else {
        resp["status"] = "ok";
    }
    if (auto m = job_messages_.find(job.id()); m != job_messages_.end()) {
        resp["notice"] = m->second;
    }
    if (job.is_terminal()) {
        resp["processing_time"] = job.processing_seconds();
    }
    return resp;
}

// --- document ---

json DaemonCore::document_json() const {
    return {
        {"length", document_.length()},
        {"caret", document_.caret()},
        {"modified", document_.modified()},
        {"path", document_.path()},
        {"can_undo", document_.can_undo()},
        {"can_redo", document_.can_redo()},
    };
}

json DaemonCore::handle_text(const json& /*cmd*/) {
    json resp = ok();
    resp["text"] = document_.text();
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_insert(const json& cmd) {
    auto text = cmd.value("text", "");
    size_t offset = cmd.value("offset", document_.caret());

    auto n = document_.insert_at(offset, text);
    if (!n) return error_response(n.error());

    json resp = ok();
    resp["inserted"] = *n;
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_erase(const json& cmd) {
    size_t offset = cmd.value("offset", size_t{0});
    size_t count = cmd.value("count", size_t{0});

    json resp = ok();
    resp["erased"] = document_.erase(offset, count);
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_caret(const json& cmd) {
    if (cmd.contains("offset")) {
        document_.set_caret(cmd["offset"].get<size_t>());
    }
    json resp = ok();
    resp["caret"] = document_.caret();
    return resp;
}

json DaemonCore::handle_undo(const json& /*cmd*/) {
    if (!document_.undo()) return error_response(ErrorCode::InvalidState, "nothing to undo");
    json resp = ok();
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_redo(const json& /*cmd*/) {
    if (!document_.redo()) return error_response(ErrorCode::InvalidState, "nothing to redo");
    json resp = ok();
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_open_text(const json& cmd) {
    auto path = cmd.value("path", "");
    if (path.empty()) return error_response(ErrorCode::InvalidParameter, "missing path");
    if (document_.modified() && !cmd.value("force", false)) {
        return error_response(ErrorCode::InvalidState, "document has unsaved changes (use force)");
    }

    if (auto r = document_.load(path); !r) return error_response(r.error());
    json resp = ok();
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_insert_file(const json& cmd) {
    auto path = cmd.value("path", "");
    if (path.empty()) return error_response(ErrorCode::InvalidParameter, "missing path");

    auto n = document_.insert_file(path);
    if (!n) return error_response(n.error());
    json resp = ok();
    resp["inserted"] = *n;
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_save_text(const json& cmd) {
    auto path = cmd.value("path", document_.path());
    if (path.empty()) return error_response(ErrorCode::InvalidParameter, "missing path");

    if (auto r = document_.save(path); !r) return error_response(r.error());
    json resp = ok();
    resp["document"] = document_json();
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = std::max(0, cmd.value("limit", 10));
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        json entry = {
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"job", e.record.job_id},
            {"profile", e.record.profile},
            {"audio_source", e.record.audio_source},
            {"audio_duration", e.record.audio_duration},
            {"processing_time", e.record.processing_time},
            {"state", e.record.state},
        };
        if (!e.record.text.empty()) entry["text"] = e.record.text;
        if (!e.record.error.empty()) entry["error"] = e.record.error;
        resp["entries"].push_back(std::move(entry));
    }
    return resp;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sttpad] {}", msg);
    }
}
