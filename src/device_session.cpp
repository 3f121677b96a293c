#include "../include/device_session.hpp"
#include "../include/exceptions.hpp"
#include "../include/frame_parser.hpp"
#include "../include/logger.hpp"
#include "../include/despike_filter.hpp"
#include <chrono>
#include <exception>

namespace {

double unixNow() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "Idle";
        case SessionState::CONNECTING: return "Connecting";
        case SessionState::BASELINE_CALIBRATING: return "BaselineCalibrating";
        case SessionState::ARMED: return "Armed";
        case SessionState::READING: return "Reading";
        case SessionState::STOPPING: return "Stopping";
        case SessionState::DISCONNECTING_INTENTIONAL: return "DisconnectingIntentional";
        case SessionState::DISCONNECTING_ERROR: return "DisconnectingError";
    }
    return "Unknown";
}

DeviceSession::DeviceSession(const DeviceIdentity& identity,
                             SessionWorker& worker,
                             Transport& transport,
                             const CalibrationTable& table,
                             const SessionSettings& settings,
                             const SessionRecorder& recorder,
                             const SessionCallbacks& callbacks)
    : identity_(identity),
      worker_(worker),
      transport_(transport),
      settings_(settings),
      calibrator_(table ? *table : std::vector<CalibrationPoint>(), settings.method, settings.allow_extrapolation),
      recorder_(recorder),
      callbacks_(callbacks),
      state_(SessionState::IDLE),
      connected_(false),
      reading_(false),
      link_error_(false),
      recovering_(false),
      baseline_(0.0),
      sample_count_(0),
      alive_(std::make_shared<bool>(true)) {
}

DeviceSession::~DeviceSession() {
    // Queued work for this session becomes a no-op from here on
    alive_.reset();
    intentional_disconnect_ = true;
    if (link_) {
        try {
            link_->close();
        } catch (const std::exception& e) {
            Logger::debug("[Session %s] Close on teardown failed: %s", identity_.address.c_str(), e.what());
        }
        link_.reset();
    }
    completeConnect(false);
}

SessionStatus DeviceSession::status() const {
    SessionStatus s;
    s.identity = identity_;
    s.state = state_.load();
    s.connected = connected_.load();
    s.reading = reading_.load();
    s.link_error = link_error_.load();
    s.baseline = baseline_.load();
    s.buffered = sample_count_.load();
    std::lock_guard<std::mutex> lock(artifact_mutex_);
    s.last_artifact = last_artifact_;
    return s;
}

SessionWorker::Task DeviceSession::guarded(std::function<void()> fn) const {
    std::weak_ptr<bool> token = alive_;
    return [token, fn]() {
        if (!token.expired()) fn();
    };
}

FrameHandler DeviceSession::makeFrameHandler(uint64_t generation, bool baseline_phase) {
    SessionWorker* worker = &worker_;
    std::weak_ptr<bool> token = alive_;
    return [this, worker, token, generation, baseline_phase](const std::string& payload) {
        // Transport context: stamp the arrival time, touch nothing else
        double host_time = unixNow();
        worker->post([this, token, generation, baseline_phase, host_time, payload]() {
            if (token.expired()) return;
            if (baseline_phase) {
                onBaselineFrame(generation, payload);
            } else {
                onReadingFrame(generation, host_time, payload);
            }
        });
    };
}

LinkLostHandler DeviceSession::makeLinkLostHandler(uint64_t generation) {
    SessionWorker* worker = &worker_;
    std::weak_ptr<bool> token = alive_;
    return [this, worker, token, generation]() {
        worker->post([this, token, generation]() {
            if (token.expired()) return;
            handleLinkLost(generation);
        });
    };
}

void DeviceSession::connect(std::function<void(bool)> on_done) {
    if (recovering_) {
        Logger::info("[Session %s] Recovery in progress, connect deferred", identity_.address.c_str());
        deferred_.push_back([this, on_done]() { connect(on_done); });
        return;
    }
    if (connect_done_) {
        Logger::warn("[Session %s] Connect already in progress", identity_.address.c_str());
        if (on_done) on_done(false);
        return;
    }
    if (connected_ && link_ && !link_->isConnected()) {
        // The link dropped and its loss notice is still queued; recover first
        handleLinkLost(link_generation_);
        if (recovering_) {
            deferred_.push_back([this, on_done]() { connect(on_done); });
            return;
        }
    }
    if (connected_ && link_ && link_->isConnected()) {
        if (on_done) on_done(true);
        return;
    }

    link_error_ = false;
    closeLinkQuietly();
    connect_done_ = on_done;
    if (!connect_done_) connect_done_ = [](bool) {};
    setState(SessionState::CONNECTING);
    Logger::info("[Session %s] Connecting to %s", identity_.address.c_str(), identity_.name.c_str());

    uint64_t generation = ++link_generation_;
    try {
        link_ = transport_.open(identity_.address, settings_.connect_timeout_s, makeLinkLostHandler(generation));
    } catch (const TransportException& e) {
        Logger::error("[Session %s] Connection failed: %s", identity_.address.c_str(), e.what());
        failConnect("open failed");
        return;
    } catch (const std::exception& e) {
        Logger::error("[Session %s] Unexpected error while connecting: %s", identity_.address.c_str(), e.what());
        failConnect("open failed");
        return;
    }

    if (!link_ || !link_->isConnected()) {
        Logger::warn("[Session %s] Link opened but not connected", identity_.address.c_str());
        failConnect("not connected");
        return;
    }

    baseline_samples_.clear();
    setState(SessionState::BASELINE_CALIBRATING);
    try {
        link_->subscribe(settings_.notify_channel, makeFrameHandler(generation, true));
    } catch (const std::exception& e) {
        Logger::error("[Session %s] Subscribe failed: %s", identity_.address.c_str(), e.what());
        failConnect("subscribe failed");
        return;
    }

    Logger::info("[Session %s] Collecting baseline for %u ms", identity_.address.c_str(),
                 (unsigned)settings_.baseline_window_ms);
    worker_.postDelayed(settings_.baseline_window_ms,
                        guarded([this, generation]() { finishBaseline(generation); }));
}

void DeviceSession::onBaselineFrame(uint64_t generation, const std::string& payload) {
    if (generation != link_generation_ || state_ != SessionState::BASELINE_CALIBRATING) return;
    SensorFrame frame;
    if (!parseSensorFrame(payload, frame)) {
        Logger::debug("[Session %s] Dropped malformed frame", identity_.address.c_str());
        return;
    }
    baseline_samples_.push_back(frame.v3);
}

void DeviceSession::finishBaseline(uint64_t generation) {
    // A link loss or disconnect during the window already settled the connect
    if (generation != link_generation_ || state_ != SessionState::BASELINE_CALIBRATING) return;

    try {
        link_->unsubscribe(settings_.notify_channel);
    } catch (const std::exception& e) {
        Logger::debug("[Session %s] Unsubscribe after baseline: %s", identity_.address.c_str(), e.what());
    }

    double baseline = baseline_samples_.empty() ? 0.0 : DespikeFilter::median(baseline_samples_);
    if (baseline_samples_.empty()) {
        Logger::warn("[Session %s] No frames during baseline window, baseline set to 0",
                     identity_.address.c_str());
    }
    baseline_ = baseline;
    Logger::info("[Session %s] Baseline %.2f from %u frames", identity_.address.c_str(), baseline,
                 (unsigned)baseline_samples_.size());
    baseline_samples_.clear();

    try {
        link_->subscribe(settings_.notify_channel, makeFrameHandler(generation, false));
    } catch (const std::exception& e) {
        Logger::error("[Session %s] Subscribe failed: %s", identity_.address.c_str(), e.what());
        failConnect("subscribe failed");
        return;
    }

    link_error_ = false;
    connected_ = true;
    setState(SessionState::ARMED);
    notifyStateChanged();
    Logger::info("[Session %s] Connected and armed", identity_.address.c_str());
    completeConnect(true);
}

void DeviceSession::failConnect(const char* reason) {
    Logger::debug("[Session %s] Connect aborted: %s", identity_.address.c_str(), reason);
    closeLinkQuietly();
    connected_ = false;
    setState(SessionState::IDLE);
    notifyStateChanged();
    completeConnect(false);
}

void DeviceSession::completeConnect(bool ok) {
    std::function<void(bool)> done;
    done.swap(connect_done_);
    if (done) done(ok);
}

bool DeviceSession::startReading(const SessionMeta& meta) {
    if (!connected_ || !link_ || !link_->isConnected()) {
        Logger::warn("[Session %s] Cannot start reading: not connected", identity_.address.c_str());
        return false;
    }
    if (state_ != SessionState::ARMED) {
        Logger::warn("[Session %s] Cannot start reading from %s", identity_.address.c_str(),
                     sessionStateName(state_));
        return false;
    }
    std::string reason;
    if (!SessionRecorder::validateMeta(meta, reason)) {
        Logger::warn("[Session %s] Cannot start reading: %s", identity_.address.c_str(), reason.c_str());
        return false;
    }
    clearCapture();
    meta_ = normalizeMeta(meta);
    has_meta_ = true;
    reading_ = true;
    setState(SessionState::READING);
    Logger::info("[Session %s] Reading started for %s", identity_.address.c_str(), meta_.athlete_id.c_str());
    return true;
}

std::string DeviceSession::stopReading(const SessionMeta& meta) {
    if (state_ != SessionState::READING) {
        Logger::info("[Session %s] Stop ignored in %s", identity_.address.c_str(), sessionStateName(state_));
        if (!buffer_.empty()) {
            Logger::warn("[Session %s] Discarding %u samples not taken in a reading",
                         identity_.address.c_str(), (unsigned)buffer_.size());
            clearCapture();
        }
        return "";
    }
    setState(SessionState::STOPPING);
    reading_ = false;
    std::string reason;
    if (SessionRecorder::validateMeta(meta, reason)) {
        meta_ = normalizeMeta(meta);
    } else {
        Logger::warn("[Session %s] %s, keeping the labels given at start", identity_.address.c_str(),
                     reason.c_str());
    }
    has_meta_ = true;

    std::string path;
    try {
        path = recorder_.save(buffer_, meta_);
    } catch (const PersistenceException& e) {
        Logger::error("[Session %s] Failed to save capture: %s", identity_.address.c_str(), e.what());
        clearCapture();
        setState(SessionState::ARMED);
        throw;
    }

    if (path.empty()) {
        Logger::info("[Session %s] Stopped with no samples, nothing saved", identity_.address.c_str());
    } else {
        Logger::info("[Session %s] Saved %u samples to %s", identity_.address.c_str(),
                     (unsigned)buffer_.size(), path.c_str());
        setLastArtifact(path);
    }
    clearCapture();
    setState(SessionState::ARMED);
    return path;
}

bool DeviceSession::disconnect() {
    if (recovering_) {
        // Link already gone; recovery finishes on its own
        return true;
    }
    intentional_disconnect_ = true;
    bool had_link = static_cast<bool>(link_);
    if (had_link || connected_) setState(SessionState::DISCONNECTING_INTENTIONAL);
    reading_ = false;

    if (link_) {
        try {
            link_->unsubscribe(settings_.notify_channel);
        } catch (const std::exception& e) {
            Logger::debug("[Session %s] Unsubscribe on disconnect: %s", identity_.address.c_str(), e.what());
        }
    }
    closeLinkQuietly();

    connected_ = false;
    clearCapture();
    setState(SessionState::IDLE);
    intentional_disconnect_ = false;
    completeConnect(false);
    if (had_link) {
        Logger::info("[Session %s] Explicitly disconnected", identity_.address.c_str());
    }
    notifyStateChanged();
    return true;
}

void DeviceSession::onReadingFrame(uint64_t generation, double host_time, const std::string& payload) {
    if (generation != link_generation_ || state_ != SessionState::READING) return;
    SensorFrame frame;
    if (!parseSensorFrame(payload, frame)) {
        Logger::debug("[Session %s] Dropped malformed frame", identity_.address.c_str());
        return;
    }
    double force = calibrator_.convert(frame.v3, baseline_);
    buffer_.append(host_time, frame.v3, force);
    sample_count_ = buffer_.size();
}

void DeviceSession::handleLinkLost(uint64_t generation) {
    if (intentional_disconnect_) {
        Logger::debug("[Session %s] Link closed as requested", identity_.address.c_str());
        return;
    }
    if (generation != link_generation_ || !link_) {
        Logger::debug("[Session %s] Ignoring link loss of a retired link", identity_.address.c_str());
        return;
    }
    if (recovering_) {
        deferred_.push_back([this, generation]() { handleLinkLost(generation); });
        return;
    }

    Logger::warn("[Session %s] Device disconnected unexpectedly", identity_.address.c_str());
    recovering_ = true;
    link_error_ = true;
    connected_ = false;
    reading_ = false;
    setState(SessionState::DISCONNECTING_ERROR);
    notifyStateChanged();
    completeConnect(false);
    worker_.post(guarded([this]() { beginRecovery(); }));
}

void DeviceSession::beginRecovery() {
    closeLinkQuietly();

    // Take the capture out so a later connect starts from empty buffers
    recovery_buffer_ = std::move(buffer_);
    recovery_meta_ = has_meta_ ? meta_ : SessionMeta();
    clearCapture();

    if (recovery_buffer_.empty()) {
        Logger::info("[Session %s] No buffered samples, nothing to recover", identity_.address.c_str());
        finishRecovery();
        return;
    }

    Logger::warn("[Session %s] %u samples buffered at link loss", identity_.address.c_str(),
                 (unsigned)recovery_buffer_.size());
    if (!callbacks_.confirm_save) {
        decideRecovery(true);
        return;
    }

    std::future<bool> answer;
    try {
        answer = callbacks_.confirm_save(identity_.address, identity_.name);
    } catch (const std::exception& e) {
        Logger::warn("[Session %s] Save prompt failed (%s), keeping data", identity_.address.c_str(), e.what());
        decideRecovery(true);
        return;
    }
    if (!answer.valid()) {
        decideRecovery(true);
        return;
    }

    auto shared = std::make_shared<std::future<bool>>(std::move(answer));
    pollPrompt(shared, Clock::now() + std::chrono::milliseconds(settings_.save_prompt_timeout_ms));
}

void DeviceSession::pollPrompt(std::shared_ptr<std::future<bool>> answer, Clock::time_point deadline) {
    std::future_status status = answer->wait_for(std::chrono::milliseconds(0));
    if (status == std::future_status::ready || status == std::future_status::deferred) {
        bool save = true;
        try {
            save = answer->get();
        } catch (const std::exception& e) {
            Logger::warn("[Session %s] Save prompt failed (%s), keeping data", identity_.address.c_str(), e.what());
            save = true;
        }
        decideRecovery(save);
        return;
    }
    if (Clock::now() >= deadline) {
        Logger::warn("[Session %s] No answer to save prompt within %u ms, keeping data",
                     identity_.address.c_str(), (unsigned)settings_.save_prompt_timeout_ms);
        decideRecovery(true);
        return;
    }
    worker_.postDelayed(PROMPT_POLL_INTERVAL_MS,
                        guarded([this, answer, deadline]() { pollPrompt(answer, deadline); }));
}

void DeviceSession::decideRecovery(bool save) {
    if (!save) {
        Logger::info("[Session %s] Partial capture discarded", identity_.address.c_str());
        finishRecovery();
        return;
    }
    try {
        std::string path = recorder_.save(recovery_buffer_, recovery_meta_);
        Logger::info("[Session %s] Partial capture saved to %s", identity_.address.c_str(), path.c_str());
        setLastArtifact(path);
    } catch (const PersistenceException& e) {
        Logger::error("[Session %s] Failed to save partial capture: %s", identity_.address.c_str(), e.what());
    }
    finishRecovery();
}

void DeviceSession::finishRecovery() {
    recovery_buffer_.clear();
    recovery_meta_ = SessionMeta();
    recovering_ = false;
    setState(SessionState::IDLE);
    notifyStateChanged();

    std::vector<SessionWorker::Task> pending;
    pending.swap(deferred_);
    for (auto& task : pending) {
        worker_.post(guarded(task));
    }
}

void DeviceSession::closeLinkQuietly() {
    if (!link_) return;
    // Retire the generation first; the close below raises a link-lost of its own
    ++link_generation_;
    std::shared_ptr<SensorLink> link;
    link.swap(link_);
    try {
        link->close();
    } catch (const std::exception& e) {
        Logger::debug("[Session %s] Close failed: %s", identity_.address.c_str(), e.what());
    }
}

void DeviceSession::clearCapture() {
    buffer_.clear();
    meta_ = SessionMeta();
    has_meta_ = false;
    sample_count_ = 0;
}

void DeviceSession::setState(SessionState state) {
    SessionState previous = state_.exchange(state);
    if (previous != state) {
        Logger::debug("[Session %s] %s -> %s", identity_.address.c_str(), sessionStateName(previous),
                      sessionStateName(state));
    }
}

void DeviceSession::notifyStateChanged() {
    if (!callbacks_.state_changed) return;
    try {
        callbacks_.state_changed();
    } catch (const std::exception& e) {
        Logger::warn("[Session %s] State listener failed: %s", identity_.address.c_str(), e.what());
    }
}

void DeviceSession::setLastArtifact(const std::string& path) {
    std::lock_guard<std::mutex> lock(artifact_mutex_);
    last_artifact_ = path;
}

SessionMeta DeviceSession::normalizeMeta(const SessionMeta& meta) {
    SessionMeta out = meta;
    if (out.athlete_id.find_first_not_of(" \t\r\n") == std::string::npos) out.athlete_id = "UNKNOWN";
    return out;
}
