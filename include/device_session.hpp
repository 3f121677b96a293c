#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "force_calibrator.hpp"
#include "session_recorder.hpp"
#include "session_worker.hpp"
#include "transport.hpp"
#include "types.hpp"

enum class SessionState {
    IDLE,
    CONNECTING,
    BASELINE_CALIBRATING,
    ARMED,
    READING,
    STOPPING,
    DISCONNECTING_INTENTIONAL,
    DISCONNECTING_ERROR
};

const char* sessionStateName(SessionState state);

// Asks the user whether to keep a capture interrupted by link loss
using SaveConfirmFn = std::function<std::future<bool>(const std::string& device_id, const std::string& device_name)>;
using StateChangedFn = std::function<void()>;

// Both optional; they run on the session worker
struct SessionCallbacks {
    SaveConfirmFn confirm_save;     // absent: interrupted captures are kept
    StateChangedFn state_changed;
};

struct SessionSettings {
    std::string notify_channel = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";
    double connect_timeout_s = 20.0;
    uint32_t baseline_window_ms = 5000;
    uint32_t save_prompt_timeout_ms = 60000;  // 0: decide "save" without waiting
    CalibrationMethod method = CalibrationMethod::PIECEWISE;
    bool allow_extrapolation = true;
};

struct SessionStatus {
    DeviceIdentity identity;
    SessionState state = SessionState::IDLE;
    bool connected = false;
    bool reading = false;
    bool link_error = false;
    double baseline = 0.0;
    size_t buffered = 0;
    std::string last_artifact;
};

/**
 * @brief Connection and acquisition lifecycle of one sensor.
 *
 * Every mutating method must run on the session worker. Transport callbacks
 * (frames, link loss) are re-posted onto the worker before they touch state.
 * The status accessors are safe from any thread.
 */
class DeviceSession {
public:
    static constexpr uint32_t PROMPT_POLL_INTERVAL_MS = 50;

    DeviceSession(const DeviceIdentity& identity,
                  SessionWorker& worker,
                  Transport& transport,
                  const CalibrationTable& table,
                  const SessionSettings& settings,
                  const SessionRecorder& recorder,
                  const SessionCallbacks& callbacks);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Opens the link and runs the baseline window; on_done(true) once Armed
    void connect(std::function<void(bool)> on_done);

    // Armed -> Reading. False when the link is not up.
    bool startReading(const SessionMeta& meta);

    /**
     * @brief Reading -> Armed, persisting the capture.
     * @return Artifact path, empty when nothing was buffered
     * @throws PersistenceException; the session is back in Armed with buffers cleared
     */
    std::string stopReading(const SessionMeta& meta);

    // Intentional disconnect; never prompts, always succeeds
    bool disconnect();

    const DeviceIdentity& identity() const { return identity_; }
    SessionState state() const { return state_.load(); }
    bool isConnected() const { return connected_.load(); }
    bool isReading() const { return reading_.load(); }
    bool hasLinkError() const { return link_error_.load(); }
    bool isRecovering() const { return recovering_.load(); }
    double baseline() const { return baseline_.load(); }
    size_t bufferedSamples() const { return sample_count_.load(); }
    SessionStatus status() const;

private:
    using Clock = std::chrono::steady_clock;

    DeviceIdentity identity_;
    SessionWorker& worker_;
    Transport& transport_;
    SessionSettings settings_;
    ForceCalibrator calibrator_;
    SessionRecorder recorder_;
    SessionCallbacks callbacks_;

    std::shared_ptr<SensorLink> link_;
    uint64_t link_generation_ = 0;
    bool intentional_disconnect_ = false;
    std::function<void(bool)> connect_done_;
    std::vector<double> baseline_samples_;

    SampleBuffer buffer_;
    SessionMeta meta_;
    bool has_meta_ = false;

    SampleBuffer recovery_buffer_;
    SessionMeta recovery_meta_;
    std::vector<SessionWorker::Task> deferred_;

    std::atomic<SessionState> state_;
    std::atomic<bool> connected_;
    std::atomic<bool> reading_;
    std::atomic<bool> link_error_;
    std::atomic<bool> recovering_;
    std::atomic<double> baseline_;
    std::atomic<size_t> sample_count_;

    mutable std::mutex artifact_mutex_;
    std::string last_artifact_;

    // Expires with the session so queued work for a removed session is skipped
    std::shared_ptr<bool> alive_;

    SessionWorker::Task guarded(std::function<void()> fn) const;
    FrameHandler makeFrameHandler(uint64_t generation, bool baseline_phase);
    LinkLostHandler makeLinkLostHandler(uint64_t generation);

    void onBaselineFrame(uint64_t generation, const std::string& payload);
    void onReadingFrame(uint64_t generation, double host_time, const std::string& payload);
    void finishBaseline(uint64_t generation);
    void failConnect(const char* reason);
    void completeConnect(bool ok);

    void handleLinkLost(uint64_t generation);
    void beginRecovery();
    void pollPrompt(std::shared_ptr<std::future<bool>> answer, Clock::time_point deadline);
    void decideRecovery(bool save);
    void finishRecovery();

    void closeLinkQuietly();
    void clearCapture();
    void setState(SessionState state);
    void notifyStateChanged();
    void setLastArtifact(const std::string& path);
    static SessionMeta normalizeMeta(const SessionMeta& meta);
};
