#pragma once

#include "Settings.hpp"

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <variant>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <string_view>

class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class JobState {
    CheckingFiles,
    CheckingResumeData,
    DownloadingMetadata,
    Downloading,
    Finished,
    Seeding,
    Unknown
};

enum class QueueMove { Up, Down, Top, Bottom };

struct JobStatus {
    std::string name;
    std::string content_hash;

    JobState state = JobState::Unknown;
    double progress = 0.0; // 0..1

    int64_t download_rate = 0, upload_rate = 0;
    int num_peers = 0, num_seeds = 0;
    int queue_position = -1;

    int64_t total_wanted = 0, all_time_upload = 0;

    bool paused = false;
    bool super_seeding = false;
    bool has_metadata = false;

    std::optional<double> share_ratio;
};

struct JobFile {
    std::string path;
    int64_t size = 0;
    int priority = 4;
};

// one job inside the engine; implementations must be safe to call from any thread
class BaseJob {
public:
    virtual ~BaseJob() = default;

    virtual std::string content_hash() const = 0;
    virtual bool is_valid() const = 0;
    virtual bool has_metadata() const = 0;
    virtual JobStatus status() const = 0;
    virtual std::vector<JobFile> files() const = 0;

    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void set_auto_managed(bool enable) = 0;
    virtual void set_file_priority(int file, int priority) = 0;
    virtual void set_piece_priority(int piece, int priority) = 0;
    virtual void move_in_queue(QueueMove move) = 0;
    virtual void set_share_ratio(double ratio) = 0;
    virtual void set_super_seeding(bool enable) = 0;
    virtual void set_max_connections(int limit) = 0;

    // answered later by a ResumeDataEvent or ResumeDataFailedEvent
    virtual void request_resume_data() = 0;
};

// events, one struct per kind the orchestrator reacts to

struct JobAddedEvent {
    std::shared_ptr<BaseJob> job;
    std::string name;
};

struct JobAddFailedEvent {
    std::string name;
    std::string error;
};

struct ResumeDataEvent {
    std::string content_hash;
    std::string blob;
};

struct ResumeDataFailedEvent {
    std::string content_hash;
    std::string error;
};

// metadata arrived or the download finished; worth a fresh resume record
struct JobCheckpointEvent {
    std::shared_ptr<BaseJob> job;
    std::string reason;
};

struct DhtItemEvent {
    std::string target;
    std::string value;
};

struct LogEvent {
    std::string source;
    std::string message;
};

struct IgnoredEvent {
    int type = 0;
};

using EngineEvent = std::variant<
    JobAddedEvent,
    JobAddFailedEvent,
    ResumeDataEvent,
    ResumeDataFailedEvent,
    JobCheckpointEvent,
    DhtItemEvent,
    LogEvent,
    IgnoredEvent
>;

struct IpRange {
    std::string first, last;
};

class BaseEngine {
public:
    virtual ~BaseEngine() = default;

    virtual void apply_settings(const SettingsMap& settings) = 0;
    virtual std::optional<SettingValue> get_setting(const std::string& name) const = 0;

    // opaque session blob (dht state and the like), fed back to the factory on next start
    virtual std::string save_state() const = 0;

    // validation failures throw EngineError, engine rejection arrives as JobAddFailedEvent
    virtual void async_add_magnet(const std::string& uri, const std::filesystem::path& save_path) = 0;
    virtual void async_add_torrent_file(const std::filesystem::path& file, const std::filesystem::path& save_path) = 0;
    virtual void async_add_torrent_buffer(std::string_view data, const std::filesystem::path& save_path) = 0;
    virtual void async_add_resume(std::string_view blob, const std::filesystem::path& save_path) = 0;

    virtual void remove_job(const std::string& content_hash, bool delete_files) = 0;

    virtual bool wait_for_event(std::chrono::milliseconds timeout) = 0;
    virtual std::vector<EngineEvent> pop_events() = 0;

    // replaces the whole filter
    virtual void set_ip_filter(const std::vector<IpRange>& blocked) = 0;

    // returns the target hash as hex
    virtual std::string dht_put(const std::string& data) = 0;
    virtual void dht_get(const std::string& target_hex) = 0;
};
