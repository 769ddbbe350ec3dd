#pragma once

#include "Engine.hpp"
#include "EngineFactory.hpp"
#include "Console.hpp"
#include "ClientOptions.hpp"
#include "SessionStore.hpp"
#include "JobRegistry.hpp"
#include "JobSnapshot.hpp"
#include "ResumeTracker.hpp"
#include "ShutdownBarrier.hpp"
#include "ConfigTranslator.hpp"
#include "AlertDispatcher.hpp"
#include "FeedManager.hpp"

#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <ostream>
#include <filesystem>

struct AddJobResult {
    bool success;
    std::string message;
};

class Client {
public:
    Client(ClientOptions options, const EngineFactory& factory, std::shared_ptr<BaseFeedFetcher> fetcher, std::ostream& out);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // event thread, feed thread, then every saved resume record
    void start();

    // runs once; later calls return the first report
    ShutdownReport shutdown();

    AddJobResult add_job(const std::string& source);
    bool submit(const JobSource& source);

    // indices are display indices, in queue order; bad ones throw std::out_of_range
    void pause(size_t index);
    void resume(size_t index);
    void remove(size_t index, bool delete_files);
    void move_in_queue(size_t index, QueueMove move);
    void set_share_ratio(size_t index, double ratio);
    void set_super_seeding(size_t index, bool enable);
    void set_max_connections(size_t index, int limit);
    void set_file_priority(size_t index, int file, int priority);
    void set_piece_priority(size_t index, int piece, int priority);

    JobStatus info(size_t index) const;
    std::vector<JobFile> files(size_t index) const;
    std::vector<JobSnapshot> job_snapshots() const;

    // totals line under the job list
    std::string summary() const;

    size_t load_ip_filter(const std::filesystem::path& path);
    std::string dht_put(const std::string& data);
    void dht_get(const std::string& target);

    // type is socks4, socks5 or http
    void set_proxy(const std::string& type, const std::string& host, int port);
    void clear_proxy();

    ConfigTranslator& config() { return _config; }
    FeedManager& feeds() { return *_feeds; }
    Console& console() { return _console; }
    const SessionStore& store() const { return _store; }
    const SettingsMap& settings() const { return _settings; }
    size_t job_count() const { return _registry.size(); }

private:
    SessionState load_state();
    std::shared_ptr<BaseJob> job_at(size_t index) const;
    void apply(const SettingsMap& changes);

    ClientOptions _options;
    Console _console;
    SessionStore _store;
    SessionState _state;

    // canonical settings: defaults merged with what session.dat carried
    SettingsMap _settings;
    std::unique_ptr<BaseEngine> _engine;

    JobRegistry _registry;
    ResumeTracker _tracker;
    ConfigTranslator _config;
    AlertDispatcher _dispatcher;
    std::unique_ptr<FeedManager> _feeds;

    std::atomic<size_t> _ip_filter_rules{0};

    std::mutex _shutdown_mutex;
    std::optional<ShutdownReport> _shutdown_report;
};
