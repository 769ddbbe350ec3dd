#pragma once

#include "Engine.hpp"

#include <atomic>
#include <memory>

#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/alert.hpp>

class LibtorrentJob : public BaseJob {
public:
    explicit LibtorrentJob(lt::torrent_handle handle): _handle(std::move(handle)) {}

    std::string content_hash() const override;
    bool is_valid() const override { return _handle.is_valid(); }
    bool has_metadata() const override;
    JobStatus status() const override;
    std::vector<JobFile> files() const override;

    void pause() override;
    void resume() override;
    void set_auto_managed(bool enable) override;
    void set_file_priority(int file, int priority) override;
    void set_piece_priority(int piece, int priority) override;
    void move_in_queue(QueueMove move) override;
    void set_share_ratio(double ratio) override { _share_ratio.store(ratio); }
    void set_super_seeding(bool enable) override;
    void set_max_connections(int limit) override;
    void request_resume_data() override;

private:
    lt::torrent_handle _handle;

    // libtorrent 2.x has no per-torrent ratio; kept here for display, negative means unset
    std::atomic<double> _share_ratio{ -1.0 };
};

class LibtorrentEngine : public BaseEngine {
public:
    LibtorrentEngine(const SettingsMap& settings, const std::string& state);

    void apply_settings(const SettingsMap& settings) override;
    std::optional<SettingValue> get_setting(const std::string& name) const override;
    std::string save_state() const override;

    void async_add_magnet(const std::string& uri, const std::filesystem::path& save_path) override;
    void async_add_torrent_file(const std::filesystem::path& file, const std::filesystem::path& save_path) override;
    void async_add_torrent_buffer(std::string_view data, const std::filesystem::path& save_path) override;
    void async_add_resume(std::string_view blob, const std::filesystem::path& save_path) override;

    void remove_job(const std::string& content_hash, bool delete_files) override;

    bool wait_for_event(std::chrono::milliseconds timeout) override;
    std::vector<EngineEvent> pop_events() override;

    void set_ip_filter(const std::vector<IpRange>& blocked) override;

    std::string dht_put(const std::string& data) override;
    void dht_get(const std::string& target_hex) override;

private:
    EngineEvent convert(lt::alert* alert) const;

    std::unique_ptr<lt::session> _session;
};
