#include "Client.hpp"
#include "IpFilter.hpp"
#include "Utils.hpp"

#include <format>
#include <stdexcept>

#include <boost/log/trivial.hpp>

namespace {

// libtorrent settings_pack::proxy_type_t
int64_t proxy_type_of(const std::string& name) {
    auto type = to_lower(name);
    if (type == "socks4") return 1;
    if (type == "socks5") return 2;
    if (type == "http") return 4;
    throw std::invalid_argument("Proxy type must be socks4, socks5 or http.");
}

void check_priority(int priority) {
    if (priority < 0 || priority > 7) throw std::invalid_argument("Priority must be between 0 and 7.");
}

}

Client::Client(ClientOptions options, const EngineFactory& factory, std::shared_ptr<BaseFeedFetcher> fetcher, std::ostream& out)
    : _options(std::move(options))
    , _console(out)
    , _store(_options.state_dir)
    , _state(load_state())
    , _settings(merge_settings(default_settings(), _state.settings))
    , _engine(factory(_settings, _state.engine_state))
    , _config(_settings, *_engine)
    , _dispatcher(*_engine, _registry, _store, _tracker, _console, _options.alert_wait)
    , _feeds(std::make_unique<FeedManager>(
        _store.feeds_file(),
        std::move(fetcher),
        [this](const JobSource& source) { return submit(source); },
        _options.feed_interval)) {
    // the engine blob is not needed once the engine holds it
    _state.engine_state.clear();
}

Client::~Client() {
    try {
        shutdown();
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Shutdown failed: " << e.what();
    }
}

SessionState Client::load_state() {
    // the only failure that stops startup
    _store.ensure_layout(_options.save_path);
    return _store.load_session();
}

void Client::start() {
    _dispatcher.start();
    if (_options.feeds_enabled) _feeds->start();

    auto scan = _store.load_all_job_resumes();
    size_t resumed = 0;

    while (auto record = scan.next()) {
        try {
            _engine->async_add_resume(record->blob, _options.save_path);
            ++resumed;
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "Could not resume " << record->path.string() << ": " << e.what();
        }
    }

    BOOST_LOG_TRIVIAL(info) << "Resuming " << resumed << " torrents, " << scan.skipped() << " resume files skipped.";
}

ShutdownReport Client::shutdown() {
    std::scoped_lock lock(_shutdown_mutex);
    if (_shutdown_report) return *_shutdown_report;

    BOOST_LOG_TRIVIAL(info) << "Shutting down...";
    _console.println("Shutting down, saving state...");

    _feeds->stop();

    _tracker.open();
    _dispatcher.request_stop();

    _store.save_session(_settings, _engine->save_state());

    // without a running event loop no answer can arrive
    ShutdownReport report;
    if (_dispatcher.running()) report = ShutdownBarrier(_registry, _tracker, _options.shutdown_timeout).collect();

    _tracker.close();
    _dispatcher.join();

    BOOST_LOG_TRIVIAL(info) << "Shutdown complete, " << report.confirmed << "/" << report.requested << " resume records saved.";
    _console.println("Shutdown complete.");

    _shutdown_report = report;
    return report;
}

AddJobResult Client::add_job(const std::string& source) {
    try {
        if (source.starts_with("magnet:")) {
            _engine->async_add_magnet(source, _options.save_path);
            return { true, "Adding magnet link..." };
        }

        std::error_code ec;
        if (!source.empty() && std::filesystem::is_regular_file(source, ec)) {
            _engine->async_add_torrent_file(source, _options.save_path);
            return { true, "Adding " + source };
        }
    }
    catch (const EngineError& e) {
        BOOST_LOG_TRIVIAL(error) << "Add failed for " << source << ": " << e.what();
        return { false, e.what() };
    }

    return { false, "Invalid torrent source." };
}

bool Client::submit(const JobSource& source) {
    try {
        if (!source.payload.empty()) _engine->async_add_torrent_buffer(source.payload, _options.save_path);
        else if (source.uri.starts_with("magnet:")) _engine->async_add_magnet(source.uri, _options.save_path);
        else return false;
    }
    catch (const EngineError& e) {
        BOOST_LOG_TRIVIAL(error) << "Feed job " << source.uri << " rejected: " << e.what();
        return false;
    }

    return true;
}

std::shared_ptr<BaseJob> Client::job_at(size_t index) const {
    return _registry.at(index);
}

void Client::pause(size_t index) {
    job_at(index)->pause();
}

void Client::resume(size_t index) {
    job_at(index)->resume();
}

void Client::remove(size_t index, bool delete_files) {
    auto job = job_at(index);
    auto hash = job->content_hash();

    _engine->remove_job(hash, delete_files);

    // after this no resume data for the hash is written, so the record can go
    _registry.remove(job);
    _store.remove_job_resume(hash);

    BOOST_LOG_TRIVIAL(info) << "Removed " << hash << (delete_files ? " with data" : "");
}

void Client::move_in_queue(size_t index, QueueMove move) {
    job_at(index)->move_in_queue(move);
}

void Client::set_share_ratio(size_t index, double ratio) {
    if (!(ratio >= 0.0)) throw std::invalid_argument("Ratio must be a non-negative number.");
    job_at(index)->set_share_ratio(ratio);
}

void Client::set_super_seeding(size_t index, bool enable) {
    job_at(index)->set_super_seeding(enable);
}

void Client::set_max_connections(size_t index, int limit) {
    if (limit <= 0) throw std::invalid_argument("Connection limit must be positive.");
    job_at(index)->set_max_connections(limit);
}

void Client::set_file_priority(size_t index, int file, int priority) {
    check_priority(priority);

    auto job = job_at(index);
    if (!job->has_metadata()) throw std::runtime_error("Torrent metadata not available yet.");

    auto count = job->files().size();
    if (file < 0 || static_cast<size_t>(file) >= count) throw std::out_of_range("Invalid file index.");

    job->set_file_priority(file, priority);
}

void Client::set_piece_priority(size_t index, int piece, int priority) {
    check_priority(priority);
    if (piece < 0) throw std::out_of_range("Invalid piece index.");

    job_at(index)->set_piece_priority(piece, priority);
}

JobStatus Client::info(size_t index) const {
    return job_at(index)->status();
}

std::vector<JobFile> Client::files(size_t index) const {
    return job_at(index)->files();
}

std::vector<JobSnapshot> Client::job_snapshots() const {
    std::vector<JobSnapshot> out;

    size_t index = 0;
    for (const auto& job: _registry.ordered()) {
        try {
            auto status = job->status();
            auto label = status_label(status);
            out.push_back({ index, std::move(status), std::move(label) });
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(debug) << "Skipping job in listing: " << e.what();
        }
        ++index;
    }

    return out;
}

std::string Client::summary() const {
    int64_t down = 0, up = 0;
    auto snapshots = job_snapshots();
    for (const auto& s: snapshots) {
        down += s.status.download_rate;
        up += s.status.upload_rate;
    }

    auto out = std::format("DL: {} | UL: {} | Torrents: {}",
        format_speed(static_cast<double>(down)), format_speed(static_cast<double>(up)), snapshots.size());

    auto proxy = _engine->get_setting("proxy_type");
    if (proxy) {
        if (auto* type = std::get_if<int64_t>(&*proxy); type && *type > 0) out += " | proxy";
    }
    if (size_t rules = _ip_filter_rules; rules > 0) out += std::format(" | filter({})", rules);
    if (_feeds->running()) out += std::format(" | feeds({})", _feeds->feeds().size());

    return out;
}

size_t Client::load_ip_filter(const std::filesystem::path& path) {
    auto ranges = ::load_ip_filter(path);
    _engine->set_ip_filter(ranges);
    _ip_filter_rules = ranges.size();

    BOOST_LOG_TRIVIAL(info) << "IP filter loaded from " << path.string() << ", " << ranges.size() << " ranges.";
    return ranges.size();
}

std::string Client::dht_put(const std::string& data) {
    return _engine->dht_put(data);
}

void Client::dht_get(const std::string& target) {
    auto hash = to_lower(target);
    if (!is_hex_digest(hash)) throw std::invalid_argument("DHT target must be 40 hex characters.");
    _engine->dht_get(hash);
}

void Client::apply(const SettingsMap& changes) {
    _engine->apply_settings(changes);
    for (const auto& [name, value]: changes) _settings.insert_or_assign(name, value);
}

void Client::set_proxy(const std::string& type, const std::string& host, int port) {
    if (host.empty()) throw std::invalid_argument("Proxy host must not be empty.");
    if (port <= 0 || port > 65535) throw std::invalid_argument("Proxy port must be between 1 and 65535.");

    apply({
        { "proxy_type", proxy_type_of(type) },
        { "proxy_hostname", host },
        { "proxy_port", int64_t{ port } },
    });

    BOOST_LOG_TRIVIAL(info) << "Proxy set to " << type << " " << host << ":" << port;
}

void Client::clear_proxy() {
    apply({ { "proxy_type", int64_t{ 0 } } });
    BOOST_LOG_TRIVIAL(info) << "Proxy cleared.";
}
