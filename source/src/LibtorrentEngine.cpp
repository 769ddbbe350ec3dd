#include "LibtorrentEngine.hpp"
#include "Utils.hpp"

#include <sstream>

#include <boost/log/trivial.hpp>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/address.hpp>
#include <libtorrent/download_priority.hpp>
#include <libtorrent/entry.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/ip_filter.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/read_resume_data.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>
#include <libtorrent/write_resume_data.hpp>

namespace {

std::string hex_of(const lt::sha1_hash& h) {
    return to_hex(std::string_view(h.data(), lt::sha1_hash::size()));
}

// v1 hash when the torrent has one, so keys match the "info-hash" field of resume files
std::string hash_of(const lt::info_hash_t& ih) {
    return hex_of(ih.has_v1() ? ih.v1 : ih.get_best());
}

std::string hash_of(const lt::torrent_handle& h) {
    try {
        if (h.is_valid()) return hash_of(h.info_hashes());
    }
    catch (const lt::system_error&) {
        // handle invalidated between the check and the call
    }
    return {};
}

lt::sha1_hash parse_hash(const std::string& hex) {
    if (!is_hex_digest(hex)) throw EngineError("Invalid hash: " + hex);

    lt::sha1_hash out;
    std::istringstream in(hex);
    in >> out;
    return out;
}

JobState map_state(lt::torrent_status::state_t state) {
    using ts = lt::torrent_status;
    switch (state) {
        case ts::checking_files: return JobState::CheckingFiles;
        case ts::checking_resume_data: return JobState::CheckingResumeData;
        case ts::downloading_metadata: return JobState::DownloadingMetadata;
        case ts::downloading: return JobState::Downloading;
        case ts::finished: return JobState::Finished;
        case ts::seeding: return JobState::Seeding;
        default: return JobState::Unknown;
    }
}

lt::download_priority_t to_priority(int value) {
    return lt::download_priority_t{ static_cast<std::uint8_t>(value) };
}

void fill_settings_pack(lt::settings_pack& pack, const SettingsMap& settings) {
    for (const auto& [name, value]: settings) {
        const int index = lt::setting_by_name(name);
        if (index < 0) {
            BOOST_LOG_TRIVIAL(warning) << "Engine does not know setting '" << name << "', skipped";
            continue;
        }

        switch (index & lt::settings_pack::type_mask) {
            case lt::settings_pack::string_type_base:
                pack.set_str(index, setting_to_string(value));
                break;
            case lt::settings_pack::int_type_base:
                if (auto* i = std::get_if<int64_t>(&value)) pack.set_int(index, static_cast<int>(*i));
                else if (auto* b = std::get_if<bool>(&value)) pack.set_int(index, *b ? 1 : 0);
                else BOOST_LOG_TRIVIAL(warning) << "Setting '" << name << "' expects an integer";
                break;
            case lt::settings_pack::bool_type_base:
                if (auto* b = std::get_if<bool>(&value)) pack.set_bool(index, *b);
                else if (auto* i = std::get_if<int64_t>(&value)) pack.set_bool(index, *i != 0);
                else BOOST_LOG_TRIVIAL(warning) << "Setting '" << name << "' expects a boolean";
                break;
        }
    }
}

std::string item_text(const lt::entry& item) {
    if (item.type() == lt::entry::string_t) return item.string();
    return item.to_string();
}

}

// -------------------- job --------------------

std::string LibtorrentJob::content_hash() const {
    return hash_of(_handle);
}

bool LibtorrentJob::has_metadata() const {
    return _handle.status(lt::status_flags_t{}).has_metadata;
}

JobStatus LibtorrentJob::status() const {
    lt::torrent_status s = _handle.status();

    JobStatus out;
    out.name = s.name;
    out.content_hash = hash_of(s.info_hashes);
    out.state = map_state(s.state);
    out.progress = s.progress;
    out.download_rate = s.download_rate;
    out.upload_rate = s.upload_rate;
    out.num_peers = s.num_peers;
    out.num_seeds = s.num_seeds;
    out.queue_position = static_cast<int>(s.queue_position);
    out.total_wanted = s.total_wanted;
    out.all_time_upload = s.all_time_upload;
    out.paused = static_cast<bool>(s.flags & lt::torrent_flags::paused);
    out.super_seeding = static_cast<bool>(s.flags & lt::torrent_flags::super_seeding);
    out.has_metadata = s.has_metadata;

    if (auto ratio = _share_ratio.load(); ratio >= 0.0) out.share_ratio = ratio;

    return out;
}

std::vector<JobFile> LibtorrentJob::files() const {
    std::vector<JobFile> out;

    auto ti = _handle.torrent_file();
    if (!ti) return out;

    const auto priorities = _handle.get_file_priorities();
    const auto& fs = ti->files();

    for (auto index: fs.file_range()) {
        auto i = static_cast<size_t>(static_cast<int>(index));

        JobFile file;
        file.path = fs.file_path(index);
        file.size = fs.file_size(index);
        if (i < priorities.size()) file.priority = static_cast<std::uint8_t>(priorities[i]);

        out.push_back(std::move(file));
    }

    return out;
}

void LibtorrentJob::pause() {
    // auto-managed torrents get restarted by the queue unless released first
    _handle.unset_flags(lt::torrent_flags::auto_managed);
    _handle.pause();
}

void LibtorrentJob::resume() {
    _handle.set_flags(lt::torrent_flags::auto_managed);
    _handle.resume();
}

void LibtorrentJob::set_auto_managed(bool enable) {
    if (enable) _handle.set_flags(lt::torrent_flags::auto_managed);
    else _handle.unset_flags(lt::torrent_flags::auto_managed);
}

void LibtorrentJob::set_file_priority(int file, int priority) {
    _handle.file_priority(lt::file_index_t{ file }, to_priority(priority));
}

void LibtorrentJob::set_piece_priority(int piece, int priority) {
    _handle.piece_priority(lt::piece_index_t{ piece }, to_priority(priority));
}

void LibtorrentJob::move_in_queue(QueueMove move) {
    switch (move) {
        case QueueMove::Up: _handle.queue_position_up(); break;
        case QueueMove::Down: _handle.queue_position_down(); break;
        case QueueMove::Top: _handle.queue_position_top(); break;
        case QueueMove::Bottom: _handle.queue_position_bottom(); break;
    }
}

void LibtorrentJob::set_super_seeding(bool enable) {
    if (enable) _handle.set_flags(lt::torrent_flags::super_seeding);
    else _handle.unset_flags(lt::torrent_flags::super_seeding);
}

void LibtorrentJob::set_max_connections(int limit) {
    _handle.set_max_connections(limit);
}

void LibtorrentJob::request_resume_data() {
    // the info dict makes the record self-contained for restarts
    _handle.save_resume_data(lt::torrent_handle::save_info_dict);
}

// -------------------- engine --------------------

LibtorrentEngine::LibtorrentEngine(const SettingsMap& settings, const std::string& state) {
    lt::session_params params;

    if (!state.empty()) {
        try {
            params = lt::read_session_params(lt::span<char const>(state.data(), static_cast<std::ptrdiff_t>(state.size())), lt::session::save_dht_state);
            BOOST_LOG_TRIVIAL(info) << "Engine session state restored.";
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "Engine session state unreadable, starting fresh: " << e.what();
            params = lt::session_params{};
        }
    }

    fill_settings_pack(params.settings, settings);
    _session = std::make_unique<lt::session>(std::move(params));
}

void LibtorrentEngine::apply_settings(const SettingsMap& settings) {
    lt::settings_pack pack;
    fill_settings_pack(pack, settings);
    _session->apply_settings(std::move(pack));
}

std::optional<SettingValue> LibtorrentEngine::get_setting(const std::string& name) const {
    const int index = lt::setting_by_name(name);
    if (index < 0) return std::nullopt;

    auto pack = _session->get_settings();

    switch (index & lt::settings_pack::type_mask) {
        case lt::settings_pack::string_type_base: return SettingValue{ pack.get_str(index) };
        case lt::settings_pack::int_type_base: return SettingValue{ static_cast<int64_t>(pack.get_int(index)) };
        case lt::settings_pack::bool_type_base: return SettingValue{ pack.get_bool(index) };
    }
    return std::nullopt;
}

std::string LibtorrentEngine::save_state() const {
    auto buf = lt::write_session_params_buf(_session->session_state(lt::session::save_dht_state));
    return std::string(buf.begin(), buf.end());
}

void LibtorrentEngine::async_add_magnet(const std::string& uri, const std::filesystem::path& save_path) {
    lt::error_code ec;
    lt::add_torrent_params params = lt::parse_magnet_uri(uri, ec);
    if (ec) throw EngineError("Invalid magnet link: " + ec.message());

    params.save_path = save_path.string();
    _session->async_add_torrent(std::move(params));
}

void LibtorrentEngine::async_add_torrent_file(const std::filesystem::path& file, const std::filesystem::path& save_path) {
    lt::error_code ec;
    auto ti = std::make_shared<lt::torrent_info>(file.string(), ec);
    if (ec) throw EngineError("Invalid torrent file " + file.string() + ": " + ec.message());

    lt::add_torrent_params params;
    params.ti = std::move(ti);
    params.save_path = save_path.string();
    _session->async_add_torrent(std::move(params));
}

void LibtorrentEngine::async_add_torrent_buffer(std::string_view data, const std::filesystem::path& save_path) {
    lt::error_code ec;
    auto ti = std::make_shared<lt::torrent_info>(lt::span<char const>(data.data(), static_cast<std::ptrdiff_t>(data.size())), ec, lt::from_span);
    if (ec) throw EngineError("Invalid torrent metadata: " + ec.message());

    lt::add_torrent_params params;
    params.ti = std::move(ti);
    params.save_path = save_path.string();
    _session->async_add_torrent(std::move(params));
}

void LibtorrentEngine::async_add_resume(std::string_view blob, const std::filesystem::path& save_path) {
    lt::error_code ec;
    lt::add_torrent_params params = lt::read_resume_data(lt::span<char const>(blob.data(), static_cast<std::ptrdiff_t>(blob.size())), ec);
    if (ec) throw EngineError("Invalid resume data: " + ec.message());

    // a job moved elsewhere keeps its recorded location
    if (params.save_path.empty()) params.save_path = save_path.string();
    _session->async_add_torrent(std::move(params));
}

void LibtorrentEngine::remove_job(const std::string& content_hash, bool delete_files) {
    auto handle = _session->find_torrent(parse_hash(content_hash));
    if (!handle.is_valid()) throw EngineError("No job with hash " + content_hash);

    _session->remove_torrent(handle, delete_files ? lt::session::delete_files : lt::remove_flags_t{});
}

bool LibtorrentEngine::wait_for_event(std::chrono::milliseconds timeout) {
    return _session->wait_for_alert(timeout) != nullptr;
}

std::vector<EngineEvent> LibtorrentEngine::pop_events() {
    std::vector<lt::alert*> alerts;
    _session->pop_alerts(&alerts);

    // alerts die on the next pop, everything is copied out here
    std::vector<EngineEvent> out;
    out.reserve(alerts.size());
    for (auto* alert: alerts) out.push_back(convert(alert));

    return out;
}

EngineEvent LibtorrentEngine::convert(lt::alert* alert) const {
    if (auto* added = lt::alert_cast<lt::add_torrent_alert>(alert)) {
        if (added->error) return JobAddFailedEvent{ added->torrent_name(), added->error.message() };
        return JobAddedEvent{ std::make_shared<LibtorrentJob>(added->handle), added->torrent_name() };
    }

    if (auto* resume = lt::alert_cast<lt::save_resume_data_alert>(alert)) {
        auto buf = lt::write_resume_data_buf(resume->params);
        return ResumeDataEvent{ hash_of(resume->params.info_hashes), std::string(buf.begin(), buf.end()) };
    }

    if (auto* failed = lt::alert_cast<lt::save_resume_data_failed_alert>(alert)) {
        return ResumeDataFailedEvent{ hash_of(failed->handle), failed->error.message() };
    }

    if (auto* metadata = lt::alert_cast<lt::metadata_received_alert>(alert)) {
        return JobCheckpointEvent{ std::make_shared<LibtorrentJob>(metadata->handle), "metadata received" };
    }

    if (auto* finished = lt::alert_cast<lt::torrent_finished_alert>(alert)) {
        return JobCheckpointEvent{ std::make_shared<LibtorrentJob>(finished->handle), "download finished" };
    }

    if (auto* immutable = lt::alert_cast<lt::dht_immutable_item_alert>(alert)) {
        return DhtItemEvent{ hex_of(immutable->target), item_text(immutable->item) };
    }

    if (auto* mut = lt::alert_cast<lt::dht_mutable_item_alert>(alert)) {
        return DhtItemEvent{ to_hex(std::string_view(mut->key.data(), mut->key.size())), item_text(mut->item) };
    }

    if (auto* log = lt::alert_cast<lt::torrent_log_alert>(alert)) {
        return LogEvent{ log->torrent_name(), log->log_message() };
    }

    if (auto* log = lt::alert_cast<lt::log_alert>(alert)) {
        return LogEvent{ "session", log->log_message() };
    }

    return IgnoredEvent{ alert->type() };
}

void LibtorrentEngine::set_ip_filter(const std::vector<IpRange>& blocked) {
    lt::ip_filter filter;

    for (const auto& range: blocked) {
        lt::error_code ec;
        auto first = lt::make_address(range.first, ec);
        if (ec) throw EngineError("Invalid address: " + range.first);
        auto last = lt::make_address(range.last, ec);
        if (ec) throw EngineError("Invalid address: " + range.last);

        filter.add_rule(first, last, lt::ip_filter::blocked);
    }

    _session->set_ip_filter(std::move(filter));
}

std::string LibtorrentEngine::dht_put(const std::string& data) {
    return hex_of(_session->dht_put_item(lt::entry(data)));
}

void LibtorrentEngine::dht_get(const std::string& target_hex) {
    _session->dht_get_item(parse_hash(target_hex));
}
