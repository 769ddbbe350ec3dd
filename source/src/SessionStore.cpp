#include "SessionStore.hpp"
#include "BEncode.hpp"
#include "Utils.hpp"

#include <algorithm>

#include <boost/log/trivial.hpp>

namespace fs = std::filesystem;

ResumeScan::ResumeScan(const fs::path& dir) {
    std::error_code ec;
    _it = fs::directory_iterator(dir, ec);

    if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot list resume directory " << dir.string() << ": " << ec.message();
        _it = fs::directory_iterator();
    }
}

std::optional<ResumeRecord> ResumeScan::next() {
    const fs::directory_iterator end;

    while (_it != end) {
        auto path = _it->path();
        std::error_code ec;
        bool regular = _it->is_regular_file(ec);

        _it.increment(ec);
        if (ec) {
            BOOST_LOG_TRIVIAL(warning) << "Resume directory walk stopped: " << ec.message();
            _it = end;
        }

        if (!regular || path.extension() != ".fastresume") continue;

        try {
            auto blob = read_from_file(path);
            auto hash = SessionStore::content_hash_of(blob);

            if (!hash) {
                BOOST_LOG_TRIVIAL(warning) << "Skipping resume file without a valid info-hash: " << path.string();
                ++_skipped;
                continue;
            }

            return ResumeRecord{ std::move(*hash), std::move(blob), std::move(path) };
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "Skipping unreadable resume file " << path.string() << ": " << e.what();
            ++_skipped;
        }
    }

    return std::nullopt;
}

SessionStore::SessionStore(fs::path state_dir): _state_dir(std::move(state_dir)) {}

void SessionStore::ensure_layout(const fs::path& save_path) const {
    fs::create_directories(_state_dir);
    fs::create_directories(resume_dir());
    fs::create_directories(save_path);
}

SessionState SessionStore::load_session() const {
    SessionState out;
    auto path = session_file();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        BOOST_LOG_TRIVIAL(info) << "No saved session at " << path.string() << ", using defaults.";
        return out;
    }

    try {
        auto data = read_from_file(path);
        auto root = BEncodeParser(data).parse();

        if (!root.is_dict()) throw std::runtime_error("session file is not a dictionary");

        if (auto* settings = root.find("settings")) out.settings = settings_from_bencode(*settings);
        if (auto* state = root.find("session"); state && state->is_string()) out.engine_state = state->as_string();

        out.loaded = true;
        BOOST_LOG_TRIVIAL(info) << "Loaded session with " << out.settings.size() << " saved settings.";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Could not load session from " << path.string() << ", using defaults: " << e.what();
        out = SessionState{};
    }

    return out;
}

bool SessionStore::save_session(const SettingsMap& settings, std::string_view engine_state) const {
    BEncodeValue::Dict root;
    root.emplace("settings", settings_to_bencode(settings));
    root.emplace("session", BEncodeValue{ std::string(engine_state) });

    try {
        write_file_atomic(session_file(), bencode(BEncodeValue{ std::move(root) }));
        BOOST_LOG_TRIVIAL(info) << "Session state saved.";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Could not save session: " << e.what();
        return false;
    }
}

bool SessionStore::save_job_resume(const std::string& content_hash, std::string_view blob) const {
    if (!is_hex_digest(content_hash)) {
        BOOST_LOG_TRIVIAL(error) << "Refusing resume record with bad hash '" << content_hash << "'";
        return false;
    }

    try {
        write_file_atomic(resume_file(content_hash), blob);
        BOOST_LOG_TRIVIAL(debug) << "Resume data saved for " << content_hash;
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Could not save resume data for " << content_hash << ": " << e.what();
        return false;
    }
}

bool SessionStore::remove_job_resume(const std::string& content_hash) const {
    if (!is_hex_digest(content_hash)) return false;

    std::error_code ec;
    bool removed = fs::remove(resume_file(content_hash), ec);
    if (ec) BOOST_LOG_TRIVIAL(warning) << "Could not remove resume data for " << content_hash << ": " << ec.message();

    return removed;
}

std::optional<std::string> SessionStore::content_hash_of(std::string_view blob) {
    BEncodeValue root;
    try {
        root = BEncodeParser(blob).parse();
    }
    catch (const std::exception&) {
        return std::nullopt;
    }

    if (!root.is_dict()) return std::nullopt;

    auto non_zero = [](std::string_view s) {
        return std::any_of(s.begin(), s.end(), [](char c) { return c != '\0'; });
    };

    if (auto* v1 = root.find("info-hash"); v1 && v1->is_string()) {
        const auto& h = v1->as_string();
        if (h.size() == 20 && non_zero(h)) return to_hex(h);
    }

    if (auto* v2 = root.find("info-hash2"); v2 && v2->is_string()) {
        const auto& h = v2->as_string();
        if (h.size() == 32 && non_zero(h)) return to_hex(std::string_view(h).substr(0, 20));
    }

    return std::nullopt;
}
