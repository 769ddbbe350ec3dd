#pragma once

#include "Settings.hpp"

#include <string>
#include <optional>
#include <filesystem>
#include <string_view>

struct SessionState {
    SettingsMap settings;        // persisted overrides only
    std::string engine_state;    // opaque engine blob
    bool loaded = false;
};

struct ResumeRecord {
    std::string content_hash;
    std::string blob;
    std::filesystem::path path;
};

// lazy walk over resume/*.fastresume, unreadable records are logged and counted
class ResumeScan {
public:
    explicit ResumeScan(const std::filesystem::path& dir);

    std::optional<ResumeRecord> next();
    size_t skipped() const { return _skipped; }

private:
    std::filesystem::directory_iterator _it;
    size_t _skipped{};
};

class SessionStore {
public:
    explicit SessionStore(std::filesystem::path state_dir);

    // creates the state, resume and download directories; throws std::filesystem::filesystem_error
    void ensure_layout(const std::filesystem::path& save_path) const;

    // never throws, a missing or corrupt file gives an empty state
    SessionState load_session() const;
    bool save_session(const SettingsMap& settings, std::string_view engine_state) const;

    ResumeScan load_all_job_resumes() const { return ResumeScan(resume_dir()); }
    bool save_job_resume(const std::string& content_hash, std::string_view blob) const;
    bool remove_job_resume(const std::string& content_hash) const;

    // hex of "info-hash", or of the truncated "info-hash2" for v2-only records
    static std::optional<std::string> content_hash_of(std::string_view blob);

    const std::filesystem::path& state_dir() const { return _state_dir; }
    std::filesystem::path session_file() const { return _state_dir / "session.dat"; }
    std::filesystem::path resume_dir() const { return _state_dir / "resume"; }
    std::filesystem::path resume_file(const std::string& content_hash) const { return resume_dir() / (content_hash + ".fastresume"); }
    std::filesystem::path feeds_file() const { return _state_dir / "rss.json"; }
    std::filesystem::path log_file() const { return _state_dir / "tclient.log"; }
    std::filesystem::path config_file() const { return _state_dir / "tclient.conf"; }

private:
    std::filesystem::path _state_dir;
};
