#include "JobSnapshot.hpp"

bool ratio_met(const JobStatus& s) {
    if (!s.share_ratio || s.progress < 1.0 || s.total_wanted <= 0) return false;
    return static_cast<double>(s.all_time_upload) / static_cast<double>(s.total_wanted) >= *s.share_ratio;
}

std::string status_label(const JobStatus& s) {
    if (s.paused) return "Paused";

    std::string label;
    switch (s.state) {
        case JobState::CheckingFiles:
        case JobState::CheckingResumeData: label = "Checking"; break;
        case JobState::DownloadingMetadata: label = "Metadata"; break;
        case JobState::Downloading: label = "Downloading"; break;
        case JobState::Finished: label = "Completed"; break;
        case JobState::Seeding: label = "Seeding"; break;
        case JobState::Unknown: label = "Unknown"; break;
    }

    if (s.super_seeding) label += " (ss)";
    if (ratio_met(s)) label = "Ratio Met";

    return label;
}
