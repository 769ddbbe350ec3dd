#pragma once

#include "Engine.hpp"

#include <string>

struct JobSnapshot {
    size_t index{};
    JobStatus status;
    std::string label;
};

// Paused, Checking, Metadata, Downloading, Completed, Seeding, Unknown,
// with " (ss)" for super-seeding; a completed job past its target ratio reads "Ratio Met"
std::string status_label(const JobStatus& s);

// true once a finished job has uploaded at least share_ratio times its size
bool ratio_met(const JobStatus& s);
