#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace stratum {

struct Step {
    StepKind kind = StepKind::Comment;
    // Identity for SetUser, raw command text for Run, free text for Comment.
    std::string payload;
    // Run only: ordered sub-commands sharing one commit.
    std::vector<std::string> subCommands;
    int line = 0;
};

struct Descriptor {
    std::string sourceName;
    std::string baseReference;
    int baseLine = 0;
    std::vector<Step> steps;
};

struct Principal {
    std::string name;
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::string home = "/";
};

struct LayerRecord {
    std::string id;
    std::chrono::system_clock::time_point createdAt;
    std::string createdBy;
    std::string identity;
};

struct ImageRecord {
    std::string id;
    std::string parentId;
    std::string rootfs;
    std::string defaultUser;
    std::string source;
    std::chrono::system_clock::time_point createdAt;
    std::vector<LayerRecord> layers;
    std::map<std::string, std::string> packages;
    std::vector<std::string> tags;
};

struct SubCommandResult {
    std::string command;
    int exitCode = 0;
    bool started = true;
    bool timedOut = false;
    std::string output;
};

struct StepResult {
    size_t index = 0;
    StepKind kind = StepKind::Comment;
    int line = 0;
    std::string payload;
    StepStatus status = StepStatus::Committed;
    // Effective identity once the step has been applied.
    std::string identity;
    std::vector<SubCommandResult> subResults;
    std::string layerId;

    std::optional<BuildErrorKind> errorKind;
    std::string errorMessage;
    int exitCode = 0;
};

} // namespace stratum
