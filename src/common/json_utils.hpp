#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/build_error.hpp"
#include "common/models.hpp"

namespace stratum {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toStepKindString(StepKind kind)
{
    switch (kind) {
    case StepKind::SetUser:
        return "USER";
    case StepKind::Run:
        return "RUN";
    case StepKind::Comment:
        return "COMMENT";
    }
    return "COMMENT";
}

inline StepKind parseStepKindString(const std::string &value)
{
    if (value == "USER") {
        return StepKind::SetUser;
    }
    if (value == "RUN") {
        return StepKind::Run;
    }
    return StepKind::Comment;
}

inline std::string toStepStatusString(StepStatus status)
{
    return status == StepStatus::Committed ? "committed" : "failed";
}

inline void to_json(nlohmann::json &j, const StepKind &kind)
{
    j = toStepKindString(kind);
}

inline void from_json(const nlohmann::json &j, StepKind &kind)
{
    if (j.is_string()) {
        kind = parseStepKindString(j.get<std::string>());
    } else {
        kind = StepKind::Comment;
    }
}

inline void to_json(nlohmann::json &j, const Step &step)
{
    j = nlohmann::json{
        {"kind", step.kind},
        {"payload", step.payload},
        {"line", step.line}
    };
    if (step.kind == StepKind::Run) {
        j["subCommands"] = step.subCommands;
    }
}

inline void to_json(nlohmann::json &j, const Descriptor &descriptor)
{
    j = nlohmann::json{
        {"source", descriptor.sourceName},
        {"from", descriptor.baseReference},
        {"steps", descriptor.steps}
    };
}

inline void to_json(nlohmann::json &j, const LayerRecord &layer)
{
    j = nlohmann::json{
        {"id", layer.id},
        {"createdAt", toIso8601Utc(layer.createdAt)},
        {"createdBy", layer.createdBy},
        {"identity", layer.identity}
    };
}

inline void from_json(const nlohmann::json &j, LayerRecord &layer)
{
    layer.id = j.value("id", "");
    layer.createdAt = fromIso8601Utc(j.value("createdAt", ""));
    layer.createdBy = j.value("createdBy", "");
    layer.identity = j.value("identity", "");
}

inline void to_json(nlohmann::json &j, const ImageRecord &image)
{
    j = nlohmann::json{
        {"id", image.id},
        {"parentId", image.parentId},
        {"rootfs", image.rootfs},
        {"defaultUser", image.defaultUser},
        {"source", image.source},
        {"createdAt", toIso8601Utc(image.createdAt)},
        {"layers", image.layers},
        {"packages", image.packages},
        {"tags", image.tags}
    };
}

inline void to_json(nlohmann::json &j, const SubCommandResult &result)
{
    j = nlohmann::json{
        {"command", result.command},
        {"exitCode", result.exitCode},
        {"started", result.started},
        {"timedOut", result.timedOut},
        {"output", result.output}
    };
}

inline void to_json(nlohmann::json &j, const StepResult &result)
{
    j = nlohmann::json{
        {"index", result.index},
        {"kind", result.kind},
        {"line", result.line},
        {"payload", result.payload},
        {"status", toStepStatusString(result.status)},
        {"identity", result.identity},
        {"subResults", result.subResults},
        {"layerId", result.layerId},
        {"exitCode", result.exitCode}
    };
    if (result.errorKind.has_value()) {
        j["error"] = nlohmann::json{
            {"kind", buildErrorKindName(*result.errorKind)},
            {"message", result.errorMessage}
        };
    }
}

} // namespace stratum
