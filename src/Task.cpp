#include "Task.h"

namespace SpriteExtractor {

std::string toString(TaskState state) {
    switch (state) {
    case TaskState::Pending: return "PENDING";
    case TaskState::Generating: return "GENERATING";
    case TaskState::Processing: return "PROCESSING";
    case TaskState::Packaging: return "PACKAGING";
    case TaskState::Success: return "SUCCESS";
    case TaskState::Failure: return "FAILURE";
    }
    return "UNKNOWN";
}

bool isTerminal(TaskState state) {
    return state == TaskState::Success || state == TaskState::Failure;
}

void to_json(nlohmann::json& j, const TaskStatus& status) {
    j = nlohmann::json{{"task_id", status.taskId}, {"status", toString(status.state)}, {"progress", status.progress}};
    if (status.spriteCount) j["sprite_count"] = *status.spriteCount;
    if (status.sizes) j["sizes"] = *status.sizes;
    if (status.error) j["error"] = *status.error;
    if (status.message) j["message"] = *status.message;
}

TaskStatus Task::snapshot() const {
    TaskStatus s;
    s.taskId = id;
    s.state = state;
    s.progress = progress;
    if (state == TaskState::Success) {
        s.spriteCount = spriteCount;
        s.sizes = sizes;
    }
    if (state == TaskState::Failure) s.error = error;
    if (!message.empty()) s.message = message;
    return s;
}

} // namespace SpriteExtractor
