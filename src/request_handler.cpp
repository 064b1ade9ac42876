#include "request_handler.h"
#include "errors.h"
#include "logger.h"
#include <sstream>

namespace pem {

namespace {

JsonReply errorReply(int status, const std::string& message) {
    JsonReply reply;
    reply.status = status;
    reply.body["error"] = message;
    return reply;
}

nlohmann::json parseBody(const std::string& body) {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json::object();
    }
    auto json = nlohmann::json::parse(body);
    if (!json.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }
    return json;
}

std::optional<double> optionalMinutes(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    if (!json[key].is_number()) {
        throw ValidationError(std::string(key) + " must be a number");
    }
    return json[key].get<double>();
}

std::vector<std::string> splitCameraList(const std::string& text) {
    std::vector<std::string> cameras;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        cameras.push_back(item);
    }
    return cameras;
}

// Runs a handler body and maps exceptions to replies
template <typename Fn>
JsonReply guarded(const char* route, Fn&& fn) {
    try {
        return fn();
    } catch (const ValidationError& e) {
        LOG_WARN("API", std::string(route) + " rejected: " + e.what());
        return errorReply(400, e.what());
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("API", std::string(route) + " received invalid JSON: " + e.what());
        return errorReply(400, std::string("Invalid JSON: ") + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("API", std::string(route) + " failed: " + e.what());
        return errorReply(500, e.what());
    }
}

} // namespace

RequestHandler::RequestHandler(EventManager& manager) : manager_(manager) {
}

StartRequest RequestHandler::parseStartRequest(const std::string& body) {
    nlohmann::json json = parseBody(body);
    StartRequest request;

    if (json.contains("identifier") && !json["identifier"].is_null()) {
        if (!json["identifier"].is_string()) {
            throw ValidationError("identifier must be a string");
        }
        request.identifier = json["identifier"].get<std::string>();
    }

    request.pastMinutes = optionalMinutes(json, "past_minutes");
    request.futureMinutes = optionalMinutes(json, "future_minutes");

    if (json.contains("cameras") && !json["cameras"].is_null()) {
        const auto& cameras = json["cameras"];
        std::vector<std::string> list;
        if (cameras.is_string()) {
            std::string text = cameras.get<std::string>();
            if (text != "all") {
                list = splitCameraList(text);
            }
        } else if (cameras.is_array()) {
            for (const auto& camera : cameras) {
                if (!camera.is_string()) {
                    throw ValidationError("cameras must contain only strings");
                }
                list.push_back(camera.get<std::string>());
            }
        } else {
            throw ValidationError("cameras must be a list or a comma separated string");
        }
        request.cameras = normalizeCameras(list);
    }

    return request;
}

JsonReply RequestHandler::start(const std::string& body) {
    return guarded("POST /start", [&]() {
        StartResult result = manager_.startOrExtend(parseStartRequest(body));

        JsonReply reply;
        reply.body["message"] = result.message;
        reply.body["events"] = nlohmann::json::object();
        reply.body["events"][result.event.identifier] = result.event.toJson(std::chrono::system_clock::now());
        return reply;
    });
}

JsonReply RequestHandler::cancel(const std::string& body) {
    return guarded("POST /cancel", [&]() {
        nlohmann::json json = parseBody(body);
        if (!json.contains("identifier") || !json["identifier"].is_string()) {
            throw ValidationError("Missing event identifier");
        }
        std::string identifier = json["identifier"].get<std::string>();

        JsonReply reply;
        if (manager_.cancel(identifier)) {
            LOG_INFO("API", "Event " + identifier + " cancelled");
            reply.body["status"] = "cancelled";
        } else {
            reply.status = 404;
            reply.body["status"] = "not_found";
        }
        return reply;
    });
}

JsonReply RequestHandler::status(const std::optional<std::string>& identifier) {
    return guarded("GET /status", [&]() {
        auto now = std::chrono::system_clock::now();
        JsonReply reply;

        if (identifier && !identifier->empty()) {
            auto event = manager_.status(*identifier);
            if (!event) {
                reply.body["events"][*identifier]["status"] = "no_event";
                return reply;
            }
            reply.body["events"][event->identifier] = event->toJson(now);
            return reply;
        }

        reply.body["events"] = nlohmann::json::object();
        for (const auto& event : manager_.statusAll()) {
            reply.body["events"][event.identifier] = event.toJson(now);
        }
        return reply;
    });
}

JsonReply RequestHandler::health() {
    JsonReply reply;
    reply.body["status"] = "ok";
    reply.body["active_events"] = manager_.registry().size();
    reply.body["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return reply;
}

nlohmann::json RequestHandler::taskToJson(const BackgroundTaskManager::TaskStatus& task) {
    nlohmann::json taskJson;
    taskJson["id"] = task.taskId;
    taskJson["type"] = task.taskType;
    taskJson["target_id"] = task.targetId;
    taskJson["progress"] = task.progress;
    taskJson["message"] = task.message;
    taskJson["state"] = BackgroundTaskManager::stateName(task.state);
    taskJson["created_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        task.createdAt.time_since_epoch()).count();
    taskJson["updated_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        task.updatedAt.time_since_epoch()).count();
    return taskJson;
}

JsonReply RequestHandler::tasks() {
    manager_.tasks().cleanupOldTasks();

    JsonReply reply;
    reply.body["tasks"] = nlohmann::json::array();
    for (const auto& task : manager_.tasks().getAllTasks()) {
        reply.body["tasks"].push_back(taskToJson(task));
    }
    return reply;
}

JsonReply RequestHandler::task(const std::string& taskId) {
    auto task = manager_.tasks().getTaskStatus(taskId);
    if (task.state == BackgroundTaskManager::TaskStatus::State::FAILED &&
        task.message == "Task not found") {
        return errorReply(404, "Task not found");
    }
    JsonReply reply;
    reply.body = taskToJson(task);
    return reply;
}

} // namespace pem
