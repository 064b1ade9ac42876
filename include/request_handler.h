#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "events/event_manager.h"

namespace pem {

/**
 * @brief Status code plus JSON body produced for one HTTP request
 */
struct JsonReply {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief Transport-independent handlers behind the HTTP routes
 *
 * Every handler maps its own failures to a reply: validation errors and
 * malformed JSON become 400, anything unexpected becomes 500.
 */
class RequestHandler {
public:
    explicit RequestHandler(EventManager& manager);

    /**
     * @brief Start or extend an event
     *
     * @param body JSON object {identifier?, past_minutes?, future_minutes?, cameras?};
     *             an empty body starts an event with a generated identifier
     * @return JsonReply {"message": ..., "events": {id: {...}}}
     */
    JsonReply start(const std::string& body);

    /**
     * @brief Cancel a pending event
     *
     * @param body JSON object {identifier}
     * @return JsonReply {"status": "cancelled"} or 404 {"status": "not_found"}
     */
    JsonReply cancel(const std::string& body);

    /**
     * @brief Status of one event, or of every active event
     */
    JsonReply status(const std::optional<std::string>& identifier);

    JsonReply health();
    JsonReply tasks();
    JsonReply task(const std::string& taskId);

    /**
     * @brief Turn a /start body into a request
     *
     * cameras may be a list of ids, a comma separated string, or "all".
     *
     * @throws ValidationError for fields of the wrong type
     * @throws nlohmann::json::parse_error for malformed JSON
     */
    static StartRequest parseStartRequest(const std::string& body);

    static nlohmann::json taskToJson(const BackgroundTaskManager::TaskStatus& task);

private:
    EventManager& manager_;
};

} // namespace pem
