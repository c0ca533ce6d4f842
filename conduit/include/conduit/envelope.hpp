#pragma once
// Envelope: the request/response structures carried inside a frame
//
// params and data are nlohmann::json values: a tagged, recursive value type
// (null | bool | number | string | array | object) that handlers branch on
// with json::type() / is_*().

#include <conduit/error.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace conduit {

using json = nlohmann::json;

// Milliseconds since the Unix epoch
int64_t now_ms();

// Fresh correlation id: mcp_<tool>_<unix-nanos>_<seq>
std::string make_request_id(const std::string& tool);

struct Request {
    std::string action;
    json params = json::object();
    std::string id;
    int64_t timestamp = 0;

    json to_json() const;
    std::string dump() const { return to_json().dump(); }
};

struct Response {
    bool success = false;
    json data;              // meaningful only when success
    std::string error;      // meaningful only when !success
    std::string id;         // empty serializes as null
    int64_t timestamp = 0;

    static Response ok(json data, std::string id = "") {
        Response r;
        r.success = true;
        r.data = std::move(data);
        r.id = std::move(id);
        r.timestamp = now_ms();
        return r;
    }

    static Response fail(std::string error, std::string id = "") {
        Response r;
        r.success = false;
        r.error = std::move(error);
        r.id = std::move(id);
        r.timestamp = now_ms();
        return r;
    }

    json to_json() const;
    std::string dump() const;
};

// Build a request envelope for one tool call
Request make_request(const std::string& action, json params);

// Throws DecodeError (with the id when it could be recovered)
Request parse_request(const std::string& text);
Response parse_response(const std::string& text);

} // namespace conduit
