#include <conduit/envelope.hpp>
#include <atomic>
#include <chrono>
#include <limits>

namespace conduit {

namespace {

std::atomic<uint64_t> request_seq{0};

// Accept string ids, and numeric ids from loosely typed callers
std::optional<std::string> extract_id(const json& obj) {
    auto it = obj.find("id");
    if (it == obj.end() || it->is_null()) return std::string();
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_number_unsigned()) return std::to_string(it->get<uint64_t>());
    return std::nullopt;
}

json parse_object(const std::string& text, const char* what) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("JSON parse error: ") + e.what());
    }
    if (!doc.is_object()) {
        throw DecodeError(std::string(what) + " is not a JSON object");
    }
    return doc;
}

// Advisory field: anything but an int64-representable integer gets the local clock
int64_t extract_timestamp(const json& obj) {
    auto it = obj.find("timestamp");
    if (it == obj.end()) return now_ms();
    if (it->is_number_integer() && !it->is_number_unsigned()) {
        return it->get<int64_t>();
    }
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(value);
        }
    }
    return now_ms();
}

}  // anonymous namespace

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string make_request_id(const std::string& tool) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "mcp_" + tool + "_" + std::to_string(nanos) + "_" +
           std::to_string(request_seq.fetch_add(1));
}

json Request::to_json() const {
    return {
        {"action", action},
        {"params", params.is_null() ? json::object() : params},
        {"id", id},
        {"timestamp", timestamp}
    };
}

json Response::to_json() const {
    json out = {
        {"success", success},
        {"id", id.empty() ? json() : json(id)},
        {"timestamp", timestamp}
    };
    if (success) {
        out["data"] = data;
    } else {
        out["error"] = error;
    }
    return out;
}

std::string Response::dump() const {
    // Tool output may carry invalid UTF-8 (file contents, asset names)
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

Request make_request(const std::string& action, json params) {
    Request req;
    req.action = action;
    req.params = params.is_null() ? json::object() : std::move(params);
    req.id = make_request_id(action);
    req.timestamp = now_ms();
    return req;
}

Request parse_request(const std::string& text) {
    json doc = parse_object(text, "message");

    auto id = extract_id(doc);
    if (!id) {
        throw DecodeError("id must be a string");
    }

    Request req;
    req.id = *id;
    req.timestamp = extract_timestamp(doc);

    auto action = doc.find("action");
    if (action != doc.end() && !action->is_null()) {
        if (!action->is_string()) {
            throw DecodeError("action must be a string", req.id);
        }
        req.action = action->get<std::string>();
    }

    auto params = doc.find("params");
    if (params != doc.end() && !params->is_null()) {
        if (!params->is_object()) {
            throw DecodeError("params must be an object", req.id);
        }
        req.params = *params;
    }
    return req;
}

Response parse_response(const std::string& text) {
    json doc = parse_object(text, "response");

    auto id = extract_id(doc);
    if (!id) {
        throw DecodeError("id must be a string");
    }

    Response resp;
    resp.id = *id;
    resp.timestamp = extract_timestamp(doc);

    auto success = doc.find("success");
    if (success == doc.end() || !success->is_boolean()) {
        throw DecodeError("response missing boolean success field", resp.id);
    }
    resp.success = success->get<bool>();

    if (auto data = doc.find("data"); data != doc.end()) {
        resp.data = *data;
    }
    if (auto err = doc.find("error"); err != doc.end() && !err->is_null()) {
        resp.error = err->is_string() ? err->get<std::string>() : err->dump();
    }
    return resp;
}

} // namespace conduit
