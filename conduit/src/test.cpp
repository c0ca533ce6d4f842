#include <conduit/bridge_client.hpp>
#include <conduit/config.hpp>
#include <conduit/dispatcher.hpp>
#include <conduit/envelope.hpp>
#include <conduit/error.hpp>
#include <conduit/frame.hpp>
#include <conduit/gateway.hpp>
#include <conduit/http_gateway.hpp>
#include <conduit/log.hpp>
#include <conduit/main_thread.hpp>
#include <conduit/stream_server.hpp>
#include <conduit/tools/builtin.hpp>
#include <httplib.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace conduit;
using Clock = std::chrono::steady_clock;

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

long long elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

int connect_local(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    int rc = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    (void)rc;
    return fd;
}

// A port nothing listens on
uint16_t unused_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
}

template <typename Pred>
bool wait_until(Pred pred, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!pred()) {
        if (Clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

ClientConfig local_client(uint16_t port) {
    ClientConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.connect_timeout_ms = 2000;
    config.io_timeout_ms = 5000;
    config.reconnect_backoff_ms = 50;
    return config;
}

Response roundtrip(int fd, const std::string& payload) {
    frame::write_frame(fd, payload, 2000);
    auto reply = frame::read_frame(fd, 5000);
    assert(reply.has_value());
    return parse_response(*reply);
}

// Tools the server tests call: echo, scene_get, asset_find, blob, null_data
void register_test_tools(ToolRegistry& registry) {
    tools::builtin::register_tools(registry);

    registry.register_tool("echo", "Echo params back",
        [](const json&) { return std::string(); },
        [](const json& params, const ToolContext&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(params.value("delay_ms", 0)));
            return Response::ok(params);
        });

    registry.register_tool("scene_get", "Fake scene hierarchy",
        [](const json&) { return std::string(); },
        [](const json&, const ToolContext&) {
            return Response::ok({{"objects", {1, 2}}});
        });

    registry.register_tool("asset_find", "Always fails",
        [](const json&) { return std::string(); },
        [](const json&, const ToolContext&) { return Response::fail("no assets"); });

    registry.register_tool("blob", "Oversized result",
        [](const json&) { return std::string(); },
        [](const json&, const ToolContext&) {
            return Response::ok(std::string(frame::MAX_PAYLOAD_SIZE + 16, 'x'));
        });

    registry.register_tool("null_data", "Success without data",
        [](const json&) { return std::string(); },
        [](const json&, const ToolContext&) { return Response::ok(json()); });
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame codec
// ═══════════════════════════════════════════════════════════════════════════

void test_frame_round_trip() {
    std::cout << "Testing Frame round trip..." << std::endl;

    std::vector<std::string> payloads = {
        "x",
        "{\"action\":\"ping\"}",
        std::string("\x00\x01\xff\x7f", 4),
        std::string(70000, 'a'),
        std::string(frame::MAX_PAYLOAD_SIZE, 'z')
    };
    for (const auto& p : payloads) {
        std::string bytes = frame::encode(p);
        assert(bytes.size() == p.size() + frame::HEADER_SIZE);
        size_t consumed = 0;
        assert(frame::decode(bytes, &consumed) == p);
        assert(consumed == bytes.size());
    }

    // Big-endian prefix
    std::string bytes = frame::encode(std::string(258, 'q'));
    assert(static_cast<unsigned char>(bytes[2]) == 1);
    assert(static_cast<unsigned char>(bytes[3]) == 2);

    // Two frames back to back
    std::string two = frame::encode("first") + frame::encode("second");
    size_t consumed = 0;
    assert(frame::decode(two, &consumed) == "first");
    assert(frame::decode(two.substr(consumed)) == "second");

    std::cout << "  PASS" << std::endl;
}

void test_frame_illegal_lengths() {
    std::cout << "Testing Frame illegal lengths..." << std::endl;

    bool threw = false;
    try {
        frame::decode_length({0, 0, 0, 0});
    } catch (const FramingError&) {
        threw = true;
    }
    assert(threw);

    // 1 MiB + 1
    threw = false;
    try {
        frame::decode_length({0x00, 0x10, 0x00, 0x01});
    } catch (const FramingError& e) {
        threw = std::string(e.what()).find("too large") != std::string::npos;
    }
    assert(threw);
    assert(frame::decode_length({0x00, 0x10, 0x00, 0x00}) == frame::MAX_PAYLOAD_SIZE);

    threw = false;
    try {
        frame::encode("");
    } catch (const FramingError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        frame::encode(std::string(frame::MAX_PAYLOAD_SIZE + 1, 'a'));
    } catch (const FramingError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        frame::decode(frame::encode("hello").substr(0, 7));
    } catch (const FramingError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_frame_socket_io() {
    std::cout << "Testing Frame socket I/O..." << std::endl;

    int sv[2];
    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

    frame::write_frame(sv[0], "hello", 1000);
    auto got = frame::read_frame(sv[1], 1000);
    assert(got && *got == "hello");

    // Oversized prefix fails without waiting for a payload that never comes
    unsigned char big[4] = {0x7f, 0xff, 0xff, 0xff};
    assert(write(sv[0], big, 4) == 4);
    auto start = Clock::now();
    bool framing = false;
    try {
        frame::read_frame(sv[1], 3000);
    } catch (const FramingError&) {
        framing = true;
    }
    assert(framing);
    assert(elapsed_ms(start) < 1000);

    // Nothing sent: timeout is a transport error
    bool timed_out = false;
    try {
        frame::read_frame(sv[1], 50);
    } catch (const TransportError&) {
        timed_out = true;
    }
    assert(timed_out);

    // Close mid-payload
    unsigned char header[4] = {0, 0, 0, 10};
    assert(write(sv[0], header, 4) == 4);
    assert(write(sv[0], "abc", 3) == 3);
    close(sv[0]);
    framing = false;
    try {
        frame::read_frame(sv[1], 1000);
    } catch (const FramingError&) {
        framing = true;
    }
    assert(framing);
    close(sv[1]);

    // Clean close between frames
    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
    close(sv[0]);
    assert(!frame::read_frame(sv[1], 1000).has_value());
    close(sv[1]);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Envelope
// ═══════════════════════════════════════════════════════════════════════════

void test_envelope_decode_rules() {
    std::cout << "Testing Envelope decode rules..." << std::endl;

    Request r = parse_request(R"({"action":"ping","id":42})");
    assert(r.action == "ping");
    assert(r.id == "42");
    assert(r.params.is_object() && r.params.empty());
    assert(r.timestamp > 0);

    r = parse_request(R"({"params":{"a":1},"id":"t2","timestamp":5})");
    assert(r.action.empty());
    assert(r.params["a"] == 1);
    assert(r.timestamp == 5);

    bool threw = false;
    try {
        parse_request(R"({"action":"x","params":[1,2],"id":"p1"})");
    } catch (const DecodeError& e) {
        threw = e.id() && *e.id() == "p1" && e.kind() == ErrorKind::Decode;
    }
    assert(threw);

    threw = false;
    try {
        parse_request(R"({"action":7,"id":"a1"})");
    } catch (const DecodeError& e) {
        threw = e.id() && *e.id() == "a1";
    }
    assert(threw);

    threw = false;
    try {
        parse_request("not json at all");
    } catch (const DecodeError& e) {
        threw = !e.id().has_value();
    }
    assert(threw);

    threw = false;
    try {
        parse_request("[1,2,3]");
    } catch (const DecodeError&) {
        threw = true;
    }
    assert(threw);

    // Serialization omits the field that does not apply
    json ok = Response::ok({{"k", "v"}}, "i1").to_json();
    assert(ok["success"] == true && ok.contains("data") && !ok.contains("error"));
    json fail = Response::fail("bad").to_json();
    assert(fail["success"] == false && !fail.contains("data"));
    assert(fail["id"].is_null());

    Response back = parse_response(Response::ok({{"k", "v"}}, "i1").dump());
    assert(back.success && back.id == "i1" && back.data["k"] == "v");

    threw = false;
    try {
        parse_response(R"({"id":"x","data":1})");
    } catch (const DecodeError&) {
        threw = true;
    }
    assert(threw);

    Response odd = parse_response(R"({"success":false,"error":{"code":3},"id":null})");
    assert(!odd.success && odd.error == "{\"code\":3}" && odd.id.empty());

    // Timestamps that do not fit an int64 fall back to the local clock
    int64_t before = now_ms();
    r = parse_request(R"({"action":"ping","params":{},"id":"x","timestamp":1e300})");
    assert(r.timestamp >= before);
    r = parse_request(R"({"action":"ping","params":{},"id":"x","timestamp":-1e300})");
    assert(r.timestamp >= before);
    r = parse_request(R"({"action":"ping","params":{},"id":"x","timestamp":18446744073709551615})");
    assert(r.timestamp >= before);
    r = parse_request(R"({"action":"ping","params":{},"id":"x","timestamp":12.5})");
    assert(r.timestamp >= before);
    r = parse_request(R"({"action":"ping","params":{},"id":"x","timestamp":1700000000000})");
    assert(r.timestamp == 1700000000000LL);

    std::cout << "  PASS" << std::endl;
}

void test_request_ids() {
    std::cout << "Testing Request ids..." << std::endl;

    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(make_request_id("scene_get"));
    }
    assert(ids.size() == 1000);
    assert(ids.begin()->rfind("mcp_scene_get_", 0) == 0);

    Request req = make_request("ping", json());
    assert(req.params.is_object());
    assert(req.to_json()["action"] == "ping");

    std::cout << "  PASS" << std::endl;
}

void test_error_taxonomy() {
    std::cout << "Testing Error taxonomy..." << std::endl;

    assert(is_retryable(ErrorKind::Transport));
    assert(is_retryable(ErrorKind::Framing));
    assert(!is_retryable(ErrorKind::Decode));
    assert(!is_retryable(ErrorKind::Validation));
    assert(!is_retryable(ErrorKind::HandlerFault));
    assert(std::string(to_string(ErrorKind::HandlerFault)) == "handler_fault");
    assert(TransportError("x").kind() == ErrorKind::Transport);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Registry and dispatcher
// ═══════════════════════════════════════════════════════════════════════════

void test_registry_overwrite_unregister() {
    std::cout << "Testing Registry overwrite/unregister..." << std::endl;

    ToolRegistry registry;
    registry.register_tool("t", "first", nullptr,
        [](const json&, const ToolContext&) { return Response::ok(1); });
    registry.register_tool("t", "second", nullptr,
        [](const json&, const ToolContext&) { return Response::ok(2); });
    assert(registry.size() == 1);
    assert(registry.find("t")->description == "second");

    Dispatcher dispatcher(registry);
    Response r = dispatcher.dispatch(Request{"t", json::object(), "x", 0}, {});
    assert(r.success && r.data == 2);

    assert(registry.unregister_tool("t"));
    assert(!registry.unregister_tool("t"));
    assert(registry.find("t") == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_dispatch_rules() {
    std::cout << "Testing Dispatch rules..." << std::endl;

    ToolRegistry registry;
    int executed = 0;
    registry.register_tool("guarded", "Requires name",
        [](const json& p) {
            return p.contains("name") ? std::string() : std::string("name is required");
        },
        [&executed](const json&, const ToolContext&) {
            ++executed;
            return Response::ok(json::object());
        });
    registry.register_tool("forgetful", "Sets a wrong id",
        nullptr,
        [](const json&, const ToolContext&) { return Response::ok(1, "someone-else"); });
    registry.register_tool("crashy", "Throws",
        nullptr,
        [](const json&, const ToolContext&) -> Response { throw std::runtime_error("boom"); });
    Dispatcher dispatcher(registry);
    ToolContext ctx{7, "test"};

    Response r = dispatcher.dispatch(Request{"__nope__", json::object(), "u1", 0}, ctx);
    assert(!r.success && r.error == "tool not found: __nope__" && r.id == "u1");

    r = dispatcher.dispatch_payload(R"({"params":{},"id":"t2"})", ctx);
    assert(!r.success && r.error == "message missing action field" && r.id == "t2");

    // Validation short-circuits execution
    r = dispatcher.dispatch(Request{"guarded", json::object(), "v1", 0}, ctx);
    assert(!r.success && r.error == "name is required" && r.id == "v1");
    assert(executed == 0);
    r = dispatcher.dispatch(Request{"guarded", {{"name", "cube"}}, "v2", 0}, ctx);
    assert(r.success && executed == 1);

    // Correlation id always wins
    r = dispatcher.dispatch(Request{"forgetful", json::object(), "c1", 0}, ctx);
    assert(r.success && r.id == "c1");

    r = dispatcher.dispatch(Request{"crashy", json::object(), "h1", 0}, ctx);
    assert(!r.success && r.error == "Tool execution failed: boom" && r.id == "h1");

    r = dispatcher.dispatch_payload("{broken", ctx);
    assert(!r.success && r.error.rfind("invalid message: ", 0) == 0 && r.id.empty());

    r = dispatcher.dispatch_payload(R"({"action":"guarded","params":"x","id":"d1"})", ctx);
    assert(!r.success && r.error.rfind("invalid message: ", 0) == 0 && r.id == "d1");

    std::cout << "  PASS" << std::endl;
}

void test_builtin_tools() {
    std::cout << "Testing Built-in tools..." << std::endl;

    ToolRegistry registry;
    tools::builtin::register_tools(registry, [] { return size_t(3); });
    Dispatcher dispatcher(registry);

    Response r = dispatcher.dispatch(Request{"ping", json::object(), "p", 0}, {});
    assert(r.success && r.data["message"] == "pong" && r.data["timestamp"].is_number());

    r = dispatcher.dispatch(Request{"host_status", json::object(), "s", 0}, ToolContext{9, "peer"});
    assert(r.success);
    assert(r.data["toolCount"] == 2);
    assert(r.data["connections"] == 3);
    assert(r.data["connectionId"] == 9);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main-thread hand-off
// ═══════════════════════════════════════════════════════════════════════════

void test_main_queue_fifo() {
    std::cout << "Testing MainThreadQueue FIFO..." << std::endl;

    MainThreadQueue queue;
    std::vector<int> order;
    for (int i = 0; i < 100; ++i) {
        queue.post([&order, i] { order.push_back(i); });
    }
    assert(queue.pending() == 100);
    assert(queue.drain() == 100);
    for (int i = 0; i < 100; ++i) {
        assert(order[i] == i);
    }

    // Work queued while draining waits for the next tick
    queue.post([&queue, &order] { queue.post([&order] { order.push_back(-1); }); });
    assert(queue.drain() == 1);
    assert(queue.pending() == 1);
    assert(queue.drain() == 1);
    assert(order.back() == -1);

    // A throwing task does not stop the drain
    queue.post([] { throw std::runtime_error("oops"); });
    queue.post([&order] { order.push_back(200); });
    assert(queue.drain() == 2);
    assert(order.back() == 200);

    // So does a non-standard throw; later work in the batch still runs
    queue.post([] { throw 7; });
    auto after = queue.submit([] { return std::string("ran"); });
    assert(queue.drain() == 2);
    assert(after.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    assert(after.get() == "ran");

    auto future = queue.submit([] { return 41 + 1; });
    queue.drain();
    assert(future.get() == 42);

    std::cout << "  PASS" << std::endl;
}

void test_main_queue_handoff() {
    std::cout << "Testing Dispatcher main-thread hand-off..." << std::endl;

    MainThreadQueue queue;
    ToolRegistry registry;
    std::thread::id ran_on;
    registry.register_tool("where", "Records its thread", nullptr,
        [&ran_on](const json&, const ToolContext&) {
            ran_on = std::this_thread::get_id();
            return Response::ok(json::object());
        });
    Dispatcher dispatcher(registry, &queue);

    std::atomic<bool> done{false};
    Response response;
    std::thread worker([&] {
        response = dispatcher.dispatch(Request{"where", json::object(), "m1", 0}, {});
        done = true;
    });

    // This thread plays the host tick
    assert(wait_until([&] {
        queue.drain();
        return done.load();
    }, 2000));
    worker.join();

    assert(response.success && response.id == "m1");
    assert(ran_on == std::this_thread::get_id());

    // Queue torn down with the call still pending
    auto doomed = std::make_unique<MainThreadQueue>();
    Dispatcher orphaned(registry, doomed.get());
    Response abandoned;
    std::thread waiter([&] {
        abandoned = orphaned.dispatch(Request{"where", json::object(), "m2", 0}, {});
    });
    assert(wait_until([&] { return doomed->pending() == 1; }, 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    doomed.reset();
    waiter.join();
    assert(!abandoned.success && abandoned.error == "tool execution abandoned: where");
    assert(abandoned.id == "m2");

    std::cout << "  PASS" << std::endl;
}

void test_execution_timeout() {
    std::cout << "Testing Execution timeout..." << std::endl;

    std::atomic<int> started{0};
    ToolRegistry registry;
    registry.register_tool("slow", "Sleeps", nullptr,
        [&started](const json&, const ToolContext&) {
            ++started;
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return Response::ok(json::object());
        });

    // Own worker thread, no queue
    Dispatcher direct(registry, nullptr, DispatcherConfig{50});
    auto start = Clock::now();
    Response r = direct.dispatch(Request{"slow", json::object(), "to1", 0}, {});
    assert(!r.success);
    assert(r.error == "tool execution timed out after 50ms: slow");
    assert(r.id == "to1");
    assert(elapsed_ms(start) < 250);
    assert(wait_until([&] { return started.load() == 1; }, 1000));

    // Queued call that timed out before the host got to it is skipped
    MainThreadQueue queue;
    Dispatcher queued(registry, &queue, DispatcherConfig{50});
    r = queued.dispatch(Request{"slow", json::object(), "to2", 0}, {});
    assert(!r.success && r.error.find("timed out") != std::string::npos);
    assert(queue.drain() == 1);
    assert(started.load() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_timed_out_tool_joined_on_teardown() {
    std::cout << "Testing Timed-out tool joined before registry teardown..." << std::endl;

    auto registry = std::make_unique<ToolRegistry>();
    std::atomic<bool> finished{false};
    std::atomic<size_t> seen{0};
    ToolRegistry* raw = registry.get();
    registry->register_tool("inspect", "Reads the registry late", nullptr,
        [raw, &finished, &seen](const json&, const ToolContext&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            seen = raw->size();
            finished = true;
            return Response::ok(json::object());
        });

    {
        Dispatcher dispatcher(*registry, nullptr, DispatcherConfig{20});
        Response r = dispatcher.dispatch(Request{"inspect", json::object(), "j1", 0}, {});
        assert(!r.success && r.error == "tool execution timed out after 20ms: inspect");
        assert(!finished);
    }
    // Dispatcher teardown waited for the tool
    assert(finished);
    assert(seen == 1);
    registry.reset();

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Stream server
// ═══════════════════════════════════════════════════════════════════════════

void test_server_happy_path() {
    std::cout << "Testing Server happy path..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));
    assert(server.port() != 0);

    BridgeClient client(local_client(server.port()));
    Request req{"ping", json::object(), "t1", now_ms()};
    Response r = client.send_message(req);
    assert(r.success && r.id == "t1");
    assert(r.data["message"] == "pong");
    assert(wait_until([&] { return server.connection_count() == 1; }, 1000));

    // Missing action over the wire
    int fd = connect_local(server.port());
    r = roundtrip(fd, R"({"params":{},"id":"t2"})");
    assert(!r.success && r.error == "message missing action field" && r.id == "t2");
    close(fd);

    client.close();
    assert(wait_until([&] { return server.connection_count() == 0; }, 2000));
    server.stop();

    std::cout << "  PASS" << std::endl;
}

void test_server_decode_error_keeps_connection() {
    std::cout << "Testing Server decode error keeps connection..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));

    int fd = connect_local(server.port());
    Response r = roundtrip(fd, "this is not json");
    assert(!r.success && r.error.rfind("invalid message: ", 0) == 0 && r.id.empty());

    r = roundtrip(fd, R"({"action":"ping","params":{},"id":"after"})");
    assert(r.success && r.id == "after");

    // Oversized result is replaced, connection survives
    r = roundtrip(fd, R"({"action":"blob","params":{},"id":"big"})");
    assert(!r.success && r.error.rfind("response too large: ", 0) == 0 && r.id == "big");
    r = roundtrip(fd, R"({"action":"ping","params":{},"id":"still"})");
    assert(r.success);

    close(fd);
    server.stop();

    std::cout << "  PASS" << std::endl;
}

void test_server_framing_error_closes() {
    std::cout << "Testing Server framing error closes connection..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));

    int fd = connect_local(server.port());
    assert(wait_until([&] { return server.connection_count() == 1; }, 1000));

    // 2 MiB prefix, no payload
    unsigned char header[4] = {0x00, 0x20, 0x00, 0x00};
    assert(write(fd, header, 4) == 4);

    auto reply = frame::read_frame(fd, 2000);
    assert(reply.has_value());
    Response r = parse_response(*reply);
    assert(!r.success && r.error.find("too large") != std::string::npos);

    bool closed = false;
    try {
        closed = !frame::read_frame(fd, 2000).has_value();
    } catch (const TransportError& e) {
        closed = std::string(e.what()).find("timed out") == std::string::npos;
    }
    assert(closed);
    assert(wait_until([&] { return server.connection_count() == 0; }, 2000));

    close(fd);
    server.stop();

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_isolation() {
    std::cout << "Testing Concurrent connection isolation..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));

    std::atomic<int> mismatches{0};
    auto caller = [&](const std::string& tag) {
        BridgeClient client(local_client(server.port()));
        for (int i = 0; i < 30; ++i) {
            Request req = make_request("echo", {{"tag", tag}, {"n", i}, {"delay_ms", i % 3}});
            Response r = client.send_message(req);
            if (!r.success || r.id != req.id || r.data["tag"] != tag || r.data["n"] != i) {
                ++mismatches;
            }
        }
    };

    std::thread a(caller, "A");
    std::thread b(caller, "B");
    a.join();
    b.join();
    assert(mismatches == 0);

    server.stop();

    std::cout << "  PASS" << std::endl;
}

void test_server_callbacks_and_broadcast() {
    std::cout << "Testing Server callbacks and broadcast..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);

    std::atomic<int> connected{0}, disconnected{0};
    server.on_client_connected([&](const Connection&) { ++connected; });
    server.on_client_disconnected([&](const Connection&) { ++disconnected; });
    assert(server.start(0));

    int a = connect_local(server.port());
    int b = connect_local(server.port());
    assert(wait_until([&] { return server.connection_count() == 2; }, 1000));
    assert(connected == 2);

    assert(server.broadcast(R"({"event":"scene_changed"})") == 2);
    auto got_a = frame::read_frame(a, 1000);
    auto got_b = frame::read_frame(b, 1000);
    assert(got_a && *got_a == R"({"event":"scene_changed"})");
    assert(got_b && *got_b == *got_a);

    close(a);
    assert(wait_until([&] { return disconnected.load() == 1; }, 2000));
    assert(server.connection_count() == 1);

    close(b);
    server.stop();
    assert(disconnected == 2);

    std::cout << "  PASS" << std::endl;
}

void test_server_stop_idempotent() {
    std::cout << "Testing Server stop idempotence..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);

    server.stop();  // never started
    assert(server.start(0));
    int fd = connect_local(server.port());
    assert(wait_until([&] { return server.connection_count() == 1; }, 1000));

    auto start = Clock::now();
    server.stop();
    server.stop();
    assert(!server.running());
    assert(server.connection_count() == 0);
    assert(elapsed_ms(start) < 1000);

    // Force-closed from the server side
    bool closed = false;
    try {
        closed = !frame::read_frame(fd, 1000).has_value();
    } catch (const TransportError& e) {
        closed = std::string(e.what()).find("timed out") == std::string::npos;
    }
    assert(closed);
    close(fd);

    std::cout << "  PASS" << std::endl;
}

void test_server_connection_limit() {
    std::cout << "Testing Server connection limit..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    ServerConfig config;
    config.max_connections = 1;
    StreamServer server(dispatcher, config);
    std::atomic<int> connected{0};
    server.on_client_connected([&](const Connection&) { ++connected; });
    assert(server.start(0));

    int first = connect_local(server.port());
    assert(wait_until([&] { return server.connection_count() == 1; }, 1000));

    // Accepted by the kernel, then closed by the server without registering
    int second = connect_local(server.port());
    bool closed = false;
    try {
        closed = !frame::read_frame(second, 2000).has_value();
    } catch (const TransportError& e) {
        closed = std::string(e.what()).find("timed out") == std::string::npos;
    }
    assert(closed);
    assert(server.connection_count() == 1);
    assert(connected == 1);
    close(second);

    Response r = roundtrip(first, R"({"action":"ping","params":{},"id":"kept"})");
    assert(r.success && r.id == "kept");

    // A slot frees up once the first client leaves
    close(first);
    assert(wait_until([&] { return server.connection_count() == 0; }, 2000));
    int third = connect_local(server.port());
    r = roundtrip(third, R"({"action":"ping","params":{},"id":"third"})");
    assert(r.success && r.id == "third");
    close(third);

    server.stop();

    std::cout << "  PASS" << std::endl;
}

void test_server_with_main_queue() {
    std::cout << "Testing Server with main-thread queue..." << std::endl;

    MainThreadQueue queue;
    ToolRegistry registry;
    std::mutex threads_mutex;
    std::set<std::thread::id> tool_threads;
    std::atomic<int> calls{0};
    registry.register_tool("where", "Records its thread", nullptr,
        [&](const json& params, const ToolContext&) {
            {
                std::lock_guard<std::mutex> lock(threads_mutex);
                tool_threads.insert(std::this_thread::get_id());
            }
            ++calls;
            return Response::ok(params);
        });
    Dispatcher dispatcher(registry, &queue);
    StreamServer server(dispatcher);
    assert(server.start(0));

    // Two connections, served only while this thread drains the queue
    std::atomic<int> finished{0};
    std::atomic<int> mismatches{0};
    auto caller = [&](const std::string& tag) {
        BridgeClient client(local_client(server.port()));
        for (int i = 0; i < 10; ++i) {
            Request req = make_request("where", {{"tag", tag}, {"n", i}});
            Response r = client.send_message(req);
            if (!r.success || r.id != req.id || r.data["tag"] != tag || r.data["n"] != i) {
                ++mismatches;
            }
        }
        ++finished;
    };
    std::thread a(caller, "A");
    std::thread b(caller, "B");
    assert(wait_until([&] {
        queue.drain();
        return finished.load() == 2;
    }, 5000));
    a.join();
    b.join();

    assert(mismatches == 0);
    assert(calls == 20);
    assert(tool_threads.size() == 1);
    assert(*tool_threads.begin() == std::this_thread::get_id());

    // Stop with a call still waiting for the main thread
    int fd = connect_local(server.port());
    frame::write_frame(fd, R"({"action":"where","params":{},"id":"late"})", 1000);
    assert(wait_until([&] { return queue.pending() == 1; }, 2000));

    std::atomic<bool> stopped{false};
    std::thread stopper([&] {
        server.stop();
        stopped = true;
    });
    assert(wait_until([&] {
        queue.drain();
        return stopped.load();
    }, 5000));
    stopper.join();

    assert(!server.running());
    assert(server.connection_count() == 0);
    assert(calls == 21);
    close(fd);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Bridge client and gateway
// ═══════════════════════════════════════════════════════════════════════════

void test_bridge_is_connected() {
    std::cout << "Testing BridgeClient connectivity probe..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));

    BridgeClient client(local_client(server.port()));
    assert(!client.is_connected());
    assert(client.test_connection());
    assert(client.is_connected());
    assert(client.endpoint() == "127.0.0.1:" + std::to_string(server.port()));

    server.stop();
    assert(wait_until([&] { return !client.is_connected(); }, 2000));

    client.close();
    client.close();

    std::cout << "  PASS" << std::endl;
}

void test_retry_bound() {
    std::cout << "Testing Gateway retry bound..." << std::endl;

    BridgeClient client(local_client(unused_port()));
    Gateway gateway(client);  // 3 attempts, 1 s apart

    auto start = Clock::now();
    ToolCallResult result = gateway.call_tool("scene_get", json::object());
    long long ms = elapsed_ms(start);

    assert(result.is_error);
    assert(result.attempts == 3);
    assert(result.text.rfind("Host communication failed after 3 attempts: ", 0) == 0);
    assert(ms >= 2000);
    assert(ms < 6000);

    std::cout << "  PASS" << std::endl;
}

void test_fail_fast_non_retryable() {
    std::cout << "Testing Gateway fail-fast on message errors..." << std::endl;

    BridgeClient client(local_client(unused_port()));
    json huge = {{"content", std::string(frame::MAX_PAYLOAD_SIZE, 'c')}};

    RetryPolicy policy;
    policy.backoff_ms = 10;
    Gateway gateway(client, policy);
    ToolCallResult result = gateway.call_tool("script_write", huge);
    assert(result.is_error && result.attempts == 1);
    assert(result.text.find("request too large") != std::string::npos);

    // Retry-everything mode keeps going
    policy.retry_all_errors = true;
    Gateway legacy(client, policy);
    result = legacy.call_tool("script_write", huge);
    assert(result.is_error && result.attempts == 3);

    std::cout << "  PASS" << std::endl;
}

void test_gateway_result_shaping() {
    std::cout << "Testing Gateway result shaping..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));

    BridgeClient client(local_client(server.port()));
    Gateway gateway(client);

    ToolCallResult ok = gateway.call_tool("scene_get", json::object());
    assert(!ok.is_error && ok.attempts == 1);
    assert(ok.text.rfind("Tool scene_get executed successfully:\n", 0) == 0);
    assert(ok.data["objects"].size() == 2);

    ToolCallResult empty = gateway.call_tool("null_data", json::object());
    assert(!empty.is_error && empty.data.is_object() && empty.data.empty());

    ToolCallResult failed = gateway.call_tool("asset_find", json::object());
    assert(failed.is_error && failed.attempts == 1);
    assert(failed.text == "Host tool execution failed: no assets");

    ToolCallResult missing = gateway.call_tool("not_on_host", json::object());
    assert(missing.is_error && missing.text == "Host tool execution failed: tool not found: not_on_host");

    server.stop();

    std::cout << "  PASS" << std::endl;
}

void test_gateway_reconnects() {
    std::cout << "Testing Gateway reconnect after host restart..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    auto first = std::make_unique<StreamServer>(dispatcher);
    assert(first->start(0));
    uint16_t port = first->port();

    BridgeClient client(local_client(port));
    RetryPolicy policy;
    policy.backoff_ms = 50;
    Gateway gateway(client, policy);
    assert(!gateway.call_tool("scene_get", json::object()).is_error);

    first->stop();
    first.reset();
    StreamServer second(dispatcher);
    assert(second.start(port));

    ToolCallResult result = gateway.call_tool("scene_get", json::object());
    assert(!result.is_error);
    assert(result.attempts == 2);

    second.stop();

    std::cout << "  PASS" << std::endl;
}

void test_mcp_rpc() {
    std::cout << "Testing MCP JSON-RPC handling..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));

    BridgeClient client(local_client(server.port()));
    Gateway gateway(client);

    auto init = gateway.handle_rpc({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                                    {"params", {{"clientInfo", {{"name", "test"}}}}}});
    assert(init && (*init)["result"]["protocolVersion"] == mcp::PROTOCOL_VERSION);
    assert((*init)["id"] == 1);

    assert(!gateway.handle_rpc({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));

    auto list = gateway.handle_rpc({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    const json& tools = (*list)["result"]["tools"];
    assert(tools.size() == 24);
    for (const auto& tool : tools) {
        assert(tool["inputSchema"]["type"] == "object");
    }

    auto call = gateway.handle_rpc({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                                    {"params", {{"name", "scene_get"}, {"arguments", json::object()}}}});
    assert((*call)["result"]["isError"] == false);
    std::string text = (*call)["result"]["content"][0]["text"];
    assert(text.rfind("Tool scene_get executed successfully:", 0) == 0);
    assert((*call)["result"]["structuredContent"]["objects"].size() == 2);

    call = gateway.handle_rpc({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                               {"params", {{"name", "asset_find"}}}});
    assert((*call)["result"]["isError"] == true);
    assert(!(*call)["result"].contains("structuredContent"));

    call = gateway.handle_rpc({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                               {"params", {{"name", "no_such_tool"}}}});
    assert((*call)["error"]["code"] == mcp::error::TOOL_NOT_FOUND);

    auto unknown = gateway.handle_rpc({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "resources/list"}});
    assert((*unknown)["error"]["code"] == mcp::error::METHOD_NOT_FOUND);

    auto malformed = gateway.handle_rpc({{"id", 7}, {"method", "tools/list"}});
    assert((*malformed)["error"]["code"] == mcp::error::INVALID_REQUEST);

    json parse = json::parse(gateway.handle("{nope"));
    assert(parse["error"]["code"] == mcp::error::PARSE_ERROR);

    auto ping = gateway.handle_rpc({{"jsonrpc", "2.0"}, {"id", 8}, {"method", "ping"}});
    assert((*ping)["result"].is_object());

    server.stop();

    std::cout << "  PASS" << std::endl;
}

void test_catalog() {
    std::cout << "Testing Tool catalog..." << std::endl;

    ToolCatalog catalog;
    assert(catalog.size() == 24);

    std::map<std::string, int> per_category;
    for (const auto& tool : catalog.tools()) {
        ++per_category[tool.category];
    }
    assert(per_category["file"] == 2);
    assert(per_category["scene"] == 8);
    assert(per_category["transform"] == 2);
    assert(per_category["ui"] == 4);
    assert(per_category["asset"] == 3);
    assert(per_category["project"] == 1);
    assert(per_category["prefab"] == 3);
    assert(per_category["editor"] == 1);

    const auto* write = catalog.find("script_write");
    assert(write && write->input_schema["required"].size() == 2);
    assert(catalog.find("nope") == nullptr);

    json listed = catalog.to_json();
    assert(listed.size() == 24 && listed[0].contains("category"));

    std::string md = catalog.to_markdown();
    assert(md.find("## scene") != std::string::npos);
    assert(md.find("`prefab_modify`") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// HTTP front end
// ═══════════════════════════════════════════════════════════════════════════

void test_health_endpoint() {
    std::cout << "Testing HTTP /health and /tools..." << std::endl;

    ToolRegistry registry;
    register_test_tools(registry);
    Dispatcher dispatcher(registry);
    StreamServer server(dispatcher);
    assert(server.start(0));

    BridgeClient client(local_client(server.port()));
    Gateway gateway(client, RetryPolicy{}, true);
    HttpConfig config;
    config.bind_address = "127.0.0.1";
    config.port = 0;
    HttpGateway http(gateway, config);
    assert(http.start());

    httplib::Client mgmt("127.0.0.1", http.management_port());
    auto health = [&] {
        auto res = mgmt.Get("/health");
        assert(res && res->status == 200);
        return json::parse(res->body);
    };

    json h = health();
    assert(h["status"] == "healthy");
    assert(h["hostConnected"] == false);
    assert(h["toolCount"] == 24);
    assert(h["debugMode"] == true);
    assert(h["version"] == CONDUIT_VERSION);
    assert(h["hostPort"] == server.port());

    assert(!gateway.call_tool("scene_get", json::object()).is_error);
    assert(health()["hostConnected"] == true);

    server.stop();
    assert(wait_until([&] { return health()["hostConnected"] == false; }, 2000));

    auto tools = mgmt.Get("/tools");
    assert(tools && tools->status == 200);
    assert(json::parse(tools->body).size() == 24);

    http.stop();

    std::cout << "  PASS" << std::endl;
}

void test_sse_transport() {
    std::cout << "Testing HTTP SSE transport..." << std::endl;

    BridgeClient client(local_client(unused_port()));
    Gateway gateway(client);
    HttpConfig config;
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.keepalive_ms = 100;
    HttpGateway http(gateway, config);
    assert(http.start());

    std::mutex mutex;
    std::condition_variable cv;
    std::string stream;
    std::atomic<bool> done{false};

    std::thread reader([&] {
        httplib::Client sse("127.0.0.1", http.port());
        sse.Get("/sse", [&](const char* data, size_t len) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                stream.append(data, len);
            }
            cv.notify_all();
            return !done.load();
        });
    });

    auto wait_for = [&](const std::string& needle) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5),
                           [&] { return stream.find(needle) != std::string::npos; });
    };

    assert(wait_for("event: endpoint"));
    assert(wait_for("sessionId="));
    std::string session;
    {
        std::lock_guard<std::mutex> lock(mutex);
        size_t pos = stream.find("sessionId=") + 10;
        session = stream.substr(pos, stream.find('\n', pos) - pos);
    }
    assert(!session.empty());
    assert(http.session_count() == 1);

    httplib::Client poster("127.0.0.1", http.port());
    auto res = poster.Post("/message?sessionId=" + session,
                           R"({"jsonrpc":"2.0","id":77,"method":"tools/list"})", "application/json");
    assert(res && res->status == 202);
    assert(wait_for("event: message"));
    assert(wait_for("\"id\":77"));

    res = poster.Post("/message?sessionId=unknown", R"({"jsonrpc":"2.0","id":1,"method":"ping"})",
                      "application/json");
    assert(res && res->status == 404);

    res = poster.Post("/message?sessionId=" + session, "{bad json", "application/json");
    assert(res && res->status == 400);
    assert(wait_for("-32700"));

    assert(wait_for(": keepalive"));

    done = true;
    http.stop();
    reader.join();
    assert(http.session_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_sse_slow_call_does_not_block() {
    std::cout << "Testing HTTP SSE with a slow tool call..." << std::endl;

    // Unreachable host: tools/call spends ~2 s in retries
    BridgeClient client(local_client(unused_port()));
    Gateway gateway(client);
    HttpConfig config;
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.keepalive_ms = 100;
    config.max_sessions = 1;
    config.request_threads = 1;
    HttpGateway http(gateway, config);
    assert(http.start());

    std::mutex mutex;
    std::condition_variable cv;
    std::string stream;
    std::atomic<bool> done{false};

    std::thread reader([&] {
        httplib::Client sse("127.0.0.1", http.port());
        sse.Get("/sse", [&](const char* data, size_t len) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                stream.append(data, len);
            }
            cv.notify_all();
            return !done.load();
        });
    });

    auto wait_for = [&](const std::string& needle, int seconds) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(seconds),
                           [&] { return stream.find(needle) != std::string::npos; });
    };

    assert(wait_for("sessionId=", 5));
    std::string session;
    {
        std::lock_guard<std::mutex> lock(mutex);
        size_t pos = stream.find("sessionId=") + 10;
        session = stream.substr(pos, stream.find('\n', pos) - pos);
    }

    // Session limit reached
    httplib::Client second("127.0.0.1", http.port());
    auto refused = second.Get("/sse");
    assert(refused && refused->status == 503);

    httplib::Client poster("127.0.0.1", http.port());
    auto start = Clock::now();
    auto res = poster.Post("/message?sessionId=" + session,
                           R"({"jsonrpc":"2.0","id":501,"method":"tools/call","params":{"name":"scene_get"}})",
                           "application/json");
    assert(res && res->status == 202);
    assert(elapsed_ms(start) < 1000);

    // Answered while the slow call is still retrying
    res = poster.Post("/message?sessionId=" + session,
                      R"({"jsonrpc":"2.0","id":502,"method":"ping"})", "application/json");
    assert(res && res->status == 202);
    assert(wait_for("\"id\":502", 5));
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(stream.find("\"id\":501") == std::string::npos);
    }

    assert(wait_for("\"id\":501", 10));
    assert(wait_for("Host communication failed after 3 attempts", 1));

    done = true;
    http.stop();
    reader.join();

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) ptrs.push_back(&s[0]);
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }
};

void clear_conduit_env() {
    unsetenv("CONDUIT_HOST_PORT");
    unsetenv("CONDUIT_GATEWAY_PORT");
    unsetenv("CONDUIT_HOST_ADDRESS");
    unsetenv("CONDUIT_DEBUG");
}

void test_config_layers() {
    std::cout << "Testing Configuration layering..." << std::endl;

    clear_conduit_env();

    uint16_t port = 0;
    assert(parse_port("8080", port) && port == 8080);
    assert(!parse_port("0", port));
    assert(!parse_port("70000", port));
    assert(!parse_port("12ab", port));

    std::string path = "/tmp/conduit_test_settings_" + std::to_string(getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"gateway": {"port": 14000, "hostAddress": "file-host", "hostPort": 12500, "debug": true},
                   "host": {"port": 12600, "tickMs": 5, "executionTimeoutMs": 250}})";
    }

    setenv("CONDUIT_HOST_ADDRESS", "env-host", 1);

    GatewayConfig gw;
    Argv args({"conduit_gateway", "--config", path, "--port", "15000", "--retry-all"});
    CliOutcome outcome = load_gateway_config(args.argc(), args.argv(), gw);
    assert(outcome.ok && !outcome.help);
    assert(gw.port == 15000);                 // flag beats file
    assert(gw.host_address == "env-host");    // env beats file
    assert(gw.host_port == 12500);            // file beats default
    assert(gw.debug);
    assert(gw.retry_all_errors);

    HostConfig host;
    Argv host_args({"conduit_host", "--config", path, "--verbose"});
    outcome = load_host_config(host_args.argc(), host_args.argv(), host);
    assert(outcome.ok);
    assert(host.port == 12600 && host.tick_ms == 5 && host.execution_timeout_ms == 250);
    assert(host.verbose);

    GatewayConfig bad;
    Argv bad_args({"conduit_gateway", "--port", "99999"});
    outcome = load_gateway_config(bad_args.argc(), bad_args.argv(), bad);
    assert(!outcome.ok && outcome.error.find("invalid port") != std::string::npos);

    Argv unknown({"conduit_host", "--frobnicate"});
    HostConfig h2;
    assert(!load_host_config(unknown.argc(), unknown.argv(), h2).ok);

    Argv help({"conduit_gateway", "--help"});
    GatewayConfig g2;
    assert(load_gateway_config(help.argc(), help.argv(), g2).help);

    Argv missing({"conduit_host", "--config", "/nonexistent/conduit.json"});
    HostConfig h3;
    assert(!load_host_config(missing.argc(), missing.argv(), h3).ok);

    // Non-integer or out-of-range numbers in the file are rejected
    std::string bad_path = path + ".bad";
    const char* bad_hosts[] = {
        R"({"host": {"tickMs": 1e300}})",
        R"({"host": {"executionTimeoutMs": 2.5}})",
        R"({"host": {"tickMs": 18446744073709551615}})",
        R"({"host": {"port": 70000}})"
    };
    for (const char* text : bad_hosts) {
        {
            std::ofstream out(bad_path);
            out << text;
        }
        HostConfig h4;
        Argv bad_file({"conduit_host", "--config", bad_path});
        CliOutcome rejected = load_host_config(bad_file.argc(), bad_file.argv(), h4);
        assert(!rejected.ok && rejected.error.find("invalid") != std::string::npos);
        assert(h4.tick_ms == 16);
    }
    std::remove(bad_path.c_str());

    clear_conduit_env();
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Conduit C++ Tests ===" << std::endl;
    std::cout << "MAX_PAYLOAD_SIZE = " << frame::MAX_PAYLOAD_SIZE << std::endl;
    std::cout << std::endl;

    log::set_verbose(false);

    test_frame_round_trip();
    test_frame_illegal_lengths();
    test_frame_socket_io();
    test_envelope_decode_rules();
    test_request_ids();
    test_error_taxonomy();

    std::cout << std::endl;
    std::cout << "=== Host Side ===" << std::endl;
    test_registry_overwrite_unregister();
    test_dispatch_rules();
    test_builtin_tools();
    test_main_queue_fifo();
    test_main_queue_handoff();
    test_execution_timeout();
    test_timed_out_tool_joined_on_teardown();
    test_server_happy_path();
    test_server_decode_error_keeps_connection();
    test_server_framing_error_closes();
    test_concurrent_isolation();
    test_server_callbacks_and_broadcast();
    test_server_stop_idempotent();
    test_server_connection_limit();
    test_server_with_main_queue();

    std::cout << std::endl;
    std::cout << "=== Gateway Side ===" << std::endl;
    test_bridge_is_connected();
    test_retry_bound();
    test_fail_fast_non_retryable();
    test_gateway_result_shaping();
    test_gateway_reconnects();
    test_mcp_rpc();
    test_catalog();
    test_health_endpoint();
    test_sse_transport();
    test_sse_slow_call_does_not_block();
    test_config_layers();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
