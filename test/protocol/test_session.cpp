#include <catch2/catch_test_macros.hpp>

#include <toolpipe/protocol/session.hpp>
#include <toolpipe/protocol/transport.hpp>

#include "mocks/mock_transport.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace toolpipe;
using toolpipe::testing::MockTransport;
using json = nlohmann::json;

namespace {

const json kInit = {{"type", "init"},
                    {"protocolVersion", "1.0"},
                    {"clientCapabilities", {"tools"}}};

struct EchoFixture {
    ToolRegistry registry;
    int calls = 0;

    EchoFixture() {
        auto r = registry.Register(
            "echo", "Echo text back",
            InputSchema().Required("text", FieldType::String),
            [this](const json& args) {
                ++calls;
                return Result<json, Error>::Ok(args["text"]);
            });
        REQUIRE(r.IsOk());
    }
};

json Call(const std::string& id, const std::string& tool, json arguments) {
    return {{"type", "call"}, {"id", id}, {"tool", tool}, {"arguments", std::move(arguments)}};
}

} // anonymous namespace

// ===========================================================================
// Happy path
// ===========================================================================

TEST_CASE("Session: handshake then echo call", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage(Call("1", "echo", {{"text", "hi"}}));

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsOk());
    CHECK(session.State() == SessionState::Closed);

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 2);
    CHECK(frames[0]["type"] == "init_ack");
    CHECK(frames[0]["protocolVersion"] == "1.0");
    CHECK(frames[0]["tools"][0]["name"] == "echo");
    CHECK(frames[1] == json{{"type", "result"}, {"id", "1"}, {"ok", true}, {"value", "hi"}});
}

TEST_CASE("Session: pipelined calls are answered in order with their ids", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    // All frames in one read, the way a pipelining client sends them.
    std::string burst = kInit.dump() + "\n";
    for (int i = 1; i <= 5; ++i) {
        burst += Call("c" + std::to_string(i), "echo", {{"text", std::to_string(i)}}).dump() + "\n";
    }
    transport.EnqueueChunk(burst);

    Session session(f.registry, transport);
    REQUIRE(session.Run().IsOk());

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 6);
    for (int i = 1; i <= 5; ++i) {
        CHECK(frames[i]["id"] == "c" + std::to_string(i));
        CHECK(frames[i]["value"] == std::to_string(i));
    }
    CHECK(session.Stats().calls == 5);
    CHECK(session.Stats().frames_in == 6);
    CHECK(session.Stats().frames_out == 6);
}

TEST_CASE("Session: frames split across reads are reassembled", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    const auto init = kInit.dump() + "\n";
    transport.EnqueueChunk(init.substr(0, 10));
    transport.EnqueueChunk(init.substr(10) + R"({"type":"list_)");
    transport.EnqueueChunk("tools\",\"id\":\"L\"}\n");

    Session session(f.registry, transport);
    REQUIRE(session.Run().IsOk());

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 2);
    CHECK(frames[1]["type"] == "tools");
    CHECK(frames[1]["id"] == "L");
}

TEST_CASE("Session: repeated list_tools returns the same catalog", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage({{"type", "list_tools"}});
    transport.EnqueueMessage({{"type", "list_tools"}});

    Session session(f.registry, transport);
    REQUIRE(session.Run().IsOk());

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 3);
    CHECK(frames[1] == frames[2]);
    CHECK(frames[1]["tools"] == frames[0]["tools"]);
}

TEST_CASE("Session: per-call errors do not end the session", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage(Call("1", "missing", json::object()));
    transport.EnqueueMessage(Call("2", "echo", json::object()));
    transport.EnqueueMessage(Call("3", "echo", {{"text", "still here"}}));

    Session session(f.registry, transport);
    REQUIRE(session.Run().IsOk());

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 4);
    CHECK(frames[1]["ok"] == false);
    CHECK(frames[1]["error"]["kind"] == "UnknownToolError");
    CHECK(frames[2]["error"]["kind"] == "ArgumentValidationError");
    CHECK(frames[3]["value"] == "still here");
    CHECK(f.calls == 1);
    CHECK(session.Stats().failed_calls == 2);
}

TEST_CASE("Session: end of stream right after connect is a clean close", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;

    Session session(f.registry, transport);
    REQUIRE(session.Run().IsOk());
    CHECK(transport.Written().empty());
    CHECK(session.State() == SessionState::Closed);
}

// ===========================================================================
// Fatal errors
// ===========================================================================

TEST_CASE("Session: call before init is a sequence error", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(Call("1", "echo", {{"text", "hi"}}));
    transport.EnqueueMessage(kInit);

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::ProtocolSequence);
    CHECK(f.calls == 0);

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0]["type"] == "error");
    CHECK(frames[0]["kind"] == "ProtocolSequenceError");
    CHECK(frames[0]["id"] == "1");
    CHECK(session.State() == SessionState::Closed);
}

TEST_CASE("Session: incompatible version fails without a catalog", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage({{"type", "init"}, {"protocolVersion", "2.0"}});
    transport.EnqueueMessage(Call("1", "echo", {{"text", "hi"}}));

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::VersionMismatch);

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0]["type"] == "error");
    CHECK(frames[0]["kind"] == "VersionMismatchError");
    CHECK(transport.Written().find("echo") == std::string::npos);
    CHECK(f.calls == 0);
}

TEST_CASE("Session: duplicate handshake closes the session", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage(Call("1", "echo", {{"text", "hi"}}));

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::ProtocolSequence);

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 2);
    CHECK(frames[0]["type"] == "init_ack");
    CHECK(frames[1]["kind"] == "ProtocolSequenceError");
    CHECK(f.calls == 0);
}

TEST_CASE("Session: client-only message types are rejected", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage({{"type", "result"}, {"id", "1"}, {"ok", true}, {"value", 1}});

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::ProtocolSequence);
    CHECK(ran.Error().message == "Unexpected 'result' message from client");
    REQUIRE(ran.Error().correlation_id.has_value());
    CHECK(*ran.Error().correlation_id == "1");

    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 2);
    CHECK(frames[1]["type"] == "error");
    CHECK(frames[1]["id"] == "1");
}

TEST_CASE("Session: truncated final frame is a framing error", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueChunk(R"({"type":"call","id":"1","tool":"echo")");

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::Framing);
    CHECK(f.calls == 0);

    // Only the init_ack; nothing is sent after a framing failure.
    auto frames = transport.WrittenFrames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0]["type"] == "init_ack");
}

TEST_CASE("Session: malformed frame ends the session silently", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueLine("{oops");
    transport.EnqueueMessage(Call("1", "echo", {{"text", "hi"}}));

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::Framing);
    CHECK(transport.WrittenFrames().size() == 1);
    CHECK(f.calls == 0);
}

TEST_CASE("Session: oversized frame is a framing error", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage(Call("1", "echo", {{"text", std::string(512, 'x')}}));

    SessionOptions options;
    options.max_frame_bytes = 256;
    Session session(f.registry, transport, options);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::Framing);
    CHECK(f.calls == 0);
}

TEST_CASE("Session: mistyped serverInfo closes with a framing error", "[protocol][session]") {
    EchoFixture f;
    std::istringstream in(
        R"({"type":"init_ack","protocolVersion":"1.0","tools":[],"serverInfo":{"name":5}})"
        "\n");
    std::ostringstream out;
    StreamTransport transport(in, out);

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::Framing);
    CHECK(session.State() == SessionState::Closed);
    CHECK(out.str().empty());
}

TEST_CASE("Session: deeply nested arguments close with a framing error", "[protocol][session]") {
    EchoFixture f;
    const std::size_t depth = 1000000;
    std::string deep_call = R"({"type":"call","id":"1","tool":"missing","arguments":{"x":)" +
                            std::string(depth, '[') + std::string(depth, ']') + "}}\n";
    REQUIRE(deep_call.size() < kDefaultMaxFrameBytes);

    std::istringstream in(kInit.dump() + "\n" + deep_call);
    std::ostringstream out;
    StreamTransport transport(in, out);

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::Framing);
    CHECK(session.State() == SessionState::Closed);
    CHECK(session.Stats().calls == 0);
}

TEST_CASE("Session: read failure is a transport error", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.FailReadAtEnd(Error::Make(ErrorCategory::Transport, "read", "EIO"));

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::Transport);
    CHECK(ran.Error().ExitCode() == 1);
}

TEST_CASE("Session: write failure stops processing", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;
    transport.EnqueueMessage(kInit);
    transport.EnqueueMessage(Call("1", "echo", {{"text", "a"}}));
    transport.EnqueueMessage(Call("2", "echo", {{"text", "b"}}));
    transport.FailWritesFrom(1, Error::Make(ErrorCategory::Transport, "write", "EPIPE"));

    Session session(f.registry, transport);
    auto ran = session.Run();

    REQUIRE(ran.IsErr());
    CHECK(ran.Error().category == ErrorCategory::Transport);
    CHECK(f.calls == 1);
    CHECK(transport.WriteCallCount() == 2);
}

TEST_CASE("Session: cannot be run twice", "[protocol][session]") {
    EchoFixture f;
    MockTransport transport;

    Session session(f.registry, transport);
    REQUIRE(session.Run().IsOk());

    auto again = session.Run();
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::ProtocolSequence);
}

// ===========================================================================
// Over real streams
// ===========================================================================

TEST_CASE("Session: runs over StreamTransport", "[protocol][session]") {
    EchoFixture f;
    std::istringstream in(kInit.dump() + "\n" +
                          Call("7", "echo", {{"text", "stream"}}).dump() + "\n");
    std::ostringstream out;
    StreamTransport transport(in, out);

    Session session(f.registry, transport);
    REQUIRE(session.Run().IsOk());

    std::istringstream lines(out.str());
    std::vector<json> frames;
    std::string line;
    while (std::getline(lines, line)) frames.push_back(json::parse(line));

    REQUIRE(frames.size() == 2);
    CHECK(frames[1]["id"] == "7");
    CHECK(frames[1]["value"] == "stream");
}
