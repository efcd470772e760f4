#include "superprompt/mcp/handler.hpp"
#include "superprompt/server/stdio_server.hpp"
#include "superprompt/util/log.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Test the stdio loop through injected streams

using superprompt::Json;
using superprompt::server::StdioServerWrapper;

static std::vector<Json> output_lines(const std::string& out)
{
    std::vector<Json> lines;
    std::istringstream in(out);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(Json::parse(line)); // every output line is one complete JSON value
    return lines;
}

static std::vector<Json> serve(const StdioServerWrapper::McpHandler& handler,
                               const std::string& input)
{
    std::istringstream in(input);
    std::ostringstream out;
    StdioServerWrapper server(handler, in, out);
    bool ok = server.run();
    assert(ok);
    assert(server.state() == StdioServerWrapper::State::Closed);
    assert(!server.running());
    return output_lines(out.str());
}

int main()
{
    using namespace superprompt;

    std::ostringstream diagnostics;
    util::log::set_sink(&diagnostics);

    tools::ToolRegistry registry;
    registry.register_tool(tools::Tool(
        "echo", "Echo text", tools::Signature{}.param<std::string>("text"),
        [](const Json& args) -> ToolResult { return args.at("text").get<std::string>(); }));
    registry.register_tool(tools::Tool("fail", "Raise", tools::Signature{},
                                       [](const Json&) -> ToolResult
                                       { throw std::invalid_argument("boom"); }));
    registry.freeze();

    auto handler = mcp::make_mcp_handler(mcp::ServerInfo{"super-prompt", "5.0.5", "0.1.0"},
                                         registry);

    // Scenario 1: ping
    {
        auto out = serve(handler, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
        assert(out.size() == 1);
        assert(out[0] == Json::parse(R"({"jsonrpc":"2.0","id":1,"result":{}})"));
        std::cout << "[PASS] Scenario 1: ping\n";
    }

    // Scenario 2: parse error
    {
        auto out = serve(handler, "not json\n");
        assert(out.size() == 1);
        assert(out[0] == Json::parse(
                             R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})"));
        std::cout << "[PASS] Scenario 2: parse error\n";
    }

    // Scenario 3: echo
    {
        auto out = serve(
            handler,
            R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})"
            "\n");
        assert(out.size() == 1);
        assert(out[0] ==
               Json::parse(
                   R"({"jsonrpc":"2.0","id":2,"result":{"content":[{"type":"text","text":"hi"}]}})"));
        std::cout << "[PASS] Scenario 3: tools/call echo\n";
    }

    // Scenario 4: missing tool
    {
        auto out = serve(
            handler,
            R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"missing"}})"
            "\n");
        assert(out.size() == 1);
        assert(out[0]["error"]["code"] == -32602);
        assert(out[0]["error"]["message"].get<std::string>().find("missing") != std::string::npos);
        std::cout << "[PASS] Scenario 4: unknown tool\n";
    }

    // Scenario 5: raising handler
    {
        auto out = serve(handler,
                         R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"fail"}})"
                         "\n");
        assert(out.size() == 1);
        assert(out[0]["error"]["code"] == -32000);
        assert(out[0]["error"]["message"].get<std::string>().find("boom") != std::string::npos);
        std::cout << "[PASS] Scenario 5: handler exception\n";
    }

    // Scenario 6: notification gets no line
    {
        auto out = serve(handler, "{\"jsonrpc\":\"2.0\",\"method\":\"tools/list\"}\n");
        assert(out.empty());
        std::cout << "[PASS] Scenario 6: notification silence\n";
    }

    // Notifications of any method, with absent or null id, never produce output
    {
        const std::vector<std::string> notes = {
            R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
            R"({"jsonrpc":"2.0","id":null,"method":"ping"})",
            R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"fail"}})",
            R"({"jsonrpc":"2.0","method":"no/such/method"})",
        };
        std::string input;
        for (const auto& n : notes)
            input += n + "\n";
        assert(serve(handler, input).empty());
        std::cout << "[PASS] notifications never answered\n";
    }

    // Responses leave in request order with ids echoed exactly
    {
        std::string input = R"({"jsonrpc":"2.0","id":"a","method":"ping"})"
                            "\n"
                            R"({"jsonrpc":"2.0","method":"ping"})"
                            "\n"
                            R"({"jsonrpc":"2.0","id":0,"method":"tools/list"})"
                            "\n"
                            "\n"
                            "   \t\n"
                            R"({"jsonrpc":"2.0","id":1.5,"method":"nope"})"
                            "\r\n"
                            "{broken\n"
                            R"({"jsonrpc":"2.0","id":"","method":"initialize"})";
        auto out = serve(handler, input);
        assert(out.size() == 5);
        assert(out[0]["id"] == "a" && out[0]["id"].is_string());
        assert(out[1]["id"] == 0 && out[1]["id"].is_number_integer());
        assert(out[1]["result"]["tools"].size() == 2);
        assert(out[2]["id"] == 1.5 && out[2]["id"].is_number_float());
        assert(out[2]["error"]["code"] == -32601);
        assert(out[3]["id"].is_null());
        assert(out[3]["error"]["code"] == -32700);
        assert(out[4]["id"] == "" && out[4]["result"]["protocolVersion"] == "0.1.0");
        std::cout << "[PASS] ordering, blank lines, CRLF and id echo\n";
    }

    // Non-object JSON is an invalid request, not a parse error
    {
        auto out = serve(handler, "[1,2,3]\n42\n");
        assert(out.size() == 2);
        assert(out[0]["error"]["code"] == -32600);
        assert(out[1]["error"]["code"] == -32600);
        std::cout << "[PASS] non-object messages\n";
    }

    // Invalid UTF-8 in tool output still yields one complete line
    {
        tools::ToolRegistry raw;
        raw.register_tool(tools::Tool("bytes", "Raw bytes", tools::Signature{},
                                      [](const Json&) -> ToolResult
                                      { return std::string("ok\xff\xfe"); }));
        auto raw_handler =
            mcp::make_mcp_handler(mcp::ServerInfo{"super-prompt", "5.0.5", "0.1.0"}, raw);
        auto out = serve(raw_handler,
                         R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"bytes"}})"
                         "\n");
        assert(out.size() == 1);
        assert(out[0]["id"] == 9);
        assert(out[0]["result"]["content"][0]["text"].get<std::string>().find("ok") == 0);
        std::cout << "[PASS] invalid UTF-8 replaced on the wire\n";
    }

    // A throwing handler is contained by the loop
    {
        StdioServerWrapper::McpHandler throwing = [](const Json&) -> std::optional<Json>
        { throw std::runtime_error("handler exploded"); };
        auto out = serve(throwing, R"({"jsonrpc":"2.0","id":5,"method":"ping"})"
                                   "\n");
        assert(out.size() == 1);
        assert(out[0]["id"] == 5);
        assert(out[0]["error"]["code"] == -32603);
        std::cout << "[PASS] handler exceptions become internal errors\n";
    }

    // Background mode reaches EOF and closes
    {
        std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                              "\n"
                              R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
                              "\n");
        std::ostringstream out;
        StdioServerWrapper server(handler, in, out);
        assert(!server.running());
        assert(server.state() == StdioServerWrapper::State::Idle);
        assert(server.start_async());
        server.stop();
        assert(!server.running());
        assert(!server.failed());
        auto lines = output_lines(out.str());
        assert(lines.size() == server.responses_written());
        std::cout << "[PASS] start_async/stop\n";
    }

    // A number too large for a double is a parse error and the loop keeps going
    {
        auto out = serve(handler, "{\"jsonrpc\":\"2.0\",\"id\":1e400,\"method\":\"ping\"}\n"
                                  "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
        assert(out.size() == 2);
        assert(out[0] == Json::parse(
                             R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})"));
        assert(out[1] == Json::parse(R"({"jsonrpc":"2.0","id":2,"result":{}})"));
        std::cout << "[PASS] out-of-range number\n";
    }

    // A handler throwing a non-exception value becomes an internal error
    {
        StdioServerWrapper::McpHandler throwing = [](const Json&) -> std::optional<Json>
        { throw 7; };
        auto out = serve(throwing, "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"ping\"}\n");
        assert(out.size() == 1);
        assert(out[0]["id"] == 3);
        assert(out[0]["error"]["code"] == -32603);
        assert(out[0]["error"]["message"] == "Internal error");
        std::cout << "[PASS] non-standard exception\n";
    }

    // A failed output stream ends the loop with an error
    {
        std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                              "\n");
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        StdioServerWrapper server(handler, in, out);
        assert(!server.run());
        assert(server.state() == StdioServerWrapper::State::Closed);
        std::cout << "[PASS] output failure reported\n";
    }

    // Diagnostics never reach the protocol stream
    {
        std::istringstream in("not json\n");
        std::ostringstream out;
        util::log::set_level(util::log::Level::Debug);
        StdioServerWrapper server(handler, in, out);
        server.run();
        util::log::set_level(util::log::Level::Info);
        assert(out.str().find("-------- MCP:") == std::string::npos);
        assert(diagnostics.str().find("-------- MCP:") != std::string::npos);
        std::cout << "[PASS] logs stay off stdout\n";
    }

    util::log::set_sink(nullptr);
    std::cout << "\nAll STDIO server tests passed!\n";
    return 0;
}
