#include "superprompt/server/stdio_server.hpp"

#include "superprompt/mcp/handler.hpp"
#include "superprompt/util/log.hpp"

#include <iostream>

namespace superprompt::server
{

namespace
{
bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

Json request_id(const Json& request)
{
    if (request.is_object())
    {
        auto it = request.find("id");
        if (it != request.end())
            return *it;
    }
    return nullptr;
}
} // namespace

const char* to_string(StdioServerWrapper::State state)
{
    switch (state)
    {
    case StdioServerWrapper::State::Idle:
        return "idle";
    case StdioServerWrapper::State::Reading:
        return "reading";
    case StdioServerWrapper::State::Dispatching:
        return "dispatching";
    case StdioServerWrapper::State::Writing:
        return "writing";
    case StdioServerWrapper::State::Closed:
        return "closed";
    }
    return "unknown";
}

StdioServerWrapper::StdioServerWrapper(McpHandler handler)
    : StdioServerWrapper(std::move(handler), std::cin, std::cout)
{
}

StdioServerWrapper::StdioServerWrapper(McpHandler handler, std::istream& in, std::ostream& out)
    : handler_(std::move(handler)), in_(in), out_(out)
{
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

std::optional<Json> StdioServerWrapper::dispatch(const std::string& line)
{
    Json request;
    try
    {
        request = Json::parse(line);
    }
    // Malformed text and out-of-range numbers both mean an unparseable line.
    catch (const Json::exception& e)
    {
        util::log::debug(std::string("parse error: ") + e.what());
        return mcp::jsonrpc_error(nullptr, mcp::error_code::ParseError, "Parse error");
    }

    try
    {
        return handler_(request);
    }
    catch (const std::exception& e)
    {
        util::log::error(std::string("handler failed: ") + e.what());
        return mcp::jsonrpc_error(request_id(request), mcp::error_code::InternalError, e.what());
    }
    catch (...)
    {
        util::log::error("handler failed with a non-standard exception");
        return mcp::jsonrpc_error(request_id(request), mcp::error_code::InternalError,
                                  "Internal error");
    }
}

bool StdioServerWrapper::write_line(const Json& response)
{
    out_ << dump_line(response) << '\n';
    out_.flush();
    if (!out_)
    {
        util::log::error("output stream failed; closing");
        return false;
    }
    ++responses_written_;
    return true;
}

bool StdioServerWrapper::run_loop()
{
    bool ok = true;
    std::string line;

    while (running_ && !stop_requested_)
    {
        state_ = State::Reading;
        if (!std::getline(in_, line))
            break;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (is_blank(line))
            continue;

        state_ = State::Dispatching;
        auto response = dispatch(line);
        if (!response)
            continue;

        state_ = State::Writing;
        if (!write_line(*response))
        {
            ok = false;
            break;
        }
    }

    state_ = State::Closed;
    running_ = false;
    util::log::debug(std::string("stdio loop ") + to_string(state_.load()));
    return ok;
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    return run_loop();
}

bool StdioServerWrapper::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    output_failed_ = false;

    thread_ = std::thread([this]() { output_failed_ = !run_loop(); });

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;

    if (thread_.joinable())
        thread_.join();

    running_ = false;
}

} // namespace superprompt::server
