#pragma once
#include "superprompt/types.hpp"

#include <atomic>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <thread>

namespace superprompt::server
{

/**
 * Line-delimited JSON-RPC loop over a pair of streams (stdin/stdout by default).
 *
 * Each non-blank input line is parsed and handed to the handler; the response, if
 * any, is written back as one line and flushed before the next line is read. One
 * message is in flight at a time, so responses leave in request order.
 *
 * Usage:
 *   auto handler = superprompt::mcp::make_mcp_handler(settings, registry);
 *   StdioServerWrapper server(handler);
 *   server.run();  // Blocking - runs until EOF or stop() is called
 *
 * The handler returns std::nullopt for messages that must not be answered
 * (notifications). A line that is not valid JSON is answered with -32700 and a
 * null id without reaching the handler.
 */
class StdioServerWrapper
{
  public:
    using McpHandler = std::function<std::optional<Json>(const Json&)>;

    enum class State
    {
        Idle,
        Reading,
        Dispatching,
        Writing,
        Closed
    };

    explicit StdioServerWrapper(McpHandler handler);
    StdioServerWrapper(McpHandler handler, std::istream& in, std::ostream& out);

    ~StdioServerWrapper();

    StdioServerWrapper(const StdioServerWrapper&) = delete;
    StdioServerWrapper& operator=(const StdioServerWrapper&) = delete;

    /**
     * Serve until EOF on the input stream or stop().
     *
     * @return false if already running or if the output stream failed
     */
    bool run();

    /**
     * Run the loop on a background thread. Use stop() to join it.
     *
     * @return false if already running
     */
    bool start_async();

    /// Request the loop to end after the current line and join the background
    /// thread if there is one. Safe to call multiple times.
    void stop();

    bool running() const
    {
        return running_.load();
    }

    State state() const
    {
        return state_.load();
    }

    /// True when a background loop ended because the output stream failed.
    bool failed() const
    {
        return output_failed_.load();
    }

    /// Number of response lines written so far.
    size_t responses_written() const
    {
        return responses_written_.load();
    }

  private:
    bool run_loop();
    std::optional<Json> dispatch(const std::string& line);
    bool write_line(const Json& response);

    McpHandler handler_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> output_failed_{false};
    std::atomic<State> state_{State::Idle};
    std::atomic<size_t> responses_written_{0};
    std::thread thread_;
};

const char* to_string(StdioServerWrapper::State state);

} // namespace superprompt::server
