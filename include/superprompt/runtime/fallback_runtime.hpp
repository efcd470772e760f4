#pragma once
#include "superprompt/mcp/handler.hpp"
#include "superprompt/runtime/runtime.hpp"
#include "superprompt/server/stdio_server.hpp"

#include <iostream>

namespace superprompt::runtime
{

/// The built-in runtime: the MCP handler served over line-delimited stdio.
class FallbackRuntime final : public Runtime
{
  public:
    explicit FallbackRuntime(mcp::Handler handler, std::istream& in = std::cin,
                             std::ostream& out = std::cout)
        : server_(std::move(handler), in, out)
    {
    }

    RuntimeMode mode() const override
    {
        return RuntimeMode::Fallback;
    }

    /// 0 on EOF, 1 when the output stream failed.
    int run() override
    {
        return server_.run() ? 0 : 1;
    }

    server::StdioServerWrapper& server()
    {
        return server_;
    }

  private:
    server::StdioServerWrapper server_;
};

} // namespace superprompt::runtime
