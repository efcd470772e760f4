#pragma once

#include "superprompt/content.hpp"
#include "superprompt/direct_call.hpp"
#include "superprompt/events.hpp"
#include "superprompt/exceptions.hpp"
#include "superprompt/mcp/handler.hpp"
#include "superprompt/providers/mode_store.hpp"
#include "superprompt/providers/system_tools.hpp"
#include "superprompt/runtime/engine_loader.hpp"
#include "superprompt/runtime/fallback_runtime.hpp"
#include "superprompt/runtime/runtime.hpp"
#include "superprompt/runtime/selector.hpp"
#include "superprompt/server/stdio_server.hpp"
#include "superprompt/settings.hpp"
#include "superprompt/tools/registry.hpp"
#include "superprompt/tools/signature.hpp"
#include "superprompt/tools/tool.hpp"
#include "superprompt/types.hpp"
#include "superprompt/util/log.hpp"
#include "superprompt/version.hpp"
