#pragma once

/// Umbrella header for the kagimcp core library.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tool_registry.hpp"
#include "router.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/stream_transport.hpp"
