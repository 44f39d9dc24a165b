#pragma once

/// Umbrella header for the toolbridge JSON-RPC line bridge.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "frame_reader.hpp"
#include "correlation_table.hpp"
#include "worker_supervisor.hpp"
#include "worker_client.hpp"
#include "router.hpp"
#include "server.hpp"
#include "config.hpp"
#include "log.hpp"
#include "signal_watcher.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
