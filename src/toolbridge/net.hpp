#pragma once

#include "net/asio-execution-context.hpp"
#include "net/buffer.hpp"
#include "net/pipe-transport.hpp"
#include "net/rpc/rpc-server.hpp"
#include "net/rpc/rpc-session.hpp"
#include "net/rpc/status.hpp"
#include "net/transport.hpp"
#include "net/worker-process.hpp"
