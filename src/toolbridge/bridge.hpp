#pragma once

#include "bridge/bridge-config.hpp"
#include "bridge/notification-relay.hpp"
#include "bridge/reconnect-supervisor.hpp"
#include "bridge/session-bridge.hpp"
