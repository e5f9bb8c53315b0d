#pragma once

#include "async/blocking-queue.hpp"
#include "async/promise-future.hpp"
