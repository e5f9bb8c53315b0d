#pragma once

/**
 * @defgroup toolbridge-utils Utilities
 * @ingroup toolbridge
 */

#include "utils/cli-utils.hpp"
#include "utils/error-codes.hpp"
