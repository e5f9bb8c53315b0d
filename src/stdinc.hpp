#pragma once

// Precompiled header. `main.cpp` and the testcases include this first.

#include "toolbridge/utils/base-include.hpp"
