// SPDX-License-Identifier: MIT
/**
 * @file simple.hpp
 * @brief Umbrella header for volscan::simple namespace
 */

#pragma once

#include "volscan/simple/analytics.hpp"
#include "volscan/simple/market_data_provider.hpp"
#include "volscan/simple/converter.hpp"
#include "volscan/simple/sources/yfinance.hpp"
