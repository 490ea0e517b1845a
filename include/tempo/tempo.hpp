#pragma once

/**
 * @file tempo.hpp
 * @brief Main header file for the tempo library
 *
 * Include this file to get the throttle and debounce controllers together
 * with their callback, outcome and configuration types.
 */

#include <tempo/callbacks.hpp>
#include <tempo/config.hpp>
#include <tempo/debounce.hpp>
#include <tempo/error.hpp>
#include <tempo/logger.hpp>
#include <tempo/observer.hpp>
#include <tempo/outcome.hpp>
#include <tempo/outcome_dispatcher.hpp>
#include <tempo/throttle.hpp>
#include <tempo/timer_table.hpp>
#include <tempo/version.hpp>
