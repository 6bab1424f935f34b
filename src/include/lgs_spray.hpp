#pragma once
/**
 * @file lgs_spray.hpp
 * @brief Layer 3: Line generation and process fan-out built on lgs_service.
 *
 * Include this when you need the LineGenerator, the command line configuration,
 * the worker body or the FanOutRunner.
 */
#include "lgs_service.hpp"

#include "spray/fan_out_runner.hpp"
#include "spray/line_generator.hpp"
#include "spray/spray_config.hpp"
#include "spray/worker.hpp"
#include "spray/worker_process.hpp"
