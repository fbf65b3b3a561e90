#pragma once

/**
 * zktable C++ library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Logging and configuration
#include "logging.hpp"
#include "config.hpp"

// Coordination service access
#include "coordination.hpp"
#include "client.hpp"

// Table state record and reader
#include "codec.hpp"
#include "table_state_reader.hpp"
