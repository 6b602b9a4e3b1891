// include/ran/ran.hpp
// Umbrella header for the RAN routing client.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "downstream.hpp"
#include "error.hpp"
#include "log.hpp"
#include "messages.hpp"
#include "stream.hpp"
#include "types.hpp"
#include "upstream.hpp"
