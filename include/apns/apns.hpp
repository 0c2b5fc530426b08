// include/apns/apns.hpp
// Umbrella header for the whole public API.

#pragma once

#include "aps.hpp"
#include "backend.hpp"
#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "message.hpp"
#include "queue.hpp"
#include "transport.hpp"
#include "types.hpp"
