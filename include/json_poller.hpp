#pragma once

// Umbrella header: everything a caller needs to build and drive a poller.
#include "abstract/HttpClient.hpp"
#include "abstract/Poller.hpp"
#include "client_connection_handlers/HttpClient.hpp"
#include "poller/FetchError.hpp"
#include "poller/JsonPoller.hpp"
#include "poller/JsonPollerBuilder.hpp"
#include "poller/PollerConfig.hpp"
#include "utils/LogUtils.hpp"
