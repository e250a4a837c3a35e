#pragma once

// Umbrella header of the bolt dispatch library.

#include "bolt/bolt-config.hpp"
#include "bolt/context-pool.hpp"
#include "bolt/context.hpp"
#include "bolt/dispatcher.hpp"
#include "bolt/handler.hpp"
#include "bolt/http-constants.hpp"
#include "bolt/http-error.hpp"
#include "bolt/http-method.hpp"
#include "bolt/http-request.hpp"
#include "bolt/http-response.hpp"
#include "bolt/http-status-code.hpp"
#include "bolt/path-matcher.hpp"
#include "bolt/path-params.hpp"
#include "bolt/response-writer.hpp"
