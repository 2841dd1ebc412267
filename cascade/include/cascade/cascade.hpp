#pragma once

#include "cascade/context/context.hpp"
#include "cascade/core/logger.hpp"
#include "cascade/middleware/allOfAll.hpp"
#include "cascade/middleware/arguments.hpp"
#include "cascade/middleware/helpers.hpp"
#include "cascade/middleware/middleware.hpp"
#include "cascade/middleware/middlewareChain.hpp"
#include "cascade/middleware/middlewareCollection.hpp"
#include "cascade/middleware/middlewareFunction.hpp"
#include "cascade/middleware/middlewareState.hpp"
#include "cascade/middleware/oneOfAll.hpp"
#include "cascade/middleware/result.hpp"
