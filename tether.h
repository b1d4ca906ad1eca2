#pragma once

#include "config/config.h"
#include "log/log.h"
#include "runtime/errors.h"
#include "runtime/coro/task.h"
#include "runtime/loop/event_loop.h"
#include "runtime/scheduler/blocking_pool.h"
#include "interop/background.h"
#include "interop/run_blocking.h"
#include "interop/run_to_completion.h"
#include "interop/sync_twin.h"
