#pragma once

#include "config.hpp"

#include "async_cursor.hpp"
#include "async_sequence.hpp"
#include "awaitable.hpp"
#include "block_on.hpp"
#include "cursor.hpp"
#include "error.hpp"
#include "guard.hpp"
#include "iterator.hpp"
#include "join.hpp"
#include "next.hpp"
#include "probe.hpp"
#include "ready.hpp"
#include "sequence.hpp"
#include "size_hint.hpp"
#include "stream.hpp"
#include "stream_awaitable.hpp"
#include "task.hpp"
#include "waker.hpp"
#include "yield.hpp"
