#pragma once

/**
 * @defgroup async
 * @{
 * @brief Coroutine based task model of aproto.
 *
 * Encode and decode operations are `async::task`s. They run cooperatively on a single
 * executor and suspend only at stream boundaries. No threads are created by the library.
 *
 * @}
 */

#include "exceptions.hpp"
#include "run.hpp"
#include "task.hpp"
