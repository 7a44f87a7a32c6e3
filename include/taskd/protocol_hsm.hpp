/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */


/**
 * @file protocol_hsm.hpp
 * @brief Connection handler states as a function-pointer table.
 *
 *   AwaitRequest -> Dispatching -> AwaitResult -> WriteResponse -> AwaitRequest
 *
 * Any I/O failure, decode failure or read timeout moves to Closed.
 */

#ifndef TASKD_PROTOCOL_HSM_HPP_
#define TASKD_PROTOCOL_HSM_HPP_

#include "vocabulary.hpp"

namespace taskd {

enum class ConnectionState : uint8_t {
  kAwaitRequest,   // Reading one frame under the read deadline
  kDispatching,    // Work item built, waiting for queue space
  kAwaitResult,    // Submitted, waiting on the one-shot reply
  kWriteResponse,  // Response framed, flushing to the socket
  kClosed
};

inline const char* connection_state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::kAwaitRequest: return "AwaitRequest";
    case ConnectionState::kDispatching: return "Dispatching";
    case ConnectionState::kAwaitResult: return "AwaitResult";
    case ConnectionState::kWriteResponse: return "WriteResponse";
    case ConnectionState::kClosed: return "Closed";
  }
  return "Unknown";
}

class Connection;

using StateHandler = expected<void, ErrorCode> (*)(Connection& conn);

// on_data:    new bytes landed in the receive buffer
// on_wakeup:  a worker freed queue space or resolved a reply
// on_drained: the pending response has been fully written
struct StateOps {
  ConnectionState state;
  StateHandler on_data;
  StateHandler on_wakeup;
  StateHandler on_drained;
};

extern const StateOps kAwaitRequestOps;
extern const StateOps kDispatchingOps;
extern const StateOps kAwaitResultOps;
extern const StateOps kWriteResponseOps;
extern const StateOps kClosedOps;

}  // namespace taskd

#endif  // TASKD_PROTOCOL_HSM_HPP_
