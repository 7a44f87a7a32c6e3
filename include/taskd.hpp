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
 * @file taskd.hpp
 * @brief taskd - TCP task-dispatch server computing file digests
 *
 * A single poll() reactor drives every connection; digests run on a fixed
 * worker pool fed through a bounded queue, and each result returns to its
 * connection through a one-shot reply channel.
 *
 * Usage:
 *   #include "taskd.hpp"
 *
 *   int main() {
 *     taskd::Server server(8080, "127.0.0.1");
 *     server.set_num_workers(4).set_queue_capacity(64);
 *     server.run();
 *   }
 */

#ifndef TASKD_HPP_
#define TASKD_HPP_

#include "taskd/client.hpp"
#include "taskd/connection.hpp"
#include "taskd/digest.hpp"
#include "taskd/dispatch_queue.hpp"
#include "taskd/frame.hpp"
#include "taskd/log.hpp"
#include "taskd/message.hpp"
#include "taskd/metrics.hpp"
#include "taskd/oneshot.hpp"
#include "taskd/protocol_hsm.hpp"
#include "taskd/server.hpp"
#include "taskd/utils.hpp"
#include "taskd/vocabulary.hpp"
#include "taskd/worker_pool.hpp"

#endif  // TASKD_HPP_
