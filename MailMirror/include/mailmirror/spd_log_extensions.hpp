/** SPDLogExtensions [MailMirror]
 *
 * Author(s): Ben Gotow
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SPDLogExtensions_h
#define SPDLogExtensions_h

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "spdlog/spdlog.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/base_sink.h"

#include "mailmirror/thread_utils.hpp"

std::mutex spdFlushMtx;
std::condition_variable spdFlushCV;
int spdUnflushed = 0;
bool spdFlushExit = false;

void runFlushLoop() {
    while (true) {
        std::chrono::system_clock::time_point desiredTime = std::chrono::system_clock::now();
        desiredTime += std::chrono::milliseconds(30000);
        {
            // Wait for a message, or for 30 seconds, whichever happens first
            std::unique_lock<std::mutex> lck(spdFlushMtx);
            spdFlushCV.wait_until(lck, desiredTime);
            if (spdFlushExit) {
                return;
            }
            if (spdUnflushed == 0) {
                continue; // detect, avoid spurious wakes
            }
        }

        // Debounce 1sec for more messages to arrive
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));

        {
            // Perform flush
            std::unique_lock<std::mutex> lck(spdFlushMtx);
            spdlog::get("logger")->flush();
            spdUnflushed = 0;
        }
    }
}

class SPDFlusherSink : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
public:
    std::thread * flushThread;

    SPDFlusherSink() {
        flushThread = new std::thread(runFlushLoop);
    }
    ~SPDFlusherSink() {
        {
            std::lock_guard<std::mutex> lck(spdFlushMtx);
            spdFlushExit = true;
            spdFlushCV.notify_one();
        }
        flushThread->join();
        delete flushThread;
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        // ensure we have a flush queued
        std::lock_guard<std::mutex> lck(spdFlushMtx);
        spdUnflushed += 1;
        spdFlushCV.notify_one();
    }

    void flush_() override {
        // no-op
    }
};

// Renders the name given to the logging thread with SetThreadName as %N.
class SPDThreadNameFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm &, spdlog::memory_buf_t & dest) override {
        std::string * name = GetThreadName(msg.thread_id);
        dest.append(name->data(), name->data() + name->size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return spdlog::details::make_unique<SPDThreadNameFlag>();
    }
};

std::unique_ptr<spdlog::formatter> SPDFormatterWithThreadNames(const std::string& pattern) {
    auto formatter = spdlog::details::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<SPDThreadNameFlag>('N').set_pattern(pattern);
    return std::move(formatter);
}

#endif /* SPDLogExtensions_h */
