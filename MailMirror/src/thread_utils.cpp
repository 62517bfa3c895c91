#include "mailmirror/thread_utils.hpp"
#include <spdlog/details/os.h>
#include <stdio.h>
#include <map>
#include <mutex>
#include <thread>

#include <unistd.h>
#include <pthread.h>

static std::map<size_t, std::string> names{};
static std::mutex namesMtx;

void SetThreadName(const char* threadName)
{
    namesMtx.lock();
    names[spdlog::details::os::thread_id()] = threadName;
    namesMtx.unlock();
#ifdef __APPLE__
    pthread_setname_np(threadName);
#else
    pthread_setname_np(pthread_self(), threadName);
#endif
}

std::string * GetThreadName(size_t spdlog_thread_id) {
    std::lock_guard<std::mutex> lck(namesMtx);
    return &names[spdlog_thread_id];
}
