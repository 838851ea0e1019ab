#include <dsbox/logger.h>

#include <mutex>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Release() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  static std::once_flag flag;
  std::call_once(flag, []() {
    spdlog::debug("Setup logger pthread_atfork");
    pthread_atfork(Prepare, Release, Release);
  });
}
