#include <isobox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

namespace {

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

// fork() may happen while another thread holds a console sink's mutex
template <bool kLock> void ForEachConsoleSink() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) {
      if constexpr (kLock) {
        ptr->mutex_.lock();
      } else {
        ptr->mutex_.unlock();
      }
    }
  }
}

void Prepare() { ForEachConsoleSink<true>(); }
void Parent() { ForEachConsoleSink<false>(); }
void Child() { ForEachConsoleSink<false>(); }

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
