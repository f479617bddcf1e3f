// logging.cpp - Async file logger: MPMC record queue drained by one writer thread

#include "logging.h"
#include "lf_queue.h"
#include "macros.h"
#include "time_utils.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <sched.h>
#include <strings.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <unistd.h>

namespace Common {

namespace {

struct LogRecord {
  EpochNanos timestamp{0};
  uint32_t thread_id{0};
  uint16_t level{0};
  uint16_t len{0};
  char msg[Logger::MAX_MSG_SIZE]{};
};

auto envSize(const char* name, std::size_t fallback, std::size_t max_value) noexcept -> std::size_t {
  const char* env = std::getenv(name);
  if (!env) return fallback;
  char* end = nullptr;
  unsigned long value = std::strtoul(env, &end, 10);
  if (end == env || value == 0 || value > max_value) return fallback;
  return static_cast<std::size_t>(value);
}

auto envInt(const char* name, int fallback) noexcept -> int {
  const char* env = std::getenv(name);
  if (!env) return fallback;
  char* end = nullptr;
  long value = std::strtol(env, &end, 10);
  if (end == env) return fallback;
  return static_cast<int>(value);
}

const char* levelToString(uint16_t level) noexcept {
  switch (level) {
    case Logger::DEBUG: return "DEBUG";
    case Logger::INFO:  return "INFO ";
    case Logger::WARN:  return "WARN ";
    case Logger::ERROR: return "ERROR";
    case Logger::FATAL: return "FATAL";
    default: return "UNKN ";
  }
}

} // namespace

// ---------- Async logger implementation ----------
class AsyncLoggerImpl {
public:
  static constexpr std::size_t MAX_BATCH_SIZE = 256;

  DELETE_COPY_AND_MOVE(AsyncLoggerImpl);

  AsyncLoggerImpl(const char* path, std::size_t capacity)
  : path_(path ? path : ""),
    file_(nullptr),
    queue_(capacity),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true),
    batch_size_(envSize("LOGGER_BATCH", 128, MAX_BATCH_SIZE)),
    flush_ms_(static_cast<int>(envSize("LOGGER_FLUSH_MS", 100, 10000))),
    writer_cpu_(envInt("LOGGER_WRITER_CPU", -1)) {

    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      // fopen below reports the failure
    }

    file_ = std::fopen(path_.c_str(), "a");
    if (file_) {
      std::setvbuf(file_, nullptr, _IOFBF, 1 << 20);
      std::fprintf(file_, "[LOGGER_CONFIG] queue_capacity=%zu batch_size=%zu flush_ms=%d writer_cpu=%d\n",
                   queue_.capacity(), batch_size_, flush_ms_, writer_cpu_);
      std::fflush(file_);
    } else {
      std::fprintf(stderr, "Warning: could not open log file %s\n", path_.c_str());
    }

    writer_thread_ = std::thread([this] {
      if (writer_cpu_ >= 0 && writer_cpu_ < sysconf(_SC_NPROCESSORS_ONLN)) {
        cpu_set_t cpuset;
        CPU_ZERO(&cpuset);
        CPU_SET(static_cast<size_t>(writer_cpu_), &cpuset);
        pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
      }
      pthread_setname_np(pthread_self(), "log-writer");
      writerLoop();
    });
  }

  ~AsyncLoggerImpl() {
    running_.store(false, std::memory_order_release);
    cv_.notify_all();

    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }

    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  bool log(uint16_t level, const char* msg, std::size_t len) noexcept {
    LogRecord rec{};
    rec.timestamp = getWallClockNanos();
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    if (rec.len > 0) {
      std::memcpy(rec.msg, msg, rec.len);
    }
    rec.msg[rec.len] = '\0';

    if (UNLIKELY(!queue_.enqueue(rec))) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    // Only notify when transitioning from empty to non-empty
    if (queue_was_empty_.exchange(false, std::memory_order_acq_rel)) {
      cv_.notify_one();
    }
    if (UNLIKELY(level >= Logger::FATAL)) {
      cv_.notify_one();
    }
    return true;
  }

  auto stats() const noexcept -> Logger::Stats {
    Logger::Stats s;
    s.messages_written = written_.load(std::memory_order_relaxed);
    s.messages_dropped = drops_.load(std::memory_order_relaxed);
    s.bytes_written = bytes_.load(std::memory_order_relaxed);
    return s;
  }

private:
  void writerLoop() {
    LogRecord batch[MAX_BATCH_SIZE];
    char headers[MAX_BATCH_SIZE][64];
    static constexpr char NEWLINE[] = "\n";
    struct iovec iovecs[MAX_BATCH_SIZE * 3];

    auto last_flush = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      cv_.wait_for(lock, std::chrono::milliseconds(1), [this] {
        return !running_.load(std::memory_order_acquire) || !queue_.empty();
      });
      lock.unlock();

      std::size_t n = 0;
      while (n < batch_size_ && queue_.dequeue(batch[n])) {
        ++n;
      }

      if (n > 0 && file_) {
        std::size_t iovec_count = 0;
        std::size_t total_bytes = 0;
        for (std::size_t i = 0; i < n; ++i) {
          const auto& rec = batch[i];
          int header_len = std::snprintf(headers[i], sizeof(headers[i]), "[%lld.%09lld][%s][T%u] ",
              static_cast<long long>(rec.timestamp / NANOS_PER_SECOND),
              static_cast<long long>(rec.timestamp % NANOS_PER_SECOND),
              levelToString(rec.level),
              rec.thread_id);
          if (header_len <= 0) continue;

          iovecs[iovec_count++] = {headers[i], static_cast<size_t>(header_len)};
          iovecs[iovec_count++] = {const_cast<char*>(rec.msg), rec.len};
          iovecs[iovec_count++] = {const_cast<char*>(NEWLINE), 1};
          total_bytes += static_cast<std::size_t>(header_len) + rec.len + 1;
        }

        // writev bypasses stdio, so drain the stdio buffer first to keep ordering
        std::fflush(file_);
        int fd = fileno(file_);
        ssize_t written = isRegularFile(fd) ? ::writev(fd, iovecs, static_cast<int>(iovec_count)) : -1;
        if (written < 0) {
          for (std::size_t i = 0; i < n; ++i) {
            std::fprintf(file_, "%s%s\n", headers[i], batch[i].msg);
          }
        }
        written_.fetch_add(n, std::memory_order_relaxed);
        bytes_.fetch_add(total_bytes, std::memory_order_relaxed);

        if (queue_.empty()) {
          queue_was_empty_.store(true, std::memory_order_release);
        }

        auto now = std::chrono::steady_clock::now();
        auto since_flush = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_flush).count();
        if (queue_.empty() || since_flush >= flush_ms_) {
          std::fflush(file_);
          last_flush = now;
        }
      } else if (n == 0) {
        queue_was_empty_.store(true, std::memory_order_release);
      }

      lock.lock();
    }

    if (file_) {
      std::fflush(file_);
    }
  }

  static bool isRegularFile(int fd) noexcept {
    struct stat st;
    if (fstat(fd, &st) == 0) {
      return S_ISREG(st.st_mode);
    }
    return false;
  }

  std::string path_;
  FILE* file_;
  MPMCLFQueue<LogRecord> queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  const std::size_t batch_size_;
  const int flush_ms_;
  const int writer_cpu_;
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> drops_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> written_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> bytes_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<bool> queue_was_empty_{true};
};

// Global logger instance
static std::unique_ptr<AsyncLoggerImpl> g_logger_impl;
static std::atomic<AsyncLoggerImpl*> g_logger_ptr{nullptr};
static std::mutex g_logger_mutex;
static std::atomic<uint16_t> g_min_level{Logger::INFO};

void initLogging(const char* log_file) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);

  g_logger_ptr.store(nullptr, std::memory_order_release);
  g_logger_impl.reset();

  std::size_t capacity = envSize("LOGGER_QUEUE_CAPACITY", 16384, 1u << 20);
  g_logger_impl = std::make_unique<AsyncLoggerImpl>(log_file, capacity);
  g_logger_ptr.store(g_logger_impl.get(), std::memory_order_release);
}

void shutdownLogging() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger_ptr.store(nullptr, std::memory_order_release);
  g_logger_impl.reset();
}

void Logger::submit(Level level, const char* msg, size_t len) noexcept {
  if (auto* impl = g_logger_ptr.load(std::memory_order_acquire)) {
    impl->log(static_cast<uint16_t>(level), msg, len);
  }
}

auto Logger::minLevel() noexcept -> Level {
  return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

auto Logger::setMinLevel(Level level) noexcept -> void {
  g_min_level.store(static_cast<uint16_t>(level), std::memory_order_relaxed);
}

auto Logger::parseLevel(const char* name, Level* out) noexcept -> bool {
  static constexpr struct { const char* name; Level level; } LEVELS[] = {
    {"DEBUG", DEBUG}, {"INFO", INFO}, {"WARN", WARN}, {"ERROR", ERROR}, {"FATAL", FATAL},
  };
  for (const auto& entry : LEVELS) {
    if (strcasecmp(name, entry.name) == 0) {
      *out = entry.level;
      return true;
    }
  }
  return false;
}

auto Logger::getStats() noexcept -> Stats {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (g_logger_impl) {
    return g_logger_impl->stats();
  }
  return Stats{};
}

} // namespace Common
