// logging.cpp - async file logger backed by a bounded MPMC queue
// (Vyukov algorithm). Producers never block: a full queue drops the record
// and bumps a counter.

#include "common/logging.h"
#include "common/macros.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <strings.h>
#include <thread>

namespace Shield::Common {

namespace {

// ---------- Bounded Vyukov MPMC queue ----------
class MPMCQueue {
public:
  static constexpr std::size_t MAX_CAPACITY = 65536;

  struct LogRecord {
    uint64_t wall_ns{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[240]{};
  };

  explicit MPMCQueue(std::size_t capacity)
  : size_(std::min(roundUpPow2(capacity), MAX_CAPACITY)),
    mask_(size_ - 1),
    buffer_(new Cell[size_]) {
    for (std::size_t i = 0; i < size_; ++i) {
      buffer_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  MPMCQueue(const MPMCQueue&) = delete;
  MPMCQueue& operator=(const MPMCQueue&) = delete;

  bool enqueue(const LogRecord& rec) noexcept {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
      if (diff == 0) {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          c.data = rec;
          c.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // full
      } else {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  bool dequeue(LogRecord& out) noexcept {
    std::size_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          out = c.data;
          c.seq.store(pos + size_, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // empty
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    SHIELD_CACHE_ALIGNED std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static std::size_t roundUpPow2(std::size_t n) noexcept {
    if (n < 2) return 2;
    --n;
    n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
    n |= n >> 8;  n |= n >> 16; n |= n >> 32;
    return n + 1;
  }

  SHIELD_CACHE_ALIGNED std::atomic<std::size_t> head_{0};
  SHIELD_CACHE_ALIGNED std::atomic<std::size_t> tail_{0};
  std::size_t size_;
  std::size_t mask_;
  std::unique_ptr<Cell[]> buffer_;
};

const char* paddedLevel(uint16_t level) noexcept {
  switch (level) {
    case 0: return "DEBUG";
    case 1: return "INFO ";
    case 2: return "WARN ";
    case 3: return "ERROR";
    case 4: return "FATAL";
    default: return "UNKN ";
  }
}

// ---------- Async logger ----------
class AsyncLogger {
public:
  static constexpr std::size_t DEFAULT_CAPACITY = 16384;
  static constexpr std::size_t BATCH_SIZE = 128;
  static constexpr int FLUSH_MS = 100;

  explicit AsyncLogger(const char* path)
  : file_(nullptr),
    queue_(DEFAULT_CAPACITY),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true) {
    std::strncpy(path_, path, sizeof(path_) - 1);
    path_[sizeof(path_) - 1] = '\0';

    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      // A failure surfaces as a null file below
    }

    file_ = std::fopen(path_, "a");
    if (!file_) {
      std::fprintf(stderr, "Warning: cannot open log file %s\n", path_);
    }

    writer_thread_ = std::thread([this] { writerLoop(); });
  }

  AsyncLogger(const AsyncLogger&) = delete;
  AsyncLogger& operator=(const AsyncLogger&) = delete;

  ~AsyncLogger() {
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

  void log(uint16_t level, const char* msg, std::size_t len) noexcept {
    MPMCQueue::LogRecord rec{};
    rec.wall_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    std::memcpy(rec.msg, msg, rec.len);
    rec.msg[rec.len] = '\0';

    if (SHIELD_UNLIKELY(!queue_.enqueue(rec))) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    cv_.notify_one();
  }

  LogStats stats() const noexcept {
    LogStats s;
    s.messages_written = written_.load(std::memory_order_relaxed);
    s.messages_dropped = drops_.load(std::memory_order_relaxed);
    s.bytes_written = bytes_.load(std::memory_order_relaxed);
    return s;
  }

private:
  void writerLoop() {
    MPMCQueue::LogRecord batch[BATCH_SIZE];
    auto last_flush = std::chrono::steady_clock::now();

    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(1), [this] {
          return !running_.load(std::memory_order_acquire) || !queue_.empty();
        });
      }

      std::size_t n = 0;
      while (n < BATCH_SIZE && queue_.dequeue(batch[n])) {
        ++n;
      }
      if (n == 0 || !file_) {
        continue;
      }

      for (std::size_t i = 0; i < n; ++i) {
        const auto& rec = batch[i];
        int written = std::fprintf(file_, "[%llu.%09llu][%s][T%u] %s\n",
            static_cast<unsigned long long>(rec.wall_ns / 1'000'000'000ULL),
            static_cast<unsigned long long>(rec.wall_ns % 1'000'000'000ULL),
            paddedLevel(rec.level),
            rec.thread_id,
            rec.msg);
        if (written > 0) {
          written_.fetch_add(1, std::memory_order_relaxed);
          bytes_.fetch_add(static_cast<uint64_t>(written), std::memory_order_relaxed);
        }
      }

      auto now = std::chrono::steady_clock::now();
      auto since_flush = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_flush).count();
      if (queue_.empty() || since_flush >= FLUSH_MS) {
        std::fflush(file_);
        last_flush = now;
      }
    }
  }

  char path_[512];
  FILE* file_;
  MPMCQueue queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  SHIELD_CACHE_ALIGNED std::atomic<uint64_t> drops_{0};
  SHIELD_CACHE_ALIGNED std::atomic<uint64_t> written_{0};
  SHIELD_CACHE_ALIGNED std::atomic<uint64_t> bytes_{0};
};

std::mutex g_logger_mutex;
std::unique_ptr<AsyncLogger> g_logger_owner;
std::atomic<AsyncLogger*> g_logger{nullptr};
std::atomic<uint16_t> g_min_level{static_cast<uint16_t>(LogLevel::INFO)};

} // namespace

void initLogging(const char* log_file, LogLevel min_level) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);

  g_logger.store(nullptr, std::memory_order_release);
  g_logger_owner.reset();

  g_min_level.store(static_cast<uint16_t>(min_level), std::memory_order_relaxed);
  g_logger_owner = std::make_unique<AsyncLogger>(log_file);
  g_logger.store(g_logger_owner.get(), std::memory_order_release);
}

void shutdownLogging() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger.store(nullptr, std::memory_order_release);
  g_logger_owner.reset();
}

auto isLoggingEnabled(LogLevel level) noexcept -> bool {
  return g_logger.load(std::memory_order_acquire) != nullptr &&
         static_cast<uint16_t>(level) >= g_min_level.load(std::memory_order_relaxed);
}

auto getLogStats() noexcept -> LogStats {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (!g_logger_owner) {
    return LogStats{};
  }
  return g_logger_owner->stats();
}

auto parseLogLevel(const char* name, LogLevel* level) noexcept -> bool {
  if (!name || !level) {
    return false;
  }
  static constexpr struct { const char* name; LogLevel level; } LEVELS[] = {
    {"debug", LogLevel::DEBUG},
    {"info", LogLevel::INFO},
    {"warn", LogLevel::WARN},
    {"warning", LogLevel::WARN},
    {"error", LogLevel::ERROR},
    {"fatal", LogLevel::FATAL},
  };
  for (const auto& entry : LEVELS) {
    if (strcasecmp(name, entry.name) == 0) {
      *level = entry.level;
      return true;
    }
  }
  return false;
}

auto logLevelName(LogLevel level) noexcept -> const char* {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
  }
  return "UNKNOWN";
}

void logMessageToGlobal(LogLevel level, const char* msg, size_t len) noexcept {
  AsyncLogger* logger = g_logger.load(std::memory_order_acquire);
  if (SHIELD_LIKELY(logger)) {
    logger->log(static_cast<uint16_t>(level), msg, len);
  }
}

} // namespace Shield::Common
