#pragma once
#include <sqlite3.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace sqlog
{

// 单个 SQLite 连接。构造时打开数据库并应用性能 PRAGMA，失败抛 ConnectionError。
class Connection
{
 public:
  explicit Connection(const std::string& db_path);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  sqlite3* Handle() const { return db_; }

  // 缓存一条预编译语句（插入语句在整个连接生命周期内复用）
  int PrepareCached(const std::string& sql, sqlite3_stmt** stmt);

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* cached_stmt_ = nullptr;
  std::string cached_sql_;

  void ApplyPragmas();
};

// 每线程一个连接，首次使用时惰性创建。
class ConnectionProvider
{
 private:
  struct Slot
  {
    std::mutex mutex;
    std::unique_ptr<Connection> conn;
  };

 public:
  // 持有期间独占当前线程的连接；CloseAll() 会等待所有 Lease 释放
  class Lease
  {
   public:
    Lease(Lease&&) = default;
    Lease& operator=(Lease&&) = default;

    Connection& Get() const { return *conn_; }
    sqlite3* Handle() const { return conn_->Handle(); }

   private:
    friend class ConnectionProvider;
    Lease(std::unique_lock<std::mutex> lock, Connection* conn)
        : lock_(std::move(lock)), conn_(conn)
    {
    }

    std::unique_lock<std::mutex> lock_;
    Connection* conn_;
  };

  explicit ConnectionProvider(std::string db_path);
  ~ConnectionProvider();

  ConnectionProvider(const ConnectionProvider&) = delete;
  ConnectionProvider& operator=(const ConnectionProvider&) = delete;

  // Shutdown() 之后抛 ClosedHandlerError；打开失败抛 ConnectionError
  Lease Acquire();

  // 释放所有线程的连接；之后 Acquire() 会重新打开
  void CloseAll();

  // 终止：CloseAll() 并拒绝后续 Acquire()
  void Shutdown();

  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  size_t OpenCount() const;
  const std::string& DbPath() const { return db_path_; }

 private:
  std::string db_path_;
  std::atomic<bool> closed_{false};

  mutable std::mutex slots_mutex_;
  std::unordered_map<std::thread::id, std::unique_ptr<Slot>> slots_;
};

}  // namespace sqlog
