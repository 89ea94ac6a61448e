#include "sqlog/storage/connection_provider.hpp"

#include "sqlog/errors.hpp"
#include "sqlog/platform.hpp"

namespace sqlog
{

Connection::Connection(const std::string& db_path)
{
  // 连接只在持有 Lease 的线程上使用，无需 SQLite 内部的全连接互斥
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  int rc = sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK)
  {
    std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw ConnectionError("failed to open '" + db_path + "': " + detail, rc);
  }

  sqlite3_busy_timeout(db_, SQLOG_BUSY_TIMEOUT_MS);

  try
  {
    ApplyPragmas();
  }
  catch (const ConnectionError&)
  {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Connection::~Connection()
{
  if (cached_stmt_)
  {
    sqlite3_finalize(cached_stmt_);
    cached_stmt_ = nullptr;
  }
  if (db_)
  {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void Connection::ApplyPragmas()
{
  const std::string pragmas[] = {
      "PRAGMA journal_mode=WAL",
      "PRAGMA synchronous=NORMAL",
      "PRAGMA cache_size=-" + std::to_string(SQLOG_CACHE_SIZE_KIB),
      "PRAGMA mmap_size=" + std::to_string(SQLOG_MMAP_SIZE),
  };

  for (const auto& sql : pragmas)
  {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
      std::string detail = err_msg ? err_msg : sqlite3_errstr(rc);
      sqlite3_free(err_msg);
      throw ConnectionError("'" + sql + "' failed: " + detail, rc);
    }
  }
}

int Connection::PrepareCached(const std::string& sql, sqlite3_stmt** stmt)
{
  if (cached_stmt_ && cached_sql_ == sql)
  {
    sqlite3_reset(cached_stmt_);
    sqlite3_clear_bindings(cached_stmt_);
    *stmt = cached_stmt_;
    return SQLITE_OK;
  }

  if (cached_stmt_)
  {
    sqlite3_finalize(cached_stmt_);
    cached_stmt_ = nullptr;
    cached_sql_.clear();
  }

  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &cached_stmt_, nullptr);
  if (rc != SQLITE_OK)
  {
    sqlite3_finalize(cached_stmt_);
    cached_stmt_ = nullptr;
    *stmt = nullptr;
    return rc;
  }
  cached_sql_ = sql;
  *stmt = cached_stmt_;
  return SQLITE_OK;
}

ConnectionProvider::ConnectionProvider(std::string db_path) : db_path_(std::move(db_path)) {}

ConnectionProvider::~ConnectionProvider() { CloseAll(); }

ConnectionProvider::Lease ConnectionProvider::Acquire()
{
  if (IsClosed())
  {
    throw ClosedHandlerError("connection provider for '" + db_path_ + "' is closed");
  }

  Slot* slot = nullptr;
  {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& entry = slots_[std::this_thread::get_id()];
    if (!entry)
    {
      entry = std::make_unique<Slot>();
    }
    slot = entry.get();
  }

  std::unique_lock<std::mutex> slot_lock(slot->mutex);
  // Shutdown() 可能发生在取得 slot 之后
  if (IsClosed())
  {
    throw ClosedHandlerError("connection provider for '" + db_path_ + "' is closed");
  }
  if (!slot->conn)
  {
    slot->conn = std::make_unique<Connection>(db_path_);
  }
  return Lease(std::move(slot_lock), slot->conn.get());
}

void ConnectionProvider::CloseAll()
{
  std::lock_guard<std::mutex> lock(slots_mutex_);
  for (auto& [tid, slot] : slots_)
  {
    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    slot->conn.reset();
  }
}

void ConnectionProvider::Shutdown()
{
  closed_.store(true, std::memory_order_release);
  CloseAll();
}

size_t ConnectionProvider::OpenCount() const
{
  std::lock_guard<std::mutex> lock(slots_mutex_);
  size_t count = 0;
  for (const auto& [tid, slot] : slots_)
  {
    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    if (slot->conn)
    {
      ++count;
    }
  }
  return count;
}

}  // namespace sqlog
