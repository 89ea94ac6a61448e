#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <vector>

#include "log_record.hpp"

namespace sqlog
{

enum class BufferState : uint8_t
{
  Active,
  Flushing,  // 至少有一个换出的批次仍在写入
  Closed
};

class RecordBuffer;

// 换出的一批记录，只可移动。销毁前计为 in-flight；不得比所属 RecordBuffer 活得更久。
class Batch
{
 public:
  Batch() = default;
  ~Batch();

  Batch(Batch&& other) noexcept;
  Batch& operator=(Batch&& other) noexcept;
  Batch(const Batch&) = delete;
  Batch& operator=(const Batch&) = delete;

  const std::vector<LogRecord>& Records() const { return records_; }
  size_t Size() const { return records_.size(); }
  bool Empty() const { return records_.empty(); }
  // 换出顺序号，批次按此顺序写入
  uint64_t Sequence() const { return sequence_; }

  std::vector<LogRecord>::const_iterator begin() const { return records_.begin(); }
  std::vector<LogRecord>::const_iterator end() const { return records_.end(); }

 private:
  friend class RecordBuffer;
  Batch(RecordBuffer* owner, uint64_t sequence, std::vector<LogRecord> records);

  void Release();

  RecordBuffer* owner_ = nullptr;
  uint64_t sequence_ = 0;
  std::vector<LogRecord> records_;
};

// 待写记录队列。互斥锁只保护追加与整体换出，从不跨越 I/O。
class RecordBuffer
{
 public:
  explicit RecordBuffer(size_t capacity);

  // 追加一条记录；达到 capacity 时换出整个待写列表并返回，否则返回空批次。
  // 关闭后抛 ClosedHandlerError。
  Batch Enqueue(LogRecord record);

  // 换出当前全部待写记录（可能为空）
  Batch Drain();

  // 进入 Closed 并返回最后一次换出；重复调用返回空批次
  Batch Close();

  // 阻塞直到没有 in-flight 批次
  void WaitIdle();

  // 阻塞直到更早换出的批次全部释放；保证同一线程的记录跨批次仍按入队顺序落库
  void WaitForTurn(const Batch& batch);

  size_t Pending() const;
  size_t InFlight() const;
  size_t Capacity() const { return capacity_; }
  BufferState State() const;

 private:
  friend class Batch;

  Batch TakeLocked();
  void OnBatchReleased(uint64_t sequence);

  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<LogRecord> pending_;
  size_t in_flight_ = 0;
  bool closed_ = false;

  uint64_t next_sequence_ = 0;
  uint64_t next_turn_ = 0;
  std::set<uint64_t> released_ahead_;
};

}  // namespace sqlog
