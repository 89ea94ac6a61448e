#include "sqlog/record_buffer.hpp"

#include "sqlog/errors.hpp"

namespace sqlog
{

Batch::Batch(RecordBuffer* owner, uint64_t sequence, std::vector<LogRecord> records)
    : owner_(owner), sequence_(sequence), records_(std::move(records))
{
}

Batch::~Batch() { Release(); }

Batch::Batch(Batch&& other) noexcept
    : owner_(other.owner_), sequence_(other.sequence_), records_(std::move(other.records_))
{
  other.owner_ = nullptr;
  other.records_.clear();
}

Batch& Batch::operator=(Batch&& other) noexcept
{
  if (this != &other)
  {
    Release();
    owner_ = other.owner_;
    sequence_ = other.sequence_;
    records_ = std::move(other.records_);
    other.owner_ = nullptr;
    other.records_.clear();
  }
  return *this;
}

void Batch::Release()
{
  records_.clear();
  if (owner_)
  {
    owner_->OnBatchReleased(sequence_);
    owner_ = nullptr;
  }
}

RecordBuffer::RecordBuffer(size_t capacity) : capacity_(capacity) {}

Batch RecordBuffer::Enqueue(LogRecord record)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
  {
    throw ClosedHandlerError("record buffer is closed");
  }
  pending_.push_back(std::move(record));
  if (pending_.size() >= capacity_)
  {
    return TakeLocked();
  }
  return Batch();
}

Batch RecordBuffer::Drain()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return TakeLocked();
}

Batch RecordBuffer::Close()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
  {
    return Batch();
  }
  closed_ = true;
  return TakeLocked();
}

Batch RecordBuffer::TakeLocked()
{
  if (pending_.empty())
  {
    return Batch();
  }
  std::vector<LogRecord> taken;
  taken.swap(pending_);
  ++in_flight_;
  return Batch(this, next_sequence_++, std::move(taken));
}

void RecordBuffer::OnBatchReleased(uint64_t sequence)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_flight_ > 0)
  {
    --in_flight_;
  }
  // 释放可能乱序（批次未经 WaitForTurn 即被丢弃），轮次只能连续推进
  if (sequence == next_turn_)
  {
    ++next_turn_;
    while (!released_ahead_.empty() && *released_ahead_.begin() == next_turn_)
    {
      released_ahead_.erase(released_ahead_.begin());
      ++next_turn_;
    }
  }
  else if (sequence > next_turn_)
  {
    released_ahead_.insert(sequence);
  }
  cv_.notify_all();
}

void RecordBuffer::WaitIdle()
{
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void RecordBuffer::WaitForTurn(const Batch& batch)
{
  if (batch.owner_ != this)
  {
    return;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this, &batch] { return next_turn_ >= batch.sequence_; });
}

size_t RecordBuffer::Pending() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

size_t RecordBuffer::InFlight() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

BufferState RecordBuffer::State() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
  {
    return BufferState::Closed;
  }
  return in_flight_ > 0 ? BufferState::Flushing : BufferState::Active;
}

}  // namespace sqlog
