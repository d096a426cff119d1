#ifndef BATCH_STORE_H
#define BATCH_STORE_H

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

// Keyed storage for per-batch sweep state. Everything a sweep needs to resume
// on the next scheduler tick lives behind this interface; nothing is carried
// on the call stack between ticks.
template <typename T>
class BatchStore {
 public:
  virtual ~BatchStore() = default;

  // Copy the entry into *out. Returns false if the batch is unknown.
  virtual bool Find(const std::string& batch_id, T* out) const = 0;

  // Insert or replace.
  virtual void Put(const std::string& batch_id, T value) = 0;

  // Read an entry in place without copying it. Returns false if the batch is
  // unknown.
  virtual bool Visit(const std::string& batch_id,
                     const std::function<void(const T&)>& fn) const = 0;

  // Mutate an entry in place. Returns false if the batch is unknown.
  virtual bool Modify(const std::string& batch_id, const std::function<void(T*)>& fn) = 0;

  // Move the entry out and remove it. Returns false if the batch is unknown.
  virtual bool Take(const std::string& batch_id, T* out) = 0;

  virtual bool Erase(const std::string& batch_id) = 0;
  virtual bool Contains(const std::string& batch_id) const = 0;
  virtual size_t Size() const = 0;
  virtual void Clear() = 0;
};

// Process-local store. Each instance is independent, so tests can use one
// store per case instead of sharing a registry.
template <typename T>
class InMemoryBatchStore : public BatchStore<T> {
 public:
  InMemoryBatchStore() = default;
  InMemoryBatchStore(const InMemoryBatchStore&) = delete;
  InMemoryBatchStore& operator=(const InMemoryBatchStore&) = delete;

  bool Find(const std::string& batch_id, T* out) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(batch_id);
    if (it == entries_.end()) {
      return false;
    }
    if (out) {
      *out = it->second;
    }
    return true;
  }

  void Put(const std::string& batch_id, T value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[batch_id] = std::move(value);
  }

  bool Visit(const std::string& batch_id,
             const std::function<void(const T&)>& fn) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(batch_id);
    if (it == entries_.end()) {
      return false;
    }
    if (fn) {
      fn(it->second);
    }
    return true;
  }

  bool Modify(const std::string& batch_id, const std::function<void(T*)>& fn) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(batch_id);
    if (it == entries_.end()) {
      return false;
    }
    if (fn) {
      fn(&it->second);
    }
    return true;
  }

  bool Take(const std::string& batch_id, T* out) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(batch_id);
    if (it == entries_.end()) {
      return false;
    }
    if (out) {
      *out = std::move(it->second);
    }
    entries_.erase(it);
    return true;
  }

  bool Erase(const std::string& batch_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(batch_id) > 0;
  }

  bool Contains(const std::string& batch_id) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(batch_id) != entries_.end();
  }

  size_t Size() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  void Clear() override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

 private:
  std::map<std::string, T> entries_;
  mutable std::mutex mutex_;
};

#endif  // BATCH_STORE_H
