#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace quire {

// Ordered push channel for one reader session. Emissions reach subscribers
// synchronously, in call order. Once closed, every subscriber gets its done
// callback and later emissions are dropped.
//
// A replaying channel keeps its history and hands it to late subscribers
// before they see live values.
template <typename T>
class Channel {
 public:
  using DataCallback = std::function<void(const T&)>;
  using DoneCallback = std::function<void()>;

  explicit Channel(bool replay = false) : replay_(replay) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  // Returns a subscription id, or 0 if the channel was already closed
  // (onDone has then been called before returning).
  int subscribe(DataCallback onData, DoneCallback onDone = nullptr) {
    if (replay_ && onData) {
      for (const T& value : history_) onData(value);
    }
    if (closed_) {
      if (onDone) onDone();
      return 0;
    }
    const int id = nextId_++;
    subscribers_.push_back({id, std::move(onData), std::move(onDone)});
    return id;
  }

  void unsubscribe(const int id) {
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
      if (it->id == id) {
        subscribers_.erase(it);
        return;
      }
    }
  }

  // False if the channel is closed and the value was dropped
  bool emit(const T& value) {
    if (closed_) return false;
    if (replay_) history_.push_back(value);

    // Callbacks may unsubscribe while we iterate
    const std::vector<Subscriber> snapshot = subscribers_;
    for (const Subscriber& s : snapshot) {
      if (s.onData) s.onData(value);
    }
    return true;
  }

  void close() {
    if (closed_) return;
    closed_ = true;

    std::vector<Subscriber> snapshot;
    snapshot.swap(subscribers_);
    for (const Subscriber& s : snapshot) {
      if (s.onDone) s.onDone();
    }
  }

  bool isClosed() const { return closed_; }
  size_t subscriberCount() const { return subscribers_.size(); }

 private:
  struct Subscriber {
    int id;
    DataCallback onData;
    DoneCallback onDone;
  };

  bool replay_;
  bool closed_ = false;
  int nextId_ = 1;
  std::vector<Subscriber> subscribers_;
  std::vector<T> history_;
};

// Read side of a Channel handed to callers. A default-constructed stream has no
// channel behind it and behaves as already closed.
template <typename T>
class Stream {
 public:
  Stream() = default;
  explicit Stream(std::shared_ptr<Channel<T>> channel) : channel_(std::move(channel)) {}

  static Stream empty() { return Stream(); }

  int subscribe(typename Channel<T>::DataCallback onData, typename Channel<T>::DoneCallback onDone = nullptr) {
    if (!channel_) {
      if (onDone) onDone();
      return 0;
    }
    return channel_->subscribe(std::move(onData), std::move(onDone));
  }

  void unsubscribe(const int id) {
    if (channel_) channel_->unsubscribe(id);
  }

  bool isClosed() const { return !channel_ || channel_->isClosed(); }

 private:
  std::shared_ptr<Channel<T>> channel_;
};

}  // namespace quire
