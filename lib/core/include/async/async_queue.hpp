#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace vine_sync::async {

/**
 * @brief Bounded multi-producer queue feeding a single coroutine consumer.
 *
 * @tparam T The type of elements stored in the queue
 *
 * Producers are transport callbacks running on arbitrary threads; the consumer
 * is a coroutine on the engine's io_context. push() never blocks: when the
 * channel is full or closed the value is rejected and the caller decides what
 * to do with it.
 */
template<typename T> class async_queue
{
public:
  /// Default number of elements the queue can hold
  static constexpr std::size_t default_capacity{ 4096 };

  /**
   * @brief Constructs a new async queue.
   *
   * @param io_context Shared pointer to the Boost.Asio io_context for async operations
   * @param capacity Maximum number of buffered elements
   */
  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::size_t capacity = default_capacity)
    : io_context_(io_context), channel_(*io_context_, capacity), capacity_(capacity), size_(0)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Pushes a value onto the queue without blocking.
   *
   * @param value The value to push (moved into the queue)
   * @return true if the value was queued, false if the queue is full or closed
   */
  [[nodiscard]] auto push(T value) -> bool
  {
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) { return false; }
    ++size_;
    return true;
  }

  /**
   * @brief Asynchronously pops a value from the queue (coroutine).
   *
   * @param cancel_slot Optional cancellation slot for operation cancellation
   * @return Awaitable that yields the next value from the queue
   * @throws boost::system::system_error on cancellation or channel errors
   */
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;
    T val = cancel_slot ? co_await channel_.async_receive(boost::asio::bind_cancellation_slot(
                            *cancel_slot, boost::asio::redirect_error(boost::asio::use_awaitable, err)))
                        : co_await channel_.async_receive(boost::asio::redirect_error(boost::asio::use_awaitable, err));
    if (err) { throw boost::system::system_error(err); }
    --size_;
    co_return val;
  }

  /**
   * @brief Attempts to pop a value without blocking.
   *
   * @return Optional containing the value if available, std::nullopt if queue is empty
   */
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    const bool received =
      channel_.try_receive([&value](boost::system::error_code /*ec*/, T rx_value) { value = std::move(rx_value); });

    if (received) {
      --size_;
      return value;
    }
    return std::nullopt;
  }

  /**
   * @brief Pops everything that is currently buffered.
   *
   * @param max_items Upper bound on the number of elements returned
   * @return Drained elements in FIFO order
   */
  auto drain(std::size_t max_items) -> std::vector<T>
  {
    std::vector<T> items;
    while (items.size() < max_items) {
      auto next = try_pop();
      if (not next) { break; }
      items.push_back(std::move(*next));
    }
    return items;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

  /**
   * @brief Closes the queue; pending and future pops fail with channel_closed.
   */
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::size_t capacity_;
  std::atomic<std::size_t> size_;
};

}// namespace vine_sync::async
