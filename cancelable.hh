/*
 * This file is part of PowerDNS or dnsdist.
 * Copyright -- PowerDNS.COM B.V. and its contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * In addition, for the avoidance of any doubt, permission is granted to
 * link this program with OpenSSL and to (re)distribute the binaries
 * produced as the result of such linking.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "whoisexception.hh"

/** A deadline that can also be canceled explicitly, from any thread.
 *
 * Copies share the cancellation state, so a copy handed to another thread
 * can cancel an operation waiting on the original.
 */
class QueryContext
{
public:
  using clock_t = std::chrono::steady_clock;

  explicit QueryContext(unsigned int timeoutMsec) :
    d_state(std::make_shared<State>()), d_deadline(clock_t::now() + std::chrono::milliseconds(timeoutMsec))
  {
  }

  void cancel()
  {
    std::lock_guard<std::mutex> lock(d_state->d_mutex);
    d_state->d_canceled = true;
    d_state->d_cond.notify_all();
  }

  [[nodiscard]] bool canceled() const
  {
    std::lock_guard<std::mutex> lock(d_state->d_mutex);
    return d_state->d_canceled;
  }

  [[nodiscard]] bool expired() const
  {
    return clock_t::now() >= d_deadline;
  }

  [[nodiscard]] clock_t::time_point deadline() const
  {
    return d_deadline;
  }

  //! milliseconds left before the deadline, 0 once it passed
  [[nodiscard]] int remainingMsec() const
  {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(d_deadline - clock_t::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
  }

  //! throws CanceledException or TimeoutException when the context is done
  void check(const std::string& server) const
  {
    if (canceled()) {
      throw CanceledException("whois: query to whois server (" + server + ") canceled", server);
    }
    if (expired()) {
      throw TimeoutException("whois: query to whois server (" + server + ") timed out", server);
    }
  }

private:
  template <typename T>
  friend T runCancelable(const QueryContext& ctx, std::function<T()> operation, std::function<void(T&)> discard, const std::string& server);

  struct State
  {
    std::mutex d_mutex;
    std::condition_variable d_cond;
    bool d_canceled{false};
  };

  std::shared_ptr<State> d_state;
  clock_t::time_point d_deadline;
};

/** Runs a blocking, non-cancellable operation on its own thread and waits for the first of
 * its completion, the deadline or an explicit cancellation of ctx.
 *
 * On completion the result is returned, or the exception thrown by the operation is rethrown.
 * On deadline or cancellation a TimeoutException or CanceledException is thrown right away
 * and the operation is abandoned: if it still produces a result later, discard is called on it
 * from the worker thread and the result is destroyed there.
 *
 * The operation must own (or share) everything it uses, it may outlive the caller.
 */
template <typename T>
T runCancelable(const QueryContext& ctx, std::function<T()> operation, std::function<void(T&)> discard, const std::string& server)
{
  struct Slot
  {
    std::optional<T> d_result;
    std::exception_ptr d_error;
    bool d_done{false};
    bool d_abandoned{false};
  };

  auto slot = std::make_shared<Slot>();
  auto state = ctx.d_state;

  std::thread worker([slot, state, operation = std::move(operation), discard = std::move(discard)]() {
    std::optional<T> result;
    std::exception_ptr error;
    try {
      result = operation();
    }
    catch (...) {
      error = std::current_exception();
    }

    std::unique_lock<std::mutex> lock(state->d_mutex);
    if (slot->d_abandoned) {
      lock.unlock();
      if (result && discard) {
        discard(*result);
      }
      return;
    }
    slot->d_result = std::move(result);
    slot->d_error = error;
    slot->d_done = true;
    state->d_cond.notify_all();
  });
  worker.detach();

  std::unique_lock<std::mutex> lock(state->d_mutex);
  state->d_cond.wait_until(lock, ctx.deadline(), [&slot, &state] { return slot->d_done || state->d_canceled; });

  if (slot->d_done) {
    if (slot->d_error) {
      std::rethrow_exception(slot->d_error);
    }
    return std::move(*slot->d_result);
  }

  slot->d_abandoned = true;
  if (state->d_canceled) {
    throw CanceledException("whois: connect to whois server (" + server + ") canceled", server);
  }
  throw TimeoutException("whois: connect to whois server (" + server + ") timed out", server);
}
