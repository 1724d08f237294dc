#pragma once

#include <QTimer>

#include <functional>

namespace photoreel {

/// A deferred callback with a uniform "is a call pending" query.
class Debouncer {
 public:
  using Callback = std::function<void()>;

  virtual ~Debouncer()                  = default;
  virtual void Trigger()                = 0;
  virtual auto IsPending() const -> bool = 0;
  virtual void Cancel()                 = 0;
};

/**
 * @brief Collapses bursts of Trigger() into a single call on the next frame.
 *
 * A trigger while a call is pending is absorbed; the pending call is not moved.
 */
class FrameCoalescer final : public Debouncer {
 public:
  FrameCoalescer(int frame_interval_ms, Callback callback);

  void Trigger() override;
  auto IsPending() const -> bool override { return timer_.isActive(); }
  void Cancel() override { timer_.stop(); }

 private:
  QTimer   timer_;
  Callback callback_;
};

/**
 * @brief Fires once after Trigger() has not been called for the quiet interval.
 */
class TrailingDebouncer final : public Debouncer {
 public:
  TrailingDebouncer(int quiet_ms, Callback callback);

  void Trigger() override;
  auto IsPending() const -> bool override { return timer_.isActive(); }
  void Cancel() override { timer_.stop(); }

 private:
  QTimer   timer_;
  Callback callback_;
};
};  // namespace photoreel
