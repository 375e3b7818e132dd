#pragma once

#include "uhi/PipelineError.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace uhi {

// A value that is computed on first use and then memoized.
//
// Copies share the same state, so a downstream stage can capture its upstream
// Deferred by value and the upstream computation still runs at most once. A
// failed computation memoizes its error as well.
template <typename T>
class Deferred {
public:
  using ComputeFn = std::function<bool(T& out, PipelineError& err)>;

  Deferred() = default;

  explicit Deferred(ComputeFn fn) : m_state(std::make_shared<State>())
  {
    m_state->fn = std::move(fn);
  }

  // Run the computation if it has not run yet. On failure err receives the
  // (memoized) error.
  bool evaluate(PipelineError& err) const
  {
    if (!m_state) {
      return err.set(PipelineErrorKind::InvalidInput, "pipeline", "stage was never defined");
    }
    State& s = *m_state;
    if (!s.done) {
      if (s.running) {
        return err.set(PipelineErrorKind::InvalidInput, "pipeline", "stage depends on itself");
      }
      s.running = true;
      PipelineError e;
      T v{};
      s.ok = s.fn(v, e);
      s.running = false;
      s.done = true;
      if (s.ok) {
        s.value = std::move(v);
      } else {
        s.error = std::move(e);
      }
      s.fn = nullptr; // drop captured upstream state
    }
    if (!s.ok) {
      err = s.error;
      return false;
    }
    return true;
  }

  // Only meaningful after evaluate() returned true.
  const T& value() const { return m_state->value; }

  bool defined() const { return m_state != nullptr; }
  bool evaluated() const { return m_state && m_state->done; }

private:
  struct State {
    ComputeFn fn;
    bool running = false;
    bool done = false;
    bool ok = false;
    T value{};
    PipelineError error;
  };

  std::shared_ptr<State> m_state;
};

} // namespace uhi
