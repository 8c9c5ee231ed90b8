// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <utility>

namespace profship {

/// Runs the callable when leaving the scope
template <class F> class ScopeExit {
public:
  explicit ScopeExit(F &&f) : _f(std::forward<F>(f)) {}
  ~ScopeExit() {
    if (_active) {
      _f();
    }
  }

  ScopeExit(ScopeExit &&other) noexcept
      : _f(std::move(other._f)), _active(other._active) {
    other._active = false;
  }
  ScopeExit(const ScopeExit &) = delete;
  ScopeExit &operator=(const ScopeExit &) = delete;
  ScopeExit &operator=(ScopeExit &&) = delete;

private:
  F _f;
  bool _active{true};
};

} // namespace profship

namespace details {

struct DeferDummy {};

template <class F> profship::ScopeExit<F> operator*(DeferDummy, F &&f) {
  return profship::ScopeExit<F>{std::forward<F>(f)};
}

} // namespace details

#define DEFER_(LINE) zz_defer##LINE
#define DEFER(LINE) DEFER_(LINE)
#define defer                                                                  \
  [[maybe_unused]] const auto &DEFER(__COUNTER__) =                            \
      ::details::DeferDummy{} *[&]()
