#pragma once

/// @file chronoid/compiler/thread_local.hpp
/// @brief @copybrief compiler::ThreadLocal

#include <type_traits>
#include <utility>

CHRONOID_NAMESPACE_BEGIN

namespace compiler {

/// @brief Pointer-like handle to the current thread's instance of a
/// compiler::ThreadLocal variable.
///
/// Must not outlive the function scope it was obtained in and must not be
/// passed to other threads.
template <typename VariableType>
class ThreadLocalScope final {
 public:
  explicit ThreadLocalScope(VariableType& variable) noexcept
      : variable_(variable) {}

  ThreadLocalScope(ThreadLocalScope&&) = delete;
  ThreadLocalScope& operator=(ThreadLocalScope&&) = delete;

  VariableType& operator*() noexcept { return variable_; }
  VariableType* operator->() noexcept { return &variable_; }

 private:
  VariableType& variable_;
};

/// @brief Thread-local variable that is created on first use in each thread
/// by calling `factory`.
///
/// @code
/// compiler::ThreadLocal local_buffer = [] { return std::string{}; };
///
/// void Foo() {
///   auto buffer = local_buffer.Use();
///   buffer->clear();
/// }
/// @endcode
///
/// `Factory` must be a captureless lambda: every lambda has a unique type, so
/// each ThreadLocal definition gets its own storage.
template <typename Factory>
class ThreadLocal final {
 public:
  using VariableType = std::invoke_result_t<const Factory&>;

  constexpr /*implicit*/ ThreadLocal(Factory factory) noexcept(
      std::is_nothrow_move_constructible_v<Factory>)
      : factory_(std::move(factory)) {}

  ThreadLocal(const ThreadLocal&) = delete;
  ThreadLocal& operator=(const ThreadLocal&) = delete;

  ThreadLocalScope<VariableType> Use() {
    return ThreadLocalScope<VariableType>(GetVariable());
  }

 private:
  VariableType& GetVariable() const {
    // If the factory throws, the variable stays uninitialized and the next
    // Use() on this thread calls the factory again.
    thread_local VariableType variable = factory_();
    return variable;
  }

  Factory factory_;
};

}  // namespace compiler

CHRONOID_NAMESPACE_END
