/**
 * @file zm_api.hpp
 * @brief zm interpreter C++ API wrapper
 */

#pragma once

#include "zm/zm_api.h"

namespace zm
{

/**
 * @brief Owning handle for a Machine
 *
 * Move-only; the interpreter is destroyed with the handle.
 */
class Interpreter
{
public:
  Interpreter() = default;
  ~Interpreter()
  {
    zm_destroy(vm_);
  }

  Interpreter(const Interpreter &) = delete;
  Interpreter &operator=(const Interpreter &) = delete;

  Interpreter(Interpreter &&other) noexcept : vm_(other.vm_)
  {
    other.vm_ = nullptr;
  }

  Interpreter &operator=(Interpreter &&other) noexcept
  {
    if (this != &other)
    {
      zm_destroy(vm_);
      vm_ = other.vm_;
      other.vm_ = nullptr;
    }
    return *this;
  }

  /**
   * @brief Create the interpreter, replacing any previous one
   * @return 0 on success, negative error code on failure
   */
  zm_err create(const ZmConfig &cfg)
  {
    zm_destroy(vm_);
    vm_ = nullptr;
    return zm_create(&cfg, &vm_);
  }

  zm_err step()
  {
    return zm_step(vm_);
  }

  zm_err run()
  {
    return zm_run(vm_);
  }

  Machine *get() const
  {
    return vm_;
  }

  explicit operator bool() const
  {
    return vm_ != nullptr;
  }

private:
  Machine *vm_ = nullptr;
};

}  // namespace zm
