#pragma once
#include <new>
#include "src/libs/traits/Traits.h"

namespace preempt {

// A stand-in for the void type, but easier to match in templates
struct Unit {};

[[noreturn]] void panic(const char* reason);

// Holds either a Value or an ErrorType.  This is how fallible
// operations report failure; unrecoverable conditions panic instead.
template <typename Value, typename ErrorType>
class Result {
  enum class State { kEMPTY, kVALUE, kERROR };

  struct ErrorConstruct {};

 public:
  using value_type = Value;
  using error_type = ErrorType;

  Result() : state_(State::kEMPTY) {}
  ~Result() {
    reset();
  }

  // Default construct a successful Value result
  inline static Result Ok() {
    return Result(Value());
  }

  // Copy in a successful Value result
  inline static Result Ok(const Value& value) {
    return Result(value);
  }

  // Move in a successful Value result
  inline static Result Ok(Value&& value) {
    return Result(move(value));
  }

  // Copy in an error result
  inline static Result Error(const ErrorType& error) {
    return Result(error, ErrorConstruct{});
  }

  // Move construct an error result
  inline static Result Error(ErrorType&& error) {
    return Result(move(error), ErrorConstruct{});
  }

  // Copy a value into the result
  explicit Result(const Value& other) : state_(State::kVALUE) {
    new (&value_) Value(other);
  }

  // Move in value
  explicit Result(Value&& other) : state_(State::kVALUE) {
    new (&value_) Value(move(other));
  }

  // Copy in error
  Result(const ErrorType& error, ErrorConstruct) : state_(State::kERROR) {
    new (&error_) ErrorType(error);
  }

  // Move in error
  Result(ErrorType&& error, ErrorConstruct) : state_(State::kERROR) {
    new (&error_) ErrorType(move(error));
  }

  // Move construct; other is left empty
  Result(Result&& other) noexcept : state_(State::kEMPTY) {
    moveFrom(move(other));
  }

  // Move assign; other is left empty
  Result& operator=(Result&& other) noexcept {
    if (&other != this) {
      reset();
      moveFrom(move(other));
    }
    return *this;
  }

  // Copy construct
  Result(const Result& other) : state_(State::kEMPTY) {
    copyFrom(other);
  }

  // Copy assign
  Result& operator=(const Result& other) {
    if (&other != this) {
      reset();
      copyFrom(other);
    }
    return *this;
  }

  bool hasValue() const {
    return state_ == State::kVALUE;
  }

  bool hasError() const {
    return state_ == State::kERROR;
  }

  bool empty() const {
    return state_ == State::kEMPTY;
  }

  // If Result does not contain a valid Value, panic
  void panicIfError() const {
    switch (state_) {
      case State::kVALUE:
        return;
      case State::kEMPTY:
        panic("Uninitialized Result");
      case State::kERROR:
        panic("Result holds Error, not Value");
    }
  }

  // Get a mutable reference to the value.  If the value is
  // not assigned, a panic will be issued by panicIfError().
  Value& value() & {
    panicIfError();
    return value_;
  }

  // Move the value out of an expiring result.  If the value is
  // not assigned, a panic will be issued by panicIfError().
  Value&& value() && {
    panicIfError();
    return move(value_);
  }

  // Get a const reference to the value.  If the value is
  // not assigned, a panic will be issued by panicIfError().
  const Value& value() const & {
    panicIfError();
    return value_;
  }

  // Returns the value, or fallback when holding an error
  Value valueOr(const Value& fallback) const {
    return hasValue() ? value_ : fallback;
  }

  // If Result does not contain an Error, panic
  void panicIfNotError() const {
    switch (state_) {
      case State::kVALUE:
        panic("Result holds Value, not Error");
      case State::kEMPTY:
        panic("Uninitialized Result");
      case State::kERROR:
        return;
    }
  }

  // Get a mutable reference to the error.  If the error is
  // not assigned, a panic will be issued by panicIfNotError().
  ErrorType& error() & {
    panicIfNotError();
    return error_;
  }

  // Get a const reference to the error.  If the error is
  // not assigned, a panic will be issued by panicIfNotError().
  const ErrorType& error() const & {
    panicIfNotError();
    return error_;
  }

 private:
  void reset() {
    switch (state_) {
      case State::kEMPTY:
        break;
      case State::kVALUE:
        value_.~Value();
        break;
      case State::kERROR:
        error_.~ErrorType();
        break;
    }
    state_ = State::kEMPTY;
  }

  void moveFrom(Result&& other) {
    switch (other.state_) {
      case State::kEMPTY:
        break;
      case State::kVALUE:
        new (&value_) Value(move(other.value_));
        break;
      case State::kERROR:
        new (&error_) ErrorType(move(other.error_));
        break;
    }
    state_ = other.state_;
    other.reset();
  }

  void copyFrom(const Result& other) {
    switch (other.state_) {
      case State::kEMPTY:
        break;
      case State::kVALUE:
        new (&value_) Value(other.value_);
        break;
      case State::kERROR:
        new (&error_) ErrorType(other.error_);
        break;
    }
    state_ = other.state_;
  }

  State state_;
  union {
    Value value_;
    ErrorType error_;
  };
};
}
