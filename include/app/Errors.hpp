#pragma once
#include <stdexcept>

namespace memfo::app {

// A snapshot whose mono_s does not strictly exceed the newest stored one
struct OutOfOrderError : public std::runtime_error { using std::runtime_error::runtime_error; };

// earliest()/latest() on a store with no snapshots yet
struct EmptyHistoryError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace memfo::app
