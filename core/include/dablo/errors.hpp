#pragma once
#include <stdexcept>
#include <string>

namespace dablo {

// Malformed board definition. Raised while a BoardGraph is being built.
class TopologyError : public std::runtime_error {
public:
  explicit TopologyError(const std::string& what) : std::runtime_error(what) {}
};

// A move that is not a member of Rules::legal_moves for the state it was applied to.
class IllegalMoveError : public std::runtime_error {
public:
  explicit IllegalMoveError(const std::string& what) : std::runtime_error(what) {}
};

// Caller bug: move selection without legal moves, or a move on a finished game.
class PreconditionError : public std::logic_error {
public:
  explicit PreconditionError(const std::string& what) : std::logic_error(what) {}
};

class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace dablo
