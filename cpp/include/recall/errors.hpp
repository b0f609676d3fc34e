#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace recall {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A command was issued in a state that does not accept it. Nothing changed.
class InvalidTransition : public Error {
public:
  InvalidTransition(std::string command, std::string state)
      : Error("Invalid transition: '" + command + "' not accepted while " + state),
        command_(std::move(command)),
        state_(std::move(state)) {}

  const std::string& command() const noexcept { return command_; }
  const std::string& state() const noexcept { return state_; }

private:
  std::string command_;
  std::string state_;
};

class InvalidSubmissionShape : public Error {
public:
  InvalidSubmissionShape(const std::string& variant, const std::string& detail)
      : Error("Invalid submission for " + variant + ": " + detail), variant_(variant) {}

  const std::string& variant() const noexcept { return variant_; }

private:
  std::string variant_;
};

class StorageError : public Error {
public:
  using Error::Error;
};

class ConflictError : public Error {
public:
  ConflictError(std::string session_id, std::uint64_t expected_version,
                std::uint64_t stored_version)
      : Error("Session '" + session_id + "' was modified externally (expected version " +
              std::to_string(expected_version) + ", stored " + std::to_string(stored_version) +
              ")"),
        session_id_(std::move(session_id)),
        expected_version_(expected_version),
        stored_version_(stored_version) {}

  const std::string& session_id() const noexcept { return session_id_; }
  std::uint64_t expected_version() const noexcept { return expected_version_; }
  std::uint64_t stored_version() const noexcept { return stored_version_; }

private:
  std::string session_id_;
  std::uint64_t expected_version_;
  std::uint64_t stored_version_;
};

} // namespace recall
