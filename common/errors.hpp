#pragma once

// ============================================================
// errors.hpp -- Exception types for the three failure classes
//
//   SetupError     -- bad arguments, unreadable input, bind/listen
//   ProtocolError  -- the client did not send a usable GET request
//   TransportError -- read/write failure once the response started
//
// All of them are terminal for the process; main() reports and
// exits with status 1.
// ============================================================

#include <stdexcept>
#include <string>

class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& msg) : std::runtime_error(msg) {}
};

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg) : std::runtime_error(msg) {}
};
