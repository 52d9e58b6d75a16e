#pragma once

#include <stdexcept>
#include <string>

// Base for every failure raised by the streaming core
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

// Peer closed the connection, or the socket failed mid-read/write.
// Terminal for the session.
class ConnectionClosed : public StreamError {
public:
    explicit ConnectionClosed(const std::string& what) : StreamError(what) {}
};

// A message could not be decoded; the message is dropped, the stage continues
class MalformedMessage : public StreamError {
public:
    explicit MalformedMessage(const std::string& what) : StreamError(what) {}
};

// encode/decode failed for one chunk; the chunk is skipped
class TransformFailure : public StreamError {
public:
    explicit TransformFailure(const std::string& what) : StreamError(what) {}
};

// Could not bind, listen or dial at session start
class BindOrConnectFailure : public StreamError {
public:
    explicit BindOrConnectFailure(const std::string& what) : StreamError(what) {}
};

// Framing or handshake problem the stream cannot recover from
class ProtocolViolation : public StreamError {
public:
    explicit ProtocolViolation(const std::string& what) : StreamError(what) {}
};
