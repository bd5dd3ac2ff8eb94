#pragma once

#include <exception>
#include <stdexcept>
#include <string>

class CamBridgeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid or missing camera configuration; fails camera construction.
class ConfigurationError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

class AddressResolutionError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

class PortAllocationError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

class ProcessSpawnError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

class ProcessRuntimeError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

class SnapshotError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

// Request arrived for a session in the wrong state.
class SessionStateError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

class StreamLimitError : public CamBridgeError {
public:
  using CamBridgeError::CamBridgeError;
};

// what() of the held exception, "" for a null pointer (success).
std::string error_message(const std::exception_ptr &error);
