/**
 * @file errors.hpp
 * @brief Exception types and link status codes shared by every fixturelink layer.
 *
 * @details
 * Two families of failure exist in this library:
 *
 * - **Programming / startup errors** are thrown. A value that does not fit its
 *   field, a byte blob of the wrong size, a malformed channel configuration or
 *   two message types sharing one type code are bugs in the caller or in the
 *   deployment. They fail fast and are never retried.
 *
 * - **Runtime link outcomes** are returned. Timeouts, failed handshakes and
 *   faulted channels are normal events on a test bench, so the transport path
 *   reports them through small enums (`LinkStatus`, `IoStatus`) and never
 *   throws.
 *
 * Framing errors (false sync, bad length, bad checksum) belong to neither
 * family: the synchronizer recovers from them in place and only counts them.
 */
#ifndef FIXTURELINK_ERRORS_HPP
#define FIXTURELINK_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fixturelink {

/// Base of every exception thrown by fixturelink.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// A value overflowed its field, or the value list does not match the descriptor.
class EncodingError : public Error {
public:
  explicit EncodingError(const std::string& what) : Error("encoding: " + what) {}
};

/// A byte blob does not have the exact size a descriptor expects.
class DecodingError : public Error {
public:
  explicit DecodingError(const std::string& what) : Error("decoding: " + what) {}
};

/// Channel configuration is missing a key, has a wrong type, or is inconsistent.
class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& what) : Error("config: " + what) {}
};

/// Two descriptors were registered under the same type code.
class RegistryError : public Error {
public:
  explicit RegistryError(const std::string& what) : Error("registry: " + what) {}
};

/**
 * @brief Outcome of a Connection Manager operation.
 *
 * `Timeout` leaves the channel Connected; `ConnectFailed`, `Faulted` and
 * `IoError` mean the channel is (or just became) Faulted.
 */
enum class LinkStatus : uint8_t {
  Ok = 0,
  Timeout,
  ConnectFailed,
  NotConnected,
  Faulted,
  IoError,
  Cancelled,
};

/// Outcome of a Stream Buffer fill/peek/read.
enum class IoStatus : uint8_t {
  Ok = 0,
  Timeout,
  Cancelled,
  Error,
};

const char* to_string(LinkStatus s);
const char* to_string(IoStatus s);

} // namespace fixturelink

#endif // FIXTURELINK_ERRORS_HPP
