#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-level transport interface every link adapter implements.
 *
 * Serial ports and UDP sockets look the same from here up: an opaque duplex
 * byte pipe. Framing never happens at this level; a datagram is just a burst
 * of bytes that lands in the Stream Buffer like any serial chunk.
 */

#include <cstddef>
#include <cstdint>

namespace fixturelink::transport {

// Same outcome codes on every adapter; transports never throw.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief Transport trait every adapter can rely on.
 *
 * Contract:
 *  - begin() opens the port/socket; false on failure. end() closes it; safe to repeat.
 *  - recv(buf,cap,n,timeout_ms) waits at most timeout_ms for data and pulls up
 *    to cap bytes. Ok means n>0, None means nothing arrived in time, Error is a
 *    broken link.
 *  - send(buf,len) writes all of len or returns Busy/Error.
 *  - flush_input() drops whatever is already waiting on the inbound side.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool      begin() = 0;
  virtual void      end() = 0;
  virtual bool      is_open() const = 0;
  virtual RxResult  recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual TxResult  send(const uint8_t* data, std::size_t len) = 0;
  virtual void      flush_input() = 0;
  virtual const char* name() const = 0;
};

const char* to_string(TxResult r);
const char* to_string(RxResult r);

} // namespace fixturelink::transport
