#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "fixturelink/transport/transport_linux_serial.hpp"
#include "fixturelink/transport/transport_memory.hpp"
#include "fixturelink/transport/transport_udp.hpp"

using namespace fixturelink::transport;

TEST_CASE("UDP sockets on loopback exchange datagrams") {
    UdpConfig a_cfg;
    a_cfg.host = "127.0.0.1";
    a_cfg.port = 47812;
    a_cfg.local_port = 47811;
    UdpConfig b_cfg;
    b_cfg.host = "127.0.0.1";
    b_cfg.port = 47811;
    b_cfg.local_port = 47812;

    UdpSocket a(a_cfg), b(b_cfg);
    REQUIRE(a.begin());
    REQUIRE(b.begin());

    const std::string hello = "connect";
    CHECK(a.send(reinterpret_cast<const uint8_t*>(hello.data()), hello.size()) == TxResult::Ok);

    uint8_t buf[64];
    size_t n = 0;
    REQUIRE(b.recv(buf, sizeof buf, n, 500) == RxResult::Ok);
    CHECK(std::string(reinterpret_cast<char*>(buf), n) == hello);

    CHECK(b.recv(buf, sizeof buf, n, 20) == RxResult::None);

    CHECK(a.send(reinterpret_cast<const uint8_t*>(hello.data()), hello.size()) == TxResult::Ok);
    CHECK(a.send(reinterpret_cast<const uint8_t*>(hello.data()), hello.size()) == TxResult::Ok);
    b.flush_input();
    CHECK(b.recv(buf, sizeof buf, n, 20) == RxResult::None);

    a.end();
    CHECK_FALSE(a.is_open());
    CHECK(a.recv(buf, sizeof buf, n, 0) == RxResult::Error);
}

TEST_CASE("A UDP datagram larger than the read buffer is dropped whole") {
    UdpConfig a_cfg;
    a_cfg.host = "127.0.0.1";
    a_cfg.port = 47814;
    a_cfg.local_port = 47813;
    UdpConfig b_cfg;
    b_cfg.host = "127.0.0.1";
    b_cfg.port = 47813;
    b_cfg.local_port = 47814;

    UdpSocket a(a_cfg), b(b_cfg);
    REQUIRE(a.begin());
    REQUIRE(b.begin());

    const std::vector<uint8_t> big(5000, 0x5A);
    const std::vector<uint8_t> small{1, 2, 3};
    CHECK(a.send(big.data(), big.size()) == TxResult::Ok);
    CHECK(a.send(small.data(), small.size()) == TxResult::Ok);

    uint8_t buf[4096];
    size_t n = 0;
    CHECK(b.recv(buf, sizeof buf, n, 500) == RxResult::None);
    CHECK(n == 0);
    REQUIRE(b.recv(buf, sizeof buf, n, 500) == RxResult::Ok);
    CHECK(n == 3);
    CHECK(buf[2] == 3);
}

TEST_CASE("UDP begin fails on an unresolvable host") {
    UdpConfig cfg;
    cfg.host = "no-such-host.invalid";
    UdpSocket s(cfg);
    CHECK_FALSE(s.begin());
    CHECK_FALSE(s.is_open());
}

TEST_CASE("Serial begin refuses what it cannot configure") {
    SerialConfig cfg;
    cfg.path = "/dev/null";           // opens, but is not a tty
    LinuxSerial not_a_tty(cfg);
    CHECK_FALSE(not_a_tty.begin());
    CHECK_FALSE(not_a_tty.is_open());

    cfg.baud = 12345;
    LinuxSerial odd_baud(cfg);
    CHECK_FALSE(odd_baud.begin());

    SerialConfig none;
    LinuxSerial no_path(none);
    CHECK_FALSE(no_path.begin());
}

TEST_CASE("Memory transport honours the read chunk limit") {
    MemoryTransport m(2);
    REQUIRE(m.begin());
    const uint8_t data[] = {1, 2, 3};
    m.feed(data, sizeof data);

    uint8_t buf[8];
    size_t n = 0;
    REQUIRE(m.recv(buf, sizeof buf, n, 0) == RxResult::Ok);
    CHECK(n == 2);
    REQUIRE(m.recv(buf, sizeof buf, n, 0) == RxResult::Ok);
    CHECK(n == 1);
    CHECK(m.recv(buf, sizeof buf, n, 0) == RxResult::None);
    CHECK(std::string(to_string(RxResult::None)) == "none");
}
