/**
 * @file PortScanner_uTest.cpp
 * @brief Unit tests for kindling::net port discovery.
 *
 * Notes:
 *  - BindPortScanner tests bind an ephemeral loopback port to create a known
 *    occupied port; they do not assume any particular port is free.
 */

#include "src/net/inc/PortScanner.hpp"
#include "src/net/utst/FakeNet.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using kindling::net::BindPortScanner;
using kindling::net::findAvailablePort;
using kindling::net::testing::FakePortScanner;

/* ----------------------------- findAvailablePort ----------------------------- */

/** @test First free port in range is returned. */
TEST(PortScannerTest, FindsFirstFree) {
  FakePortScanner scanner;
  scanner.taken = {6000, 6001};
  const auto PORT = findAvailablePort(scanner, 6000, 6100);
  ASSERT_TRUE(PORT.has_value());
  EXPECT_EQ(*PORT, 6002);
  EXPECT_EQ(scanner.probes, 3U);
}

/** @test Range bounds are inclusive. */
TEST(PortScannerTest, InclusiveUpperBound) {
  FakePortScanner scanner;
  for (std::uint16_t p = 6000; p < 6100; ++p) {
    scanner.taken.insert(p);
  }
  const auto PORT = findAvailablePort(scanner, 6000, 6100);
  ASSERT_TRUE(PORT.has_value());
  EXPECT_EQ(*PORT, 6100);
}

/** @test Exhausted range yields nullopt. */
TEST(PortScannerTest, ExhaustedRange) {
  FakePortScanner scanner;
  for (std::uint16_t p = 6000; p <= 6010; ++p) {
    scanner.taken.insert(p);
  }
  EXPECT_FALSE(findAvailablePort(scanner, 6000, 6010).has_value());
  EXPECT_EQ(scanner.probes, 11U);
}

/** @test Range ending at 65535 terminates. */
TEST(PortScannerTest, TopOfPortSpace) {
  FakePortScanner scanner;
  scanner.taken = {65534, 65535};
  EXPECT_FALSE(findAvailablePort(scanner, 65534, 65535).has_value());
}

/* ----------------------------- BindPortScanner ----------------------------- */

/** @test A port held by a listening socket is reported unavailable. */
TEST(PortScannerTest, BindDetectsOccupiedPort) {
  const int SOCK = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(SOCK, 0);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = 0;
  ASSERT_EQ(::bind(SOCK, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  ASSERT_EQ(::listen(SOCK, 1), 0);

  socklen_t len = sizeof(addr);
  ASSERT_EQ(::getsockname(SOCK, reinterpret_cast<sockaddr*>(&addr), &len), 0);
  const std::uint16_t PORT = ntohs(addr.sin_port);

  BindPortScanner scanner;
  EXPECT_FALSE(scanner.isPortAvailable(PORT));
  ::close(SOCK);
}
