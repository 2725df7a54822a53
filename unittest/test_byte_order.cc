#include <doctest/doctest.h>
#include <pngme/byte_order.hh>

#include <array>
#include <cstdint>

using namespace pngme;

TEST_SUITE("BYTE_ORDER") {
    TEST_CASE("swap32") {
        CHECK(swap32(0x11223344u) == 0x44332211u);
        CHECK(swap_byte_order<std::uint32_t>(0xABD1D84Eu) == 0x4ED8D1ABu);
        CHECK(swap32(swap32(0xDEADBEEFu)) == 0xDEADBEEFu);
    }

    TEST_CASE("exactly one byte order is native") {
        CHECK(byte_order_native(byte_order::big) != byte_order_native(byte_order::little));
        CHECK(byte_order_native(byte_order::big) == is_big_endian);
    }

    TEST_CASE("store_be32 writes network order") {
        std::array<std::byte, 4> out{};
        store_be32(out.data(), 2882656334u);
        CHECK(out[0] == std::byte(0xAB));
        CHECK(out[1] == std::byte(0xD1));
        CHECK(out[2] == std::byte(0xD8));
        CHECK(out[3] == std::byte(0x4E));
    }

    TEST_CASE("load reads back what store wrote") {
        std::array<std::byte, 4> buf{};
        store<std::uint32_t>(buf.data(), 42u, byte_order::big);
        CHECK(buf[3] == std::byte(42));
        CHECK(load<std::uint32_t>(buf.data(), byte_order::big) == 42u);

        store<std::uint32_t>(buf.data(), 42u, byte_order::little);
        CHECK(buf[0] == std::byte(42));
        CHECK(load<std::uint32_t>(buf.data(), byte_order::little) == 42u);
    }
}
