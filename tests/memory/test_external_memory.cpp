#include <catch2/catch_test_macros.hpp>

#include <tgpu/memory/external_memory.hpp>

using namespace tgpu;

TEST_CASE("ExternalMemory: host backdoor access", "[memory][external]") {
    ExternalMemory mem(8, 8, 2);

    REQUIRE(mem.get_capacity() == 256);
    REQUIRE(mem.get_channel_count() == 2);

    mem.write(10, 42);
    REQUIRE(mem.read(10) == 42);

    mem.write(11, 0x1AB);                    // masked to the data width
    REQUIRE(mem.read(11) == 0xAB);

    mem.load(100, {1, 2, 3});
    REQUIRE(mem.dump(100, 3) == std::vector<Word>{1, 2, 3});

    REQUIRE_THROWS_AS(mem.read(256), std::out_of_range);
    REQUIRE_THROWS_AS(mem.write(256, 1), std::out_of_range);
    REQUIRE_THROWS_AS(mem.load(254, {1, 2, 3}), std::out_of_range);
    REQUIRE_THROWS_AS(mem.dump(250, 10), std::out_of_range);

    mem.clear();
    REQUIRE(mem.read(10) == 0);
}

TEST_CASE("ExternalMemory: read handshake honours latency", "[memory][external][handshake]") {
    ExternalMemory mem(8, 8, 1, 3);
    mem.write(5, 77);

    MemoryChannel& ch = mem.channels()[0];
    ch.read_valid = true;
    ch.read_address = 5;

    mem.update(1);
    REQUIRE_FALSE(ch.read_ready);
    mem.update(2);
    REQUIRE_FALSE(ch.read_ready);
    REQUIRE_FALSE(mem.is_ready());
    REQUIRE(mem.get_last_access_cycle() == 0);
    mem.update(3);
    REQUIRE(ch.read_ready);
    REQUIRE(ch.read_data == 77);
    REQUIRE(mem.get_reads_served() == 1);
    REQUIRE(mem.get_last_access_cycle() == 3);

    // Holding valid does not repeat the access
    mem.update(4);
    mem.update(5);
    REQUIRE(ch.read_ready);
    REQUIRE(mem.get_reads_served() == 1);
    REQUIRE(mem.get_last_access_cycle() == 3);

    ch.read_valid = false;
    mem.update(6);
    REQUIRE_FALSE(ch.read_ready);
    REQUIRE(mem.is_ready());
}

TEST_CASE("ExternalMemory: write handshake", "[memory][external][handshake]") {
    ExternalMemory mem(8, 8, 2, 1);

    MemoryChannel& ch = mem.channels()[1];
    ch.write_valid = true;
    ch.write_address = 20;
    ch.write_data = 9;

    mem.update(1);
    REQUIRE(ch.write_ready);
    REQUIRE(mem.read(20) == 9);
    REQUIRE(mem.get_writes_served() == 1);

    ch.write_valid = false;
    mem.update(2);
    REQUIRE_FALSE(ch.write_ready);
}

TEST_CASE("ExternalMemory: read-only memory ignores writes", "[memory][external]") {
    ExternalMemory rom(8, 16, 1, 1, false);
    rom.write(0, 0xF000);                    // host backdoor still works

    MemoryChannel& ch = rom.channels()[0];
    ch.write_valid = true;
    ch.write_address = 0;
    ch.write_data = 0x1234;
    rom.update(1);

    REQUIRE_FALSE(ch.write_ready);
    REQUIRE(rom.read(0) == 0xF000);
}

TEST_CASE("ExternalMemory: addresses wrap to the address width", "[memory][external]") {
    ExternalMemory mem(4, 8, 1, 1);
    mem.write(3, 55);

    MemoryChannel& ch = mem.channels()[0];
    ch.read_valid = true;
    ch.read_address = 0x13;                  // 19 wraps to 3
    mem.update(1);
    REQUIRE(ch.read_data == 55);
}

TEST_CASE("ExternalMemory: reset clears handshakes and keeps contents", "[memory][external][reset]") {
    ExternalMemory mem(8, 8, 1, 1);
    mem.write(1, 11);
    mem.channels()[0].read_valid = true;
    mem.channels()[0].read_address = 1;
    mem.update(1);
    REQUIRE(mem.channels()[0].read_ready);

    REQUIRE(mem.get_last_access_cycle() == 1);

    mem.reset();
    REQUIRE(mem.get_last_access_cycle() == 0);
    REQUIRE_FALSE(mem.channels()[0].read_valid);
    REQUIRE_FALSE(mem.channels()[0].read_ready);
    REQUIRE(mem.get_reads_served() == 0);
    REQUIRE(mem.read(1) == 11);
}

TEST_CASE("ExternalMemory: invalid geometry", "[memory][external]") {
    REQUIRE_THROWS_AS(ExternalMemory(0, 8, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(ExternalMemory(8, 0, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(ExternalMemory(8, 8, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(ExternalMemory(8, 8, 1, 0), std::invalid_argument);
}
