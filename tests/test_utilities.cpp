#include <catch2/catch_test_macros.hpp>

#include "utilities.hpp"

TEST_CASE("natural_size", "[utilities]") {
    REQUIRE(natural_size(0) == "0 Bytes");
    REQUIRE(natural_size(1) == "1 Byte");
    REQUIRE(natural_size(999) == "999 Bytes");
    REQUIRE(natural_size(1000) == "1.0 kB");
    REQUIRE(natural_size(8864) == "8.9 kB");
    REQUIRE(natural_size(3'000'000) == "3.0 MB");
    REQUIRE(natural_size(1'500'000'000) == "1.5 GB");
}

TEST_CASE("trim", "[utilities]") {
    REQUIRE(trim("  hello world \n") == "hello world");
    REQUIRE(trim("\t\r\n ") == "");
    REQUIRE(trim("") == "");
    REQUIRE(trim("x") == "x");
}
