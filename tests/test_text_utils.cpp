#include <catch2/catch_test_macros.hpp>

#include "speech_guard/utils/text.hpp"

#include <chrono>
#include <string>

TEST_CASE("to_lower and trim normalize header values") {
    REQUIRE(speech_guard::utils::to_lower("Audio/WEBM") == "audio/webm");
    REQUIRE(speech_guard::utils::trim("  \tvalue \n") == "value");
    REQUIRE(speech_guard::utils::trim("   ").empty());
}

TEST_CASE("mime_essence drops parameters and case") {
    REQUIRE(speech_guard::utils::mime_essence("Audio/WebM; codecs=opus") == "audio/webm");
    REQUIRE(speech_guard::utils::mime_essence(" audio/wav ") == "audio/wav");
    REQUIRE(speech_guard::utils::mime_essence("").empty());
}

TEST_CASE("random_hex_id produces lowercase hex of the requested length") {
    const auto id = speech_guard::utils::random_hex_id();
    REQUIRE(id.size() == 32);
    REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(speech_guard::utils::random_hex_id(8).size() == 8);
    REQUIRE(speech_guard::utils::random_hex_id() != id);
}

TEST_CASE("iso8601_utc renders milliseconds and a Z suffix") {
    const auto time = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(1700000000123LL));
    REQUIRE(speech_guard::utils::iso8601_utc(time) == "2023-11-14T22:13:20.123Z");
}
