#include <catch2/catch_test_macros.hpp>
#include "sync/note_codec.hpp"

#include <string>

using namespace vellum;
using namespace vellum::sync;

namespace {

Note sample() {
    return Note{
        .id = "n1",
        .title = "Hi",
        .body = "world\nwith \"quotes\" and unicode \xC3\xA9",
        .created_at = Timestamp(1700000000000),
        .modified_at = Timestamp(1700000000123),
        .version = 4,
        .deleted = false
    };
}

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("Encoded notes decode to the same note", "[unit][codec]") {
    const auto note = sample();
    const auto payload = encode_note(note);

    auto decoded = decode_note(payload.span(), note.id);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == note);
}

TEST_CASE("Encoding is compact and key-sorted", "[unit][codec]") {
    Note note = sample();
    note.body = "world";

    const auto payload = encode_note(note);
    const std::string json(payload.bytes().begin(), payload.bytes().end());
    REQUIRE(json ==
            R"({"body":"world","created":1700000000000,"modified":1700000000123,"title":"Hi","v":2,"version":4})");
    REQUIRE(encode_note(note) == payload);
}

TEST_CASE("The payload leaves the id and tombstone to the envelope", "[unit][codec]") {
    Note note = sample();
    note.id = "secret-id";
    note.deleted = true;
    const auto payload = encode_note(note);
    const std::string json(payload.bytes().begin(), payload.bytes().end());
    REQUIRE(json.find("secret-id") == std::string::npos);
    REQUIRE(json.find("deleted") == std::string::npos);

    auto decoded = decode_note(payload.span(), "other");
    REQUIRE(decoded.unwrap().id == "other");
    REQUIRE_FALSE(decoded.unwrap().deleted);
}

TEST_CASE("Version 1 payloads take created from modified", "[unit][codec]") {
    const auto payload = bytes(R"({"v":1,"title":"Old","body":"note","modified":42,"version":3})");
    auto decoded = decode_note(payload, "legacy");
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().created_at == Timestamp(42));
    REQUIRE(decoded.unwrap().modified_at == Timestamp(42));
    REQUIRE(decoded.unwrap().version == 3);
}

TEST_CASE("Malformed payloads fail with Format", "[unit][codec]") {
    const auto expect_format = [](const std::string& json, const std::string& fragment) {
        auto result = decode_note(bytes(json), "n1");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::Format));
        REQUIRE(result.unwrap_err().message.find("n1") != std::string::npos);
        REQUIRE(result.unwrap_err().message.find(fragment) != std::string::npos);
    };

    SECTION("Not JSON") {
        expect_format("\x01\x02garbage", "not a JSON object");
        expect_format("[1,2,3]", "not a JSON object");
        expect_format("", "not a JSON object");
    }

    SECTION("Missing or newer codec version") {
        expect_format(R"({"title":"a","body":"b","modified":1,"version":1})", "codec version");
        expect_format(R"({"v":3,"title":"a","body":"b","modified":1,"version":1,"created":1})",
                      "unsupported codec version 3");
    }

    SECTION("Mistyped fields") {
        expect_format(R"({"v":2,"title":5,"body":"b","modified":1,"version":1,"created":1})",
                      "strings");
        expect_format(R"({"v":2,"title":"a","body":"b","modified":"x","version":1,"created":1})",
                      "modified");
        expect_format(R"({"v":2,"title":"a","body":"b","modified":1.5,"version":1,"created":1})",
                      "modified");
        expect_format(R"({"v":2,"title":"a","body":"b","modified":1e300,"version":1,"created":1})",
                      "modified");
        expect_format(R"({"v":2,"title":"a","body":"b","modified":1,"version":1,"created":-1e300})",
                      "created");
        expect_format(R"({"v":2,"title":"a","body":"b","modified":1,"version":0,"created":1})",
                      "version counter");
        expect_format(R"({"v":2,"title":"a","body":"b","modified":1,"version":1})",
                      "created");
    }
}
