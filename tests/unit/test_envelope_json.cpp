#include <catch2/catch_test_macros.hpp>
#include "sync/envelope_json.hpp"

#include <QJsonArray>
#include <QJsonDocument>

using namespace vellum;
using namespace vellum::sync;

namespace {

EncryptedEnvelope sample() {
    return EncryptedEnvelope{
        .id = "n1",
        .ciphertext = {0x00, 0xff, 0x10, 0x20},
        .nonce = std::vector<uint8_t>(24, 0xab),
        .tag = std::vector<uint8_t>(16, 0xcd),
        .modified_at = Timestamp(1700000000123),
        .deleted = false
    };
}

} // namespace

TEST_CASE("Envelopes serialize to the wire form", "[unit][wire]") {
    const auto obj = envelope_to_json(sample());
    REQUIRE(obj.value("id").toString() == "n1");
    REQUIRE(obj.value("ciphertext").toString() == "AP8QIA==");
    REQUIRE(obj.value("modified_at").toInteger() == 1700000000123);
    REQUIRE_FALSE(obj.value("deleted").toBool());

    auto parsed = envelope_from_json(obj);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap() == sample());
}

TEST_CASE("Tombstones carry no ciphertext", "[unit][wire]") {
    const auto obj = envelope_to_json(tombstone_envelope("n1", Timestamp(5)));
    REQUIRE(obj.value("deleted").toBool());
    REQUIRE_FALSE(obj.contains("ciphertext"));
    REQUIRE_FALSE(obj.contains("nonce"));
    REQUIRE_FALSE(obj.contains("tag"));

    auto parsed = envelope_from_json(obj);
    REQUIRE(parsed.unwrap() == tombstone_envelope("n1", Timestamp(5)));
}

TEST_CASE("Malformed envelopes fail with Format", "[unit][wire]") {
    auto obj = envelope_to_json(sample());

    SECTION("Missing id") {
        obj.remove("id");
        REQUIRE(envelope_from_json(obj).unwrap_err().is(ErrorKind::Format));
    }

    SECTION("Missing or fractional timestamp") {
        obj.remove("modified_at");
        REQUIRE(envelope_from_json(obj).unwrap_err().message.find("modified_at") != std::string::npos);
        obj["modified_at"] = 1.5;
        REQUIRE(envelope_from_json(obj).is_err());
    }

    SECTION("Timestamps outside the int64 range") {
        for (const double huge : {1e300, -1e300, 9223372036854775808.0}) {
            obj["modified_at"] = huge;
            auto result = envelope_from_json(obj);
            REQUIRE(result.is_err());
            REQUIRE(result.unwrap_err().is(ErrorKind::Format));
            REQUIRE(result.unwrap_err().message.find("modified_at") != std::string::npos);
        }
    }

    SECTION("Invalid base64") {
        obj["nonce"] = "!!not base64!!";
        auto result = envelope_from_json(obj);
        REQUIRE(result.unwrap_err().is(ErrorKind::Format));
        REQUIRE(result.unwrap_err().message.find("n1") != std::string::npos);
    }
}

TEST_CASE("Pull responses", "[unit][wire]") {
    QJsonArray notes;
    notes.append(envelope_to_json(sample()));
    notes.append(envelope_to_json(tombstone_envelope("n2", Timestamp(9))));

    SECTION("Bare array") {
        auto response = parse_pull_response(QJsonDocument(notes).toJson());
        REQUIRE(response.is_ok());
        REQUIRE(response.unwrap().envelopes.size() == 2);
        REQUIRE(response.unwrap().dropped == 0);
        REQUIRE(response.unwrap().envelopes[1].deleted);
    }

    SECTION("Wrapped in an object") {
        QJsonObject wrapper;
        wrapper["notes"] = notes;
        auto response = parse_pull_response(QJsonDocument(wrapper).toJson());
        REQUIRE(response.is_ok());
        REQUIRE(response.unwrap().envelopes.size() == 2);
    }

    SECTION("Damaged entries are kept by id, anonymous ones dropped") {
        QJsonObject damaged = envelope_to_json(sample());
        damaged["id"] = "n3";
        damaged["tag"] = "%%%";
        notes.append(damaged);
        notes.append(QJsonObject{{"ciphertext", "AAAA"}});
        notes.append(42);

        auto response = parse_pull_response(QJsonDocument(notes).toJson());
        REQUIRE(response.is_ok());
        const auto& envelopes = response.unwrap().envelopes;
        REQUIRE(envelopes.size() == 3);
        REQUIRE(envelopes[2].id == "n3");
        REQUIRE(envelopes[2].nonce.empty());
        REQUIRE(envelopes[2].tag.empty());
        REQUIRE(envelopes[2].modified_at == sample().modified_at);
        REQUIRE(response.unwrap().dropped == 2);
    }

    SECTION("Entries with unrepresentable timestamps keep their id at time zero") {
        QJsonObject huge = envelope_to_json(sample());
        huge["id"] = "big";
        huge["modified_at"] = 1e300;
        QJsonObject tiny = envelope_to_json(sample());
        tiny["id"] = "small";
        tiny["tag"] = "%%%";
        tiny["modified_at"] = -1e300;

        auto response = parse_pull_response(
            QJsonDocument(QJsonArray{huge, tiny}).toJson(QJsonDocument::Compact));
        REQUIRE(response.is_ok());
        const auto& envelopes = response.unwrap().envelopes;
        REQUIRE(envelopes.size() == 2);
        REQUIRE(envelopes[0].id == "big");
        REQUIRE(envelopes[0].ciphertext.empty());
        REQUIRE(envelopes[0].modified_at == Timestamp(0));
        REQUIRE(envelopes[1].id == "small");
        REQUIRE(envelopes[1].modified_at == Timestamp(0));
        REQUIRE(response.unwrap().dropped == 0);
    }

    SECTION("Not a note list") {
        REQUIRE(parse_pull_response("{\"oops\":true}").unwrap_err().is(ErrorKind::Format));
        REQUIRE(parse_pull_response("<html>").unwrap_err().is(ErrorKind::Format));
    }
}
