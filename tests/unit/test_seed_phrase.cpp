#include <catch2/catch_test_macros.hpp>
#include "crypto/seed_phrase.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace vellum;
using namespace vellum::crypto;

namespace {

std::vector<uint8_t> from_hex(const std::string& hex) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

const std::string SAMPLE =
    "abandon ability able about above absent absorb abstract absurd abuse access actress";

} // namespace

TEST_CASE("Wordlist is the sorted BIP-39 English list", "[unit][seed]") {
    const auto& words = english_wordlist();
    REQUIRE(words.front() == "abandon");
    REQUIRE(words.back() == "zoo");
    REQUIRE(std::is_sorted(words.begin(), words.end()));
    REQUIRE(word_index("abandon") == uint16_t{0});
    REQUIRE(word_index("zoo") == uint16_t{2047});
    REQUIRE_FALSE(word_index("vellum").has_value());
}

TEST_CASE("Known BIP-39 vectors encode as published", "[unit][seed]") {
    struct Vector {
        std::string entropy;
        std::string phrase;
    };
    const std::vector<Vector> vectors = {
        {"00000000000000000000000000000000",
         "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about"},
        {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
         "legal winner thank year wave sausage worth useful legal winner thank yellow"},
        {"80808080808080808080808080808080",
         "letter advice cage absurd amount doctor acoustic avoid letter advice cage above"},
        {"ffffffffffffffffffffffffffffffff",
         "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo wrong"},
        {"9e885d952ad362caeb4efe34a8e91bd2",
         "ozone drill grab fiber curtain grace pudding thank cruise elder eight picnic"},
        {"0000000000000000000000000000000000000000000000000000000000000000",
         "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon "
         "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon art"},
        {"ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff",
         "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo vote"},
    };

    for (const auto& v : vectors) {
        const auto entropy = from_hex(v.entropy);
        auto encoded = SeedPhrase::from_entropy(entropy);
        REQUIRE(encoded.is_ok());
        CHECK(encoded.unwrap().to_string() == v.phrase);

        auto parsed = SeedPhrase::parse(v.phrase);
        REQUIRE(parsed.is_ok());
        CHECK(parsed.unwrap().entropy().bytes() == entropy);
    }
}

TEST_CASE("Seed phrase validation", "[unit][seed]") {
    SECTION("Sample phrase is valid") {
        REQUIRE(SeedPhrase::validate(SAMPLE));
        auto parsed = SeedPhrase::parse(SAMPLE);
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap().word_count() == 12);
        REQUIRE(parsed.unwrap().entropy().bytes() == from_hex("00000401003008014030070100240501"));
    }

    SECTION("Case and spacing are normalized") {
        const std::string messy =
            "  ABANDON ability\tAble about\nabove absent absorb abstract absurd abuse access Actress ";
        auto parsed = SeedPhrase::parse(messy);
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap().to_string() == SAMPLE);
    }

    SECTION("Checksum mismatch is rejected") {
        const std::string bad =
            "abandon ability able about above absent absorb abstract absurd abuse access accident";
        REQUIRE_FALSE(SeedPhrase::validate(bad));
        auto parsed = SeedPhrase::parse(bad);
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().is(ErrorKind::Format));
        REQUIRE(parsed.unwrap_err().message.find("checksum") != std::string::npos);
    }

    SECTION("Wrong word counts are rejected") {
        REQUIRE_FALSE(SeedPhrase::validate(""));
        REQUIRE_FALSE(SeedPhrase::validate("abandon ability able"));
        REQUIRE_FALSE(SeedPhrase::validate(SAMPLE + " abandon"));
        auto parsed = SeedPhrase::parse("abandon ability able");
        REQUIRE(parsed.unwrap_err().message.find("12 or 24") != std::string::npos);
    }

    SECTION("Unknown word reports its position, not the word") {
        auto parsed = SeedPhrase::parse(
            "abandon ability able about above absent absorb abstract absurd abuse access zzzz");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().message.find("position 12") != std::string::npos);
        REQUIRE(parsed.unwrap_err().message.find("zzzz") == std::string::npos);
    }

    SECTION("Entropy of the wrong size is rejected") {
        std::vector<uint8_t> entropy(20, 0);
        auto result = SeedPhrase::from_entropy(entropy);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::Format));
    }
}

TEST_CASE("Generated phrases", "[unit][seed]") {
    SECTION("Default strength is twelve words and validates") {
        auto phrase = SeedPhrase::generate();
        REQUIRE(phrase.is_ok());
        REQUIRE(phrase.unwrap().word_count() == 12);
        REQUIRE(SeedPhrase::validate(phrase.unwrap().to_string()));
    }

    SECTION("Twenty-four words round-trip through parse") {
        auto phrase = SeedPhrase::generate(SeedStrength::Words24);
        REQUIRE(phrase.is_ok());
        REQUIRE(phrase.unwrap().word_count() == 24);
        auto parsed = SeedPhrase::parse(phrase.unwrap().to_string());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap() == phrase.unwrap());
    }

    SECTION("Consecutive phrases differ") {
        std::set<std::string> seen;
        for (int i = 0; i < 16; ++i) {
            seen.insert(SeedPhrase::generate().unwrap().to_string());
        }
        REQUIRE(seen.size() == 16);
    }
}

TEST_CASE("Seed phrase copies are independent", "[unit][seed]") {
    auto original = SeedPhrase::parse(SAMPLE).unwrap();
    SeedPhrase copy = original;
    REQUIRE(copy == original);
    REQUIRE(copy.entropy().data() != original.entropy().data());
    REQUIRE(copy.to_string() == SAMPLE);
}
