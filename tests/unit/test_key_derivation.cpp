#include <catch2/catch_test_macros.hpp>
#include "crypto/key_derivation.hpp"

using namespace vellum;
using namespace vellum::crypto;

namespace {

const std::string PHRASE =
    "abandon ability able about above absent absorb abstract absurd abuse access actress";

SeedPhrase phrase() {
    return SeedPhrase::parse(PHRASE).unwrap();
}

} // namespace

TEST_CASE("Key derivation is deterministic", "[unit][kdf]") {
    const auto params = KdfParams::minimal();

    auto first = derive_key(phrase(), CONTEXT_ENCRYPTION, params);
    auto second = derive_key(phrase(), CONTEXT_ENCRYPTION, params);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    REQUIRE(first.unwrap() == second.unwrap());

    SECTION("Phrase spelling does not matter, only its entropy") {
        auto shouted = SeedPhrase::parse(
            "ABANDON ABILITY ABLE ABOUT ABOVE ABSENT ABSORB ABSTRACT ABSURD ABUSE ACCESS ACTRESS").unwrap();
        REQUIRE(derive_key(shouted, CONTEXT_ENCRYPTION, params).unwrap() == first.unwrap());
    }
}

TEST_CASE("Distinct contexts and phrases give distinct keys", "[unit][kdf]") {
    const auto params = KdfParams::minimal();
    const auto encryption = derive_key(phrase(), CONTEXT_ENCRYPTION, params).unwrap();
    const auto account = derive_key(phrase(), CONTEXT_ACCOUNT_ID, params).unwrap();
    REQUIRE_FALSE(encryption == account);

    const auto other = SeedPhrase::generate().unwrap();
    REQUIRE_FALSE(derive_key(other, CONTEXT_ENCRYPTION, params).unwrap() == encryption);
}

TEST_CASE("Account id is a stable 128-bit hex string", "[unit][kdf]") {
    const auto params = KdfParams::minimal();
    auto id = derive_account_id(phrase(), params);
    REQUIRE(id.is_ok());
    REQUIRE(id.unwrap().size() == 32);
    REQUIRE(id.unwrap().find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(derive_account_id(phrase(), params).unwrap() == id.unwrap());

    SECTION("Account id does not reveal the encryption key") {
        const auto key = derive_key(phrase(), CONTEXT_ENCRYPTION, params).unwrap();
        const auto key_hex = to_hex(key.span());
        REQUIRE(key_hex.find(id.unwrap()) == std::string::npos);
    }
}

TEST_CASE("Session keys match the individual derivations", "[unit][kdf]") {
    const auto params = KdfParams::minimal();
    auto session = derive_session_keys(phrase(), params);
    REQUIRE(session.is_ok());
    REQUIRE(session.unwrap().encryption_key == derive_key(phrase(), CONTEXT_ENCRYPTION, params).unwrap());
    REQUIRE(session.unwrap().account_id == derive_account_id(phrase(), params).unwrap());
}

TEST_CASE("Argon2 cost changes the key", "[unit][kdf]") {
    auto cheap = KdfParams::minimal();
    auto costlier = cheap;
    costlier.opslimit = cheap.opslimit + 1;
    REQUIRE_FALSE(derive_key(phrase(), CONTEXT_ENCRYPTION, cheap).unwrap() ==
                  derive_key(phrase(), CONTEXT_ENCRYPTION, costlier).unwrap());
}

TEST_CASE("Bad derivation parameters fail with Derivation", "[unit][kdf]") {
    SECTION("Unknown version") {
        auto params = KdfParams::minimal();
        params.version = CURRENT_KDF_VERSION + 1;
        auto result = derive_key(phrase(), CONTEXT_ENCRYPTION, params);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::Derivation));
    }

    SECTION("Memory limit below the Argon2 minimum") {
        auto params = KdfParams::minimal();
        params.memlimit = crypto_pwhash_MEMLIMIT_MIN - 1;
        REQUIRE(derive_key(phrase(), CONTEXT_ENCRYPTION, params).unwrap_err().is(ErrorKind::Derivation));
    }

    SECTION("Operations limit below the Argon2 minimum") {
        auto params = KdfParams::minimal();
        params.opslimit = 0;
        REQUIRE(derive_key(phrase(), CONTEXT_ENCRYPTION, params).unwrap_err().is(ErrorKind::Derivation));
    }

    SECTION("Empty context") {
        auto result = derive_key(phrase(), "", KdfParams::minimal());
        REQUIRE(result.unwrap_err().is(ErrorKind::Derivation));
    }
}
