#pragma once

#include "crypto/keys.hpp"
#include "core/result.hpp"
#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::crypto {

constexpr size_t WORDLIST_SIZE = 2048;
constexpr size_t BITS_PER_WORD = 11;

/**
 * The BIP-39 English wordlist.
 */
const std::array<std::string_view, WORDLIST_SIZE>& english_wordlist();

/**
 * Index of `word` in the wordlist (exact, lowercase match).
 */
[[nodiscard]] std::optional<uint16_t> word_index(std::string_view word);

/**
 * Entropy length of a phrase. The value is the entropy size in bytes.
 */
enum class SeedStrength : size_t {
    Words12 = 16,  // 128 bits + 4 checksum bits
    Words24 = 32   // 256 bits + 8 checksum bits
};

/**
 * SeedPhrase - BIP-39 mnemonic encoding of 128 or 256 bits of entropy.
 *
 * Only constructible through generate/parse/from_entropy, so every
 * instance carries a valid checksum. Equality compares decoded entropy.
 */
class SeedPhrase {
public:
    /**
     * Fresh random phrase. Fails with EntropySource if libsodium's
     * random source cannot be initialized.
     */
    [[nodiscard]] static Result<SeedPhrase, Error> generate(
        SeedStrength strength = SeedStrength::Words12);

    /**
     * Decode and checksum-verify a phrase. Case-insensitive; any run of
     * whitespace separates words. Fails with Format naming the problem.
     */
    [[nodiscard]] static Result<SeedPhrase, Error> parse(std::string_view text);

    /**
     * Encode raw entropy (16 or 32 bytes).
     */
    [[nodiscard]] static Result<SeedPhrase, Error> from_entropy(std::span<const uint8_t> entropy);

    /**
     * True iff `text` is a well-formed phrase with a matching checksum.
     * Never throws on malformed input.
     */
    [[nodiscard]] static bool validate(std::string_view text);

    SeedPhrase(const SeedPhrase& other);
    SeedPhrase& operator=(const SeedPhrase& other);
    SeedPhrase(SeedPhrase&&) noexcept = default;
    SeedPhrase& operator=(SeedPhrase&&) noexcept = default;
    ~SeedPhrase();

    [[nodiscard]] const std::vector<std::string>& words() const { return words_; }
    [[nodiscard]] size_t word_count() const { return words_.size(); }
    [[nodiscard]] const SecretBytes& entropy() const { return entropy_; }

    /**
     * Canonical form: lowercase words joined by single spaces.
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SeedPhrase& other) const { return entropy_ == other.entropy_; }

private:
    SeedPhrase(SecretBytes entropy, std::vector<std::string> words)
        : entropy_(std::move(entropy)), words_(std::move(words)) {}

    SecretBytes entropy_;
    std::vector<std::string> words_;
};

} // namespace vellum::crypto
