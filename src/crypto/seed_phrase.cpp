#include "crypto/seed_phrase.hpp"

#include <algorithm>
#include <cctype>

namespace vellum::crypto {

namespace {

using Digest = std::array<uint8_t, crypto_hash_sha256_BYTES>;

Digest sha256(std::span<const uint8_t> data) {
    Digest out{};
    crypto_hash_sha256(out.data(), data.data(), data.size());
    return out;
}

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

size_t entropy_bytes_for(size_t word_count) {
    switch (word_count) {
        case 12: return static_cast<size_t>(SeedStrength::Words12);
        case 24: return static_cast<size_t>(SeedStrength::Words24);
        default: return 0;
    }
}

} // namespace

std::optional<uint16_t> word_index(std::string_view word) {
    const auto& list = english_wordlist();
    const auto it = std::lower_bound(list.begin(), list.end(), word);
    if (it == list.end() || *it != word) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(it - list.begin());
}

Result<SeedPhrase, Error> SeedPhrase::generate(SeedStrength strength) {
    auto init_result = init();
    if (init_result.is_err()) {
        return Result<SeedPhrase, Error>::err(init_result.unwrap_err());
    }

    SecretBytes entropy(static_cast<size_t>(strength));
    fill_random(entropy.data(), entropy.size());
    return from_entropy(entropy.span());
}

Result<SeedPhrase, Error> SeedPhrase::from_entropy(std::span<const uint8_t> entropy) {
    if (entropy_bytes_for(12) != entropy.size() && entropy_bytes_for(24) != entropy.size()) {
        return Result<SeedPhrase, Error>::err(Error{
            ErrorKind::Format,
            "Seed entropy must be 16 or 32 bytes, got " + std::to_string(entropy.size())});
    }

    const auto digest = sha256(entropy);
    const size_t ent_bits = entropy.size() * 8;
    const size_t total_bits = ent_bits + ent_bits / 32;

    // Bit i of ENT || CS, most significant bit first.
    const auto bit_at = [&](size_t pos) -> unsigned {
        if (pos < ent_bits) {
            return (entropy[pos / 8] >> (7 - pos % 8)) & 1u;
        }
        pos -= ent_bits;
        return (digest[pos / 8] >> (7 - pos % 8)) & 1u;
    };

    const auto& list = english_wordlist();
    std::vector<std::string> words;
    words.reserve(total_bits / BITS_PER_WORD);
    for (size_t w = 0; w < total_bits / BITS_PER_WORD; ++w) {
        unsigned index = 0;
        for (size_t b = 0; b < BITS_PER_WORD; ++b) {
            index = (index << 1) | bit_at(w * BITS_PER_WORD + b);
        }
        words.emplace_back(list[index]);
    }

    return Result<SeedPhrase, Error>::ok(
        SeedPhrase(SecretBytes(entropy.data(), entropy.size()), std::move(words)));
}

Result<SeedPhrase, Error> SeedPhrase::parse(std::string_view text) {
    auto words = split_words(text);
    const size_t ent_bytes = entropy_bytes_for(words.size());
    if (ent_bytes == 0) {
        return Result<SeedPhrase, Error>::err(Error{
            ErrorKind::Format,
            "Seed phrase must have 12 or 24 words, got " + std::to_string(words.size())});
    }

    std::vector<uint16_t> indices;
    indices.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
        const auto idx = word_index(words[i]);
        if (!idx) {
            // Position only: the words themselves are secret.
            return Result<SeedPhrase, Error>::err(Error{
                ErrorKind::Format, "Unknown word at position " + std::to_string(i + 1)});
        }
        indices.push_back(*idx);
    }

    const size_t ent_bits = ent_bytes * 8;
    const size_t cs_bits = ent_bits / 32;
    SecretBytes entropy(ent_bytes);
    unsigned checksum = 0;

    size_t pos = 0;
    for (const auto idx : indices) {
        for (int b = static_cast<int>(BITS_PER_WORD) - 1; b >= 0; --b, ++pos) {
            const unsigned bit = (idx >> b) & 1u;
            if (pos < ent_bits) {
                entropy.data()[pos / 8] |= static_cast<uint8_t>(bit << (7 - pos % 8));
            } else {
                checksum = (checksum << 1) | bit;
            }
        }
    }

    const auto digest = sha256(entropy.span());
    const unsigned expected = digest[0] >> (8 - cs_bits);
    if (checksum != expected) {
        return Result<SeedPhrase, Error>::err(
            Error{ErrorKind::Format, "Seed phrase checksum mismatch"});
    }

    return Result<SeedPhrase, Error>::ok(SeedPhrase(std::move(entropy), std::move(words)));
}

bool SeedPhrase::validate(std::string_view text) {
    return parse(text).is_ok();
}

SeedPhrase::SeedPhrase(const SeedPhrase& other)
    : entropy_(other.entropy_.clone()), words_(other.words_) {}

SeedPhrase& SeedPhrase::operator=(const SeedPhrase& other) {
    if (this != &other) {
        entropy_ = other.entropy_.clone();
        words_ = other.words_;
    }
    return *this;
}

SeedPhrase::~SeedPhrase() {
    for (auto& w : words_) {
        if (!w.empty()) {
            secure_zero(w.data(), w.size());
        }
    }
}

std::string SeedPhrase::to_string() const {
    std::string out;
    for (size_t i = 0; i < words_.size(); ++i) {
        if (i > 0) out.push_back(' ');
        out += words_[i];
    }
    return out;
}

} // namespace vellum::crypto
