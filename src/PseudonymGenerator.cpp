#include "PseudonymGenerator.h"
#include "CommonUtils.h"
#include "DigestUtils.h"

#include <array>
#include <cctype>
#include <random>

namespace {
constexpr std::array<const char*, 64> kFirstNames = {
    "Avery", "Blake", "Casey", "Dana", "Elliot", "Finley", "Gray", "Harper",
    "Indigo", "Jordan", "Kai", "Logan", "Morgan", "Noel", "Oakley", "Parker",
    "Quinn", "Reese", "Sage", "Taylor", "Umber", "Val", "Wren", "Yael",
    "Alex", "Bailey", "Cameron", "Drew", "Emerson", "Frankie", "Glenn", "Hayden",
    "Ira", "Jamie", "Kendall", "Lane", "Marley", "Nico", "Ocean", "Peyton",
    "Remy", "Rowan", "Skyler", "Tatum", "Uri", "Vesper", "Winter", "Zion",
    "Ainsley", "Brook", "Cypress", "Darcy", "Eden", "Flynn", "Gale", "Haven",
    "Jules", "Kit", "Lennox", "Milan", "Nova", "Onyx", "Perry", "Robin"};

constexpr std::array<const char*, 64> kLastNames = {
    "Abbott", "Barrow", "Calder", "Dunmore", "Ellery", "Fenwick", "Garrick", "Hollis",
    "Ingram", "Jessup", "Kendrick", "Lowell", "Marlow", "Norcross", "Oakes", "Pryor",
    "Quimby", "Radley", "Sutter", "Thorne", "Upton", "Vance", "Whitlock", "York",
    "Ashby", "Brennan", "Carver", "Dalton", "Easton", "Fairfax", "Gilmore", "Hartley",
    "Irwin", "Jarvis", "Keating", "Linwood", "Mercer", "Newell", "Osborne", "Pembrook",
    "Quill", "Rutledge", "Sterling", "Tilbury", "Underhill", "Varley", "Winslow", "Yardley",
    "Alcott", "Bramley", "Crowther", "Denholm", "Elwood", "Foxley", "Grantham", "Halloway",
    "Keswick", "Langford", "Merriman", "Northcote", "Pemberton", "Ravenscroft", "Ashworth", "Blackwood"};

constexpr std::array<const char*, 4> kDomains = {"example.com", "example.net", "example.org", "mail.test"};

template <size_t N>
const char* pick(const std::array<const char*, N>& corpus, std::mt19937_64& rng) {
    return corpus[static_cast<size_t>(rng() % N)];
}

char randomDigit(std::mt19937_64& rng, bool nonZero) {
    return nonZero ? static_cast<char>('1' + rng() % 9) : static_cast<char>('0' + rng() % 10);
}

std::string randomDigits(std::mt19937_64& rng, size_t count) {
    std::string out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) out.push_back(randomDigit(rng, false));
    return out;
}

// Replaces every digit, keeping punctuation, sign and length. A leading digit stays non-zero
// unless the original digit run was a single zero.
std::string substituteDigits(const std::string& original, std::mt19937_64& rng) {
    std::string out = original;
    bool first = true;
    size_t digitCount = 0;
    for (char c : original) {
        if (std::isdigit(static_cast<unsigned char>(c))) ++digitCount;
    }
    for (char& c : out) {
        if (!std::isdigit(static_cast<unsigned char>(c))) continue;
        const bool keepZeroLead = first && c == '0' && digitCount == 1;
        c = randomDigit(rng, first && !keepZeroLead);
        first = false;
    }
    return out;
}

bool hasDigit(const std::string& s) {
    for (unsigned char c : s) {
        if (std::isdigit(c)) return true;
    }
    return false;
}
} // namespace

const char* pseudonymShapeName(PseudonymShape shape) {
    switch (shape) {
        case PseudonymShape::AUTO: return "auto";
        case PseudonymShape::NAME: return "name";
        case PseudonymShape::EMAIL: return "email";
        case PseudonymShape::PHONE: return "phone";
        case PseudonymShape::SSN: return "ssn";
        case PseudonymShape::NUMERIC: return "numeric";
        case PseudonymShape::TOKEN: return "token";
    }
    return "unknown";
}

std::string CorpusPseudonymGenerator::generate(uint64_t key, PseudonymShape shape, const std::string& original) const {
    std::mt19937_64 rng(key);
    switch (shape) {
        case PseudonymShape::EMAIL: {
            const std::string first = CommonUtils::toLower(pick(kFirstNames, rng));
            const std::string last = CommonUtils::toLower(pick(kLastNames, rng));
            return first + "." + last + randomDigits(rng, 3) + "@" + pick(kDomains, rng);
        }
        case PseudonymShape::PHONE:
            if (hasDigit(original)) return substituteDigits(original, rng);
            return "555-" + randomDigits(rng, 4);
        case PseudonymShape::SSN:
            // 9xx area numbers are never issued.
            return "9" + randomDigits(rng, 2) + "-" + randomDigits(rng, 2) + "-" + randomDigits(rng, 4);
        case PseudonymShape::NUMERIC:
            if (hasDigit(original)) return substituteDigits(original, rng);
            return std::string(1, randomDigit(rng, true)) + randomDigits(rng, 5);
        case PseudonymShape::TOKEN: {
            static const char* kHex = "0123456789abcdef";
            std::string out = "ANON_";
            const uint64_t bits = rng();
            for (int shift = 44; shift >= 0; shift -= 4) out.push_back(kHex[(bits >> shift) & 0x0F]);
            return out;
        }
        case PseudonymShape::AUTO:
        case PseudonymShape::NAME:
            break;
    }
    // 24 key bits pick given name, middle name and a double-barrelled surname whose halves differ.
    const size_t last = static_cast<size_t>((key >> 12) & 0x3F);
    const size_t second = (last + 1 + static_cast<size_t>((key >> 18) % 63)) % kLastNames.size();
    return std::string(kFirstNames[key & 0x3F]) + " " + kFirstNames[(key >> 6) & 0x3F] + " " + kLastNames[last] + "-" +
           kLastNames[second];
}

PseudonymContext::PseudonymContext(std::shared_ptr<const PseudonymGenerator> generator)
    : generator_(generator ? std::move(generator) : std::make_shared<CorpusPseudonymGenerator>()) {}

uint64_t PseudonymContext::deriveKey(uint64_t seed, const std::string& piiType, const std::string& value) {
    return DigestUtils::digest64(std::to_string(seed) + ":" + piiType + ":" + value);
}

std::string PseudonymContext::pseudonym(uint64_t seed,
                                        const std::string& piiType,
                                        const std::string& value,
                                        PseudonymShape shape) {
    std::string cacheKey = std::to_string(seed);
    cacheKey.push_back('\x1f');
    cacheKey += piiType;
    cacheKey.push_back('\x1f');
    cacheKey += pseudonymShapeName(shape);
    cacheKey.push_back('\x1f');
    cacheKey += value;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(cacheKey);
        if (it != cache_.end()) return it->second;
    }

    std::string generated = generator_->generate(deriveKey(seed, piiType, value), shape, value);

    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.emplace(std::move(cacheKey), std::move(generated)).first->second;
}

size_t PseudonymContext::cacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

PseudonymShape PseudonymContext::resolveShape(PseudonymShape requested,
                                              const std::string& piiType,
                                              SemanticType columnType,
                                              bool preserveDataTypes) {
    if (requested != PseudonymShape::AUTO) return requested;

    const std::string pii = CommonUtils::toLower(piiType);
    if (CommonUtils::containsAny(pii, {"email", "mail"})) return PseudonymShape::EMAIL;
    if (CommonUtils::containsAny(pii, {"phone", "mobile", "tel"})) return PseudonymShape::PHONE;
    if (CommonUtils::containsAny(pii, {"ssn", "social_security"})) return PseudonymShape::SSN;
    if (columnType == SemanticType::NUMERIC) {
        return preserveDataTypes ? PseudonymShape::NUMERIC : PseudonymShape::TOKEN;
    }
    if (CommonUtils::containsAny(pii, {"name"})) return PseudonymShape::NAME;
    if (CommonUtils::containsAny(pii, {"id", "account", "card"})) return PseudonymShape::TOKEN;
    return PseudonymShape::NAME;
}
