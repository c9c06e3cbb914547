#pragma once

#include "RuleModel.h"
#include "TabularDataset.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * Source of synthetic replacement values. Implementations must be pure: the same key, shape and
 * original always produce the same output.
 */
class PseudonymGenerator {
public:
    virtual ~PseudonymGenerator() = default;

    /**
     * @param key 64-bit value derived from (seed, pii type, original value).
     * @param original the (case-normalized) input; used for layout-preserving shapes.
     */
    virtual std::string generate(uint64_t key, PseudonymShape shape, const std::string& original) const = 0;
};

// Built-in corpus of names and reserved example domains.
class CorpusPseudonymGenerator : public PseudonymGenerator {
public:
    std::string generate(uint64_t key, PseudonymShape shape, const std::string& original) const override;
};

/**
 * Per-run pseudonymization state: the generator and a synchronized cache so that equal inputs map to
 * equal pseudonyms whatever order columns are processed in.
 */
class PseudonymContext {
public:
    explicit PseudonymContext(std::shared_ptr<const PseudonymGenerator> generator = nullptr);

    PseudonymContext(const PseudonymContext&) = delete;
    PseudonymContext& operator=(const PseudonymContext&) = delete;

    std::string pseudonym(uint64_t seed, const std::string& piiType, const std::string& value, PseudonymShape shape);

    size_t cacheSize() const;

    static uint64_t deriveKey(uint64_t seed, const std::string& piiType, const std::string& value);

    /**
     * @brief Concrete shape for a rule: explicit shapes win, AUTO picks by pii type keyword, then by column type.
     */
    static PseudonymShape resolveShape(PseudonymShape requested,
                                       const std::string& piiType,
                                       SemanticType columnType,
                                       bool preserveDataTypes);

private:
    std::shared_ptr<const PseudonymGenerator> generator_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> cache_;
};

const char* pseudonymShapeName(PseudonymShape shape);
