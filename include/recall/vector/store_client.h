#pragma once

#include <recall/core/types.h>
#include <recall/memory/candidate.h>

#include <string>
#include <vector>

namespace recall::vector {

/**
 * @brief Abstract interface for the backing vector store.
 *
 * Implementations wrap a concrete store (Qdrant, sqlite-vec, ...). The ranking core only
 * depends on this contract; any error, exception or malformed payload is treated as a
 * failure and absorbed by ResilientStoreAccess.
 */
class IStoreClient {
public:
    virtual ~IStoreClient() = default;

    /**
     * @brief Nearest-neighbour search
     *
     * @param vector Query embedding
     * @param topK Maximum number of hits to return
     * @return Raw hits ordered by the store, or error
     */
    virtual Result<std::vector<memory::RawHit>> search(const std::vector<float>& vector,
                                                       size_t topK) = 0;
};

/**
 * @brief Abstract interface for the embedding provider that turns text into vectors.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) = 0;

    /**
     * @brief Batched variant; the default implementation embeds one text at a time.
     */
    virtual Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            auto r = embed(text);
            if (!r) {
                return r.error();
            }
            out.push_back(std::move(r).value());
        }
        return out;
    }

    /**
     * @brief Embedding dimensionality (0 if unknown)
     */
    virtual size_t dimension() const = 0;
};

} // namespace recall::vector
