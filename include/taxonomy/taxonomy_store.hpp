#pragma once

#include "common/postgrest_client.hpp"
#include "taxonomy/taxonomy_types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace atlas {

/**
 * @brief Persistence of the taxonomy
 *
 * replace() swaps the whole taxonomy at once: readers see either the old
 * or the new clusters and assignments, never a mix.
 */
class TaxonomyStore {
public:
    virtual ~TaxonomyStore() = default;

    virtual void replace(const TaxonomySnapshot& snapshot) = 0;

    /**
     * @brief Current taxonomy, or nullopt if none has been written
     */
    virtual std::optional<TaxonomySnapshot> load() const = 0;

    virtual std::string backend_name() const = 0;
};

/**
 * @brief Taxonomy kept in a JSON file, replaced by temp file + rename
 */
class LocalTaxonomyStore : public TaxonomyStore {
public:
    explicit LocalTaxonomyStore(const std::string& path);

    void replace(const TaxonomySnapshot& snapshot) override;
    std::optional<TaxonomySnapshot> load() const override;
    std::string backend_name() const override { return "local"; }

private:
    std::string path_;
};

/**
 * @brief Taxonomy tables in the remote database, replaced by the
 * replace_taxonomy function in a single transaction
 */
class RemoteTaxonomyStore : public TaxonomyStore {
public:
    explicit RemoteTaxonomyStore(PostgrestClient client);

    void replace(const TaxonomySnapshot& snapshot) override;
    std::optional<TaxonomySnapshot> load() const override;
    std::string backend_name() const override { return "remote"; }

    /**
     * @brief Argument of replace_taxonomy (flat rows, pgvector centroids)
     */
    static nlohmann::json build_payload(const TaxonomySnapshot& snapshot);

private:
    PostgrestClient client_;
};

/**
 * @brief Settings for create_taxonomy_store
 */
struct TaxonomyStoreConfig {
    std::string backend = "local";          ///< "local" or "remote"
    std::string path = "atlas_index/taxonomy.json";
    std::string remote_url;
    std::string remote_key;
    int timeout_seconds = 30;
};

/**
 * @throws std::invalid_argument for an unknown backend or missing URL
 */
std::unique_ptr<TaxonomyStore> create_taxonomy_store(const TaxonomyStoreConfig& config);

} // namespace atlas
