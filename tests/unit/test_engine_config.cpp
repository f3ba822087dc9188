#include <gtest/gtest.h>
#include "pipeline/engine_config.hpp"
#include "common/file_utils.hpp"
#include <cstdlib>
#include <filesystem>

using namespace atlas;
namespace fs = std::filesystem;

class EngineConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
            ("atlas_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        clear_environment();
    }

    void TearDown() override {
        clear_environment();
        fs::remove_all(temp_dir);
    }

    static void clear_environment() {
        for (const char* name : {"ATLAS_VECTOR_BACKEND", "ATLAS_REMOTE_URL", "SUPABASE_URL",
                                 "ATLAS_EMBEDDING_PROVIDER", "OPENAI_API_KEY", "GEMINI_API_KEY",
                                 "ATLAS_CHUNK_TARGET_TOKENS", "ATLAS_CLAIMS_PATH"}) {
            unsetenv(name);
        }
    }

    static EngineConfig offline_config() {
        EngineConfig config;
        config.embedding_provider = "hashing";
        return config;
    }
};

// ==========================================
// JSON Tests
// ==========================================

TEST_F(EngineConfigTest, FileRoundTripRedactsKeys) {
    EngineConfig config = offline_config();
    config.remote_key = "service-secret";
    config.llm_api_key = "llm-secret";
    config.taxonomy_min_clusters = 3;
    config.taxonomy_max_clusters = 6;
    config.dedup_passes = {{"only", 0.97, 10000}};

    std::string path = (temp_dir / "config.json").string();
    config.to_json_file(path);

    auto raw = read_json_file(path);
    EXPECT_NE(raw["remote_key"], "service-secret");
    EXPECT_NE(raw["llm_api_key"], "llm-secret");

    auto loaded = EngineConfig::from_json_file(path);
    EXPECT_TRUE(loaded.remote_key.empty());
    EXPECT_TRUE(loaded.llm_api_key.empty());
    EXPECT_EQ(loaded.taxonomy_min_clusters, 3);
    EXPECT_EQ(loaded.taxonomy_max_clusters, 6);
    ASSERT_EQ(loaded.dedup_passes.size(), 1u);
    EXPECT_EQ(loaded.dedup_passes[0].name, "only");
    EXPECT_EQ(loaded.dedup_passes[0].temporal_window_ms, 10000);
}

TEST_F(EngineConfigTest, UnredactedJsonKeepsKeys) {
    EngineConfig config = offline_config();
    config.remote_key = "k";
    auto loaded = EngineConfig::from_json(config.to_json(false));
    EXPECT_EQ(loaded.remote_key, "k");
}

TEST_F(EngineConfigTest, LegacyRemoteKeysAccepted) {
    auto config = EngineConfig::from_json({
        {"supabase_url", "https://db.example.org"},
        {"supabase_key", "abc"}
    });
    EXPECT_EQ(config.remote_url, "https://db.example.org");
    EXPECT_EQ(config.remote_key, "abc");
    EXPECT_EQ(config.taxonomy_min_clusters, 8);
    EXPECT_EQ(config.dedup_passes.size(), 2u);
}

TEST_F(EngineConfigTest, MalformedFileThrows) {
    std::string path = (temp_dir / "broken.json").string();
    write_file_atomically(path, "[1, 2, 3]");
    EXPECT_THROW(EngineConfig::from_json_file(path), std::runtime_error);
    EXPECT_THROW(load_config_with_fallback((temp_dir / "missing.json").string()), std::runtime_error);
}

TEST_F(EngineConfigTest, InvalidPassInFileThrows) {
    nlohmann::json j;
    j["dedup_passes"] = nlohmann::json::array({nlohmann::json{{"similarity_threshold", 0.0}}});
    EXPECT_THROW(EngineConfig::from_json(j), std::invalid_argument);
}

// ==========================================
// Validation Tests
// ==========================================

TEST_F(EngineConfigTest, ValidateDefaultsOffline) {
    std::string error;
    EXPECT_TRUE(offline_config().validate(error)) << error;
}

TEST_F(EngineConfigTest, ValidateRejectsBadSettings) {
    std::string error;

    EngineConfig config = offline_config();
    config.taxonomy_min_clusters = 1;
    EXPECT_FALSE(config.validate(error));

    config = offline_config();
    config.chunk_overlap_tokens = config.chunk_target_tokens;
    EXPECT_FALSE(config.validate(error));

    config = offline_config();
    config.vector_backend = "remote";
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("remote_url"), std::string::npos);

    config = offline_config();
    config.projection = "umap";
    EXPECT_FALSE(config.validate(error));
}

TEST_F(EngineConfigTest, EmbeddingKeyOnlyRequiredWhenEmbedding) {
    EngineConfig config;
    config.embedding_provider = "openai";
    std::string error;
    EXPECT_FALSE(config.validate(error));
    EXPECT_TRUE(config.validate(error, false)) << error;
}

// ==========================================
// Environment Tests
// ==========================================

TEST_F(EngineConfigTest, EnvironmentOverridesFile) {
    setenv("ATLAS_EMBEDDING_PROVIDER", "openai", 1);
    setenv("OPENAI_API_KEY", "sk-test", 1);
    setenv("SUPABASE_URL", "https://legacy.example.org", 1);
    setenv("ATLAS_CLAIMS_PATH", "/data/claims.json", 1);

    EngineConfig config = offline_config();
    config.apply_environment();

    EXPECT_EQ(config.embedding_provider, "openai");
    EXPECT_EQ(config.embedding_api_key, "sk-test");
    EXPECT_EQ(config.remote_url, "https://legacy.example.org");
    EXPECT_EQ(config.claims_path, "/data/claims.json");
}

TEST_F(EngineConfigTest, NumericEnvironmentMustParse) {
    setenv("ATLAS_CHUNK_TARGET_TOKENS", "lots", 1);
    EngineConfig config;
    EXPECT_THROW(config.apply_environment(), std::invalid_argument);

    setenv("ATLAS_CHUNK_TARGET_TOKENS", "256", 1);
    config.apply_environment();
    EXPECT_EQ(config.chunk_target_tokens, 256u);
}

// ==========================================
// Component Settings Tests
// ==========================================

TEST_F(EngineConfigTest, ComponentSettingsFollowConfig) {
    EngineConfig config = offline_config();
    config.index_dir = "/tmp/idx";
    config.taxonomy_min_clusters = 4;
    config.gmm_seed = 7;

    EXPECT_EQ(config.taxonomy_store_config().path,
              (fs::path("/tmp/idx") / "taxonomy.json").string());
    config.taxonomy_path = "/tmp/elsewhere.json";
    EXPECT_EQ(config.taxonomy_store_config().path, "/tmp/elsewhere.json");

    auto taxonomy = config.taxonomy_config();
    EXPECT_EQ(taxonomy.min_clusters, 4);
    EXPECT_EQ(taxonomy.gmm.seed, 7u);

    EXPECT_FALSE(config.llm_config().model.empty());
    EXPECT_EQ(config.vector_index_config().index_dir, "/tmp/idx");
    EXPECT_EQ(config.claim_store_config().path, "claims.json");
}
