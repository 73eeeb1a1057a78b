#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>
#include <sstream>
#include "auth/credential_store.hpp"
#include "crypto/crypto_error.hpp"
#include "test_utils.hpp"

using namespace vault::auth;
using nlohmann::json;

class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
        test_dir = make_test_dir("credential_test");
        store = std::make_unique<vault::store::Store>(test_config(test_dir));
        credentials = std::make_unique<CredentialStore>(*store);
    }

    void TearDown() override {
        credentials.reset();
        store.reset();
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
    std::unique_ptr<vault::store::Store> store;
    std::unique_ptr<CredentialStore> credentials;
};

TEST_F(CredentialStoreTest, EveryVariantRoundTrips) {
    credentials->set("anthropic", ApiCredential{"sk-123"});
    credentials->set("github", OAuthCredential{"refresh-tok", "access-tok", 1700000000000});
    credentials->set("internal", WellKnownCredential{"wk-key", "wk-token"});

    auto api = credentials->get("anthropic");
    ASSERT_TRUE(api.has_value());
    ASSERT_TRUE(std::holds_alternative<ApiCredential>(*api));
    EXPECT_EQ(std::get<ApiCredential>(*api).key, "sk-123");

    auto oauth = credentials->get("github");
    ASSERT_TRUE(oauth.has_value());
    ASSERT_TRUE(std::holds_alternative<OAuthCredential>(*oauth));
    EXPECT_EQ(std::get<OAuthCredential>(*oauth).refresh, "refresh-tok");
    EXPECT_EQ(std::get<OAuthCredential>(*oauth).access, "access-tok");
    EXPECT_EQ(std::get<OAuthCredential>(*oauth).expires, 1700000000000);

    auto wellknown = credentials->get("internal");
    ASSERT_TRUE(wellknown.has_value());
    ASSERT_TRUE(std::holds_alternative<WellKnownCredential>(*wellknown));
    EXPECT_EQ(std::get<WellKnownCredential>(*wellknown).token, "wk-token");
}

TEST_F(CredentialStoreTest, JsonIsTaggedByType) {
    json j = Credential{WellKnownCredential{"k", "t"}};
    EXPECT_EQ(j["type"], "wellknown");
    EXPECT_EQ(j["key"], "k");
    EXPECT_EQ(j["token"], "t");

    EXPECT_STREQ(credential_type(OAuthCredential{}), "oauth");
    EXPECT_STREQ(credential_type(ApiCredential{}), "api");
}

TEST_F(CredentialStoreTest, RejectsUnknownOrMalformedRecords) {
    store->write({"auth", "weird"}, json{{"type", "password"}, {"key", "x"}});
    EXPECT_THROW(credentials->get("weird"), vault::store::ValidationError);

    store->write({"auth", "partial"}, json{{"type", "oauth"}, {"refresh", "r"}});
    EXPECT_THROW(credentials->get("partial"), vault::store::ValidationError);

    store->write({"auth", "untagged"}, json{{"key", "x"}});
    EXPECT_THROW(credentials->get("untagged"), vault::store::ValidationError);
}

TEST_F(CredentialStoreTest, RejectsBadProviderNames) {
    EXPECT_THROW(credentials->set("", ApiCredential{"k"}), vault::store::ValidationError);
    EXPECT_THROW(credentials->set("../escape", ApiCredential{"k"}), vault::store::ValidationError);
}

TEST_F(CredentialStoreTest, RemoveAndList) {
    credentials->set("a", ApiCredential{"1"});
    credentials->set("b", ApiCredential{"2"});

    auto all = credentials->all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(std::get<ApiCredential>(all.at("b")).key, "2");

    EXPECT_TRUE(credentials->remove("a"));
    EXPECT_FALSE(credentials->remove("a"));
    EXPECT_FALSE(credentials->get("a").has_value());
    EXPECT_EQ(credentials->all().size(), 1u);
}

TEST_F(CredentialStoreTest, FilesAreOwnerOnly) {
    credentials->set("anthropic", ApiCredential{"sk"});
    using std::filesystem::perms;
    auto mode = std::filesystem::status(test_dir / "auth" / "anthropic.json").permissions();
    EXPECT_EQ(mode & (perms::group_all | perms::others_all), perms::none);
}

TEST_F(CredentialStoreTest, MigrationEncryptsCredentials) {
    credentials->set("a", ApiCredential{"plain-secret"});
    credentials->set("b", WellKnownCredential{"k", "t"});

    EXPECT_THROW(credentials->migrate_to_encrypted(), vault::crypto::KeyUnavailableError);

    vault::store::Store encrypted_store(test_config(test_dir, std::string("cred-key")));
    CredentialStore encrypted(encrypted_store);
    EXPECT_EQ(encrypted.migrate_to_encrypted(), 2u);

    std::ifstream file(test_dir / "auth" / "a.json");
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_EQ(contents.str().find("plain-secret"), std::string::npos);

    auto a = encrypted.get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(std::get<ApiCredential>(*a).key, "plain-secret");
}

TEST_F(CredentialStoreTest, MigrationCountsOnlyUnencryptedRecords) {
    credentials->set("a", ApiCredential{"1"});
    credentials->set("b", ApiCredential{"2"});
    store->write({"session", "s1"}, nlohmann::json(1));

    vault::store::Store encrypted_store(test_config(test_dir, std::string("cred-key")));
    CredentialStore encrypted(encrypted_store);
    encrypted.set("c", ApiCredential{"3"});

    // Records outside the auth namespace are not touched
    EXPECT_EQ(encrypted.migrate_to_encrypted(), 2u);
    EXPECT_EQ(encrypted.migrate_to_encrypted(), 0u);
    EXPECT_EQ(encrypted.all().size(), 3u);
}

TEST_F(CredentialStoreTest, MigrationKeepsConcurrentChanges) {
    credentials->set("a", ApiCredential{"a-old"});
    credentials->set("b", ApiCredential{"b-old"});
    credentials->set("c", ApiCredential{"c-old"});

    vault::store::Store encrypted_store(test_config(test_dir, std::string("cred-key")));
    CredentialStore encrypted(encrypted_store);

    // Hold the first record so the migration stalls after taking its snapshot
    const std::string first = vault::store::StorageKey{"auth", "a"}.resource_id(encrypted_store.root());
    auto blocker = encrypted_store.lock_manager().acquire(first, vault::lock::LockMode::Exclusive,
                                                          std::chrono::milliseconds(1000));

    auto migration = std::async(std::launch::async, [&encrypted]() {
        return encrypted.migrate_to_encrypted();
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto diagnostics = encrypted_store.lock_manager().diagnostics();
        auto it = diagnostics.find(first);
        if (it != diagnostics.end() && it->second.waiting_exclusive == 1) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    // Changes made while the migration is in flight
    encrypted.set("b", ApiCredential{"b-new"});
    EXPECT_TRUE(encrypted.remove("c"));
    blocker.release();

    // Only "a" still needed encrypting
    EXPECT_EQ(migration.get(), 1u);

    auto b = encrypted.get("b");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(std::get<ApiCredential>(*b).key, "b-new");
    EXPECT_FALSE(encrypted.get("c").has_value());

    auto a = encrypted.get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(std::get<ApiCredential>(*a).key, "a-old");
}
