#include <gtest/gtest.h>
#include <core/credential_resolver.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class CredentialResolverTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path creds_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sftpflow_credentials_test";
        fs::create_directories(test_dir);
        creds_path = test_dir / "credentials";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_creds(const std::string& content) {
        std::ofstream(creds_path) << content;
    }
};

TEST_F(CredentialResolverTest, StoreReadsKeyValueLines) {
    write_creds("# comment\nprod.password=s3cret\nprod.username=deploy\n");
    CredentialStore store(creds_path);

    auto pw = store.get("prod", "password");
    ASSERT_TRUE(pw.is_ok());
    EXPECT_EQ(pw.value, "s3cret");
    EXPECT_TRUE(store.get("prod.keydata").is_err());
}

TEST_F(CredentialResolverTest, MissingStoreFileIsEmpty) {
    CredentialStore store(test_dir / "absent");
    EXPECT_TRUE(store.get("prod.password").is_err());
}

TEST_F(CredentialResolverTest, DefaultsHostAndPort) {
    CredentialStore store(creds_path);
    CredentialConfig cfg;
    cfg.name = "local";
    cfg.username = "me";

    auto r = resolve_identity(cfg, OperationRequest{}, store);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.host, "localhost");
    EXPECT_EQ(r.value.port, 22);
    EXPECT_EQ(r.value.username, "me");
    EXPECT_FALSE(r.value.password.has_value());
    EXPECT_FALSE(r.value.private_key.has_value());
}

TEST_F(CredentialResolverTest, RequestOverridesConfigOverridesStore) {
    write_creds("prod.username=store-user\nprod.password=store-pw\n");
    CredentialStore store(creds_path);

    CredentialConfig cfg;
    cfg.name = "prod";
    cfg.host = "config-host";
    cfg.password = "config-pw";

    OperationRequest req;
    req.host = "request-host";
    req.port = 2022;

    auto r = resolve_identity(cfg, req, store);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.host, "request-host");
    EXPECT_EQ(r.value.port, 2022);
    EXPECT_EQ(r.value.username, "store-user");
    EXPECT_EQ(r.value.password.value(), "config-pw");
    EXPECT_EQ(r.value.cache_key(),
              "prod|store-user@request-host:2022#" + r.value.secret_digest());
}

TEST_F(CredentialResolverTest, KeyAndPassphraseFromStore) {
    write_creds("prod.keydata=KEYDATA\nprod.passphrase=pp\n");
    CredentialStore store(creds_path);

    CredentialConfig cfg;
    cfg.name = "prod";
    cfg.username = "deploy";

    auto r = resolve_identity(cfg, OperationRequest{}, store);
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(r.value.private_key.has_value());
    EXPECT_EQ(r.value.private_key->data, "KEYDATA");
    EXPECT_EQ(r.value.private_key->passphrase.value(), "pp");
}

TEST_F(CredentialResolverTest, MissingUsernameIsResolutionFailure) {
    CredentialStore store(creds_path);
    CredentialConfig cfg;
    cfg.name = "nobody";

    auto r = resolve_identity(cfg, OperationRequest{}, store);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Resolution);
}

TEST_F(CredentialResolverTest, InvalidPortIsResolutionFailure) {
    CredentialStore store(creds_path);
    CredentialConfig cfg;
    cfg.name = "p";
    cfg.username = "u";
    cfg.port = 70000;

    auto r = resolve_identity(cfg, OperationRequest{}, store);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Resolution);
}
