#include <gtest/gtest.h>
#include <managers/sftpflow_service.hpp>
#include "memory_session.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

class ServiceTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryRemote> remote = std::make_shared<MemoryRemote>();
    fs::path creds_path = fs::temp_directory_path() / "sftpflow_service_test_credentials";

    Config make_config() {
        Config config;
        CredentialConfig prod;
        prod.name = "prod";
        prod.host = "sftp.example.com";
        prod.username = "deploy";
        prod.password = "pw";
        config.add_credentials(prod);

        CredentialConfig backup = prod;
        backup.name = "backup";
        backup.username = "archiver";
        config.add_credentials(backup);

        NodeConfig upload;
        upload.name = "upload";
        upload.operation = "put";
        upload.workdir = "/uploads";
        upload.filename = "/a.txt";
        upload.credentials = "prod";
        config.add_node(upload);

        NodeConfig browse;
        browse.name = "browse";
        browse.credentials = "prod";
        config.add_node(browse);

        NodeConfig archive;
        archive.name = "archive";
        archive.credentials = "backup";
        config.add_node(archive);

        NodeConfig broken;
        broken.name = "broken";
        broken.credentials = "missing";
        config.add_node(broken);
        return config;
    }

    std::unique_ptr<SftpFlowService> make_service() {
        return std::make_unique<SftpFlowService>(make_config(), CredentialStore(creds_path),
                                                 memory_factory(remote));
    }
};

TEST_F(ServiceTest, UploadScenario) {
    auto service = make_service();
    OperationRequest req;
    req.payload = std::string("hello");

    Completion c = service->submit("upload", req).get();
    ASSERT_TRUE(c.is_ok()) << c.error;
    const auto& out = std::get<TransferOutcome>(c.value);
    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.path, "uploads/a.txt");
    EXPECT_EQ(out.size, 5);
    EXPECT_TRUE(service->status("upload").cleared());
}

TEST_F(ServiceTest, UnknownNodeIsResolutionFailure) {
    auto service = make_service();
    Completion c = service->submit("nope", OperationRequest{}).get();
    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.kind, ErrorKind::Resolution);
    EXPECT_EQ(remote->connects.load(), 0);
}

TEST_F(ServiceTest, NodeWithMissingCredentialsRefusesRequests) {
    auto service = make_service();
    Completion c = service->submit("broken", OperationRequest{}).get();
    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.kind, ErrorKind::Resolution);
    EXPECT_EQ(c.error, "configuration node 'missing' missing");
    EXPECT_EQ(service->status("broken").color, StatusColor::Red);
}

TEST_F(ServiceTest, RequestOverridesNodeSettings) {
    remote->add_dir("/home/user/reports");
    remote->add_file("/home/user/reports/q1.csv", "q1");
    auto service = make_service();

    OperationRequest req;
    req.operation = "get";
    req.workdir = "reports";
    req.filename = "q1.csv";
    Completion c = service->submit("browse", req).get();
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(std::get<FileContent>(c.value).data, "q1");

    // payload names the directory to list
    OperationRequest listing;
    listing.payload_as_path = true;
    listing.payload = std::string("reports");
    c = service->submit("browse", listing).get();
    ASSERT_TRUE(c.is_ok()) << c.error;
    ASSERT_EQ(std::get<Listing>(c.value).entries.size(), 1u);
    EXPECT_EQ(std::get<Listing>(c.value).entries[0].name, "q1.csv");

    // upload from inside the target directory
    OperationRequest upload;
    upload.change_directory = true;
    upload.payload = std::string("hello");
    c = service->submit("upload", upload).get();
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(remote->content("/home/user/uploads/a.txt"), "hello");
    auto calls = remote->call_log();
    EXPECT_NE(std::find(calls.begin(), calls.end(), "cd /home/user/uploads"), calls.end());
}

TEST_F(ServiceTest, PrepareAppliesPathModeOverrides) {
    auto service = make_service();
    auto defaults = service->prepare("upload", OperationRequest{});
    ASSERT_TRUE(defaults.is_ok()) << defaults.error;
    EXPECT_FALSE(defaults.value.payload_as_path);
    EXPECT_FALSE(defaults.value.change_directory);

    OperationRequest req;
    req.payload_as_path = true;
    req.change_directory = true;
    auto p = service->prepare("upload", req);
    ASSERT_TRUE(p.is_ok()) << p.error;
    EXPECT_TRUE(p.value.payload_as_path);
    EXPECT_TRUE(p.value.change_directory);
}

TEST_F(ServiceTest, PrepareBuildsCacheKeyFromIdentity) {
    auto service = make_service();
    OperationRequest req;
    req.port = 2222;
    auto p = service->prepare("browse", req);
    ASSERT_TRUE(p.is_ok()) << p.error;
    EXPECT_EQ(p.value.key, "prod|deploy@sftp.example.com:2222#" + p.value.identity.secret_digest());
    EXPECT_EQ(p.value.operation, "list");
    EXPECT_TRUE(p.value.reuse_session);
}

TEST_F(ServiceTest, SameIdentityOperationsAreSerialized) {
    remote->op_delay_ms = 2;
    auto service = make_service();

    std::vector<std::future<Completion>> futures;
    for (int i = 0; i < 8; ++i) {
        OperationRequest req;
        req.filename = "f" + std::to_string(i) + ".txt";
        req.payload = std::string("payload");
        futures.push_back(service->submit("upload", req));
        futures.push_back(service->submit("browse", OperationRequest{}));
    }
    for (auto& f : futures) {
        Completion c = f.get();
        EXPECT_TRUE(c.is_ok()) << c.error;
    }

    EXPECT_EQ(remote->max_in_flight.load(), 1);
    EXPECT_EQ(remote->connects.load(), 1);
}

TEST_F(ServiceTest, DifferentIdentitiesGetSeparateSessions) {
    auto service = make_service();
    ASSERT_TRUE(service->submit("browse", OperationRequest{}).get().is_ok());
    ASSERT_TRUE(service->submit("archive", OperationRequest{}).get().is_ok());

    EXPECT_EQ(remote->connects.load(), 2);
    EXPECT_EQ(service->cache().cached_keys().size(), 2u);
}

TEST_F(ServiceTest, PasswordOverrideDoesNotReuseAuthenticatedSession) {
    remote->accepted_password = "pw";
    auto service = make_service();
    ASSERT_TRUE(service->submit("browse", OperationRequest{}).get().is_ok());

    OperationRequest wrong;
    wrong.password = "WRONG";
    auto p = service->prepare("browse", wrong);
    ASSERT_TRUE(p.is_ok()) << p.error;
    EXPECT_NE(p.value.key, service->prepare("browse", OperationRequest{}).value.key);

    Completion c = service->submit("browse", wrong).get();
    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.kind, ErrorKind::Connect);
    EXPECT_EQ(remote->connect_attempts.load(), 2);
    EXPECT_EQ(remote->connects.load(), 1);

    // The configured password still reuses the first session
    ASSERT_TRUE(service->submit("browse", OperationRequest{}).get().is_ok());
    EXPECT_EQ(remote->connect_attempts.load(), 2);
    EXPECT_EQ(service->cache().cached_keys().size(), 1u);
}

TEST_F(ServiceTest, CloseOperationEndsCachedSession) {
    auto service = make_service();
    ASSERT_TRUE(service->submit("browse", OperationRequest{}).get().is_ok());

    OperationRequest close;
    close.operation = "close";
    Completion c = service->submit("browse", close).get();
    ASSERT_TRUE(c.is_ok());
    EXPECT_TRUE(service->cache().cached_keys().empty());
    EXPECT_EQ(remote->ends.load(), 1);
}

TEST_F(ServiceTest, ShutdownDrainsAndClosesSessions) {
    auto service = make_service();
    std::vector<std::future<Completion>> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(service->submit("browse", OperationRequest{}));
        futures.push_back(service->submit("archive", OperationRequest{}));
    }
    service->shutdown();

    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(std::chrono::seconds(0)), std::future_status::ready);
        EXPECT_TRUE(f.get().is_ok());
    }
    EXPECT_TRUE(service->cache().cached_keys().empty());
    EXPECT_EQ(remote->ends.load(), remote->connects.load());
}

TEST_F(ServiceTest, ConcurrentShutdownRunsOnce) {
    auto service = make_service();
    ASSERT_TRUE(service->submit("browse", OperationRequest{}).get().is_ok());
    ASSERT_TRUE(service->submit("archive", OperationRequest{}).get().is_ok());

    std::thread other([&] { service->shutdown(); });
    service->shutdown();
    other.join();
    service.reset();

    EXPECT_EQ(remote->connects.load(), 2);
    EXPECT_EQ(remote->ends.load(), 2);
}

TEST_F(ServiceTest, StatusListenerSeesPhases) {
    auto service = make_service();
    std::mutex m;
    std::vector<std::string> texts;
    service->set_status_listener([&](const std::string& node, const Status& s) {
        std::lock_guard<std::mutex> lock(m);
        texts.push_back(node + ":" + s.text);
    });

    ASSERT_TRUE(service->submit("browse", OperationRequest{}).get().is_ok());
    service->shutdown();

    std::lock_guard<std::mutex> lock(m);
    std::vector<std::string> expected = {
        "browse:connecting", "browse:listing", "browse:done", "browse:"};
    EXPECT_EQ(texts, expected);
}
