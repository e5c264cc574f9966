/**
 * @file test_remote_project_client.cpp
 * @brief End-to-end scenarios against the in-memory backend
 */

#include "test_fixtures.h"

#include <cavesync/remote_project/core/checksum.h>

#include <thread>

namespace cavesync::remote_project::test {

using namespace std::chrono_literals;

class RemoteProjectClientTest : public RemoteProjectFixture {};

// ============================================================================
// Session
// ============================================================================

TEST_F(RemoteProjectClientTest, PasswordLogin) {
    auto client = make_client("alice");
    EXPECT_FALSE(client.is_authenticated());

    login(client, "alice@example.com", "alice-pw");
    EXPECT_TRUE(client.is_authenticated());

    auto instance = client.current_instance();
    ASSERT_TRUE(instance);
    EXPECT_EQ(instance.value().to_string(), "http://localhost:8000");
}

TEST_F(RemoteProjectClientTest, OAuthLogin) {
    auto client = make_client("alice");
    ASSERT_TRUE(client.authenticate(credentials::from_oauth("oauth-alice"), host));
    EXPECT_TRUE(client.list_projects());
}

TEST_F(RemoteProjectClientTest, WrongPasswordFails) {
    auto client = make_client("alice");
    auto r = client.authenticate(credentials::from_password("alice@example.com", "nope"), host);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::authentication_failed);
    EXPECT_FALSE(client.is_authenticated());
}

TEST_F(RemoteProjectClientTest, OperationsRequireLogin) {
    auto client = make_client("alice");

    EXPECT_EQ(client.list_projects().error().code, error_code::not_authenticated);
    EXPECT_EQ(client.acquire_or_refresh("cave-1").error().code, error_code::not_authenticated);
    EXPECT_EQ(client.release("cave-1").error().code, error_code::not_authenticated);
    EXPECT_EQ(client.upload_bytes("m", "cave-1", {1}).error().code,
              error_code::not_authenticated);
    EXPECT_EQ(client.download("cave-1").error().code, error_code::not_authenticated);

    project_creation_request request;
    request.name = "Grotte Casteret";
    request.description = "Ice cave";
    request.country_code = "ES";
    EXPECT_EQ(client.create_project(request).error().code, error_code::not_authenticated);

    write_file(client.archive_path("cave-1"), {'t', 'm', 'l'});
    EXPECT_EQ(client.upload("m", "cave-1").error().code, error_code::not_authenticated);
    EXPECT_EQ(client.download_verified("cave-1", checksum::sha256("tml")).error().code,
              error_code::not_authenticated);
    EXPECT_EQ(client.release_all().error().code, error_code::not_authenticated);

    EXPECT_EQ(backend_->request_count(), 0u);
}

TEST_F(RemoteProjectClientTest, LogoutForgetsLocks) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    ASSERT_TRUE(client.acquire_or_refresh("cave-1").value());

    client.logout();
    EXPECT_FALSE(client.is_authenticated());
    EXPECT_TRUE(client.held_locks().empty());
    EXPECT_FALSE(client.lock_state("cave-1").has_value());
}

TEST_F(RemoteProjectClientTest, RevokedTokenSurfacesAuthenticationFailure) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    backend_->revoke_all_tokens();

    auto projects = client.list_projects();
    ASSERT_FALSE(projects);
    EXPECT_EQ(projects.error().code, error_code::authentication_failed);
}

// ============================================================================
// Projects
// ============================================================================

TEST_F(RemoteProjectClientTest, ListProjects) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");

    auto projects = client.list_projects();
    ASSERT_TRUE(projects);
    ASSERT_EQ(projects.value().size(), 3u);

    const auto& first = projects.value()[0];
    EXPECT_EQ(first.id, "cave-1");
    EXPECT_EQ(first.name, "Grotte de Choranche");
    EXPECT_EQ(first.permission, access_level::admin);
    ASSERT_TRUE(first.latitude.has_value());
    EXPECT_DOUBLE_EQ(*first.latitude, 45.1234);
    EXPECT_FALSE(first.active_mutex.has_value());
}

TEST_F(RemoteProjectClientTest, ListShowsLockHolder) {
    auto alice = make_client("alice");
    login(alice, "alice@example.com", "alice-pw");
    ASSERT_TRUE(alice.acquire_or_refresh("cave-1").value());

    auto projects = alice.list_projects();
    ASSERT_TRUE(projects);
    ASSERT_TRUE(projects.value()[0].active_mutex.has_value());
    EXPECT_EQ(projects.value()[0].active_mutex->describe_holder(), "alice@example.com");
}

TEST_F(RemoteProjectClientTest, CreateProject) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");

    project_creation_request request;
    request.name = "Grotte Casteret";
    request.description = "Ice cave";
    request.country_code = "ES";
    request.latitude = 42.6931;
    request.longitude = -0.0276;

    auto created = client.create_project(request);
    ASSERT_TRUE(created) << created.error().message;
    EXPECT_FALSE(created.value().id.empty());
    EXPECT_EQ(created.value().name, "Grotte Casteret");
    EXPECT_EQ(created.value().country_code, "ES");

    auto projects = client.list_projects();
    ASSERT_TRUE(projects);
    EXPECT_EQ(projects.value().size(), 4u);
}

TEST_F(RemoteProjectClientTest, InvalidCreationMakesNoRequest) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    auto before = backend_->request_count();

    project_creation_request request;
    request.name = "No country";
    request.description = "x";

    auto created = client.create_project(request);
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, error_code::project_validation_failed);
    EXPECT_EQ(backend_->request_count(), before);
}

TEST_F(RemoteProjectClientTest, CreationIsNotRetried) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    backend_->inject_failure("/api/v1/projects/", 503);
    auto before = backend_->request_count();

    project_creation_request request;
    request.name = "Retry me";
    request.description = "x";
    request.country_code = "FR";

    auto created = client.create_project(request);
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, error_code::unexpected_status);
    EXPECT_EQ(backend_->request_count(), before + 1);
}

// ============================================================================
// Locks
// ============================================================================

TEST_F(RemoteProjectClientTest, LocksAreMutuallyExclusive) {
    auto alice = make_client("alice");
    auto bob = make_client("bob");
    login(alice, "alice@example.com", "alice-pw");
    login(bob, "bob@example.com", "bob-pw");

    ASSERT_TRUE(alice.acquire_or_refresh("cave-1").value());

    auto contested = bob.acquire_or_refresh("cave-1");
    ASSERT_TRUE(contested);
    EXPECT_FALSE(contested.value());
    EXPECT_FALSE(bob.lock_state("cave-1").has_value());

    ASSERT_TRUE(alice.release("cave-1").value());
    EXPECT_FALSE(backend_->lock_holder("cave-1").has_value());

    EXPECT_TRUE(bob.acquire_or_refresh("cave-1").value());
    EXPECT_EQ(backend_->lock_holder("cave-1"), "bob@example.com");
}

TEST_F(RemoteProjectClientTest, ConcurrentAcquireHasSingleWinner) {
    auto alice = make_client("alice");
    auto bob = make_client("bob");
    login(alice, "alice@example.com", "alice-pw");
    login(bob, "bob@example.com", "bob-pw");
    backend_->set_latency(50ms);

    for (int round = 0; round < 5; ++round) {
        auto by_alice = alice.acquire_or_refresh_async("cave-1");
        auto by_bob = bob.acquire_or_refresh_async("cave-1");
        auto alice_won = by_alice.get();
        auto bob_won = by_bob.get();
        ASSERT_TRUE(alice_won) << alice_won.error().message;
        ASSERT_TRUE(bob_won) << bob_won.error().message;

        ASSERT_NE(alice_won.value(), bob_won.value()) << "round " << round;
        auto& winner = alice_won.value() ? alice : bob;
        auto& loser = alice_won.value() ? bob : alice;
        EXPECT_EQ(backend_->lock_holder("cave-1"),
                  alice_won.value() ? "alice@example.com" : "bob@example.com");
        EXPECT_TRUE(winner.lock_state("cave-1").has_value());
        EXPECT_FALSE(loser.lock_state("cave-1").has_value());

        ASSERT_TRUE(winner.release("cave-1").value());
        EXPECT_FALSE(backend_->lock_holder("cave-1").has_value());
    }
}

TEST_F(RemoteProjectClientTest, RefreshKeepsLock) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");

    ASSERT_TRUE(client.acquire_or_refresh("cave-1").value());
    auto first = client.lock_state("cave-1");
    ASSERT_TRUE(client.acquire_or_refresh("cave-1").value());
    auto second = client.lock_state("cave-1");

    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->acquired_at, second->acquired_at);
    EXPECT_GE(second->lease_expires_at, first->lease_expires_at);
    EXPECT_EQ(client.held_locks().size(), 1u);
}

TEST_F(RemoteProjectClientTest, ReadOnlyProjectIsRefused) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");

    auto projects = client.list_projects();
    ASSERT_TRUE(projects);
    auto before = backend_->request_count();

    const project* read_only = nullptr;
    for (const auto& p : projects.value()) {
        if (p.id == "cave-ro") {
            read_only = &p;
        }
    }
    ASSERT_NE(read_only, nullptr);

    auto r = client.acquire_or_refresh(*read_only);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::access_denied);
    EXPECT_EQ(backend_->request_count(), before);
}

TEST_F(RemoteProjectClientTest, ReleaseAll) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    ASSERT_TRUE(client.acquire_or_refresh("cave-1").value());
    ASSERT_TRUE(client.acquire_or_refresh("cave-2").value());

    auto released = client.release_all();
    ASSERT_TRUE(released);
    EXPECT_EQ(released.value(), 2u);
    EXPECT_TRUE(client.held_locks().empty());
    EXPECT_FALSE(backend_->lock_holder("cave-1").has_value());
    EXPECT_FALSE(backend_->lock_holder("cave-2").has_value());
}

TEST_F(RemoteProjectClientTest, UnknownProjectLockIsFalse) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");

    auto r = client.acquire_or_refresh("missing");
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value());
}

// ============================================================================
// Archives
// ============================================================================

TEST_F(RemoteProjectClientTest, UploadRequiresLock) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    auto before = backend_->request_count();

    auto r = client.upload_bytes("msg", "cave-1", {1, 2, 3});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::lock_not_held);
    EXPECT_EQ(backend_->request_count(), before);
}

TEST_F(RemoteProjectClientTest, UploadThenDownloadPreservesBytes) {
    auto alice = make_client("alice");
    auto bob = make_client("bob");
    login(alice, "alice@example.com", "alice-pw");
    login(bob, "bob@example.com", "bob-pw");

    auto archive = random_bytes(256 * 1024);
    write_file(alice.archive_path("cave-1"), archive);

    ASSERT_TRUE(alice.acquire_or_refresh("cave-1").value());
    auto uploaded = alice.upload("Surveyed the north branch", "cave-1");
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_EQ(backend_->last_message("cave-1"), "Surveyed the north branch");
    EXPECT_EQ(backend_->stored_archive("cave-1"), archive);

    auto path = bob.download_verified("cave-1", checksum::sha256(std::span<const uint8_t>(archive)));
    ASSERT_TRUE(path) << path.error().message;
    EXPECT_EQ(path.value(), bob.archive_path("cave-1"));
    EXPECT_EQ(checksum::sha256_file(path.value()).value(),
              checksum::sha256(std::span<const uint8_t>(archive)));
}

TEST_F(RemoteProjectClientTest, DownloadWithoutArchive) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");

    auto path = client.download("cave-2");
    ASSERT_FALSE(path);
    EXPECT_EQ(path.error().code, error_code::project_not_found);
}

TEST_F(RemoteProjectClientTest, TransientFailuresAreRetried) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    backend_->inject_failure("/acquire/", 503);
    backend_->inject_failure("/acquire/", 0);

    auto r = client.acquire_or_refresh("cave-1");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value());

    backend_->inject_failure("/upload/", 502);
    auto uploaded = client.upload_bytes("msg", "cave-1", {9, 9, 9});
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_EQ(backend_->upload_count("cave-1"), 1);
}

TEST_F(RemoteProjectClientTest, PersistentFailureSurfacesAfterRetries) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    backend_->inject_failure("/projects/", 500, 3);
    auto before = backend_->request_count();

    auto projects = client.list_projects();
    ASSERT_FALSE(projects);
    EXPECT_EQ(projects.error().http_status, 500);
    EXPECT_EQ(backend_->request_count(), before + 3);
}

TEST_F(RemoteProjectClientTest, CancelledOperationMakesNoRequest) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    auto before = backend_->request_count();

    cancellation_source source;
    source.cancel();

    auto r = client.acquire_or_refresh("cave-1", source.token());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::operation_cancelled);
    EXPECT_EQ(backend_->request_count(), before);
}

// ============================================================================
// Async
// ============================================================================

TEST_F(RemoteProjectClientTest, AsyncWorkflow) {
    auto client = make_client("alice");

    auto auth = client.authenticate_async(
        credentials::from_password("alice@example.com", "alice-pw"), host);
    ASSERT_TRUE(auth.get());

    auto projects = client.list_projects_async().get();
    ASSERT_TRUE(projects);
    EXPECT_EQ(projects.value().size(), 3u);

    ASSERT_TRUE(client.acquire_or_refresh_async("cave-1").get().value());

    write_file(client.archive_path("cave-1"), {'t', 'm', 'l'});
    ASSERT_TRUE(client.upload_async("async upload", "cave-1").get());

    auto path = client.download_async("cave-1").get();
    ASSERT_TRUE(path);
    EXPECT_EQ(read_file(path.value()), (byte_buffer{'t', 'm', 'l'}));

    ASSERT_TRUE(client.release_async("cave-1").get().value());
    ASSERT_TRUE(client.logout_async().get());
    EXPECT_FALSE(client.is_authenticated());
}

TEST_F(RemoteProjectClientTest, AsyncCallsRunConcurrently) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    backend_->set_latency(200ms);

    auto start = std::chrono::steady_clock::now();
    auto first = client.acquire_or_refresh_async("cave-1");
    auto second = client.acquire_or_refresh_async("cave-2");
    EXPECT_TRUE(first.get().value());
    EXPECT_TRUE(second.get().value());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 390ms);
    EXPECT_EQ(client.held_locks().size(), 2u);
}

TEST_F(RemoteProjectClientTest, AsyncCancellation) {
    backend_->inject_failure("/projects/", 503, 10);

    retry_policy slow;
    slow.max_attempts = 5;
    slow.base_delay = 500ms;
    auto slow_client = remote_project_client::builder()
                           .with_archive_root(test_dir_ / "slow")
                           .with_retry_policy(slow)
                           .with_http_client(backend_)
                           .build();
    ASSERT_TRUE(slow_client);
    login(slow_client.value(), "alice@example.com", "alice-pw");

    cancellation_source source;
    auto start = std::chrono::steady_clock::now();
    auto future = slow_client.value().list_projects_async(source.token());
    std::this_thread::sleep_for(50ms);
    source.cancel();

    auto projects = future.get();
    ASSERT_FALSE(projects);
    EXPECT_EQ(projects.error().code, error_code::operation_cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(RemoteProjectClientTest, BuilderRejectsInvalidConfiguration) {
    auto client = remote_project_client::builder()
                      .with_archive_root(test_dir_)
                      .with_archive_extension("")
                      .with_http_client(backend_)
                      .build();
    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);

    auto zero_lease = remote_project_client::builder()
                          .with_archive_root(test_dir_)
                          .with_lock_lease(std::chrono::seconds(0))
                          .with_http_client(backend_)
                          .build();
    ASSERT_FALSE(zero_lease);
    EXPECT_EQ(zero_lease.error().code, error_code::invalid_configuration);
}

TEST_F(RemoteProjectClientTest, MovedClientKeepsSession) {
    auto client = make_client("alice");
    login(client, "alice@example.com", "alice-pw");
    ASSERT_TRUE(client.acquire_or_refresh("cave-1").value());

    remote_project_client moved(std::move(client));
    EXPECT_TRUE(moved.is_authenticated());
    EXPECT_EQ(moved.held_locks().size(), 1u);
}

}  // namespace cavesync::remote_project::test
