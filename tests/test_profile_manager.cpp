#include <gtest/gtest.h>
#include <managers/profile_manager.hpp>
#include <core/constants.hpp>
#include "fake_launcher.hpp"
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

// Fails the first `failures` attempts, then answers.
class FakeProbe : public EndpointProbe {
public:
    Result<void> probe(const std::string& host, int port, int timeout_ms) override {
        calls.push_back({host, port});
        EXPECT_GT(timeout_ms, 0);
        if (failures < 0 || static_cast<int>(calls.size()) <= failures) {
            return Result<void>::Err("Connection refused");
        }
        return Result<void>::Ok();
    }

    int failures = 0;   // -1: never answer
    std::vector<std::pair<std::string, int>> calls;
};

static const char* KUBECONFIG = R"(apiVersion: v1
kind: Config
current-context: k3s
clusters:
- name: k3s
  cluster:
    server: https://10.0.0.1:6443
contexts:
- name: k3s
  context:
    cluster: k3s
    user: admin
users:
- name: admin
  user:
    token: t0k3n
)";

class ProfileManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeProcessLauncher launcher;
    FakeProbe probe;
    int sleeps = 0;

    ProfileConfig config;
    std::unique_ptr<TunnelManager> tunnels;
    std::unique_ptr<KubeconfigManager> kubeconfig;
    std::unique_ptr<ProfileManager> profiles;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("ktun_activate_test_") + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        std::ofstream(test_dir / "kube.yaml") << KUBECONFIG;
        std::ofstream(test_dir / PROFILES_FILENAME) << R"(
default:
  kubeconfig:
    type: local
    path: kube.yaml
  tunnel:
    type: ssh
    user: root
    host: bastion
    identity_file: keys/id_ed25519
direct:
  kubeconfig:
    type: local
    path: kube.yaml
)";
        auto loaded = ProfileConfig::load(test_dir / PROFILES_FILENAME);
        ASSERT_TRUE(loaded.is_ok()) << loaded.error;
        config = loaded.value;

        tunnels = std::make_unique<TunnelManager>(test_dir / "tunnels", launcher);
        kubeconfig = std::make_unique<KubeconfigManager>(
            config.file().parent_path(), config.state_dir() / "profiles",
            [](const SessionTarget&, const std::string&, StatusCallback) {
                return Result<std::string>::Err("no ssh in tests");
            });
        profiles = std::make_unique<ProfileManager>(config, *tunnels, *kubeconfig, probe,
                                                    [this](int) { sleeps++; });
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    ActivatedProfile activate(const std::string& name) {
        auto session = tunnels->begin_session();
        return profiles->activate_profile(session, name);
    }
};

TEST_F(ProfileManagerTest, ActivateRewritesServerToLocalPort) {
    auto activated = activate("default");

    ASSERT_TRUE(activated.tunnel);
    EXPECT_EQ(activated.tunnel->status, TunnelState::Open);
    int port = activated.tunnel->local_ports.at(KUBERNETES_FORWARDING);

    auto written = YAML::LoadFile(activated.kubeconfig.string());
    EXPECT_EQ(written["clusters"][0]["cluster"]["server"].as<std::string>(),
              "https://localhost:" + std::to_string(port));

    ASSERT_EQ(probe.calls.size(), 1u);
    EXPECT_EQ(probe.calls[0].first, "localhost");
    EXPECT_EQ(probe.calls[0].second, port);

    // The tunnel forwards to the API server named in the kubeconfig.
    ASSERT_EQ(launcher.spawned.size(), 1u);
    const auto& argv = launcher.spawned[0];
    EXPECT_EQ(argv[3], std::to_string(port) + ":10.0.0.1:6443");
    EXPECT_EQ(argv.back(), "root@bastion");
}

TEST_F(ProfileManagerTest, FreshTunnelGetsLongGrace) {
    probe.failures = -1;
    EXPECT_THROW(activate("default"), ApiServerUnreachable);
    EXPECT_EQ(static_cast<int>(probe.calls.size()), API_GRACE_FRESH_SECS * 1000 / API_PROBE_INTERVAL_MS);
    EXPECT_EQ(sleeps, static_cast<int>(probe.calls.size()) - 1);
}

TEST_F(ProfileManagerTest, ReusedTunnelGetsShortGrace) {
    auto first = activate("default");

    probe.calls.clear();
    probe.failures = -1;
    EXPECT_THROW(activate("default"), ApiServerUnreachable);
    EXPECT_EQ(static_cast<int>(probe.calls.size()), API_GRACE_REUSED_SECS * 1000 / API_PROBE_INTERVAL_MS);
    EXPECT_EQ(launcher.spawned.size(), 1u);
}

TEST_F(ProfileManagerTest, DeadTunnelIsRestartedWithLongGrace) {
    auto first = activate("default");
    launcher.kill(*first.tunnel->ssh_pid);

    probe.calls.clear();
    probe.failures = -1;
    EXPECT_THROW(activate("default"), ApiServerUnreachable);
    EXPECT_EQ(static_cast<int>(probe.calls.size()), API_GRACE_FRESH_SECS * 1000 / API_PROBE_INTERVAL_MS);
    EXPECT_EQ(launcher.spawned.size(), 2u);
}

TEST_F(ProfileManagerTest, ProbeRetriesUntilReachable) {
    probe.failures = 3;
    auto activated = activate("default");
    EXPECT_EQ(probe.calls.size(), 4u);
    EXPECT_EQ(sleeps, 3);
    EXPECT_TRUE(fs::exists(activated.kubeconfig));
}

TEST_F(ProfileManagerTest, UnreachableCarriesLastError) {
    probe.failures = -1;
    try {
        activate("direct");
        FAIL() << "expected ApiServerUnreachable";
    } catch (const ApiServerUnreachable& e) {
        EXPECT_NE(std::string(e.what()).find("Connection refused"), std::string::npos);
    }
}

TEST_F(ProfileManagerTest, ProfileWithoutTunnelProbesServerDirectly) {
    auto activated = activate("direct");

    EXPECT_FALSE(activated.tunnel);
    EXPECT_TRUE(launcher.spawned.empty());
    ASSERT_EQ(probe.calls.size(), 1u);
    EXPECT_EQ(probe.calls[0].first, "10.0.0.1");
    EXPECT_EQ(probe.calls[0].second, 6443);

    auto written = YAML::LoadFile(activated.kubeconfig.string());
    EXPECT_EQ(written["clusters"][0]["cluster"]["server"].as<std::string>(), "https://10.0.0.1:6443");
}

TEST_F(ProfileManagerTest, OpenRequiresTunnel) {
    auto session = tunnels->begin_session();
    EXPECT_THROW(profiles->open_profile_tunnel(session, "direct"), ProfileError);
    EXPECT_TRUE(launcher.spawned.empty());
}

TEST_F(ProfileManagerTest, UnknownProfile) {
    auto session = tunnels->begin_session();
    EXPECT_THROW(profiles->activate_profile(session, "ghost"), ProfileError);
    EXPECT_THROW(profiles->open_profile_tunnel(session, "ghost"), ProfileError);
}

TEST_F(ProfileManagerTest, OpenProfileTunnelUsesLocator) {
    auto session = tunnels->begin_session();
    auto status = profiles->open_profile_tunnel(session, "default");
    EXPECT_EQ(status.status, TunnelState::Open);

    auto record = tunnels->get_tunnel(session, profiles->locator_for("default"));
    ASSERT_TRUE(record);
    EXPECT_EQ(record->first.locator.config_file, config.file().string());
    EXPECT_EQ(record->first.locator.profile, "default");
    EXPECT_TRUE(probe.calls.empty());
}

TEST_F(ProfileManagerTest, TunnelSpecResolvesIdentity) {
    SshTunnelConfig tunnel{"root", "bastion", std::string("keys/id")};
    auto spec = ProfileManager::tunnel_spec_for("/work/ktun-profiles.yaml", "default", tunnel, "10.0.0.1", 6443);

    EXPECT_EQ(spec.locator.str(), "/work/ktun-profiles.yaml:default");
    ASSERT_TRUE(spec.identity_file);
    EXPECT_EQ(*spec.identity_file, "/work/keys/id");
    ASSERT_EQ(spec.forwardings.size(), 1u);
    EXPECT_EQ(spec.forwardings.at(KUBERNETES_FORWARDING), (Forwarding{"10.0.0.1", 6443}));
}
