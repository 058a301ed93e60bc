#include <gtest/gtest.h>
#include <managers/tunnel_types.hpp>
#include <regex>

static TunnelSpec make_spec() {
    TunnelSpec spec;
    spec.locator = Locator{"/work/ktun-profiles.yaml", "default"};
    spec.forwardings["kubernetes"] = Forwarding{"10.0.0.1", 6443};
    spec.user = "root";
    spec.host = "bastion.example.org";
    return spec;
}

TEST(TunnelTypes, LocatorString) {
    Locator loc{"/a/b.yaml", "dev"};
    EXPECT_EQ(loc.str(), "/a/b.yaml:dev");
}

TEST(TunnelTypes, StateNames) {
    EXPECT_STREQ(to_string(TunnelState::Open), "open");
    EXPECT_STREQ(to_string(TunnelState::Broken), "broken");
    EXPECT_STREQ(to_string(TunnelState::Closed), "closed");
    EXPECT_EQ(parse_tunnel_state("broken"), TunnelState::Broken);
    EXPECT_THROW(parse_tunnel_state("opening"), std::invalid_argument);
}

TEST(TunnelTypes, EmptyStatusIsClosed) {
    auto s = TunnelStatus::empty();
    EXPECT_EQ(s.status, TunnelState::Closed);
    EXPECT_TRUE(s.id.empty());
    EXPECT_FALSE(s.ssh_pid);
    EXPECT_TRUE(s.local_ports.empty());
}

TEST(TunnelTypes, RecordJsonShape) {
    TunnelStatus status;
    status.id = "tun-0000abcd";
    status.status = TunnelState::Open;
    status.ssh_pid = 4242;
    status.local_ports["kubernetes"] = 12345;
    status.spec_hash = "deadbeef";

    TunnelRecord record{make_spec(), status};
    nlohmann::json j = record;

    // Stored as a two-element array [spec, status].
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["locator"]["profile"], "default");
    EXPECT_EQ(j[0]["forwardings"]["kubernetes"]["port"], 6443);
    EXPECT_TRUE(j[0]["identity_file"].is_null());
    EXPECT_EQ(j[1]["status"], "open");
    EXPECT_EQ(j[1]["ssh_pid"], 4242);
    EXPECT_EQ(j[1]["local_ports"]["kubernetes"], 12345);

    auto back = j.get<TunnelRecord>();
    EXPECT_EQ(back.first, record.first);
    EXPECT_EQ(back.second.id, status.id);
    EXPECT_EQ(back.second.ssh_pid, status.ssh_pid);
    EXPECT_EQ(back.second.local_ports, status.local_ports);
}

TEST(TunnelTypes, NullPidReadsAsUnset) {
    auto j = nlohmann::json::parse(R"({
        "id": "tun-1", "status": "closed", "ssh_pid": null,
        "local_ports": {}, "spec_hash": ""
    })");
    auto s = j.get<TunnelStatus>();
    EXPECT_FALSE(s.ssh_pid);
    EXPECT_EQ(s.status, TunnelState::Closed);
}

TEST(TunnelTypes, HashIgnoresInsertionOrder) {
    TunnelSpec a = make_spec();
    a.forwardings["metrics"] = Forwarding{"10.0.0.2", 9090};

    TunnelSpec b = make_spec();
    b.forwardings.clear();
    b.forwardings["metrics"] = Forwarding{"10.0.0.2", 9090};
    b.forwardings["kubernetes"] = Forwarding{"10.0.0.1", 6443};

    EXPECT_EQ(spec_hash(a), spec_hash(b));
    EXPECT_EQ(spec_hash(a), spec_hash(a));
}

TEST(TunnelTypes, HashCoversEveryField) {
    const std::string base = spec_hash(make_spec());

    auto s = make_spec();
    s.forwardings["kubernetes"].host = "10.0.0.9";
    EXPECT_NE(spec_hash(s), base);

    s = make_spec();
    s.forwardings["kubernetes"].port = 6444;
    EXPECT_NE(spec_hash(s), base);

    s = make_spec();
    s.user = "admin";
    EXPECT_NE(spec_hash(s), base);

    s = make_spec();
    s.host = "other.example.org";
    EXPECT_NE(spec_hash(s), base);

    s = make_spec();
    s.identity_file = "/home/me/.ssh/id_ed25519";
    EXPECT_NE(spec_hash(s), base);

    s = make_spec();
    s.forwardings["extra"] = Forwarding{"localhost", 80};
    EXPECT_NE(spec_hash(s), base);
}

TEST(TunnelTypes, HashIsHexSha256) {
    std::regex hex("^[0-9a-f]{64}$");
    EXPECT_TRUE(std::regex_match(spec_hash(make_spec()), hex));
}

TEST(TunnelTypes, NewIdsAreDistinct) {
    std::regex shape("^tun-[0-9a-f]{8}$");
    auto a = new_tunnel_id();
    auto b = new_tunnel_id();
    EXPECT_TRUE(std::regex_match(a, shape));
    EXPECT_NE(a, b);
}
