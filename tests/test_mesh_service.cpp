#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <optional>
#include <sodium.h>
#include <string>
#include <utility>
#include <vector>

#include "app/mesh_service.hpp"
#include "crypto/announce_verifier.hpp"
#include "crypto/fingerprint_registry.hpp"
#include "crypto/sodium_util.hpp"
#include "mesh/fragment_manager.hpp"
#include "mesh/mesh_delegate.hpp"
#include "mesh/peer_directory.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"

using namespace app;

struct CapturingDelegate : mesh::MeshDelegate
{
    std::mutex                            mu;
    std::vector<proto::Packet>            packets;
    std::vector<std::vector<std::string>> lists;
    std::vector<std::string>              removed;

    void on_reassembled_packet(const proto::Packet &p) override
    {
        std::lock_guard<std::mutex> lk(mu);
        packets.push_back(p);
    }
    void on_peer_list_updated(const std::vector<std::string> &ids) override
    {
        std::lock_guard<std::mutex> lk(mu);
        lists.push_back(ids);
    }
    void on_peer_removed(const std::string &peer_id) override
    {
        std::lock_guard<std::mutex> lk(mu);
        removed.push_back(peer_id);
    }
};

// Transport wrapper that records what the service writes.
struct CapturingTransport : transport::ITransport
{
    transport::LoopbackTransport  &inner;
    std::vector<transport::Frame> sent;

    explicit CapturingTransport(transport::LoopbackTransport &t) : inner(t) {}

    bool start(const transport::Settings &s, transport::OnFrame cb) override
    {
        return inner.start(s, std::move(cb));
    }
    bool send(const transport::Frame &f) override
    {
        sent.push_back(f);
        return inner.send(f);
    }
    void        stop() override { inner.stop(); }
    std::string name() const override { return "capture"; }
    bool        link_ready() const override { return inner.link_ready(); }
};

struct Node
{
    CapturingDelegate           delegate;
    crypto::FingerprintRegistry fingerprints;
    mesh::FragmentManager       fragments;
    mesh::PeerDirectory         peers;
    CapturingTransport          tx;
    MeshService                 service;

    Node(transport::LoopbackTransport &link, crypto::AnnounceVerifier &v, const util::Config &cfg,
         const proto::SenderId &id)
        : fragments(cfg), peers(fingerprints, cfg), tx(link), service(tx, fragments, peers, v, id)
    {
        service.set_delegate(&delegate);
    }
    ~Node() { service.set_delegate(nullptr); }
};

static const proto::SenderId kIdA = {0xa0, 1, 2, 3, 4, 5, 6, 7};
static const proto::SenderId kIdB = {0xb0, 1, 2, 3, 4, 5, 6, 7};

// identity body used by these tests: [nick_len u8][nick][noise 32][signing 32][sig 64],
// signature over nick || noise
static std::optional<IdentityAnnouncement> decode_identity(const proto::Packet &p)
{
    const auto &b = p.payload;
    if (b.empty())
        return std::nullopt;
    const std::size_t n = b[0];
    if (b.size() != 1 + n + 32 + 32 + 64)
        return std::nullopt;

    IdentityAnnouncement a;
    auto                 it = b.begin() + 1;
    a.nickname.assign(it, it + n);
    it += n;
    a.noise_public_key.assign(it, it + 32);
    it += 32;
    a.signing_public_key.assign(it, it + 32);
    it += 32;
    a.signature.assign(it, it + 64);
    a.signed_data.assign(b.begin() + 1, b.begin() + 1 + n + 32);
    return a;
}

struct Identity
{
    std::vector<std::uint8_t> noise = std::vector<std::uint8_t>(32);
    std::vector<std::uint8_t> pk    = std::vector<std::uint8_t>(crypto_sign_PUBLICKEYBYTES);
    std::vector<std::uint8_t> sk    = std::vector<std::uint8_t>(crypto_sign_SECRETKEYBYTES);

    Identity()
    {
        crypto::ensure_sodium_init();
        crypto::random_bytes(noise.data(), noise.size());
        crypto_sign_keypair(pk.data(), sk.data());
    }

    proto::Bytes body(const std::string &nick, bool corrupt = false) const
    {
        proto::Bytes signed_data(nick.begin(), nick.end());
        signed_data.insert(signed_data.end(), noise.begin(), noise.end());

        std::vector<std::uint8_t> sig(crypto_sign_BYTES);
        crypto_sign_detached(sig.data(), nullptr, signed_data.data(), signed_data.size(),
                             sk.data());
        if (corrupt)
            sig[0] ^= 0xff;

        proto::Bytes out;
        out.push_back(static_cast<std::uint8_t>(nick.size()));
        out.insert(out.end(), signed_data.begin(), signed_data.end());
        out.insert(out.end(), pk.begin(), pk.end());
        out.insert(out.end(), sig.begin(), sig.end());
        return out;
    }
};

class MeshServiceTest : public ::testing::Test
{
  protected:
    util::Config                   cfg;
    transport::LoopbackTransport   link_a{"dev-a"}, link_b{"dev-b"};
    crypto::SodiumAnnounceVerifier verifier;
    Node                           a{link_a, verifier, cfg, kIdA};
    Node                           b{link_b, verifier, cfg, kIdB};

    void SetUp() override
    {
        link_a.connect(&link_b);
        link_b.connect(&link_a);
        transport::Settings s{};
        s.role        = "loopback";
        s.mtu_payload = 0;
        ASSERT_TRUE(a.service.start(s));
        ASSERT_TRUE(b.service.start(s));
    }
    void TearDown() override
    {
        a.service.stop();
        b.service.stop();
    }
};

TEST_F(MeshServiceTest, AnnounceAddsPeer)
{
    ASSERT_TRUE(a.service.send_announce("alice"));

    const std::string id_a = proto::peer_id_of(kIdA);
    EXPECT_EQ(b.peers.peer_nickname(id_a), std::string("alice"));
    EXPECT_FALSE(b.peers.is_peer_verified(id_a));
    ASSERT_EQ(b.delegate.lists.size(), 1u);
    EXPECT_EQ(b.delegate.lists[0], std::vector<std::string>{id_a});
    EXPECT_EQ(b.service.address_peer_map().at("dev-a"), id_a);

    // announce is not handed to the application
    EXPECT_TRUE(b.delegate.packets.empty());
    // and a node never learns about itself
    EXPECT_EQ(a.peers.size(), 0u);
}

TEST_F(MeshServiceTest, LeaveRemovesPeer)
{
    ASSERT_TRUE(a.service.send_announce("alice"));
    ASSERT_TRUE(a.service.send_leave());

    const std::string id_a = proto::peer_id_of(kIdA);
    EXPECT_FALSE(b.peers.peer_info(id_a).has_value());
    EXPECT_EQ(b.delegate.removed, std::vector<std::string>{id_a});
}

TEST_F(MeshServiceTest, LeaveForgetsAddress)
{
    ASSERT_TRUE(a.service.send_announce("alice"));
    ASSERT_EQ(b.service.address_peer_map().size(), 1u);

    ASSERT_TRUE(a.service.send_leave());
    EXPECT_TRUE(b.service.address_peer_map().empty());
    EXPECT_EQ(b.service.debug_info().find("dev-a"), std::string::npos);
}

TEST_F(MeshServiceTest, AddressesOfRemovedPeersPruned)
{
    ASSERT_TRUE(a.service.send_announce("alice"));
    // as the stale sweep would
    b.peers.remove_peer(proto::peer_id_of(kIdA));

    const proto::SenderId kIdC = {0xc0, 1, 2, 3, 4, 5, 6, 7};
    const std::string     nick = "carol";
    proto::Packet ann(proto::MessageType::Announce, kIdC, proto::Bytes(nick.begin(), nick.end()));
    b.service.on_rx(proto::encode(ann), "dev-c");

    const auto m = b.service.address_peer_map();
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m.at("dev-c"), proto::peer_id_of(kIdC));
}

TEST_F(MeshServiceTest, LargeMessageFragmentedAndDeliveredOnce)
{
    proto::Bytes body(1500);
    for (std::size_t i = 0; i < body.size(); ++i)
        body[i] = static_cast<std::uint8_t>(i * 7);
    proto::Packet p(proto::MessageType::Message, kIdA, body);

    ASSERT_TRUE(a.service.send_packet(p));
    EXPECT_EQ(a.tx.sent.size(), 4u);
    for (const auto &f : a.tx.sent)
    {
        auto d = proto::decode(f);
        ASSERT_TRUE(d.has_value());
        EXPECT_TRUE(d->is(proto::MessageType::Fragment));
        EXPECT_LE(d->payload.size(), frag::FRAG_HDR_SIZE + cfg.max_fragment_size);
    }

    ASSERT_EQ(b.delegate.packets.size(), 1u);
    EXPECT_EQ(b.delegate.packets[0], p);
    EXPECT_EQ(b.fragments.pending_count(), 0u);
}

TEST_F(MeshServiceTest, SmallMessageSentAsIs)
{
    proto::Packet p(proto::MessageType::Message, kIdA, {'h', 'i'});
    ASSERT_TRUE(a.service.send_packet(p));
    ASSERT_EQ(a.tx.sent.size(), 1u);
    EXPECT_EQ(a.tx.sent[0], proto::encode(p));
    ASSERT_EQ(b.delegate.packets.size(), 1u);
    EXPECT_EQ(b.delegate.packets[0], p);
}

TEST_F(MeshServiceTest, FragmentsOutOfOrderViaOnRx)
{
    proto::Packet p(proto::MessageType::Message, kIdA, proto::Bytes(1500, 'x'));
    auto          frags = a.fragments.create_fragments(p);
    ASSERT_EQ(frags.size(), 4u);

    const std::size_t order[] = {2, 0, 3, 1};
    for (auto i : order)
        b.service.on_rx(proto::encode(frags[i]), "dev-a");

    ASSERT_EQ(b.delegate.packets.size(), 1u);
    EXPECT_EQ(b.delegate.packets[0], p);
}

TEST_F(MeshServiceTest, InvalidFrameDropped)
{
    testing::internal::CaptureStderr();
    b.service.on_rx({1, 2, 3}, "dev-a");
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("dropping invalid frame"), std::string::npos);
    EXPECT_TRUE(b.delegate.packets.empty());
    EXPECT_TRUE(b.service.address_peer_map().empty());
}

TEST_F(MeshServiceTest, VerifiedIdentityAnnouncement)
{
    b.service.set_identity_decoder(decode_identity);
    Identity id;

    proto::Packet ann(proto::MessageType::NoiseIdentityAnnounce, kIdA, id.body("alice"));
    ASSERT_TRUE(a.service.send_packet(ann));

    const std::string id_a = proto::peer_id_of(kIdA);
    EXPECT_TRUE(b.peers.is_peer_verified(id_a));
    EXPECT_EQ(b.peers.peer_nickname(id_a), std::string("alice"));
    EXPECT_EQ(b.peers.fingerprint_for_peer(id_a), crypto::fingerprint_of_key(id.noise));
    EXPECT_EQ(b.delegate.lists.size(), 1u);
    EXPECT_TRUE(b.delegate.packets.empty());
}

TEST_F(MeshServiceTest, BadSignatureLeavesPeerUnverified)
{
    b.service.set_identity_decoder(decode_identity);
    Identity id;

    proto::Packet ann(proto::MessageType::NoiseIdentityAnnounce, kIdA, id.body("eve", true));
    ASSERT_TRUE(a.service.send_packet(ann));

    const std::string id_a = proto::peer_id_of(kIdA);
    ASSERT_TRUE(b.peers.peer_info(id_a).has_value());
    EXPECT_FALSE(b.peers.is_peer_verified(id_a));
    EXPECT_FALSE(b.peers.has_fingerprint_for_peer(id_a));
}

TEST_F(MeshServiceTest, RotatedIdKeepsFingerprint)
{
    b.service.set_identity_decoder(decode_identity);
    Identity id;

    const proto::SenderId rotated = {0xa1, 9, 9, 9, 9, 9, 9, 9};
    b.service.on_rx(
        proto::encode(proto::Packet(proto::MessageType::NoiseIdentityAnnounce, kIdA,
                                    id.body("alice"))),
        "dev-a");
    b.service.on_rx(
        proto::encode(proto::Packet(proto::MessageType::NoiseIdentityAnnounce, rotated,
                                    id.body("alice"))),
        "dev-a");

    const std::string fp = crypto::fingerprint_of_key(id.noise);
    EXPECT_EQ(b.peers.peer_id_for_fingerprint(fp), proto::peer_id_of(rotated));
    EXPECT_FALSE(b.peers.has_fingerprint_for_peer(proto::peer_id_of(kIdA)));
    EXPECT_TRUE(b.peers.is_peer_verified(proto::peer_id_of(rotated)));
}

TEST_F(MeshServiceTest, IdentityWithoutDecoderGoesToApplication)
{
    proto::Packet ann(proto::MessageType::NoiseIdentityAnnounce, kIdA, {1, 2, 3});
    ASSERT_TRUE(a.service.send_packet(ann));
    ASSERT_EQ(b.delegate.packets.size(), 1u);
    EXPECT_EQ(b.delegate.packets[0], ann);
}

TEST_F(MeshServiceTest, RssiFollowsAddressMapping)
{
    b.service.on_rssi("dev-a", -70);  // no mapping yet
    EXPECT_TRUE(b.peers.all_peer_rssi().empty());

    ASSERT_TRUE(a.service.send_announce("alice"));
    b.service.on_rssi("dev-a", -61);
    EXPECT_EQ(b.peers.peer_rssi(proto::peer_id_of(kIdA)), -61);

    const auto dump = b.service.debug_info();
    EXPECT_NE(dump.find("Device: dev-a -> Peer: " + proto::peer_id_of(kIdA)), std::string::npos);
    EXPECT_NE(dump.find("RSSI: -61 dBm"), std::string::npos);
}

TEST(MeshService, StartFailsWhenTransportFails)
{
    struct DeadTransport : transport::ITransport
    {
        bool start(const transport::Settings &, transport::OnFrame) override { return false; }
        bool send(const transport::Frame &) override { return false; }
        void stop() override {}
        bool link_ready() const override { return false; }
    } dead;

    util::Config                 cfg;
    crypto::FingerprintRegistry  reg;
    mesh::FragmentManager        fm(cfg);
    mesh::PeerDirectory          pd(reg, cfg);
    crypto::NoopAnnounceVerifier v;
    MeshService                  svc(dead, fm, pd, v, MeshService::random_sender_id());

    testing::internal::CaptureStderr();
    EXPECT_FALSE(svc.start(transport::Settings{}));
    testing::internal::GetCapturedStderr();
    EXPECT_FALSE(svc.send_announce("nobody"));
}

TEST(MeshService, StartRollsBackWhenPeerCleanupFails)
{
    util::Config cfg;
    cfg.peer_cleanup_interval = std::chrono::milliseconds(0);

    transport::LoopbackTransport link;
    crypto::FingerprintRegistry  reg;
    mesh::FragmentManager        fm(cfg);
    mesh::PeerDirectory          pd(reg, cfg);
    crypto::NoopAnnounceVerifier v;
    MeshService                  svc(link, fm, pd, v, MeshService::random_sender_id());

    auto out = fm.create_fragments(
        proto::Packet(proto::MessageType::Message, kIdA, proto::Bytes(1500, 0x33)));
    ASSERT_GT(out.size(), 1u);
    fm.handle_incoming_fragment(out[0]);
    ASSERT_EQ(fm.pending_count(), 1u);

    testing::internal::CaptureStderr();
    EXPECT_FALSE(svc.start(transport::Settings{}));
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("peer cleanup failed to start"), std::string::npos);
    // fragment manager was shut down again
    EXPECT_EQ(fm.pending_count(), 0u);
    EXPECT_FALSE(link.link_ready());
}

TEST(MeshService, OwnPacketsIgnored)
{
    transport::LoopbackTransport echo;  // frames come straight back
    util::Config                 cfg;
    crypto::NoopAnnounceVerifier v;
    Node                         n(echo, v, cfg, kIdA);

    ASSERT_TRUE(n.service.start(transport::Settings{}));
    ASSERT_TRUE(n.service.send_announce("narcissus"));
    ASSERT_TRUE(n.service.send_packet(proto::Packet(proto::MessageType::Message, kIdA, {1})));

    EXPECT_EQ(n.peers.size(), 0u);
    EXPECT_TRUE(n.delegate.packets.empty());
    EXPECT_TRUE(n.service.address_peer_map().empty());
    n.service.stop();
}
