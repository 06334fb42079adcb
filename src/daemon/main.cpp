#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "app/mesh_service.hpp"
#include "crypto/announce_verifier.hpp"
#include "crypto/fingerprint_registry.hpp"
#include "crypto/sodium_util.hpp"
#include "mesh/fragment_manager.hpp"
#include "mesh/peer_directory.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

static std::atomic<bool> g_stop{false};

static void on_signal(int)
{
    g_stop.store(true);
}

// Logs what the mesh hands to the application.
struct LoggingDelegate : mesh::MeshDelegate
{
    std::string name;
    explicit LoggingDelegate(std::string n) : name(std::move(n)) {}

    void on_reassembled_packet(const proto::Packet &p) override
    {
        LOG_INFO("[%s] packet type=0x%02x from %s (%zu bytes)", name.c_str(), (unsigned)p.type,
                 proto::peer_id_of(p.sender).c_str(), p.payload.size());
    }
    void on_peer_list_updated(const std::vector<std::string> &ids) override
    {
        LOG_INFO("[%s] active peers: %zu", name.c_str(), ids.size());
    }
    void on_peer_removed(const std::string &peer_id) override
    {
        LOG_INFO("[%s] peer removed: %s", name.c_str(), peer_id.c_str());
    }
};

// One mesh node: its own registry, engine, directory and service.
struct Node
{
    LoggingDelegate             delegate;
    crypto::FingerprintRegistry fingerprints;
    mesh::FragmentManager       fragments;
    mesh::PeerDirectory         peers;
    app::MeshService            service;

    Node(const std::string &name, transport::ITransport &t, crypto::AnnounceVerifier &v,
         const util::Config &cfg)
        : delegate(name),
          fragments(cfg),
          peers(fingerprints, cfg),
          service(t, fragments, peers, v, app::MeshService::random_sender_id())
    {
        service.set_delegate(&delegate);
    }
};

int main()
{
    dogemesh::init_log_level_from_env("DOGEMESH_LOG_LEVEL");
    if (!crypto::ensure_sodium_init())
        return 1;

    const util::Config cfg      = util::Config::from_env();
    const std::string  nickname = util::env_or("DOGEMESH_NICKNAME", "shibe");
    const std::string  which    = util::env_or("DOGEMESH_TRANSPORT", "loopback");
    if (which != "loopback")
        LOG_WARN("Transport '%s' not available in this build, using loopback", which.c_str());

    LOG_SYSTEM("Config: threshold=%zu max_fragment=%zu stale=%llds nickname=%s",
               cfg.fragment_threshold, cfg.max_fragment_size,
               (long long)std::chrono::duration_cast<std::chrono::seconds>(cfg.stale_peer_timeout)
                   .count(),
               nickname.c_str());

    transport::Settings s{};
    s.role = "loopback";
    if (const char *e = std::getenv("DOGEMESH_MTU_PAYLOAD"))
    {
        char         *p = nullptr;
        unsigned long v = std::strtoul(e, &p, 10);
        if (p && *p == '\0' && v > cfg.max_fragment_size)
            s.mtu_payload = static_cast<std::size_t>(v);
        else
            LOG_WARN("Ignoring invalid DOGEMESH_MTU_PAYLOAD='%s'", e);
    }
    else
    {
        // unfragmented packets stay within the threshold, fragments carry two headers
        s.mtu_payload = std::max(cfg.fragment_threshold,
                                 proto::HDR_SIZE + frag::FRAG_HDR_SIZE + cfg.max_fragment_size);
    }

    // Two in-process nodes joined by a loopback pair stand in for the radio link.
    transport::LoopbackTransport   link_a("loop-a"), link_b("loop-b");
    crypto::SodiumAnnounceVerifier verifier;
    link_a.connect(&link_b);
    link_b.connect(&link_a);

    Node local("local", link_a, verifier, cfg);
    Node neighbor("neighbor", link_b, verifier, cfg);

    if (!local.service.start(s) || !neighbor.service.start(s))
    {
        LOG_ERROR("MeshService start failed");
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (!local.service.send_announce(nickname) ||
        !neighbor.service.send_announce(nickname + "-neighbor"))
        LOG_WARN("announce not sent");

    // something big enough to need fragmentation
    proto::Packet hello(proto::MessageType::Message, local.service.local_id(),
                        proto::Bytes(cfg.fragment_threshold * 3, 'D'));
    if (!local.service.send_packet(hello))
        LOG_WARN("demo message not sent");

    auto last_dump = std::chrono::steady_clock::now() - std::chrono::seconds(30);
    while (!g_stop.load())
    {
        const auto now = std::chrono::steady_clock::now();
        if (now - last_dump >= std::chrono::seconds(30))
        {
            LOG_SYSTEM("%s", local.service.debug_info().c_str());
            last_dump = now;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutting down");
    if (!local.service.send_leave())
        LOG_WARN("leave not sent");
    local.service.stop();
    neighbor.service.stop();
    return 0;
}
