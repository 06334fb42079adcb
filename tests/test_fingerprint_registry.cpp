#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "crypto/fingerprint_registry.hpp"

using namespace crypto;

static std::vector<std::uint8_t> key(std::uint8_t seed)
{
    return std::vector<std::uint8_t>(32, seed);
}

// every fingerprint maps back to the id that holds it, and no two ids share one
static void expect_bijection(const FingerprintRegistry &reg)
{
    std::set<std::string> seen;
    for (const auto &kv : reg.all_peer_fingerprints())
    {
        EXPECT_TRUE(seen.insert(kv.second).second) << "fingerprint held twice: " << kv.second;
        auto back = reg.peer_id_for_fingerprint(kv.second);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, kv.first);
    }
}

TEST(Fingerprint, Sha256Hex)
{
    const std::string abc = "abc";
    EXPECT_EQ(fingerprint_of_key(std::vector<std::uint8_t>(abc.begin(), abc.end())),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(fingerprint_of_key(key(1)).size(), 64u);
    EXPECT_NE(fingerprint_of_key(key(1)), fingerprint_of_key(key(2)));
}

TEST(FingerprintRegistry, StoreAndLookup)
{
    FingerprintRegistry reg;
    const auto          fp = reg.store_fingerprint_for_peer("aaaa", key(1));
    EXPECT_EQ(fp, fingerprint_of_key(key(1)));

    EXPECT_TRUE(reg.has_fingerprint_for_peer("aaaa"));
    EXPECT_EQ(reg.fingerprint_for_peer("aaaa"), fp);
    EXPECT_EQ(reg.peer_id_for_fingerprint(fp), std::string("aaaa"));
    EXPECT_FALSE(reg.fingerprint_for_peer("bbbb").has_value());
    EXPECT_FALSE(reg.peer_id_for_fingerprint("00").has_value());
    EXPECT_EQ(reg.size(), 1u);
}

TEST(FingerprintRegistry, NewKeyReplacesOldFingerprint)
{
    FingerprintRegistry reg;
    const auto          fp1 = reg.store_fingerprint_for_peer("aaaa", key(1));
    const auto          fp2 = reg.store_fingerprint_for_peer("aaaa", key(2));

    EXPECT_EQ(reg.fingerprint_for_peer("aaaa"), fp2);
    EXPECT_FALSE(reg.peer_id_for_fingerprint(fp1).has_value());
    EXPECT_EQ(reg.size(), 1u);
    expect_bijection(reg);
}

TEST(FingerprintRegistry, SameKeyUnderNewIdMovesMapping)
{
    FingerprintRegistry reg;
    const auto          fp = reg.store_fingerprint_for_peer("aaaa", key(1));
    reg.store_fingerprint_for_peer("bbbb", key(1));

    EXPECT_FALSE(reg.has_fingerprint_for_peer("aaaa"));
    EXPECT_EQ(reg.peer_id_for_fingerprint(fp), std::string("bbbb"));
    expect_bijection(reg);
}

TEST(FingerprintRegistry, UpdatePeerIdMapping)
{
    FingerprintRegistry reg;
    const auto          fp = reg.store_fingerprint_for_peer("old0", key(7));
    reg.store_fingerprint_for_peer("other", key(8));

    reg.update_peer_id_mapping(std::string("old0"), "new0", fp);

    EXPECT_FALSE(reg.has_fingerprint_for_peer("old0"));
    EXPECT_EQ(reg.fingerprint_for_peer("new0"), fp);
    EXPECT_EQ(reg.peer_id_for_fingerprint(fp), std::string("new0"));
    EXPECT_TRUE(reg.has_fingerprint_for_peer("other"));
    EXPECT_EQ(reg.size(), 2u);
    expect_bijection(reg);
}

TEST(FingerprintRegistry, UpdateMappingWithoutOldId)
{
    FingerprintRegistry reg;
    const auto          fp = fingerprint_of_key(key(3));
    reg.update_peer_id_mapping(std::nullopt, "cccc", fp);
    EXPECT_EQ(reg.peer_id_for_fingerprint(fp), std::string("cccc"));

    // a fingerprint claimed by another id without naming the old one still moves
    reg.update_peer_id_mapping(std::nullopt, "dddd", fp);
    EXPECT_FALSE(reg.has_fingerprint_for_peer("cccc"));
    EXPECT_EQ(reg.peer_id_for_fingerprint(fp), std::string("dddd"));
    expect_bijection(reg);
}

TEST(FingerprintRegistry, RemoveAndClear)
{
    FingerprintRegistry reg;
    const auto          fp = reg.store_fingerprint_for_peer("aaaa", key(1));
    reg.store_fingerprint_for_peer("bbbb", key(2));

    reg.remove_peer("aaaa");
    EXPECT_FALSE(reg.has_fingerprint_for_peer("aaaa"));
    EXPECT_FALSE(reg.peer_id_for_fingerprint(fp).has_value());
    reg.remove_peer("nope");
    EXPECT_EQ(reg.size(), 1u);

    reg.clear_all();
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_TRUE(reg.all_peer_fingerprints().empty());
}

TEST(FingerprintRegistry, DebugInfo)
{
    FingerprintRegistry reg;
    reg.store_fingerprint_for_peer("aaaa", key(1));
    const auto s = reg.debug_info();
    EXPECT_NE(s.find("=== Fingerprint Registry ==="), std::string::npos);
    EXPECT_NE(s.find("aaaa"), std::string::npos);
}
