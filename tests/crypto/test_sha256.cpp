// COMMONIP - SHA256 Tests
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <gtest/gtest.h>
#include "commonip/crypto/sha256.h"
#include "commonip/core/types.h"

#include <string>

namespace commonip {
namespace test {

// ============================================================================
// Known Vectors
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(std::string()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(std::string("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(SHA256Hash(std::string("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"))
                  .ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    hasher.Write("ab").Write("c");
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), SHA256Hash(std::string("abc")));
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    hasher.Write("garbage");
    hasher.Reset();
    hasher.Write("abc");
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), SHA256Hash(std::string("abc")));
}

TEST(SHA256Test, AddressFromLabelIsDigestPrefix) {
    Address a = AddressFromLabel("abc");
    Hash256 h = SHA256Hash(std::string("abc"));
    EXPECT_EQ(a.ToHex(), h.ToHex().substr(0, 40));
    EXPECT_EQ(AddressFromLabel("abc"), a);
    EXPECT_NE(AddressFromLabel("abd"), a);
}

} // namespace test
} // namespace commonip
