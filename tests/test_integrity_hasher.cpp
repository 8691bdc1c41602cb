#include "utils/integrity_hasher.hpp"

#include <gtest/gtest.h>

TEST(IntegrityHasherTest, KnownDigests) {
  EXPECT_EQ(IntegrityHasher::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(IntegrityHasher::sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(IntegrityHasherTest, IncrementalMatchesOneShot) {
  IntegrityHasher hasher;
  hasher.update("line one\n");
  hasher.update("line two\r\n");
  hasher.update("");
  hasher.update("tail");
  EXPECT_EQ(hasher.hex_digest(),
            IntegrityHasher::sha256_hex("line one\nline two\r\ntail"));
  EXPECT_EQ(hasher.bytes_hashed(), 23u);
}

TEST(IntegrityHasherTest, DigestDoesNotEndStream) {
  IntegrityHasher hasher;
  hasher.update("a");
  std::string partial = hasher.hex_digest();
  hasher.update("bc");
  EXPECT_EQ(partial, IntegrityHasher::sha256_hex("a"));
  EXPECT_EQ(hasher.hex_digest(), IntegrityHasher::sha256_hex("abc"));
}

TEST(IntegrityHasherTest, MovedHasherKeepsState) {
  IntegrityHasher first;
  first.update("ab");
  IntegrityHasher second(std::move(first));
  second.update("c");
  EXPECT_EQ(second.hex_digest(), IntegrityHasher::sha256_hex("abc"));
}
