/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak/keccak.hpp"

#ifndef ROTL64
#define ROTL64(x, y) (((x) << (y)) | ((x) >> (64 - (y))))
#endif

namespace pc::crypto::keccak {
  namespace {
    constexpr size_t kRate{136};
    constexpr size_t kRounds{24};

    constexpr std::array<uint64_t, kRounds> kRoundConstants{
        0x0000000000000001, 0x0000000000008082, 0x800000000000808A,
        0x8000000080008000, 0x000000000000808B, 0x0000000080000001,
        0x8000000080008081, 0x8000000000008009, 0x000000000000008A,
        0x0000000000000088, 0x0000000080008009, 0x000000008000000A,
        0x000000008000808B, 0x800000000000008B, 0x8000000000008089,
        0x8000000000008003, 0x8000000000008002, 0x8000000000000080,
        0x000000000000800A, 0x800000008000000A, 0x8000000080008081,
        0x8000000000008080, 0x0000000080000001, 0x8000000080008008,
    };

    // rho offsets and pi lane order, walking the permutation cycle from 1
    constexpr std::array<unsigned, 24> kRho{
        1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
        27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44,
    };
    constexpr std::array<unsigned, 24> kPi{
        10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
        15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1,
    };

    void keccakF(std::array<uint64_t, 25> &st) {
      std::array<uint64_t, 5> bc{};
      for (size_t round = 0; round < kRounds; ++round) {
        // theta
        for (size_t i = 0; i < 5; ++i) {
          bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (size_t i = 0; i < 5; ++i) {
          const uint64_t t = bc[(i + 4) % 5] ^ ROTL64(bc[(i + 1) % 5], 1);
          for (size_t j = 0; j < 25; j += 5) {
            st[j + i] ^= t;
          }
        }
        // rho and pi
        uint64_t t = st[1];
        for (size_t i = 0; i < 24; ++i) {
          const auto j = kPi[i];
          const uint64_t next = st[j];
          st[j] = ROTL64(t, kRho[i]);
          t = next;
        }
        // chi
        for (size_t j = 0; j < 25; j += 5) {
          for (size_t i = 0; i < 5; ++i) {
            bc[i] = st[j + i];
          }
          for (size_t i = 0; i < 5; ++i) {
            st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
          }
        }
        // iota
        st[0] ^= kRoundConstants[round];
      }
    }

    uint64_t load64(const uint8_t *p) {
      uint64_t v{};
      for (size_t i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
      }
      return v;
    }
  }  // namespace

  Ctx::Ctx() = default;

  void Ctx::absorb() {
    for (size_t i = 0; i < kRate / 8; ++i) {
      state[i] ^= load64(block.data() + 8 * i);
    }
    keccakF(state);
    used = 0;
  }

  void Ctx::update(BytesIn in) {
    for (auto byte : in) {
      block[used++] = byte;
      if (used == kRate) {
        absorb();
      }
    }
  }

  Hash256 Ctx::final() {
    std::fill(block.begin() + used, block.end(), 0);
    block[used] |= 0x01;
    block[kRate - 1] |= 0x80;
    absorb();
    Hash256 hash;
    for (size_t i = 0; i < hash.size(); ++i) {
      hash[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
    }
    state.fill(0);
    block.fill(0);
    used = 0;
    return hash;
  }

  Hash256 keccak256(BytesIn to_hash) {
    Ctx ctx;
    ctx.update(to_hash);
    return ctx.final();
  }
}  // namespace pc::crypto::keccak
