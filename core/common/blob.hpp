/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include <boost/functional/hash.hpp>

#include "common/hexutil.hpp"

namespace pc::common {
  enum class BlobError { kIncorrectLength = 1 };
}  // namespace pc::common

OUTCOME_HPP_DECLARE_ERROR(pc::common, BlobError);

namespace pc::common {
  /**
   * Fixed-size byte array with hex conversions
   * @tparam size_ - length of the blob in bytes
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    static constexpr size_t kSize{size_};

    /**
     * Initialize blob value with zeros
     */
    constexpr Blob() : std::array<uint8_t, size_>{} {}

    explicit Blob(const std::array<uint8_t, size_> &bytes)
        : std::array<uint8_t, size_>{bytes} {}

    /**
     * Converts current blob to hex string, without prefix
     */
    std::string toHex() const {
      return hex_lower(*this);
    }

    bool isZero() const {
      for (auto byte : *this) {
        if (byte != 0) {
          return false;
        }
      }
      return true;
    }

    /**
     * Create Blob from arbitrary span
     * @param span - bytes, must be exactly blob size
     * @return result containing Blob object if span of correct length
     */
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (span.size() != size_) {
        return BlobError::kIncorrectLength;
      }
      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /**
     * Create Blob from hex string, with or without "0x" prefix
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      if (hex.substr(0, 2) == "0x") {
        hex.remove_prefix(2);
      }
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }
  };

  using Hash256 = Blob<32>;
}  // namespace pc::common

template <size_t N>
struct std::hash<pc::common::Blob<N>> {
  auto operator()(const pc::common::Blob<N> &blob) const {
    return boost::hash_range(blob.begin(), blob.end());
  }
};
