/**
 * @file dataset_codec.hpp
 * @brief Interface to an external data set encoder/decoder
 *
 * The upper layer carries data sets as opaque byte streams. A dataset_codec
 * supplied by a DICOM data-model library converts between those bytes and
 * its own data set type, which the upper layer holds type-erased.
 */

#ifndef DUL_NETWORK_DATASET_CODEC_HPP
#define DUL_NETWORK_DATASET_CODEC_HPP

#include "dul/core/result.hpp"

#include <any>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace dul::network {

/**
 * @brief Converts data set bytes to and from a data model
 *
 * Implementations must be safe to call from several association threads
 * at once.
 */
class dataset_codec {
public:
    virtual ~dataset_codec() = default;

    /**
     * @brief Decode a data set encoded in the given transfer syntax
     * @return The decoded data set, or dataset_decode_failed
     */
    [[nodiscard]] virtual auto decode(std::span<const uint8_t> bytes,
                                      std::string_view transfer_syntax) const
        -> Result<std::any> = 0;

    /**
     * @brief Encode a data set in the given transfer syntax
     * @return The encoded bytes, or dataset_encode_failed
     */
    [[nodiscard]] virtual auto encode(const std::any& dataset,
                                      std::string_view transfer_syntax) const
        -> Result<std::vector<uint8_t>> = 0;
};

using dataset_codec_ptr = std::shared_ptr<const dataset_codec>;

}  // namespace dul::network

#endif  // DUL_NETWORK_DATASET_CODEC_HPP
