// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CORE_SBF_PAYLOAD_HPP
#define SBF_CLOUD_CORE_SBF_PAYLOAD_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

#include "sbf_cloud/core/SbfTypes.hpp"

namespace sbf_cloud {

constexpr std::size_t kPreambleSize = 64;
constexpr std::uint8_t kFormatFlag = 0x2A;
constexpr std::size_t kMaxScalarFields = 0xFFFF;

struct PayloadPreamble {
    std::uint64_t point_count = 0;
    std::uint16_t field_count = 0;
    Vec3 local_shift{0.0, 0.0, 0.0};

    std::size_t columns() const { return kCoordinateColumns + field_count; }
    std::size_t rowBytes() const { return columns() * sizeof(float); }
};

// Decoded payload: row-major rows x (3 + field_count) float32 values
struct PayloadData {
    PayloadPreamble preamble;
    std::vector<float> values;
};

// Big-endian .sbf.data codec
class SbfPayloadCodec {
public:
    static PayloadData readPayload(const std::vector<std::uint8_t>& bytes,
                                   std::uint64_t declared_points,
                                   std::size_t declared_fields);

    static std::vector<std::uint8_t> writePayload(const Vec3& local_shift,
                                                  const std::vector<float>& matrix,
                                                  std::uint64_t rows,
                                                  std::size_t field_count);

    // 64 bytes in/out
    static void encodePreamble(const PayloadPreamble& preamble, std::uint8_t* out);
    static PayloadPreamble decodePreamble(const std::uint8_t* data);

    static void checkAgainstHeader(const PayloadPreamble& preamble,
                                   std::uint64_t declared_points,
                                   std::size_t declared_fields);

    // Payload size including the preamble; false on overflow
    static bool expectedSize(const PayloadPreamble& preamble, std::uint64_t& size);

    static void encodeRow(const float* values, std::size_t columns, std::uint8_t* out);
    static void decodeRow(const std::uint8_t* data, std::size_t columns, float* values);
};

// Row-at-a-time reader over a payload stream
class SbfPayloadReader {
public:
    explicit SbfPayloadReader(std::istream& in);

    const PayloadPreamble& readPreamble(std::uint64_t declared_points, std::size_t declared_fields);

    // Fills row with 3 + field_count values; throws PayloadTruncated
    void readRow(std::vector<float>& row);

    std::uint64_t rowsRead() const { return rows_read_; }

    // True once readPreamble has checked the body length; false on non-seekable streams
    bool sizeVerified() const { return size_verified_; }

private:
    std::istream& in_;
    PayloadPreamble preamble_;
    std::vector<std::uint8_t> buffer_;
    std::uint64_t rows_read_ = 0;
    bool size_verified_ = false;
};

class SbfPayloadWriter {
public:
    explicit SbfPayloadWriter(std::ostream& out);

    void writePreamble(const PayloadPreamble& preamble);
    void writeRow(const std::vector<float>& row);

private:
    std::ostream& out_;
    std::size_t columns_ = 0;
    std::vector<std::uint8_t> buffer_;
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_CORE_SBF_PAYLOAD_HPP
