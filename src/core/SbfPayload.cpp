// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/core/SbfPayload.hpp"

#include <cstring>
#include <limits>
#include <string>

#include "sbf_cloud/core/SbfError.hpp"

namespace sbf_cloud {

namespace {

// Byte offsets inside the 64-byte preamble
constexpr std::size_t kPointCountOffset = 2;
constexpr std::size_t kFieldCountOffset = 10;
constexpr std::size_t kShiftOffset = 12;

void storeU64(std::uint64_t value, std::uint8_t* out) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

std::uint64_t loadU64(const std::uint8_t* data) {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

void storeU32(std::uint32_t value, std::uint8_t* out) {
    out[0] = static_cast<std::uint8_t>(value >> 24);
    out[1] = static_cast<std::uint8_t>(value >> 16);
    out[2] = static_cast<std::uint8_t>(value >> 8);
    out[3] = static_cast<std::uint8_t>(value);
}

std::uint32_t loadU32(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

void storeF64(double value, std::uint8_t* out) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    storeU64(bits, out);
}

double loadF64(const std::uint8_t* data) {
    const std::uint64_t bits = loadU64(data);
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

void checkFieldCount(std::size_t field_count) {
    if (field_count > kMaxScalarFields) {
        throw SbfError(SbfErrorCode::PayloadMalformed,
                       "too many scalar fields for the payload format: " +
                           std::to_string(field_count));
    }
}

}  // namespace

void SbfPayloadCodec::encodePreamble(const PayloadPreamble& preamble, std::uint8_t* out) {
    std::memset(out, 0, kPreambleSize);
    out[0] = kFormatFlag;
    out[1] = kFormatFlag;
    storeU64(preamble.point_count, out + kPointCountOffset);
    out[kFieldCountOffset] = static_cast<std::uint8_t>(preamble.field_count >> 8);
    out[kFieldCountOffset + 1] = static_cast<std::uint8_t>(preamble.field_count & 0xFF);
    for (std::size_t i = 0; i < 3; ++i) {
        storeF64(preamble.local_shift[i], out + kShiftOffset + i * sizeof(double));
    }
}

PayloadPreamble SbfPayloadCodec::decodePreamble(const std::uint8_t* data) {
    if (data[0] != kFormatFlag || data[1] != kFormatFlag) {
        throw SbfError(SbfErrorCode::PayloadMalformed, "missing 0x2A 0x2A format flag");
    }
    PayloadPreamble preamble;
    preamble.point_count = loadU64(data + kPointCountOffset);
    preamble.field_count = static_cast<std::uint16_t>((data[kFieldCountOffset] << 8) |
                                                      data[kFieldCountOffset + 1]);
    for (std::size_t i = 0; i < 3; ++i) {
        preamble.local_shift[i] = loadF64(data + kShiftOffset + i * sizeof(double));
    }
    return preamble;
}

void SbfPayloadCodec::checkAgainstHeader(const PayloadPreamble& preamble,
                                         std::uint64_t declared_points,
                                         std::size_t declared_fields) {
    if (preamble.point_count != declared_points || preamble.field_count != declared_fields) {
        throw SbfError(SbfErrorCode::PayloadHeaderMismatch,
                       "payload declares " + std::to_string(preamble.point_count) + " points / " +
                           std::to_string(preamble.field_count) + " fields, header declares " +
                           std::to_string(declared_points) + " / " +
                           std::to_string(declared_fields));
    }
}

bool SbfPayloadCodec::expectedSize(const PayloadPreamble& preamble, std::uint64_t& size) {
    const std::uint64_t row_bytes = preamble.rowBytes();
    const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() - kPreambleSize;
    if (preamble.point_count > limit / row_bytes) {
        return false;
    }
    size = kPreambleSize + preamble.point_count * row_bytes;
    return true;
}

void SbfPayloadCodec::encodeRow(const float* values, std::size_t columns, std::uint8_t* out) {
    for (std::size_t c = 0; c < columns; ++c) {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &values[c], sizeof(bits));
        storeU32(bits, out + c * sizeof(float));
    }
}

void SbfPayloadCodec::decodeRow(const std::uint8_t* data, std::size_t columns, float* values) {
    for (std::size_t c = 0; c < columns; ++c) {
        const std::uint32_t bits = loadU32(data + c * sizeof(float));
        std::memcpy(&values[c], &bits, sizeof(float));
    }
}

PayloadData SbfPayloadCodec::readPayload(const std::vector<std::uint8_t>& bytes,
                                         std::uint64_t declared_points,
                                         std::size_t declared_fields) {
    if (bytes.size() < kPreambleSize) {
        throw SbfError(SbfErrorCode::PayloadTruncated,
                       "payload is " + std::to_string(bytes.size()) +
                           " bytes, shorter than the 64-byte preamble");
    }

    PayloadData data;
    data.preamble = decodePreamble(bytes.data());
    checkAgainstHeader(data.preamble, declared_points, declared_fields);

    std::uint64_t required = 0;
    if (!expectedSize(data.preamble, required) || bytes.size() < required) {
        throw SbfError(SbfErrorCode::PayloadTruncated,
                       "payload is " + std::to_string(bytes.size()) + " bytes, " +
                           std::to_string(data.preamble.point_count) + " rows need more");
    }

    const std::size_t columns = data.preamble.columns();
    const std::size_t rows = static_cast<std::size_t>(data.preamble.point_count);
    data.values.resize(rows * columns);
    for (std::size_t r = 0; r < rows; ++r) {
        decodeRow(bytes.data() + kPreambleSize + r * data.preamble.rowBytes(),
                  columns,
                  data.values.data() + r * columns);
    }
    return data;
}

std::vector<std::uint8_t> SbfPayloadCodec::writePayload(const Vec3& local_shift,
                                                        const std::vector<float>& matrix,
                                                        std::uint64_t rows,
                                                        std::size_t field_count) {
    checkFieldCount(field_count);

    PayloadPreamble preamble;
    preamble.point_count = rows;
    preamble.field_count = static_cast<std::uint16_t>(field_count);
    preamble.local_shift = local_shift;

    const std::size_t columns = preamble.columns();
    if (matrix.size() != rows * columns) {
        throw SbfError(SbfErrorCode::ColumnSizeMismatch,
                       "matrix holds " + std::to_string(matrix.size()) + " values, expected " +
                           std::to_string(rows * columns));
    }

    std::vector<std::uint8_t> bytes(kPreambleSize + matrix.size() * sizeof(float));
    encodePreamble(preamble, bytes.data());
    for (std::size_t r = 0; r < rows; ++r) {
        encodeRow(matrix.data() + r * columns,
                  columns,
                  bytes.data() + kPreambleSize + r * preamble.rowBytes());
    }
    return bytes;
}

SbfPayloadReader::SbfPayloadReader(std::istream& in) : in_(in) {}

const PayloadPreamble& SbfPayloadReader::readPreamble(std::uint64_t declared_points,
                                                      std::size_t declared_fields) {
    std::uint8_t raw[kPreambleSize];
    in_.read(reinterpret_cast<char*>(raw), kPreambleSize);
    if (static_cast<std::size_t>(in_.gcount()) != kPreambleSize) {
        throw SbfError(SbfErrorCode::PayloadTruncated, "payload is shorter than the 64-byte preamble");
    }

    preamble_ = SbfPayloadCodec::decodePreamble(raw);
    SbfPayloadCodec::checkAgainstHeader(preamble_, declared_points, declared_fields);

    std::uint64_t required = 0;
    if (!SbfPayloadCodec::expectedSize(preamble_, required)) {
        throw SbfError(SbfErrorCode::PayloadTruncated, "declared payload size overflows");
    }

    // Seekable streams are checked up front so nothing is allocated for a short file
    size_verified_ = false;
    const std::istream::pos_type body_start = in_.tellg();
    if (body_start != std::istream::pos_type(-1)) {
        in_.seekg(0, std::ios::end);
        const std::istream::pos_type end = in_.tellg();
        in_.seekg(body_start);
        if (end != std::istream::pos_type(-1)) {
            if (static_cast<std::uint64_t>(end - body_start) < required - kPreambleSize) {
                throw SbfError(SbfErrorCode::PayloadTruncated,
                               "payload body is " + std::to_string(end - body_start) + " bytes, " +
                                   std::to_string(required - kPreambleSize) + " expected");
            }
            size_verified_ = true;
        }
    }
    in_.clear();

    buffer_.resize(preamble_.rowBytes());
    rows_read_ = 0;
    return preamble_;
}

void SbfPayloadReader::readRow(std::vector<float>& row) {
    if (rows_read_ >= preamble_.point_count) {
        throw SbfError(SbfErrorCode::PayloadTruncated, "read past the declared point count");
    }
    in_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
    if (static_cast<std::size_t>(in_.gcount()) != buffer_.size()) {
        throw SbfError(SbfErrorCode::PayloadTruncated,
                       "payload ends at row " + std::to_string(rows_read_) + " of " +
                           std::to_string(preamble_.point_count));
    }
    row.resize(preamble_.columns());
    SbfPayloadCodec::decodeRow(buffer_.data(), row.size(), row.data());
    ++rows_read_;
}

SbfPayloadWriter::SbfPayloadWriter(std::ostream& out) : out_(out) {}

void SbfPayloadWriter::writePreamble(const PayloadPreamble& preamble) {
    std::uint8_t raw[kPreambleSize];
    SbfPayloadCodec::encodePreamble(preamble, raw);
    out_.write(reinterpret_cast<const char*>(raw), kPreambleSize);
    columns_ = preamble.columns();
    buffer_.resize(preamble.rowBytes());
}

void SbfPayloadWriter::writeRow(const std::vector<float>& row) {
    if (row.size() != columns_) {
        throw SbfError(SbfErrorCode::ColumnSizeMismatch,
                       "row has " + std::to_string(row.size()) + " values, expected " +
                           std::to_string(columns_));
    }
    SbfPayloadCodec::encodeRow(row.data(), row.size(), buffer_.data());
    out_.write(reinterpret_cast<const char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
}

}  // namespace sbf_cloud
