// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/core/SbfDocument.hpp"

#include <iterator>
#include <sstream>

#include "sbf_cloud/core/SbfError.hpp"
#include "sbf_cloud/core/SbfPayload.hpp"
#include "sbf_cloud/core/ShiftComposer.hpp"

namespace sbf_cloud {

SbfDocument::SbfDocument() = default;

SbfDocument SbfDocument::fromArrays(PointMatrix points,
                                    const std::vector<std::string>& field_names,
                                    std::vector<std::vector<float>> columns,
                                    const Vec3& global_shift) {
    if (field_names.size() != columns.size()) {
        throw SbfError(SbfErrorCode::ColumnSizeMismatch,
                       std::to_string(field_names.size()) + " names for " +
                           std::to_string(columns.size()) + " columns");
    }

    SbfDocument document;
    document.header_.global_shift = global_shift;
    document.fields_ = ScalarFieldTable(points.size());
    for (std::size_t i = 0; i < columns.size(); ++i) {
        document.fields_.add(field_names[i], std::move(columns[i]));
    }
    document.points_ = std::move(points);
    return document;
}

SbfDocument SbfDocument::open(const std::string& header_text, const std::vector<std::uint8_t>& payload) {
    SbfDocument document;
    document.header_ = SbfHeaderCodec::parse(header_text);
    const std::size_t field_count = document.header_.fieldCount();

    PayloadData data = SbfPayloadCodec::readPayload(payload, document.header_.points, field_count);
    document.local_shift_ = data.preamble.local_shift;

    const auto point_count = static_cast<std::size_t>(data.preamble.point_count);
    const std::size_t columns_per_row = data.preamble.columns();
    document.points_.reserve(point_count);
    std::vector<std::vector<float>> columns(field_count, std::vector<float>(point_count));
    for (std::size_t r = 0; r < point_count; ++r) {
        const float* row = data.values.data() + r * columns_per_row;
        document.points_.push_back(
            ShiftComposer::compose(row, document.local_shift_, document.header_.global_shift));
        for (std::size_t c = 0; c < field_count; ++c) {
            columns[c][r] = row[kCoordinateColumns + c];
        }
    }
    data.values.clear();
    data.values.shrink_to_fit();

    document.fields_ = ScalarFieldTable(point_count);
    for (std::size_t c = 0; c < field_count; ++c) {
        document.fields_.add(document.header_.field_names[c], std::move(columns[c]));
    }
    document.attachFieldEntries();
    return document;
}

SbfDocument SbfDocument::open(std::istream& header, std::istream& payload) {
    const std::string header_text((std::istreambuf_iterator<char>(header)),
                                  std::istreambuf_iterator<char>());

    SbfDocument document;
    document.header_ = SbfHeaderCodec::parse(header_text);
    const std::size_t field_count = document.header_.fieldCount();

    SbfPayloadReader reader(payload);
    const PayloadPreamble& preamble = reader.readPreamble(document.header_.points, field_count);
    document.local_shift_ = preamble.local_shift;

    const auto point_count = static_cast<std::size_t>(preamble.point_count);
    std::vector<std::vector<float>> columns(field_count);
    // A non-seekable stream may declare more rows than it holds
    if (reader.sizeVerified()) {
        document.points_.reserve(point_count);
        for (auto& values : columns) {
            values.reserve(point_count);
        }
    }

    std::vector<float> row;
    for (std::size_t r = 0; r < point_count; ++r) {
        reader.readRow(row);
        document.points_.push_back(
            ShiftComposer::compose(row.data(), document.local_shift_, document.header_.global_shift));
        for (std::size_t c = 0; c < field_count; ++c) {
            columns[c].push_back(row[kCoordinateColumns + c]);
        }
    }

    document.fields_ = ScalarFieldTable(point_count);
    for (std::size_t c = 0; c < field_count; ++c) {
        document.fields_.add(document.header_.field_names[c], std::move(columns[c]));
    }
    document.attachFieldEntries();
    return document;
}

void SbfDocument::attachFieldEntries() {
    std::vector<HeaderEntry> remaining;
    for (auto& entry : header_.extra_entries) {
        std::uint64_t number = 0;
        std::string suffix;
        if (SbfHeaderCodec::parseFieldAttributeKey(entry.key, number, suffix) &&
            number <= header_.field_names.size()) {
            field_entries_[header_.field_names[number - 1]].push_back({suffix, entry.value});
        } else {
            remaining.push_back(std::move(entry));
        }
    }
    header_.extra_entries = std::move(remaining);
}

SbfHeader SbfDocument::buildHeader() const {
    SbfHeader header = header_;
    header.points = points_.size();
    header.field_names = fields_.names();

    std::vector<HeaderEntry> entries;
    for (std::size_t i = 0; i < header.field_names.size(); ++i) {
        const auto found = field_entries_.find(header.field_names[i]);
        if (found == field_entries_.end()) {
            continue;
        }
        for (const auto& entry : found->second) {
            entries.push_back({"SF" + std::to_string(i + 1) + entry.key, entry.value});
        }
    }
    entries.insert(entries.end(), header_.extra_entries.begin(), header_.extra_entries.end());
    header.extra_entries = std::move(entries);
    return header;
}

void SbfDocument::save(std::ostream& header_out, std::ostream& payload_out) const {
    if (fields_.size() > kMaxScalarFields) {
        throw SbfError(SbfErrorCode::PayloadMalformed,
                       "too many scalar fields for the payload format: " +
                           std::to_string(fields_.size()));
    }

    header_out << SbfHeaderCodec::serialize(buildHeader());

    PayloadPreamble preamble;
    preamble.point_count = points_.size();
    preamble.field_count = static_cast<std::uint16_t>(fields_.size());
    preamble.local_shift = ShiftComposer::computeLocalShift(points_, header_.global_shift);

    SbfPayloadWriter writer(payload_out);
    writer.writePreamble(preamble);

    std::vector<float> row(preamble.columns());
    for (std::size_t r = 0; r < points_.size(); ++r) {
        ShiftComposer::decompose(points_[r], preamble.local_shift, header_.global_shift, row.data());
        for (std::size_t c = 0; c < fields_.size(); ++c) {
            row[kCoordinateColumns + c] = fields_.at(c).values[r];
        }
        writer.writeRow(row);
    }
}

SerializedSbf SbfDocument::save() const {
    std::ostringstream header;
    std::ostringstream payload(std::ios::binary);
    save(header, payload);

    SerializedSbf serialized;
    serialized.header_text = header.str();
    const std::string bytes = payload.str();
    serialized.payload.assign(bytes.begin(), bytes.end());
    return serialized;
}

void SbfDocument::setGlobalShift(const Vec3& global_shift) {
    header_.global_shift = global_shift;
}

void SbfDocument::dropGlobalShift() {
    header_.global_shift = {0.0, 0.0, 0.0};
}

void SbfDocument::addScalarField(const std::string& name, std::vector<float> values) {
    fields_.add(name, std::move(values));
}

void SbfDocument::removeScalarField(const std::string& name) {
    fields_.remove(name);
    field_entries_.erase(name);
}

void SbfDocument::renameScalarField(const std::string& name, const std::string& new_name) {
    fields_.rename(name, new_name);
    if (name == new_name) {
        return;
    }
    auto found = field_entries_.find(name);
    if (found != field_entries_.end()) {
        field_entries_[new_name] = std::move(found->second);
        field_entries_.erase(name);
    }
}

void SbfDocument::removeAllScalarFields() {
    fields_.clear();
    field_entries_.clear();
}

void SbfDocument::addIndexField(const std::string& name) {
    std::vector<float> index(points_.size());
    for (std::size_t i = 0; i < index.size(); ++i) {
        index[i] = static_cast<float>(i);
    }
    fields_.add(name, std::move(index));
}

void SbfDocument::addNormals(const PointMatrix& normals) {
    if (normals.size() != points_.size()) {
        throw SbfError(SbfErrorCode::ColumnSizeMismatch,
                       std::to_string(normals.size()) + " normals for " +
                           std::to_string(points_.size()) + " points");
    }

    std::vector<ScalarField> group = {{"Nx", {}}, {"Ny", {}}, {"Nz", {}}};
    for (std::size_t axis = 0; axis < 3; ++axis) {
        group[axis].values.reserve(normals.size());
        for (const auto& normal : normals) {
            group[axis].values.push_back(static_cast<float>(normal[axis]));
        }
    }
    fields_.addGroup(std::move(group));
}

}  // namespace sbf_cloud
