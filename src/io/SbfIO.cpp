// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/io/SbfIO.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include "sbf_cloud/core/SbfError.hpp"
#include "sbf_cloud/core/SbfPayload.hpp"

namespace sbf_cloud {

namespace fs = std::filesystem;

std::string SbfIO::payloadPathFor(const std::string& filename) {
    return filename + ".data";
}

bool SbfIO::exists(const std::string& filename) {
    return fs::is_regular_file(filename) && fs::is_regular_file(payloadPathFor(filename));
}

SbfDocument SbfIO::readSbf(const std::string& filename) {
    auto t0 = std::chrono::high_resolution_clock::now();
    const std::string payload_path = payloadPathFor(filename);

    if (!fs::exists(filename)) {
        throw SbfError(SbfErrorCode::FileNotFound, "File does not exist: " + filename);
    }
    if (!fs::exists(payload_path)) {
        throw SbfError(SbfErrorCode::FileNotFound, "Payload does not exist: " + payload_path);
    }

    std::ifstream header(filename);
    if (!header.is_open()) {
        throw SbfError(SbfErrorCode::IoFailure, "Cannot open file: " + filename);
    }
    std::ifstream payload(payload_path, std::ios::binary);
    if (!payload.is_open()) {
        throw SbfError(SbfErrorCode::IoFailure, "Cannot open file: " + payload_path);
    }

    SbfDocument document = SbfDocument::open(header, payload);
    if (payload.bad()) {
        throw SbfError(SbfErrorCode::IoFailure, "Read error on " + payload_path);
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    double total_ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][SbfIO] read file='" << filename << "' total=" << total_ms
              << " ms, points=" << document.pointCount()
              << ", fields=" << document.fieldCount() << std::endl;
    return document;
}

void SbfIO::writeSbf(const std::string& filename, const SbfDocument& document) {
    auto t0 = std::chrono::high_resolution_clock::now();
    const std::string payload_path = payloadPathFor(filename);

    fs::path filepath(filename);
    fs::path dir = filepath.parent_path();
    if (!dir.empty() && !fs::exists(dir)) {
        throw SbfError(SbfErrorCode::IoFailure, "Directory does not exist: " + dir.string());
    }

    if (document.fieldCount() > kMaxScalarFields) {
        throw SbfError(SbfErrorCode::PayloadMalformed,
                       "too many scalar fields for the payload format: " +
                           std::to_string(document.fieldCount()));
    }

    // Existing files are replaced only after both temporaries are complete
    const std::string header_tmp = filename + ".tmp";
    const std::string payload_tmp = payload_path + ".tmp";
    const auto discard = [&]() {
        std::error_code ec;
        fs::remove(header_tmp, ec);
        fs::remove(payload_tmp, ec);
    };

    bool ok = false;
    {
        std::ofstream header(header_tmp);
        if (!header.is_open()) {
            throw SbfError(SbfErrorCode::IoFailure, "Cannot create file: " + header_tmp);
        }
        std::ofstream payload(payload_tmp, std::ios::binary);
        if (!payload.is_open()) {
            header.close();
            discard();
            throw SbfError(SbfErrorCode::IoFailure, "Cannot create file: " + payload_tmp);
        }

        try {
            document.save(header, payload);
        } catch (...) {
            header.close();
            payload.close();
            discard();
            throw;
        }
        header.flush();
        payload.flush();
        ok = header.good() && payload.good();
    }

    if (!ok) {
        discard();
        throw SbfError(SbfErrorCode::IoFailure, "Failed to write " + filename);
    }

    std::error_code ec;
    fs::rename(payload_tmp, payload_path, ec);
    if (!ec) {
        fs::rename(header_tmp, filename, ec);
    }
    if (ec) {
        discard();
        throw SbfError(SbfErrorCode::IoFailure, "Cannot replace " + filename + ": " + ec.message());
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    double total_ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][SbfIO] write file='" << filename << "' total=" << total_ms
              << " ms, points=" << document.pointCount()
              << ", fields=" << document.fieldCount() << std::endl;
}

std::string SbfIO::resolveDestination(const std::string& filename, const std::string& destination) {
    if (fs::is_directory(destination)) {
        return (fs::path(destination) / fs::path(filename).filename()).string();
    }
    return destination;
}

std::string SbfIO::copySbf(const std::string& filename, const std::string& destination) {
    if (!fs::exists(filename)) {
        throw SbfError(SbfErrorCode::FileNotFound, "File does not exist: " + filename);
    }
    const std::string target = resolveDestination(filename, destination);

    std::error_code ec;
    std::cout << "copy " << fs::path(filename).filename().string() << " to " << target << std::endl;
    fs::copy_file(filename, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw SbfError(SbfErrorCode::IoFailure, "Cannot copy " + filename + ": " + ec.message());
    }

    const std::string payload_path = payloadPathFor(filename);
    if (fs::exists(payload_path)) {
        fs::copy_file(payload_path, payloadPathFor(target), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw SbfError(SbfErrorCode::IoFailure, "Cannot copy " + payload_path + ": " + ec.message());
        }
    } else {
        std::cerr << "Warning: no payload next to " << filename << std::endl;
    }
    return target;
}

std::string SbfIO::moveSbf(const std::string& filename, const std::string& destination) {
    if (!fs::exists(filename)) {
        throw SbfError(SbfErrorCode::FileNotFound, "File does not exist: " + filename);
    }
    const std::string target = resolveDestination(filename, destination);

    const auto move_one = [](const std::string& from, const std::string& to) {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (!ec) {
            return;
        }
        // rename fails across filesystems
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::remove(from, ec);
        }
        if (ec) {
            throw SbfError(SbfErrorCode::IoFailure, "Cannot move " + from + ": " + ec.message());
        }
    };

    std::cout << "move " << fs::path(filename).filename().string() << " to " << target << std::endl;
    move_one(filename, target);
    const std::string payload_path = payloadPathFor(filename);
    if (fs::exists(payload_path)) {
        try {
            move_one(payload_path, payloadPathFor(target));
        } catch (const SbfError&) {
            std::error_code ec;
            fs::rename(target, filename, ec);
            if (ec) {
                std::cerr << "Warning: could not restore " << filename << ": " << ec.message() << std::endl;
            }
            throw;
        }
    }
    return target;
}

}  // namespace sbf_cloud
