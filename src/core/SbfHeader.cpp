// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sbf_cloud/core/SbfHeader.hpp"

#include <cmath>
#include <limits>
#include <locale>
#include <map>
#include <sstream>

#include "sbf_cloud/core/SbfError.hpp"

namespace sbf_cloud {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool parseUnsigned(const std::string& text, std::uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    std::uint64_t result = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return false;
        }
        result = result * 10 + digit;
    }
    value = result;
    return true;
}

// Decimal literal only: no hex, nan, inf or expressions
bool parseReal(const std::string& token, double& value) {
    if (token.empty()) {
        return false;
    }
    bool has_digit = false;
    for (char c : token) {
        if (c >= '0' && c <= '9') {
            has_digit = true;
        } else if (c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
            return false;
        }
    }
    if (!has_digit) {
        return false;
    }

    std::istringstream iss(token);
    iss.imbue(std::locale::classic());
    double parsed = 0.0;
    iss >> parsed;
    if (iss.fail()) {
        return false;
    }
    iss.peek();
    if (!iss.eof() || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

std::string formatReal(double value) {
    for (int precision : {15, std::numeric_limits<double>::max_digits10}) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss.precision(precision);
        oss << value;
        double round_trip = 0.0;
        if (parseReal(oss.str(), round_trip) && round_trip == value) {
            return oss.str();
        }
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.precision(std::numeric_limits<double>::max_digits10);
    oss << value;
    return oss.str();
}

[[noreturn]] void malformed(const std::string& message) {
    throw SbfError(SbfErrorCode::HeaderMalformed, message);
}

}  // namespace

bool SbfHeaderCodec::parseFieldKey(const std::string& key, std::uint64_t& number) {
    if (key.size() < 3 || key.compare(0, 2, "SF") != 0) {
        return false;
    }
    return parseUnsigned(key.substr(2), number);
}

bool SbfHeaderCodec::parseFieldAttributeKey(const std::string& key, std::uint64_t& number,
                                            std::string& suffix) {
    const auto underscore = key.find('_');
    if (underscore == std::string::npos || underscore + 1 >= key.size()) {
        return false;
    }
    const std::string field_key = key.substr(0, underscore);
    if (!parseFieldKey(field_key, number) || number == 0 || field_key != "SF" + std::to_string(number)) {
        return false;
    }
    suffix = key.substr(underscore);
    return true;
}

Vec3 SbfHeaderCodec::parseGlobalShift(const std::string& value) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        const auto comma = value.find(',', start);
        parts.push_back(trim(value.substr(start, comma == std::string::npos ? std::string::npos
                                                                            : comma - start)));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    if (parts.size() != 3) {
        throw SbfError(SbfErrorCode::GlobalShiftMalformed,
                       "expected three comma separated values, got '" + value + "'");
    }

    Vec3 shift{0.0, 0.0, 0.0};
    for (std::size_t i = 0; i < 3; ++i) {
        if (!parseReal(parts[i], shift[i])) {
            throw SbfError(SbfErrorCode::GlobalShiftMalformed,
                           "invalid component '" + parts[i] + "' in '" + value + "'");
        }
    }
    return shift;
}

std::string SbfHeaderCodec::formatGlobalShift(const Vec3& shift) {
    return formatReal(shift[0]) + ", " + formatReal(shift[1]) + ", " + formatReal(shift[2]);
}

std::vector<HeaderSection> SbfHeaderCodec::parseSections(const std::string& text) {
    std::vector<HeaderSection> sections;
    std::istringstream stream(text);
    std::string raw;
    std::size_t line_number = 0;

    while (std::getline(stream, raw)) {
        ++line_number;
        const std::string line = trim(raw);
        if (line.empty()) {
            continue;
        }

        const std::string where = "line " + std::to_string(line_number);

        if (line.front() == '[') {
            if (line.back() != ']') {
                malformed(where + ": unterminated section name");
            }
            const std::string name = trim(line.substr(1, line.size() - 2));
            if (name.empty()) {
                malformed(where + ": empty section name");
            }
            for (const auto& section : sections) {
                if (section.name == name) {
                    malformed(where + ": duplicate section [" + name + "]");
                }
            }
            sections.push_back({name, {}});
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            malformed(where + ": expected 'key = value'");
        }
        if (sections.empty()) {
            malformed(where + ": key outside of any section");
        }

        HeaderEntry entry{trim(line.substr(0, eq)), trim(line.substr(eq + 1))};
        if (entry.key.empty()) {
            malformed(where + ": empty key");
        }
        auto& entries = sections.back().entries;
        for (const auto& existing : entries) {
            if (existing.key == entry.key) {
                malformed(where + ": duplicate key '" + entry.key + "'");
            }
        }
        entries.push_back(std::move(entry));
    }

    return sections;
}

SbfHeader SbfHeaderCodec::parse(const std::string& text) {
    std::vector<HeaderSection> sections = parseSections(text);

    SbfHeader header;
    const HeaderSection* sbf = nullptr;
    for (const auto& section : sections) {
        if (section.name == kSectionName) {
            sbf = &section;
        } else {
            header.other_sections.push_back(section);
        }
    }
    if (sbf == nullptr) {
        malformed("no [SBF] section");
    }

    bool has_points = false;
    std::uint64_t field_count = 0;
    std::map<std::uint64_t, std::string> numbered_fields;

    for (const auto& entry : sbf->entries) {
        std::uint64_t number = 0;
        if (entry.key == kPointsKey) {
            if (!parseUnsigned(entry.value, header.points)) {
                malformed("Points is not a non-negative integer: '" + entry.value + "'");
            }
            has_points = true;
        } else if (entry.key == kFieldCountKey) {
            if (!parseUnsigned(entry.value, field_count)) {
                malformed("SFCount is not a non-negative integer: '" + entry.value + "'");
            }
        } else if (entry.key == kGlobalShiftKey) {
            header.global_shift = parseGlobalShift(entry.value);
        } else if (parseFieldKey(entry.key, number)) {
            if (entry.key != "SF" + std::to_string(number)) {
                malformed("non canonical scalar field key '" + entry.key + "'");
            }
            numbered_fields.emplace(number, entry.value);
        } else {
            header.extra_entries.push_back(entry);
        }
    }

    if (!has_points) {
        malformed("missing Points");
    }
    if (numbered_fields.size() != field_count) {
        malformed("SFCount is " + std::to_string(field_count) + " but " +
                  std::to_string(numbered_fields.size()) + " SF keys are present");
    }

    // map is ordered, so a contiguous 1..N sequence ends exactly at N
    std::uint64_t expected = 1;
    for (const auto& [number, name] : numbered_fields) {
        if (number != expected) {
            malformed("scalar field keys are not contiguous: missing SF" + std::to_string(expected));
        }
        if (name.empty()) {
            malformed("SF" + std::to_string(number) + " has an empty name");
        }
        for (const auto& existing : header.field_names) {
            if (existing == name) {
                malformed("duplicate scalar field name '" + name + "'");
            }
        }
        header.field_names.push_back(name);
        ++expected;
    }

    return header;
}

std::string SbfHeaderCodec::serialize(const SbfHeader& header) {
    std::ostringstream out;
    out.imbue(std::locale::classic());

    out << "[" << kSectionName << "]\n";
    out << kPointsKey << " = " << header.points << "\n";
    out << kFieldCountKey << " = " << header.field_names.size() << "\n";
    out << kGlobalShiftKey << " = " << formatGlobalShift(header.global_shift) << "\n";
    for (std::size_t i = 0; i < header.field_names.size(); ++i) {
        out << "SF" << (i + 1) << " = " << header.field_names[i] << "\n";
    }
    for (const auto& entry : header.extra_entries) {
        out << entry.key << " = " << entry.value << "\n";
    }

    for (const auto& section : header.other_sections) {
        out << "\n[" << section.name << "]\n";
        for (const auto& entry : section.entries) {
            out << entry.key << " = " << entry.value << "\n";
        }
    }

    return out.str();
}

}  // namespace sbf_cloud
