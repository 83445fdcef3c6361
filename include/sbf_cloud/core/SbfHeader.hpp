// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_CORE_SBF_HEADER_HPP
#define SBF_CLOUD_CORE_SBF_HEADER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "sbf_cloud/core/SbfTypes.hpp"

namespace sbf_cloud {

struct HeaderEntry {
    std::string key;
    std::string value;
};

struct HeaderSection {
    std::string name;
    std::vector<HeaderEntry> entries;
};

// Structured view of a .sbf text header.
// Points, SFCount, GlobalShift and SF1..SFN are decoded into typed members;
// every other key of [SBF] and every other section is kept verbatim.
struct SbfHeader {
    std::uint64_t points = 0;
    std::vector<std::string> field_names;  // SF1..SFN in numeric order
    Vec3 global_shift{0.0, 0.0, 0.0};
    std::vector<HeaderEntry> extra_entries;
    std::vector<HeaderSection> other_sections;

    std::size_t fieldCount() const { return field_names.size(); }
};

// Text codec for the INI-style .sbf header
class SbfHeaderCodec {
public:
    static constexpr const char* kSectionName = "SBF";
    static constexpr const char* kPointsKey = "Points";
    static constexpr const char* kFieldCountKey = "SFCount";
    static constexpr const char* kGlobalShiftKey = "GlobalShift";

    // Throws SbfError(HeaderMalformed / GlobalShiftMalformed)
    static SbfHeader parse(const std::string& text);

    static std::string serialize(const SbfHeader& header);

    // Accepts exactly "x, y, z" (surrounding whitespace allowed)
    static Vec3 parseGlobalShift(const std::string& value);

    static std::string formatGlobalShift(const Vec3& shift);

    // "SF7" -> 7. Returns false for keys that are not field keys.
    static bool parseFieldKey(const std::string& key, std::uint64_t& number);

    // "SF2_Shift" -> 2, "_Shift". Only canonical numbers match.
    static bool parseFieldAttributeKey(const std::string& key, std::uint64_t& number, std::string& suffix);

private:
    static std::vector<HeaderSection> parseSections(const std::string& text);
};

}  // namespace sbf_cloud

#endif  // SBF_CLOUD_CORE_SBF_HEADER_HPP
