// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SBF_CLOUD_UTILS_ERROR_ACCUMULATOR_HPP
#define SBF_CLOUD_UTILS_ERROR_ACCUMULATOR_HPP

#include <cstddef>
#include <string>

namespace sbf_cloud::utils {

// Joins non-empty messages with "; "
class ErrorAccumulator {
public:
    void add(const std::string& message) {
        if (message.empty()) {
            return;
        }
        if (!messages_.empty()) {
            messages_ += "; ";
        }
        messages_ += message;
        ++count_;
    }

    void add(const std::string& context, const std::string& message) {
        add(context.empty() ? message : context + ": " + message);
    }

    bool empty() const {
        return messages_.empty();
    }

    std::size_t count() const {
        return count_;
    }

    const std::string& str() const {
        return messages_;
    }

    void clear() {
        messages_.clear();
        count_ = 0;
    }

private:
    std::string messages_;
    std::size_t count_ = 0;
};

}  // namespace sbf_cloud::utils

#endif  // SBF_CLOUD_UTILS_ERROR_ACCUMULATOR_HPP
