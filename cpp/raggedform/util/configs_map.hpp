/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <boost/algorithm/string.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace raggedform {

/*
 * Process-wide integer knobs, looked up case-insensitively by dotted name. Readers pass the default
 * that applies while a knob is unset.
 */
class ConfigsMap {
public:
    static void init();
    static std::shared_ptr<ConfigsMap> instance();

    static std::shared_ptr<ConfigsMap> instance_;
    static std::once_flag init_flag_;

    void set_int(const std::string& label, int64_t val) {
        ints_[normalize(label)] = val;
    }

    int64_t get_int(const std::string& label, int64_t default_val) const {
        return get_int(label).value_or(default_val);
    }

    std::optional<int64_t> get_int(const std::string& label) const {
        auto it = ints_.find(normalize(label));
        if (it == ints_.cend())
            return std::nullopt;

        return it->second;
    }

    void unset_int(const std::string& label) {
        ints_.erase(normalize(label));
    }

private:
    static std::string normalize(const std::string& label) {
        return boost::to_upper_copy<std::string>(label);
    }

    std::unordered_map<std::string, int64_t> ints_;
};

/// Overrides integer knobs for its lifetime, restoring or unsetting them on destruction
struct ScopedConfig {
    using ConfigOptions = std::vector<std::pair<std::string, std::optional<int64_t>>>;

    ScopedConfig(std::string name, int64_t val) :
        ScopedConfig(ConfigOptions{{std::move(name), std::make_optional(val)}}) {
    }

    explicit ScopedConfig(ConfigOptions overrides) {
        auto configs = ConfigsMap::instance();
        for (auto& [name, new_value] : overrides) {
            auto old_value = configs->get_int(name);
            apply(name, new_value);
            originals_.emplace_back(std::move(name), old_value);
        }
    }

    ~ScopedConfig() {
        for (const auto& [name, original_value] : originals_)
            apply(name, original_value);
    }

private:
    static void apply(const std::string& name, const std::optional<int64_t>& value) {
        if (value.has_value())
            ConfigsMap::instance()->set_int(name, *value);
        else
            ConfigsMap::instance()->unset_int(name);
    }

    ConfigOptions originals_;
};

} //namespace raggedform
