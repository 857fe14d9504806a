/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <raggedform/util/configs_map.hpp>

using namespace raggedform;

TEST(ConfigsMap, CaseInsensitiveLookup) {
    ConfigsMap::instance()->set_int("Test.SomeKnob", 12);
    ASSERT_EQ(ConfigsMap::instance()->get_int("TEST.SOMEKNOB", 0), 12);
    ASSERT_EQ(ConfigsMap::instance()->get_int("test.someknob"), std::make_optional<int64_t>(12));
    ConfigsMap::instance()->unset_int("Test.SomeKnob");
    ASSERT_FALSE(ConfigsMap::instance()->get_int("Test.SomeKnob").has_value());
}

TEST(ConfigsMap, DefaultsWhenUnset) {
    ASSERT_EQ(ConfigsMap::instance()->get_int("Test.NeverSet", 4), 4);
    ASSERT_FALSE(ConfigsMap::instance()->get_int("Test.NeverSet").has_value());
}

TEST(ConfigsMap, ScopedConfigRestores) {
    ConfigsMap::instance()->set_int("Test.Scoped", 1);
    {
        ScopedConfig scoped("Test.Scoped", 2);
        ASSERT_EQ(ConfigsMap::instance()->get_int("Test.Scoped", 0), 2);
    }
    ASSERT_EQ(ConfigsMap::instance()->get_int("Test.Scoped", 0), 1);

    {
        ScopedConfig scoped("Test.ScopedFresh", 5);
        ASSERT_EQ(ConfigsMap::instance()->get_int("Test.ScopedFresh", 0), 5);
    }
    ASSERT_FALSE(ConfigsMap::instance()->get_int("Test.ScopedFresh").has_value());
    ConfigsMap::instance()->unset_int("Test.Scoped");
}

TEST(ConfigsMap, ScopedConfigCanUnset) {
    ConfigsMap::instance()->set_int("Test.Cleared", 3);
    {
        ScopedConfig scoped(ScopedConfig::ConfigOptions{{"Test.Cleared", std::nullopt}});
        ASSERT_FALSE(ConfigsMap::instance()->get_int("Test.Cleared").has_value());
    }
    ASSERT_EQ(ConfigsMap::instance()->get_int("Test.Cleared", 0), 3);
    ConfigsMap::instance()->unset_int("Test.Cleared");
}
