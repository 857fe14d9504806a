/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>
#include <raggedform/log/log.hpp>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    auto res = RUN_ALL_TESTS();
    raggedform::log::Loggers::instance().flush_all();
    return res;
}
