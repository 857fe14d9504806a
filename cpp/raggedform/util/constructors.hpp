/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#define RAGGEDFORM_NO_MOVE_OR_COPY(__T__) \
    __T__(__T__ && ) noexcept = delete; \
    __T__& operator=(__T__ && )  noexcept = delete; \
    __T__(const __T__ & ) = delete; \
    __T__& operator=(const __T__ & ) = delete;
