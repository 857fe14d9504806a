/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/forms/form.hpp>

#include <folly/Function.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace raggedform {

/// Names the buffer holding `attribute` ("data", "offsets", "mask", ...) of one node
using BufferKeyFn = folly::Function<std::string(const Form&, std::string_view) const>;

struct ExpectedBuffer {
    std::string key_;
    Primitive dtype_;

    bool operator==(const ExpectedBuffer& other) const = default;
};

/*
 * Calls `visitor` with every buffer a provider must supply to hydrate an array of this shape, parents
 * before children. Each node reports the auxiliary arrays it owns itself (NumpyForm its "data",
 * ListForm "starts" and "stops", ListOffsetForm "offsets", the indexed forms "index", the masked forms
 * "mask", UnionForm "tags" and "index"); with `recursive` the children follow in order.
 */
void visit_expected_buffers(
    const Form& form,
    const BufferKeyFn& getkey,
    bool recursive,
    folly::FunctionRef<void(const ExpectedBuffer&)> visitor);

std::vector<ExpectedBuffer> expected_from_buffers(const Form& form, const BufferKeyFn& getkey, bool recursive = true);

/// The conventional namer, "{form_key}-{attribute}". Raises if a node has no form_key.
BufferKeyFn form_key_buffer_namer();

/// Copy of the tree whose nodes are keyed `prefix0`, `prefix1`, ... in pre-order
FormPtr with_form_keys(const Form& form, std::string_view prefix = "node");

using BufferContainer = std::unordered_map<std::string, std::vector<uint8_t>>;

/*
 * Canned buffers for a synthetic array of length zero or one: one zero-filled buffer under the key ""
 * and a namer sending every request there. Every index, offset, mask and tag then reads as zero.
 */
struct StubBuffers {
    uint64_t length_;
    BufferContainer container_;
    BufferKeyFn buffer_key_;
};

StubBuffers length_zero_buffers(const Form& form);

StubBuffers length_one_buffers(const Form& form);

/// Bytes needed for every buffer of an array of `length` whose index values are all zero
uint64_t stub_buffer_size(const Form& form, uint64_t length);

} // namespace raggedform
