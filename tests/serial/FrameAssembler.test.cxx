// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "serial/FrameAssembler.hxx"
#include "protocol/Protocol.hxx"

using namespace neewerLink;

static std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

static void test_skips_garbage_before_sentinel() {
    FrameAssembler fa;
    const auto bytes = concat({{0x00, 0xFF, 0x11}, Protocol::encodeCctCommand(50, 4950)});
    const auto statuses = fa.feed(bytes.data(), bytes.size());

    TEST_ASSERT_EQUAL_size_t(1, statuses.size());
    TEST_ASSERT_EQUAL_UINT8(50, statuses[0].brightness);
    TEST_ASSERT_EQUAL_UINT32(4950, statuses[0].kelvin);
    TEST_ASSERT_EQUAL_UINT32(3, fa.bytesDiscarded());
    TEST_ASSERT_EQUAL_size_t(0, fa.buffered());
}

static void test_invalid_window_is_dropped_whole() {
    FrameAssembler fa;
    auto corrupted = Protocol::encodeCctCommand(10, 2900);
    corrupted[7] ^= 0xFF;
    const auto bytes = concat({corrupted, Protocol::encodeCctCommand(75, 7000)});
    const auto statuses = fa.feed(bytes.data(), bytes.size());

    TEST_ASSERT_EQUAL_size_t(1, statuses.size());
    TEST_ASSERT_EQUAL_UINT8(75, statuses[0].brightness);
    TEST_ASSERT_EQUAL_UINT32(7000, statuses[0].kelvin);
    TEST_ASSERT_EQUAL_UINT32(1, fa.framesRejected());
    TEST_ASSERT_EQUAL_UINT32(1, fa.framesDecoded());
    TEST_ASSERT_EQUAL_size_t(0, fa.buffered());
}

static void test_no_rescan_inside_dropped_window() {
    // A sentinel inside a rejected window is not a resync point
    FrameAssembler fa;
    const std::vector<uint8_t> bytes = {0x3A, 0x02, 0x3A, 0x02, 0x03, 0x01, 0x32, 0x09};
    const auto statuses = fa.feed(bytes.data(), bytes.size());

    TEST_ASSERT_EQUAL_size_t(0, statuses.size());
    TEST_ASSERT_EQUAL_UINT32(1, fa.framesRejected());
    TEST_ASSERT_EQUAL_size_t(0, fa.buffered());
}

static void test_frame_split_across_reads() {
    FrameAssembler fa;
    const auto frame = Protocol::encodeCctCommand(30, 3600);

    auto statuses = fa.feed(frame.data(), 5);
    TEST_ASSERT_EQUAL_size_t(0, statuses.size());
    TEST_ASSERT_EQUAL_size_t(5, fa.buffered());

    statuses = fa.feed(frame.data() + 5, frame.size() - 5);
    TEST_ASSERT_EQUAL_size_t(1, statuses.size());
    TEST_ASSERT_EQUAL_UINT8(30, statuses[0].brightness);
    TEST_ASSERT_EQUAL_UINT32(Protocol::byteToKelvin(Protocol::kelvinToByte(3600)), statuses[0].kelvin);
}

static void test_buffer_without_sentinel_is_cleared() {
    FrameAssembler fa;
    const std::vector<uint8_t> bytes = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    const auto statuses = fa.feed(bytes.data(), bytes.size());

    TEST_ASSERT_EQUAL_size_t(0, statuses.size());
    TEST_ASSERT_EQUAL_size_t(0, fa.buffered());
    TEST_ASSERT_EQUAL_UINT32(9, fa.bytesDiscarded());
}

static void test_partial_frame_is_kept() {
    FrameAssembler fa;
    const std::vector<uint8_t> bytes = {0x42, 0x3A, 0x02, 0x03};
    const auto statuses = fa.feed(bytes.data(), bytes.size());

    TEST_ASSERT_EQUAL_size_t(0, statuses.size());
    TEST_ASSERT_EQUAL_size_t(3, fa.buffered());
}

static void test_back_to_back_frames_in_order() {
    FrameAssembler fa;
    const auto bytes = concat({Protocol::encodeCctCommand(1, 2900),
                               Protocol::encodeCctCommand(2, 4950),
                               Protocol::encodeCctCommand(3, 7000)});
    const auto statuses = fa.feed(bytes.data(), bytes.size());

    TEST_ASSERT_EQUAL_size_t(3, statuses.size());
    TEST_ASSERT_EQUAL_UINT8(1, statuses[0].brightness);
    TEST_ASSERT_EQUAL_UINT8(2, statuses[1].brightness);
    TEST_ASSERT_EQUAL_UINT8(3, statuses[2].brightness);
    TEST_ASSERT_EQUAL_UINT32(2900, statuses[0].kelvin);
    TEST_ASSERT_EQUAL_UINT32(7000, statuses[2].kelvin);
}

static void test_reset_clears_state() {
    FrameAssembler fa;
    const std::vector<uint8_t> bytes = {0x00, 0x3A, 0x02};
    (void)fa.feed(bytes.data(), bytes.size());
    TEST_ASSERT_EQUAL_size_t(2, fa.buffered());

    fa.reset();
    TEST_ASSERT_EQUAL_size_t(0, fa.buffered());
    TEST_ASSERT_EQUAL_UINT32(0, fa.bytesDiscarded());
}

void run_frame_assembler_tests() {
    RUN_TEST(test_skips_garbage_before_sentinel);
    RUN_TEST(test_invalid_window_is_dropped_whole);
    RUN_TEST(test_no_rescan_inside_dropped_window);
    RUN_TEST(test_frame_split_across_reads);
    RUN_TEST(test_buffer_without_sentinel_is_cleared);
    RUN_TEST(test_partial_frame_is_kept);
    RUN_TEST(test_back_to_back_frames_in_order);
    RUN_TEST(test_reset_clears_state);
}
