#include <unity.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "audio/CaptureBuffer.h"

using patchprobe::audio::CaptureBuffer;

void test_capture_buffer_interleaves_blocks_in_order() {
  CaptureBuffer buffer;
  buffer.open(2);
  const float left[] = {1.0f, 2.0f};
  const float right[] = {3.0f, 4.0f};
  const float* block[] = {left, right};
  TEST_ASSERT_TRUE(buffer.append(block, 2, 2));
  const float more[] = {5.0f};
  const float* second[] = {more, more};
  TEST_ASSERT_TRUE(buffer.append(second, 2, 1));
  buffer.seal();

  const auto clip = buffer.finish(48000.0);
  const std::vector<float> expected{1.0f, 3.0f, 2.0f, 4.0f, 5.0f, 5.0f};
  TEST_ASSERT_EQUAL_INT(2, clip.channels);
  TEST_ASSERT_EQUAL_INT(3, static_cast<int>(clip.frames()));
  TEST_ASSERT_EQUAL_FLOAT_ARRAY(expected.data(), clip.samples.data(), expected.size());
}

void test_capture_buffer_fills_missing_channels_with_silence() {
  CaptureBuffer buffer;
  buffer.open(2);
  const float mono[] = {0.5f, 0.5f};
  const float* narrow[] = {mono};
  TEST_ASSERT_TRUE(buffer.append(narrow, 1, 2));
  const float* holes[] = {nullptr, mono};
  TEST_ASSERT_TRUE(buffer.append(holes, 2, 2));
  buffer.seal();

  TEST_ASSERT_EQUAL_INT(1, static_cast<int>(buffer.shortBlocks()));
  const auto clip = buffer.finish(8000.0);
  const std::vector<float> expected{0.5f, 0.0f, 0.5f, 0.0f, 0.0f, 0.5f, 0.0f, 0.5f};
  TEST_ASSERT_EQUAL_FLOAT_ARRAY(expected.data(), clip.samples.data(), expected.size());
}

void test_capture_buffer_drops_blocks_after_seal() {
  CaptureBuffer buffer;
  const float data[] = {1.0f};
  const float* block[] = {data};

  // A fresh buffer is sealed until opened.
  TEST_ASSERT_FALSE(buffer.append(block, 1, 1));
  buffer.open(1);
  TEST_ASSERT_TRUE(buffer.finish(8000.0).empty());  // not sealed yet, nothing handed out
  TEST_ASSERT_TRUE(buffer.append(block, 1, 1));
  buffer.seal();
  TEST_ASSERT_TRUE(buffer.sealed());
  TEST_ASSERT_FALSE(buffer.append(block, 1, 1));
  TEST_ASSERT_EQUAL_INT(1, static_cast<int>(buffer.chunkCount()));
  TEST_ASSERT_EQUAL_INT(1, static_cast<int>(buffer.finish(8000.0).frames()));
}

void test_capture_buffer_seal_fences_a_running_producer() {
  CaptureBuffer buffer;
  buffer.open(1);
  std::atomic<bool> quit{false};
  std::atomic<int> accepted{0};
  std::thread producer([&] {
    std::vector<float> samples(64, 0.25f);
    const float* block[] = {samples.data()};
    while (!quit.load()) {
      if (buffer.append(block, 1, 64)) {
        accepted.fetch_add(1);
      }
    }
  });

  while (accepted.load() < 10) {
    std::this_thread::yield();
  }
  buffer.seal();
  const auto chunksAtSeal = buffer.chunkCount();
  const int acceptedAtSeal = accepted.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  quit.store(true);
  producer.join();

  TEST_ASSERT_EQUAL_INT(static_cast<int>(chunksAtSeal), static_cast<int>(buffer.chunkCount()));
  // At most the append that was counting itself when seal() returned.
  TEST_ASSERT_TRUE(accepted.load() - acceptedAtSeal <= 1);
  const auto clip = buffer.finish(8000.0);
  TEST_ASSERT_EQUAL_INT(static_cast<int>(chunksAtSeal) * 64, static_cast<int>(clip.frames()));
}
