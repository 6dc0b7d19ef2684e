/**
 * @file test_frame_codec.cpp
 * @brief Tests for frame_codec.hpp
 */

#include "meshlink/frame_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <vector>

using Bytes = std::vector<uint8_t>;

namespace {

struct Collector {
  std::vector<Bytes> payloads;

  static void OnPayload(const uint8_t* data, uint32_t size, void* ctx) {
    static_cast<Collector*>(ctx)->payloads.emplace_back(data, data + size);
  }

  uint32_t Feed(meshlink::FrameDecoder& dec, const Bytes& bytes) {
    return dec.Feed(bytes.data(), static_cast<uint32_t>(bytes.size()),
                    &Collector::OnPayload, this);
  }
};

Bytes Encode(const Bytes& payload) {
  Bytes out(meshlink::kMaxFrameSize);
  auto r = meshlink::EncodeFrame(payload.data(),
                                 static_cast<uint32_t>(payload.size()),
                                 out.data(), static_cast<uint32_t>(out.size()));
  REQUIRE(r.has_value());
  out.resize(r.value());
  return out;
}

Bytes Pattern(uint32_t size, uint8_t seed) {
  Bytes b(size);
  for (uint32_t i = 0; i < size; ++i) {
    b[i] = static_cast<uint8_t>(seed + i * 7U);
  }
  return b;
}

Bytes Concat(const Bytes& a, const Bytes& b) {
  Bytes out(a);
  out.insert(out.end(), b.begin(), b.end());
  return out;
}

}  // namespace

// ============================================================================
// Encoder
// ============================================================================

TEST_CASE("frame_codec - header layout", "[frame_codec]") {
  Bytes frame = Encode({0x01, 0x02, 0x03});
  REQUIRE(frame.size() == 7U);
  REQUIRE(frame[0] == 0x94);
  REQUIRE(frame[1] == 0xC3);
  REQUIRE(frame[2] == 0x00);
  REQUIRE(frame[3] == 0x03);
  REQUIRE(frame[4] == 0x01);
  REQUIRE(frame[6] == 0x03);
}

TEST_CASE("frame_codec - length is big-endian", "[frame_codec]") {
  Bytes frame = Encode(Pattern(300U, 1U));
  REQUIRE(frame[2] == 0x01);
  REQUIRE(frame[3] == 0x2C);
}

TEST_CASE("frame_codec - size boundary 512 accepted, 513 rejected",
          "[frame_codec]") {
  uint8_t out[meshlink::kMaxFrameSize + 8U];
  Bytes max_payload = Pattern(512U, 3U);
  auto ok = meshlink::EncodeFrame(max_payload.data(), 512U, out, sizeof(out));
  REQUIRE(ok.has_value());
  REQUIRE(ok.value() == 516U);

  Bytes too_big = Pattern(513U, 3U);
  auto bad = meshlink::EncodeFrame(too_big.data(), 513U, out, sizeof(out));
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == meshlink::LinkError::kPayloadTooLarge);
}

TEST_CASE("frame_codec - encode into short buffer fails", "[frame_codec]") {
  uint8_t out[6];
  Bytes payload = Pattern(4U, 0U);
  auto r = meshlink::EncodeFrame(payload.data(), 4U, out, sizeof(out));
  REQUIRE(!r.has_value());
}

// ============================================================================
// Decoder
// ============================================================================

TEST_CASE("frame_codec - round trip leaves empty buffer", "[frame_codec]") {
  for (uint32_t size : {1U, 2U, 63U, 255U, 256U, 511U, 512U}) {
    meshlink::FrameDecoder dec;
    Collector c;
    Bytes payload = Pattern(size, static_cast<uint8_t>(size));
    REQUIRE(c.Feed(dec, Encode(payload)) == 1U);
    REQUIRE(c.payloads.size() == 1U);
    REQUIRE(c.payloads[0] == payload);
    REQUIRE(dec.BufferedSize() == 0U);
  }
}

TEST_CASE("frame_codec - several frames in one feed", "[frame_codec]") {
  Bytes a = Pattern(10U, 1U);
  Bytes b = Pattern(200U, 2U);
  Bytes c3 = Pattern(1U, 3U);
  Bytes stream = Concat(Concat(Encode(a), Encode(b)), Encode(c3));

  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, stream) == 3U);
  REQUIRE(c.payloads.size() == 3U);
  REQUIRE(c.payloads[0] == a);
  REQUIRE(c.payloads[1] == b);
  REQUIRE(c.payloads[2] == c3);
  REQUIRE(dec.BufferedSize() == 0U);
  REQUIRE(dec.GetStats().frames_decoded == 3U);
}

TEST_CASE("frame_codec - frame split at every position", "[frame_codec]") {
  Bytes payload = Pattern(40U, 9U);
  Bytes frame = Encode(payload);
  for (size_t k = 1; k < frame.size(); ++k) {
    meshlink::FrameDecoder dec;
    Collector c;
    Bytes head(frame.begin(), frame.begin() + static_cast<long>(k));
    Bytes tail(frame.begin() + static_cast<long>(k), frame.end());
    REQUIRE(c.Feed(dec, head) == 0U);
    REQUIRE(dec.BufferedSize() == k);
    REQUIRE(c.Feed(dec, tail) == 1U);
    REQUIRE(c.payloads.size() == 1U);
    REQUIRE(c.payloads[0] == payload);
    REQUIRE(dec.BufferedSize() == 0U);
  }
}

TEST_CASE("frame_codec - byte-at-a-time delivery", "[frame_codec]") {
  Bytes a = Pattern(17U, 4U);
  Bytes b = Pattern(3U, 5U);
  Bytes stream = Concat(Encode(a), Encode(b));

  meshlink::FrameDecoder dec;
  Collector c;
  for (uint8_t byte : stream) {
    (void)dec.Feed(&byte, 1U, &Collector::OnPayload, &c);
  }
  REQUIRE(c.payloads.size() == 2U);
  REQUIRE(c.payloads[0] == a);
  REQUIRE(c.payloads[1] == b);
}

TEST_CASE("frame_codec - leading noise is discarded", "[frame_codec]") {
  Bytes noise = {0x00, 0x11, 0x94, 0x22, 0xC3, 0x94, 0x94, 0x7F, 0xFF};
  Bytes payload = Pattern(25U, 6U);

  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, Concat(noise, Encode(payload))) == 1U);
  REQUIRE(c.payloads.size() == 1U);
  REQUIRE(c.payloads[0] == payload);
  REQUIRE(dec.BufferedSize() == 0U);
  REQUIRE(dec.GetStats().bytes_discarded == noise.size());
}

TEST_CASE("frame_codec - lone magic byte does not anchor", "[frame_codec]") {
  Bytes payload = {0xAA};
  Bytes stream = Concat({0x94}, Encode(payload));

  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, stream) == 1U);
  REQUIRE(c.payloads[0] == payload);
}

TEST_CASE("frame_codec - corrupted length does not block later frames",
          "[frame_codec]") {
  Bytes bad_header = {0x94, 0xC3, 0x02, 0x01};  // 513
  Bytes payload = Pattern(12U, 8U);

  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, Concat(bad_header, Encode(payload))) == 1U);
  REQUIRE(c.payloads.size() == 1U);
  REQUIRE(c.payloads[0] == payload);
  REQUIRE(dec.GetStats().spurious_lengths == 1U);
  REQUIRE(dec.BufferedSize() == 0U);
}

TEST_CASE("frame_codec - zero length header is spurious", "[frame_codec]") {
  Bytes zero = {0x94, 0xC3, 0x00, 0x00};
  Bytes payload = {0x42, 0x43};

  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, Concat(zero, Encode(payload))) == 1U);
  REQUIRE(c.payloads[0] == payload);
  REQUIRE(dec.GetStats().spurious_lengths == 1U);
}

TEST_CASE("frame_codec - incomplete frame is retained from its header",
          "[frame_codec]") {
  Bytes frame = Encode(Pattern(100U, 2U));
  Bytes partial = Concat({0x01, 0x02}, Bytes(frame.begin(), frame.begin() + 50));

  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, partial) == 0U);
  REQUIRE(dec.BufferedSize() == 50U);
  REQUIRE(dec.BufferedData()[0] == 0x94);
  REQUIRE(dec.BufferedData()[1] == 0xC3);
}

TEST_CASE("frame_codec - feed larger than decode buffer", "[frame_codec]") {
  std::vector<Bytes> sent;
  Bytes stream;
  for (uint32_t i = 0; i < 10U; ++i) {
    sent.push_back(Pattern(500U, static_cast<uint8_t>(i)));
    stream = Concat(stream, Encode(sent.back()));
  }
  REQUIRE(stream.size() > meshlink::kDecodeBufferSize);

  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, stream) == 10U);
  REQUIRE(c.payloads == sent);
  REQUIRE(dec.BufferedSize() == 0U);
}

TEST_CASE("frame_codec - garbage only never grows buffer unbounded",
          "[frame_codec]") {
  Bytes garbage(4096U, 0x55);
  meshlink::FrameDecoder dec;
  Collector c;
  REQUIRE(c.Feed(dec, garbage) == 0U);
  REQUIRE(dec.BufferedSize() < meshlink::kFrameHeaderSize);
  REQUIRE(dec.GetStats().bytes_fed == 4096U);
}

TEST_CASE("frame_codec - Reset drops partial frame", "[frame_codec]") {
  Bytes frame = Encode(Pattern(30U, 1U));
  meshlink::FrameDecoder dec;
  Collector c;
  (void)c.Feed(dec, Bytes(frame.begin(), frame.begin() + 10));
  dec.Reset();
  REQUIRE(dec.BufferedSize() == 0U);
  Bytes payload = {0x07};
  REQUIRE(c.Feed(dec, Encode(payload)) == 1U);
  REQUIRE(c.payloads.back() == payload);
}

TEST_CASE("frame_codec - null callback still consumes frames",
          "[frame_codec]") {
  Bytes frame = Encode({0x01});
  meshlink::FrameDecoder dec;
  REQUIRE(dec.Feed(frame.data(), static_cast<uint32_t>(frame.size()), nullptr,
                   nullptr) == 1U);
  REQUIRE(dec.BufferedSize() == 0U);
}
