// test_segment.cpp – Tests for segment framing, the core header, the MOT
// header codec and MotObject parameter bookkeeping.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_segment

#include "MOTCodec/BitStream.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/MotObject.hpp"
#include "MOTCodec/Segment.hpp"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace mot;

// ─── Utility ─────────────────────────────────────────────────────────────────

static void hexdump(const std::vector<uint8_t>& v, const std::string& label) {
    std::cout << label << " [" << v.size() << "B]: ";
    for (uint8_t b : v)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b << ' ';
    std::cout << std::dec << '\n';
}

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static std::vector<uint8_t> fromHex(const std::string& hex) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2)
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: segment preamble
// ─────────────────────────────────────────────────────────────────────────────
static void testSegmentPreamble() {
    std::cout << "\n=== Test: segment preamble ===\n";
    const std::vector<uint8_t> data{0xaa, 0xbb, 0xcc};

    auto seg = encodeSegment(data, 2);
    hexdump(seg, "segment");
    CHECK(seg == fromHex("4003aabbcc"), "repetition 2, size 3 -> 40 03");

    Segment split = splitSegment(seg);
    CHECK(split.header.repetition == 2, "repetition = 2");
    CHECK(split.header.size == 3,       "size = 3");
    CHECK(split.data.size() == 3 && split.data[0] == 0xaa, "data view starts after the preamble");

    // Trailing bytes beyond SegmentSize are not part of the segment.
    auto padded = seg;
    padded.push_back(0xff);
    CHECK(splitSegment(padded).data.size() == 3, "trailing byte excluded");

    bool threw = false;
    try { (void)splitSegment(fromHex("4003aabb")); }
    catch (const MalformedSegment&) { threw = true; }
    CHECK(threw, "size 3 with 2 bytes -> MalformedSegment");

    threw = false;
    try { (void)splitSegment(fromHex("40")); }
    catch (const MalformedSegment&) { threw = true; }
    CHECK(threw, "1-byte buffer -> MalformedSegment");

    threw = false;
    try { (void)encodeSegment(data, 8); }
    catch (const ValidationError&) { threw = true; }
    CHECK(threw, "repetition 8 -> ValidationError");

    threw = false;
    try { (void)encodeSegment(std::vector<uint8_t>(SegmentHeader::kMaxSize + 1, 0)); }
    catch (const ValidationError&) { threw = true; }
    CHECK(threw, "8192-byte segment -> ValidationError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: core header bit layout
// ─────────────────────────────────────────────────────────────────────────────
static void testCoreHeader() {
    std::cout << "\n=== Test: core header ===\n";
    CoreHeader core{3, 25, content_types::ImagePng};

    BitWriter bw;
    writeCoreHeader(bw, core);
    auto bytes = bw.take();
    hexdump(bytes, "core header");
    CHECK(bytes == fromHex("000000300c8403"), "body 3, header 25, [2:3]");

    BitReader br{bytes};
    CHECK(readCoreHeader(br) == core, "reads back");
    CHECK(br.atEnd(), "exactly 7 bytes consumed");

    CoreHeader big{CoreHeader::kMaxBodySize, CoreHeader::kMaxHeaderSize, ContentType{63, 511}};
    BitWriter bw2;
    writeCoreHeader(bw2, big);
    auto big_bytes = bw2.take();
    BitReader br2{big_bytes};
    CHECK(readCoreHeader(br2) == big, "maximum field values read back");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: MotObject parameter bookkeeping
// ─────────────────────────────────────────────────────────────────────────────
static void testMotObject() {
    std::cout << "\n=== Test: MotObject ===\n";
    MotObject obj{ContentName{"TEST"}, {1, 2, 3}, content_types::ImagePng, 7};

    CHECK(obj.name().name == "TEST",       "name = TEST");
    CHECK(obj.transportId() == 7,          "transport id = 7");
    CHECK(obj.contentType() == content_types::ImagePng, "content type = [2:3]");
    CHECK(obj.hasParameter(ParameterKind::ContentName), "ContentName present");
    CHECK(obj.toString() == "\"TEST\" [7]", "toString");

    obj.addParameter(MimeType{"image/png"});
    obj.addParameter(Priority{9});
    obj.addParameter(Priority{4});
    CHECK(obj.get<Priority>() && obj.get<Priority>()->value() == 4, "Priority replaced by kind");
    CHECK(obj.get<MimeType>() && obj.get<MimeType>()->mime == "image/png", "typed access");
    CHECK(obj.get<Compression>() == nullptr, "absent kind -> nullptr");

    auto params = obj.parameters();
    CHECK(params.size() == 3, "3 parameters");
    CHECK(!params.empty() && kindOf(params[0]) == ParameterKind::ContentName, "ContentName first");

    obj.addParameter(ContentName{"RENAMED"});
    CHECK(obj.name().name == "RENAMED", "ContentName replaced");

    bool threw = false;
    try { obj.addParameter(DefaultPermitOutdatedVersions{true}); }
    catch (const ValidationError&) { threw = true; }
    CHECK(threw, "directory parameter rejected");

    threw = false;
    try { obj.removeParameter({ParameterKind::ContentName, 0}); }
    catch (const ValidationError&) { threw = true; }
    CHECK(threw, "ContentName cannot be removed");

    CHECK(obj.removeParameter({ParameterKind::Priority, 0}),  "Priority removed");
    CHECK(!obj.removeParameter({ParameterKind::Priority, 0}), "second removal is a no-op");
    CHECK(obj.parameter({ParameterKind::Priority, 0}) == nullptr, "Priority gone");

    obj.setBody({9, 9});
    CHECK(obj.body().size() == 2, "body replaced");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: encodeHeader / decodeHeader
// ─────────────────────────────────────────────────────────────────────────────
static void testHeaderCodec() {
    std::cout << "\n=== Test: MOT header codec ===\n";
    MotObject obj{ContentName{"TEST"}, {1, 2, 3}, content_types::ImagePng, 7};
    obj.addParameter(MimeType{"image/png"});

    auto header = encodeHeader(obj);
    hexdump(header, "header");
    CHECK(header == fromHex("000000300c8403" "cc054054455354" "d009696d6167652f706e67"),
          "core header + ContentName + MimeType");

    const auto registry = ParameterRegistry::headerParameters();
    DecodedHeader decoded = decodeHeader(header, registry);
    CHECK(decoded.core.body_size == 3,   "body size = 3");
    CHECK(decoded.core.header_size == 25, "header size = 25");
    CHECK(decoded.core.content_type == content_types::ImagePng, "content type = [2:3]");
    CHECK(decoded.params.size() == 2,    "2 parameters");
    CHECK(decoded.params.size() == 2 && decoded.params[0] == Parameter{ContentName{"TEST"}},
          "ContentName decoded");
    CHECK(decoded.skipped_ids.empty(),   "nothing skipped");

    // Unknown parameter inside the header extension: header size 7+7+4 = 18.
    auto with_unknown = fromHex("00000000090000" "cc054054455354" "cd02aabb");
    decoded = decodeHeader(with_unknown, registry);
    CHECK(decoded.params.size() == 1,                          "ContentName kept");
    CHECK(decoded.skipped_ids == std::vector<uint8_t>{13},     "id 13 skipped");

    bool threw = false;
    try { (void)decodeHeader(fromHex("00000000030000"), registry); }
    catch (const MalformedSegment&) { threw = true; }
    CHECK(threw, "HeaderSize 6 -> MalformedSegment");

    threw = false;
    try { (void)decodeHeader(fromHex("000000000a0000" "cc05"), registry); }
    catch (const MalformedSegment&) { threw = true; }
    CHECK(threw, "HeaderSize 20 with 9 bytes -> MalformedSegment");

    threw = false;
    try { (void)decodeHeader(fromHex("000000"), registry); }
    catch (const MalformedSegment&) { threw = true; }
    CHECK(threw, "3 bytes -> MalformedSegment");

    threw = false;
    try { (void)decodeHeader(fromHex("00000000058000" "cc054054"), registry); }
    catch (const MalformedPreamble&) { threw = true; }
    CHECK(threw, "truncated parameter -> MalformedPreamble");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testSegmentPreamble();
    testCoreHeader();
    testMotObject();
    testHeaderCodec();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
