// test_object_decoder.cpp – End-to-end tests: datagroups in, MOT objects
// out, in header mode and directory mode.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_object_decoder

#include "MOTCodec/BitStream.hpp"
#include "MOTCodec/Datagroup.hpp"
#include "MOTCodec/Directory.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/ObjectDecoder.hpp"
#include "MOTCodec/ParameterRegistry.hpp"
#include "MOTCodec/Segment.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mot;

// ─── Utility ─────────────────────────────────────────────────────────────────

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

static Datagroup dg(DatagroupType type, uint16_t tid, uint32_t index, bool last,
                    std::vector<uint8_t> data) {
    return Datagroup{static_cast<uint8_t>(type), tid, index, last, std::move(data)};
}

// Object with a ContentName, a MIME type and the given body.
static MotObject makeObject(uint16_t tid, const std::string& name, std::vector<uint8_t> body) {
    MotObject obj{ContentName{name}, std::move(body), content_types::ImagePng, tid};
    obj.addParameter(MimeType{"image/png"});
    return obj;
}

// Header with a core header only: no ContentName.
static std::vector<uint8_t> namelessHeader(uint32_t body_size) {
    BitWriter bw;
    writeCoreHeader(bw, CoreHeader{body_size, CoreHeader::kSize, content_types::TextAscii});
    return bw.take();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: header mode, transport id 7
// ─────────────────────────────────────────────────────────────────────────────
static void testHeaderModeEndToEnd() {
    std::cout << "\n=== Test: header mode, transport id 7 ===\n";
    const auto obj = makeObject(7, "TEST", {0x01, 0x02, 0x03, 0x04, 0x05});

    ObjectDecoder decoder;
    auto out = decoder.push(dg(DatagroupType::Header, 7, 0, true, encodeHeader(obj)));
    CHECK(out.empty(), "header alone emits nothing");
    out = decoder.push(dg(DatagroupType::Body, 7, 1, true, {0x04, 0x05}));
    CHECK(out.empty(), "body segment 1 alone emits nothing");
    CHECK(decoder.cache().contains(7), "transport id 7 buffered");

    out = decoder.push(dg(DatagroupType::Body, 7, 0, false, {0x01, 0x02, 0x03}));
    CHECK(out.size() == 1, "exactly one object");
    if (out.size() == 1) {
        const MotObject& o = out[0];
        CHECK(o.transportId() == 7,                       "transport id 7");
        CHECK(o.name().name == "TEST",                    "name TEST");
        CHECK(o.body() == obj.body(),                     "body concatenated in segment order");
        CHECK(o.contentType() == content_types::ImagePng, "content type [2:3]");
        CHECK(o.get<MimeType>() && o.get<MimeType>()->mime == "image/png", "MimeType attached");
    }
    CHECK(!decoder.cache().contains(7), "transport id 7 removed from the cache");
    CHECK(decoder.objectsEmitted() == 1, "objectsEmitted = 1");
    CHECK(decoder.errorCount() == 0,     "no errors");

    // Duplicate of an already consumed segment starts a new, incomplete entry.
    out = decoder.push(dg(DatagroupType::Body, 7, 0, false, {0x01, 0x02, 0x03}));
    CHECK(out.empty(), "late duplicate emits nothing");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: directory mode, one directory completes several bodies at once
// ─────────────────────────────────────────────────────────────────────────────
static void testDirectoryModeBurst() {
    std::cout << "\n=== Test: directory mode burst ===\n";
    const std::vector<MotObject> objects{
        makeObject(3, "slide3.png", {3, 3, 3}),
        makeObject(1, "slide1.png", {1}),
        makeObject(2, "slide2.png", {2, 2}),
    };
    const auto dir = encodeDirectory(DirectoryLayout{50, 512, {}}, objects);
    const size_t half = dir.size() / 2;

    ObjectDecoder decoder;
    for (const auto& o : objects) {
        auto out = decoder.push(dg(DatagroupType::Body, o.transportId(), 0, true, o.body()));
        CHECK(out.empty(), "body without header or directory emits nothing");
    }

    auto out = decoder.push(dg(DatagroupType::Directory, 100, 1, true,
                               std::vector<uint8_t>(dir.begin() + half, dir.end())));
    CHECK(out.empty(), "second directory segment alone emits nothing");

    out = decoder.push(dg(DatagroupType::Directory, 100, 0, false,
                          std::vector<uint8_t>(dir.begin(), dir.begin() + half)));
    CHECK(out.size() == 3, "directory completes all three objects");
    if (out.size() == 3) {
        CHECK(out[0].transportId() == 1 && out[1].transportId() == 2 && out[2].transportId() == 3,
              "emitted in ascending transport id order");
        CHECK(out[0].name().name == "slide1.png", "names come from the directory");
        CHECK(out[2].body() == (std::vector<uint8_t>{3, 3, 3}), "bodies intact");
    }
    CHECK(decoder.cache().directory() != nullptr, "decoded directory kept in the cache");
    CHECK(decoder.cache().directory() && decoder.cache().directory()->carousel_period == 50,
          "carousel period 5.0 s");

    // A later body is compiled straight from the cached directory.
    out = decoder.push(dg(DatagroupType::Body, 2, 0, true, {7, 7}));
    CHECK(out.size() == 1 && out[0].name().name == "slide2.png", "later body uses the cached directory");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: a complete header wins over the directory
// ─────────────────────────────────────────────────────────────────────────────
static void testHeaderPrecedence() {
    std::cout << "\n=== Test: header takes precedence over directory ===\n";
    const auto in_dir    = makeObject(4, "from-directory", {4});
    const auto in_header = makeObject(4, "from-header", {4});

    ObjectDecoder decoder;
    (void)decoder.push(dg(DatagroupType::Directory, 0, 0, true,
                          encodeDirectory(DirectoryLayout{}, {in_dir})));
    (void)decoder.push(dg(DatagroupType::Header, 4, 0, true, encodeHeader(in_header)));
    auto out = decoder.push(dg(DatagroupType::Body, 4, 0, true, {4}));

    CHECK(out.size() == 1, "one object");
    CHECK(out.size() == 1 && out[0].name().name == "from-header", "header parameters used");

    // A partial header falls back to the directory.
    ObjectDecoder partial;
    (void)partial.push(dg(DatagroupType::Directory, 0, 0, true,
                          encodeDirectory(DirectoryLayout{}, {in_dir})));
    (void)partial.push(dg(DatagroupType::Header, 4, 1, true, {0x00}));
    out = partial.push(dg(DatagroupType::Body, 4, 0, true, {4}));
    CHECK(out.size() == 1 && out[0].name().name == "from-directory",
          "incomplete header -> directory used");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: per-object failures are reported and the stream continues
// ─────────────────────────────────────────────────────────────────────────────
static void testErrorReporting() {
    std::cout << "\n=== Test: error reporting ===\n";
    std::vector<DecodeError> errors;

    ObjectDecoder decoder;
    decoder.setErrorHandler([&](const DecodeError& e) { errors.push_back(e); });

    // No ContentName.
    (void)decoder.push(dg(DatagroupType::Header, 20, 0, true, namelessHeader(1)));
    auto out = decoder.push(dg(DatagroupType::Body, 20, 0, true, {0}));
    CHECK(out.empty(), "object without ContentName dropped");
    CHECK(errors.size() == 1 && errors[0].kind == DecodeErrorKind::MissingMandatoryParameter,
          "MissingMandatoryParameter reported");
    CHECK(errors.size() == 1 && errors[0].transport_id == 20, "reported for transport id 20");
    CHECK(!decoder.cache().contains(20), "failed transport id removed");

    // Truncated header framing.
    (void)decoder.push(dg(DatagroupType::Header, 21, 0, true, {0x00, 0x00}));
    out = decoder.push(dg(DatagroupType::Body, 21, 0, true, {0}));
    CHECK(out.empty(), "malformed header dropped");
    CHECK(errors.size() == 2 && errors[1].kind == DecodeErrorKind::MalformedSegment,
          "MalformedSegment reported");

    // Healthy object after the failures.
    const auto ok = makeObject(22, "ok.png", {1, 2});
    (void)decoder.push(dg(DatagroupType::Header, 22, 0, true, encodeHeader(ok)));
    out = decoder.push(dg(DatagroupType::Body, 22, 0, true, {1, 2}));
    CHECK(out.size() == 1, "stream continues after errors");
    CHECK(decoder.errorCount() == 2, "errorCount = 2");
    CHECK(std::string(decodeErrorKindName(DecodeErrorKind::DirectoryLookupFailure)) ==
              "directory lookup failure",
          "error kind name");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: transport id missing from the directory
// ─────────────────────────────────────────────────────────────────────────────
static void testDirectoryLookupFailure() {
    std::cout << "\n=== Test: directory lookup failure ===\n";
    std::vector<DecodeError> errors;
    ObjectDecoder decoder;
    decoder.setErrorHandler([&](const DecodeError& e) { errors.push_back(e); });

    (void)decoder.push(dg(DatagroupType::Directory, 0, 0, true,
                          encodeDirectory(DirectoryLayout{}, {makeObject(1, "one", {1})})));
    auto out = decoder.push(dg(DatagroupType::Body, 9, 0, true, {9}));
    CHECK(out.empty(), "unlisted transport id not emitted");
    CHECK(errors.size() == 1 && errors[0].kind == DecodeErrorKind::DirectoryLookupFailure,
          "DirectoryLookupFailure reported");
    CHECK(errors.size() == 1 && errors[0].transport_id == 9, "for transport id 9");

    out = decoder.push(dg(DatagroupType::Body, 1, 0, true, {1}));
    CHECK(out.size() == 1 && out[0].transportId() == 1, "listed transport id still decodes");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: pull-based stream and the eager helper
// ─────────────────────────────────────────────────────────────────────────────
static void testDecodeStream() {
    std::cout << "\n=== Test: DecodeStream / decodeObjects ===\n";
    const auto a = makeObject(7, "a", {0xa});
    const auto b = makeObject(8, "b", {0xb, 0xb});

    const std::vector<Datagroup> input{
        dg(DatagroupType::Header, 7, 0, true, encodeHeader(a)),
        dg(DatagroupType::Body,   8, 0, true, b.body()),
        dg(DatagroupType::Body,   7, 0, true, a.body()),
        dg(DatagroupType::Body,   7, 0, true, a.body()), // duplicate after emission
        dg(DatagroupType::Body,   9, 0, false, {0}),     // never completes
        dg(DatagroupType::Header, 8, 0, true, encodeHeader(b)),
    };

    size_t pulled = 0;
    DecodeStream stream([&]() -> std::optional<Datagroup> {
        if (pulled == input.size()) return std::nullopt;
        return input[pulled++];
    });

    auto first = stream.next();
    CHECK(first && first->transportId() == 7, "first object: transport id 7");
    CHECK(pulled == 3, "pulled only as far as needed");
    auto second = stream.next();
    CHECK(second && second->transportId() == 8, "second object: transport id 8");
    CHECK(!stream.next(), "exhausted");
    CHECK(!stream.next(), "stays exhausted");
    CHECK(stream.decoder().cache().contains(9), "incomplete transport id left in the cache");

    std::vector<DecodeError> errors;
    auto all = decodeObjects(input, [&](const DecodeError& e) { errors.push_back(e); });
    CHECK(all.size() == 2, "decodeObjects: 2 objects");
    CHECK(errors.empty(),  "decodeObjects: no errors");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 7: a registered decoder that throws does not stall the stream
// ─────────────────────────────────────────────────────────────────────────────
static void testThrowingExtensionDecoder() {
    std::cout << "\n=== Test: throwing extension decoder ===\n";
    auto header_params = ParameterRegistry::headerParameters();
    header_params.registerDecoder(0x27, [](std::span<const uint8_t>) -> Parameter {
        throw std::out_of_range("short scope id");
    });

    std::vector<DecodeError> errors;
    ObjectDecoder decoder(std::move(header_params), ParameterRegistry::directoryParameters());
    decoder.setErrorHandler([&](const DecodeError& e) { errors.push_back(e); });

    auto tagged = makeObject(5, "tagged.png", {5});
    tagged.addParameter(makeExtensionParameter(0x27, "ScopeId", ParameterScope::Header,
                                               ExtensionEncoding::Raw,
                                               std::vector<uint8_t>{0xe1, 0xc2, 0xe3}));
    auto out = decoder.push(dg(DatagroupType::Header, 5, 0, true, encodeHeader(tagged)));
    CHECK(out.empty(), "header alone emits nothing");
    out = decoder.push(dg(DatagroupType::Body, 5, 0, true, {5}));
    CHECK(out.empty(), "object with a failing parameter dropped");
    CHECK(errors.size() == 1 && errors[0].transport_id == 5, "failure reported for transport id 5");
    CHECK(errors.size() == 1 && errors[0].kind == DecodeErrorKind::Other, "reported as Other");
    CHECK(errors.size() == 1 && errors[0].message.find("short scope id") != std::string::npos,
          "decoder message carried");
    CHECK(!decoder.cache().contains(5), "transport id 5 removed from the cache");

    const auto healthy = makeObject(6, "healthy.png", {6, 6});
    out = decoder.push(dg(DatagroupType::Header, 6, 0, true, encodeHeader(healthy)));
    CHECK(out.empty(), "healthy header alone emits nothing");
    out = decoder.push(dg(DatagroupType::Body, 6, 0, true, {6, 6}));
    CHECK(out.size() == 1 && out[0].transportId() == 6, "later transport id still emitted");
    CHECK(errors.size() == 1, "no further errors");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 8: an undecodable directory gives way to the next repetition
// ─────────────────────────────────────────────────────────────────────────────
static void testMalformedDirectoryReplaced() {
    std::cout << "\n=== Test: malformed directory replaced ===\n";
    std::vector<DecodeError> errors;
    ObjectDecoder decoder;
    decoder.setErrorHandler([&](const DecodeError& e) { errors.push_back(e); });

    (void)decoder.push(dg(DatagroupType::Body, 1, 0, true, {1}));
    auto out = decoder.push(dg(DatagroupType::Directory, 100, 0, true, {0x00, 0x01}));
    CHECK(out.empty(), "truncated directory emits nothing");
    CHECK(errors.size() == 1 && errors[0].kind == DecodeErrorKind::MalformedSegment,
          "MalformedSegment reported");
    CHECK(!decoder.cache().contains(100),        "bad directory removed from the cache");
    CHECK(decoder.cache().directory() == nullptr, "no directory kept");

    out = decoder.push(dg(DatagroupType::Body, 1, 0, true, {1}));
    CHECK(out.empty(), "body waits for a usable directory");

    out = decoder.push(dg(DatagroupType::Directory, 100, 0, true,
                          encodeDirectory(DirectoryLayout{}, {makeObject(1, "one.png", {1})})));
    CHECK(out.size() == 1 && out[0].name().name == "one.png", "next directory copy used");
    CHECK(errors.size() == 1, "no further errors");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testHeaderModeEndToEnd();
    testDirectoryModeBurst();
    testHeaderPrecedence();
    testErrorReporting();
    testDirectoryLookupFailure();
    testDecodeStream();
    testThrowingExtensionDecoder();
    testMalformedDirectoryReplaced();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
