#include "../backend/core/include/MessageCodec.h"
#include "TestUtils.h"
#include <iostream>
#include <string>

bool testEncodeAscii() {
    TEST_START("Encode ASCII text");

    TEST_ASSERT(Codec::Encode("Hello") == "0x48656c6c6f", "Hello should encode to 0x48656c6c6f");
    TEST_ASSERT(Codec::Encode("") == "0x", "Empty string should encode to bare 0x");

    std::string upper = Codec::Encode("\xff");
    TEST_ASSERT(upper == "0xff", "Hex output should be lowercase");

    TEST_PASS();
}

bool testDecodeWithAndWithoutPrefix() {
    TEST_START("Decode with and without 0x prefix");

    auto prefixed = Codec::Decode("0x48656c6c6f");
    TEST_ASSERT(prefixed.success, "Prefixed hex should decode");
    TEST_ASSERT(*prefixed == "Hello", "Prefixed hex should decode to Hello");

    auto bare = Codec::Decode("48656C6C6F");
    TEST_ASSERT(bare.success, "Unprefixed uppercase hex should decode");
    TEST_ASSERT(*bare == "Hello", "Unprefixed hex should decode to Hello");

    auto empty = Codec::Decode("0x");
    TEST_ASSERT(empty.success && empty->empty(), "0x should decode to the empty string");

    TEST_PASS();
}

bool testDecodeRejectsMalformedHex() {
    TEST_START("Decode rejects malformed hex");

    auto odd = Codec::Decode("0x123");
    TEST_ASSERT(!odd.success, "Odd-length hex should fail");
    TEST_ASSERT(odd.kind() == Callout::ErrorKind::MalformedHex, "Odd length should be MalformedHex");

    auto junk = Codec::Decode("0xzz");
    TEST_ASSERT(!junk.success, "Non-hex characters should fail");
    TEST_ASSERT(junk.kind() == Callout::ErrorKind::MalformedHex, "Non-hex should be MalformedHex");

    TEST_PASS();
}

bool testUtf8RoundTrip() {
    TEST_START("UTF-8 text survives encode/decode");

    const std::string text = "caf\xc3\xa9 \xe2\x82\xac 100 \xf0\x9f\x9a\x80\nline two";
    std::string encoded = Codec::Encode(text);
    TEST_STEP("Encoded: " << encoded);

    auto decoded = Codec::Decode(encoded);
    TEST_ASSERT(decoded.success, "Encoded UTF-8 should decode");
    TEST_ASSERT(*decoded == text, "Decoded bytes should equal the original");

    TEST_PASS();
}

bool testIsLikelyText() {
    TEST_START("Printable ratio heuristic");

    TEST_ASSERT(Codec::IsLikelyText(Codec::Encode("Please return the funds.\n")),
                "Plain English should be text");
    TEST_ASSERT(!Codec::IsLikelyText("0x"), "Empty calldata is not text");
    TEST_ASSERT(!Codec::IsLikelyText("0x123"), "Undecodable calldata is not text");
    TEST_ASSERT(!Codec::IsLikelyText("0xa9059cbb000000000000000000000000"),
                "ERC-20 selector bytes are not text");

    // 8 printable out of 10 sits exactly on the threshold
    TEST_ASSERT(Codec::IsLikelyText(Codec::Encode(std::string("abcdefgh") + '\x01' + '\x02')),
                "80% printable should count as text");
    TEST_ASSERT(!Codec::IsLikelyText(Codec::Encode(std::string("abcdefg") + '\x01' + '\x02' + '\x03')),
                "70% printable should not count as text");

    // Each multi-byte character counts once, and is not printable ASCII
    TEST_ASSERT(Codec::IsLikelyText(Codec::Encode("abcd\xc3\xa9")),
                "Four ASCII letters and one accented letter are 80% printable");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Calldata Codec Tests");

    testEncodeAscii();
    testDecodeWithAndWithoutPrefix();
    testDecodeRejectsMalformedHex();
    testUtf8RoundTrip();
    testIsLikelyText();

    TestUtils::printTestSummary("Calldata Codec");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
