#include "../backend/core/include/SignedMessage.h"
#include "TestUtils.h"
#include <iostream>
#include <string>

bool testSignAndRecover() {
    TEST_START("EIP-191 sign and recover");

    const std::string message = "I am the owner of this address.";
    auto signature = SignedMessage::SignMessage(message, TEST_PRIVATE_KEY);
    TEST_ASSERT(signature.success, "Signing should succeed");
    TEST_STEP("Signature: " << *signature);
    TEST_ASSERT(signature->size() == 132, "Signature should be 0x + 65 bytes");

    std::string v = signature->substr(130);
    TEST_ASSERT(v == "1b" || v == "1c", "v should be 27 or 28");

    SignedMessage::ParsedSignedMessage parsed{message, *signature};
    auto signer = SignedMessage::RecoverSignedMessageAddress(parsed);
    TEST_ASSERT(signer.has_value(), "Recovery should succeed");
    TEST_ASSERT(*signer == TEST_ADDRESS, "Recovered signer should be the test address");

    TEST_PASS();
}

bool testFramingRoundTrip() {
    TEST_START("Signed-message framing");

    const std::string message = "Line one\nLine \"two\"";
    auto signature = SignedMessage::SignMessage(message, SECOND_PRIVATE_KEY);
    TEST_ASSERT(signature.success, "Signing should succeed");

    std::string framed = SignedMessage::FormatSignedMessage(message, *signature);
    TEST_ASSERT(framed.rfind("MESSAGE: \"", 0) == 0, "Framing should start with MESSAGE:");

    auto parsed = SignedMessage::ParseSignedMessage("Preamble text\n" + framed + "\n");
    TEST_ASSERT(parsed.has_value(), "Framing should be found inside surrounding text");
    TEST_ASSERT(parsed->message == message, "Multi-line message with quotes should survive");
    TEST_ASSERT(parsed->signature == *signature, "Signature should be extracted");

    auto signer = SignedMessage::RecoverSignedMessageAddress(*parsed);
    TEST_ASSERT(signer && *signer == SECOND_ADDRESS, "Recovered signer mismatch");

    TEST_PASS();
}

bool testParseRejectsUnframedText() {
    TEST_START("Unframed text is not a signed message");

    TEST_ASSERT(!SignedMessage::ParseSignedMessage(""), "Empty text has no framing");
    TEST_ASSERT(!SignedMessage::ParseSignedMessage("Please return the funds."), "Plain text has no framing");
    TEST_ASSERT(!SignedMessage::ParseSignedMessage("MESSAGE: \"hi\"\nSIGNATURE: nothex"),
                "Signature must be 0x hex");

    TEST_PASS();
}

bool testRecoveryRejectsBadSignatures() {
    TEST_START("Malformed signatures do not recover");

    const std::string message = "tamper test";
    auto signature = SignedMessage::SignMessage(message, TEST_PRIVATE_KEY);
    TEST_ASSERT(signature.success, "Signing should succeed");

    SignedMessage::ParsedSignedMessage shortSig{message, signature->substr(0, 130)};
    TEST_ASSERT(!SignedMessage::RecoverSignedMessageAddress(shortSig), "64-byte signature is rejected");

    SignedMessage::ParsedSignedMessage badV{message, signature->substr(0, 130) + "1f"};
    TEST_ASSERT(!SignedMessage::RecoverSignedMessageAddress(badV), "v = 31 is rejected");

    SignedMessage::ParsedSignedMessage rawV{message, signature->substr(0, 130) +
                                                         (signature->substr(130) == "1b" ? "00" : "01")};
    auto raw = SignedMessage::RecoverSignedMessageAddress(rawV);
    TEST_ASSERT(raw && *raw == TEST_ADDRESS, "v in {0, 1} is accepted");

    SignedMessage::ParsedSignedMessage edited{message + "!", *signature};
    auto other = SignedMessage::RecoverSignedMessageAddress(edited);
    TEST_ASSERT(!other || *other != TEST_ADDRESS, "An edited message must not recover the signer");

    auto badKey = SignedMessage::SignMessage(message, "0x1234");
    TEST_ASSERT(badKey.kind() == Callout::ErrorKind::InvalidPrivateKey, "Short key is InvalidPrivateKey");

    TEST_PASS();
}

bool testLargeSignedMessage() {
    TEST_START("Signed message with a very large body");

    std::string body;
    while (body.size() < 150000) {
        body += "Return the funds to the original owner, line \"" + std::to_string(body.size()) + "\"\n";
    }
    auto signature = SignedMessage::SignMessage(body, TEST_PRIVATE_KEY);
    TEST_ASSERT(signature.success, "Signing should succeed");

    auto parsed = SignedMessage::ParseSignedMessage(SignedMessage::FormatSignedMessage(body, *signature));
    TEST_ASSERT(parsed.has_value(), "Framing should be found in a 150 KB message");
    TEST_ASSERT(parsed->message == body, "Large body should be returned intact");
    auto signer = SignedMessage::RecoverSignedMessageAddress(*parsed);
    TEST_ASSERT(signer && *signer == TEST_ADDRESS, "Signer of a large message should be recovered");

    const std::string flat = "MESSAGE: \"" + std::string(200000, 'a') + "\"\nSIGNATURE: 0x1b";
    auto single = SignedMessage::ParseSignedMessage(flat);
    TEST_ASSERT(single && single->message.size() == 200000 && single->signature == "0x1b",
                "A 200 KB single-line body should parse");

    const std::string noSignature = "MESSAGE: \"" + std::string(200000, 'b') + "\"\nSIGNATURE: 0x";
    TEST_ASSERT(!SignedMessage::ParseSignedMessage(noSignature), "Signature without hex digits is not framing");
    auto content = SignedMessage::ExtractFramedContent(noSignature);
    TEST_ASSERT(content && content->size() == 200000, "Framed content does not depend on the signature");

    TEST_PASS();
}

bool testFramingEdgeCases() {
    TEST_START("Framing boundaries");

    auto quoted = SignedMessage::ParseSignedMessage("MESSAGE: \"say \"hi\"\" \nSIGNATURE: 0xab");
    TEST_ASSERT(quoted && quoted->message == "say \"hi\"", "Inner quotes stay in the body");

    auto spaced = SignedMessage::ParseSignedMessage("MESSAGE:\n  \"body\"\r\n\nSIGNATURE:   0xAB12");
    TEST_ASSERT(spaced && spaced->message == "body" && spaced->signature == "0xAB12",
                "Whitespace around the quotes and the signature is allowed");

    TEST_ASSERT(!SignedMessage::ParseSignedMessage("MESSAGE: \"body\" SIGNATURE: 0xab"),
                "SIGNATURE must start a new line");
    TEST_ASSERT(!SignedMessage::ParseSignedMessage("MESSAGE: \"body\"\n  SIGNATURE: 0xab"),
                "SIGNATURE must follow the newline directly");

    auto second = SignedMessage::ParseSignedMessage("MESSAGE: no quote\nMESSAGE: \"real\"\nSIGNATURE: 0x01");
    TEST_ASSERT(second && second->message == "real", "A tag without a quote is skipped");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Signed Message Tests");

    testSignAndRecover();
    testFramingRoundTrip();
    testParseRejectsUnframedText();
    testRecoveryRejectsBadSignatures();
    testLargeSignedMessage();
    testFramingEdgeCases();

    TestUtils::printTestSummary("Signed Message");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
