#include "../backend/blockchain/include/TransferAnalysis.h"
#include "MockHttpTransport.h"
#include "TestTransactions.h"
#include "TestUtils.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using EthereumService::EventLog;
using EthereumService::NetworkConfig;
using Transfers::TransferType;
using namespace TestTransactions;

namespace {

const char* ETH_RPC = "https://eth.rpc ";
const char* ETH_TOKENINFO = "https://eth.explorer/api?module=token&action=tokeninfo";

NetworkConfig Ethereum() {
    return NetworkConfig(1, "Ethereum", "https://eth.explorer/api", "https://eth.rpc");
}

EventLog ToEventLog(const nlohmann::json& log) {
    EventLog event;
    event.address = log["address"].get<std::string>();
    event.topics = log["topics"].get<std::vector<std::string>>();
    event.data = log["data"].get<std::string>();
    return event;
}

std::vector<EventLog> ToEventLogs(const nlohmann::json& logs) {
    std::vector<EventLog> events;
    for (const auto& log : logs) {
        events.push_back(ToEventLog(log));
    }
    return events;
}

} // namespace

bool testHexToDecimal() {
    TEST_START("Hex quantities to decimal");

    TEST_ASSERT(Transfers::HexToDecimal("0x59682f00") == std::string("1500000000"), "1500 USDC in base units");
    TEST_ASSERT(Transfers::HexToDecimal("0x") == std::string("0"), "Empty data is zero");
    TEST_ASSERT(Transfers::HexToDecimal(Word("1")) == std::string("1"), "Leading zero bytes are ignored");
    TEST_ASSERT(Transfers::HexToDecimal("0x" + std::string(64, 'f')) ==
                    std::string("115792089237316195423570985008687907853269984665640564039457584007913129639935"),
                "Largest uint256");

    TEST_ASSERT(!Transfers::HexToDecimal("0x1" + std::string(64, '0')), "More than 256 bits is rejected");
    TEST_ASSERT(!Transfers::HexToDecimal("59682f00"), "The 0x prefix is required");
    TEST_ASSERT(!Transfers::HexToDecimal("0xzz"), "Non-hex digits are rejected");

    TEST_PASS();
}

bool testFormatUnits() {
    TEST_START("Base units to token amounts");

    TEST_ASSERT(Transfers::FormatUnits("1500000000", 6) == "1500", "Whole amount has no fraction");
    TEST_ASSERT(Transfers::FormatUnits("1500000", 6) == "1.5", "Trailing zeros are dropped");
    TEST_ASSERT(Transfers::FormatUnits("1", 18) == "0.000000000000000001", "One wei");
    TEST_ASSERT(Transfers::FormatUnits("000120", 2) == "1.2", "Leading zeros are ignored");
    TEST_ASSERT(Transfers::FormatUnits("0", 18) == "0", "Zero");
    TEST_ASSERT(Transfers::FormatUnits("123", 0) == "123", "No decimals");

    TEST_PASS();
}

bool testDecodeTransferLog() {
    TEST_START("Decode Transfer event logs");

    auto erc20 = Transfers::DecodeTransferLog(
        ToEventLog(TransferLog(USDC_TOKEN, TEST_ADDRESS, SECOND_ADDRESS, "59682f00")));
    TEST_ASSERT(erc20.has_value(), "Transfer log should decode");
    TEST_ASSERT(erc20->type == TransferType::Erc20, "Three topics is a fungible transfer");
    TEST_ASSERT(erc20->token == USDC_TOKEN, "Token is the emitting contract");
    TEST_ASSERT(erc20->from == Lowercase(TEST_ADDRESS), "Sender comes from the first indexed topic");
    TEST_ASSERT(erc20->to == Lowercase(SECOND_ADDRESS), "Recipient comes from the second indexed topic");
    TEST_ASSERT(erc20->value == "1500000000", "Value comes from the data word");

    auto nft = Transfers::DecodeTransferLog(ToEventLog(ReceiptLog(
        USDC_TOKEN, {TRANSFER_EVENT, AddressTopic(TEST_ADDRESS), AddressTopic(SECOND_ADDRESS), Word("2a")},
        "0x")));
    TEST_ASSERT(nft && nft->type == TransferType::Erc721, "Indexed token id marks an NFT transfer");
    TEST_ASSERT(nft->value == "42", "NFT value is the token id");

    auto emptyData = Transfers::DecodeTransferLog(ToEventLog(ReceiptLog(
        USDC_TOKEN, {TRANSFER_EVENT, AddressTopic(TEST_ADDRESS), AddressTopic(SECOND_ADDRESS)}, "0x")));
    TEST_ASSERT(emptyData && emptyData->value == "0", "Missing data is a zero transfer");

    auto approval = Transfers::DecodeTransferLog(ToEventLog(TheftLogs()[0]));
    TEST_ASSERT(!approval, "Approval events are not transfers");

    auto twoTopics = Transfers::DecodeTransferLog(
        ToEventLog(ReceiptLog(USDC_TOKEN, {TRANSFER_EVENT, AddressTopic(TEST_ADDRESS)}, Word("1"))));
    TEST_ASSERT(!twoTopics, "A Transfer without both parties is skipped");

    auto shortTopic = Transfers::DecodeTransferLog(ToEventLog(
        ReceiptLog(USDC_TOKEN, {TRANSFER_EVENT, "0x1234", AddressTopic(SECOND_ADDRESS)}, Word("1"))));
    TEST_ASSERT(!shortTopic, "A malformed topic is skipped");

    auto all = Transfers::DecodeTransferLogs(ToEventLogs(TheftLogs()));
    TEST_ASSERT(all.size() == 2, "Theft receipt has two transfers");
    TEST_ASSERT(all[1].to == Lowercase(RECIPIENT), "Transfers keep log order");

    TEST_PASS();
}

bool testApplyTokenInfo() {
    TEST_START("Token metadata refines transfers");

    auto transfers = Transfers::DecodeTransferLogs(ToEventLogs(TheftLogs()));

    EthereumService::TokenInfo usdc{"USDC", "USD Coin", 6};
    Transfers::ApplyTokenInfo(transfers[0], usdc);
    TEST_ASSERT(transfers[0].info && transfers[0].info->symbol == "USDC", "Metadata should be attached");
    TEST_ASSERT(transfers[0].type == TransferType::Erc20, "Six decimals stays fungible");

    EthereumService::TokenInfo collectible{"PUNK", "Punks", 0};
    Transfers::ApplyTokenInfo(transfers[1], collectible);
    TEST_ASSERT(transfers[1].type == TransferType::Erc721, "Zero decimals is an NFT");

    TEST_PASS();
}

bool testSummarizeTransfers() {
    TEST_START("Victim and scammer from net balance changes");

    auto summary = Transfers::SummarizeTransfers(Transfers::DecodeTransferLogs(ToEventLogs(TheftLogs())));
    TEST_ASSERT(summary.victim && *summary.victim == Lowercase(TEST_ADDRESS), "Victim lost the most");
    TEST_ASSERT(summary.scammer && *summary.scammer == Lowercase(SECOND_ADDRESS),
                "Scammer kept more than the address it forwarded to");
    TEST_ASSERT(summary.transfers.size() == 2, "Transfers are carried through");

    // Each NFT moves one unit, whatever its id
    std::vector<Transfers::TokenTransfer> nfts(2);
    nfts[0].type = TransferType::Erc721;
    nfts[0].from = Lowercase(TEST_ADDRESS);
    nfts[0].to = Lowercase(SECOND_ADDRESS);
    nfts[0].value = "999999";
    nfts[1].type = TransferType::Erc721;
    nfts[1].from = Lowercase(TEST_ADDRESS);
    nfts[1].to = Lowercase(RECIPIENT);
    nfts[1].value = "1";
    auto nftSummary = Transfers::SummarizeTransfers(nfts);
    TEST_ASSERT(nftSummary.victim && *nftSummary.victim == Lowercase(TEST_ADDRESS), "NFT victim");
    TEST_ASSERT(nftSummary.scammer && *nftSummary.scammer == Lowercase(SECOND_ADDRESS),
                "Equal gains go to the first recipient");

    std::vector<Transfers::TokenTransfer> selfTransfer(1);
    selfTransfer[0].from = Lowercase(TEST_ADDRESS);
    selfTransfer[0].to = Lowercase(TEST_ADDRESS);
    selfTransfer[0].value = "100";
    auto none = Transfers::SummarizeTransfers(selfTransfer);
    TEST_ASSERT(!none.victim && !none.scammer, "A self transfer has no victim or scammer");

    auto empty = Transfers::SummarizeTransfers({});
    TEST_ASSERT(!empty.victim && !empty.scammer, "No transfers, no parties");

    TEST_PASS();
}

bool testParseTransactionReceipt() {
    TEST_START("Parse transaction receipt JSON");

    nlohmann::json logs = TheftLogs();
    logs[1]["topics"][0] = "0xDDF252AD1BE2C89B69C2B068FC378DAA952BA7F163C4A11628F55A4DF523B3EF";
    std::string object = nlohmann::json::parse(ReceiptResponse(THEFT_HASH, logs))["result"].dump();

    auto receipt = EthereumService::ParseTransactionReceipt(object);
    TEST_ASSERT(receipt.has_value(), "Receipt should parse");
    TEST_ASSERT(receipt->transactionHash == THEFT_HASH, "Hash mismatch");
    TEST_ASSERT(receipt->status && *receipt->status == "0x1", "Status mismatch");
    TEST_ASSERT(receipt->logs.size() == 3, "All logs are kept");
    TEST_ASSERT(receipt->logs[1].topics[0] == TRANSFER_EVENT, "Topics are normalized to lowercase");
    TEST_ASSERT(Transfers::DecodeTransferLogs(receipt->logs).size() == 2,
                "Normalized topics still decode");

    auto noLogs = EthereumService::ParseTransactionReceipt(R"({"transactionHash":"0x01"})");
    TEST_ASSERT(noLogs && noLogs->logs.empty() && !noLogs->status, "Missing fields are tolerated");

    TEST_ASSERT(!EthereumService::ParseTransactionReceipt("[1,2]"), "An array is not a receipt");
    TEST_ASSERT(!EthereumService::ParseTransactionReceipt("{oops"), "Invalid JSON is rejected");

    TEST_PASS();
}

bool testGetTransactionReceipt() {
    TEST_START("Fetch a receipt over JSON-RPC");

    auto mock = std::make_shared<MockHttpTransport>();
    EthereumService::EthereumClient client(mock);

    mock->addResponse(ETH_RPC, ReceiptResponse(THEFT_HASH, TheftLogs()));
    auto receipt = client.GetTransactionReceipt("https://eth.rpc", THEFT_HASH);
    TEST_ASSERT(receipt.success, "Receipt fetch should succeed");
    TEST_ASSERT(receipt->logs.size() == 3, "Log count mismatch");
    TEST_ASSERT(mock->countRequests("\"eth_getTransactionReceipt\"") == 1, "Receipt method should be called");
    TEST_ASSERT(mock->countRequests(THEFT_HASH) == 1, "Hash should be sent as the parameter");

    mock->reset();
    mock->addResponse(ETH_RPC, RpcNullResult());
    auto pending = client.GetTransactionReceipt("https://eth.rpc", THEFT_HASH);
    TEST_ASSERT(pending.kind() == Callout::ErrorKind::TransactionNotFound, "Null receipt is TransactionNotFound");

    mock->reset();
    mock->addResponse(ETH_RPC, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"header not found"}})");
    auto rpcError = client.GetTransactionReceipt("https://eth.rpc", THEFT_HASH);
    TEST_ASSERT(rpcError.kind() == Callout::ErrorKind::NetworkError, "RPC error is NetworkError");
    TEST_ASSERT(rpcError.error().find("header not found") != std::string::npos, "RPC message is kept");

    mock->reset();
    mock->addFailure(ETH_RPC);
    auto unreachable = client.GetTransactionReceipt("https://eth.rpc", THEFT_HASH);
    TEST_ASSERT(unreachable.kind() == Callout::ErrorKind::NetworkError, "Transport failure is NetworkError");
    TEST_ASSERT(TestUtils::logContains("EthereumClient", "RPC request failed"), "Failure should be logged");

    TEST_PASS();
}

bool testGetTokenInfo() {
    TEST_START("Token info from the explorer");

    auto mock = std::make_shared<MockHttpTransport>();
    EthereumService::EthereumClient client(mock);

    mock->addResponse(ETH_TOKENINFO, TokenInfoResponse("USDC", "USD Coin", "6"));
    auto listForm = client.GetTokenInfo(Ethereum(), USDC_TOKEN, "test-api-key");
    TEST_ASSERT(listForm.success, "Lookup should succeed");
    TEST_ASSERT(listForm->symbol == "USDC" && listForm->name == "USD Coin", "Symbol and name mismatch");
    TEST_ASSERT(listForm->decimals && *listForm->decimals == 6, "Divisor is the decimal count");
    TEST_ASSERT(mock->countRequests(std::string("contractaddress=") + USDC_TOKEN) == 1,
                "Contract should be queried");

    mock->reset();
    mock->addResponse(ETH_TOKENINFO, R"({"result":{"symbol":"PUNK","name":"Punks","decimals":0}})");
    auto objectForm = client.GetTokenInfo(Ethereum(), USDC_TOKEN, "test-api-key");
    TEST_ASSERT(objectForm.success && objectForm->name == "Punks", "Object form should parse");
    TEST_ASSERT(objectForm->decimals && *objectForm->decimals == 0, "Numeric decimals should parse");

    mock->reset();
    mock->addResponse(ETH_TOKENINFO, R"({"status":"0","message":"NOTOK","result":"Invalid API Key"})");
    auto rejected = client.GetTokenInfo(Ethereum(), USDC_TOKEN, "test-api-key");
    TEST_ASSERT(rejected.kind() == Callout::ErrorKind::NetworkError, "Explorer rejection is NetworkError");

    auto noKey = client.GetTokenInfo(Ethereum(), USDC_TOKEN, "");
    TEST_ASSERT(noKey.kind() == Callout::ErrorKind::MissingApiKey, "Empty key is MissingApiKey");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Transfer Analysis Tests");
    TestUtils::initializeTestLogger("");

    testHexToDecimal();
    testFormatUnits();
    testDecodeTransferLog();
    testApplyTokenInfo();
    testSummarizeTransfers();
    testParseTransactionReceipt();
    testGetTransactionReceipt();
    testGetTokenInfo();

    TestUtils::printTestSummary("Transfer Analysis");
    TestUtils::shutdownTestLogger();

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
