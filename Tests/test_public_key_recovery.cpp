#include "../backend/blockchain/include/PublicKeyRecovery.h"
#include "Callout/Errors.h"
#include "MockHttpTransport.h"
#include "TestTransactions.h"
#include "TestUtils.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using EthereumService::NetworkConfig;
using namespace TestTransactions;

namespace {

const char* ETH_TXLIST = "https://eth.explorer/api?module=account&action=txlist";
const char* ETH_PROXY = "https://eth.explorer/api?module=proxy";
const char* ETH_RPC = "https://eth.rpc ";
const char* POLYGON_TXLIST = "https://polygon.explorer/api?module=account&action=txlist";
const char* POLYGON_PROXY = "https://polygon.explorer/api?module=proxy";
const char* POLYGON_RPC = "https://polygon.rpc ";
const char* OPTIMISM_TXLIST = "https://optimism.explorer/api?module=account&action=txlist";
const char* OPTIMISM_PROXY = "https://optimism.explorer/api?module=proxy";
const char* OPTIMISM_RPC = "https://optimism.rpc ";

std::vector<NetworkConfig> TestNetworks() {
    return {
        NetworkConfig(1, "Ethereum", "https://eth.explorer/api", "https://eth.rpc"),
        NetworkConfig(137, "Polygon", "https://polygon.explorer/api", "https://polygon.rpc"),
        NetworkConfig(10, "Optimism", "https://optimism.explorer/api", "https://optimism.rpc"),
    };
}

struct Fixture {
    std::shared_ptr<MockHttpTransport> mock;
    Recovery::PublicKeyRecoveryEngine engine;

    explicit Fixture(const std::string& apiKey = "test-api-key")
        : mock(std::make_shared<MockHttpTransport>()), engine(mock, TestNetworks(), apiKey) {}
};

} // namespace

bool testParseTransactionRecord() {
    TEST_START("Parse eth_getTransactionByHash result");

    auto record = EthereumService::ParseTransactionRecord(ToJson(DynamicFeeTransaction()).dump());
    TEST_ASSERT(record.has_value(), "Well-formed transaction should parse");
    TEST_ASSERT(record->type && *record->type == "0x2", "Type should be kept");
    TEST_ASSERT(record->maxFeePerGas && *record->maxFeePerGas == "0x174876e800", "Fee field mismatch");
    TEST_ASSERT(record->accessList && record->accessList->empty(), "Empty access list should be kept");

    auto creation = ToJson(PreEip155Transaction());
    creation["to"] = nullptr;
    record = EthereumService::ParseTransactionRecord(creation.dump());
    TEST_ASSERT(record.has_value() && !record->to, "Contract creation has no recipient");

    auto unsigned_tx = ToJson(PreEip155Transaction());
    unsigned_tx.erase("r");
    TEST_ASSERT(!EthereumService::ParseTransactionRecord(unsigned_tx.dump()),
                "Records without a signature are rejected");
    TEST_ASSERT(!EthereumService::ParseTransactionRecord("not json"), "Invalid JSON is rejected");

    TEST_PASS();
}

bool testFetchAndRecoverOnConfiguredNetwork() {
    TEST_START("Fetch and recover from a configured RPC endpoint");

    Fixture fixture;
    fixture.mock->addResponse(ETH_RPC, ToRpcResponse(DynamicFeeTransaction()));

    auto key = fixture.engine.FetchAndRecoverPublicKey("https://eth.rpc", DYNAMIC_FEE_HASH);
    TEST_ASSERT(key.success, "Recovery should succeed");
    TEST_STEP("Recovered " << key->derivedAddress << " on " << key->chainName);
    TEST_ASSERT(key->publicKey == TEST_PUBLIC_KEY, "Public key mismatch");
    TEST_ASSERT(key->derivedAddress == TEST_ADDRESS, "Derived address mismatch");
    TEST_ASSERT(key->chainId == 1 && key->chainName == "Ethereum", "Chain should come from the network");
    TEST_ASSERT(key->txHash == DYNAMIC_FEE_HASH, "Tx hash should be echoed");
    TEST_ASSERT(!key->approximate, "EIP-1559 recovery is exact");

    const auto& request = fixture.mock->requests().front();
    TEST_ASSERT(request.method == "POST", "RPC should be a POST");
    TEST_ASSERT(request.body.find("eth_getTransactionByHash") != std::string::npos,
                "RPC method should be eth_getTransactionByHash");
    TEST_ASSERT(request.body.find(DYNAMIC_FEE_HASH) != std::string::npos, "RPC params should carry the hash");

    TEST_PASS();
}

bool testFetchFromUnlistedEndpoint() {
    TEST_START("Chain falls back to the transaction's chain id");

    auto mock = std::make_shared<MockHttpTransport>();
    Recovery::PublicKeyRecoveryEngine engine(
        mock, {NetworkConfig(1, "Ethereum", "https://eth.explorer/api", "https://eth.rpc")}, "key");

    mock->addResponse("https://other.rpc", ToRpcResponse(AccessListTransaction()));
    auto unknownChain = engine.FetchAndRecoverPublicKey("https://other.rpc", ACCESS_LIST_HASH);
    TEST_ASSERT(unknownChain.success, "Recovery should succeed");
    TEST_ASSERT(unknownChain->chainId == 137, "Chain id should come from the transaction");
    TEST_ASSERT(unknownChain->chainName == "Chain 137", "Unlisted chains get a generic name");

    mock->addResponse("https://legacy.rpc", ToRpcResponse(Eip155Transaction()));
    auto fromV = engine.FetchAndRecoverPublicKey("https://legacy.rpc", EIP155_HASH);
    TEST_ASSERT(fromV.success, "Legacy recovery should succeed");
    TEST_ASSERT(fromV->chainId == 1 && fromV->chainName == "Ethereum", "v = 37 resolves to Ethereum");
    TEST_ASSERT(fromV->derivedAddress == TEST_ADDRESS, "Derived address mismatch");

    TEST_PASS();
}

bool testRpcFailures() {
    TEST_START("RPC failures are classified");

    Fixture fixture;
    fixture.mock->addResponse(ETH_RPC, RpcNullResult());
    auto missing = fixture.engine.FetchAndRecoverPublicKey("https://eth.rpc", EIP155_HASH);
    TEST_ASSERT(!missing.success, "Null result should fail");
    TEST_ASSERT(missing.kind() == Callout::ErrorKind::TransactionNotFound, "Null result is TransactionNotFound");
    TEST_ASSERT(Callout::IsRetryable(missing.kind()), "A missing transaction may appear later");

    fixture.mock->addFailure(POLYGON_RPC, "connection reset");
    auto down = fixture.engine.FetchAndRecoverPublicKey("https://polygon.rpc", EIP155_HASH);
    TEST_ASSERT(down.kind() == Callout::ErrorKind::NetworkError, "Transport failure is NetworkError");
    TEST_ASSERT(Callout::IsRetryable(down.kind()), "NetworkError is retryable");

    fixture.mock->addResponse(OPTIMISM_RPC, "<html>502 Bad Gateway</html>", 502);
    auto gateway = fixture.engine.FetchAndRecoverPublicKey("https://optimism.rpc", EIP155_HASH);
    TEST_ASSERT(gateway.kind() == Callout::ErrorKind::NetworkError, "HTTP 502 is NetworkError");

    fixture.mock->addResponse("https://broken.rpc", "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":");
    auto garbled = fixture.engine.FetchAndRecoverPublicKey("https://broken.rpc", EIP155_HASH);
    TEST_ASSERT(garbled.kind() == Callout::ErrorKind::NetworkError, "Truncated JSON is NetworkError");

    TEST_PASS();
}

bool testSearchTransactionAcrossChains() {
    TEST_START("Cross-chain transaction search");

    Fixture fixture;
    fixture.mock->addResponse(ETH_PROXY, RpcNullResult());
    fixture.mock->addResponse(POLYGON_PROXY, ProxyFoundResponse(ACCESS_LIST_HASH));
    fixture.mock->addResponse(POLYGON_RPC, ToRpcResponse(AccessListTransaction()));

    auto network = fixture.engine.SearchTransactionAcrossChains(ACCESS_LIST_HASH);
    TEST_ASSERT(network.success, "Search should succeed");
    TEST_ASSERT(network->chainId == 137, "Transaction should be located on Polygon");
    TEST_ASSERT(fixture.mock->countRequests(OPTIMISM_PROXY) == 0, "Search should stop at the first hit");

    auto key = fixture.engine.RecoverPublicKeyFromTransaction(ACCESS_LIST_HASH);
    TEST_ASSERT(key.success, "Recovery from hash should succeed");
    TEST_ASSERT(key->chainName == "Polygon", "Key should report the located chain");
    TEST_ASSERT(key->derivedAddress == TEST_ADDRESS, "Derived address mismatch");
    TEST_ASSERT(fixture.mock->countRequests("apikey=test-api-key") > 0, "API key should be sent");

    TEST_PASS();
}

bool testSearchSkipsFailingExplorers() {
    TEST_START("Cross-chain search skips failing explorers");

    Fixture fixture;
    fixture.mock->addFailure(ETH_PROXY);
    fixture.mock->addResponse(POLYGON_PROXY, "rate limited", 429);
    fixture.mock->addResponse(OPTIMISM_PROXY, ProxyFoundResponse(DYNAMIC_FEE_HASH));

    auto network = fixture.engine.SearchTransactionAcrossChains(DYNAMIC_FEE_HASH);
    TEST_ASSERT(network.success, "Search should continue past failures");
    TEST_ASSERT(network->name == "Optimism", "Transaction should be located on Optimism");

    TEST_PASS();
}

bool testTransactionNotFoundAnywhere() {
    TEST_START("Transaction missing on every network");

    Fixture fixture;
    fixture.mock->addResponse("module=proxy", RpcNullResult());

    auto network = fixture.engine.SearchTransactionAcrossChains(EIP155_HASH);
    TEST_ASSERT(!network.success, "Search should fail");
    TEST_ASSERT(network.kind() == Callout::ErrorKind::TransactionNotFoundOnAnyNetwork,
                "Kind should be TransactionNotFoundOnAnyNetwork");
    TEST_ASSERT(fixture.mock->countRequests("module=proxy") == 3, "Every network should be asked once");

    auto key = fixture.engine.RecoverPublicKeyFromTransaction(EIP155_HASH);
    TEST_ASSERT(key.kind() == Callout::ErrorKind::TransactionNotFoundOnAnyNetwork,
                "Recovery should propagate the search failure");

    TEST_PASS();
}

bool testMissingApiKey() {
    TEST_START("Explorer operations require an API key");

    Fixture fixture("");
    auto network = fixture.engine.SearchTransactionAcrossChains(EIP155_HASH);
    TEST_ASSERT(network.kind() == Callout::ErrorKind::MissingApiKey, "Search should be MissingApiKey");

    auto key = fixture.engine.RecoverPublicKeyFromAddress(TEST_ADDRESS);
    TEST_ASSERT(key.kind() == Callout::ErrorKind::MissingApiKey, "Address recovery should be MissingApiKey");
    TEST_ASSERT(fixture.mock->callCount() == 0, "No request should be made without a key");

    // The direct RPC path needs no explorer key
    fixture.mock->addResponse(ETH_RPC, ToRpcResponse(Eip155Transaction()));
    auto direct = fixture.engine.FetchAndRecoverPublicKey("https://eth.rpc", EIP155_HASH);
    TEST_ASSERT(direct.success, "RPC recovery works without an API key");

    TEST_PASS();
}

bool testAddressSearchPreferredChain() {
    TEST_START("Address search tries the preferred chain first");

    Fixture fixture;
    fixture.mock->addResponse(POLYGON_TXLIST, TxListResponse({{ACCESS_LIST_HASH, TEST_ADDRESS}}));
    fixture.mock->addResponse(POLYGON_RPC, ToRpcResponse(AccessListTransaction()));

    auto outcome = fixture.engine.SearchAddress(TEST_ADDRESS, 137);
    TEST_ASSERT(outcome.state == Recovery::SearchState::Found, "Search should find the key");
    TEST_ASSERT(outcome.key.chainId == 137, "Key should come from Polygon");
    TEST_ASSERT(outcome.key.publicKey == TEST_PUBLIC_KEY, "Public key mismatch");
    TEST_ASSERT(fixture.mock->countRequests(ETH_TXLIST) == 0, "Ethereum should not be queried");

    const auto& first = fixture.mock->requests().front();
    TEST_ASSERT(first.key.find("sort=desc") != std::string::npos, "Newest transactions first");
    TEST_ASSERT(first.key.find("offset=5") != std::string::npos, "Five transactions per page");

    TEST_PASS();
}

bool testAddressSearchSkipsNetworks() {
    TEST_START("Address search skips empty and failing networks");

    Fixture fixture;
    // Only an incoming transaction on Ethereum
    fixture.mock->addResponse(ETH_TXLIST, TxListResponse({{EIP155_HASH, SECOND_ADDRESS}}));
    fixture.mock->addResponse(POLYGON_TXLIST, R"({"status":"0","message":"NOTOK","result":"Invalid API Key"})");
    fixture.mock->addResponse(OPTIMISM_TXLIST,
                              TxListResponse({{PRE_EIP155_HASH, SECOND_ADDRESS},
                                              {DYNAMIC_FEE_HASH, TEST_ADDRESS}}));
    fixture.mock->addResponse(OPTIMISM_RPC, ToRpcResponse(DynamicFeeTransaction()));

    auto outcome = fixture.engine.SearchAddress(TEST_ADDRESS);
    TEST_ASSERT(outcome.state == Recovery::SearchState::Found, "Search should reach Optimism");
    TEST_ASSERT(outcome.key.chainName == "Optimism", "Key should report the network it came from");
    TEST_ASSERT(outcome.key.txHash == DYNAMIC_FEE_HASH, "The first outgoing transaction is used");
    TEST_ASSERT(outcome.attempts.size() == 2, "Two networks should have been skipped");
    TEST_ASSERT(outcome.attempts[0].find("Ethereum") == 0, "First attempt should be Ethereum");
    TEST_ASSERT(outcome.attempts[1].find("Invalid API Key") != std::string::npos,
                "Explorer error text should be kept");
    TEST_ASSERT(fixture.mock->countRequests(PRE_EIP155_HASH) == 0, "Incoming transactions are ignored");

    TEST_PASS();
}

bool testMismatchStopsSearch() {
    TEST_START("Address mismatch stops the search");

    Fixture fixture;
    // Listed as sent by SECOND_ADDRESS, but the signature belongs to TEST_ADDRESS
    fixture.mock->addResponse(ETH_TXLIST, TxListResponse({{EIP155_HASH, SECOND_ADDRESS}}));
    fixture.mock->addResponse(ETH_RPC, ToRpcResponse(Eip155Transaction()));
    fixture.mock->addResponse(POLYGON_TXLIST, TxListResponse({{ACCESS_LIST_HASH, SECOND_ADDRESS}}));

    auto outcome = fixture.engine.SearchAddress(SECOND_ADDRESS);
    TEST_ASSERT(outcome.state == Recovery::SearchState::AbortedOnMismatch, "Search should abort");
    TEST_ASSERT(outcome.mismatchDetail.find(TEST_ADDRESS) != std::string::npos,
                "Detail should name the recovered address");
    TEST_ASSERT(outcome.mismatchDetail.find(SECOND_ADDRESS) != std::string::npos,
                "Detail should name the expected address");
    TEST_ASSERT(fixture.mock->countRequests("polygon") == 0, "No further network may be queried");
    TEST_ASSERT(TestUtils::logContains("Recovery", "does not match"), "Mismatch should be logged");

    fixture.mock->reset();
    fixture.mock->addResponse(ETH_TXLIST, TxListResponse({{EIP155_HASH, SECOND_ADDRESS}}));
    fixture.mock->addResponse(ETH_RPC, ToRpcResponse(Eip155Transaction()));
    auto key = fixture.engine.RecoverPublicKeyFromAddress(SECOND_ADDRESS);
    TEST_ASSERT(key.kind() == Callout::ErrorKind::AddressMismatch, "Kind should be AddressMismatch");
    TEST_ASSERT(!Callout::IsRetryable(key.kind()), "AddressMismatch is never retryable");

    TEST_PASS();
}

bool testExhaustedAllNetworks() {
    TEST_START("Address with no outgoing transactions");

    Fixture fixture;
    fixture.mock->addResponse("action=txlist", EmptyTxListResponse());

    auto outcome = fixture.engine.SearchAddress(SECOND_ADDRESS);
    TEST_ASSERT(outcome.state == Recovery::SearchState::ExhaustedAllNetworks, "Search should exhaust");
    TEST_ASSERT(outcome.attempts.size() == 3, "Every network should be attempted");

    auto key = fixture.engine.RecoverPublicKeyFromAddress(SECOND_ADDRESS);
    TEST_ASSERT(key.kind() == Callout::ErrorKind::NoOutgoingTransactionsFound,
                "Kind should be NoOutgoingTransactionsFound");
    TEST_ASSERT(key.error().find("must have sent at least one transaction") != std::string::npos,
                "Message should explain the requirement");
    TEST_ASSERT(key.error().find("Optimism") != std::string::npos, "Message should carry the last failure");

    TEST_PASS();
}

bool testRetryAroundRecovery() {
    TEST_START("Retry policy around network recovery");

    Fixture fixture;
    fixture.mock->addFailure(ETH_RPC, "timeout");
    fixture.mock->addResponse(ETH_RPC, ToRpcResponse(Eip155Transaction()));

    Callout::RetryPolicy policy;
    policy.maxAttempts = 3;
    policy.initialDelayMs = 0;

    auto key = Callout::WithRetry(
        [&fixture]() { return fixture.engine.FetchAndRecoverPublicKey("https://eth.rpc", EIP155_HASH); },
        policy);
    TEST_ASSERT(key.success, "Second attempt should succeed");
    TEST_ASSERT(fixture.mock->countRequests(ETH_RPC) == 2, "Exactly one retry should be made");

    fixture.mock->reset();
    fixture.mock->addResponse(ETH_TXLIST, TxListResponse({{EIP155_HASH, SECOND_ADDRESS}}));
    fixture.mock->addResponse(ETH_RPC, ToRpcResponse(Eip155Transaction()));
    auto mismatch = Callout::WithRetry(
        [&fixture]() { return fixture.engine.RecoverPublicKeyFromAddress(SECOND_ADDRESS); }, policy);
    TEST_ASSERT(mismatch.kind() == Callout::ErrorKind::AddressMismatch, "Mismatch should surface");
    TEST_ASSERT(fixture.mock->countRequests(ETH_TXLIST) == 1, "Mismatch must not be retried");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Public Key Recovery Tests");
    TestUtils::initializeTestLogger("");

    testParseTransactionRecord();
    testFetchAndRecoverOnConfiguredNetwork();
    testFetchFromUnlistedEndpoint();
    testRpcFailures();
    testSearchTransactionAcrossChains();
    testSearchSkipsFailingExplorers();
    testTransactionNotFoundAnywhere();
    testMissingApiKey();
    testAddressSearchPreferredChain();
    testAddressSearchSkipsNetworks();
    testMismatchStopsSearch();
    testExhaustedAllNetworks();
    testRetryAroundRecovery();

    TestUtils::printTestSummary("Public Key Recovery");
    TestUtils::shutdownTestLogger();

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
