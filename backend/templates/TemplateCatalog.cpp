#include "include/TemplateCatalog.h"

#include <algorithm>

namespace Templates {

namespace {

TemplateVariable MakeVariable(const std::string& key, const std::string& label,
                              const std::string& placeholder, VariableType type, bool optional,
                              const std::optional<std::string>& prefix) {
    TemplateVariable variable;
    variable.key = key;
    variable.label = label;
    variable.placeholder = placeholder;
    variable.type = type;
    variable.optional = optional;
    variable.prefix = prefix;
    return variable;
}

using Prefix = std::optional<std::string>;

TemplateVariable ReceiveAddress(const Prefix& prefix = std::nullopt) {
    return MakeVariable("receive_address", "Return Address", "0x... address to return funds to",
                        VariableType::Address, false, prefix);
}

TemplateVariable ExploitedAddress(const Prefix& prefix = std::nullopt) {
    return MakeVariable("exploited_address", "Exploited Address",
                        "0x... address that was exploited", VariableType::Address, false, prefix);
}

TemplateVariable SpammerAddress(const Prefix& prefix = std::nullopt) {
    return MakeVariable("spammer_address", "Scammer Address", "0x... scammer / exploiter address",
                        VariableType::Address, false, prefix);
}

TemplateVariable VictimAddress(const Prefix& prefix = std::nullopt) {
    return MakeVariable("victim_address", "Victim Address", "0x... address that lost funds",
                        VariableType::Address, false, prefix);
}

TemplateVariable RecoveryAddress(const Prefix& prefix = std::nullopt) {
    return MakeVariable("recovery_address", "Recovery Address",
                        "0x... address holding recovered funds", VariableType::Address, false,
                        prefix);
}

TemplateVariable ContractAddress(const Prefix& prefix = std::nullopt) {
    return MakeVariable("contract_address", "Contract Address",
                        "0x... malicious contract address", VariableType::Address, false, prefix);
}

TemplateVariable Deadline(const Prefix& prefix = std::nullopt) {
    return MakeVariable("deadline", "Deadline", "e.g. 48 hours, July 30 2025", VariableType::Text,
                        true, prefix);
}

TemplateVariable TokenName(const Prefix& prefix = std::nullopt) {
    return MakeVariable("token_name", "Token Name", "e.g. ETH, USDC, PLS", VariableType::Text, true,
                        prefix);
}

TemplateVariable Amount(const Prefix& prefix = std::nullopt) {
    return MakeVariable("amount", "Amount", "e.g. 150,000", VariableType::Text, true, prefix);
}

TemplateVariable RecoveredAmount(const Prefix& prefix = std::nullopt) {
    return MakeVariable("recovered_amount", "Recovered Amount", "e.g. 150,000", VariableType::Text,
                        false, prefix);
}

TemplateVariable ProjectName(const Prefix& prefix = std::nullopt) {
    return MakeVariable("project_name", "Project Name", "e.g. RocketSwap, SafeYield",
                        VariableType::Text, false, prefix);
}

TemplateVariable TheftTxHash(const Prefix& prefix = std::nullopt) {
    return MakeVariable("theft_tx_hash", "Theft Transaction Hash",
                        "0x... transaction hash of the theft", VariableType::Text, false, prefix);
}

TemplateVariable ChainId(const Prefix& prefix = std::nullopt) {
    return MakeVariable("chain_id", "Chain ID", "e.g. 369, 1, 137, 8453", VariableType::Number,
                        false, prefix);
}

TemplateVariable RecoveryPercentage(const Prefix& prefix = std::nullopt) {
    return MakeVariable("recovery_percentage", "Recovery Percentage", "90 (for 90%)",
                        VariableType::Number, false, prefix);
}

MessageTemplate MakeTemplate(const std::string& id, const std::string& name,
                             const std::string& categoryId, const std::string& templateString,
                             const std::string& description,
                             const std::vector<TemplateVariable>& variables) {
    MessageTemplate messageTemplate;
    messageTemplate.id = id;
    messageTemplate.name = name;
    messageTemplate.categoryId = categoryId;
    messageTemplate.templateString = templateString;
    messageTemplate.description = description;
    messageTemplate.variables = variables;
    return messageTemplate;
}

std::vector<TemplateCategory> BuildCategories() {
    return {
        {"scam-recovery", "Scam Recovery", "Negotiate return of stolen funds", "victim", "scammer"},
        {"rug-pull", "Rug Pull", "Hold devs accountable on-chain", "investor", "developer"},
        {"approval-exploit", "Approval Exploit", "Warn about token approval abuse", "victim",
         "exploiter"},
        {"public-warning", "Public Warning", "Broadcast warnings to the ecosystem", "reporter",
         "recipient"},
        {"whitehat-recovery", "Whitehat Recovery", "Reach out to victims after recovering funds",
         "whitehat", "victim"},
    };
}

std::vector<MessageTemplate> BuildTemplates() {
    std::vector<MessageTemplate> templates;

    // Scam recovery

    templates.push_back(MakeTemplate(
        "scam-bounty-whitehat", "Bounty Offer (Whitehat)", "scam-recovery",
        "This is a message regarding funds taken from ${exploited_address}. "
        "If you are a whitehat security researcher who recovered these funds, please return "
        "${recovery_percentage}%${amount? of the ${amount}}${token_name? ${token_name}} to "
        "${receive_address} and keep ${bounty_percentage}% as a legitimate bounty."
        "${deadline? Please respond by ${deadline}.} This is a good-faith offer.",
        "Bounty offer assuming whitehat intent - collaborative tone",
        {ExploitedAddress("taken from "), RecoveryPercentage("return "), Amount("the "),
         TokenName(), ReceiveAddress("to "), Deadline("respond by ")}));

    templates.push_back(MakeTemplate(
        "scam-bounty-simple", "Bounty Offer (Simple)", "scam-recovery",
        "Return ${recovery_percentage}% of the funds procured in transaction hash ${theft_tx_hash} "
        "on chain ${chain_id} to ${receive_address} and keep ${bounty_percentage}% as a legitimate "
        "bounty. This is a good-faith offer.",
        "Simple bounty offer - clean and direct",
        {RecoveryPercentage("Return "), TheftTxHash("transaction hash "), ChainId("on chain "),
         ReceiveAddress("to ")}));

    templates.push_back(MakeTemplate(
        "scam-bounty", "Bounty Offer (Detailed)", "scam-recovery",
        "This is a message regarding funds taken from ${exploited_address}. "
        "Return ${recovery_percentage}%${amount? of the ${amount}}${token_name? ${token_name}} to "
        "${receive_address} and keep ${bounty_percentage}% as a legitimate bounty."
        "${deadline? No further action will be pursued if funds are returned by ${deadline}.} "
        "This is a good-faith offer.",
        "Detailed bounty offer with specific amounts",
        {ExploitedAddress("taken from "), RecoveryPercentage("Return "), Amount("the "),
         TokenName(), ReceiveAddress("to "), Deadline("returned by ")}));

    templates.push_back(MakeTemplate(
        "scam-legal", "Legal Threat (Scammer)", "scam-recovery",
        "NOTICE: Unauthorized transfers from ${exploited_address} have been documented. "
        "Blockchain forensics and law enforcement have been engaged. "
        "Return funds${amount? ${amount}}${token_name? ${token_name}} to ${receive_address} "
        "immediately. Failure to comply will result in legal proceedings. All on-chain evidence "
        "is preserved permanently.",
        "Formal legal notice with law enforcement mention - for scammers",
        {ExploitedAddress("from "), Amount("("), TokenName(), ReceiveAddress("to ")}));

    templates.push_back(MakeTemplate(
        "scam-deadline", "Deadline Warning (Scammer)", "scam-recovery",
        "FINAL WARNING: Return funds${amount? ${amount}}${token_name? ${token_name}} to "
        "${receive_address}${deadline? by ${deadline}}. "
        "All collected evidence including transaction traces, wallet clustering data, and exchange "
        "deposit records will be submitted to relevant authorities and published publicly. "
        "This is your last opportunity to resolve this without escalation.",
        "Final deadline with specific consequences - for scammers",
        {Amount("("), TokenName(), ReceiveAddress("to "), Deadline("by ")}));

    // Rug pull

    templates.push_back(MakeTemplate(
        "rug-accountability", "Developer Accountability", "rug-pull",
        "This address deployed and controlled ${project_name}. "
        "Liquidity${amount? approximately ${amount}}${token_name? ${token_name}} was removed "
        "without community consent. This message is an immutable, on-chain record of that action. "
        "Investors and future projects can verify this wallet's history permanently. "
        "Return funds to ${receive_address} to begin making this right.",
        "On-chain record tying a dev wallet to a rug pull",
        {ProjectName("controlled "), Amount("Approximately "), TokenName(),
         ReceiveAddress("to ")}));

    templates.push_back(MakeTemplate(
        "rug-community", "Community Warning", "rug-pull",
        "PUBLIC NOTICE: The project ${project_name} has been identified as a rug pull. "
        "This address (the recipient of this message) drained${amount? approximately ${amount}}"
        "${token_name? ${token_name}} from the project. "
        "DO NOT interact with any new tokens or contracts deployed by this wallet. "
        "This record is permanent and searchable on-chain.",
        "Public warning to the community about a rug-pulled project",
        {ProjectName("project "), Amount("approximately "), TokenName()}));

    // Approval exploit

    templates.push_back(MakeTemplate(
        "approval-revoke", "Revoke Alert", "approval-exploit",
        "WARNING TO ALL HOLDERS: The contract at ${contract_address} has been exploiting token "
        "approvals. ${token_name? If you have approved ${token_name} for this contract, }REVOKE "
        "YOUR APPROVAL IMMEDIATELY using revoke.cash or your wallet's approval manager. "
        "${amount? Approximately ${amount}}${token_name? ${token_name}} has already been drained "
        "from ${exploited_address} and other victims.",
        "Urgent alert to revoke malicious token approvals",
        {ContractAddress("contract at "), TokenName("approved "), Amount("Approximately "),
         ExploitedAddress("from ")}));

    templates.push_back(MakeTemplate(
        "approval-demand", "Funds Recovery Demand", "approval-exploit",
        "You exploited token approvals via contract ${contract_address} to drain"
        "${amount? ${amount}}${token_name? ${token_name}} from multiple wallets including "
        "${exploited_address}. All exploit transactions have been traced and documented. "
        "Return stolen funds to ${receive_address}${deadline? by ${deadline}}. "
        "Exchanges have been notified and are monitoring for deposits from flagged addresses.",
        "Direct demand to approval exploiter with evidence mention",
        {ContractAddress("contract "), Amount("drain "), TokenName(),
         ExploitedAddress("including "), ReceiveAddress("to "), Deadline("by ")}));

    // Public warning

    templates.push_back(MakeTemplate(
        "warning-identity", "Identity Warning", "public-warning",
        "PUBLIC RECORD: This address is associated with ${spammer_address} and has been identified "
        "in connection with fraudulent activity involving ${project_name}. "
        "${amount? Approximately ${amount}}${token_name? ${token_name}} has been stolen across "
        "multiple victims. This on-chain record serves as a permanent warning to all future "
        "counterparties.",
        "Link a scammer identity to their wallet on-chain",
        {SpammerAddress("with "), ProjectName("involving "), Amount("Approximately "),
         TokenName()}));

    templates.push_back(MakeTemplate(
        "warning-exchange", "Exchange / Bridge Alert", "public-warning",
        "EXCHANGE & BRIDGE NOTICE: Funds from address ${spammer_address} are proceeds of theft"
        "${amount? \xE2\x80\x94 ${amount}}${token_name? ${token_name}} stolen from "
        "${exploited_address}. Any deposits from this wallet or associated addresses should be "
        "frozen and investigated. Legitimate owner recovery address: ${receive_address}. "
        "Contact victim via the sending address of this transaction for verification.",
        "Alert exchanges/bridges to freeze stolen funds",
        {SpammerAddress("address "), Amount("\xE2\x80\x94 "), TokenName(),
         ExploitedAddress("from "), ReceiveAddress(": ")}));

    // Whitehat recovery

    templates.push_back(MakeTemplate(
        "whitehat-intro", "Recovery Introduction", "whitehat-recovery",
        "Hello, I recovered ${recovered_amount}${token_name? ${token_name}} that was taken from "
        "your address ${victim_address}. The funds are currently held at ${recovery_address}. "
        "Please contact me via the sending address of this transaction to arrange return of your "
        "funds. I am a whitehat security researcher and recovered these funds to prevent further "
        "loss.",
        "Initial contact from whitehat to victim - friendly introduction",
        {RecoveredAmount("recovered "), TokenName(), VictimAddress("address "),
         RecoveryAddress("at ")}));

    templates.push_back(MakeTemplate(
        "whitehat-bounty-offer", "Bounty Proposal", "whitehat-recovery",
        "I recovered ${recovered_amount}${token_name? ${token_name}} that was taken from "
        "${victim_address}. The funds are held at ${recovery_address}. "
        "I propose returning ${recovery_percentage}% to you and keeping ${bounty_percentage}% as a "
        "recovery bounty for my work. Please contact me via the sending address of this "
        "transaction if you agree to these terms.${deadline? Please respond by ${deadline}.}",
        "Whitehat proposing a bounty split to victim",
        {RecoveredAmount("recovered "), TokenName(), VictimAddress("from "),
         RecoveryAddress("at "), RecoveryPercentage("returning "), Deadline("respond by ")}));

    templates.push_back(MakeTemplate(
        "whitehat-full-return", "Full Return Offer", "whitehat-recovery",
        "I recovered ${recovered_amount}${token_name? ${token_name}} that was taken from "
        "${victim_address}. The funds are currently held at ${recovery_address}. "
        "I am offering to return 100% of the recovered funds to you. "
        "Please contact me via the sending address of this transaction to arrange the return. "
        "No bounty requested - this is a goodwill recovery.",
        "Whitehat offering full return with no bounty",
        {RecoveredAmount("recovered "), TokenName(), VictimAddress("from "),
         RecoveryAddress("at ")}));

    templates.push_back(MakeTemplate(
        "whitehat-verification", "Verification Request", "whitehat-recovery",
        "I recovered funds that may belong to ${victim_address}. "
        "To verify ownership and arrange return, please: "
        "1) Sign a message from ${victim_address} proving control, "
        "2) Contact me via the sending address of this transaction with the signature. "
        "Recovered amount: ${recovered_amount}${token_name? ${token_name}}. "
        "Funds held at: ${recovery_address}.",
        "Whitehat requesting verification before returning funds",
        {VictimAddress("belong to "), RecoveredAmount(": "), TokenName(),
         RecoveryAddress(": ")}));

    return templates;
}

} // namespace

const std::vector<TemplateCategory>& GetTemplateCategories() {
    static const std::vector<TemplateCategory> categories = BuildCategories();
    return categories;
}

const std::vector<MessageTemplate>& GetMessageTemplates() {
    static const std::vector<MessageTemplate> templates = BuildTemplates();
    return templates;
}

std::vector<MessageTemplate> GetTemplatesByCategory(const std::string& categoryId) {
    std::vector<MessageTemplate> matching;
    for (const auto& messageTemplate : GetMessageTemplates()) {
        if (messageTemplate.categoryId == categoryId) {
            matching.push_back(messageTemplate);
        }
    }
    return matching;
}

std::optional<MessageTemplate> GetTemplateById(const std::string& id) {
    const auto& templates = GetMessageTemplates();
    auto it = std::find_if(templates.begin(), templates.end(),
                           [&id](const MessageTemplate& messageTemplate) {
                               return messageTemplate.id == id;
                           });
    if (it == templates.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace Templates
