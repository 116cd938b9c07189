#include "ferry/Hash.hpp"

#include "doctest/doctest.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace ferry {

TEST_CASE("idlHash known values") {
    CHECK_EQ(idlHash(""), 0);
    CHECK_EQ(idlHash("a"), 97);
    CHECK_EQ(idlHash("x"), 120);
    CHECK_EQ(idlHash("id"), 23515);
    CHECK_EQ(idlHash("foo"), 5097222);
    CHECK_EQ(idlHash("bar"), 4895187);
    CHECK_EQ(idlHash("name"), 1224700491);
    CHECK_EQ(idlHash("head"), 1158359328);
    CHECK_EQ(idlHash("tail"), 1291237008);
}

TEST_CASE("idlHash is stable") {
    std::string label("balance");
    auto first = idlHash(label);
    auto second = idlHash(std::string_view(label.data(), label.size()));
    CHECK_EQ(first, second);
    // Distinct instances of the same characters hash alike.
    CHECK_EQ(idlHash("balance"), first);
}

TEST_CASE("idlHash no collisions in a realistic schema") {
    std::vector<std::string> labels { "id", "name", "owner", "balance", "amount", "from", "to", "memo", "created_at",
                                      "updated_at", "timestamp", "caller", "canister", "principal", "subaccount",
                                      "fee", "ok", "err", "InsufficientFunds", "BadFee", "TooOld", "CreatedInFuture",
                                      "Duplicate", "TemporarilyUnavailable", "GenericError", "message", "code",
                                      "head", "tail", "left", "right", "value", "key", "entries", "size", "count",
                                      "start", "length", "offset", "producer", "retailer", "document", "title",
                                      "body", "tags", "version", "get", "put", "delete", "list", "query", "update",
                                      "transfer", "approve", "allowance", "metadata", "symbol", "decimals",
                                      "total_supply", "minting_account", "expires_at", "spender", "status" };
    std::unordered_map<Hash, std::string> seen;
    for (const auto& label : labels) {
        auto h = idlHash(label);
        auto iter = seen.find(h);
        if (iter != seen.end()) {
            FAIL("collision between '" << iter->second << "' and '" << label << "'");
        }
        seen.emplace(h, label);
    }
    CHECK_EQ(seen.size(), labels.size());
}

TEST_CASE("symbol hash") {
    SUBCASE("empty input matches reference XXH32") { CHECK_EQ(hash(""), 0x02cc5d05); }
    SUBCASE("deterministic") {
        CHECK_EQ(hash("List"), hash(std::string("List")));
        CHECK_EQ(hash("List", 4), hash("List"));
    }
    SUBCASE("seed changes result") {
        std::string_view name("List");
        CHECK_NE(hash(name, 0), hash(name, 1));
    }
}

} // namespace ferry
