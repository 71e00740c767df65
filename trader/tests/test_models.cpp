#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/signal.hpp"
#include "../src/sol_amount.hpp"
#include "../src/solana_tx.hpp"
#include "../src/util.hpp"
#include "fakes.hpp"
#include <limits>

namespace {
ErrorCode parse_error(const std::string& text) {
    try {
        SolAmount::parse(text);
    } catch (const TradeError& e) {
        return e.code();
    }
    FAIL("parsed " << text);
    return ErrorCode::ValidationFailed;
}

nlohmann::json wire_signal() {
    return {
        {"strategy", "SHIELD"},
        {"action", "buy"},
        {"token", "BONK"},
        {"amount_sol", "0.25"},
        {"wallet_address", TEST_WALLET},
        {"timestamp", 1700000000}
    };
}
}

TEST_CASE("Fixed-point SOL amounts", "[amount]") {
    SECTION("Decimal strings parse exactly") {
        REQUIRE(SolAmount::parse("1").lamports() == 1000000000);
        REQUIRE(SolAmount::parse("0.5").lamports() == 500000000);
        REQUIRE(SolAmount::parse("0.000000001").lamports() == 1);
        REQUIRE(SolAmount::parse(".25").lamports() == 250000000);
        REQUIRE(SolAmount::parse("-0.1").lamports() == -100000000);
    }

    SECTION("Malformed or over-precise input is rejected") {
        REQUIRE(parse_error("0.0000000001") == ErrorCode::ValidationFailed);
        REQUIRE(parse_error("") == ErrorCode::ValidationFailed);
        REQUIRE(parse_error("abc") == ErrorCode::ValidationFailed);
        REQUIRE(parse_error("1.2.3") == ErrorCode::ValidationFailed);
        REQUIRE(parse_error("12345678901") == ErrorCode::ValidationFailed);
    }

    SECTION("Amounts beyond the lamport range are rejected") {
        REQUIRE(parse_error("9999999999") == ErrorCode::ValidationFailed);
        REQUIRE(parse_error("9223372036.854775808") == ErrorCode::ValidationFailed);
        REQUIRE(SolAmount::parse("9223372036.854775807").lamports() == std::numeric_limits<int64_t>::max());
    }

    SECTION("Canonical string trims trailing zeros") {
        REQUIRE(SolAmount::parse("0.500").to_string() == "0.5");
        REQUIRE(SolAmount::parse("2.0").to_string() == "2");
        REQUIRE(SolAmount::from_lamports(1000).to_string() == "0.000001");
        REQUIRE(SolAmount::from_lamports(-1500000000).to_string() == "-1.5");
    }

    SECTION("Basis points round down") {
        REQUIRE(SolAmount::parse("1").percent_bps(1000) == SolAmount::parse("0.1"));
        REQUIRE(SolAmount::from_lamports(9999).percent_bps(1).lamports() == 0);
        REQUIRE(SolAmount::parse("100").percent_bps(10000) == SolAmount::parse("100"));
    }
}

TEST_CASE("Signal parsing and validation", "[signal]") {
    SECTION("Wire aliases map to strategies") {
        REQUIRE(parse_strategy("SHIELD") == Strategy::Conservative);
        REQUIRE(parse_strategy("spear") == Strategy::Aggressive);
        REQUIRE(parse_strategy("Exit") == Strategy::Exit);
        REQUIRE_THROWS_AS(parse_strategy("YOLO"), TradeError);
    }

    SECTION("Amount accepted as string or number") {
        auto j = wire_signal();
        REQUIRE(Signal::from_json(j).amount == SolAmount::parse("0.25"));

        j["amount_sol"] = 0.5;
        REQUIRE(Signal::from_json(j).amount == SolAmount::parse("0.5"));
    }

    SECTION("Missing fields are validation failures") {
        auto j = wire_signal();
        j.erase("token");
        try {
            Signal::from_json(j);
            FAIL("parsed incomplete signal");
        } catch (const TradeError& e) {
            REQUIRE(e.code() == ErrorCode::ValidationFailed);
        }

        REQUIRE_THROWS_AS(Signal::from_json(nlohmann::json("not a signal")), TradeError);
    }

    SECTION("Trade uuid is derived deterministically when absent") {
        auto a = Signal::from_json(wire_signal());
        auto b = Signal::from_json(wire_signal());
        REQUIRE(a.trade_uuid.size() == 32);
        REQUIRE(a.trade_uuid == b.trade_uuid);

        auto j = wire_signal();
        j["amount_sol"] = "0.26";
        REQUIRE(Signal::from_json(j).trade_uuid != a.trade_uuid);

        j = wire_signal();
        j["trade_uuid"] = "client-chosen";
        REQUIRE(Signal::from_json(j).trade_uuid == "client-chosen");
    }

    SECTION("Validation rules") {
        auto s = make_signal("v1");
        REQUIRE_NOTHROW(s.validate());

        auto bad = s;
        bad.token.clear();
        REQUIRE_THROWS_AS(bad.validate(), TradeError);

        bad = s;
        bad.wallet_address = "short";
        REQUIRE_THROWS_AS(bad.validate(), TradeError);

        bad = s;
        bad.amount = SolAmount::from_lamports(0);
        REQUIRE_THROWS_AS(bad.validate(), TradeError);

        bad = s;
        bad.amount = SolAmount::parse("100.000000001");
        REQUIRE_THROWS_AS(bad.validate(), TradeError);

        bad = s;
        bad.amount = SolAmount::parse("100");
        REQUIRE_NOTHROW(bad.validate());

        bad = s;
        bad.strategy = Strategy::Exit;
        bad.action = Action::Buy;
        REQUIRE_THROWS_AS(bad.validate(), TradeError);
    }

    SECTION("Mint falls back to the token symbol") {
        auto s = make_signal("m1");
        REQUIRE(s.mint() == s.token_address);
        s.token_address.clear();
        REQUIRE(s.mint() == "BONK");
    }
}

TEST_CASE("Error codes", "[errors]") {
    REQUIRE(error_code_string(ErrorCode::LoadShed) == "LOAD_SHED");
    REQUIRE(error_code_string(ErrorCode::DuplicateTrade) == "DUPLICATE_TRADE");

    REQUIRE(is_retryable(ErrorCode::RpcUnavailable));
    REQUIRE(is_retryable(ErrorCode::Timeout));
    REQUIRE_FALSE(is_retryable(ErrorCode::StrategyDisabled));
    REQUIRE_FALSE(is_retryable(ErrorCode::AmountTooLarge));

    REQUIRE(is_execution_error(ErrorCode::AmountTooSmall));
    REQUIRE_FALSE(is_execution_error(ErrorCode::QueueFull));

    TradeError e(ErrorCode::QueueFull, "Queue is full (3/3)");
    REQUIRE(e.reason_code() == "QUEUE_FULL");
}

TEST_CASE("Encoding helpers", "[util]") {
    SECTION("Base58 keeps leading zero bytes") {
        std::vector<uint8_t> bytes = {0, 0, 1, 2, 3};
        auto text = util::base58_encode(bytes);
        REQUIRE(text.substr(0, 2) == "11");
        REQUIRE(util::base58_decode(text) == bytes);
        REQUIRE(util::base58_encode(std::vector<uint8_t>(32, 0)) == "11111111111111111111111111111111");
        REQUIRE_THROWS_AS(util::base58_decode("0OIl"), std::invalid_argument);
    }

    SECTION("Base64 matches the standard alphabet") {
        std::vector<uint8_t> bytes = {'h', 'e', 'l', 'l', 'o'};
        REQUIRE(util::base64_encode(bytes) == "aGVsbG8=");
        REQUIRE(util::base64_decode("aGVsbG8=") == bytes);
    }

    SECTION("Short-vec boundaries") {
        std::vector<uint8_t> out;
        util::encode_shortvec(out, 0x7f);
        REQUIRE(out == std::vector<uint8_t>{0x7f});

        out.clear();
        util::encode_shortvec(out, 0x80);
        REQUIRE(out == std::vector<uint8_t>{0x80, 0x01});

        out.clear();
        util::encode_shortvec(out, 0x3fff);
        REQUIRE(out == std::vector<uint8_t>{0xff, 0x7f});

        size_t offset = 0;
        REQUIRE(util::decode_shortvec(out, offset) == 0x3fff);
        REQUIRE(offset == 2);
    }

    SECTION("Trade id hashing") {
        REQUIRE(util::sha256_hex("abc") ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        REQUIRE(util::sha256_hex("abc", 16) == "ba7816bf8f01cfea414140de5dae2223");
    }

    SECTION("DSN password redaction") {
        REQUIRE(util::redact_dsn("postgresql://trader:hunter2@db:5432/trades") ==
                "postgresql://trader:***@db:5432/trades");
        REQUIRE(util::redact_dsn("postgresql://db/trades") == "postgresql://db/trades");
    }

    SECTION("Solana address shape") {
        REQUIRE(util::is_valid_solana_address(TEST_WALLET));
        REQUIRE_FALSE(util::is_valid_solana_address("0x1234"));
    }
}

TEST_CASE("Transfer transaction layout", "[solana_tx]") {
    std::array<uint8_t, 32> from{};
    std::array<uint8_t, 32> to{};
    std::array<uint8_t, 32> blockhash{};
    from.fill(1);
    to.fill(2);
    blockhash.fill(3);

    auto message = WireTransaction::transfer_message(from, to, 1000000, blockhash);

    SECTION("Header, accounts and instruction") {
        // header + 3 accounts + blockhash + 1 instruction (program, 2 accounts, 12 data bytes)
        REQUIRE(message.size() == 3 + 1 + 96 + 32 + 1 + 1 + 1 + 2 + 1 + 12);
        REQUIRE(message[0] == 1);
        REQUIRE(message[1] == 0);
        REQUIRE(message[2] == 1);
        REQUIRE(message[3] == 3);
        REQUIRE(message[4] == 1);
        REQUIRE(message[4 + 32] == 2);
        REQUIRE(message[4 + 64] == 0);

        // instruction index 2 followed by u64 lamports, little endian
        size_t data = message.size() - 12;
        REQUIRE(message[data] == 2);
        REQUIRE(message[data + 4] == 0x40);
        REQUIRE(message[data + 5] == 0x42);
        REQUIRE(message[data + 6] == 0x0f);
    }

    SECTION("Blockhash can be replaced in place") {
        auto tx = WireTransaction::from_message(message, 1);
        REQUIRE(tx.recent_blockhash() == blockhash);

        std::array<uint8_t, 32> fresh{};
        fresh.fill(9);
        tx.set_recent_blockhash(fresh);
        REQUIRE(tx.recent_blockhash() == fresh);

        auto parsed = WireTransaction::parse(tx.serialize());
        REQUIRE(parsed.signature_count() == 1);
        REQUIRE(parsed.recent_blockhash() == fresh);
    }

    SECTION("Signing fills the fee payer slot") {
        auto keypair = Keypair::from_bytes(std::vector<uint8_t>(32, 7));
        auto tx = WireTransaction::from_message(
            WireTransaction::transfer_message(keypair.pubkey(), to, 5000, blockhash), 1);
        tx.sign(keypair);

        auto sig = util::base58_decode(tx.signature_base58());
        REQUIRE(sig.size() == 64);
        REQUIRE(sig != std::vector<uint8_t>(64, 0));
        REQUIRE_THROWS_AS(WireTransaction::parse({0x01, 0x02}), std::invalid_argument);
    }
}
