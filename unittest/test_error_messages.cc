//
// Error messages and error kinds reported to callers
//

#include <doctest/doctest.h>
#include <string>
#include <vector>

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include "test_utils.hh"

using namespace pngme;

TEST_CASE("Error messages") {
    SUBCASE("invalid chunk type lists the offending bytes") {
        try {
            chunk_type t("Ru1t");
            FAIL("Should have thrown exception");
        } catch (const invalid_chunk_type_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("[82, 117, 49, 116]") != std::string::npos);
            CHECK(msg.find("uppercase or lowercase letters") != std::string::npos);
            CHECK(e.kind() == error_kind::invalid_chunk_type);
        }
    }

    SUBCASE("invalid length shows the actual size") {
        try {
            chunk_type t("RuStX");
            FAIL("Should have thrown exception");
        } catch (const invalid_length_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("4-byte length") != std::string::npos);
            CHECK(msg.find("got 5") != std::string::npos);
            CHECK(e.kind() == error_kind::invalid_length);
        }
    }

    SUBCASE("checksum mismatch names the chunk and both values") {
        try {
            (void)chunk::parse(secret_frame(2882656333u));
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("RuSt") != std::string::npos);
            CHECK(msg.find("2882656333") != std::string::npos);
            CHECK(msg.find("2882656334") != std::string::npos);
            CHECK(msg.find("does not match") != std::string::npos);
            CHECK(e.kind() == error_kind::checksum_mismatch);
        }
    }

    SUBCASE("truncated input shows the size") {
        std::vector<std::byte> data(7);
        try {
            (void)chunk::parse(data);
            FAIL("Should have thrown exception");
        } catch (const truncated_input_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("12") != std::string::npos);
            CHECK(msg.find("got 7") != std::string::npos);
        }
    }

    SUBCASE("length mismatch shows declared and actual sizes") {
        auto frame = make_frame(40, "RuSt", secret_message, secret_message_crc);
        try {
            (void)chunk::parse(frame);
            FAIL("Should have thrown exception");
        } catch (const length_mismatch_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("declares 40") != std::string::npos);
            CHECK(msg.find("holds 42") != std::string::npos);
            CHECK(e.kind() == error_kind::length_mismatch);
        }
    }

    SUBCASE("size limit shows length and limit") {
        parse_options opts;
        opts.max_chunk_size = 16;
        try {
            (void)chunk::parse(secret_frame(), opts);
            FAIL("Should have thrown exception");
        } catch (const chunk_too_large_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("RuSt") != std::string::npos);
            CHECK(msg.find("42") != std::string::npos);
            CHECK(msg.find("16") != std::string::npos);
        }
    }

    SUBCASE("text decode error names the byte offset") {
        chunk c(chunk_type("ruSt"), std::string_view("ok\xff"));
        try {
            (void)c.data_as_string();
            FAIL("Should have thrown exception");
        } catch (const text_decode_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("UTF-8") != std::string::npos);
            CHECK(msg.find("byte 2") != std::string::npos);
            CHECK(e.kind() == error_kind::text_decode);
        }
    }
}

TEST_CASE("Error kinds") {
    SUBCASE("stable names") {
        CHECK(to_string(error_kind::invalid_length) == "invalid_length");
        CHECK(to_string(error_kind::invalid_chunk_type) == "invalid_chunk_type");
        CHECK(to_string(error_kind::truncated_input) == "truncated_input");
        CHECK(to_string(error_kind::length_mismatch) == "length_mismatch");
        CHECK(to_string(error_kind::chunk_too_large) == "chunk_too_large");
        CHECK(to_string(error_kind::checksum_mismatch) == "checksum_mismatch");
        CHECK(to_string(error_kind::text_decode) == "text_decode");
        CHECK(to_string(error_kind::io) == "io");
        CHECK(to_string(error_kind::parse) == "parse");
    }

    SUBCASE("hierarchy") {
        CHECK_THROWS_AS((void)chunk::parse(secret_frame(1)), parse_error);
        CHECK_THROWS_AS((void)chunk::parse(secret_frame(1)), pngme_error);
        CHECK_THROWS_AS((void)chunk::parse(secret_frame(1)), std::runtime_error);

        chunk c(chunk_type("ruSt"), std::string_view("\xff"));
        CHECK_THROWS_AS((void)c.data_as_string(), pngme_error);
    }

    SUBCASE("macro builds message from arguments") {
        try {
            THROW_PNGME(truncated_input_error, "need ", 12, " bytes, got ", 3);
        } catch (const truncated_input_error& e) {
            CHECK(std::string(e.what()) == "need 12 bytes, got 3");
            CHECK(e.kind() == error_kind::truncated_input);
        }
    }
}
