#include <catch2/catch_test_macros.hpp>
#include <cidgen.hpp>
#include <sstream>

#include "cid_tool.hpp"
#include "utils.hpp"

namespace cidgen::test
{
    // nonce abcdef followed by the first 5 bytes of HMAC-SHA256(SHARED_SECRET, nonce)
    inline constexpr auto KNOWN_GOOD_CID = "abcdef12a3fee6ab"sv;

    static std::vector<std::string> lines(const std::string& s)
    {
        std::vector<std::string> result;
        std::istringstream in{s};
        for (std::string line; std::getline(in, line);)
            result.push_back(line);
        return result;
    }

    TEST_CASE("006 - Tool: generate", "[006][tool][generate]")
    {
        std::ostringstream out;

        SECTION("Random IDs of the requested length")
        {
            REQUIRE(tool::generate_cids(out, 5, 12, std::nullopt) == tool::EXIT_ALL_VALID);
            auto ids = lines(out.str());
            REQUIRE(ids.size() == 5);
            for (const auto& id : ids)
                CHECK(connection_id::from_hex(id).size() == 12);
        }

        SECTION("Keyed IDs when a secret is given")
        {
            REQUIRE(tool::generate_cids(out, 5, 12, opt::hmac_secret{SHARED_SECRET}) == tool::EXIT_ALL_VALID);
            auto ids = lines(out.str());
            REQUIRE(ids.size() == 5);

            auto checker = make_keyed_generator(opt::hmac_secret{SHARED_SECRET});
            for (const auto& id : ids)
            {
                auto cid = connection_id::from_hex(id);
                CHECK(cid.size() == keyed_cid_generator::CID_LEN);
                CHECK(checker.validate(cid));
            }
        }

        SECTION("Bad length")
        {
            REQUIRE_THROWS_AS(tool::generate_cids(out, 1, MAX_CID_LEN + 1, std::nullopt), std::out_of_range);
        }
    }

    TEST_CASE("006 - Tool: validate", "[006][tool][validate]")
    {
        std::ostringstream out;

        SECTION("Known good ID")
        {
            // Fixed value: keyed IDs must stay stable across releases for cooperating processes
            REQUIRE(tool::validate_cids(out, opt::hmac_secret{SHARED_SECRET}, {std::string{KNOWN_GOOD_CID}}) ==
                    tool::EXIT_ALL_VALID);
            CHECK(out.str() == "abcdef12a3fee6ab: valid\n");
        }

        SECTION("Mixed input reports every ID")
        {
            std::vector<std::string> ids{
                    "abcdef12a3fee6ac",  // last bit flipped
                    "not-hex",
                    std::string{KNOWN_GOOD_CID},
                    "abcdef",
            };
            REQUIRE(tool::validate_cids(out, opt::hmac_secret{SHARED_SECRET}, ids) == tool::EXIT_SOME_INVALID);

            auto result = lines(out.str());
            REQUIRE(result.size() == 4);
            CHECK(result[0] == "abcdef12a3fee6ac: invalid (" + std::string{cid_strerror(cid_error::bad_signature)} + ")");
            CHECK(result[1] == "not-hex: invalid (not a hex connection ID)");
            CHECK(result[2] == "abcdef12a3fee6ab: valid");
            CHECK(result[3] == "abcdef: invalid (" + std::string{cid_strerror(cid_error::bad_length)} + ")");
        }

        SECTION("Different secret")
        {
            REQUIRE(tool::validate_cids(out, opt::hmac_secret{ustring(32, 0x55)}, {std::string{KNOWN_GOOD_CID}}) ==
                    tool::EXIT_SOME_INVALID);
        }
    }
}  // namespace cidgen::test
