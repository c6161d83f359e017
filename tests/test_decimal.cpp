/**
 * @file test_decimal.cpp
 * @brief Unit tests for DecimalValue construction.
 */

#include <packdec/packdec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace packdec;

using Bytes = std::vector<std::uint8_t>;

static void require_zero(const std::optional<DecimalValue>& value) {
    REQUIRE(value.has_value());
    REQUIRE(value->sign() == Sign::Zero);
    REQUIRE(value->fractional_digit_count() == 0);
    REQUIRE(value->packed_digits() == Bytes{0x00});
    REQUIRE(value->is_zero());
}

TEST_CASE("Canonical zero", "[decimal]") {
    SECTION("from \"0\"") {
        require_zero(construct("0"));
    }

    SECTION("default-constructed record") {
        DecimalValue value;
        REQUIRE(value.sign() == Sign::Zero);
        REQUIRE(value.fractional_digit_count() == 0);
        REQUIRE(value.packed_digits() == Bytes{0x00});
        REQUIRE(construct("0") == value);
    }
}

TEST_CASE("Reference literal", "[decimal]") {
    auto value = construct("+1234.56789");
    REQUIRE(value.has_value());
    REQUIRE(value->sign() == Sign::Positive);
    REQUIRE(value->fractional_digit_count() == 5);
    REQUIRE(value->packed_digits() == Bytes{0x89, 0x67, 0x45, 0x23, 0x01});
    REQUIRE_FALSE(value->is_zero());
}

TEST_CASE("Negative literal", "[decimal]") {
    auto value = construct("-99084.566");
    REQUIRE(value.has_value());
    REQUIRE(value->sign() == Sign::Negative);
    REQUIRE(value->fractional_digit_count() == 3);
    REQUIRE(value->packed_digits() == Bytes{0x66, 0x45, 0x08, 0x99});
}

TEST_CASE("Unsigned integer literal", "[decimal]") {
    auto value = construct("12345");
    REQUIRE(value.has_value());
    REQUIRE(value->sign() == Sign::Positive);
    REQUIRE(value->fractional_digit_count() == 0);
    REQUIRE(value->packed_digits() == Bytes{0x45, 0x23, 0x01});
}

TEST_CASE("Rejected literals construct nothing", "[decimal]") {
    const char* rejected[] = {"",     "text",     "+.67", "-.566", ".566",
                              "566.", "+x",       "-y",   "+67.566z",
                              "-99084d54.566", "+", "-",   "1.2.3"};

    for (const char* text : rejected) {
        INFO("literal: \"" << text << "\"");
        REQUIRE_FALSE(construct(text).has_value());
    }
}

TEST_CASE("Zero-leading literals collapse to zero", "[decimal]") {
    require_zero(construct("0.5"));
    require_zero(construct("0123.45"));
    require_zero(construct("00"));
    require_zero(construct("0.000001"));
}

TEST_CASE("Signed zero literals collapse to zero", "[decimal]") {
    require_zero(construct("-0"));
    require_zero(construct("+0"));
    require_zero(construct("+0.000"));
    require_zero(construct("-00.0"));
}

TEST_CASE("Signed fraction below one is not zero", "[decimal]") {
    auto value = construct("-0.25");
    REQUIRE(value.has_value());
    REQUIRE(value->sign() == Sign::Negative);
    REQUIRE(value->fractional_digit_count() == 2);
    // "025" -> "0025"
    REQUIRE(value->packed_digits() == Bytes{0x25, 0x00});
}

TEST_CASE("Construction is idempotent", "[decimal]") {
    auto first = construct("-99084.566");
    auto second = construct("-99084.566");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first == *second);

    REQUIRE(construct("+1234.56789") == construct("1234.56789"));
    REQUIRE(*construct("1.5") != *construct("15"));
    REQUIRE(*construct("-15") != *construct("15"));
}

TEST_CASE("Error-code parse", "[decimal]") {
    SECTION("success overwrites the output") {
        DecimalValue value;
        REQUIRE(parse("-99084.566", value) == Error::Ok);
        REQUIRE(value.sign() == Sign::Negative);
        REQUIRE(value.fractional_digit_count() == 3);
    }

    SECTION("failure leaves the output untouched") {
        DecimalValue value = *construct("42");
        REQUIRE(parse("566.", value) == Error::Malformed);
        REQUIRE(value.sign() == Sign::Positive);
        REQUIRE(value.packed_digits() == Bytes{0x42});
    }

    SECTION("every rejection is malformed input") {
        DecimalValue value;
        REQUIRE(parse("", value) == Error::Malformed);
        REQUIRE(parse("1e5", value) == Error::Malformed);
        REQUIRE(parse("1.2.3", value) == Error::Malformed);
    }
}

#if !PACKDEC_NO_EXCEPTIONS

TEST_CASE("Throwing construction", "[decimal]") {
    SECTION("accepted literal") {
        auto value = construct_or_throw("+1234.56789");
        REQUIRE(value == *construct("+1234.56789"));
    }

    SECTION("malformed literal") {
        REQUIRE_THROWS_AS(construct_or_throw("566."), MalformedInputException);

        try {
            (void)construct_or_throw("-99084d54.566");
            FAIL("expected MalformedInputException");
        } catch (const PackdecException& e) {
            REQUIRE(e.code() == Error::Malformed);
            REQUIRE(std::string(e.what()).find("-99084d54.566") != std::string::npos);
        }
    }
}

TEST_CASE("Exception matching an error code", "[decimal][error]") {
    SECTION("malformed input") {
        REQUIRE_THROWS_AS(throw_error(Error::Malformed, "m"), MalformedInputException);
    }

    SECTION("overflow") {
        REQUIRE_THROWS_AS(throw_error(Error::Overflow, "o"), OverflowException);
    }

    SECTION("internal failures keep their code") {
        try {
            throw_error(Error::InvalidDigit, error_string(Error::InvalidDigit));
            FAIL("expected PackdecException");
        } catch (const MalformedInputException&) {
            FAIL("invariant violation reported as malformed input");
        } catch (const PackdecException& e) {
            REQUIRE(e.code() == Error::InvalidDigit);
            REQUIRE(std::string(e.what()) == "Invalid digit character");
        }
    }
}

#endif // !PACKDEC_NO_EXCEPTIONS

TEST_CASE("Input errors are told apart from internal failures", "[decimal][error]") {
    REQUIRE(is_input_error(Error::Malformed));
    REQUIRE(is_input_error(Error::Overflow));
    REQUIRE_FALSE(is_input_error(Error::Ok));
    REQUIRE_FALSE(is_input_error(Error::InvalidDigit));
    REQUIRE_FALSE(is_input_error(Error::InvalidArg));

    static_assert(is_input_error(Error::Malformed));
}

TEST_CASE("Names and messages", "[decimal]") {
    REQUIRE(std::string(sign_name(Sign::Positive)) == "Positive");
    REQUIRE(std::string(sign_name(Sign::Negative)) == "Negative");
    REQUIRE(std::string(sign_name(Sign::Zero)) == "Zero");

    REQUIRE(std::string(error_string(Error::Ok)) == "Success");
    REQUIRE(std::string(error_string(Error::Malformed)) == "Malformed decimal literal");
    REQUIRE(std::string(error_string(Error::Overflow)) == "Input too long");

    REQUIRE(std::string(version()) == "1.0.0");
}
