#include <gtest/gtest.h>
#include "common/register_decoder.hpp"
#include "common/errors.hpp"

TEST(RegisterDecoder, Int16UMasksToSixteenBits) {
    EXPECT_EQ(decode_int16u(0x0000), 0);
    EXPECT_EQ(decode_int16u(0xFFFF), 65535);
    EXPECT_EQ(decode_int16u(0x1ABCD), 0xABCD);
}

TEST(RegisterDecoder, Int16SIsTwosComplement) {
    EXPECT_EQ(decode_int16s(0x0001), 1);
    EXPECT_EQ(decode_int16s(0x7FFF), 32767);
    EXPECT_EQ(decode_int16s(0x8000), -32768);
    EXPECT_EQ(decode_int16s(0xFFFF), -1);
}

TEST(RegisterDecoder, Int32UHighWordFirst) {
    EXPECT_EQ(decode_int32u({0x0001, 0x86A0}), 100000u);
    EXPECT_EQ(decode_int32u({0xFFFF, 0xFFFF}), 0xFFFFFFFFu);
}

TEST(RegisterDecoder, Float32HighWordFirst) {
    EXPECT_FLOAT_EQ(decode_float32({0x4348, 0x0000}), 200.0f);
    EXPECT_FLOAT_EQ(decode_float32({0x3F80, 0x0000}), 1.0f);
    EXPECT_FLOAT_EQ(decode_float32({0xC2F6, 0xE979}), -123.456f);
}

TEST(RegisterDecoder, PowerFactorIsSignedThousandths) {
    EXPECT_DOUBLE_EQ(decode_4q_power_factor(0x0384), 0.9);
    EXPECT_DOUBLE_EQ(decode_4q_power_factor(0xFC7C), -0.9);
    EXPECT_DOUBLE_EQ(decode_4q_power_factor(0x03E8), 1.0);
}

TEST(RegisterDecoder, Utf8HighByteThenLowByte) {
    EXPECT_EQ(decode_utf8({0x4142, 0x4344}), "ABCD");
}

TEST(RegisterDecoder, Utf8StopsAtFirstNul) {
    EXPECT_EQ(decode_utf8({0x4142, 0x4300, 0x4445}), "ABC");
    EXPECT_EQ(decode_utf8({0x0041}), "");
}

TEST(RegisterDecoder, Utf8DropsInvalidBytes) {
    // 0xFF is never valid; 0xC3 0xA9 is "é"
    EXPECT_EQ(decode_utf8({0x41FF, 0xC3A9}), "A\xC3\xA9");
    // Lone continuation byte and truncated sequence
    EXPECT_EQ(decode_utf8({0x8041, 0x42E2}), "AB");
}

TEST(RegisterDecoder, DecodeDispatchesOnType) {
    EXPECT_DOUBLE_EQ(std::get<double>(decode(RegisterType::Float32, {0x4348, 0x0000})), 200.0);
    EXPECT_DOUBLE_EQ(std::get<double>(decode(RegisterType::Int32U, {0x0001, 0x86A0})), 100000.0);
    EXPECT_DOUBLE_EQ(std::get<double>(decode(RegisterType::Int16S, {0xFFFE})), -2.0);
    EXPECT_DOUBLE_EQ(std::get<double>(decode(RegisterType::PowerFactor4Q, {0x0384})), 0.9);
    EXPECT_EQ(std::get<std::string>(decode(RegisterType::Utf8, {0x4D31, 0x0000})), "M1");
}

TEST(RegisterDecoder, WrongWordCountIsDecodeError) {
    EXPECT_THROW(decode(RegisterType::Float32, {0x4348}), DecodeError);
    EXPECT_THROW(decode(RegisterType::Int32U, {1, 2, 3}), DecodeError);
    EXPECT_THROW(decode(RegisterType::Int16U, {}), DecodeError);
    EXPECT_THROW(decode(RegisterType::Utf8, {}), DecodeError);
    EXPECT_THROW(decode(RegisterType::Utf8, {0x4142}, 2), DecodeError);
}

TEST(RegisterDecoder, DecodeErrorIsAValidationError) {
    try {
        decode_numeric(RegisterType::Int16U, {1, 2});
        FAIL() << "expected DecodeError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Decode);
        EXPECT_FALSE(e.retryable());
    }
}

TEST(RegisterDecoder, NumericDecodeRejectsText) {
    EXPECT_THROW(decode_numeric(RegisterType::Utf8, {0x4142}), DecodeError);
}

TEST(RegisterDecoder, TypeNamesRoundTrip) {
    for (const char* name : {"INT16U", "INT16S", "INT32U", "FLOAT32", "UTF8", "4Q_FP_PF"}) {
        EXPECT_STREQ(register_type_name(parse_register_type(name)), name);
    }
    EXPECT_THROW(parse_register_type("FLOAT64"), DecodeError);
    EXPECT_THROW(parse_register_type("float32"), DecodeError);
}

TEST(RegisterDecoder, RegisterCounts) {
    EXPECT_EQ(register_count(RegisterType::Int16U), 1u);
    EXPECT_EQ(register_count(RegisterType::PowerFactor4Q), 1u);
    EXPECT_EQ(register_count(RegisterType::Float32), 2u);
    EXPECT_EQ(register_count(RegisterType::Int32U), 2u);
    EXPECT_EQ(register_count(RegisterType::Utf8), kDefaultUtf8Registers);
}
