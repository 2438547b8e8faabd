// common/register_decoder.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// Modbus-style holding register encodings. Multi-register types are
// always big-endian word order (first register is the high word).
enum class RegisterType {
    Int16U,
    Int16S,
    Int32U,
    Float32,
    Utf8,
    PowerFactor4Q
};

using RegisterWords = std::vector<uint32_t>;
using DecodedValue = std::variant<double, std::string>;

constexpr size_t kDefaultUtf8Registers = 16;

// Wire names: INT16U, INT16S, INT32U, FLOAT32, UTF8, 4Q_FP_PF.
RegisterType parse_register_type(const std::string& name);
const char* register_type_name(RegisterType type);

// Registers consumed by one value. UTF8 is caller-specified; the
// default covers 32 characters.
size_t register_count(RegisterType type);

uint16_t decode_int16u(uint32_t word);
int16_t decode_int16s(uint32_t word);
uint32_t decode_int32u(const RegisterWords& words);
float decode_float32(const RegisterWords& words);
std::string decode_utf8(const RegisterWords& words);
double decode_4q_power_factor(uint32_t word);

// Checks the word count against the type and dispatches. For UTF8,
// `utf8_registers` is the expected count (0 accepts any non-empty block).
// Throws DecodeError on a count mismatch.
DecodedValue decode(RegisterType type, const RegisterWords& words, size_t utf8_registers = 0);

// As decode(), for types that yield a number. UTF8 is a DecodeError.
double decode_numeric(RegisterType type, const RegisterWords& words);
