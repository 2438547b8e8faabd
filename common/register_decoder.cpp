// common/register_decoder.cpp
#include "register_decoder.hpp"
#include "errors.hpp"
#include <cstring>

namespace {

void require_count(RegisterType type, const RegisterWords& words, size_t expected) {
    if (words.size() != expected) {
        throw DecodeError(std::string(register_type_name(type)) + " requires " +
                          std::to_string(expected) + " register(s), got " +
                          std::to_string(words.size()));
    }
}

// Length of the UTF-8 sequence starting at `i`, or 0 if the bytes there
// do not form a valid sequence (overlong forms and surrogates included).
size_t valid_sequence_length(const std::string& s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = byte(i);
    size_t n = s.size() - i;

    if (c < 0x80) return 1;

    auto cont = [&](size_t k) { return k < s.size() && (byte(k) & 0xC0) == 0x80; };

    if (c >= 0xC2 && c <= 0xDF) {
        return (n >= 2 && cont(i + 1)) ? 2 : 0;
    }
    if (c >= 0xE0 && c <= 0xEF) {
        if (n < 3 || !cont(i + 1) || !cont(i + 2)) return 0;
        unsigned char c1 = byte(i + 1);
        if (c == 0xE0 && c1 < 0xA0) return 0;  // overlong
        if (c == 0xED && c1 > 0x9F) return 0;  // surrogate
        return 3;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        if (n < 4 || !cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return 0;
        unsigned char c1 = byte(i + 1);
        if (c == 0xF0 && c1 < 0x90) return 0;
        if (c == 0xF4 && c1 > 0x8F) return 0;
        return 4;
    }
    return 0;
}

} // namespace

RegisterType parse_register_type(const std::string& name) {
    if (name == "INT16U") return RegisterType::Int16U;
    if (name == "INT16S") return RegisterType::Int16S;
    if (name == "INT32U") return RegisterType::Int32U;
    if (name == "FLOAT32") return RegisterType::Float32;
    if (name == "UTF8") return RegisterType::Utf8;
    if (name == "4Q_FP_PF") return RegisterType::PowerFactor4Q;
    throw DecodeError("Unknown data type: " + name);
}

const char* register_type_name(RegisterType type) {
    switch (type) {
        case RegisterType::Int16U: return "INT16U";
        case RegisterType::Int16S: return "INT16S";
        case RegisterType::Int32U: return "INT32U";
        case RegisterType::Float32: return "FLOAT32";
        case RegisterType::Utf8: return "UTF8";
        case RegisterType::PowerFactor4Q: return "4Q_FP_PF";
    }
    return "UNKNOWN";
}

size_t register_count(RegisterType type) {
    switch (type) {
        case RegisterType::Int16U:
        case RegisterType::Int16S:
        case RegisterType::PowerFactor4Q:
            return 1;
        case RegisterType::Int32U:
        case RegisterType::Float32:
            return 2;
        case RegisterType::Utf8:
            return kDefaultUtf8Registers;
    }
    return 1;
}

uint16_t decode_int16u(uint32_t word) {
    return static_cast<uint16_t>(word & 0xFFFF);
}

int16_t decode_int16s(uint32_t word) {
    uint16_t value = decode_int16u(word);
    return value > 0x7FFF ? static_cast<int16_t>(static_cast<int32_t>(value) - 0x10000)
                          : static_cast<int16_t>(value);
}

uint32_t decode_int32u(const RegisterWords& words) {
    require_count(RegisterType::Int32U, words, 2);
    return (static_cast<uint32_t>(decode_int16u(words[0])) << 16) | decode_int16u(words[1]);
}

float decode_float32(const RegisterWords& words) {
    require_count(RegisterType::Float32, words, 2);
    uint32_t bits = (static_cast<uint32_t>(decode_int16u(words[0])) << 16) | decode_int16u(words[1]);
    float value;
    static_assert(sizeof(value) == sizeof(bits), "float32 must be 4 bytes");
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string decode_utf8(const RegisterWords& words) {
    std::string bytes;
    bytes.reserve(words.size() * 2);
    for (uint32_t word : words) {
        bytes.push_back(static_cast<char>((word >> 8) & 0xFF));
        bytes.push_back(static_cast<char>(word & 0xFF));
    }

    size_t nul = bytes.find('\0');
    if (nul != std::string::npos) {
        bytes.resize(nul);
    }

    // Invalid bytes are dropped rather than replaced.
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = valid_sequence_length(bytes, i);
        if (len == 0) {
            ++i;
            continue;
        }
        out.append(bytes, i, len);
        i += len;
    }
    return out;
}

double decode_4q_power_factor(uint32_t word) {
    return decode_int16s(word) / 1000.0;
}

DecodedValue decode(RegisterType type, const RegisterWords& words, size_t utf8_registers) {
    switch (type) {
        case RegisterType::Int16U:
            require_count(type, words, 1);
            return static_cast<double>(decode_int16u(words[0]));
        case RegisterType::Int16S:
            require_count(type, words, 1);
            return static_cast<double>(decode_int16s(words[0]));
        case RegisterType::Int32U:
            return static_cast<double>(decode_int32u(words));
        case RegisterType::Float32:
            return static_cast<double>(decode_float32(words));
        case RegisterType::PowerFactor4Q:
            require_count(type, words, 1);
            return decode_4q_power_factor(words[0]);
        case RegisterType::Utf8:
            if (words.empty()) {
                throw DecodeError("UTF8 requires at least 1 register");
            }
            if (utf8_registers != 0) {
                require_count(type, words, utf8_registers);
            }
            return decode_utf8(words);
    }
    throw DecodeError("Unsupported data type");
}

double decode_numeric(RegisterType type, const RegisterWords& words) {
    if (type == RegisterType::Utf8) {
        throw DecodeError("UTF8 registers do not decode to a number");
    }
    return std::get<double>(decode(type, words));
}
