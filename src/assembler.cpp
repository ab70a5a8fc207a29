#include "assembler.h"
#include "bytecode.h"
#include <cctype>
#include <limits>
#include <map>
#include <sstream>
#include <vector>

namespace vouchrun {

AssemblyError::AssemblyError(int line, const std::string& message)
    : std::runtime_error("line " + std::to_string(line) + ": " + message),
      line_(line) {}

namespace {

struct Token {
    std::string text;
    int line;
};

std::vector<Token> tokenize(const std::string& source) {
    std::vector<Token> tokens;
    std::istringstream stream(source);
    std::string line;
    int line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        auto comment = line.find(';');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        std::istringstream words(line);
        std::string word;
        while (words >> word) {
            tokens.push_back({word, line_number});
        }
    }
    return tokens;
}

bool is_identifier(const std::string& text) {
    if (text.empty() || !(std::isalpha(static_cast<unsigned char>(text[0])) || text[0] == '_')) {
        return false;
    }
    for (char c : text) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
            return false;
        }
    }
    return true;
}

bool parse_integer(const std::string& text, int64_t& value) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    int base = 10;
    if (text.size() - pos > 2 && text[pos] == '0' && (text[pos + 1] == 'x' || text[pos + 1] == 'X')) {
        base = 16;
        pos += 2;
    }
    if (pos >= text.size()) {
        return false;
    }

    uint64_t magnitude = 0;
    for (; pos < text.size(); ++pos) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (base == 16 && c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else {
            return false;
        }
        if (magnitude > (std::numeric_limits<uint64_t>::max() - digit) / base) {
            return false;
        }
        magnitude = magnitude * base + digit;
    }

    // Hex literals may spell any 64-bit pattern; decimals must fit int64
    if (base == 10 && !negative &&
        magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    if (negative) {
        if (magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1) {
            return false;
        }
        value = static_cast<int64_t>(0 - magnitude);
    } else {
        value = static_cast<int64_t>(magnitude);
    }
    return true;
}

void write_le(Bytes& out, uint64_t value, int width) {
    for (int i = 0; i < width; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
    }
}

} // namespace

Bytes Assembler::assemble(const std::string& source) {
    auto tokens = tokenize(source);

    // Pass 1: label offsets
    std::map<std::string, uint32_t> labels;
    uint64_t offset = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.text.back() == ':') {
            std::string name = token.text.substr(0, token.text.size() - 1);
            if (!is_identifier(name)) {
                throw AssemblyError(token.line, "invalid label '" + name + "'");
            }
            if (labels.count(name)) {
                throw AssemblyError(token.line, "duplicate label '" + name + "'");
            }
            labels[name] = static_cast<uint32_t>(offset);
            continue;
        }

        Opcode op;
        OpcodeInfo info;
        if (!lookup_mnemonic(token.text, op, info)) {
            throw AssemblyError(token.line, "unknown instruction '" + token.text + "'");
        }
        if (info.immediate_bytes > 0) {
            if (i + 1 >= tokens.size() || tokens[i + 1].line != token.line) {
                throw AssemblyError(token.line, "missing operand for '" + token.text + "'");
            }
            ++i;
        }
        offset += 1 + info.immediate_bytes;
        if (offset > std::numeric_limits<uint32_t>::max()) {
            throw AssemblyError(token.line, "module too large");
        }
    }

    // Pass 2: emit
    Bytes code;
    code.reserve(offset);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.text.back() == ':') {
            continue;
        }

        Opcode op;
        OpcodeInfo info;
        lookup_mnemonic(token.text, op, info);
        code.push_back(static_cast<uint8_t>(op));
        if (info.immediate_bytes == 0) {
            continue;
        }

        const auto& operand = tokens[++i];
        int64_t value = 0;
        if (is_identifier(operand.text)) {
            auto it = labels.find(operand.text);
            if (it == labels.end()) {
                throw AssemblyError(operand.line, "undefined label '" + operand.text + "'");
            }
            value = it->second;
        } else if (!parse_integer(operand.text, value)) {
            throw AssemblyError(operand.line, "invalid operand '" + operand.text + "'");
        }

        if (info.immediate_bytes == 1 && (value < 0 || value > 0xff)) {
            throw AssemblyError(operand.line, "operand out of range for '" + token.text + "'");
        }
        if (info.immediate_bytes == 4 &&
            (value < 0 || value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))) {
            throw AssemblyError(operand.line, "operand out of range for '" + token.text + "'");
        }
        write_le(code, static_cast<uint64_t>(value), info.immediate_bytes);
    }

    return code;
}

} // namespace vouchrun
