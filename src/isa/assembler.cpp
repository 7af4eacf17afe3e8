#include <tgpu/isa/assembler.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace tgpu::isa {

namespace {

struct Statement {
    size_t line;
    std::string mnemonic;               // upper-cased
    std::vector<std::string> operands;
};

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

std::vector<std::string> split_operands(const std::string& text) {
    std::vector<std::string> operands;
    std::string token;
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!token.empty()) {
                operands.push_back(token);
                token.clear();
            }
        } else {
            token += c;
        }
    }
    if (!token.empty()) operands.push_back(token);
    return operands;
}

unsigned long parse_number(const Statement& st, const std::string& token, unsigned long max_value) {
    std::string digits = (!token.empty() && token[0] == '#') ? token.substr(1) : token;
    if (digits.empty() || !std::isdigit(static_cast<unsigned char>(digits[0]))) {
        throw AssemblerError(st.line, "expected a number, got '" + token + "'");
    }
    // Decimal unless prefixed with 0x; a leading zero is not octal
    const bool hex = digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X');
    size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(digits, &consumed, hex ? 16 : 10);
    } catch (const std::exception&) {
        throw AssemblerError(st.line, "invalid number '" + token + "'");
    }
    if (consumed != digits.size()) {
        throw AssemblerError(st.line, "invalid number '" + token + "'");
    }
    if (value > max_value) {
        throw AssemblerError(st.line, "value " + digits + " out of range (max " +
                                      std::to_string(max_value) + ")");
    }
    return value;
}

uint8_t parse_register(const Statement& st, const std::string& token) {
    std::string upper = to_upper(token);
    if (upper == "%BLOCKIDX") return BLOCK_IDX_REGISTER;
    if (upper == "%BLOCKDIM") return BLOCK_DIM_REGISTER;
    if (upper == "%THREADIDX") return THREAD_IDX_REGISTER;

    if (upper.size() >= 2 && upper.size() <= 3 && upper[0] == 'R' &&
        std::all_of(upper.begin() + 1, upper.end(), [](unsigned char c) { return std::isdigit(c); })) {
        unsigned long index = std::stoul(upper.substr(1));
        if (index < REGISTER_COUNT) {
            return static_cast<uint8_t>(index);
        }
    }
    throw AssemblerError(st.line, "invalid register '" + token + "'");
}

void expect_operands(const Statement& st, size_t count) {
    if (st.operands.size() != count) {
        throw AssemblerError(st.line, st.mnemonic + " expects " + std::to_string(count) +
                                      " operand(s), got " + std::to_string(st.operands.size()));
    }
}

// Parse the condition suffix of a BR mnemonic ("BRNZ" -> n|z)
std::optional<uint8_t> branch_condition(const std::string& mnemonic) {
    if (mnemonic.size() < 3 || mnemonic.compare(0, 2, "BR") != 0) return std::nullopt;
    uint8_t nzp = 0;
    for (size_t i = 2; i < mnemonic.size(); ++i) {
        uint8_t bit = 0;
        switch (mnemonic[i]) {
            case 'N': bit = NZP_NEGATIVE; break;
            case 'Z': bit = NZP_ZERO; break;
            case 'P': bit = NZP_POSITIVE; break;
            default: return std::nullopt;
        }
        if (nzp & bit) return std::nullopt;
        nzp |= bit;
    }
    return nzp;
}

Word encode_statement(const Statement& st, const std::map<std::string, Address>& labels) {
    const std::string& m = st.mnemonic;

    if (m == ".WORD") {
        expect_operands(st, 1);
        return static_cast<Word>(parse_number(st, st.operands[0], 0xFFFF));
    }
    if (m == "NOP") {
        expect_operands(st, 0);
        return encode(Opcode::NOP, 0, 0, 0);
    }
    if (m == "RET") {
        expect_operands(st, 0);
        return encode(Opcode::RET, 0, 0, 0);
    }
    if (m == "ADD" || m == "SUB" || m == "MUL" || m == "DIV") {
        expect_operands(st, 3);
        Opcode op = m == "ADD" ? Opcode::ADD : m == "SUB" ? Opcode::SUB
                  : m == "MUL" ? Opcode::MUL : Opcode::DIV;
        return encode(op, parse_register(st, st.operands[0]),
                      parse_register(st, st.operands[1]),
                      parse_register(st, st.operands[2]));
    }
    if (m == "CMP") {
        expect_operands(st, 2);
        return encode(Opcode::CMP, 0, parse_register(st, st.operands[0]),
                      parse_register(st, st.operands[1]));
    }
    if (m == "LDR") {
        expect_operands(st, 2);
        return encode(Opcode::LDR, parse_register(st, st.operands[0]),
                      parse_register(st, st.operands[1]), 0);
    }
    if (m == "STR") {
        expect_operands(st, 2);
        return encode(Opcode::STR, 0, parse_register(st, st.operands[0]),
                      parse_register(st, st.operands[1]));
    }
    if (m == "CONST") {
        expect_operands(st, 2);
        return encode_immediate(Opcode::CONST, parse_register(st, st.operands[0]),
                                static_cast<uint8_t>(parse_number(st, st.operands[1], 0xFF)));
    }
    if (auto nzp = branch_condition(m)) {
        expect_operands(st, 1);
        const std::string& target = st.operands[0];
        if (is_identifier(target)) {
            auto it = labels.find(target);
            if (it == labels.end()) {
                throw AssemblerError(st.line, "undefined label '" + target + "'");
            }
            if (it->second > 0xFF) {
                throw AssemblerError(st.line, "label '" + target + "' beyond branch range");
            }
            return encode_branch(*nzp, static_cast<uint8_t>(it->second));
        }
        return encode_branch(*nzp, static_cast<uint8_t>(parse_number(st, target, 0xFF)));
    }
    if (m == "BR") {
        throw AssemblerError(st.line, "branch requires a condition (BRn, BRz, BRp, ...)");
    }

    throw AssemblerError(st.line, "unknown mnemonic '" + st.mnemonic + "'");
}

} // namespace

Program Assembler::assemble(const std::string& source) {
    Program program;
    std::vector<Statement> statements;

    std::istringstream stream(source);
    std::string raw_line;
    size_t line_no = 0;

    // Pass 1: collect labels and statements
    while (std::getline(stream, raw_line)) {
        ++line_no;
        size_t comment = raw_line.find(';');
        std::string text = trim(comment == std::string::npos ? raw_line : raw_line.substr(0, comment));

        size_t colon;
        while ((colon = text.find(':')) != std::string::npos) {
            std::string label = trim(text.substr(0, colon));
            if (!is_identifier(label)) {
                throw AssemblerError(line_no, "invalid label '" + label + "'");
            }
            if (program.labels.count(label) != 0) {
                throw AssemblerError(line_no, "duplicate label '" + label + "'");
            }
            program.labels[label] = static_cast<Address>(statements.size());
            text = trim(text.substr(colon + 1));
        }
        if (text.empty()) continue;

        size_t split = text.find_first_of(" \t");
        Statement st;
        st.line = line_no;
        st.mnemonic = to_upper(text.substr(0, split));
        st.operands = split_operands(split == std::string::npos ? "" : text.substr(split + 1));

        if (st.mnemonic == ".THREADS") {
            expect_operands(st, 1);
            unsigned long threads = parse_number(st, st.operands[0], 0xFF);
            if (threads == 0) {
                throw AssemblerError(line_no, ".threads must be at least 1");
            }
            program.thread_count = static_cast<uint32_t>(threads);
            continue;
        }

        statements.push_back(std::move(st));
    }

    // Pass 2: encode
    program.words.reserve(statements.size());
    for (const auto& st : statements) {
        program.words.push_back(encode_statement(st, program.labels));
    }

    return program;
}

Program Assembler::assemble_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open kernel source: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return assemble(buffer.str());
}

std::string Assembler::listing(const Program& program) {
    std::map<Address, std::vector<std::string>> labels_at;
    for (const auto& [name, addr] : program.labels) {
        labels_at[addr].push_back(name);
    }

    std::ostringstream oss;
    if (program.thread_count) {
        oss << ".threads " << *program.thread_count << "\n";
    }
    for (Size pc = 0; pc < program.words.size(); ++pc) {
        auto it = labels_at.find(static_cast<Address>(pc));
        if (it != labels_at.end()) {
            for (const auto& name : it->second) oss << name << ":\n";
        }
        oss << "  " << std::setw(3) << std::setfill(' ') << pc << ":  0x"
            << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << program.words[pc]
            << std::dec << std::nouppercase << std::setfill(' ')
            << "  " << disassemble(program.words[pc]) << "\n";
    }
    return oss.str();
}

} // namespace tgpu::isa
