#include <shortid/error.hpp>

namespace shortid {

const char* ShortIdError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Length:     return "Length";
        case Format:     return "Format";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

// error[Format]: short id is not canonical
//   input: 'bullshitmustnotbevalid'
//   hint: ...
//   --> shortid.toml:3
std::string ShortIdError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!input.empty()) {
        out += "\n  input: '";
        out += input;
        out += "'";
    }

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
    }

    return out;
}

} // namespace shortid
