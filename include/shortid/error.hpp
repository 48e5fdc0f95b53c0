#pragma once

#include <string>

namespace shortid {

struct ShortIdError {
    enum Code {
        IO,
        Parse,       // malformed 36-char uuid text or TOML
        Length,      // text length not accepted by the entry point
        Format,      // bad base64 or non-canonical short id
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string input;   // offending text, if any
    std::string file;
    int line = 0;

    ShortIdError() = default;
    ShortIdError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ShortIdError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    ShortIdError& with_input(std::string text) {
        input = std::move(text);
        return *this;
    }
    ShortIdError& at(std::string f, int l = 0) {
        file = std::move(f);
        line = l;
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace shortid
