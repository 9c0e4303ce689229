// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/encoder.hpp"
#include "utils.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace logroll {

namespace {

enum class TokenType : std::uint8_t {
    Literal,
    Level,
    LevelFull,
    Time,
    Date,
    Pid,
    Tid,
    Tag,
    File,
    Line,
    Func,
    Message,
    Newline
};

struct Token {
    TokenType type;
    std::string literal;  // Only used for Literal type
};

const std::unordered_map<std::string_view, TokenType>& get_token_map() {
    static const std::unordered_map<std::string_view, TokenType> map = {
        {"level", TokenType::Level},
        {"Level", TokenType::LevelFull},
        {"time",  TokenType::Time},
        {"date",  TokenType::Date},
        {"pid",   TokenType::Pid},
        {"tid",   TokenType::Tid},
        {"tag",   TokenType::Tag},
        {"file",  TokenType::File},
        {"line",  TokenType::Line},
        {"func",  TokenType::Func},
        {"msg",   TokenType::Message},
        {"n",     TokenType::Newline},
    };
    return map;
}

inline void append_int(std::string& out, std::int64_t value) {
    std::array<char, 24> buf;
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    out.append(buf.data(), static_cast<std::size_t>(ptr - buf.data()));
}

std::vector<Token> tokenize(std::string_view pattern) {
    const auto& token_map = get_token_map();
    std::vector<Token> tokens;
    std::string literal;

    auto flush_literal = [&] {
        if (!literal.empty()) {
            tokens.push_back({TokenType::Literal, std::move(literal)});
            literal.clear();
        }
    };

    while (!pattern.empty()) {
        auto open = pattern.find('{');
        if (open != 0) {
            literal.append(pattern.substr(0, open));
            pattern.remove_prefix(open == std::string_view::npos ? pattern.size() : open);
            continue;
        }

        auto close = pattern.find('}');
        if (close == std::string_view::npos) {
            literal.append(pattern);
            break;
        }

        auto name = pattern.substr(1, close - 1);
        if (auto it = token_map.find(name); it != token_map.end()) {
            flush_literal();
            tokens.push_back({it->second, {}});
        } else {
            literal.append(pattern.substr(0, close + 1));
        }
        pattern.remove_prefix(close + 1);
    }
    flush_literal();
    return tokens;
}

} // anonymous namespace

struct PatternEncoder::Impl {
    std::string pattern;
    std::vector<Token> tokens;
    std::string header;
    std::string footer;

    std::string format(const Record& record) const {
        std::string out;
        out.reserve(96 + record.message.size() + record.tag.size());

        for (const auto& token : tokens) {
            switch (token.type) {
                case TokenType::Literal:   out.append(token.literal); break;
                case TokenType::Message:   out.append(record.message); break;
                case TokenType::Tag:       out.append(record.tag); break;
                case TokenType::Time:      out.append(detail::format_timestamp(record.timestamp)); break;
                case TokenType::Date:      out.append(detail::format_date(record.timestamp)); break;
                case TokenType::Level:     out.append(level_name(record.level)); break;
                case TokenType::LevelFull: out.append(level_full_name(record.level)); break;
                case TokenType::Pid:       append_int(out, record.pid); break;
                case TokenType::Tid:       append_int(out, record.tid); break;
                case TokenType::File:
                    out.append(extract_filename(record.location.file_name()));
                    break;
                case TokenType::Line:
                    append_int(out, static_cast<std::int64_t>(record.location.line()));
                    break;
                case TokenType::Func:
                    out.append(record.location.function_name());
                    break;
                case TokenType::Newline:   out.push_back('\n'); break;
            }
        }
        return out;
    }
};

PatternEncoder::PatternEncoder(std::string_view pattern, std::string header, std::string footer)
    : impl_(std::make_unique<Impl>()) {
    impl_->pattern = std::string(pattern);
    impl_->tokens = tokenize(pattern);
    impl_->header = std::move(header);
    impl_->footer = std::move(footer);
}

PatternEncoder::~PatternEncoder() = default;

std::expected<std::string, std::error_code> PatternEncoder::header_bytes() {
    return impl_->header;
}

std::expected<std::string, std::error_code> PatternEncoder::footer_bytes() {
    return impl_->footer;
}

std::expected<std::string, std::error_code> PatternEncoder::encode(const Record& record) {
    return impl_->format(record);
}

std::string_view PatternEncoder::pattern() const noexcept {
    return impl_->pattern;
}

} // namespace logroll
