// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/file_namer.hpp"
#include "utils.hpp"

#include <charconv>
#include <regex>
#include <vector>

namespace logroll {

namespace {

enum class PartType : std::uint8_t {
    Literal,
    Date,
    Index
};

struct Part {
    PartType type;
    std::string text;  // Literal text or strftime format
};

bool is_token(std::string_view name) {
    return name == "index" || name == "date" || name.starts_with("date:");
}

std::vector<Part> parse_file_part(std::string_view text) {
    std::vector<Part> parts;
    std::string literal;

    auto flush_literal = [&] {
        if (!literal.empty()) {
            parts.push_back({PartType::Literal, std::move(literal)});
            literal.clear();
        }
    };

    while (!text.empty()) {
        auto open = text.find('{');
        if (open != 0) {
            literal.append(text.substr(0, open));
            text.remove_prefix(open == std::string_view::npos ? text.size() : open);
            continue;
        }

        auto close = text.find('}');
        if (close == std::string_view::npos) {
            literal.append(text);
            break;
        }

        auto name = text.substr(1, close - 1);
        if (name == "index") {
            flush_literal();
            parts.push_back({PartType::Index, {}});
        } else if (name == "date") {
            flush_literal();
            parts.push_back({PartType::Date, std::string(PatternFileNamer::kDefaultDateFormat)});
        } else if (name.starts_with("date:") && name.size() > 5) {
            flush_literal();
            parts.push_back({PartType::Date, std::string(name.substr(5))});
        } else {
            literal.append(text.substr(0, close + 1));
        }
        text.remove_prefix(close + 1);
    }
    flush_literal();
    return parts;
}

} // anonymous namespace

struct PatternFileNamer::Impl {
    std::string pattern;
    std::filesystem::path directory;
    std::vector<Part> parts;
    bool has_index = false;
    bool compressed = false;
    std::regex any_period;

    std::string render(const NamingState& state) const {
        std::string out;
        for (const auto& part : parts) {
            switch (part.type) {
                case PartType::Literal: out.append(part.text); break;
                case PartType::Date:    out.append(detail::format_utc(state.period_start_ms, part.text)); break;
                case PartType::Index:   out.append(std::to_string(state.index)); break;
            }
        }
        if (compressed) {
            out.append(kCompressionSuffix);
        }
        return out;
    }

    // Dates are matched loosely, or exactly when a period is given
    std::string to_regex(std::optional<std::int64_t> period_start_ms, bool capture_index) const {
        std::string re;
        for (const auto& part : parts) {
            switch (part.type) {
                case PartType::Literal:
                    re.append(detail::regex_escape(part.text));
                    break;
                case PartType::Date:
                    if (period_start_ms) {
                        re.append(detail::regex_escape(detail::format_utc(*period_start_ms, part.text)));
                    } else {
                        re.append(".+?");
                    }
                    break;
                case PartType::Index:
                    re.append(capture_index ? "(\\d+)" : "\\d+");
                    break;
            }
        }
        re.append("(?:");
        re.append(detail::regex_escape(kCompressionSuffix));
        re.append(")?");
        return re;
    }
};

PatternFileNamer::PatternFileNamer(std::string pattern) : impl_(std::make_unique<Impl>()) {
    std::filesystem::path full(pattern);
    impl_->pattern = std::move(pattern);
    impl_->directory = full.parent_path();
    impl_->compressed = impl_->pattern.ends_with(kCompressionSuffix);

    // The suffix is appended on render and optional when matching
    auto file_part = full.filename().string();
    if (impl_->compressed) {
        file_part.resize(file_part.size() - kCompressionSuffix.size());
    }
    impl_->parts = parse_file_part(file_part);
    for (const auto& part : impl_->parts) {
        if (part.type == PartType::Index) {
            impl_->has_index = true;
        }
    }
    impl_->any_period = std::regex(impl_->to_regex(std::nullopt, false));
}

PatternFileNamer::~PatternFileNamer() = default;

std::filesystem::path PatternFileNamer::resolve(const NamingState& state) const {
    return impl_->directory / impl_->render(state);
}

std::filesystem::path PatternFileNamer::directory() const {
    return impl_->directory;
}

bool PatternFileNamer::matches(std::string_view file_name) const {
    return std::regex_match(file_name.begin(), file_name.end(), impl_->any_period);
}

std::optional<std::uint32_t>
PatternFileNamer::index_of(std::string_view file_name, std::int64_t period_start_ms) const {
    if (!impl_->has_index) {
        return std::nullopt;
    }

    std::regex re(impl_->to_regex(period_start_ms, true));
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(file_name.begin(), file_name.end(), match, re)) {
        return std::nullopt;
    }

    // First capture is the first {index}; later ones repeat the same value
    const auto& group = match[1];
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(&*group.first, &*group.first + group.length(), value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return value;
}

bool PatternFileNamer::has_index() const noexcept {
    return impl_->has_index;
}

bool PatternFileNamer::compressed() const noexcept {
    return impl_->compressed;
}

const std::string& PatternFileNamer::pattern() const noexcept {
    return impl_->pattern;
}

PatternTokens scan_pattern_tokens(std::string_view pattern) {
    PatternTokens tokens;
    auto slash = pattern.find_last_of("/\\");
    auto file_start = slash == std::string_view::npos ? 0 : slash + 1;

    std::size_t pos = 0;
    while ((pos = pattern.find('{', pos)) != std::string_view::npos) {
        auto close = pattern.find('}', pos);
        if (close == std::string_view::npos) {
            break;
        }
        auto name = pattern.substr(pos + 1, close - pos - 1);
        if (is_token(name)) {
            if (pos < file_start) {
                tokens.tokens_in_directory = true;
            } else if (name == "index") {
                tokens.has_index = true;
            } else {
                tokens.has_date = true;
            }
        }
        pos = close + 1;
    }
    return tokens;
}

} // namespace logroll
